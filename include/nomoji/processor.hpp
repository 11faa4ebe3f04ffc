#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "nomoji/config.hpp"

namespace nomoji {

enum class OutputMode {
    Stdout,
    InPlace,
    Backup,
    DryRun,
};

OutputMode output_mode(const Config& config);

struct FileResult {
    std::string file;
    std::size_t emojis_found = 0;
    bool success = false;
    std::optional<std::string> error;
    // Cleaned text held back for ordered emission in stdout mode.
    std::optional<std::string> output;
};

// Truncates `path` and writes `content`; throws std::system_error.
void write_file(const std::string& path, const std::string& content);

class FileProcessor {
public:
    using WriteFn = std::function<void(const std::string& path, const std::string& content)>;

    explicit FileProcessor(const Config& config, WriteFn write_fn = write_file);

    FileResult process(const std::string& file) const;

private:
    FileResult failure(const std::string& file, std::size_t emojis_found,
                       const std::string& error) const;

    OutputMode mode_;
    std::string backup_suffix_;
    WriteFn write_fn_;
};

// Scrubs all of `in` into `out` (nothing is written when `dry_run`).
// Returns the number of removed emoji sequences; throws on read, decode or
// write failure.
std::size_t process_stream(std::istream& in, std::ostream& out, bool dry_run);

}
