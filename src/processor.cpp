#include "nomoji/processor.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>

#include "nomoji/emoji/scrubber.hpp"
#include "nomoji/logging.hpp"
#include "nomoji/utils/text.hpp"

namespace nomoji {

namespace {

// fstream does not promise to set errno when open fails.
int open_error() {
    return errno != 0 ? errno : EIO;
}

std::string read_file(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw std::system_error(EISDIR, std::generic_category(), path);
    }
    errno = 0;
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw std::system_error(open_error(), std::generic_category(), path);
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        throw std::system_error(EIO, std::generic_category(), path);
    }
    return buffer.str();
}

void log_breakdown(const std::string& file, const std::u32string& scalars) {
    if (!logging::get_logger()->should_log(spdlog::level::debug)) {
        return;
    }
    std::map<std::string, std::size_t> by_kind;
    for (const auto& sequence : emoji::find_sequences(scalars)) {
        ++by_kind[emoji::to_string(sequence.kind)];
    }
    for (const auto& [kind, count] : by_kind) {
        debug("Emoji sequences by kind", {kv("file", file), kv("kind", kind), kv("count", count)});
    }
}

}

void write_file(const std::string& path, const std::string& content) {
    errno = 0;
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        throw std::system_error(open_error(), std::generic_category(), path);
    }
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
    stream.flush();
    if (!stream) {
        throw std::system_error(EIO, std::generic_category(), path);
    }
}

OutputMode output_mode(const Config& config) {
    if (config.dry_run) {
        return OutputMode::DryRun;
    }
    if (config.backup) {
        return OutputMode::Backup;
    }
    if (config.inplace) {
        return OutputMode::InPlace;
    }
    return OutputMode::Stdout;
}

FileProcessor::FileProcessor(const Config& config, WriteFn write_fn)
    : mode_(output_mode(config)),
      backup_suffix_(config.backup_suffix),
      write_fn_(std::move(write_fn)) {}

FileResult FileProcessor::failure(const std::string& file, std::size_t emojis_found,
                                  const std::string& error) const {
    warn("File processing failed", {kv("file", file), kv("error", error)});
    FileResult result;
    result.file = file;
    result.emojis_found = emojis_found;
    result.success = false;
    result.error = error;
    return result;
}

FileResult FileProcessor::process(const std::string& file) const {
    std::string content;
    try {
        content = read_file(file);
    } catch (const std::system_error& ex) {
        return failure(file, 0, std::string("Failed to read file: ") + ex.code().message());
    }

    std::u32string scalars;
    try {
        scalars = utils::decode_utf8(content);
    } catch (const utils::DecodeError& ex) {
        return failure(file, 0, std::string("Failed to decode file: ") + ex.what());
    }

    const auto scrubbed = emoji::scrub(scalars);
    debug("Scrubbed file", {kv("file", file),
                            kv("scalars", scalars.size()),
                            kv("emojis", scrubbed.removed_count)});
    log_breakdown(file, scalars);

    FileResult result;
    result.file = file;
    result.emojis_found = scrubbed.removed_count;
    result.success = true;

    switch (mode_) {
        case OutputMode::DryRun:
            return result;
        case OutputMode::Stdout:
            result.output = utils::encode_utf8(scrubbed.output);
            return result;
        case OutputMode::Backup: {
            std::error_code ec;
            std::filesystem::copy_file(file, file + backup_suffix_,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                return failure(file, scrubbed.removed_count,
                               "Failed to create backup: " + ec.message());
            }
            break;
        }
        case OutputMode::InPlace:
            break;
    }

    try {
        write_fn_(file, utils::encode_utf8(scrubbed.output));
    } catch (const std::system_error& ex) {
        return failure(file, scrubbed.removed_count,
                       std::string("Failed to write file: ") + ex.code().message());
    }
    return result;
}

std::size_t process_stream(std::istream& in, std::ostream& out, bool dry_run) {
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::system_error(EIO, std::generic_category(), "stdin");
    }

    const auto cleaned = utils::remove_emojis(content);
    debug("Scrubbed stdin", {kv("bytes", content.size()), kv("emojis", cleaned.removed_count)});
    if (dry_run) {
        return cleaned.removed_count;
    }

    out.write(cleaned.text.data(), static_cast<std::streamsize>(cleaned.text.size()));
    out.flush();
    if (!out) {
        throw std::system_error(EIO, std::generic_category(), "stdout");
    }
    return cleaned.removed_count;
}

}
