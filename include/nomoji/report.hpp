#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nomoji/processor.hpp"

namespace nomoji {
namespace report {

struct Summary {
    std::size_t files_processed = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    std::size_t total_emojis = 0;
};

Summary summarize(const std::vector<FileResult>& results);

std::string render_text(const std::vector<FileResult>& results, bool dry_run);
nlohmann::json to_json(const std::vector<FileResult>& results, bool dry_run);
std::string render_json(const std::vector<FileResult>& results, bool dry_run);

std::string render_stdin_text(std::size_t emojis, bool dry_run);
std::string render_stdin_json(std::size_t emojis, bool dry_run);

}
}
