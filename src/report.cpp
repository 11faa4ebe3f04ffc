#include "nomoji/report.hpp"

#include <sstream>

namespace nomoji::report {

namespace {

constexpr const char* kHeader = "\n=== nomoji Report ===\n";

}

Summary summarize(const std::vector<FileResult>& results) {
    Summary summary;
    summary.files_processed = results.size();
    for (const auto& result : results) {
        if (result.success) {
            ++summary.successful;
        } else {
            ++summary.failed;
        }
        summary.total_emojis += result.emojis_found;
    }
    return summary;
}

std::string render_text(const std::vector<FileResult>& results, bool dry_run) {
    const auto summary = summarize(results);
    std::ostringstream out;
    out << kHeader;
    out << "Files processed: " << summary.files_processed << "\n";
    out << "Successful: " << summary.successful << "\n";
    if (summary.failed > 0) {
        out << "Failed: " << summary.failed << "\n";
    }
    out << "Total emojis found: " << summary.total_emojis << "\n";

    if (results.empty()) {
        return out.str();
    }
    out << "\nPer-file results:\n";
    for (const auto& result : results) {
        out << "  " << result.file << ": " << result.emojis_found << " emojis";
        if (result.error) {
            out << " - ERROR: " << *result.error << "\n";
        } else {
            out << (dry_run ? " found" : " removed") << "\n";
        }
    }
    return out.str();
}

nlohmann::json to_json(const std::vector<FileResult>& results, bool dry_run) {
    const auto summary = summarize(results);
    nlohmann::json files = nlohmann::json::array();
    for (const auto& result : results) {
        nlohmann::json item;
        item["file"] = result.file;
        item["emojis_found"] = result.emojis_found;
        item["success"] = result.success;
        item["error"] = result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr);
        files.push_back(std::move(item));
    }

    nlohmann::json payload;
    payload["dry_run"] = dry_run;
    payload["files_processed"] = summary.files_processed;
    payload["successful"] = summary.successful;
    payload["failed"] = summary.failed;
    payload["total_emojis"] = summary.total_emojis;
    payload["files"] = std::move(files);
    return payload;
}

std::string render_json(const std::vector<FileResult>& results, bool dry_run) {
    return to_json(results, dry_run).dump(2) + "\n";
}

std::string render_stdin_text(std::size_t emojis, bool dry_run) {
    std::ostringstream out;
    out << kHeader;
    out << "Emojis " << (dry_run ? "found in" : "removed from") << " stdin: " << emojis << "\n";
    return out.str();
}

std::string render_stdin_json(std::size_t emojis, bool dry_run) {
    nlohmann::json payload;
    payload["dry_run"] = dry_run;
    payload["source"] = "stdin";
    payload["total_emojis"] = emojis;
    return payload.dump(2) + "\n";
}

}
