#pragma once

#include <optional>
#include <string>
#include <vector>

namespace nomoji {

enum class ReportFormat {
    Text,
    Json,
};

struct Config {
    std::vector<std::string> files;
    bool backup = false;
    bool inplace = false;
    bool dry_run = false;
    std::string backup_suffix = ".bak";
    int jobs = 1;
    ReportFormat report_format = ReportFormat::Text;
    std::string log_level = "WARN";
    std::optional<std::string> log_filename;

    static Config load();
    void validate() const;

    bool reads_stdin() const;
};

ReportFormat parse_report_format(const std::string& value);

}
