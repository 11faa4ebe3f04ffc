#include "nomoji/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace nomoji {

namespace {

constexpr const char* kEnvPrefix = "NOMOJI_";

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Only NOMOJI_* keys are taken from .env; the tool runs in arbitrary
// directories whose .env files belong to other programs.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    std::error_code ec;
    if (!std::filesystem::exists(dotenv_path, ec)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.rfind(kEnvPrefix, 0) != 0) {
            continue;
        }
        set_env_value(key, strip_quotes(value));
    }
}

int default_jobs() {
    const auto cores = std::thread::hardware_concurrency();
    return cores == 0 ? 1 : static_cast<int>(cores);
}

}

ReportFormat parse_report_format(const std::string& value) {
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (normalized == "text") {
        return ReportFormat::Text;
    }
    if (normalized == "json") {
        return ReportFormat::Json;
    }
    throw std::runtime_error("unknown report format: " + value);
}

Config Config::load() {
    load_dotenv();
    Config config;

    config.log_level = get_env_str("NOMOJI_LOG_LEVEL", "WARN");

    const auto log_filename_raw = get_env_str("NOMOJI_LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("NOMOJI_LOGS_DIR")) {
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }

    config.jobs = get_env_int("NOMOJI_JOBS", default_jobs());
    config.backup_suffix = get_env_str("NOMOJI_BACKUP_SUFFIX", ".bak");
    config.report_format = parse_report_format(get_env_str("NOMOJI_REPORT_FORMAT", "text"));

    return config;
}

void Config::validate() const {
    if (jobs <= 0) {
        throw std::runtime_error("NOMOJI_JOBS must be positive");
    }
    if (backup && backup_suffix.empty()) {
        throw std::runtime_error("NOMOJI_BACKUP_SUFFIX must not be empty");
    }
}

bool Config::reads_stdin() const {
    return files.empty() || (files.size() == 1 && files.front() == "-");
}

}
