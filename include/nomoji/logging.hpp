#pragma once

#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>

#include "nomoji/config.hpp"
#include "spdlog/logger.h"

namespace nomoji {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {key, oss.str()};
}

inline bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" \t\"=,") != std::string::npos;
}

inline std::string format_kv(std::initializer_list<KeyValue> items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        result += item.key;
        result += '=';
        if (!needs_quotes(item.value)) {
            result += item.value;
            continue;
        }
        result += '"';
        for (char ch : item.value) {
            if (ch == '"' || ch == '\\') {
                result += '\\';
            }
            result += ch;
        }
        result += '"';
    }
    return result;
}

inline std::string with_kv(const std::string& message,
                           std::initializer_list<KeyValue> items) {
    const auto context = format_kv(items);
    if (context.empty()) {
        return message;
    }
    return message + " [" + context + "]";
}

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, items));
    }
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::warn;

}
