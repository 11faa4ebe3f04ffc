#pragma once

#include <stdexcept>
#include <string>

#include "nomoji/config.hpp"

namespace nomoji {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class CliAction {
    Run,
    Help,
    Version,
    MissingArguments,
};

// Applies command-line options on top of `config`. Throws UsageError for
// unknown options or malformed values.
CliAction parse_args(int argc, char* argv[], Config& config);

std::string usage(const std::string& program);
std::string version();

}
