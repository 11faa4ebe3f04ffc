#include "nomoji/cli.hpp"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace nomoji {

namespace {

constexpr const char* kVersion = "0.1.0";

enum LongOnlyOption {
    kDryRun = 256,
    kReport,
    kBackupSuffix,
};

constexpr long kMaxJobs = 1024;

int parse_jobs(const char* raw) {
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(raw, &end, 10);
    if (errno != 0 || end == raw || *end != '\0' || value <= 0 || value > kMaxJobs) {
        throw UsageError(std::string("invalid value for --jobs: ") + raw);
    }
    return static_cast<int>(value);
}

std::string offending_option(char* argv[]) {
    if (optopt > 0 && optopt < kDryRun) {
        return std::string("-") + static_cast<char>(optopt);
    }
    return argv[optind - 1];
}

}

CliAction parse_args(int argc, char* argv[], Config& config) {
    if (argc <= 1) {
        return CliAction::MissingArguments;
    }

    static const option long_options[] = {
        {"backup", no_argument, nullptr, 'b'},
        {"inplace", no_argument, nullptr, 'i'},
        {"jobs", required_argument, nullptr, 'j'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {"dry-run", no_argument, nullptr, kDryRun},
        {"report", required_argument, nullptr, kReport},
        {"backup-suffix", required_argument, nullptr, kBackupSuffix},
        {nullptr, 0, nullptr, 0},
    };

    // optind = 0 makes glibc reinitialize its scanner between calls.
    optind = 0;
    opterr = 0;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, ":bij:hV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'b':
                config.backup = true;
                break;
            case 'i':
                config.inplace = true;
                break;
            case 'j':
                config.jobs = parse_jobs(optarg);
                break;
            case 'h':
                return CliAction::Help;
            case 'V':
                return CliAction::Version;
            case kDryRun:
                config.dry_run = true;
                break;
            case kReport:
                try {
                    config.report_format = parse_report_format(optarg);
                } catch (const std::runtime_error& ex) {
                    throw UsageError(ex.what());
                }
                break;
            case kBackupSuffix:
                if (std::string(optarg).empty()) {
                    throw UsageError("--backup-suffix must not be empty");
                }
                config.backup_suffix = optarg;
                break;
            case ':':
                throw UsageError("missing value for " + offending_option(argv));
            default:
                throw UsageError("unknown option: " + offending_option(argv));
        }
    }

    config.files.assign(argv + optind, argv + argc);
    return CliAction::Run;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Remove emoji characters from text files\n\n"
        << "Usage: " << program << " [OPTIONS] [FILES]...\n\n"
        << "Arguments:\n"
        << "  [FILES]...              Input file(s) to process (use - for stdin)\n\n"
        << "Options:\n"
        << "  -b, --backup            Create backup files before editing in place\n"
        << "  -i, --inplace           Edit files in place\n"
        << "      --dry-run           Count emojis without removing\n"
        << "  -j, --jobs <N>          Number of files processed concurrently\n"
        << "      --report <FORMAT>   Report format: text or json\n"
        << "      --backup-suffix <S> Suffix for backup files (default .bak)\n"
        << "  -h, --help              Print help\n"
        << "  -V, --version           Print version\n";
    return out.str();
}

std::string version() {
    return std::string("nomoji ") + kVersion;
}

}
