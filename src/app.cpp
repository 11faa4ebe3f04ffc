#include "nomoji/app.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "nomoji/batch.hpp"
#include "nomoji/logging.hpp"
#include "nomoji/report.hpp"
#include "nomoji/utils/text.hpp"

namespace nomoji {

App::App(Config config, std::istream& in, std::ostream& out, std::ostream& err)
    : config_(std::move(config)),
      in_(in),
      out_(out),
      err_(err) {}

int App::run() {
    if (config_.reads_stdin()) {
        return run_stdin();
    }
    return run_files();
}

int App::run_stdin() {
    std::size_t count = 0;
    try {
        count = process_stream(in_, out_, config_.dry_run);
    } catch (const utils::DecodeError& ex) {
        error("Failed to decode stdin", {kv("error", ex.what())});
        err_ << "Error reading from stdin: " << ex.what() << "\n";
        return 1;
    } catch (const std::system_error& ex) {
        error("Failed to process stdin", {kv("error", ex.what())});
        err_ << "Error processing stdin: " << ex.code().message() << "\n";
        return 1;
    }

    if (config_.report_format == ReportFormat::Json) {
        err_ << report::render_stdin_json(count, config_.dry_run);
    } else {
        err_ << report::render_stdin_text(count, config_.dry_run);
    }
    return 0;
}

int App::effective_jobs() const {
    if (config_.jobs > 1 && output_mode(config_) != OutputMode::DryRun &&
        has_duplicate_paths(config_.files)) {
        warn("Duplicate paths given, processing sequentially");
        return 1;
    }
    return config_.jobs;
}

void App::emit_stdout(std::vector<FileResult>& results) {
    for (auto& result : results) {
        if (!result.output) {
            continue;
        }
        out_.write(result.output->data(), static_cast<std::streamsize>(result.output->size()));
        out_.flush();
        result.output.reset();
        if (!out_) {
            error("Failed to write to stdout", {kv("file", result.file)});
            result.success = false;
            result.error = "Failed to write to stdout: " +
                           std::make_error_code(std::errc::io_error).message();
            out_.clear();
        }
    }
}

int App::run_files() {
    const FileProcessor processor(config_);
    const BatchRunner runner(effective_jobs(), [&processor](const std::string& file) {
        return processor.process(file);
    });

    auto results = runner.run(config_.files);
    emit_stdout(results);

    if (config_.report_format == ReportFormat::Json) {
        err_ << report::render_json(results, config_.dry_run);
    } else {
        err_ << report::render_text(results, config_.dry_run);
    }

    const auto failures = std::count_if(results.begin(), results.end(),
                                        [](const FileResult& result) { return !result.success; });
    return failures > 0 ? 1 : 0;
}

}
