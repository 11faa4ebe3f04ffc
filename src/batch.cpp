#include "nomoji/batch.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <future>
#include <set>
#include <system_error>
#include <thread>

#include "nomoji/logging.hpp"

namespace nomoji {

BatchRunner::BatchRunner(int max_workers, TaskFn task_fn)
    : max_workers_(max_workers),
      task_fn_(std::move(task_fn)) {}

std::vector<FileResult> BatchRunner::run(const std::vector<std::string>& files) const {
    std::vector<std::packaged_task<FileResult()>> tasks;
    std::vector<std::future<FileResult>> futures;
    tasks.reserve(files.size());
    futures.reserve(files.size());
    for (const auto& file : files) {
        tasks.emplace_back([this, &file]() { return task_fn_(file); });
        futures.push_back(tasks.back().get_future());
    }

    const auto worker_count = std::min(files.size(),
                                       static_cast<size_t>(std::max(1, max_workers_)));
    info("Processing files", {kv("files", files.size()), kv("workers", worker_count)});

    std::atomic<size_t> next{0};
    auto worker = [&tasks, &next]() {
        for (size_t index = next++; index < tasks.size(); index = next++) {
            tasks[index]();
        }
    };

    // The calling thread is always a worker, so tasks still drain when no
    // extra thread can be started.
    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (size_t i = 1; i < worker_count; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& ex) {
            warn("Failed to start worker thread",
                 {kv("started", threads.size() + 1), kv("error", ex.what())});
            break;
        }
    }
    worker();
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<FileResult> results;
    results.reserve(files.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& ex) {
            error("File task raised", {kv("file", files[i]), kv("error", ex.what())});
            FileResult failed;
            failed.file = files[i];
            failed.error = std::string("Unexpected error: ") + ex.what();
            results.push_back(std::move(failed));
        }
    }
    return results;
}

bool has_duplicate_paths(const std::vector<std::string>& files) {
    std::set<std::string> seen;
    for (const auto& file : files) {
        std::error_code ec;
        auto normalized = std::filesystem::absolute(file, ec);
        if (!ec) {
            normalized = std::filesystem::weakly_canonical(normalized, ec);
        }
        const auto key = ec ? file : normalized.string();
        if (!seen.insert(key).second) {
            return true;
        }
    }
    return false;
}

}
