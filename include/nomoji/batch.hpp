#pragma once

#include <functional>
#include <string>
#include <vector>

#include "nomoji/processor.hpp"

namespace nomoji {

class BatchRunner {
public:
    using TaskFn = std::function<FileResult(const std::string& file)>;

    BatchRunner(int max_workers, TaskFn task_fn);

    // Runs the task over every file with at most `max_workers` threads and
    // returns the results in the order of `files`.
    std::vector<FileResult> run(const std::vector<std::string>& files) const;

private:
    int max_workers_;
    TaskFn task_fn_;
};

bool has_duplicate_paths(const std::vector<std::string>& files);

}
