#pragma once

#include <istream>
#include <ostream>
#include <vector>

#include "nomoji/config.hpp"
#include "nomoji/processor.hpp"

namespace nomoji {

class App {
public:
    App(Config config, std::istream& in, std::ostream& out, std::ostream& err);

    // Returns the process exit status: 0 when every unit succeeded.
    int run();

private:
    int run_stdin();
    int run_files();
    void emit_stdout(std::vector<FileResult>& results);
    int effective_jobs() const;

    Config config_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

}
