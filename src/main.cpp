#include "nomoji/app.hpp"
#include "nomoji/cli.hpp"
#include "nomoji/config.hpp"
#include "nomoji/logging.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "nomoji";
    // Console logging on stderr with defaults until the real config is known.
    nomoji::logging::init(nomoji::Config{});
    try {
        auto config = nomoji::Config::load();
        switch (nomoji::parse_args(argc, argv, config)) {
            case nomoji::CliAction::Help:
                std::cout << nomoji::usage(program);
                return 0;
            case nomoji::CliAction::Version:
                std::cout << nomoji::version() << "\n";
                return 0;
            case nomoji::CliAction::MissingArguments:
                std::cerr << nomoji::usage(program);
                return 2;
            case nomoji::CliAction::Run:
                break;
        }
        config.validate();
        nomoji::logging::init(config);
        nomoji::info(
            "Starting nomoji",
            {nomoji::kv("files", config.files.size()),
             nomoji::kv("dry_run", config.dry_run),
             nomoji::kv("backup", config.backup),
             nomoji::kv("inplace", config.inplace),
             nomoji::kv("jobs", config.jobs)});
        std::ios::sync_with_stdio(false);
        nomoji::App app(std::move(config), std::cin, std::cout, std::cerr);
        return app.run();
    } catch (const nomoji::UsageError& ex) {
        std::cerr << "error: " << ex.what() << "\n\n" << nomoji::usage(program);
        return 2;
    } catch (const std::exception& ex) {
        nomoji::error(
            "Startup failed",
            {nomoji::kv("error", ex.what())});
        return 1;
    }
}
