#include <iostream>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <pairdays/cli/pairdays_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so table/JSON output on stdout stays clean;
        // PairdaysCLI::run() adjusts the level based on flags and config.
        auto logger = spdlog::stderr_color_mt("pairdays");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        pairdays::cli::PairdaysCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
