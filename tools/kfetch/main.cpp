#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <kfetch/cli/kfetch_cli.h>

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so stdout stays clean for --json; KfetchCLI::run() adjusts the level
        spdlog::set_default_logger(spdlog::stderr_color_mt("kfetch"));
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        kfetch::cli::KfetchCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kfetch::cli::ExitFatal;
    }
}
