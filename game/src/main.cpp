#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "core/Logger.hpp"

#include "sim/Scenario.hpp"
#include "sim/ScenarioRunner.hpp"

namespace {
constexpr const char* ToolName = "hillkeeper_sim";
constexpr const char* ToolVersion = "1.0.0";
}

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string scenarioPath;
    std::string logPath;
    bool verbose = false;
    bool showHelp = false;
    bool valid = true;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if (arg == "-s" || arg == "--scenario") {
                if (i + 1 < argc) {
                    args.scenarioPath = argv[++i];
                } else {
                    args.valid = false;
                }
            } else if (arg == "-l" || arg == "--log") {
                if (i + 1 < argc) {
                    args.logPath = argv[++i];
                } else {
                    args.valid = false;
                }
            } else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                args.valid = false;
            }
        }

        if (!args.showHelp && args.scenarioPath.empty()) {
            args.valid = false;
        }
        return args;
    }

    static void PrintHelp() {
        std::cout << "Hillkeeper - King of the Hill scenario replay\n";
        std::cout << "=============================================\n\n";
        std::cout << "Usage: " << ToolName << " --scenario PATH [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help            Show this help message\n";
        std::cout << "  -s, --scenario PATH   Scenario file to replay\n";
        std::cout << "  -l, --log PATH        Also write the log to a file\n";
        std::cout << "  -v, --verbose         Log contest transitions and published state\n";
        std::cout << "\n";
        std::cout << "Version: " << ToolVersion << "\n";
    }
};

/**
 * @brief Replay a scenario headless and print the match report as JSON
 */
int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp) {
        CommandLineArgs::PrintHelp();
        return EXIT_SUCCESS;
    }
    if (!args.valid) {
        CommandLineArgs::PrintHelp();
        return EXIT_FAILURE;
    }

    Hillkeeper::Logger::Initialize(args.logPath, true);
    if (args.verbose) {
        Hillkeeper::Logger::SetLevel(spdlog::level::trace);
    }

    Hillkeeper::Sim::Scenario scenario;
    if (!scenario.Load(args.scenarioPath)) {
        SIM_LOG_ERROR("Failed to load scenario {}", args.scenarioPath);
        Hillkeeper::Logger::Shutdown();
        return EXIT_FAILURE;
    }

    Hillkeeper::Sim::ScenarioRunner runner(scenario);
    if (!runner.GetRules().IsActive()) {
        SIM_LOG_WARN("King of the Hill is disabled in scenario {}, replaying without rules", scenario.name);
    }

    const auto report = runner.Run();
    std::cout << report.ToJson().dump(2) << std::endl;

    Hillkeeper::Logger::Shutdown();
    return EXIT_SUCCESS;
}
