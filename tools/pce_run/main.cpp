// pce-run: load a JSON process program, run it and print the JSON run report

#include "common/Logger.h"
#include "engine/ProcessEngine.h"
#include "parsing/ProcessJsonParser.h"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

void printUsage(const char *programName) {
    std::cerr << "Usage: " << programName << " <program.json> [options]\n\n";
    std::cerr << "Run a process-calculus program given as a JSON process tree.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <file.json>     Engine configuration\n";
    std::cerr << "  --inject <channel=json>  Publish a payload on @\"channel\" before running (repeatable)\n";
    std::cerr << "  --max-steps <n>          Step budget (overrides the configuration)\n";
    std::cerr << "  --log-level <level>      trace, debug, info, warn, error, off\n";
    std::cerr << "  --log-dir <dir>          Write pce.log into <dir>\n\n";
    std::cerr << "Exit codes: 0 completed or quiescent, 1 usage or load error, 2 failed,\n";
    std::cerr << "            3 deadlocked, 4 step limit exceeded\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << programName << " greeter.json --inject 'greet=[\"world\"]'\n";
}

int exitCodeFor(PCE::RunStatus status) {
    switch (status) {
    case PCE::RunStatus::COMPLETED:
    case PCE::RunStatus::QUIESCENT:
        return 0;
    case PCE::RunStatus::FAILED:
        return 2;
    case PCE::RunStatus::DEADLOCKED:
        return 3;
    case PCE::RunStatus::STEP_LIMIT_EXCEEDED:
        return 4;
    case PCE::RunStatus::RUNNING:
        break;
    }
    return 1;
}

struct Options {
    std::string programPath;
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> injections;
    std::optional<uint64_t> maxSteps;
    std::optional<std::string> logLevel;
    std::optional<std::string> logDir;
};

// Returns false on a usage error
bool parseArguments(int argc, char **argv, Options &options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string &out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--config") {
            if (!next(options.configPath)) {
                return false;
            }
        } else if (arg == "--inject") {
            if (!next(value)) {
                return false;
            }
            auto separator = value.find('=');
            if (separator == std::string::npos || separator == 0) {
                std::cerr << "Injection must look like channel=json, got '" << value << "'\n";
                return false;
            }
            options.injections.emplace_back(value.substr(0, separator), value.substr(separator + 1));
        } else if (arg == "--max-steps") {
            if (!next(value)) {
                return false;
            }
            char *end = nullptr;
            unsigned long long steps = std::strtoull(value.c_str(), &end, 10);
            if (*end != '\0' || steps == 0 || value[0] == '-') {
                std::cerr << "Invalid step budget '" << value << "'\n";
                return false;
            }
            options.maxSteps = static_cast<uint64_t>(steps);
        } else if (arg == "--log-level") {
            if (!next(value)) {
                return false;
            }
            options.logLevel = value;
        } else if (arg == "--log-dir") {
            if (!next(value)) {
                return false;
            }
            options.logDir = value;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << "\n";
            return false;
        } else if (options.programPath.empty()) {
            options.programPath = arg;
        } else {
            std::cerr << "Unexpected argument " << arg << "\n";
            return false;
        }
    }
    return !options.programPath.empty();
}

}  // namespace

int main(int argc, char **argv) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        PCE::EngineConfig config =
            options.configPath.empty() ? PCE::EngineConfig() : PCE::EngineConfig::fromFile(options.configPath);
        config.applyEnvironment();
        if (options.maxSteps) {
            config.maxSteps = *options.maxSteps;
        }
        if (options.logLevel) {
            config.logLevel = *options.logLevel;
        }
        if (options.logDir) {
            config.logDir = *options.logDir;
            config.logToFile = true;
        }

        PCE::Logger::initialize(config.logOptions());

        PCE::ProcessJsonParser parser;
        PCE::ProcessPtr program = parser.parseFile(options.programPath);
        if (!program) {
            for (const auto &message : parser.getErrorMessages()) {
                std::cerr << options.programPath << ": " << message << "\n";
            }
            return 1;
        }

        PCE::ProcessEngine engine(config);
        engine.load(program);
        for (const auto &[channel, payload] : options.injections) {
            PCE::InjectResult result = engine.injectJson(channel, payload);
            if (!result.isSuccess) {
                std::cerr << "Rejected injection on '" << channel << "': " << result.errorMessage << "\n";
                return 1;
            }
        }

        PCE::RunReport report = engine.run();
        std::cout << PCE::JsonUtils::toPrettyString(report.toJson()) << std::endl;
        PCE::Logger::flush();
        return exitCodeFor(report.status);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
