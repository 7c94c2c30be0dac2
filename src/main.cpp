#include "tools/code_execution_tool.h"
#include "sandbox/result_codec.h"
#include "python/runtime.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include <cstdint>
#include <cerrno>
#include <getopt.h>

namespace snipbox {

static const char* SNIPBOX_VERSION = "0.1.0";

constexpr int EXIT_EXECUTION_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct CliConfig {
    bool showHelp = false;
    bool showVersion = false;
    bool isolated = false;
    bool requestMode = false;
    std::string configPath;
    std::string inputPath = "-";
    std::string logLevel;
    std::string logFile;
    std::optional<uint32_t> timeoutSeconds;
    std::optional<uint32_t> maxMemoryMb;
    std::optional<std::vector<std::string>> allowedModules;
};

void printHelp(const char* progName) {
    std::cout << "snipbox v" << SNIPBOX_VERSION << " - Sandboxed Python snippet runner\n\n";
    std::cout << "Usage: " << progName << " [options] [FILE|-]\n\n";
    std::cout << "Reads a snippet from FILE (or stdin), runs it and prints the JSON result.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -v, --version         Show version\n";
    std::cout << "  -c, --config FILE     Use config file (key=value)\n";
    std::cout << "  -t, --timeout SEC     Execution deadline in seconds (default: 5)\n";
    std::cout << "  -a, --allow LIST      Comma-separated allowed modules\n";
    std::cout << "  -m, --memory MB       Memory budget in MB for isolated runs (default: 100)\n";
    std::cout << "  -i, --isolated        Run in a resource-limited child process\n";
    std::cout << "  -r, --request         Input is a JSON request instead of raw source\n";
    std::cout << "  -l, --loglevel LEVEL  Log level (trace/debug/info/warn/error/off)\n";
    std::cout << "  -L, --logfile FILE    Also write logs to FILE\n";
    std::cout << "\nExit status: 0 success, 1 failed execution, 2 usage or configuration error\n";
}

void printVersion() {
    std::cout << "snipbox v" << SNIPBOX_VERSION << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
    std::cout << "Python: " << PY_VERSION << "\n";
}

static bool parseUnsigned(const char* text, uint32_t& out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text, &end, 10);
    if (errno != 0 || *end != '\0' || text[0] == '-' || value > UINT32_MAX) return false;
    out = static_cast<uint32_t>(value);
    return true;
}

static std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        size_t end = item.find_last_not_of(" \t");
        items.push_back(item.substr(start, end - start + 1));
    }
    return items;
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'v'},
        {"config", required_argument, 0, 'c'},
        {"timeout", required_argument, 0, 't'},
        {"allow", required_argument, 0, 'a'},
        {"memory", required_argument, 0, 'm'},
        {"isolated", no_argument, 0, 'i'},
        {"request", no_argument, 0, 'r'},
        {"loglevel", required_argument, 0, 'l'},
        {"logfile", required_argument, 0, 'L'},
        {0, 0, 0, 0}
    };

    int opt;
    int optionIndex = 0;
    uint32_t number = 0;

    while ((opt = getopt_long(argc, argv, "hvc:t:a:m:irl:L:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configPath = optarg;
                break;
            case 't':
                if (!parseUnsigned(optarg, number) || number == 0) {
                    std::cerr << "Invalid --timeout: " << optarg << "\n";
                    return false;
                }
                config.timeoutSeconds = number;
                break;
            case 'a':
                config.allowedModules = splitList(optarg);
                break;
            case 'm':
                if (!parseUnsigned(optarg, number)) {
                    std::cerr << "Invalid --memory: " << optarg << "\n";
                    return false;
                }
                config.maxMemoryMb = number;
                break;
            case 'i':
                config.isolated = true;
                break;
            case 'r':
                config.requestMode = true;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            case 'L':
                config.logFile = optarg;
                break;
            default:
                return false;
        }
    }

    if (optind < argc) {
        config.inputPath = argv[optind++];
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

static bool readInput(const std::string& path, std::string& out) {
    std::ostringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        if (std::cin.bad()) return false;
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) return false;
        buffer << file.rdbuf();
    }
    out = buffer.str();
    return true;
}

static void setupLogging(const utils::LogConfig& logConfig, const CliConfig& cli) {
    std::string level = cli.logLevel.empty() ? logConfig.level : cli.logLevel;
    std::string file = cli.logFile.empty() ? logConfig.file : cli.logFile;

    utils::Logger::setLevel(utils::Logger::parseLevel(level, utils::LogLevel::INFO));
    utils::Logger::enableConsole(logConfig.console);
    utils::Logger::setMaxFileSize(logConfig.maxFileSize);
    utils::Logger::setMaxFiles(logConfig.maxFiles);
    utils::Logger::init(file);
    utils::Logger::enableFile(!file.empty());
}

static int runSnippet(const CliConfig& cli) {
    utils::Config& config = utils::Config::instance();
    if (!cli.configPath.empty() && !config.load(cli.configPath)) {
        std::cerr << "snipbox: cannot read config file " << cli.configPath << "\n";
        return EXIT_USAGE;
    }

    setupLogging(config.getLogConfig(), cli);

    tools::ToolConfig toolConfig = tools::ToolConfig::fromConfig(config);
    if (cli.maxMemoryMb) toolConfig.defaultPolicy.maxMemoryMb = *cli.maxMemoryMb;
    if (cli.isolated) toolConfig.isolation = tools::IsolationMode::SUBPROCESS;

    auto valid = toolConfig.defaultPolicy.validate();
    if (!valid.ok()) {
        std::cerr << "snipbox: invalid sandbox configuration: " << valid.error().toString() << "\n";
        return EXIT_USAGE;
    }

    std::string input;
    if (!readInput(cli.inputPath, input)) {
        std::cerr << "snipbox: cannot read " << (cli.inputPath == "-" ? "stdin" : cli.inputPath) << "\n";
        return EXIT_USAGE;
    }

    tools::ExecutionRequest request;
    if (cli.requestMode) {
        auto parsed = tools::ExecutionRequest::fromJson(input);
        if (!parsed.ok()) {
            std::cerr << "snipbox: " << parsed.error().toString() << "\n";
            return EXIT_USAGE;
        }
        request = parsed.value();
    } else {
        request.source = input;
    }
    if (cli.timeoutSeconds) request.timeoutSeconds = cli.timeoutSeconds;
    if (cli.allowedModules) request.allowedModules = cli.allowedModules;

    auto init = python::PythonRuntime::init();
    if (!init.ok()) {
        std::cerr << "snipbox: " << init.error().toString() << "\n";
        return EXIT_USAGE;
    }
    LOG_DEBUG("Python " + python::PythonRuntime::version() + " ready, isolation=" +
              tools::isolationModeName(toolConfig.isolation));

    tools::CodeExecutionTool tool(toolConfig);
    sandbox::ExecutionResult result = tool.execute(request);

    std::cout << sandbox::dumpJson(sandbox::toJson(result), 2) << std::endl;
    return result.success ? 0 : EXIT_EXECUTION_FAILED;
}

}

int main(int argc, char* argv[]) {
    snipbox::CliConfig config;

    if (!snipbox::parseArgs(argc, argv, config)) {
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return snipbox::EXIT_USAGE;
    }

    if (config.showHelp) {
        snipbox::printHelp(argv[0]);
        return 0;
    }

    if (config.showVersion) {
        snipbox::printVersion();
        return 0;
    }

    int result = snipbox::runSnippet(config);

    snipbox::python::PythonRuntime::shutdown();
    snipbox::utils::Logger::flush();
    snipbox::utils::Logger::shutdown();
    return result;
}
