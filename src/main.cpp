// ============================================================================
// File: src/main.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Command line front end:
//     midibeat [options] <input.mid> <output.mid> <filter>
//
//   Exit codes: 0 success, 1 conversion error, 2 usage error.
//
// ============================================================================

#include "core/Config.h"
#include "core/Error.h"
#include "core/Logger.h"
#include "midi/ConversionPipeline.h"
#include "midi/filters/FilterRegistry.h"

#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace midiBeat;

namespace fs = std::filesystem;

namespace {

constexpr const char* VERSION = "1.0.0";

constexpr int EXIT_CONVERSION_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;

/// Bad command line or arguments that fail the pre-conversion checks
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace

// ============================================================================
// COMMAND LINE ARGUMENTS
// ============================================================================

struct CommandLineArgs {
    std::string configPath;
    std::string logLevel;
    std::optional<int> ticksPerBeat;
    std::optional<double> multiplier;
    std::vector<std::string> positional;
    bool verbose = false;
    bool dumpJson = false;
    bool listFilters = false;
    bool showHelp = false;
    bool showVersion = false;
};

// ============================================================================
// FUNCTION DECLARATIONS
// ============================================================================

void printUsage(const char* programName);
void printVersion();
void printFilters(const FilterRegistry& registry);
CommandLineArgs parseCommandLine(int argc, char* argv[]);
void applyLoggingConfig(const CommandLineArgs& args);
void checkPaths(const std::string& input, const std::string& output);

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        // ====================================================================
        // 1. PARSE COMMAND LINE ARGUMENTS
        // ====================================================================

        CommandLineArgs args = parseCommandLine(argc, argv);

        if (args.showHelp) {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        }

        if (args.showVersion) {
            printVersion();
            return EXIT_SUCCESS;
        }

        // ====================================================================
        // 2. CONFIGURATION AND LOGGING
        // ====================================================================

        Config& config = Config::instance();
        if (!args.configPath.empty() && !config.load(args.configPath)) {
            Logger::warning("main", "Some configuration values were invalid and reset to defaults");
        }

        applyLoggingConfig(args);

        FilterRegistry registry;

        if (args.listFilters) {
            printFilters(registry);
            return EXIT_SUCCESS;
        }

        // ====================================================================
        // 3. VALIDATE ARGUMENTS
        // ====================================================================

        if (args.positional.size() != 3) {
            throw UsageError("Expected <input.mid> <output.mid> <filter>, got " +
                             std::to_string(args.positional.size()) + " arguments");
        }

        const std::string& inputPath = args.positional[0];
        const std::string& outputPath = args.positional[1];
        const std::string& filterName = args.positional[2];

        checkPaths(inputPath, outputPath);

        RepresentationFilter& filter = registry.getFilter(filterName);

        if (args.multiplier) {
            if (filterName == "swing" || filterName == "unswing") {
                filter.setParameter("multiplier", *args.multiplier);
            } else {
                Logger::warning("main", "--mult is ignored by filter " + filterName);
            }
        }

        PipelineOptions options = PipelineOptions::fromConfig();
        if (args.ticksPerBeat) {
            options.outputTicksPerBeat = *args.ticksPerBeat;
        }

        // ====================================================================
        // 4. CONVERT
        // ====================================================================

        ConversionPipeline pipeline(options);
        MidiRepresentation result = pipeline.processFile(inputPath, outputPath, filter);

        if (args.dumpJson) {
            std::cout << result.toJson().dump(2) << std::endl;
        }

        Logger::info("main", "Processing complete");
        return EXIT_SUCCESS;

    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Use --help for usage information" << std::endl;
        return EXIT_USAGE_ERROR;

    } catch (const MidiBeatException& e) {
        switch (e.getCode()) {
            case ErrorCode::FILTER_NOT_FOUND:
            case ErrorCode::CONFIG_PARSE_ERROR:
            case ErrorCode::INVALID_CONFIG:
            case ErrorCode::FILE_NOT_FOUND:
                Logger::error("main", std::string(e.what()) + " [" + e.getCodeString() + "]");
                return EXIT_USAGE_ERROR;

            case ErrorCode::NEGATIVE_DURATION:
                Logger::critical("main", std::string("Internal error: ") + e.what());
                return EXIT_CONVERSION_ERROR;

            default:
                Logger::error("main", std::string("Conversion failed: ") + e.what() +
                              " [" + e.getCodeString() + "]");
                return EXIT_CONVERSION_ERROR;
        }

    } catch (const std::exception& e) {
        Logger::error("main", std::string("Fatal exception: ") + e.what());
        return EXIT_CONVERSION_ERROR;
    }
}

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS] <input.mid> <output.mid> <filter>\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH        Path to JSON config file\n"
              << "  -t, --ticks-per-beat N   Output resolution (default: input's)\n"
              << "  -m, --mult X             Swing multiplier for swing/unswing\n"
              << "  -l, --log-level LVL      Log level (debug|info|warning|error|critical)\n"
              << "  -v, --verbose            Verbose output (debug level)\n"
              << "  -j, --dump-json          Print the filtered representation as JSON\n"
              << "      --list-filters       List available filters\n"
              << "  -h, --help               Show this help\n"
              << "  -V, --version            Show version\n"
              << "\n"
              << "Filters: no_filter, no_chords, swing, unswing, tempo_integrator\n"
              << "\n"
              << "Example:\n"
              << "  " << programName << " song.mid swung.mid swing --mult 2\n"
              << std::endl;
}

void printVersion() {
    std::cout << "MidiBeat v" << VERSION << "\n"
              << "Beat-addressed MIDI conversion toolkit\n"
              << std::endl;
}

void printFilters(const FilterRegistry& registry) {
    for (const auto& name : registry.listFilters()) {
        std::cout << "  " << name << "  "
                  << registry.getFilter(name).getDescription() << "\n";
    }
    std::cout << std::flush;
}

namespace {

std::string requireValue(int argc, char* argv[], int& i, const std::string& option) {
    if (i + 1 >= argc) {
        throw UsageError(option + " requires an argument");
    }
    return argv[++i];
}

int parseInt(const std::string& text, const std::string& option) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw UsageError(option + ": not an integer: " + text);
    }
    if (consumed != text.size()) {
        throw UsageError(option + ": not an integer: " + text);
    }
    return value;
}

double parseDouble(const std::string& text, const std::string& option) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw UsageError(option + ": not a number: " + text);
    }
    if (consumed != text.size()) {
        throw UsageError(option + ": not a number: " + text);
    }
    return value;
}

} // namespace

CommandLineArgs parseCommandLine(int argc, char* argv[]) {
    CommandLineArgs args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.showHelp = true;
        }
        else if (arg == "-V" || arg == "--version") {
            args.showVersion = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        }
        else if (arg == "-j" || arg == "--dump-json") {
            args.dumpJson = true;
        }
        else if (arg == "--list-filters") {
            args.listFilters = true;
        }
        else if (arg == "-c" || arg == "--config") {
            args.configPath = requireValue(argc, argv, i, arg);
        }
        else if (arg == "-l" || arg == "--log-level") {
            args.logLevel = requireValue(argc, argv, i, arg);
            if (!Logger::parseLevel(args.logLevel)) {
                throw UsageError(arg + ": unknown level: " + args.logLevel);
            }
        }
        else if (arg == "-t" || arg == "--ticks-per-beat") {
            int ticks = parseInt(requireValue(argc, argv, i, arg), arg);
            if (ticks < 1 || ticks > 0x7FFF) {
                throw UsageError(arg + " must be between 1 and 32767");
            }
            args.ticksPerBeat = ticks;
        }
        else if (arg == "-m" || arg == "--mult") {
            double multiplier = parseDouble(requireValue(argc, argv, i, arg), arg);
            if (!std::isfinite(multiplier) || multiplier <= 0.0) {
                throw UsageError(arg + " must be a positive number");
            }
            args.multiplier = multiplier;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        }
        else {
            args.positional.push_back(arg);
        }
    }

    return args;
}

void applyLoggingConfig(const CommandLineArgs& args) {
    const Config& config = Config::instance();

    std::string level = args.logLevel.empty()
        ? config.getString("logging.level", "info")
        : args.logLevel;
    Logger::setLevel(Logger::levelFromString(level));

    if (args.verbose) {
        Logger::setLevel(Logger::Level::DEBUG);
    }

    if (config.getBool("logging.file_enabled", false)) {
        std::string path = config.getString("logging.file_path", "");
        if (path.empty() || !Logger::enableFileLogging(path)) {
            Logger::warning("main", "File logging requested but log file unavailable: " + path);
        }
    }
}

void checkPaths(const std::string& input, const std::string& output) {
    std::error_code ec;
    if (!fs::is_regular_file(input, ec)) {
        throw UsageError("The input file does not exist: " + input);
    }
    if (fs::path(input).extension() != ".mid") {
        throw UsageError("Input file does not end with .mid: " + input);
    }
    if (fs::path(output).extension() != ".mid") {
        throw UsageError("Output file does not end with .mid: " + output);
    }
}

// ============================================================================
// END OF FILE main.cpp
// ============================================================================
