#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "catalog/pattern_catalog.hpp"
#include "catalog/pattern_file.hpp"
#include "pipeline/anonymization_pipeline.hpp"
#include "pipeline/demo_corpus.hpp"
#include "pipeline/line_batch.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

void printHelp(const char* argv0) {
    std::cout << "Usage:\n"
              << "  " << argv0 << " [options] [input_file]   Redact identifiers line by line (stdin if no file)\n"
              << "  " << argv0 << " --demo                   Redact the built-in demonstration texts\n"
              << "\nOptions:\n"
              << "  --config <file>        key=value configuration file\n"
              << "  --patterns <file>      LABEL=regex pattern file (replaces the built-in catalog)\n"
              << "  --placeholder <text>   replacement token (default <ID>)\n"
              << "  --threads <n>          worker threads, 0 = hardware concurrency\n"
              << "  -h, --help             show this help message\n";
}

struct CommandLine {
    std::string configPath;
    std::string inputPath;
    bool demo = false;
    bool help = false;
    // flags that override config file values, applied after it is loaded
    std::vector<std::pair<std::string, std::string>> overrides;
};

CommandLine parseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    auto needValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error("missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "--demo") {
            cmd.demo = true;
        } else if (arg == "--config") {
            cmd.configPath = needValue(i, arg);
        } else if (arg == "--patterns") {
            cmd.overrides.emplace_back("patternFile", needValue(i, arg));
        } else if (arg == "--placeholder") {
            cmd.overrides.emplace_back("placeholder", needValue(i, arg));
        } else if (arg == "--threads") {
            cmd.overrides.emplace_back("workerThreads", needValue(i, arg));
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::runtime_error("unknown option " + arg);
        } else if (cmd.inputPath.empty()) {
            cmd.inputPath = arg;
        } else {
            throw std::runtime_error("more than one input file given");
        }
    }
    return cmd;
}

std::vector<std::string> readLines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

int main(int argc, char** argv) {
    namespace logger = idredact::util::logger;

    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "[main] " << ex.what() << "\n";
        printHelp(argv[0]);
        return 1;
    }
    if (cmd.help) {
        printHelp(argv[0]);
        return 0;
    }

    try {
        // 1. Configuration: defaults, then config file, then flags
        idredact::config::RedactorConfig config;
        idredact::util::ConfigParser configParser(config);
        if (!cmd.configPath.empty()) {
            configParser.loadFromFile(cmd.configPath);
        }
        for (const auto& kv : cmd.overrides) {
            configParser.set(kv.first, kv.second);
        }

        logger::setLogLevel(logger::parseLogLevel(config.logLevel));
        if (!config.logFile.empty()) {
            logger::enableFileOutput(config.logFile, true);
        }

        // 2. Pattern catalog, built once and shared read-only by every worker
        std::unique_ptr<idredact::catalog::PatternCatalog> customCatalog;
        const idredact::catalog::PatternCatalog* catalog = nullptr;
        if (!config.patternFile.empty()) {
            customCatalog = std::make_unique<idredact::catalog::PatternCatalog>(
                idredact::catalog::PatternCatalog::build(
                    idredact::catalog::loadPatternFile(config.patternFile), config.regexLocale));
            catalog = customCatalog.get();
        } else if (config.regexLocale != idredact::catalog::kDefaultRegexLocale) {
            customCatalog = std::make_unique<idredact::catalog::PatternCatalog>(
                idredact::catalog::PatternCatalog::build(idredact::catalog::builtinPatterns(),
                                                         config.regexLocale));
            catalog = customCatalog.get();
        } else {
            catalog = &idredact::catalog::PatternCatalog::builtin();
        }
        logger::info("[main] Catalog ready: " + std::to_string(catalog->size()) +
                     " patterns, fingerprint " + catalog->fingerprint());

        idredact::pipeline::AnonymizationPipeline pipeline(*catalog, nullptr, config.placeholder,
                                                           config.maxEntityTextLength);
        idredact::pipeline::LineBatchRedactor batch(pipeline, config.workerThreads);
        logger::debug("[main] Using " + std::to_string(batch.threadCount()) + " worker threads");

        // 3. Demo mode: print original / redacted pairs
        if (cmd.demo) {
            const auto texts = idredact::pipeline::demoCorpus();
            const auto redacted = batch.process(texts);
            for (size_t i = 0; i < texts.size(); ++i) {
                std::cout << "Original:   " << texts[i] << "\n"
                          << "Redacted:   " << redacted[i] << "\n"
                          << std::string(50, '-') << "\n";
            }
            logger::info("[main] Demo finished: " + std::to_string(batch.stats().changedLines) + " of " +
                         std::to_string(batch.stats().lines) + " texts changed");
            return 0;
        }

        // 4. Line filter mode
        std::vector<std::string> lines;
        if (cmd.inputPath.empty()) {
            lines = readLines(std::cin);
        } else {
            std::ifstream in(cmd.inputPath);
            if (!in.is_open()) {
                logger::error("[main] Cannot open input file: " + cmd.inputPath);
                return 1;
            }
            lines = readLines(in);
        }

        const auto redacted = batch.process(lines);
        for (const auto& line : redacted) {
            std::cout << line << "\n";
        }
        std::cout.flush();

        logger::info("[main] Redacted " + std::to_string(batch.stats().changedLines) + " of " +
                     std::to_string(batch.stats().lines) + " lines");
    } catch (const idredact::catalog::PatternCompilationError& ex) {
        logger::critical("[main] " + std::string(ex.what()));
        return 1;
    } catch (const std::exception& ex) {
        logger::error("[main] aborted: " + std::string(ex.what()));
        return 1;
    }
    return 0;
}
