#include "core/analysis_pipeline.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FATAL = 1;
    constexpr int EXIT_USAGE = 2;

    void printUsage(const char *program)
    {
        std::cout << "Archive Dedup - duplicate detection, quality ranking and record linkage for image archives" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE       JSON configuration file" << std::endl;
        std::cout << "  --root DIR          Directory to scan (scan.root)" << std::endl;
        std::cout << "  --records CSV       External record export (records.path)" << std::endl;
        std::cout << "  --db FILE           SQLite output database (database.path)" << std::endl;
        std::cout << "  --output DIR        Directory for CSV reports (output.directory)" << std::endl;
        std::cout << "  --log-level LEVEL   TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h          Show this help message" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    nlohmann::json overrides = nlohmann::json::object();

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return EXIT_OK;
        }

        auto next_value = [&](std::string &value)
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " needs a value" << std::endl;
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--config")
        {
            if (!next_value(config_path))
                return EXIT_USAGE;
        }
        else if (arg == "--root" || arg == "--records" || arg == "--db" || arg == "--output" || arg == "--log-level")
        {
            if (!next_value(value))
                return EXIT_USAGE;
            if (arg == "--root")
                overrides["scan"]["root"] = value;
            else if (arg == "--records")
                overrides["records"]["path"] = value;
            else if (arg == "--db")
                overrides["database"]["path"] = value;
            else if (arg == "--output")
                overrides["output"]["directory"] = value;
            else
                overrides["log_level"] = value;
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return EXIT_USAGE;
        }
    }

    auto &config = PocoConfigManager::getInstance();
    Logger::init(config.getLogLevel());

    if (!config_path.empty() && !config.load(config_path))
    {
        std::cerr << "Error: cannot load configuration " << config_path << std::endl;
        return EXIT_USAGE;
    }
    // Command-line values win over the configuration file
    config.update(overrides);

    if (!config.validateConfig())
    {
        std::cerr << "Error: invalid configuration" << std::endl;
        return EXIT_USAGE;
    }
    Logger::setLevel(config.getLogLevel());

    std::string root = config.getScanRoot();
    if (root.empty())
    {
        std::cerr << "Error: no scan root given (--root or scan.root)" << std::endl;
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    Logger::info("Starting archive analysis of " + root);

    PipelineResult result;
    try
    {
        AnalysisPipeline pipeline(PipelineOptions::fromConfig(config));
        result = pipeline.runOnDirectory(root);
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Analysis aborted: ") + e.what());
        return EXIT_FATAL;
    }

    if (!result.success)
    {
        std::cerr << "Error: " << result.error_message << std::endl;
        return EXIT_FATAL;
    }

    const auto &linkage = result.report.linkage;
    Logger::info("Done: " + std::to_string(result.report.records.size()) + " images, " +
                 std::to_string(result.report.exact.groups.size()) + " duplicate groups, " +
                 std::to_string(linkage.direct_count + linkage.propagated_count) + " linked, " +
                 std::to_string(linkage.conflict_count) + " in conflict");
    return EXIT_OK;
}
