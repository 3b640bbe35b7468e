#include "io.hpp"
#include "naming.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#ifdef WITH_TBB
#include <tbb/global_control.h>
#endif

using namespace namefact;

namespace {

void printVersion() {
    std::cout << "\033[1;36mNameFactory\033[0m (\033[1mnamefact\033[0m) v0.1.0" << std::endl;
}

void printHelp(const cxxopts::Options& options) {
    std::cout << options.help() << std::endl;
}

void printResult(const std::string& smiles, const NameResult& result, bool json, bool trace) {
    if (json) {
        std::cout << result.toJSON(trace) << std::endl;
        return;
    }
    if (result.error) {
        std::cerr << "\033[1;31mError:\033[0m " << smiles << ": " << result.errorMessage << std::endl;
        return;
    }
    std::cout << result.name << std::endl;
    if (trace) {
        for (const auto& entry : result.trace) {
            std::cout << "  [" << entry.ruleId << "] " << naming::phaseToString(entry.phase) << ": "
                      << entry.message << std::endl;
        }
        for (const auto& warning : result.warnings) {
            std::cout << "  warning " << naming::diagnosticKindName(warning.kind) << ": " << warning.message
                      << std::endl;
        }
        std::cout << "  confidence " << result.confidence << std::endl;
    }
}

int runBatch(const RuleEngine& engine, const std::string& inputPath, const std::string& outputPath,
             const std::string& smilesColumn, const std::string& delimiter, bool hasHeader) {
    if (!std::filesystem::exists(std::filesystem::path(inputPath))) {
        globalLogger.error("Input file does not exist: " + inputPath);
        return 1;
    }
    globalLogger.info("Processing input file: " + inputPath);
    globalLogger.info("Output will be written to: " + outputPath);

    CsvIO csv(inputPath, outputPath, delimiter, smilesColumn, hasHeader);
    CsvIO::LineReader lineReader = csv.createLineReader();
    CsvIO::ResultWriter resultWriter = csv.createResultWriter();

    size_t totalLines = lineReader.countDataLines();
    ProgressBar progressBar(totalLines > 0 ? totalLines : 1, "Naming", 50);
    progressBar.start();
    auto startTime = std::chrono::steady_clock::now();

    size_t processed = 0;
    size_t failed = 0;
    std::vector<std::string> smiles;
    std::vector<std::vector<std::string>> rows;
    while (lineReader.readBatch(smiles, rows, globalConfig.batchSize)) {
        MoleculeBatch batch(smiles.size());
        batch.addSmilesBatch(smiles);
        std::vector<NameResult> results = engine.generateBatch(batch);

        size_t batchFailures = 0;
        for (const auto& result : results) {
            if (result.error) ++batchFailures;
        }
        failed += batchFailures;
        if (!resultWriter.writeBatch(rows, results)) {
            progressBar.finish();
            globalLogger.error("Failed to write results to " + outputPath);
            return 1;
        }
        processed += results.size();
        progressBar.update(results.size(), batchFailures);
    }
    resultWriter.flush();
    progressBar.finish();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    globalLogger.info("Named " + std::to_string(processed - failed) + " of " + std::to_string(processed) +
                      " molecules in " + std::to_string(elapsed.count()) + " ms");
    if (failed > 0) {
        globalLogger.warning(std::to_string(failed) + " molecule(s) could not be named");
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("\033[1;36mnamefact\033[0m", "IUPAC substitutive names for molecular structures");

    options.add_options("Basic")
        ("h,help", "Display help information")
        ("version", "Display version information")
        ("v,verbose", "Enable detailed logging output");

    options.add_options("Input/Output")
        ("s,smiles", "Name a single SMILES string", cxxopts::value<std::string>())
        ("i,input", "Input CSV file path", cxxopts::value<std::string>())
        ("o,output", "Output CSV file path", cxxopts::value<std::string>())
        ("json", "Print single results as JSON")
        ("trace", "Include the rule trace in the output");

    options.add_options("CSV Options")
        ("smiles-column", "Name or 0-based index of the SMILES column",
         cxxopts::value<std::string>()->default_value("SMILES"))
        ("delimiter", "CSV delimiter character", cxxopts::value<std::string>()->default_value(","))
        ("no-header", "Input CSV file has no header");

    options.add_options("Naming")
        ("rules", "JSON alias table overlaid on the built-in tables", cxxopts::value<std::string>())
        ("log-level", "DEBUG, INFO, WARNING or ERROR", cxxopts::value<std::string>()->default_value("WARNING"));

    options.add_options("Performance")
        ("b,batch-size", "Number of molecules per batch", cxxopts::value<size_t>())
        ("t,threads", "Number of parallel threads (0=auto)", cxxopts::value<int>());

    options.set_width(100);

    if (argc == 1 || (argc > 1 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))) {
        printHelp(options);
        return 0;
    }

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) { printHelp(options); return 0; }
        if (result.count("version")) { printVersion(); return 0; }

        globalConfig.numThreads = result.count("threads") ? result["threads"].as<int>() : 0;
        globalConfig.verbose = result.count("verbose") > 0;
        globalConfig.batchSize = result.count("batch-size") ? result["batch-size"].as<size_t>() : 1000;
        globalConfig.logLevel = result["log-level"].as<std::string>();
        globalConfig.includeTrace = result.count("trace") > 0;
        if (result.count("rules")) globalConfig.rulesPath = result["rules"].as<std::string>();

        if (globalConfig.verbose) {
            globalLogger.setMinLevel(LogLevel::DEBUG);
            globalLogger.info("Verbose mode enabled.");
        } else {
            globalLogger.setMinLevel(parseLogLevel(globalConfig.logLevel));
        }
        if (globalConfig.batchSize == 0) {
            globalLogger.error("Batch size must be positive.");
            return 1;
        }

        if (globalConfig.numThreads <= 0) {
            int availableCores = static_cast<int>(std::thread::hardware_concurrency());
            globalConfig.numThreads = availableCores > 1 ? availableCores - 1 : 1;
            globalLogger.info("Auto-configured to use " + std::to_string(globalConfig.numThreads) + " threads.");
        }

#ifdef WITH_TBB
        tbb::global_control globalLimit(tbb::global_control::max_allowed_parallelism,
                                        static_cast<size_t>(globalConfig.numThreads));
        globalLogger.debug("TBB configured with " + std::to_string(globalConfig.numThreads) + " threads");
#endif

        naming::RuleTables tables = globalConfig.rulesPath.empty()
                                        ? naming::RuleTables::builtin()
                                        : naming::RuleTables::fromJsonFile(globalConfig.rulesPath);
        RuleEngine engine(tables);

        if (result.count("smiles")) {
            const std::string smiles = result["smiles"].as<std::string>();
            NameResult named = engine.generateFromSmiles(smiles);
            printResult(smiles, named, result.count("json") > 0, globalConfig.includeTrace);
            return named.error ? 2 : 0;
        }

        if (!result.count("input") || !result.count("output")) {
            std::cerr << "\033[1;31mError:\033[0m either --smiles or both --input and --output are required."
                      << std::endl;
            printHelp(options);
            return 1;
        }

        return runBatch(engine, result["input"].as<std::string>(), result["output"].as<std::string>(),
                        result["smiles-column"].as<std::string>(), result["delimiter"].as<std::string>(),
                        result.count("no-header") == 0);

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "\033[1;31mError parsing options:\033[0m " << e.what() << std::endl;
        printHelp(options);
        return 1;
    } catch (const NamingException& e) {
        globalLogger.fatal(std::string(errorCodeToString(e.getCode())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        globalLogger.fatal(std::string("Unhandled exception: ") + e.what());
        return 1;
    }
}
