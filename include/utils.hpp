#pragma once

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <chrono>
#include <mutex>
#include <atomic>
#include <thread>
#include <functional>
#include <utility>
#include <ostream>
#include <iostream> // For default std::cout in Logger

// RDKit Forward Declarations
namespace RDKit {
    class ROMol;
}

namespace namefact {

enum class ErrorCode {
    SUCCESS = 0,
    PARSE_ERROR,
    IO_ERROR,
    STRUCTURAL_ERROR,
    NAMING_ERROR,
    CONFIG_ERROR,
    NOT_IMPLEMENTED,
    UNKNOWN_ERROR
};

const char* errorCodeToString(ErrorCode code);

class NamingException : public std::runtime_error {
private:
    ErrorCode code;

public:
    NamingException(const std::string& message, ErrorCode code = ErrorCode::UNKNOWN_ERROR);
    ErrorCode getCode() const;
};

// Malformed molecular graph. Never repaired, always propagated to the caller.
class StructuralError : public NamingException {
public:
    explicit StructuralError(const std::string& message);
};

struct Config {
    int numThreads = 1;
    bool verbose = false;
    std::string logLevel = "WARNING";
    size_t batchSize = 1000;
    std::string rulesPath;      // optional JSON alias table
    bool includeTrace = false;  // emit rule trace with each result
};

extern Config globalConfig;

namespace util {
    std::string join(const std::vector<std::string>& parts, const std::string& separator);
    std::string trim(const std::string& text);
}


enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

LogLevel parseLogLevel(const std::string& name);

class ProgressBar;

class Logger {
private:
    LogLevel minLevel;
    std::mutex logMutex;
    std::ostream& out;
    std::ostream& err_out;
    bool colorEnabled;
    ProgressBar* activeProgressBar;
    std::vector<std::pair<LogLevel, std::string>> bufferedMessages;

    std::ostream& streamFor(LogLevel level);
    std::string formatMessage(LogLevel level, const std::string& message);

public:
    Logger(LogLevel minLevel = LogLevel::WARNING,
          std::ostream& out_stream = std::cout,
          std::ostream& err_stream = std::cerr,
          bool colorEnabled = true);

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    void setMinLevel(LogLevel level);

    void setActiveProgressBar(ProgressBar* progressBar);
    void clearActiveProgressBar();
    void flushBufferedMessages();
};

extern Logger globalLogger;

// Terminal progress line for batch naming. Counts named and failed molecules;
// log output is buffered by globalLogger while the bar is drawn.
class ProgressBar {
private:
    size_t total;
    std::atomic<size_t> current{0};
    std::atomic<size_t> failures{0};
    std::string label;
    std::atomic<bool> active{false};
    std::chrono::steady_clock::time_point startTime;
    int refreshMs;
    std::mutex drawMutex;
    std::thread drawThread;

    void drawLoop();
    void draw(bool final);

public:
    ProgressBar(size_t total, const std::string& label = std::string("Naming"), int refreshMs = 100);
    ~ProgressBar();

    void start();
    void update(size_t processed, size_t failed = 0);
    void finish();
    double getProgress() const;
    double getElapsedSeconds() const;
    size_t getFailures() const { return failures.load(std::memory_order_relaxed); }
    void temporarilyPauseDisplay(const std::function<void()>& callback);
};


// One input record: the SMILES text as given and the RDKit molecule parsed from it.
class MoleculeRecord {
private:
    std::shared_ptr<RDKit::ROMol> mol;
    std::string originalSmiles;
    bool valid;
    std::string errorMessage;

public:
    MoleculeRecord();
    explicit MoleculeRecord(const std::string& smiles);

    bool parse(const std::string& smiles);
    bool isValid() const;
    const std::string& getErrorMessage() const;

    std::shared_ptr<RDKit::ROMol> getMolecule() const;
    const std::string& getOriginalSmiles() const;

    void setOriginalSmiles(const std::string& original) { originalSmiles = original; }
    void setErrorMessage(const std::string& message) { errorMessage = message; }
};

class MoleculeBatch {
private:
    std::vector<MoleculeRecord> records;

public:
    explicit MoleculeBatch(size_t initialSize = 0);

    void addSmilesBatch(const std::vector<std::string>& smiles);

    size_t size() const;
    const std::vector<MoleculeRecord>& getRecords() const;
};

} // namespace namefact
