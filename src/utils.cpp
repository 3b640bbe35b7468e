#include "utils.hpp"

// RDKit includes for implementation
#include <GraphMol/GraphMol.h>
#include <GraphMol/SanitException.h>
#include <GraphMol/SmilesParse/SmilesParse.h>

// TBB includes (conditionally)
#ifdef WITH_TBB
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#endif

// Includes for ProgressBar display
#include <unistd.h>
#include <sys/ioctl.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace namefact {

// --- Global Variables ---
Config globalConfig;
Logger globalLogger(LogLevel::WARNING, std::cout, std::cerr, true);

// --- NamingException ---
NamingException::NamingException(const std::string& message, ErrorCode code)
    : std::runtime_error(message), code(code) {}

ErrorCode NamingException::getCode() const { return code; }

StructuralError::StructuralError(const std::string& message)
    : NamingException(message, ErrorCode::STRUCTURAL_ERROR) {}

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:          return "SUCCESS";
        case ErrorCode::PARSE_ERROR:      return "PARSE_ERROR";
        case ErrorCode::IO_ERROR:         return "IO_ERROR";
        case ErrorCode::STRUCTURAL_ERROR: return "STRUCTURAL_ERROR";
        case ErrorCode::NAMING_ERROR:     return "NAMING_ERROR";
        case ErrorCode::CONFIG_ERROR:     return "CONFIG_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:  return "NOT_IMPLEMENTED";
        case ErrorCode::UNKNOWN_ERROR:    return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

// --- Utility Functions ---
namespace util {
    std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string joined;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) joined += separator;
            joined += parts[i];
        }
        return joined;
    }

    std::string trim(const std::string& text) {
        size_t first = text.find_first_not_of(" \t\n\r\f\v");
        if (first == std::string::npos) return "";
        size_t last = text.find_last_not_of(" \t\n\r\f\v");
        return text.substr(first, last - first + 1);
    }
}

LogLevel parseLogLevel(const std::string& name) {
    std::string upper;
    for (char c : name) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    throw NamingException("Unknown log level: " + name, ErrorCode::CONFIG_ERROR);
}

// --- Logger Implementation ---
namespace {

struct LevelStyle {
    const char* tag;
    const char* color;
};

LevelStyle styleOf(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return {"DEBUG", "\033[38;5;250m"};
        case LogLevel::INFO:    return {"INFO", "\033[38;5;44m"};
        case LogLevel::WARNING: return {"WARNING", "\033[38;5;208m"};
        case LogLevel::ERROR:   return {"ERROR", "\033[38;5;203m"};
        case LogLevel::FATAL:   return {"FATAL", "\033[38;5;199m"};
    }
    return {"UNKNOWN", ""};
}

// Only the process streams can be terminals
bool isTerminal(const std::ostream& stream) {
    if (&stream == &std::cout) return isatty(STDOUT_FILENO) != 0;
    if (&stream == &std::cerr) return isatty(STDERR_FILENO) != 0;
    return false;
}

} // namespace

Logger::Logger(LogLevel minLevel, std::ostream& out_stream, std::ostream& err_stream, bool colorEnabled)
    : minLevel(minLevel), out(out_stream), err_out(err_stream),
      colorEnabled(colorEnabled), activeProgressBar(nullptr) {}

std::ostream& Logger::streamFor(LogLevel level) {
    return level >= LogLevel::WARNING ? err_out : out;
}

std::string Logger::formatMessage(LogLevel level, const std::string& message) {
    LevelStyle style = styleOf(level);
    if (colorEnabled && isTerminal(streamFor(level))) {
        return std::string(style.color) + "[" + style.tag + "]\033[0m " + message;
    }
    return std::string("[") + style.tag + "] " + message;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < minLevel) return;
    std::lock_guard<std::mutex> lock(logMutex);

    if (!activeProgressBar) {
        streamFor(level) << formatMessage(level, message) << std::endl;
        return;
    }
    // Hold routine messages back until the bar is gone; errors interrupt it.
    bufferedMessages.emplace_back(level, message);
    if (level >= LogLevel::ERROR) {
        activeProgressBar->temporarilyPauseDisplay([this]() { flushBufferedMessages(); });
    }
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warning(const std::string& message) { log(LogLevel::WARNING, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }
void Logger::fatal(const std::string& message) { log(LogLevel::FATAL, message); }

void Logger::setMinLevel(LogLevel level) { minLevel = level; }

void Logger::setActiveProgressBar(ProgressBar* progressBar) {
    std::lock_guard<std::mutex> lock(logMutex);
    activeProgressBar = progressBar;
    bufferedMessages.clear();
}

void Logger::clearActiveProgressBar() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (activeProgressBar) {
        flushBufferedMessages();
        activeProgressBar = nullptr;
    }
}

// Caller holds logMutex
void Logger::flushBufferedMessages() {
    for (const auto& [level, message] : bufferedMessages) {
        streamFor(level) << formatMessage(level, message) << std::endl;
    }
    bufferedMessages.clear();
}

// --- ProgressBar Implementation ---
namespace {

int terminalWidth() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return std::clamp(static_cast<int>(w.ws_col), 40, 250);
    }
    if (const char* columns = getenv("COLUMNS")) {
        char* end = nullptr;
        long parsed = std::strtol(columns, &end, 10);
        if (end != columns && parsed > 0) return std::clamp(static_cast<int>(parsed), 40, 250);
    }
    return 80;
}

std::string formatDuration(double seconds) {
    long whole = static_cast<long>(std::max(0.0, seconds));
    std::stringstream ss;
    if (whole >= 3600) {
        ss << whole / 3600 << "h " << (whole % 3600) / 60 << "m";
    } else if (whole >= 60) {
        ss << whole / 60 << "m " << whole % 60 << "s";
    } else {
        ss << whole << "s";
    }
    return ss.str();
}

// Blue to green as the batch completes
std::string barColor(double progress) {
    std::stringstream color;
    color << "\033[38;2;46;" << static_cast<int>(126 + progress * 129) << ";"
          << static_cast<int>(236 - progress * 140) << "m";
    return color.str();
}

} // namespace

ProgressBar::ProgressBar(size_t total, const std::string& label, int refreshMs)
    : total(total), label(label), refreshMs(refreshMs) {}

ProgressBar::~ProgressBar() {
    finish();
}

void ProgressBar::start() {
    if (active.exchange(true)) return;
    startTime = std::chrono::steady_clock::now();
    globalLogger.setActiveProgressBar(this);
    drawThread = std::thread(&ProgressBar::drawLoop, this);
}

void ProgressBar::update(size_t processed, size_t failed) {
    current.fetch_add(processed, std::memory_order_relaxed);
    failures.fetch_add(failed, std::memory_order_relaxed);
}

void ProgressBar::finish() {
    if (!active.exchange(false)) return;
    if (drawThread.joinable()) drawThread.join();
    {
        std::lock_guard<std::mutex> lock(drawMutex);
        draw(true);
        std::cout << std::endl;
    }
    globalLogger.clearActiveProgressBar();
}

double ProgressBar::getProgress() const {
    if (total == 0) return 0.0;
    return std::min(static_cast<double>(current.load(std::memory_order_relaxed)) / total, 1.0);
}

double ProgressBar::getElapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
}

void ProgressBar::drawLoop() {
    while (active) {
        {
            std::lock_guard<std::mutex> lock(drawMutex);
            draw(false);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(refreshMs));
    }
}

// Caller holds drawMutex
void ProgressBar::draw(bool final) {
    size_t done = current.load(std::memory_order_relaxed);
    size_t failed = failures.load(std::memory_order_relaxed);
    double seconds = getElapsedSeconds();
    double rate = seconds > 0.01 ? done / seconds : 0.0;

    std::stringstream line;
    line << "\r\033[K";
    if (final) {
        line << "\033[38;5;40m✓\033[0m \033[1m" << done << "/" << total << "\033[0m named";
    } else {
        double progress = getProgress();
        int width = std::clamp(terminalWidth() / 4, 10, 40);
        int filled = static_cast<int>(std::floor(progress * width));
        line << "\033[1m" << label << "\033[0m " << barColor(progress);
        for (int i = 0; i < width; ++i) line << (i < filled ? "█" : " ");
        line << "\033[0m " << std::fixed << std::setprecision(1) << progress * 100.0 << "% ";
        line << "\033[1m" << done << "/" << total << "\033[0m";
    }
    if (failed > 0) line << " \033[38;5;203m" << failed << " failed\033[0m";
    line << " \033[38;5;208m" << std::fixed << std::setprecision(1) << rate << " names/s\033[0m";
    if (final) {
        line << " \033[38;5;105m" << std::setprecision(2) << seconds << "s\033[0m";
    } else if (done > 0 && done < total) {
        line << " \033[38;5;105mETA " << formatDuration(seconds * (total - done) / done) << "\033[0m";
    }
    std::cout << line.str() << std::flush;
}

void ProgressBar::temporarilyPauseDisplay(const std::function<void()>& callback) {
    std::lock_guard<std::mutex> lock(drawMutex);
    std::cout << "\r\033[K" << std::flush;
    callback();
    if (active) draw(false);
}


// --- MoleculeRecord Implementation ---
MoleculeRecord::MoleculeRecord() : valid(false) {}

MoleculeRecord::MoleculeRecord(const std::string& smilesStr) : originalSmiles(smilesStr), valid(false) {
    parse(smilesStr);
}

bool MoleculeRecord::parse(const std::string& smilesStr) {
    originalSmiles = smilesStr;
    mol = nullptr;
    valid = false;
    errorMessage = "";

    std::string trimmed = util::trim(smilesStr);
    if (trimmed.empty()) {
        errorMessage = "Input SMILES string is empty.";
        return false;
    }

    try {
        RDKit::RWMol* rawMol = RDKit::SmilesToMol(trimmed);
        if (!rawMol) {
            errorMessage = "RDKit failed to parse SMILES (returned null).";
            return false;
        }
        mol.reset(rawMol);
        valid = true;
        return true;
    } catch (const RDKit::MolSanitizeException& e) {
        errorMessage = "RDKit Sanity Exception during SMILES parse: " + std::string(e.what());
        mol = nullptr;
        return false;
    } catch (const std::exception& e) {
        errorMessage = "Error parsing SMILES: " + std::string(e.what());
        mol = nullptr;
        return false;
    }
}

bool MoleculeRecord::isValid() const { return valid; }
const std::string& MoleculeRecord::getErrorMessage() const { return errorMessage; }
std::shared_ptr<RDKit::ROMol> MoleculeRecord::getMolecule() const { return mol; }
const std::string& MoleculeRecord::getOriginalSmiles() const { return originalSmiles; }

// --- MoleculeBatch Implementation ---
MoleculeBatch::MoleculeBatch(size_t initialSize) {
    records.reserve(initialSize);
}

void MoleculeBatch::addSmilesBatch(const std::vector<std::string>& smilesVec) {
    records.clear();
    records.resize(smilesVec.size());

    #ifdef WITH_TBB
    tbb::parallel_for(tbb::blocked_range<size_t>(0, smilesVec.size()),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i != range.end(); ++i) {
                if (!records[i].parse(smilesVec[i])) {
                    records[i].setOriginalSmiles(smilesVec[i]);
                }
            }
        });
    #else
    for (size_t i = 0; i < smilesVec.size(); ++i) {
        if (!records[i].parse(smilesVec[i])) {
            records[i].setOriginalSmiles(smilesVec[i]);
        }
    }
    #endif
}

size_t MoleculeBatch::size() const { return records.size(); }
const std::vector<MoleculeRecord>& MoleculeBatch::getRecords() const { return records; }

} // namespace namefact
