#include "io.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace namefact {

namespace {
    const char* const RESULT_COLUMNS[] = {"iupac_name", "method", "confidence", "error"};

    bool isIndex(const std::string& text) {
        return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
    }

    void stripLineEnd(std::string& line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    }
}

std::vector<std::string> CsvIO::parseCsvLine(const std::string& line, const std::string& delimiter) {
    std::vector<std::string> cells;
    if (line.empty()) return cells;

    std::string currentCell;
    char delimChar = delimiter.empty() ? ',' : delimiter[0];
    const char quoteChar = '"';
    bool inQuotes = false;

    for (size_t i = 0; i < line.length(); ++i) {
        char c = line[i];
        if (inQuotes) {
            if (c == quoteChar) {
                if (i + 1 < line.length() && line[i + 1] == quoteChar) {
                    // "" inside quotes is a literal quote
                    currentCell += quoteChar;
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                currentCell += c;
            }
        } else if (c == quoteChar && currentCell.empty()) {
            inQuotes = true;
        } else if (c == delimChar) {
            cells.push_back(currentCell);
            currentCell.clear();
        } else {
            currentCell += c;
        }
    }
    cells.push_back(currentCell);
    return cells;
}

CsvIO::CsvIO(const std::string& inputPath, const std::string& outputPath, const std::string& delimiter,
             const std::string& smilesColumn, bool hasHeader)
    : inputPath(inputPath), outputPath(outputPath), delimiter(delimiter), smilesColumn(smilesColumn),
      hasHeader(hasHeader) {

    std::ifstream file(inputPath);
    if (!file.is_open()) {
        throw NamingException("CsvIO: Failed to open input file: " + inputPath, ErrorCode::IO_ERROR);
    }

    if (hasHeader) {
        if (!parseHeader(file)) {
            throw NamingException("CsvIO: Failed to find SMILES column '" + smilesColumn + "' in header.",
                                  ErrorCode::PARSE_ERROR);
        }
    } else {
        smilesIndex = isIndex(smilesColumn) ? std::stoi(smilesColumn) : 0;
        globalLogger.info("CsvIO: No header, reading SMILES from column " + std::to_string(smilesIndex));
    }
}

bool CsvIO::parseHeader(std::ifstream& file) {
    std::string headerLine;
    if (!std::getline(file, headerLine)) {
        globalLogger.error("CsvIO: Failed to read header line from file: " + inputPath);
        return false;
    }
    // UTF-8 BOM
    if (headerLine.rfind("\xEF\xBB\xBF", 0) == 0) headerLine = headerLine.substr(3);
    stripLineEnd(headerLine);

    headerColumns = parseCsvLine(headerLine, delimiter);
    if (headerColumns.empty()) {
        globalLogger.error("CsvIO: Header line parsed into zero columns. Check delimiter or file format.");
        return false;
    }

    if (isIndex(smilesColumn)) {
        int index = std::stoi(smilesColumn);
        if (index < static_cast<int>(headerColumns.size())) {
            smilesIndex = index;
            globalLogger.info("CsvIO: Using SMILES column at index " + smilesColumn + " ('" +
                              headerColumns[index] + "')");
            return true;
        }
    }
    for (size_t i = 0; i < headerColumns.size(); ++i) {
        if (util::trim(headerColumns[i]) == smilesColumn) {
            smilesIndex = static_cast<int>(i);
            globalLogger.info("CsvIO: Found SMILES column '" + smilesColumn + "' at index " + std::to_string(i));
            return true;
        }
    }
    globalLogger.error("CsvIO: SMILES column '" + smilesColumn + "' not found in header.");
    return false;
}

CsvIO::LineReader CsvIO::createLineReader() const {
    return LineReader(inputPath, hasHeader, delimiter, smilesIndex);
}

CsvIO::ResultWriter CsvIO::createResultWriter() const {
    if (outputPath.empty()) {
        throw NamingException("Cannot create ResultWriter: Output file path is not set.", ErrorCode::IO_ERROR);
    }
    return ResultWriter(outputPath, delimiter, headerColumns, hasHeader);
}

// --- LineReader Implementation ---

CsvIO::LineReader::LineReader(const std::string& filePath, bool hasHeader, const std::string& delimiter,
                              int smilesIndex)
    : buffer(65536), readerHasHeader(hasHeader), delimiter(delimiter), smilesIndex(smilesIndex) {
    fileStream.rdbuf()->pubsetbuf(buffer.data(), buffer.size());
    fileStream.open(filePath, std::ios::binary);
    if (!fileStream.is_open()) {
        throw NamingException("LineReader: Failed to open file: " + filePath, ErrorCode::IO_ERROR);
    }
    std::error_code ec;
    fileSize = std::filesystem::file_size(filePath, ec);
    if (ec) {
        fileSize = 0;
        globalLogger.warning("LineReader: Could not determine file size for " + filePath + ": " + ec.message());
    }
}

CsvIO::LineReader::~LineReader() {
    if (fileStream.is_open()) fileStream.close();
}

bool CsvIO::LineReader::readBatch(std::vector<std::string>& smiles, std::vector<std::vector<std::string>>& rows,
                                  size_t batchSize) {
    std::lock_guard<std::mutex> lock(readMutex);
    smiles.clear();
    rows.clear();
    if (!fileStream.is_open() || smilesIndex < 0) return false;

    std::string line;
    if (readerHasHeader && !headerSkipped) {
        if (!std::getline(fileStream, line)) return false;
        bytesRead += line.size() + 1;
        headerSkipped = true;
    }

    while (smiles.size() < batchSize && std::getline(fileStream, line)) {
        bytesRead += line.size() + 1;
        stripLineEnd(line);
        if (line.find_first_not_of(" \t") == std::string::npos) {
            globalLogger.debug("LineReader: Skipping empty line.");
            continue;
        }
        std::vector<std::string> cells = CsvIO::parseCsvLine(line, delimiter);
        if (static_cast<size_t>(smilesIndex) >= cells.size()) {
            globalLogger.warning("LineReader: SMILES column " + std::to_string(smilesIndex) +
                                 " out of bounds for line: " + line.substr(0, 50));
            continue;
        }
        smiles.push_back(util::trim(cells[smilesIndex]));
        rows.push_back(std::move(cells));
    }
    return !smiles.empty();
}

size_t CsvIO::LineReader::countDataLines() {
    std::lock_guard<std::mutex> lock(readMutex);
    std::streampos originalPos = fileStream.tellg();
    fileStream.clear();
    fileStream.seekg(0, std::ios::beg);

    std::string line;
    size_t lineCount = 0;
    bool skipHeader = readerHasHeader;
    while (std::getline(fileStream, line)) {
        if (skipHeader) {
            skipHeader = false;
            continue;
        }
        if (line.find_first_not_of(" \t\r\n") != std::string::npos) ++lineCount;
    }

    fileStream.clear();
    fileStream.seekg(originalPos);
    globalLogger.debug("Data lines: " + std::to_string(lineCount));
    return lineCount;
}

double CsvIO::LineReader::getProgress() const {
    if (fileSize == 0) return 1.0;
    return std::min(static_cast<double>(bytesRead.load(std::memory_order_relaxed)) / fileSize, 1.0);
}

// --- ResultWriter Implementation ---

CsvIO::ResultWriter::ResultWriter(const std::string& outFilePath, const std::string& delimiter,
                                  const std::vector<std::string>& inputHeaders, bool writeHeader)
    : delimiter(delimiter), headers(inputHeaders), headerWritten(!writeHeader) {
    for (const char* column : RESULT_COLUMNS) headers.emplace_back(column);

    fileStream.open(outFilePath, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!fileStream.is_open()) {
        throw NamingException("ResultWriter: Failed to open output file: " + outFilePath, ErrorCode::IO_ERROR);
    }
    globalLogger.info("ResultWriter: Initialized for output file: " + outFilePath);
}

CsvIO::ResultWriter::~ResultWriter() {
    if (fileStream.is_open()) {
        fileStream.flush();
        fileStream.close();
    }
}

std::string CsvIO::ResultWriter::quote(const std::string& cell) const {
    bool needsQuotes = cell.find(delimiter) != std::string::npos || cell.find('"') != std::string::npos ||
                       cell.find_first_of("\n\r") != std::string::npos;
    if (!needsQuotes) return cell;
    std::string quoted = "\"";
    for (char c : cell) {
        if (c == '"') quoted += "\"\"";
        else quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool CsvIO::ResultWriter::writeBatch(const std::vector<std::vector<std::string>>& rows,
                                     const std::vector<NameResult>& results) {
    std::lock_guard<std::mutex> lock(writeMutex);
    if (!fileStream.is_open()) {
        globalLogger.error("ResultWriter::writeBatch: Output file stream is not open.");
        return false;
    }
    if (rows.size() != results.size()) {
        globalLogger.error("ResultWriter::writeBatch: " + std::to_string(rows.size()) + " rows but " +
                           std::to_string(results.size()) + " results");
        return false;
    }

    std::ostringstream batchBuffer;
    if (!headerWritten) {
        for (size_t i = 0; i < headers.size(); ++i) {
            if (i > 0) batchBuffer << delimiter;
            batchBuffer << quote(headers[i]);
        }
        batchBuffer << '\n';
        headerWritten = true;
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        for (const auto& cell : rows[i]) batchBuffer << quote(cell) << delimiter;

        const NameResult& result = results[i];
        batchBuffer << quote(result.error ? std::string() : result.name) << delimiter
                    << naming::methodToString(result.method) << delimiter
                    << std::fixed << std::setprecision(2) << result.confidence << delimiter
                    << quote(result.error ? result.errorMessage : std::string()) << '\n';
    }

    fileStream << batchBuffer.str();
    if (!fileStream.good()) {
        globalLogger.error("ResultWriter::writeBatch: File stream encountered an error after writing batch.");
        fileStream.clear();
        return false;
    }
    return true;
}

void CsvIO::ResultWriter::flush() {
    if (fileStream.is_open()) fileStream.flush();
}

} // namespace namefact
