#pragma once

#include "naming.hpp"
#include "utils.hpp"

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace namefact {

// Delimited text input with one SMILES column; every other column is carried
// through to the output untouched.
class CsvIO {
private:
    std::string inputPath;
    std::string outputPath;
    std::string delimiter;
    std::string smilesColumn;
    bool hasHeader;
    std::vector<std::string> headerColumns;
    int smilesIndex = -1;

    bool parseHeader(std::ifstream& file);

public:
    // smilesColumn is a header name, or a 0-based index when it is all digits
    CsvIO(const std::string& inputPath, const std::string& outputPath, const std::string& delimiter,
          const std::string& smilesColumn, bool hasHeader);

    const std::vector<std::string>& getHeaderColumns() const { return headerColumns; }
    int getSmilesIndex() const { return smilesIndex; }

    class LineReader {
    private:
        std::ifstream fileStream;
        std::vector<char> buffer;
        std::mutex readMutex;
        uintmax_t fileSize = 0;
        std::atomic<size_t> bytesRead{0};
        bool headerSkipped = false;
        bool readerHasHeader;
        std::string delimiter;
        int smilesIndex;

    public:
        LineReader(const std::string& filePath, bool hasHeader, const std::string& delimiter, int smilesIndex);
        ~LineReader();

        // Reads up to batchSize data rows; false once the file is exhausted
        bool readBatch(std::vector<std::string>& smiles, std::vector<std::vector<std::string>>& rows,
                       size_t batchSize);
        size_t countDataLines();
        double getProgress() const;
    };

    class ResultWriter {
    private:
        std::ofstream fileStream;
        std::string delimiter;
        std::vector<std::string> headers;
        std::mutex writeMutex;
        bool headerWritten = false;

        std::string quote(const std::string& cell) const;

    public:
        // No header line is written when writeHeader is false
        ResultWriter(const std::string& outFilePath, const std::string& delimiter,
                     const std::vector<std::string>& inputHeaders, bool writeHeader = true);
        ~ResultWriter();

        // Original columns, then name, method, confidence and error
        bool writeBatch(const std::vector<std::vector<std::string>>& rows, const std::vector<NameResult>& results);
        void flush();
    };

    LineReader createLineReader() const;
    ResultWriter createResultWriter() const;

    static std::vector<std::string> parseCsvLine(const std::string& line, const std::string& delimiter);
};

} // namespace namefact
