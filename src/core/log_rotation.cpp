// StreamProv - Dedicated stream provisioning service
// Log Rotation Component Implementation

#include "streamprov/core/log_rotation.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <system_error>

#include <zlib.h>

namespace streamprov {
namespace core {

namespace fs = std::filesystem;

// =============================================================================
// GzipCompressor Implementation
// =============================================================================

namespace {

class GzipCompressor : public ICompressor {
public:
    Result<void, LogRotationError> compress(
        const uint8_t* input,
        size_t inputSize,
        std::vector<uint8_t>& output) override
    {
        uLongf compressedSize = compressBound(static_cast<uLong>(inputSize));
        output.resize(compressedSize);

        int result = compress2(
            output.data(),
            &compressedSize,
            input,
            static_cast<uLong>(inputSize),
            Z_DEFAULT_COMPRESSION
        );

        if (result != Z_OK) {
            return Result<void, LogRotationError>::error(
                LogRotationError(LogRotationError::Code::CompressionFailed,
                                 "zlib compress2 failed: " + std::to_string(result))
            );
        }

        output.resize(compressedSize);
        return Result<void, LogRotationError>::success();
    }

    Result<void, LogRotationError> compressFile(
        const std::string& inputPath,
        const std::string& outputPath) override
    {
        std::ifstream inFile(inputPath, std::ios::binary);
        if (!inFile) {
            return Result<void, LogRotationError>::error(
                LogRotationError(LogRotationError::Code::FileOpenFailed,
                                 "Cannot open input file: " + inputPath)
            );
        }

        std::vector<char> inputData(
            (std::istreambuf_iterator<char>(inFile)),
            std::istreambuf_iterator<char>()
        );
        inFile.close();

        gzFile gzOut = gzopen(outputPath.c_str(), "wb9");
        if (!gzOut) {
            return Result<void, LogRotationError>::error(
                LogRotationError(LogRotationError::Code::FileOpenFailed,
                                 "Cannot create gzip file: " + outputPath)
            );
        }

        int written = 0;
        if (!inputData.empty()) {
            written = gzwrite(gzOut, inputData.data(), static_cast<unsigned>(inputData.size()));
        }
        int closeResult = gzclose(gzOut);

        if ((written == 0 && !inputData.empty()) || closeResult != Z_OK) {
            return Result<void, LogRotationError>::error(
                LogRotationError(LogRotationError::Code::CompressionFailed,
                                 "gzwrite failed for: " + outputPath)
            );
        }

        return Result<void, LogRotationError>::success();
    }
};

} // anonymous namespace

std::unique_ptr<ICompressor> createGzipCompressor() {
    return std::make_unique<GzipCompressor>();
}

// =============================================================================
// FileSink Implementation
// =============================================================================

FileSink::FileSink(const std::string& filePath)
    : FileSink(filePath, RotationPolicy())
{
}

FileSink::FileSink(const std::string& filePath, const RotationPolicy& policy)
    : filePath_(filePath)
    , policy_(policy)
{
    if (policy_.compress) {
        compressor_ = createGzipCompressor();
    }
    openFile();
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(LogLevel level, const std::string& message,
                     const std::string& category, const SourceLocation& location)
{
    (void)level;
    (void)category;
    (void)location;

    std::lock_guard<std::mutex> lock(mutex_);

    if (shouldRotate()) {
        auto result = performRotation();
        if (result.isError()) {
            // Keep writing to whatever file is open; the failure is kept
            // for lastError() since this sink cannot log about itself.
            lastError_ = result.error();
        }
    }

    if (!file_.is_open()) {
        return;
    }

    file_ << message << "\n";
    currentSize_ += message.size() + 1;
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

std::string FileSink::getName() const {
    return "FileSink";
}

bool FileSink::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

uint64_t FileSink::getCurrentFileSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentSize_;
}

Result<void, LogRotationError> FileSink::forceRotation() {
    std::lock_guard<std::mutex> lock(mutex_);
    return performRotation();
}

LogRotationError FileSink::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool FileSink::shouldRotate() const {
    return policy_.maxFileSize > 0 && currentSize_ >= policy_.maxFileSize;
}

std::string FileSink::backupName(uint32_t index) const {
    std::string name = filePath_ + "." + std::to_string(index);
    if (policy_.compress) {
        name += ".gz";
    }
    return name;
}

Result<void, LogRotationError> FileSink::performRotation() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }

    shiftBackups();

    std::error_code ec;
    std::string rotated = filePath_ + ".1";
    if (fs::exists(filePath_, ec)) {
        fs::rename(filePath_, rotated, ec);
        if (ec) {
            openFile();
            return Result<void, LogRotationError>::error(
                LogRotationError(LogRotationError::Code::RotationFailed,
                                 "Failed to rename log file: " + ec.message())
            );
        }

        if (compressor_) {
            auto result = compressor_->compressFile(rotated, rotated + ".gz");
            if (result.isError()) {
                openFile();
                return result;
            }
            fs::remove(rotated, ec);
        }
    }

    cleanupOldBackups();

    if (!openFile()) {
        return Result<void, LogRotationError>::error(
            LogRotationError(LogRotationError::Code::FileOpenFailed,
                             "Failed to open new log file after rotation")
        );
    }

    return Result<void, LogRotationError>::success();
}

void FileSink::shiftBackups() {
    // .n-1 -> .n, ..., .1 -> .2
    std::error_code ec;
    for (uint32_t i = policy_.maxBackupFiles; i >= 2; --i) {
        std::string from = backupName(i - 1);
        if (fs::exists(from, ec)) {
            fs::rename(from, backupName(i), ec);
        }
    }
}

void FileSink::cleanupOldBackups() {
    std::error_code ec;
    for (uint32_t i = policy_.maxBackupFiles + 1; i <= policy_.maxBackupFiles + 10; ++i) {
        fs::remove(backupName(i), ec);
    }
    if (policy_.maxBackupFiles == 0) {
        fs::remove(backupName(1), ec);
    }
}

bool FileSink::openFile() {
    file_.open(filePath_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        return false;
    }

    std::error_code ec;
    auto size = fs::file_size(filePath_, ec);
    currentSize_ = ec ? 0 : static_cast<uint64_t>(size);
    return true;
}

// =============================================================================
// ConsoleSink Implementation
// =============================================================================

ConsoleSink::ConsoleSink(bool useColors)
    : useColors_(useColors)
{
}

void ConsoleSink::write(LogLevel level, const std::string& message,
                        const std::string& category, const SourceLocation& location)
{
    (void)category;
    (void)location;

    std::lock_guard<std::mutex> lock(mutex_);

    const char* colorCode = "";
    const char* resetCode = useColors_ ? "\033[0m" : "";

    if (useColors_) {
        switch (level) {
            case LogLevel::Debug:
                colorCode = "\033[36m";  // Cyan
                break;
            case LogLevel::Info:
                colorCode = "\033[32m";  // Green
                break;
            case LogLevel::Warning:
                colorCode = "\033[33m";  // Yellow
                break;
            case LogLevel::Error:
                colorCode = "\033[31m";  // Red
                break;
        }
    }

    std::cerr << colorCode << message << resetCode << "\n";
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

std::string ConsoleSink::getName() const {
    return "ConsoleSink";
}

} // namespace core
} // namespace streamprov
