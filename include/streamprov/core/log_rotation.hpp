// StreamProv - Dedicated stream provisioning service
// Log Rotation Component
//
// File output with size-based rotation and gzip compression of rotated
// files, plus a console sink for interactive runs.

#ifndef STREAMPROV_CORE_LOG_ROTATION_HPP
#define STREAMPROV_CORE_LOG_ROTATION_HPP

#include "streamprov/core/log_sink.hpp"
#include "streamprov/core/result.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace streamprov {
namespace core {

/**
 * @brief Error information for log rotation operations.
 */
struct LogRotationError {
    enum class Code {
        FileOpenFailed,
        RotationFailed,
        CompressionFailed,
        Unknown
    };

    Code code;
    std::string message;

    LogRotationError(Code c = Code::Unknown, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Rotation policy for FileSink.
 *
 * A maxFileSize of 0 disables rotation.
 */
struct RotationPolicy {
    uint64_t maxFileSize = 0;
    uint32_t maxBackupFiles = 5;
    bool compress = false;
};

/**
 * @brief Interface for data compression.
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    virtual Result<void, LogRotationError> compress(
        const uint8_t* input,
        size_t inputSize,
        std::vector<uint8_t>& output
    ) = 0;

    /**
     * @brief Compress a file into a gzip file at outputPath.
     */
    virtual Result<void, LogRotationError> compressFile(
        const std::string& inputPath,
        const std::string& outputPath
    ) = 0;
};

/**
 * @brief Create the zlib-backed gzip compressor.
 */
std::unique_ptr<ICompressor> createGzipCompressor();

/**
 * @brief File sink with size-based rotation.
 *
 * Rotated files are named <path>.1 (newest) through <path>.N, with a .gz
 * suffix when compression is enabled. Files beyond maxBackupFiles are
 * deleted.
 *
 * @code
 * RotationPolicy policy;
 * policy.maxFileSize = 100 * 1024 * 1024;
 * policy.maxBackupFiles = 5;
 * policy.compress = true;
 *
 * logger->addSink(std::make_shared<FileSink>("streamprov.log", policy));
 * @endcode
 */
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& filePath);
    FileSink(const std::string& filePath, const RotationPolicy& policy);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(LogLevel level, const std::string& message,
               const std::string& category, const SourceLocation& location) override;
    void flush() override;
    std::string getName() const override;

    bool isOpen() const;
    uint64_t getCurrentFileSize() const;

    /**
     * @brief Rotate now regardless of the current size.
     */
    Result<void, LogRotationError> forceRotation();

    /**
     * @brief Last rotation failure, empty message if none.
     */
    LogRotationError lastError() const;

private:
    bool shouldRotate() const;
    Result<void, LogRotationError> performRotation();
    std::string backupName(uint32_t index) const;
    void shiftBackups();
    void cleanupOldBackups();
    bool openFile();

    std::string filePath_;
    RotationPolicy policy_;
    mutable std::mutex mutex_;
    std::ofstream file_;
    uint64_t currentSize_ = 0;
    std::unique_ptr<ICompressor> compressor_;
    LogRotationError lastError_{LogRotationError::Code::Unknown, ""};
};

/**
 * @brief Console sink writing to stderr with optional ANSI colours.
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool useColors = true);

    void write(LogLevel level, const std::string& message,
               const std::string& category, const SourceLocation& location) override;
    void flush() override;
    std::string getName() const override;

private:
    bool useColors_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace streamprov

#endif // STREAMPROV_CORE_LOG_ROTATION_HPP
