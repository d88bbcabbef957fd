#ifndef CIDBOOST_TRANSFER_FILE_SINK_H
#define CIDBOOST_TRANSFER_FILE_SINK_H

#include <elio/elio.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace cidboost {

// Destination of an ordered byte stream. write() throws CidBoostError on failure;
// data must stay valid until the returned task completes.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual elio::coro::task<void> write(const uint8_t* data, size_t size) = 0;
};

// Writes straight through to a file. Once sealed no byte reaches the file, so a
// paused or canceled task can stop its writers from any thread.
class FileSink : public ByteSink {
public:
    // Creates or truncates path. Throws CidBoostError(WriteFailed).
    explicit FileSink(const std::filesystem::path& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    // Throws WriteFailed on I/O errors and Cancelled after seal()
    elio::coro::task<void> write(const uint8_t* data, size_t size) override;

    // Flushes and closes; waits for a write in progress. Idempotent.
    void seal();

    // seal() that reports a failed final flush. Throws CidBoostError(WriteFailed).
    void finish();

    uint64_t bytes_written() const;
    bool sealed() const;
    const std::filesystem::path& path() const { return path_; }

private:
    bool close_locked();

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::ofstream out_;
    bool sealed_ = false;
    uint64_t written_ = 0;
};

} // namespace cidboost

#endif // CIDBOOST_TRANSFER_FILE_SINK_H
