#ifndef CIDBOOST_TRANSFER_BYTE_PIPE_H
#define CIDBOOST_TRANSFER_BYTE_PIPE_H

#include "cidboost/base/wakeup.h"
#include "cidboost/transfer/file_sink.h"
#include <elio/elio.hpp>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <vector>

namespace cidboost {

// Bounded byte queue between one writing and one reading coroutine. Closing
// either end with an error wakes the other end, which then fails with it.
class BytePipe {
public:
    explicit BytePipe(size_t capacity);

    // Suspends while the pipe is full. Throws once the read end is closed.
    elio::coro::task<void> write(const uint8_t* data, size_t size);
    // End of data, or the writer's failure
    void close_write(std::exception_ptr error = nullptr);

    // Suspends while the pipe is empty. Returns 0 at end of data; rethrows the
    // writer's failure.
    elio::coro::task<size_t> read(uint8_t* buffer, size_t len);
    void close_read(std::exception_ptr error = nullptr);

    // First failure passed to either close call
    std::exception_ptr first_error() const;

private:
    void record_error(const std::exception_ptr& error);

    mutable std::mutex mutex_;
    std::vector<uint8_t> ring_;
    size_t head_ = 0;
    size_t size_ = 0;
    bool write_closed_ = false;
    bool read_closed_ = false;
    std::exception_ptr write_error_;
    std::exception_ptr read_error_;
    std::exception_ptr first_error_;

    std::shared_ptr<Wakeup> readable_ = std::make_shared<Wakeup>();
    std::shared_ptr<Wakeup> writable_ = std::make_shared<Wakeup>();
};

// ByteSink feeding a pipe's write end
class PipeSink : public ByteSink {
public:
    explicit PipeSink(BytePipe& pipe) : pipe_(pipe) {}

    elio::coro::task<void> write(const uint8_t* data, size_t size) override {
        co_await pipe_.write(data, size);
    }

private:
    BytePipe& pipe_;
};

} // namespace cidboost

#endif // CIDBOOST_TRANSFER_BYTE_PIPE_H
