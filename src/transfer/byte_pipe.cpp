#include "cidboost/transfer/byte_pipe.h"
#include "cidboost/base/error_code.h"
#include <algorithm>
#include <cstring>

namespace cidboost {

BytePipe::BytePipe(size_t capacity) : ring_(std::max<size_t>(capacity, 1)) {}

elio::coro::task<void> BytePipe::write(const uint8_t* data, size_t size) {
    while (size > 0) {
        size_t n = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (read_closed_) {
                if (read_error_) {
                    std::rethrow_exception(read_error_);
                }
                throw CidBoostError(ErrorCode::TransferFailed, "reader stopped consuming");
            }
            if (write_closed_) {
                throw CidBoostError(ErrorCode::InvalidState, "write after close");
            }
            if (size_ < ring_.size()) {
                size_t tail = (head_ + size_) % ring_.size();
                size_t space = ring_.size() - size_;
                n = std::min({size, space, ring_.size() - tail});
                std::memcpy(ring_.data() + tail, data, n);
                size_ += n;
            }
        }
        if (n == 0) {
            co_await writable_->wait();
            continue;
        }
        data += n;
        size -= n;
        readable_->notify();
    }
}

void BytePipe::close_write(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (write_closed_) return;
        write_closed_ = true;
        write_error_ = error;
        record_error(error);
    }
    readable_->notify();
    writable_->notify();
}

elio::coro::task<size_t> BytePipe::read(uint8_t* buffer, size_t len) {
    while (true) {
        size_t n = 0;
        bool ended = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (size_ > 0) {
                n = std::min({len, size_, ring_.size() - head_});
                std::memcpy(buffer, ring_.data() + head_, n);
                head_ = (head_ + n) % ring_.size();
                size_ -= n;
            } else if (write_closed_ || read_closed_) {
                if (write_error_) {
                    std::rethrow_exception(write_error_);
                }
                ended = true;
            }
        }
        if (n > 0) {
            writable_->notify();
            co_return n;
        }
        if (ended) {
            co_return 0;
        }
        co_await readable_->wait();
    }
}

void BytePipe::close_read(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (read_closed_) return;
        read_closed_ = true;
        read_error_ = error;
        record_error(error);
    }
    writable_->notify();
    readable_->notify();
}

std::exception_ptr BytePipe::first_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return first_error_;
}

void BytePipe::record_error(const std::exception_ptr& error) {
    if (error && !first_error_) {
        first_error_ = error;
    }
}

} // namespace cidboost
