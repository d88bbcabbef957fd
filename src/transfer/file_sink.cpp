#include "cidboost/transfer/file_sink.h"
#include "cidboost/base/error_code.h"
#include <cerrno>
#include <cstring>

namespace cidboost {

FileSink::FileSink(const std::filesystem::path& path) : path_(path) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        throw CidBoostError(ErrorCode::WriteFailed,
                            "failed to create " + path_.string() + ": " + std::strerror(errno));
    }
}

FileSink::~FileSink() {
    seal();
}

elio::coro::task<void> FileSink::write(const uint8_t* data, size_t size) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sealed_) {
            throw CidBoostError(ErrorCode::Cancelled, "destination closed");
        }
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        out_.flush();
        if (!out_) {
            throw CidBoostError(ErrorCode::WriteFailed, "failed to write " + path_.string());
        }
        written_ += size;
    }
    co_return;
}

bool FileSink::close_locked() {
    if (sealed_) {
        return true;
    }
    sealed_ = true;
    out_.flush();
    bool ok = static_cast<bool>(out_);
    out_.close();
    return ok && !out_.fail();
}

void FileSink::seal() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void FileSink::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool was_sealed = sealed_;
    if (!close_locked() && !was_sealed) {
        throw CidBoostError(ErrorCode::WriteFailed, "failed to flush " + path_.string());
    }
}

uint64_t FileSink::bytes_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

bool FileSink::sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

} // namespace cidboost
