#include "cidboost/base/error_code.h"

namespace cidboost {

namespace {

class CidBoostCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "cidboost";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const CidBoostCategory& get_category() {
    static CidBoostCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

bool is_error(const std::error_code& ec, ErrorCode code) {
    return ec.category() == get_category() && ec.value() == static_cast<int>(code);
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::ProviderNotFound: return "No providers found";
        case ErrorCode::TransferFailed: return "Transfer failed";
        case ErrorCode::WriteFailed: return "Write failed";
        case ErrorCode::DecryptionMetadataInvalid: return "Invalid encryption metadata";
        case ErrorCode::AccessDenied: return "Access denied";
        case ErrorCode::CryptoError: return "Crypto error";
        default: return "Unknown error";
    }
}

CidBoostError::CidBoostError(ErrorCode code, const std::string& message)
    : code_(code), detail_(message), message_(to_string(code) + ": " + message) {}

const char* CidBoostError::what() const noexcept {
    return message_.c_str();
}

ErrorCode error_code_of(const std::exception_ptr& error) {
    if (!error) {
        return ErrorCode::Success;
    }
    try {
        std::rethrow_exception(error);
    } catch (const CidBoostError& e) {
        return e.code();
    } catch (const std::exception&) {
        return ErrorCode::InternalError;
    }
}

} // namespace cidboost
