#ifndef CIDBOOST_BASE_ERROR_CODE_H
#define CIDBOOST_BASE_ERROR_CODE_H

#include <exception>
#include <string>
#include <system_error>

namespace cidboost {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    InvalidState = 1003,
    Timeout = 1004,
    Cancelled = 1005,
    InternalError = 1006,

    // Network errors (2000-2999)
    NetworkError = 2001,
    ConnectionFailed = 2002,
    ConnectionClosed = 2003,
    ProtocolError = 2004,

    // Discovery errors (3000-3999)
    ProviderNotFound = 3001,

    // Transfer errors (4000-4999)
    TransferFailed = 4001,
    WriteFailed = 4002,

    // Crypto errors (5000-5999)
    DecryptionMetadataInvalid = 5001,
    AccessDenied = 5002,
    CryptoError = 5003
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

// Returns true when ec belongs to the cidboost category and equals code.
bool is_error(const std::error_code& ec, ErrorCode code);

class CidBoostError : public std::exception {
public:
    CidBoostError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    // Message without the "<kind>: " prefix that what() carries.
    const std::string& detail() const { return detail_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string detail_;
    std::string message_;
};

// Classifies an exception_ptr; non-CidBoostError exceptions map to InternalError.
ErrorCode error_code_of(const std::exception_ptr& error);

} // namespace cidboost

namespace std {
template <>
struct is_error_code_enum<cidboost::ErrorCode> : true_type {};
} // namespace std

#endif // CIDBOOST_BASE_ERROR_CODE_H
