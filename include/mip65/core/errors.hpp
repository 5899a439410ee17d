#pragma once
#include <stdexcept>
#include <string>

namespace mip65::core {

enum class ErrorCode {
    UNAUTHORIZED,
    INVALID_DATE,
    UNKNOWN_ASSET,
    ALREADY_EXISTS,
    OVERFLOW,
    INVALID_ARGUMENT
};

const char* to_string(ErrorCode code);

// Base for every rejection raised by the ledger and the role registry.
// A thrown LedgerError means the call had no effect.
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class Unauthorized : public LedgerError {
public:
    explicit Unauthorized(const std::string& message)
        : LedgerError(ErrorCode::UNAUTHORIZED, message) {}
};

class InvalidDate : public LedgerError {
public:
    explicit InvalidDate(const std::string& message)
        : LedgerError(ErrorCode::INVALID_DATE, message) {}
};

class UnknownAsset : public LedgerError {
public:
    explicit UnknownAsset(const std::string& asset)
        : LedgerError(ErrorCode::UNKNOWN_ASSET, "unknown asset: " + asset) {}
};

class AlreadyExists : public LedgerError {
public:
    explicit AlreadyExists(const std::string& asset)
        : LedgerError(ErrorCode::ALREADY_EXISTS, "asset already initialized: " + asset) {}
};

class Overflow : public LedgerError {
public:
    explicit Overflow(const std::string& message)
        : LedgerError(ErrorCode::OVERFLOW, message) {}
};

} // namespace mip65::core
