#pragma once

#include <stdexcept>
#include <string>

namespace avrolite {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    InvalidSchema,
    NameConflict,
    InvalidValue,
    TruncatedBuffer,
    TrailingData,
    InvalidResolver,
    JsonParse,
    Io,
    BadMagic,
    SyncMismatch,
    Codec,
};

const char* to_string(ErrorKind k) noexcept;

class AvroError : public std::runtime_error {
public:
    AvroError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

} // namespace avrolite
