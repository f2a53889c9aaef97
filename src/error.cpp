#include "avrolite/error.hpp"

namespace avrolite {

AvroError::AvroError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind AvroError::kind() const noexcept { return kind_; }

const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::InvalidSchema: return "invalid schema";
        case ErrorKind::NameConflict: return "name conflict";
        case ErrorKind::InvalidValue: return "invalid value";
        case ErrorKind::TruncatedBuffer: return "truncated buffer";
        case ErrorKind::TrailingData: return "trailing data";
        case ErrorKind::InvalidResolver: return "invalid resolver";
        case ErrorKind::JsonParse: return "json parse error";
        case ErrorKind::Io: return "i/o error";
        case ErrorKind::BadMagic: return "bad magic";
        case ErrorKind::SyncMismatch: return "sync marker mismatch";
        case ErrorKind::Codec: return "codec error";
    }
    return "unknown error";
}

} // namespace avrolite
