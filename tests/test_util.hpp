#pragma once

#include "avrolite/error.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

// True when `fn` throws an AvroError of kind `k`.
template <typename Fn>
static bool throws_kind(avrolite::ErrorKind k, Fn&& fn) {
    try {
        fn();
    } catch (const avrolite::AvroError& e) {
        return e.kind() == k;
    }
    return false;
}
