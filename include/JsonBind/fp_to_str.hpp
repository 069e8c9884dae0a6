#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <type_traits>

#ifndef JSONBIND_USE_FAST_FLOAT
#define JSONBIND_USE_FAST_FLOAT 1  // desktop default
#endif

#if JSONBIND_USE_FAST_FLOAT
#include <fast_double_parser.h>
#include <simdjson.h>
#endif

namespace JsonBind {

enum class FloatPrecision {
    Full,       // shortest text that reads back to the same value
    SixDigits   // at most six fractional digits, trailing zeros trimmed
};

namespace fp_to_str_detail {

#ifndef JSONBIND_NUMBER_BUF_SIZE
constexpr std::size_t NumberBufSize = 64;
#else
constexpr std::size_t NumberBufSize = JSONBIND_NUMBER_BUF_SIZE;
#endif


// buf must be NUL-terminated and hold an already validated JSON number token
inline bool parse_number_to_double(const char * buf, double& out) {
#if JSONBIND_USE_FAST_FLOAT
    const char* endp = fast_double_parser::parse_number(buf, &out);
    if (!endp) return false;
    return true;
#else
    char* endp = nullptr;
    errno = 0;
    double x = std::strtod(buf, &endp);
    if (endp == buf) {
        return false;
    }
    out = x;
    return true;
#endif
}

// Shortest round-trip form of a double, pointer past last char returned.
inline char* format_double_shortest(char* first, char* last, double value) {
#if JSONBIND_USE_FAST_FLOAT
    char* end = simdjson::internal::to_chars(first, last, value);
    // simdjson keeps a ".0" tail on integral values: 3.0, -0.0
    if (end - first >= 2 && end[-1] == '0' && end[-2] == '.') {
        end -= 2;
    }
    return end;
#else
    auto [ptr, ec] = std::to_chars(first, last, value);
    if (ec != std::errc{}) {
        *first = '0';
        return first + 1;
    }
    return ptr;
#endif
}

inline char* format_float_shortest(char* first, char* last, float value) {
    auto [ptr, ec] = std::to_chars(first, last, value);
    if (ec != std::errc{}) {
        *first = '0';
        return first + 1;
    }
    return ptr;
}

// Rounds to six fractional digits through integer arithmetic, so
// 1.23456789f becomes "1.234568". Magnitudes past Limit go through the
// shortest formatter instead.
template<class F>
inline char* format_six_digits(char* first, char* last, F value) {
    static_assert(std::is_floating_point_v<F>, "[[[ JsonBind ]]] F must be floating point");
    constexpr double Limit = std::is_same_v<F, float> ? double(0x4ffffff) : double(0x4ffffffffull);
    constexpr std::uint64_t Exp = 1000000;

    double v = static_cast<double>(value);
    char* p = first;
    if (v < 0) {
        *p++ = '-';
        v = -v;
    }
    if (v > Limit) {
        if constexpr (std::is_same_v<F, float>) {
            return format_float_shortest(p, last, static_cast<float>(v));
        } else {
            return format_double_shortest(p, last, v);
        }
    }
    std::uint64_t scaled = static_cast<std::uint64_t>(v * double(Exp) + 0.5);
    auto [ip, iec] = std::to_chars(p, last, scaled / Exp);
    if (iec != std::errc{}) {
        return p;
    }
    p = ip;
    std::uint64_t frac = scaled % Exp;
    if (frac == 0) {
        return p;
    }
    *p++ = '.';
    for (std::uint64_t pow10 = Exp / 10; pow10 > 1 && frac < pow10; pow10 /= 10) {
        *p++ = '0';
    }
    auto [fp, fec] = std::to_chars(p, last, frac);
    if (fec != std::errc{}) {
        return p;
    }
    p = fp;
    while (p[-1] == '0') {
        --p;
    }
    return p;
}

} // namespace fp_to_str_detail
} // namespace JsonBind
