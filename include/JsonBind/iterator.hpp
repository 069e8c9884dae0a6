#pragma once

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "errors.hpp"
#include "fp_to_str.hpp"

namespace JsonBind {

enum class ValueType {
    Invalid,
    String,
    Number,
    Null,
    Bool,
    Array,
    Object
};

enum class TryParseStatus {
    no_match,
    ok,
    error
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

// Pull-style cursor over an in-memory JSON text. Like Stream, the first
// error is latched and every later read becomes a no-op.
class Iterator {
public:
    explicit Iterator(std::string_view input, std::size_t max_skip_depth = 64, std::size_t max_depth = 512)
        : current_(input.data()), begin_(input.data()), end_(input.data() + input.size()),
          m_maxSkipDepth(max_skip_depth), m_maxDepth(max_depth) {}

    Iterator(const Iterator&) = delete;
    Iterator& operator=(const Iterator&) = delete;

    bool ok() const { return m_error == DecodeError::NO_ERROR; }
    DecodeError error() const { return m_error; }
    ReaderError reader_error() const { return m_readerError; }
    const std::string& custom_message() const { return m_message; }
    const char* current() const { return current_; }
    const char* begin() const { return begin_; }
    const char* end() const { return end_; }
    const char* error_pos() const { return m_errorPos; }
    std::size_t offset() const { return static_cast<std::size_t>(current_ - begin_); }
    // Containers opened through read_array_begin/read_object_begin and not yet closed.
    std::size_t depth() const { return m_depth; }

    void set_error(DecodeError e) {
        if (m_error != DecodeError::NO_ERROR) {
            return;
        }
        m_error = e;
        m_errorPos = current_;
    }
    void set_reader_error(ReaderError e) {
        if (m_error != DecodeError::NO_ERROR) {
            return;
        }
        m_readerError = e;
        set_error(DecodeError::READER_ERROR);
    }
    void report_custom_error(std::string message) {
        if (m_error != DecodeError::NO_ERROR) {
            return;
        }
        m_message = std::move(message);
        set_error(DecodeError::CUSTOM_CODEC_ERROR);
    }

    ValueType what_is_next() {
        skip_whitespace();
        if (!ok() || atEnd()) {
            return ValueType::Invalid;
        }
        switch (*current_) {
        case '"': return ValueType::String;
        case 'n': return ValueType::Null;
        case 't':
        case 'f': return ValueType::Bool;
        case '[': return ValueType::Array;
        case '{': return ValueType::Object;
        case '-':
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            return ValueType::Number;
        default:
            return ValueType::Invalid;
        }
    }

    // Consumes a null literal if one is next.
    bool read_null() {
        skip_whitespace();
        if (!ok()) return false;
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if (*current_ != 'n') {
            return false;
        }
        ++current_;
        if (!match_literal("ull") || (!atEnd() && !isPlainEnd(*current_))) {
            set_reader_error(ReaderError::ILLFORMED_NULL);
            return false;
        }
        return true;
    }

    TryParseStatus read_bool(bool & b) {
        skip_whitespace();
        if (!ok()) return TryParseStatus::error;
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return TryParseStatus::error;
        }
        switch (*current_) {
        case 't':
            ++current_;
            if (match_literal("rue") && (atEnd() || isPlainEnd(*current_))) {
                b = true;
                return TryParseStatus::ok;
            }
            set_reader_error(ReaderError::ILLFORMED_BOOL);
            return TryParseStatus::error;
        case 'f':
            ++current_;
            if (match_literal("alse") && (atEnd() || isPlainEnd(*current_))) {
                b = false;
                return TryParseStatus::ok;
            }
            set_reader_error(ReaderError::ILLFORMED_BOOL);
            return TryParseStatus::error;
        default:
            return TryParseStatus::no_match;
        }
    }

    // no_match: the next value is not a number; the cursor does not move.
    template<class NumberT>
    TryParseStatus read_number(NumberT & storage) {
        skip_whitespace();
        if (!ok()) return TryParseStatus::error;
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return TryParseStatus::error;
        }
        if (*current_ != '-' && (*current_ < '0' || *current_ > '9')) {
            return TryParseStatus::no_match;
        }

        char buf[fp_to_str_detail::NumberBufSize];
        bool seenDot = false;
        bool seenExp = false;
        if (!read_number_token(buf, seenDot, seenExp)) {
            return TryParseStatus::error;
        }

        if constexpr (std::is_integral_v<NumberT>) {
            if (seenDot || seenExp) {
                set_error(DecodeError::FLOAT_VALUE_IN_INTEGER_STORAGE);
                return TryParseStatus::error;
            }
            NumberT value{};
            if (!parse_decimal_integer<NumberT>(buf, value)) {
                set_reader_error(ReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return TryParseStatus::error;
            }
            storage = value;
            return TryParseStatus::ok;
        } else {
            static_assert(std::is_floating_point_v<NumberT>,
                          "[[[ JsonBind ]]] number storage must be integral or floating");
            double x;
            if (!fp_to_str_detail::parse_number_to_double(buf, x)) {
                set_reader_error(ReaderError::ILLFORMED_NUMBER);
                return TryParseStatus::error;
            }
            if (static_cast<double>(std::numeric_limits<NumberT>::lowest()) > x
                || static_cast<double>(std::numeric_limits<NumberT>::max()) < x) {
                set_reader_error(ReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return TryParseStatus::error;
            }
            storage = static_cast<NumberT>(x);
            return TryParseStatus::ok;
        }
    }

    // Appends the unescaped string content to out.
    TryParseStatus read_string(std::string & out) {
        skip_whitespace();
        if (!ok()) return TryParseStatus::error;
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return TryParseStatus::error;
        }
        if (*current_ != '"') {
            return TryParseStatus::no_match;
        }
        ++current_;
        return read_string_body(out) ? TryParseStatus::ok : TryParseStatus::error;
    }

    // Convenience readers for hand-written decoders. A kind mismatch is
    // latched as the matching DecodeError and a zero value is returned.
    std::string read_string() {
        std::string s;
        if (read_string(s) == TryParseStatus::no_match) {
            set_error(DecodeError::NON_STRING_IN_STRING_STORAGE);
        }
        return s;
    }

    template<class Int = int>
    Int read_int() {
        Int v{};
        if (read_number(v) == TryParseStatus::no_match) {
            set_error(DecodeError::WRONG_JSON_FOR_NUMBER_STORAGE);
        }
        return v;
    }

    double read_float() {
        double v{};
        if (read_number(v) == TryParseStatus::no_match) {
            set_error(DecodeError::WRONG_JSON_FOR_NUMBER_STORAGE);
        }
        return v;
    }

    bool read_bool() {
        bool b = false;
        if (read_bool(b) == TryParseStatus::no_match) {
            set_error(DecodeError::NON_BOOL_JSON_IN_BOOL_VALUE);
        }
        return b;
    }

    // Array/object structural events

    IterationStatus read_array_begin() {
        return read_container_begin('[', ']', ReaderError::ILLFORMED_ARRAY);
    }
    IterationStatus read_object_begin() {
        return read_container_begin('{', '}', ReaderError::ILLFORMED_OBJECT);
    }

    // Reads "key" and the following ':'
    bool read_object_key(std::string & key) {
        key.clear();
        TryParseStatus st = read_string(key);
        if (st == TryParseStatus::no_match) {
            set_reader_error(ReaderError::ILLFORMED_OBJECT);
            return false;
        }
        if (st != TryParseStatus::ok) {
            return false;
        }
        skip_whitespace();
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if (*current_ != ':') {
            set_reader_error(ReaderError::ILLFORMED_OBJECT);
            return false;
        }
        ++current_;
        return true;
    }

    IterationStatus advance_array() {
        return advance_after_value(']', ReaderError::ILLFORMED_ARRAY);
    }
    IterationStatus advance_object() {
        return advance_after_value('}', ReaderError::ILLFORMED_OBJECT);
    }

    // Consumes one well-formed value of any kind without materializing it.
    bool skip() {
        NoOpFiller filler{};
        return skip_json_value_internal(filler);
    }

    // Copies the raw text of the next value into out.
    bool capture(std::string & out) {
        out.clear();
        StringFiller filler{&out};
        return skip_json_value_internal(filler);
    }

    bool finish() {
        skip_whitespace();
        if (!ok()) return false;
        if (current_ != end_) {
            set_reader_error(ReaderError::EXCESS_CHARACTERS);
            return false;
        }
        return true;
    }

    // Text of the form [+-]?[0-9]+, as found in integral map keys and in
    // number tokens already checked by read_number_token. False for any
    // other text and for values Int cannot hold.
    template <class Int>
    static constexpr bool parse_decimal_integer(std::string_view text, Int& out) noexcept {
        static_assert(std::is_integral_v<Int>, "[[[ JsonBind ]]] Int must be an integral type");
        using Magnitude = std::make_unsigned_t<Int>;

        bool negative = false;
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }
        if (text.empty() || (negative && std::is_unsigned_v<Int>)) {
            return false;
        }

        // |min()| is one past max() for signed types
        const Magnitude bound = negative
            ? static_cast<Magnitude>(static_cast<Magnitude>(std::numeric_limits<Int>::max()) + 1u)
            : static_cast<Magnitude>(std::numeric_limits<Int>::max());
        Magnitude magnitude = 0;
        for (char c : text) {
            if (c < '0' || c > '9') {
                return false;
            }
            const auto digit = static_cast<Magnitude>(c - '0');
            if (magnitude > static_cast<Magnitude>((bound - digit) / 10u)) {
                return false;
            }
            magnitude = static_cast<Magnitude>(magnitude * 10u + digit);
        }
        // negation in the unsigned domain, so min() needs no special case
        out = negative ? static_cast<Int>(static_cast<Magnitude>(~magnitude + 1u))
                       : static_cast<Int>(magnitude);
        return true;
    }

private:
    struct NoOpFiller {
        void operator()(char) {}
    };
    struct StringFiller {
        std::string * out;
        void operator()(char ch) { out->push_back(ch); }
    };

    IterationStatus read_container_begin(char open, char close, ReaderError illformed) {
        IterationStatus ret;
        skip_whitespace();
        if (!ok()) return ret;
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if (*current_ != open) {
            ret.status = TryParseStatus::no_match;
            return ret;
        }
        // checked before looking inside, so [] at the limit fails like [1]
        if (m_depth >= m_maxDepth) {
            set_reader_error(ReaderError::NESTING_TOO_DEEP);
            return ret;
        }
        ++current_;
        skip_whitespace();
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if (*current_ == ',') {
            set_reader_error(illformed);
            return ret;
        }
        if (*current_ == close) {
            ++current_;
        } else {
            ++m_depth;
            ret.has_value = true;
        }
        ret.status = TryParseStatus::ok;
        return ret;
    }

    IterationStatus advance_after_value(char close, ReaderError illformed) {
        IterationStatus ret;
        skip_whitespace();
        if (!ok()) return ret;
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        char c = *current_;
        if (c == close) {
            ++current_;
            if (m_depth > 0) {
                --m_depth;
            }
            ret.status = TryParseStatus::ok;
            return ret;
        }
        if (c != ',') {
            set_reader_error(illformed);
            return ret;
        }
        ++current_;
        skip_whitespace();
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        // catches [1,] and {"a":1,}
        if (*current_ == ',' || *current_ == close || (close == '}' && *current_ != '"')) {
            set_reader_error(illformed);
            return ret;
        }
        ret.has_value = true;
        ret.status = TryParseStatus::ok;
        return ret;
    }

    template <class Filler>
    bool skip_json_value_internal(Filler & filler) {
        skip_whitespace();
        if (!ok()) return false;
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }

        auto skipLiteral = [&](std::string_view lit, ReaderError err) -> bool {
            for (char l : lit) {
                if (atEnd()) {
                    set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                    return false;
                }
                if (*current_ != l) {
                    set_reader_error(err);
                    return false;
                }
                filler(*current_);
                ++current_;
            }
            return true;
        };

        auto skipNumber = [&]() -> bool {
            char buf[fp_to_str_detail::NumberBufSize];
            const char* start = current_;
            bool seenDot = false;
            bool seenExp = false;
            if (!read_number_token(buf, seenDot, seenExp)) {
                return false;
            }
            for (const char* c = start; c != current_; ++c) {
                filler(*c);
            }
            return true;
        };

        auto skipString = [&]() -> bool {
            const char* start = current_;
            ++current_;
            if (!skip_string_body()) {
                return false;
            }
            for (const char* c = start; c != current_; ++c) {
                filler(*c);
            }
            return true;
        };

        auto skipScalar = [&](char c) -> bool {
            switch (c) {
            case '"': return skipString();
            case 't': return skipLiteral("true", ReaderError::ILLFORMED_BOOL);
            case 'f': return skipLiteral("false", ReaderError::ILLFORMED_BOOL);
            case 'n': return skipLiteral("null", ReaderError::ILLFORMED_NULL);
            default:  return skipNumber();
            }
        };

        char c = *current_;
        if (c != '{' && c != '[') {
            return skipScalar(c);
        }

        // Compound value: an explicit stack of expected closing delimiters
        // instead of recursion, plus the grammar position inside the
        // innermost container.
        enum class At { KeyOrClose, Key, Colon, ValueOrClose, Value, AfterValue };
        std::vector<char> stack;
        stack.reserve(16);
        At at = At::AfterValue;

        auto open = [&](char ch) -> bool {
            if (stack.size() >= m_maxSkipDepth) {
                set_reader_error(ReaderError::SKIPPING_STACK_OVERFLOW);
                return false;
            }
            stack.push_back(ch == '{' ? '}' : ']');
            filler(ch);
            ++current_;
            at = (ch == '{') ? At::KeyOrClose : At::ValueOrClose;
            return true;
        };

        if (!open(c)) {
            return false;
        }

        while (!stack.empty()) {
            skip_whitespace();
            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char ch = *current_;
            const bool inObject = stack.back() == '}';
            const ReaderError illformed = inObject ? ReaderError::ILLFORMED_OBJECT : ReaderError::ILLFORMED_ARRAY;

            switch (at) {
            case At::KeyOrClose:
            case At::ValueOrClose:
            case At::AfterValue:
                if (ch == stack.back()) {
                    stack.pop_back();
                    filler(ch);
                    ++current_;
                    at = At::AfterValue;
                    continue;
                }
                break;
            default:
                break;
            }

            switch (at) {
            case At::AfterValue:
                if (ch != ',') {
                    set_reader_error(illformed);
                    return false;
                }
                filler(ch);
                ++current_;
                at = inObject ? At::Key : At::Value;
                break;
            case At::KeyOrClose:
            case At::Key:
                if (ch != '"') {
                    set_reader_error(ReaderError::ILLFORMED_OBJECT);
                    return false;
                }
                if (!skipString()) {
                    return false;
                }
                at = At::Colon;
                break;
            case At::Colon:
                if (ch != ':') {
                    set_reader_error(ReaderError::ILLFORMED_OBJECT);
                    return false;
                }
                filler(ch);
                ++current_;
                at = At::Value;
                break;
            case At::ValueOrClose:
            case At::Value:
                if (ch == '{' || ch == '[') {
                    if (!open(ch)) {
                        return false;
                    }
                    break;
                }
                if (ch == ',' || ch == ']' || ch == '}' || ch == ':') {
                    set_reader_error(illformed);
                    return false;
                }
                if (!skipScalar(ch)) {
                    return false;
                }
                at = At::AfterValue;
                break;
            }
        }
        return true;
    }

    bool atEnd() const {
        return current_ == end_;
    }

    static constexpr bool isPlainEnd(char a) {
        switch(a) {
        case ']':
        case ',':
        case '}':
        case ':':
        case 0x20:
        case 0x0A:
        case 0x0D:
        case 0x09:
            return true;
        }
        return false;
    }

    static constexpr bool isSpace(char c) noexcept {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

    void skip_whitespace() {
        while (current_ != end_ && isSpace(*current_)) {
            ++current_;
        }
    }

    bool match_literal(std::string_view lit) {
        for (char c : lit) {
            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            if (*current_ != c) {
                return false;
            }
            ++current_;
        }
        return true;
    }

    static constexpr int hex_digit_value(char c) {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        const char lower = static_cast<char>(c | 0x20);
        if (lower >= 'a' && lower <= 'f') {
            return lower - 'a' + 10;
        }
        return -1;
    }

    // The four hex digits of a \u escape.
    bool read_hex_quad(std::uint16_t & out) {
        unsigned value = 0;
        for (int n = 0; n < 4; ++n, ++current_) {
            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const int digit = hex_digit_value(*current_);
            if (digit < 0) {
                set_reader_error(ReaderError::ILLFORMED_STRING);
                return false;
            }
            value = value * 16u + static_cast<unsigned>(digit);
        }
        out = static_cast<std::uint16_t>(value);
        return true;
    }

    // \uXXXX (with surrogate pair) after the 'u' has been consumed
    bool read_unicode_escape(std::uint32_t & codepoint) {
        std::uint16_t u1 = 0;
        if (!read_hex_quad(u1)) {
            return false;
        }
        if (u1 >= 0xD800u && u1 <= 0xDBFFu) {
            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            if (*current_ != '\\') {
                set_reader_error(ReaderError::ILLFORMED_STRING);
                return false;
            }
            ++current_;
            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            if (*current_ != 'u') {
                set_reader_error(ReaderError::ILLFORMED_STRING);
                return false;
            }
            ++current_;
            std::uint16_t u2 = 0;
            if (!read_hex_quad(u2)) {
                return false;
            }
            if (u2 < 0xDC00u || u2 > 0xDFFFu) {
                set_reader_error(ReaderError::ILLFORMED_STRING);
                return false;
            }
            codepoint = 0x10000u
                        + ((static_cast<std::uint32_t>(u1) - 0xD800u) << 10)
                        + (static_cast<std::uint32_t>(u2) - 0xDC00u);
            return true;
        }
        if (u1 >= 0xDC00u && u1 <= 0xDFFFu) {
            // Lone low surrogate
            set_reader_error(ReaderError::ILLFORMED_STRING);
            return false;
        }
        codepoint = u1;
        return true;
    }

    static void append_utf8(std::string & out, std::uint32_t codepoint) {
        if (codepoint <= 0x7Fu) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FFu) {
            out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFFu) {
            out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    // Opening quote already consumed.
    bool read_string_body(std::string & out) {
        while (true) {
            // Fast path: copy a run of non-special chars
            const char* run = current_;
            while (run != end_ && *run != '"' && *run != '\\' && static_cast<unsigned char>(*run) > 0x1F) {
                ++run;
            }
            out.append(current_, run);
            current_ = run;

            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char c = *current_;
            if (c == '"') {
                ++current_;
                return true;
            }
            if (c != '\\') {
                // Control characters must be escaped (RFC 8259 §7)
                set_reader_error(ReaderError::ILLFORMED_STRING);
                return false;
            }
            ++current_;
            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char esc = *current_++;
            switch (esc) {
            case '"':  out.push_back('"');  break;
            case '/':  out.push_back('/');  break;
            case '\\': out.push_back('\\'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'r':  out.push_back('\r'); break;
            case 'n':  out.push_back('\n'); break;
            case 't':  out.push_back('\t'); break;
            case 'u': {
                std::uint32_t codepoint = 0;
                if (!read_unicode_escape(codepoint)) {
                    return false;
                }
                append_utf8(out, codepoint);
                break;
            }
            default:
                set_reader_error(ReaderError::ILLFORMED_STRING);
                return false;
            }
        }
    }

    // Validates string syntax without unescaping. Opening quote consumed.
    bool skip_string_body() {
        while (true) {
            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char c = *current_;
            if (c == '"') {
                ++current_;
                return true;
            }
            if (static_cast<unsigned char>(c) <= 0x1F) {
                set_reader_error(ReaderError::ILLFORMED_STRING);
                return false;
            }
            ++current_;
            if (c != '\\') {
                continue;
            }
            if (atEnd()) {
                set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char esc = *current_++;
            switch (esc) {
            case '"': case '/': case '\\':
            case 'b': case 'f': case 'r': case 'n': case 't':
                break;
            case 'u': {
                std::uint32_t codepoint = 0;
                if (!read_unicode_escape(codepoint)) {
                    return false;
                }
                break;
            }
            default:
                set_reader_error(ReaderError::ILLFORMED_STRING);
                return false;
            }
        }
    }

    // Copies one number token into buf as a NUL-terminated string. The
    // token runs up to the next delimiter and must match the RFC 8259
    // number grammar as a whole.
    bool read_number_token(char (&buf)[fp_to_str_detail::NumberBufSize],
                           bool& seenDot,
                           bool& seenExp)
    {
        // Position in -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
        enum class At { Start, Zero, Int, Dot, Frac, Exp, ExpSign, ExpDigits };
        At at = At::Start;
        std::size_t len = 0;
        seenDot = false;
        seenExp = false;

        if (!atEnd() && *current_ == '-') {
            buf[len++] = '-';
            ++current_;
        }
        if (atEnd()) {
            set_reader_error(ReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }

        for (; !atEnd() && !isPlainEnd(*current_); ++current_) {
            const char c = *current_;
            const bool digit = c >= '0' && c <= '9';
            const bool exp = c == 'e' || c == 'E';
            bool accepted = true;
            switch (at) {
            case At::Start:
                accepted = digit;
                at = (c == '0') ? At::Zero : At::Int;
                break;
            case At::Zero:
            case At::Int:
                if (digit) {
                    accepted = at == At::Int;
                } else if (c == '.') {
                    at = At::Dot;
                    seenDot = true;
                } else if (exp) {
                    at = At::Exp;
                    seenExp = true;
                } else {
                    accepted = false;
                }
                break;
            case At::Dot:
                accepted = digit;
                at = At::Frac;
                break;
            case At::Frac:
                if (exp) {
                    at = At::Exp;
                    seenExp = true;
                } else {
                    accepted = digit;
                }
                break;
            case At::Exp:
                accepted = digit || c == '+' || c == '-';
                at = digit ? At::ExpDigits : At::ExpSign;
                break;
            case At::ExpSign:
            case At::ExpDigits:
                accepted = digit;
                at = At::ExpDigits;
                break;
            }
            if (!accepted || len + 1 >= fp_to_str_detail::NumberBufSize) {
                set_reader_error(ReaderError::ILLFORMED_NUMBER);
                return false;
            }
            buf[len++] = c;
        }
        buf[len] = '\0';

        if (at != At::Zero && at != At::Int && at != At::Frac && at != At::ExpDigits) {
            set_reader_error(ReaderError::ILLFORMED_NUMBER);
            return false;
        }
        return true;
    }

    const char* current_;
    const char* begin_;
    const char* end_;
    const char* m_errorPos = nullptr;
    std::size_t m_maxSkipDepth;
    std::size_t m_maxDepth;
    std::size_t m_depth = 0;

    DecodeError m_error = DecodeError::NO_ERROR;
    ReaderError m_readerError = ReaderError::NO_ERROR;
    std::string m_message;
};

} // namespace JsonBind
