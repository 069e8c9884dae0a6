#pragma once

#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#include "errors.hpp"
#include "fp_to_str.hpp"

namespace JsonBind {

struct StreamOptions {
    FloatPrecision float_precision = FloatPrecision::Full;
    bool escape_html = false;
    std::size_t max_depth = 512;
};

// Push-style output buffer used by every encoder. The first error set on a
// stream is kept; all writes after it are no-ops.
class Stream {
public:
    Stream() = default;
    explicit Stream(StreamOptions opts): m_opts(opts) {}
    Stream(std::string & out, StreamOptions opts): m_opts(opts), m_out(&out) {}

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    bool ok() const { return m_error == EncodeError::NO_ERROR; }
    EncodeError error() const { return m_error; }
    const std::string& custom_message() const { return m_message; }
    const StreamOptions& options() const { return m_opts; }

    void set_error(EncodeError e) {
        if (m_error != EncodeError::NO_ERROR) {
            return;
        }
        m_error = e;
    }
    void report_custom_error(std::string message) {
        if (m_error != EncodeError::NO_ERROR) {
            return;
        }
        m_error = EncodeError::CUSTOM_CODEC_ERROR;
        m_message = std::move(message);
    }

    std::string& buffer() { return m_out ? *m_out : m_own; }
    const std::string& buffer() const { return m_out ? *m_out : m_own; }
    std::size_t size() const { return buffer().size(); }

    bool write_raw(std::string_view raw) {
        if (!ok()) return false;
        buffer().append(raw);
        return true;
    }
    bool write_raw(char c) {
        if (!ok()) return false;
        buffer().push_back(c);
        return true;
    }

    bool write_null() { return write_raw("null"); }
    bool write_bool(bool b) { return write_raw(b ? std::string_view("true") : std::string_view("false")); }

    bool write_object_start() { return open_container('{'); }
    bool write_object_end() { return close_container('}'); }
    bool write_array_start() { return open_container('['); }
    bool write_array_end() { return close_container(']'); }

    std::size_t depth() const { return m_depth; }
    bool write_more() { return write_raw(','); }

    // "name": with the key escaped like any other string
    bool write_object_field(std::string_view name) {
        if (!write_string(name)) return false;
        return write_raw(':');
    }

    template<class Int>
    bool write_int(Int v) {
        static_assert(std::is_integral_v<Int>, "[[[ JsonBind ]]] Int must be an integral type");
        if (!ok()) return false;
        char buf[fp_to_str_detail::NumberBufSize];
        char* p = format_decimal_integer<Int>(v, buf, buf + sizeof(buf));
        buffer().append(buf, p);
        return true;
    }

    template<class F>
    bool write_float(F v) {
        static_assert(std::is_floating_point_v<F>, "[[[ JsonBind ]]] F must be floating point");
        if (!ok()) return false;
        if (std::isnan(v) || std::isinf(v)) {
            set_error(EncodeError::UNSUPPORTED_VALUE);
            return false;
        }
        char buf[fp_to_str_detail::NumberBufSize];
        char* last = buf + sizeof(buf);
        char* end;
        if (m_opts.float_precision == FloatPrecision::SixDigits) {
            end = fp_to_str_detail::format_six_digits<F>(buf, last, v);
        } else if constexpr (std::is_same_v<F, float>) {
            end = fp_to_str_detail::format_float_shortest(buf, last, v);
        } else {
            end = fp_to_str_detail::format_double_shortest(buf, last, static_cast<double>(v));
        }
        buffer().append(buf, end);
        return true;
    }

    bool write_string(std::string_view s) {
        if (!ok()) return false;
        constexpr char hex[] = "0123456789abcdef";
        std::string& out = buffer();
        out.reserve(out.size() + s.size() + 2);
        out.push_back('"');

        const char* p = s.data();
        const char* e = s.data() + s.size();
        while (p < e) {
            // Find next byte that needs escaping
            const char* run = p;
            while (run < e && !needs_escape(static_cast<unsigned char>(*run))) {
                ++run;
            }
            if (run != p) {
                out.append(p, run);
                p = run;
                continue;
            }

            unsigned char uc = static_cast<unsigned char>(*p++);
            switch (uc) {
            case '"':  out.append("\\\""); break;
            case '\\': out.append("\\\\"); break;
            case '\b': out.append("\\b"); break;
            case '\f': out.append("\\f"); break;
            case '\n': out.append("\\n"); break;
            case '\r': out.append("\\r"); break;
            case '\t': out.append("\\t"); break;
            default:
                out.append("\\u00");
                out.push_back(hex[(uc >> 4) & 0xF]);
                out.push_back(hex[uc & 0xF]);
                break;
            }
        }
        out.push_back('"');
        return true;
    }

    // Decimal text of value at first; returns one past the last char.
    // [first, last) holds fp_to_str_detail::NumberBufSize chars at every call site.
    template <class Int>
    static char* format_decimal_integer(Int value, char* first, char* last) noexcept {
        static_assert(std::is_integral_v<Int>, "[[[ JsonBind ]]] Int must be an integral type");
        return std::to_chars(first, last, value).ptr;
    }

private:
    // A self-referencing value graph ends here instead of in a stack overflow.
    bool open_container(char c) {
        if (!ok()) return false;
        if (m_depth >= m_opts.max_depth) {
            set_error(EncodeError::NESTING_TOO_DEEP);
            return false;
        }
        ++m_depth;
        return write_raw(c);
    }
    bool close_container(char c) {
        if (!ok()) return false;
        if (m_depth > 0) {
            --m_depth;
        }
        return write_raw(c);
    }

    bool needs_escape(unsigned char uc) const {
        if (uc == '"' || uc == '\\' || uc < 0x20) {
            return true;
        }
        return m_opts.escape_html && (uc == '<' || uc == '>' || uc == '&');
    }

    StreamOptions m_opts{};
    EncodeError m_error = EncodeError::NO_ERROR;
    std::string m_message;
    std::size_t m_depth = 0;
    std::string* m_out = nullptr;
    std::string m_own;
};

} // namespace JsonBind
