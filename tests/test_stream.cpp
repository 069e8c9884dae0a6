#include <cstdint>
#include <limits>
#include <string>

#include "test_helpers.hpp"

using namespace TestHelpers;
using namespace JsonBind;

namespace {

bool test_integer_extremes() {
    Stream s;
    s.write_int(std::numeric_limits<std::int64_t>::min());
    s.write_more();
    s.write_int(std::numeric_limits<std::uint64_t>::max());
    s.write_more();
    s.write_int(std::int8_t{-7});
    s.write_more();
    s.write_int(0);
    return s.ok() && s.buffer() == "-9223372036854775808,18446744073709551615,-7,0";
}

bool test_shortest_doubles() {
    Stream s;
    s.write_float(0.1);
    s.write_more();
    s.write_float(2.0);
    s.write_more();
    s.write_float(-1.5);
    s.write_more();
    s.write_float(0.3f);
    return s.ok() && s.buffer() == "0.1,2,-1.5,0.3";
}

bool test_non_finite_float_latches_error() {
    Stream s;
    s.write_array_start();
    if (s.write_float(std::numeric_limits<double>::quiet_NaN())) return false;
    if (s.error() != EncodeError::UNSUPPORTED_VALUE) return false;
    // writes after the first error change nothing
    s.write_int(1);
    s.write_array_end();
    s.report_custom_error("late");
    if (s.buffer() != "[" || !s.custom_message().empty()) return false;

    Stream inf;
    inf.write_float(std::numeric_limits<float>::infinity());
    return inf.error() == EncodeError::UNSUPPORTED_VALUE;
}

bool test_string_escaping() {
    Stream s;
    s.write_string("a\"b\\c\n\t\x01\x1f");
    return s.buffer() == R"("a\"b\\c\n\t\u0001\u001f")";
}

bool test_non_ascii_passes_through() {
    Stream s;
    s.write_string("caf\xC3\xA9 /");
    return s.buffer() == "\"caf\xC3\xA9 /\"";
}

bool test_html_escaping_is_optional() {
    Stream plain;
    plain.write_string("<a&b>");
    if (plain.buffer() != R"("<a&b>")") return false;

    Stream html(StreamOptions{.escape_html = true});
    html.write_string("<a&b>");
    return html.buffer() == R"("\u003ca\u0026b\u003e")";
}

bool test_object_field_keys_are_escaped() {
    std::string out = "prefix:";
    Stream s(out, StreamOptions{});
    s.write_object_start();
    s.write_object_field("k\"1");
    s.write_bool(true);
    s.write_more();
    s.write_object_field("n");
    s.write_null();
    s.write_object_end();
    return out == R"(prefix:{"k\"1":true,"n":null})" && s.size() == out.size();
}

bool test_six_digit_stream() {
    Stream s(StreamOptions{.float_precision = FloatPrecision::SixDigits});
    s.write_float(1.23456789f);
    s.write_more();
    s.write_float(-0.5);
    s.write_more();
    s.write_float(10.0);
    return s.buffer() == "1.234568,-0.5,10";
}

bool test_custom_error_keeps_message() {
    Stream s;
    s.report_custom_error("bad value");
    s.set_error(EncodeError::UNSUPPORTED_VALUE);
    return s.error() == EncodeError::CUSTOM_CODEC_ERROR
        && s.custom_message() == "bad value"
        && error_kind(s.error()) == ErrorKind::CustomCodec;
}

bool test_nesting_limit() {
    Stream s(StreamOptions{.max_depth = 2});
    s.write_array_start();
    s.write_object_start();
    if (!s.ok() || s.depth() != 2) return false;
    s.write_object_end();
    if (s.depth() != 1 || !s.write_array_start()) return false;
    if (s.write_array_start()) return false;
    return s.error() == EncodeError::NESTING_TOO_DEEP && s.buffer() == "[{}[";
}

} // namespace

int main() {
    return RunTests({
        {"test_integer_extremes", &test_integer_extremes},
        {"test_shortest_doubles", &test_shortest_doubles},
        {"test_non_finite_float_latches_error", &test_non_finite_float_latches_error},
        {"test_string_escaping", &test_string_escaping},
        {"test_non_ascii_passes_through", &test_non_ascii_passes_through},
        {"test_html_escaping_is_optional", &test_html_escaping_is_optional},
        {"test_object_field_keys_are_escaped", &test_object_field_keys_are_escaped},
        {"test_six_digit_stream", &test_six_digit_stream},
        {"test_custom_error_keeps_message", &test_custom_error_keeps_message},
        {"test_nesting_limit", &test_nesting_limit},
    });
}
