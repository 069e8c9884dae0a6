#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "test_helpers.hpp"

using namespace TestHelpers;
using namespace JsonBind;

using Clock = std::chrono::system_clock;

namespace jsonbind_test {

struct Tom {
    std::string field1;
};

struct TestObject1 {
    std::string field1;
};

// Renders itself as the number of seconds.
struct TimeMarshaler {
    std::int64_t seconds = 0;

    bool marshal_json(std::string & out) const {
        out = std::to_string(seconds);
        return true;
    }
};

struct WithMarshaler {
    TimeMarshaler Field;
};

struct WithMarshalerPtr {
    std::unique_ptr<TimeMarshaler> Field;
};

// Reads itself from a quoted decimal.
struct QuotedInt {
    int value = 0;

    bool unmarshal_json(std::string_view raw) {
        if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
            return false;
        }
        auto [p, ec] = std::from_chars(raw.data() + 1, raw.data() + raw.size() - 1, value);
        return ec == std::errc{} && p == raw.data() + raw.size() - 1;
    }
};

struct WithUnmarshaler {
    std::unique_ptr<QuotedInt> Field;
    std::string Field2;
};

struct TmStruct {
    std::string String;

    bool marshal_json(std::string & out) const {
        out = "\"" + String + "\"";
        return true;
    }
};

struct BrokenMarshaler {
    int x = 0;

    bool marshal_json(std::string & out) const {
        out = "{not json";
        return true;
    }
};

struct FailingMarshaler {
    int x = 0;

    bool marshal_json(std::string &) const {
        return false;
    }
};

// Maps TestObject1::field1 to "field-1" and carries it as a number.
class IntAsStringExtension : public Extension {
public:
    void update_struct_descriptor(StructDescriptor & descriptor) override {
        if (descriptor.type != type_id<TestObject1>()) {
            return;
        }
        FieldBinding* binding = descriptor.get_field("field1");
        if (!binding) {
            return;
        }
        binding->encoder = [](const void* ptr, Stream & stream) {
            const std::string& s = *static_cast<const std::string*>(ptr);
            int v = 0;
            std::from_chars(s.data(), s.data() + s.size(), v);
            stream.write_int(v);
        };
        binding->decoder = [](void* ptr, Iterator & iter) {
            *static_cast<std::string*>(ptr) = std::to_string(iter.read_int());
        };
        binding->rename("field-1");
    }
};

} // namespace jsonbind_test

using namespace jsonbind_test;

namespace {

std::string format_utc(Clock::time_point t) {
    std::time_t secs = Clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

void register_time_decoder() {
    RegisterTypeDecoder<Clock::time_point>([](Clock::time_point & t, Iterator & iter) {
        std::string text = iter.read_string();
        if (!iter.ok()) {
            return;
        }
        std::tm tm{};
        std::istringstream in(text);
        in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (in.fail()) {
            iter.report_custom_error("cannot parse time '" + text + "'");
            return;
        }
        t = Clock::from_time_t(timegm(&tm));
    });
}

bool test_type_decoder_for_time_point() {
    RegistryReset reset;
    register_time_decoder();

    Clock::time_point val{};
    if (!ParseSucceeds(val, R"("2016-12-05 08:43:28")")) return false;
    std::time_t secs = Clock::to_time_t(val);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return tm.tm_year + 1900 == 2016 && tm.tm_mon + 1 == 12 && tm.tm_mday == 5;
}

bool test_type_decoder_reports_custom_error() {
    RegistryReset reset;
    register_time_decoder();

    Clock::time_point val{};
    auto res = Parse(val, R"("yesterday")");
    return !res
        && res.error() == DecodeError::CUSTOM_CODEC_ERROR
        && res.kind() == ErrorKind::CustomCodec
        && res.message() == "cannot parse time 'yesterday'";
}

bool test_type_encoder_for_time_point() {
    RegistryReset reset;
    RegisterTypeEncoder<Clock::time_point>([](const Clock::time_point & t, Stream & stream) {
        stream.write_string(format_utc(t));
    });

    Clock::time_point epoch = Clock::from_time_t(0);
    return SerializesTo(epoch, R"("1970-01-01 00:00:00")");
}

bool test_byte_array_encoder() {
    RegistryReset reset;
    RegisterTypeEncoder<std::vector<std::uint8_t>>([](const std::vector<std::uint8_t> & bytes, Stream & stream) {
        stream.write_string(std::string(bytes.begin(), bytes.end()));
    });

    std::vector<std::uint8_t> val{'a', 'b', 'c'};
    if (!SerializesTo(val, R"("abc")")) return false;

    ClearEncoders();
    return SerializesTo(val, "[97,98,99]");
}

bool test_six_digit_float() {
    FrozenConfig cfg = Config{.float_precision = FloatPrecision::SixDigits}.freeze();
    if (!SerializesTo(1.23456789f, "1.234568", cfg)) return false;
    return SerializesTo(1.23456789f, "1.2345679");
}

bool test_field_decoder() {
    RegistryReset reset;
    RegisterFieldDecoder<Tom, std::string>("field1", [](std::string & s, Iterator & iter) {
        s = std::to_string(iter.read_int());
    });

    Tom tom;
    if (!ParseSucceeds(tom, R"({"field1": 100})")) return false;
    return tom.field1 == "100";
}

bool test_field_decoder_by_type_name() {
    RegistryReset reset;
    RegisterFieldDecoder("jsonbind_test::Tom", "field1", [](void* ptr, Iterator & iter) {
        *static_cast<std::string*>(ptr) = "#" + std::to_string(iter.read_int());
    });

    Tom tom;
    if (!ParseSucceeds(tom, R"({"field1": 7})")) return false;
    return tom.field1 == "#7";
}

bool test_field_by_extension() {
    RegistryReset reset;
    RegisterExtension(std::make_shared<IntAsStringExtension>());

    TestObject1 obj;
    if (!ParseSucceeds(obj, R"({"field-1": 100})")) return false;
    if (obj.field1 != "100") return false;
    return SerializesTo(obj, R"({"field-1":100})");
}

bool test_marshaler() {
    RegistryReset reset;
    WithMarshaler obj{TimeMarshaler{123}};
    return SerializesTo(obj, R"({"Field":123})");
}

bool test_marshaler_and_encoder() {
    RegistryReset reset;
    WithMarshalerPtr obj{std::make_unique<TimeMarshaler>(TimeMarshaler{123})};
    if (!SerializesTo(obj, R"({"Field":123})")) return false;

    RegisterTypeEncoder<TimeMarshaler>([](const TimeMarshaler &, Stream & stream) {
        stream.write_string("hello from encoder");
    });
    return SerializesTo(obj, R"({"Field":"hello from encoder"})");
}

bool test_unmarshaler() {
    RegistryReset reset;
    QuotedInt obj;
    if (!ParseSucceeds(obj, R"(   "100" )")) return false;
    if (obj.value != 100) return false;

    QuotedInt second;
    Iterator iter(R"(   "100" )");
    ReadValue(second, iter);
    return iter.ok() && second.value == 100;
}

bool test_unmarshaler_rejects_input() {
    RegistryReset reset;
    QuotedInt obj;
    auto res = Parse(obj, "100");
    return !res && res.error() == DecodeError::CUSTOM_CODEC_ERROR;
}

bool test_unmarshaler_and_decoder() {
    RegistryReset reset;
    WithUnmarshaler obj;
    obj.Field = std::make_unique<QuotedInt>();
    QuotedInt* original = obj.Field.get();

    if (!ParseSucceeds(obj, R"({"Field":"100"})")) return false;
    if (obj.Field->value != 100) return false;

    RegisterTypeDecoder<QuotedInt>([](QuotedInt & v, Iterator & iter) {
        v.value = 10;
        iter.skip();
    });
    if (!ParseSucceeds(obj, R"({"Field":"100"})")) return false;
    return obj.Field.get() == original && obj.Field->value == 10;
}

bool test_marshaler_on_struct() {
    RegistryReset reset;
    TmStruct fixed{"hello"};
    return SerializesTo(fixed, R"("hello")");
}

bool test_marshaler_output_is_validated() {
    RegistryReset reset;
    std::string out;
    auto res = Serialize(BrokenMarshaler{}, out);
    if (res || res.error() != EncodeError::INVALID_RAW_JSON) return false;

    auto res2 = Serialize(FailingMarshaler{}, out);
    return !res2 && res2.error() == EncodeError::CUSTOM_CODEC_ERROR && res2.kind() == ErrorKind::CustomCodec;
}

bool test_self_marshaling_struct_decodes_by_reflection() {
    RegistryReset reset;
    TimeMarshaler t;
    if (!ParseSucceeds(t, R"({"seconds": 77})")) return false;
    return t.seconds == 77;
}

} // namespace

static_assert(static_schema::RawMarshaler<TimeMarshaler>);
static_assert(!static_schema::RawUnmarshaler<TimeMarshaler>);
static_assert(static_schema::RawUnmarshaler<QuotedInt>);
static_assert(static_schema::NativeCodec<TmStruct>);
static_assert(!static_schema::NativeCodec<Tom>);

int main() {
    return RunTests({
        {"test_type_decoder_for_time_point", &test_type_decoder_for_time_point},
        {"test_type_decoder_reports_custom_error", &test_type_decoder_reports_custom_error},
        {"test_type_encoder_for_time_point", &test_type_encoder_for_time_point},
        {"test_byte_array_encoder", &test_byte_array_encoder},
        {"test_six_digit_float", &test_six_digit_float},
        {"test_field_decoder", &test_field_decoder},
        {"test_field_decoder_by_type_name", &test_field_decoder_by_type_name},
        {"test_field_by_extension", &test_field_by_extension},
        {"test_marshaler", &test_marshaler},
        {"test_marshaler_and_encoder", &test_marshaler_and_encoder},
        {"test_unmarshaler", &test_unmarshaler},
        {"test_unmarshaler_rejects_input", &test_unmarshaler_rejects_input},
        {"test_unmarshaler_and_decoder", &test_unmarshaler_and_decoder},
        {"test_marshaler_on_struct", &test_marshaler_on_struct},
        {"test_marshaler_output_is_validated", &test_marshaler_output_is_validated},
        {"test_self_marshaling_struct_decodes_by_reflection", &test_self_marshaling_struct_decodes_by_reflection},
    });
}
