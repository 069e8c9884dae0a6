#include <memory>
#include <string>

#include "test_helpers.hpp"

using namespace TestHelpers;
using namespace JsonBind;

namespace jsonbind_test {

struct Pair {
    std::string a;
    std::string b;
};

struct OtherPair {
    std::string a;
};

struct Stamp {
    int v = 0;
};

struct Holder {
    Stamp when;
    Stamp other;
};

struct Envelope {
    Holder inner;
};

struct Triple {
    std::string first;
    int middle = 0;
    std::string last;
};

struct Quoted {
    int value = 0;

    bool unmarshal_json(std::string_view raw) {
        value = static_cast<int>(raw.size());
        return true;
    }
};

struct QuotedHolder {
    Quoted q;
    Quoted r;
};

// Injects a type-level decoder for Stamp.
class StampExtension : public Extension {
public:
    DecoderFn create_decoder(TypeId type) override {
        if (type != type_id<Stamp>()) {
            return {};
        }
        return [](void* ptr, Iterator & iter) {
            static_cast<Stamp*>(ptr)->v = 3;
            iter.skip();
        };
    }
};

class HideExtension : public Extension {
public:
    void update_struct_descriptor(StructDescriptor & descriptor) override {
        if (descriptor.type != type_id<Pair>()) {
            return;
        }
        if (FieldBinding* b = descriptor.get_field("b")) {
            b->hide();
        }
    }
};

} // namespace jsonbind_test

using namespace jsonbind_test;

namespace {

DecoderFn stamp_setter(int v) {
    return [v](void* ptr, Iterator & iter) {
        static_cast<Stamp*>(ptr)->v = v;
        iter.skip();
    };
}

bool test_field_override_touches_only_its_field() {
    RegistryReset reset;
    RegisterFieldDecoder<Pair, std::string>("a", [](std::string & s, Iterator & iter) {
        s = "A:" + iter.read_string();
    });

    Pair p;
    if (!ParseSucceeds(p, R"({"a":"x","b":"y"})")) return false;
    if (p.a != "A:x" || p.b != "y") return false;

    OtherPair o;
    if (!ParseSucceeds(o, R"({"a":"x"})")) return false;
    return o.a == "x";
}

bool test_type_override_reaches_every_slot() {
    RegistryReset reset;
    RegisterTypeDecoder<Stamp>(stamp_setter(1));

    Holder h;
    if (!ParseSucceeds(h, R"({"when":{"v":5},"other":{"v":6}})")) return false;
    return h.when.v == 1 && h.other.v == 1;
}

bool test_field_override_beats_type_override_on_same_slot() {
    RegistryReset reset;
    RegisterTypeDecoder<Stamp>(stamp_setter(1));
    RegisterFieldDecoder<Holder>("when", stamp_setter(2));

    Holder h;
    if (!ParseSucceeds(h, R"({"when":{"v":5},"other":{"v":6}})")) return false;
    return h.when.v == 2 && h.other.v == 1;
}

bool test_field_override_beats_native_capability() {
    RegistryReset reset;
    QuotedHolder h;
    if (!ParseSucceeds(h, R"({"q":"12345","r":"12"})")) return false;
    if (h.q.value != 7 || h.r.value != 4) return false;

    RegisterFieldDecoder<QuotedHolder, Quoted>("q", [](Quoted & q, Iterator & iter) {
        q.value = -1;
        iter.skip();
    });
    if (!ParseSucceeds(h, R"({"q":"12345","r":"12"})")) return false;
    return h.q.value == -1 && h.r.value == 4;
}

bool test_type_override_beats_native_capability() {
    RegistryReset reset;
    RegisterTypeDecoder<Quoted>([](Quoted & q, Iterator & iter) {
        q.value = 99;
        iter.skip();
    });
    QuotedHolder h;
    if (!ParseSucceeds(h, R"({"q":"1","r":"2"})")) return false;
    return h.q.value == 99 && h.r.value == 99;
}

bool test_extension_codec_sits_below_type_override() {
    RegistryReset reset;
    RegisterExtension(std::make_shared<StampExtension>());

    Holder h;
    if (!ParseSucceeds(h, R"({"when":{"v":5},"other":{"v":6}})")) return false;
    if (h.when.v != 3 || h.other.v != 3) return false;

    RegisterTypeDecoder<Stamp>(stamp_setter(1));
    if (!ParseSucceeds(h, R"({"when":{"v":5},"other":{"v":6}})")) return false;
    return h.when.v == 1 && h.other.v == 1;
}

bool test_new_override_invalidates_cached_codec() {
    RegistryReset reset;
    Stamp s{4};
    if (!SerializesTo(s, R"({"v":4})")) return false;
    auto before = Resolve<Stamp>();

    RegisterTypeEncoder<Stamp>([](const Stamp & st, Stream & stream) {
        stream.write_int(st.v * 10);
    });
    if (!SerializesTo(s, "40")) return false;
    auto after = Resolve<Stamp>();
    if (&before.codec() == &after.codec()) return false;

    ClearEncoders();
    return SerializesTo(s, R"({"v":4})");
}

bool test_clear_is_idempotent() {
    RegistryReset reset;
    RegisterTypeDecoder<Stamp>(stamp_setter(1));
    ClearDecoders();
    ClearDecoders();
    ClearEncoders();
    ClearExtensions();
    ClearExtensions();

    Stamp s;
    if (!ParseSucceeds(s, R"({"v":8})")) return false;
    return s.v == 8;
}

bool test_clear_extensions_keeps_field_overrides() {
    RegistryReset reset;
    RegisterFieldDecoder<Holder>("when", stamp_setter(2));
    RegisterExtension(std::make_shared<StampExtension>());
    ClearExtensions();

    Holder h;
    if (!ParseSucceeds(h, R"({"when":{"v":5},"other":{"v":6}})")) return false;
    if (h.when.v != 2 || h.other.v != 6) return false;

    ClearDecoders();
    if (!ParseSucceeds(h, R"({"when":{"v":5},"other":{"v":6}})")) return false;
    return h.when.v == 5;
}

bool test_encoder_and_decoder_share_one_field_entry() {
    RegistryReset reset;
    RegisterFieldDecoder<Holder>("when", stamp_setter(2));
    RegisterFieldEncoder<Holder, Stamp>("when", [](const Stamp &, Stream & stream) {
        stream.write_string("custom");
    });
    if (Registry::global().extensions().size() != 1) return false;

    ClearEncoders();
    if (Registry::global().extensions().size() != 1) return false;
    ClearDecoders();
    return Registry::global().extensions().empty();
}

bool test_extension_hides_field() {
    RegistryReset reset;
    RegisterExtension(std::make_shared<HideExtension>());

    Pair p{"x", "y"};
    if (!SerializesTo(p, R"({"a":"x"})")) return false;
    if (!ParseSucceeds(p, R"({"a":"1","b":"2"})")) return false;
    return p.a == "1" && p.b == "y";
}

bool test_generation_moves_on_every_mutation() {
    RegistryReset reset;
    Registry& r = Registry::global();
    auto g0 = r.generation();
    RegisterTypeDecoder<Stamp>(stamp_setter(1));
    auto g1 = r.generation();
    ClearDecoders();
    auto g2 = r.generation();
    return g0 < g1 && g1 < g2;
}

bool test_private_registry_is_isolated() {
    RegistryReset reset;
    Registry local;
    FrozenConfig cfg = Config{}.freeze(local);
    RegisterTypeEncoder<Stamp>([](const Stamp &, Stream & stream) {
        stream.write_null();
    }, local);

    Stamp s{1};
    if (!SerializesTo(s, "null", cfg)) return false;
    return SerializesTo(s, R"({"v":1})");
}

bool test_error_in_field_decoder_stops_the_record() {
    int lastCalls = 0;
    RegistryReset reset;
    RegisterFieldDecoder<Triple, std::string>("first", [](std::string &, Iterator & iter) {
        iter.report_custom_error("first is rejected");
    });
    RegisterFieldDecoder<Triple, std::string>("last", [&lastCalls](std::string & s, Iterator & iter) {
        ++lastCalls;
        s = iter.read_string();
    });

    Triple t;
    auto res = Parse(t, R"({"first":"a","middle":7,"last":"z"})");
    return !res && res.error() == DecodeError::CUSTOM_CODEC_ERROR && res.kind() == ErrorKind::CustomCodec
        && res.message() == "first is rejected"
        && lastCalls == 0 && t.middle == 0 && t.last.empty();
}

bool test_error_in_field_encoder_stops_the_record() {
    int lastCalls = 0;
    RegistryReset reset;
    RegisterFieldEncoder<Triple, std::string>("first", [](const std::string &, Stream & stream) {
        stream.report_custom_error("first is not writable");
    });
    RegisterFieldEncoder<Triple, std::string>("last", [&lastCalls](const std::string & s, Stream & stream) {
        ++lastCalls;
        stream.write_string(s);
    });

    Triple t{"a", 7, "z"};
    std::string out;
    auto res = Serialize(t, out);
    return !res && res.error() == EncodeError::CUSTOM_CODEC_ERROR
        && res.message() == "first is not writable"
        && lastCalls == 0 && out.find("middle") == std::string::npos;
}

bool test_field_override_keeps_sibling_codecs() {
    RegistryReset reset;
    Envelope e;
    Pair p;
    if (!ParseSucceeds(e, R"({"inner":{"when":{"v":5},"other":{"v":6}}})")) return false;
    if (!ParseSucceeds(p, R"({"a":"x","b":"y"})")) return false;

    const auto generation = Registry::global().generation();
    const CompiledCodec* stamp = &Resolve<Stamp>().codec();
    const CompiledCodec* pair = &Resolve<Pair>().codec();
    const CompiledCodec* holder = &Resolve<Holder>().codec();
    const CompiledCodec* envelope = &Resolve<Envelope>().codec();

    RegisterFieldDecoder<Holder>("when", stamp_setter(2));
    if (Registry::global().generation() != generation) return false;
    if (&Resolve<Stamp>().codec() != stamp || &Resolve<Pair>().codec() != pair) return false;
    if (&Resolve<Envelope>().codec() != envelope) return false;
    if (&Resolve<Holder>().codec() == holder) return false;

    // the enclosing record reaches the new Holder codec through its slot
    if (!ParseSucceeds(e, R"({"inner":{"when":{"v":5},"other":{"v":6}}})")) return false;
    return e.inner.when.v == 2 && e.inner.other.v == 6;
}

bool test_struct_descriptor_lookup() {
    StructDescriptor sd{type_id<Pair>(), Registry::global().descriptors().get(type_id<Pair>())->fields};
    const FieldBinding* b = sd.get_field("b");
    if (!b || b->index != 1 || b->type != type_id<std::string>()) return false;
    return sd.get_field("missing") == nullptr;
}

} // namespace

int main() {
    return RunTests({
        {"test_field_override_touches_only_its_field", &test_field_override_touches_only_its_field},
        {"test_type_override_reaches_every_slot", &test_type_override_reaches_every_slot},
        {"test_field_override_beats_type_override_on_same_slot", &test_field_override_beats_type_override_on_same_slot},
        {"test_field_override_beats_native_capability", &test_field_override_beats_native_capability},
        {"test_type_override_beats_native_capability", &test_type_override_beats_native_capability},
        {"test_extension_codec_sits_below_type_override", &test_extension_codec_sits_below_type_override},
        {"test_new_override_invalidates_cached_codec", &test_new_override_invalidates_cached_codec},
        {"test_clear_is_idempotent", &test_clear_is_idempotent},
        {"test_clear_extensions_keeps_field_overrides", &test_clear_extensions_keeps_field_overrides},
        {"test_encoder_and_decoder_share_one_field_entry", &test_encoder_and_decoder_share_one_field_entry},
        {"test_extension_hides_field", &test_extension_hides_field},
        {"test_generation_moves_on_every_mutation", &test_generation_moves_on_every_mutation},
        {"test_private_registry_is_isolated", &test_private_registry_is_isolated},
        {"test_struct_descriptor_lookup", &test_struct_descriptor_lookup},
        {"test_error_in_field_decoder_stops_the_record", &test_error_in_field_decoder_stops_the_record},
        {"test_error_in_field_encoder_stops_the_record", &test_error_in_field_encoder_stops_the_record},
        {"test_field_override_keeps_sibling_codecs", &test_field_override_keeps_sibling_codecs},
    });
}
