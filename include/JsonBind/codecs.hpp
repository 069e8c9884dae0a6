#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "annotated.hpp"
#include "codec_arena.hpp"
#include "transformers.hpp"

namespace JsonBind {

namespace static_schema {

template<class T>
concept JsonBool = std::same_as<T, bool>;

template<class T>
concept JsonInteger = std::is_integral_v<T> && !std::same_as<T, bool>;

template<class T>
concept JsonFloat = std::same_as<T, float> || std::same_as<T, double>;

template<class T>
concept JsonString = std::same_as<T, std::string>;

template<class T>
concept JsonEnum = std::is_enum_v<T>;

template<class T>
concept JsonPrimitive = JsonBool<T> || JsonInteger<T> || JsonFloat<T> || JsonString<T> || JsonEnum<T>;

template<class T>
struct is_std_array : std::false_type {};

template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template<class T>
concept FixedArray = is_std_array<T>::value;

template<class C>
concept MapKey = JsonString<C> || JsonInteger<C>;

template<class C>
concept MapLike = requires (C& c) {
    typename C::key_type;
    typename C::mapped_type;
    c.begin();
    c.end();
    c.clear();
    c[std::declval<typename C::key_type>()];
} && MapKey<typename C::key_type>;

template<class C>
concept DynamicSequence = !JsonString<C> && !MapLike<C> && requires (C& c) {
    typename C::value_type;
    c.begin();
    c.end();
    c.clear();
    c.push_back(std::declval<typename C::value_type>());
};

template<class T>
struct optional_traits {
    static constexpr bool value = false;
};

template<class T>
struct optional_traits<std::optional<T>> {
    static constexpr bool value = true;
    using element_type = T;
    static T& emplace(std::optional<T>& o) { return o.emplace(); }
};

template<class T>
struct optional_traits<std::unique_ptr<T>> {
    static constexpr bool value = true;
    using element_type = T;
    static T& emplace(std::unique_ptr<T>& o) {
        o = std::make_unique<T>();
        return *o;
    }
};

template<class T>
struct optional_traits<std::shared_ptr<T>> {
    static constexpr bool value = true;
    using element_type = T;
    static T& emplace(std::shared_ptr<T>& o) {
        o = std::make_shared<T>();
        return *o;
    }
};

template<class T>
concept OptionalLike = optional_traits<T>::value;

// Native capabilities: the type knows how to render or read its own JSON.
template<class T>
concept RawMarshaler = requires (const T& t, std::string& out) {
    { t.marshal_json(out) } -> std::convertible_to<bool>;
};

template<class T>
concept RawUnmarshaler = requires (T& t, std::string_view raw) {
    { t.unmarshal_json(raw) } -> std::convertible_to<bool>;
};

template<class T>
concept NativeCodec = RawMarshaler<T> || RawUnmarshaler<T> || transformers::TransformerLike<T>;

} // namespace static_schema

namespace codecs {

// Value emptiness as used by omit_empty.
template<class T>
bool is_empty_value(const void* ptr) {
    const T& v = *static_cast<const T*>(ptr);
    if constexpr (static_schema::JsonBool<T>) {
        return !v;
    } else if constexpr (static_schema::JsonInteger<T> || static_schema::JsonFloat<T>) {
        return v == T{};
    } else if constexpr (static_schema::JsonEnum<T>) {
        return static_cast<std::underlying_type_t<T>>(v) == 0;
    } else if constexpr (static_schema::OptionalLike<T>) {
        return !v;
    } else if constexpr (static_schema::FixedArray<T>) {
        return std::tuple_size_v<T> == 0;
    } else if constexpr (requires { v.empty(); }) {
        return v.empty();
    } else {
        return false;
    }
}

template<class T>
CompiledCodec make_primitive_codec(CodecArena & /*arena*/) {
    CompiledCodec out;
    out.type = type_id<T>();
    out.encode = [](const void* ptr, Stream & stream) {
        const T& v = *static_cast<const T*>(ptr);
        if constexpr (static_schema::JsonBool<T>) {
            stream.write_bool(v);
        } else if constexpr (static_schema::JsonInteger<T>) {
            stream.write_int(v);
        } else if constexpr (static_schema::JsonFloat<T>) {
            stream.write_float(v);
        } else if constexpr (static_schema::JsonEnum<T>) {
            stream.write_int(static_cast<std::underlying_type_t<T>>(v));
        } else {
            stream.write_string(v);
        }
    };
    out.decode = [](void* ptr, Iterator & iter) {
        T& v = *static_cast<T*>(ptr);
        if (iter.read_null() || !iter.ok()) {
            return;
        }
        if constexpr (static_schema::JsonBool<T>) {
            if (iter.read_bool(v) == TryParseStatus::no_match) {
                iter.set_error(DecodeError::NON_BOOL_JSON_IN_BOOL_VALUE);
            }
        } else if constexpr (static_schema::JsonInteger<T> || static_schema::JsonFloat<T>) {
            if (iter.read_number(v) == TryParseStatus::no_match) {
                iter.set_error(DecodeError::WRONG_JSON_FOR_NUMBER_STORAGE);
            }
        } else if constexpr (static_schema::JsonEnum<T>) {
            std::underlying_type_t<T> raw{};
            TryParseStatus st = iter.read_number(raw);
            if (st == TryParseStatus::no_match) {
                iter.set_error(DecodeError::WRONG_JSON_FOR_NUMBER_STORAGE);
            } else if (st == TryParseStatus::ok) {
                v = static_cast<T>(raw);
            }
        } else {
            std::string s;
            TryParseStatus st = iter.read_string(s);
            if (st == TryParseStatus::no_match) {
                iter.set_error(DecodeError::NON_STRING_IN_STRING_STORAGE);
            } else if (st == TryParseStatus::ok) {
                v = std::move(s);
            }
        }
    };
    return out;
}

template<class C>
CompiledCodec make_sequence_codec(CodecArena & arena) {
    using Elem = typename C::value_type;
    CodecSlot* elem = &arena.slot(type_id<Elem>());

    CompiledCodec out;
    out.type = type_id<C>();
    out.encode = [elem](const void* ptr, Stream & stream) {
        const C& c = *static_cast<const C*>(ptr);
        stream.write_array_start();
        bool first = true;
        for (const auto& item : c) {
            if (!first) {
                stream.write_more();
            }
            first = false;
            if constexpr (std::same_as<Elem, bool>) {
                const bool b = item;
                elem->encode(&b, stream);
            } else {
                elem->encode(std::addressof(item), stream);
            }
            if (!stream.ok()) {
                return;
            }
        }
        stream.write_array_end();
    };
    out.decode = [elem](void* ptr, Iterator & iter) {
        C& c = *static_cast<C*>(ptr);
        if (iter.read_null() || !iter.ok()) {
            return;
        }
        IterationStatus st = iter.read_array_begin();
        if (st.status == TryParseStatus::no_match) {
            iter.set_error(DecodeError::NON_ARRAY_IN_ARRAY_LIKE_VALUE);
            return;
        }
        if (st.status != TryParseStatus::ok) {
            return;
        }
        c.clear();
        while (st.has_value) {
            if constexpr (std::same_as<Elem, bool>) {
                bool b = false;
                elem->decode(&b, iter);
                c.push_back(b);
            } else {
                c.emplace_back();
                elem->decode(std::addressof(c.back()), iter);
            }
            if (!iter.ok()) {
                return;
            }
            st = iter.advance_array();
            if (st.status != TryParseStatus::ok) {
                return;
            }
        }
    };
    return out;
}

template<class A>
CompiledCodec make_fixed_array_codec(CodecArena & arena) {
    using Elem = typename A::value_type;
    constexpr std::size_t N = std::tuple_size_v<A>;
    CodecSlot* elem = &arena.slot(type_id<Elem>());

    CompiledCodec out;
    out.type = type_id<A>();
    out.encode = [elem](const void* ptr, Stream & stream) {
        const A& a = *static_cast<const A*>(ptr);
        stream.write_array_start();
        for (std::size_t i = 0; i < N; ++i) {
            if (i != 0) {
                stream.write_more();
            }
            elem->encode(std::addressof(a[i]), stream);
            if (!stream.ok()) {
                return;
            }
        }
        stream.write_array_end();
    };
    out.decode = [elem](void* ptr, Iterator & iter) {
        A& a = *static_cast<A*>(ptr);
        if (iter.read_null() || !iter.ok()) {
            return;
        }
        IterationStatus st = iter.read_array_begin();
        if (st.status == TryParseStatus::no_match) {
            iter.set_error(DecodeError::NON_ARRAY_IN_ARRAY_LIKE_VALUE);
            return;
        }
        if (st.status != TryParseStatus::ok) {
            return;
        }
        std::size_t i = 0;
        while (st.has_value) {
            if (i == N) {
                iter.set_error(DecodeError::FIXED_SIZE_CONTAINER_OVERFLOW);
                return;
            }
            elem->decode(std::addressof(a[i]), iter);
            ++i;
            if (!iter.ok()) {
                return;
            }
            st = iter.advance_array();
            if (st.status != TryParseStatus::ok) {
                return;
            }
        }
    };
    return out;
}

template<class M>
CompiledCodec make_map_codec(CodecArena & arena) {
    using Key = typename M::key_type;
    using Mapped = typename M::mapped_type;
    CodecSlot* value = &arena.slot(type_id<Mapped>());
    const bool sorted = arena.options().sort_map_keys;

    auto key_to_string = [](const Key& k) -> std::string {
        if constexpr (static_schema::JsonString<Key>) {
            return k;
        } else {
            char buf[fp_to_str_detail::NumberBufSize];
            char* end = Stream::format_decimal_integer<Key>(k, buf, buf + sizeof(buf));
            return std::string(buf, end);
        }
    };

    CompiledCodec out;
    out.type = type_id<M>();
    out.encode = [value, sorted, key_to_string](const void* ptr, Stream & stream) {
        const M& m = *static_cast<const M*>(ptr);
        std::vector<std::pair<std::string, const Mapped*>> entries;
        entries.reserve(m.size());
        for (const auto& [k, v] : m) {
            entries.emplace_back(key_to_string(k), std::addressof(v));
        }
        if (sorted) {
            std::sort(entries.begin(), entries.end(),
                      [](const auto& a, const auto& b) { return a.first < b.first; });
        }
        stream.write_object_start();
        bool first = true;
        for (const auto& [k, v] : entries) {
            if (!first) {
                stream.write_more();
            }
            first = false;
            stream.write_object_field(k);
            value->encode(v, stream);
            if (!stream.ok()) {
                return;
            }
        }
        stream.write_object_end();
    };
    out.decode = [value](void* ptr, Iterator & iter) {
        M& m = *static_cast<M*>(ptr);
        if (iter.read_null() || !iter.ok()) {
            return;
        }
        IterationStatus st = iter.read_object_begin();
        if (st.status == TryParseStatus::no_match) {
            iter.set_error(DecodeError::NON_OBJECT_IN_MAP_LIKE_VALUE);
            return;
        }
        if (st.status != TryParseStatus::ok) {
            return;
        }
        std::string keyText;
        while (st.has_value) {
            if (!iter.read_object_key(keyText)) {
                return;
            }
            Key key{};
            if constexpr (static_schema::JsonString<Key>) {
                key = keyText;
            } else {
                if (!Iterator::parse_decimal_integer<Key>(keyText, key)) {
                    iter.set_error(DecodeError::ILLFORMED_MAP_KEY);
                    return;
                }
            }
            value->decode(std::addressof(m[key]), iter);
            if (!iter.ok()) {
                return;
            }
            st = iter.advance_object();
            if (st.status != TryParseStatus::ok) {
                return;
            }
        }
    };
    return out;
}

template<class O>
CompiledCodec make_optional_codec(CodecArena & arena) {
    using Traits = static_schema::optional_traits<O>;
    using Elem = typename Traits::element_type;
    CodecSlot* elem = &arena.slot(type_id<Elem>());

    CompiledCodec out;
    out.type = type_id<O>();
    out.encode = [elem](const void* ptr, Stream & stream) {
        const O& o = *static_cast<const O*>(ptr);
        if (!o) {
            stream.write_null();
            return;
        }
        elem->encode(std::addressof(*o), stream);
    };
    out.decode = [elem](void* ptr, Iterator & iter) {
        O& o = *static_cast<O*>(ptr);
        if (iter.read_null()) {
            o.reset();
            return;
        }
        if (!iter.ok()) {
            return;
        }
        // an existing pointee is decoded in place
        Elem& target = o ? *o : Traits::emplace(o);
        elem->decode(std::addressof(target), iter);
    };
    return out;
}

// Codec for a type carrying its own capability. Only the directions the
// type implements are filled; the other stays empty for the compiler to
// resolve structurally.
template<class T>
CompiledCodec make_native_codec(CodecArena & arena) {
    CompiledCodec out;
    out.type = type_id<T>();

    if constexpr (static_schema::RawMarshaler<T> || static_schema::RawUnmarshaler<T>) {
        if constexpr (static_schema::RawMarshaler<T>) {
            out.encode = [](const void* ptr, Stream & stream) {
                const T& v = *static_cast<const T*>(ptr);
                std::string raw;
                if (!v.marshal_json(raw)) {
                    stream.report_custom_error(fmt::format("marshal_json of {} failed", type_name<T>()));
                    return;
                }
                Iterator check(raw);
                if (!check.skip() || !check.finish()) {
                    stream.set_error(EncodeError::INVALID_RAW_JSON);
                    return;
                }
                stream.write_raw(raw);
            };
        }
        if constexpr (static_schema::RawUnmarshaler<T>) {
            out.decode = [](void* ptr, Iterator & iter) {
                T& v = *static_cast<T*>(ptr);
                std::string raw;
                if (!iter.capture(raw)) {
                    return;
                }
                if (!v.unmarshal_json(raw)) {
                    iter.report_custom_error(fmt::format("unmarshal_json of {} failed", type_name<T>()));
                }
            };
        }
    } else {
        using Wire = typename T::wire_type;
        CodecSlot* wire = &arena.slot(type_id<Wire>());
        if constexpr (transformers::SerializeTransformer<T>) {
            out.encode = [wire](const void* ptr, Stream & stream) {
                const T& v = *static_cast<const T*>(ptr);
                Wire w{};
                if (!v.transform_to(w)) {
                    stream.set_error(EncodeError::TRANSFORMER_ERROR);
                    return;
                }
                wire->encode(&w, stream);
            };
        }
        if constexpr (transformers::ParseTransformer<T>) {
            out.decode = [wire](void* ptr, Iterator & iter) {
                T& v = *static_cast<T*>(ptr);
                Wire w{};
                wire->decode(&w, iter);
                if (!iter.ok()) {
                    return;
                }
                if (!v.transform_from(w)) {
                    iter.set_error(DecodeError::TRANSFORMER_ERROR);
                }
            };
        }
    }
    return out;
}

} // namespace codecs

} // namespace JsonBind
