#pragma once

#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "codecs.hpp"
#include "descriptor.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "type_info.hpp"

namespace JsonBind {

template<class T>
Descriptor describe_type();

template<class T>
TypeId type_id() {
    static const TypeInfo info{std::type_index(typeid(T)), detail::demangle(typeid(T).name()), &describe_type<T>};
    return TypeId(&info);
}

namespace detail {

template<class T, std::size_t I>
FieldBinding make_field_binding() {
    using Field = introspection::structureElementTypeByIndex<I, T>;
    using Meta = options::detail::annotation_meta_getter<Field>;
    using Value = std::remove_cvref_t<typename Meta::value_t>;
    using Opts = typename Meta::options;

    FieldBinding b;
    b.declared_name = std::string(introspection::structureElementNameByIndex<I, T>);
    b.type = type_id<Value>();
    b.index = I;
    b.access = [](void* record) -> void* {
        return std::addressof(Meta::getRef(introspection::getStructElementByIndex<I>(*static_cast<T*>(record))));
    };
    b.is_empty = &codecs::is_empty_value<Value>;
    b.omit_empty = Opts::template has_option<options::detail::omit_empty_tag>;
    b.annotations.not_json = Opts::template has_option<options::detail::not_json_tag>;
    b.annotations.read_only = Opts::template has_option<options::detail::read_only_tag>;
    b.annotations.write_only = Opts::template has_option<options::detail::write_only_tag>;

    std::string wire = b.declared_name;
    if constexpr (Opts::template has_option<options::detail::key_tag>) {
        using Key = typename Opts::template get_option<options::detail::key_tag>;
        b.annotations.explicit_name = true;
        wire = std::string(Key::desc.toStringView());
    }
    b.rename(std::move(wire));
    return b;
}

template<class T>
void describe_record(Descriptor & d) {
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (d.fields.push_back(make_field_binding<T, I>()), ...);
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
    for (const auto& f : d.fields) {
        d.children.push_back(f.type);
    }
}

} // namespace detail

// One-level structural description of T. Nested types are referenced by
// TypeId only; their descriptors are built by the cache on demand.
template<class T>
Descriptor describe_type() {
    Descriptor d;
    d.type = type_id<T>();
    d.is_empty = &codecs::is_empty_value<T>;

    if constexpr (static_schema::JsonPrimitive<T>) {
        d.shape = TypeKind::Primitive;
        d.make_structural = &codecs::make_primitive_codec<T>;
    } else if constexpr (static_schema::FixedArray<T>) {
        d.shape = TypeKind::Sequence;
        d.make_structural = &codecs::make_fixed_array_codec<T>;
        d.children.push_back(type_id<typename T::value_type>());
    } else if constexpr (static_schema::MapLike<T>) {
        d.shape = TypeKind::Mapping;
        d.make_structural = &codecs::make_map_codec<T>;
        d.children.push_back(type_id<typename T::mapped_type>());
    } else if constexpr (static_schema::DynamicSequence<T>) {
        d.shape = TypeKind::Sequence;
        d.make_structural = &codecs::make_sequence_codec<T>;
        d.children.push_back(type_id<typename T::value_type>());
    } else if constexpr (static_schema::OptionalLike<T>) {
        d.shape = TypeKind::Optional;
        d.make_structural = &codecs::make_optional_codec<T>;
        d.children.push_back(type_id<typename static_schema::optional_traits<T>::element_type>());
    } else if constexpr (is_annotated_v<T>) {
        d.unsupported_reason = "Annotated<> only applies to record fields";
    } else if constexpr (introspection::Aggregate<T>) {
        // also for self-marshaling aggregates: the direction they do not
        // implement falls back to reflection
        d.shape = TypeKind::StructuredRecord;
        detail::describe_record<T>(d);
    } else {
        d.unsupported_reason = "not a primitive, container, optional or reflectable aggregate";
    }

    if constexpr (static_schema::RawMarshaler<T> || static_schema::RawUnmarshaler<T>) {
        d.native = NativeCapability{static_schema::RawMarshaler<T>, static_schema::RawUnmarshaler<T>};
        d.make_native = &codecs::make_native_codec<T>;
    } else if constexpr (transformers::TransformerLike<T>) {
        d.native = NativeCapability{transformers::SerializeTransformer<T>, transformers::ParseTransformer<T>,
                                    type_id<typename T::wire_type>()};
        d.make_native = &codecs::make_native_codec<T>;
        d.children.push_back(d.native.wire);
    }
    d.kind = d.native.any() ? TypeKind::CustomMarshaled : d.shape;
    return d;
}

} // namespace JsonBind
