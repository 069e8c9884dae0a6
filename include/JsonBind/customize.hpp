#pragma once

#include <concepts>
#include <memory>
#include <string>
#include <utility>

#include "extension.hpp"
#include "registry.hpp"
#include "type_builder.hpp"

namespace JsonBind {

namespace detail {

template<class T, class F>
EncoderFn typed_encoder(F fn) {
    return [fn = std::move(fn)](const void* ptr, Stream & stream) {
        fn(*static_cast<const T*>(ptr), stream);
    };
}

template<class T, class F>
DecoderFn typed_decoder(F fn) {
    return [fn = std::move(fn)](void* ptr, Iterator & iter) {
        fn(*static_cast<T*>(ptr), iter);
    };
}

} // namespace detail

// Whole-type overrides. A type is named by its demangled C++ name, e.g.
// "app::Event", or given as a template argument.

inline void RegisterTypeEncoder(std::string type_name, EncoderFn fn, Registry & registry = Registry::global()) {
    registry.register_type_encoder(TypeMatcher::named(std::move(type_name)), std::move(fn));
}

inline void RegisterTypeDecoder(std::string type_name, DecoderFn fn, Registry & registry = Registry::global()) {
    registry.register_type_decoder(TypeMatcher::named(std::move(type_name)), std::move(fn));
}

template<class T>
void RegisterTypeEncoder(EncoderFn fn, Registry & registry = Registry::global()) {
    registry.register_type_encoder(TypeMatcher::of(type_id<T>()), std::move(fn));
}

template<class T>
void RegisterTypeDecoder(DecoderFn fn, Registry & registry = Registry::global()) {
    registry.register_type_decoder(TypeMatcher::of(type_id<T>()), std::move(fn));
}

// Typed forms: fn(const T&, Stream&) and fn(T&, Iterator&).
template<class T, class F>
    requires std::invocable<F&, const T&, Stream&>
void RegisterTypeEncoder(F fn, Registry & registry = Registry::global()) {
    RegisterTypeEncoder<T>(detail::typed_encoder<T>(std::move(fn)), registry);
}

template<class T, class F>
    requires std::invocable<F&, T&, Iterator&>
void RegisterTypeDecoder(F fn, Registry & registry = Registry::global()) {
    RegisterTypeDecoder<T>(detail::typed_decoder<T>(std::move(fn)), registry);
}

// Single field slot overrides, by declared member name.

inline void RegisterFieldEncoder(std::string type_name, std::string field, EncoderFn fn, Registry & registry = Registry::global()) {
    registry.register_field_encoder(TypeMatcher::named(std::move(type_name)), std::move(field), std::move(fn));
}

inline void RegisterFieldDecoder(std::string type_name, std::string field, DecoderFn fn, Registry & registry = Registry::global()) {
    registry.register_field_decoder(TypeMatcher::named(std::move(type_name)), std::move(field), std::move(fn));
}

template<class Owner>
void RegisterFieldEncoder(std::string field, EncoderFn fn, Registry & registry = Registry::global()) {
    registry.register_field_encoder(TypeMatcher::of(type_id<Owner>()), std::move(field), std::move(fn));
}

template<class Owner>
void RegisterFieldDecoder(std::string field, DecoderFn fn, Registry & registry = Registry::global()) {
    registry.register_field_decoder(TypeMatcher::of(type_id<Owner>()), std::move(field), std::move(fn));
}

template<class Owner, class FieldT, class F>
    requires std::invocable<F&, const FieldT&, Stream&>
void RegisterFieldEncoder(std::string field, F fn, Registry & registry = Registry::global()) {
    RegisterFieldEncoder<Owner>(std::move(field), detail::typed_encoder<FieldT>(std::move(fn)), registry);
}

template<class Owner, class FieldT, class F>
    requires std::invocable<F&, FieldT&, Iterator&>
void RegisterFieldDecoder(std::string field, F fn, Registry & registry = Registry::global()) {
    RegisterFieldDecoder<Owner>(std::move(field), detail::typed_decoder<FieldT>(std::move(fn)), registry);
}

inline void RegisterExtension(std::shared_ptr<Extension> extension, Registry & registry = Registry::global()) {
    registry.register_extension(std::move(extension));
}

inline void ClearEncoders(Registry & registry = Registry::global()) {
    registry.clear_encoders();
}

inline void ClearDecoders(Registry & registry = Registry::global()) {
    registry.clear_decoders();
}

inline void ClearExtensions(Registry & registry = Registry::global()) {
    registry.clear_extensions();
}

} // namespace JsonBind
