#pragma once

#include <optional>
#include <string>
#include <typeindex>

#include "descriptor.hpp"

namespace JsonBind {

// Base for user extensions. Every hook defaults to "no opinion", so an
// extension overrides only what it cares about.
class Extension {
public:
    virtual ~Extension() = default;

    // Called for every structured record after default bindings are derived.
    virtual void update_struct_descriptor(StructDescriptor & /*descriptor*/) {}

    // Type-level codec injection, consulted right after registered type
    // overrides. An empty function means "not handled".
    virtual EncoderFn create_encoder(TypeId /*type*/) { return {}; }
    virtual DecoderFn create_decoder(TypeId /*type*/) { return {}; }
};

// Matches a type either by its C++ identity or by its demangled name.
struct TypeMatcher {
    std::optional<std::type_index> index;
    std::string name;

    static TypeMatcher of(TypeId type) {
        return TypeMatcher{type.index(), type.name()};
    }
    static TypeMatcher named(std::string name) {
        return TypeMatcher{std::nullopt, std::move(name)};
    }

    bool matches(TypeId type) const {
        if (index) {
            return *index == type.index();
        }
        return name == type.name();
    }
    std::string_view display_name() const {
        return name;
    }
};

// One field slot override. Registered field encoders/decoders live in the
// extension chain as instances of this class.
class FieldOverrideExtension final : public Extension {
public:
    FieldOverrideExtension(TypeMatcher owner, std::string field)
        : m_owner(std::move(owner)), m_field(std::move(field)) {}

    void update_struct_descriptor(StructDescriptor & descriptor) override {
        if (!m_owner.matches(descriptor.type)) {
            return;
        }
        FieldBinding* binding = descriptor.get_field(m_field);
        if (!binding) {
            return;
        }
        if (m_encoder) {
            binding->encoder = m_encoder;
        }
        if (m_decoder) {
            binding->decoder = m_decoder;
        }
    }

    void set_encoder(EncoderFn fn) { m_encoder = std::move(fn); }
    void set_decoder(DecoderFn fn) { m_decoder = std::move(fn); }
    void drop_encoder() { m_encoder = nullptr; }
    void drop_decoder() { m_decoder = nullptr; }
    bool empty() const { return !m_encoder && !m_decoder; }

    const TypeMatcher& owner() const { return m_owner; }
    const std::string& field() const { return m_field; }

private:
    TypeMatcher m_owner;
    std::string m_field;
    EncoderFn m_encoder;
    DecoderFn m_decoder;
};

} // namespace JsonBind
