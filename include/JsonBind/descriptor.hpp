#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "iterator.hpp"
#include "stream.hpp"
#include "type_info.hpp"

namespace JsonBind {

enum class TypeKind {
    Primitive,
    Sequence,
    Mapping,
    Optional,
    StructuredRecord,
    CustomMarshaled,
    Unsupported
};

constexpr std::string_view kind_to_string(TypeKind k) {
    switch(k) {
    case TypeKind::Primitive: return "Primitive"; break;
    case TypeKind::Sequence: return "Sequence"; break;
    case TypeKind::Mapping: return "Mapping"; break;
    case TypeKind::Optional: return "Optional"; break;
    case TypeKind::StructuredRecord: return "StructuredRecord"; break;
    case TypeKind::CustomMarshaled: return "CustomMarshaled"; break;
    case TypeKind::Unsupported: return "Unsupported"; break;
    }
    return "N/A";
}

// Encoder/decoder operate on the address of one value of the bound type.
using EncoderFn = std::function<void(const void* ptr, Stream& stream)>;
using DecoderFn = std::function<void(void* ptr, Iterator& iter)>;

// Annotation facts collected from Annotated<> options. They survive
// configuration rewriting, unlike the name lists.
struct FieldAnnotations {
    bool explicit_name = false;   // key<"...">
    bool not_json = false;
    bool read_only = false;       // encoded, never decoded
    bool write_only = false;      // decoded, never encoded
};

struct FieldBinding {
    std::string declared_name;
    std::vector<std::string> from_names;   // accepted on decode
    std::vector<std::string> to_names;     // emitted on encode
    TypeId type;                           // nested type
    std::size_t index = 0;                 // declaration order
    void* (*access)(void* record) = nullptr;
    bool (*is_empty)(const void* value) = nullptr;
    EncoderFn encoder;                     // overrides the nested type's codec
    DecoderFn decoder;
    bool omit_empty = false;
    FieldAnnotations annotations;

    void* get(void* record) const {
        return access(record);
    }
    const void* get(const void* record) const {
        return access(const_cast<void*>(record));
    }

    bool is_private() const {
        return !declared_name.empty() && declared_name.back() == '_';
    }
    bool hidden_from_encode() const { return to_names.empty(); }
    bool hidden_from_decode() const { return from_names.empty(); }
    bool hidden() const { return to_names.empty() && from_names.empty(); }

    void hide() {
        from_names.clear();
        to_names.clear();
    }
    void rename(std::string wire_name) {
        from_names = {wire_name};
        to_names = {std::move(wire_name)};
    }
};

// Mutable view of a record handed to extensions after the default bindings
// for the active configuration have been derived.
struct StructDescriptor {
    TypeId type;
    std::vector<FieldBinding> fields;

    FieldBinding* get_field(std::string_view declared_name) {
        for (auto& f : fields) {
            if (f.declared_name == declared_name) {
                return &f;
            }
        }
        return nullptr;
    }
    const FieldBinding* get_field(std::string_view declared_name) const {
        for (auto& f : fields) {
            if (f.declared_name == declared_name) {
                return &f;
            }
        }
        return nullptr;
    }
};

// A resolved (type, configuration) pair. Each direction either carries a
// routine or the reason it could not be built.
struct CompiledCodec {
    TypeId type;
    EncoderFn encode;
    DecoderFn decode;
    BuildError encode_error;
    BuildError decode_error;
};

class CodecArena;
using CodecFactory = CompiledCodec (*)(CodecArena& arena);

struct NativeCapability {
    bool encode = false;
    bool decode = false;
    TypeId wire;    // transformers only: the type actually read and written

    bool any() const { return encode || decode; }
};

// Structural shape of one type. Pure function of the C++ type: no
// configuration and no extensions are involved.
struct Descriptor {
    TypeId type;
    TypeKind kind = TypeKind::Unsupported;    // CustomMarshaled when native capability exists
    TypeKind shape = TypeKind::Unsupported;   // what the type looks like without it
    NativeCapability native;
    std::vector<FieldBinding> fields;         // StructuredRecord
    std::vector<TypeId> children;             // every nested type
    bool (*is_empty)(const void* value) = nullptr;
    CodecFactory make_structural = nullptr;   // every shape except StructuredRecord
    CodecFactory make_native = nullptr;
    std::string unsupported_reason;
};

} // namespace JsonBind
