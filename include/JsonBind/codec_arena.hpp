#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "config.hpp"
#include "descriptor.hpp"
#include "extension.hpp"
#include "naming.hpp"
#include "registry.hpp"

namespace JsonBind {

class CodecArena;

// Late-bound reference to the codec of one type inside one arena. Composite
// codecs hold slots for their children instead of the children's codecs, so
// recursive types compile without recursing.
class CodecSlot {
public:
    CodecSlot(CodecArena & arena, TypeId type): m_arena(arena), m_type(type) {}

    CodecSlot(const CodecSlot&) = delete;
    CodecSlot& operator=(const CodecSlot&) = delete;

    TypeId type() const { return m_type; }

    const CompiledCodec& get() const;

    void encode(const void* ptr, Stream & stream) const {
        const CompiledCodec& codec = get();
        if (!codec.encode) {
            stream.set_error(EncodeError::BUILD_ERROR);
            return;
        }
        codec.encode(ptr, stream);
    }

    void decode(void* ptr, Iterator & iter) const {
        const CompiledCodec& codec = get();
        if (!codec.decode) {
            iter.set_error(DecodeError::BUILD_ERROR);
            return;
        }
        codec.decode(ptr, iter);
    }

    // Forgets the bound codec; the next use resolves again.
    void reset() {
        m_codec.store(nullptr, std::memory_order_release);
    }

private:
    CodecArena& m_arena;
    TypeId m_type;
    mutable std::atomic<const CompiledCodec*> m_codec{nullptr};
};

// Codec cache of one frozen configuration for one registry generation.
// Compiled codecs are never moved or freed while the arena lives.
class CodecArena {
public:
    CodecArena(Config options, Registry & registry, std::uint64_t generation)
        : m_options(options), m_registry(registry), m_generation(generation),
          m_fieldRevision(registry.field_revision()) {}

    CodecArena(const CodecArena&) = delete;
    CodecArena& operator=(const CodecArena&) = delete;

    const Config& options() const { return m_options; }
    Registry& registry() const { return m_registry; }
    std::uint64_t generation() const { return m_generation; }

    StreamOptions stream_options() const {
        return StreamOptions{m_options.float_precision, m_options.escape_html, m_options.max_depth};
    }

    const CompiledCodec& resolve(TypeId type) {
        {
            std::shared_lock lock(m_mutex);
            auto it = m_codecs.find(type);
            if (it != m_codecs.end()) {
                return *it->second;
            }
        }

        // Compiled without holding the lock; concurrent builders of the same
        // type race and the first one to publish wins.
        auto compiled = std::make_unique<CompiledCodec>(compile(type));

        std::unique_lock lock(m_mutex);
        auto [it, inserted] = m_codecs.try_emplace(type, std::move(compiled));
        if (!inserted) {
            spdlog::debug("JsonBind: discarded duplicate codec build for {}", type.name());
        }
        return *it->second;
    }

    CodecSlot& slot(TypeId type) {
        std::lock_guard lock(m_slotsMutex);
        auto& s = m_slots[type];
        if (!s) {
            s = std::make_unique<CodecSlot>(*this, type);
        }
        return *s;
    }

    std::size_t size() const {
        std::shared_lock lock(m_mutex);
        return m_codecs.size();
    }

    // Catches up with field-level registrations made since the last call.
    // Such a registration changes its owner's record codec only; every other
    // compiled codec stays, except those that failed to build, which the new
    // override may have repaired. Retired codecs are kept alive for
    // callers still holding them.
    void sync_field_overrides() {
        if (m_fieldRevision.load(std::memory_order_acquire) == m_registry.field_revision()) {
            return;
        }
        std::unique_lock lock(m_mutex);
        auto [owners, revision] = m_registry.field_owners_since(m_fieldRevision.load(std::memory_order_relaxed));
        for (auto it = m_codecs.begin(); it != m_codecs.end();) {
            const TypeId type = it->first;
            const CompiledCodec& codec = *it->second;
            const bool owned = std::any_of(owners.begin(), owners.end(),
                                           [type](const TypeMatcher& m) { return m.matches(type); });
            if (!owned && codec.encode_error.empty() && codec.decode_error.empty()) {
                ++it;
                continue;
            }
            spdlog::debug("JsonBind: field revision {} retires codec for {}", revision, type.name());
            if (CodecSlot* s = find_slot(type)) {
                s->reset();
            }
            m_retired.push_back(std::move(it->second));
            it = m_codecs.erase(it);
        }
        m_fieldRevision.store(revision, std::memory_order_release);
    }

    // Bindings of a record as seen under this configuration, after every
    // registered extension had its say.
    StructDescriptor struct_descriptor_for(const Descriptor & desc,
                                           const std::vector<std::shared_ptr<Extension>> & extensions) const {
        StructDescriptor sd{desc.type, desc.fields};
        for (auto& f : sd.fields) {
            if (f.annotations.not_json) {
                f.hide();
                continue;
            }
            if (!f.annotations.explicit_name) {
                std::string base = f.declared_name;
                if (f.is_private()) {
                    if (!m_options.support_private_fields) {
                        f.hide();
                        continue;
                    }
                    base.pop_back();
                }
                f.rename(apply_naming(m_options.naming, base));
            }
            if (f.annotations.read_only) {
                f.from_names.clear();
            }
            if (f.annotations.write_only) {
                f.to_names.clear();
            }
        }
        for (const auto& e : extensions) {
            e->update_struct_descriptor(sd);
        }
        return sd;
    }

private:
    enum class Direction { Encode, Decode };

    CodecSlot* find_slot(TypeId type) {
        std::lock_guard lock(m_slotsMutex);
        auto it = m_slots.find(type);
        return it != m_slots.end() ? it->second.get() : nullptr;
    }

    static std::string_view direction_name(Direction d) {
        return d == Direction::Encode ? "encode" : "decode";
    }

    CompiledCodec compile(TypeId type) {
        auto desc = m_registry.descriptors().get(type);
        auto extensions = m_registry.extensions();

        CompiledCodec out;
        out.type = type;

        std::optional<CompiledCodec> native;
        std::optional<CompiledCodec> structural;
        auto get_native = [&]() -> const CompiledCodec& {
            if (!native) native = desc->make_native(*this);
            return *native;
        };
        auto get_structural = [&]() -> const CompiledCodec& {
            if (!structural) {
                structural = desc->shape == TypeKind::StructuredRecord
                    ? assemble_record(*desc, extensions)
                    : desc->make_structural(*this);
            }
            return *structural;
        };

        if (EncoderFn fn = m_registry.find_type_encoder(type)) {
            out.encode = std::move(fn);
        } else if (EncoderFn fn = extension_encoder(extensions, type)) {
            out.encode = std::move(fn);
        } else if (desc->native.encode) {
            if (auto reason = check_native(*desc, Direction::Encode, extensions)) {
                out.encode_error = BuildError{type.name(), std::move(*reason)};
            } else {
                out.encode = get_native().encode;
            }
        } else if (auto reason = check_shape(*desc, Direction::Encode, extensions)) {
            out.encode_error = BuildError{type.name(), std::move(*reason)};
        } else {
            out.encode = get_structural().encode;
        }

        if (DecoderFn fn = m_registry.find_type_decoder(type)) {
            out.decode = std::move(fn);
        } else if (DecoderFn fn = extension_decoder(extensions, type)) {
            out.decode = std::move(fn);
        } else if (desc->native.decode) {
            if (auto reason = check_native(*desc, Direction::Decode, extensions)) {
                out.decode_error = BuildError{type.name(), std::move(*reason)};
            } else {
                out.decode = get_native().decode;
            }
        } else if (auto reason = check_shape(*desc, Direction::Decode, extensions)) {
            out.decode_error = BuildError{type.name(), std::move(*reason)};
        } else {
            out.decode = get_structural().decode;
        }

        if (!out.encode_error.empty()) {
            spdlog::warn("JsonBind: cannot build encoder for {}: {}", type.name(), out.encode_error.reason);
        }
        if (!out.decode_error.empty()) {
            spdlog::warn("JsonBind: cannot build decoder for {}: {}", type.name(), out.decode_error.reason);
        }
        spdlog::debug("JsonBind: compiled codec for {} ({}) generation {}",
                      type.name(), kind_to_string(desc->kind), m_generation);
        return out;
    }

    static EncoderFn extension_encoder(const std::vector<std::shared_ptr<Extension>> & extensions, TypeId type) {
        for (const auto& e : extensions) {
            if (EncoderFn fn = e->create_encoder(type)) {
                return fn;
            }
        }
        return {};
    }

    static DecoderFn extension_decoder(const std::vector<std::shared_ptr<Extension>> & extensions, TypeId type) {
        for (const auto& e : extensions) {
            if (DecoderFn fn = e->create_decoder(type)) {
                return fn;
            }
        }
        return {};
    }

    bool has_override(TypeId type, Direction dir, const std::vector<std::shared_ptr<Extension>> & extensions) const {
        if (dir == Direction::Encode) {
            return m_registry.find_type_encoder(type) || extension_encoder(extensions, type);
        }
        return m_registry.find_type_decoder(type) || extension_decoder(extensions, type);
    }

    // Walks the type graph below desc the way the compiled codec would and
    // reports the first type that has no representation in this direction.
    std::optional<std::string> check_shape(const Descriptor & desc, Direction dir,
                                           const std::vector<std::shared_ptr<Extension>> & extensions) {
        std::unordered_set<TypeId> visited{desc.type};
        return check_shape(desc, dir, extensions, visited);
    }

    std::optional<std::string> check_native(const Descriptor & desc, Direction dir,
                                            const std::vector<std::shared_ptr<Extension>> & extensions) {
        std::unordered_set<TypeId> visited{desc.type};
        return check_native(desc, dir, extensions, visited);
    }

    // A raw marshaler is self-contained; a transformer is only as good as
    // its wire type.
    std::optional<std::string> check_native(const Descriptor & desc, Direction dir,
                                            const std::vector<std::shared_ptr<Extension>> & extensions,
                                            std::unordered_set<TypeId> & visited) {
        if (!desc.native.wire.valid()) {
            return std::nullopt;
        }
        if (auto reason = check_type(desc.native.wire, dir, extensions, visited)) {
            return fmt::format("wire type of '{}': {}", desc.type.name(), *reason);
        }
        return std::nullopt;
    }

    std::optional<std::string> check_shape(const Descriptor & desc, Direction dir,
                                           const std::vector<std::shared_ptr<Extension>> & extensions,
                                           std::unordered_set<TypeId> & visited) {
        switch (desc.shape) {
        case TypeKind::Unsupported:
            return fmt::format("type '{}' has no JSON {} representation ({})",
                               desc.type.name(), direction_name(dir), desc.unsupported_reason);
        case TypeKind::StructuredRecord: {
            StructDescriptor sd = struct_descriptor_for(desc, extensions);
            for (const auto& f : sd.fields) {
                const bool skipped = dir == Direction::Encode
                    ? (f.hidden_from_encode() || f.encoder)
                    : (f.hidden_from_decode() || f.decoder);
                if (skipped) {
                    continue;
                }
                if (auto reason = check_type(f.type, dir, extensions, visited)) {
                    return fmt::format("field '{}' of '{}': {}", f.declared_name, desc.type.name(), *reason);
                }
            }
            return std::nullopt;
        }
        default:
            for (const TypeId& child : desc.children) {
                if (auto reason = check_type(child, dir, extensions, visited)) {
                    return reason;
                }
            }
            return std::nullopt;
        }
    }

    std::optional<std::string> check_type(TypeId type, Direction dir,
                                          const std::vector<std::shared_ptr<Extension>> & extensions,
                                          std::unordered_set<TypeId> & visited) {
        if (!visited.insert(type).second) {
            return std::nullopt;
        }
        if (has_override(type, dir, extensions)) {
            return std::nullopt;
        }
        auto desc = m_registry.descriptors().get(type);
        if (dir == Direction::Encode ? desc->native.encode : desc->native.decode) {
            return check_native(*desc, dir, extensions, visited);
        }
        return check_shape(*desc, dir, extensions, visited);
    }

    struct EncodeField {
        FieldBinding binding;
        std::vector<std::string> prefixes;   // "name": rendered once
        CodecSlot* slot;
    };

    struct DecodeField {
        FieldBinding binding;
        CodecSlot* slot;
    };

    struct DecodeTable {
        std::vector<DecodeField> fields;
        std::unordered_map<std::string, std::size_t> exact;
        std::unordered_map<std::string, std::size_t> folded;
        bool case_sensitive = false;
        bool strict = false;

        const DecodeField* find(const std::string & key) const {
            if (auto it = exact.find(key); it != exact.end()) {
                return &fields[it->second];
            }
            if (!case_sensitive) {
                std::string lowered = key;
                ascii_lower_in_place(lowered);
                if (auto it = folded.find(lowered); it != folded.end()) {
                    return &fields[it->second];
                }
            }
            return nullptr;
        }
    };

    CompiledCodec assemble_record(const Descriptor & desc,
                                  const std::vector<std::shared_ptr<Extension>> & extensions) {
        StructDescriptor sd = struct_descriptor_for(desc, extensions);

        auto encodeFields = std::make_shared<std::vector<EncodeField>>();
        auto table = std::make_shared<DecodeTable>();
        table->case_sensitive = m_options.case_sensitive;
        table->strict = m_options.disallow_unknown_fields;

        for (auto& f : sd.fields) {
            CodecSlot* s = &slot(f.type);
            if (!f.hidden_from_encode()) {
                EncodeField ef{f, {}, s};
                for (const auto& name : f.to_names) {
                    Stream prefix(stream_options());
                    prefix.write_object_field(name);
                    ef.prefixes.push_back(std::move(prefix.buffer()));
                }
                encodeFields->push_back(std::move(ef));
            }
            if (!f.hidden_from_decode()) {
                const std::size_t idx = table->fields.size();
                table->fields.push_back(DecodeField{f, s});
                // first binding claiming a name keeps it
                for (const auto& name : f.from_names) {
                    table->exact.try_emplace(name, idx);
                    std::string lowered = name;
                    ascii_lower_in_place(lowered);
                    table->folded.try_emplace(std::move(lowered), idx);
                }
            }
        }

        CompiledCodec out;
        out.type = desc.type;
        out.encode = [encodeFields](const void* ptr, Stream & stream) {
            stream.write_object_start();
            bool first = true;
            for (const auto& f : *encodeFields) {
                const void* value = f.binding.get(ptr);
                if (f.binding.omit_empty && f.binding.is_empty && f.binding.is_empty(value)) {
                    continue;
                }
                for (const auto& prefix : f.prefixes) {
                    if (!first) {
                        stream.write_more();
                    }
                    first = false;
                    stream.write_raw(prefix);
                    if (f.binding.encoder) {
                        f.binding.encoder(value, stream);
                    } else {
                        f.slot->encode(value, stream);
                    }
                    if (!stream.ok()) {
                        return;
                    }
                }
            }
            stream.write_object_end();
        };
        out.decode = [table](void* ptr, Iterator & iter) {
            if (iter.read_null() || !iter.ok()) {
                return;
            }
            IterationStatus st = iter.read_object_begin();
            if (st.status == TryParseStatus::no_match) {
                iter.set_error(DecodeError::NON_OBJECT_IN_STRUCT);
                return;
            }
            if (st.status != TryParseStatus::ok) {
                return;
            }
            std::string key;
            while (st.has_value) {
                if (!iter.read_object_key(key)) {
                    return;
                }
                if (const DecodeField* f = table->find(key)) {
                    void* value = f->binding.get(ptr);
                    if (f->binding.decoder) {
                        f->binding.decoder(value, iter);
                    } else {
                        f->slot->decode(value, iter);
                    }
                } else if (table->strict) {
                    iter.set_error(DecodeError::EXCESS_FIELD);
                } else {
                    iter.skip();
                }
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

    Config m_options;
    Registry& m_registry;
    std::uint64_t m_generation;

    std::atomic<std::uint64_t> m_fieldRevision;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<TypeId, std::unique_ptr<CompiledCodec>> m_codecs;
    std::vector<std::unique_ptr<CompiledCodec>> m_retired;

    std::mutex m_slotsMutex;
    std::unordered_map<TypeId, std::unique_ptr<CodecSlot>> m_slots;
};

inline const CompiledCodec& CodecSlot::get() const {
    const CompiledCodec* codec = m_codec.load(std::memory_order_acquire);
    if (!codec) {
        codec = &m_arena.resolve(m_type);
        m_codec.store(codec, std::memory_order_release);
    }
    return *codec;
}

inline std::shared_ptr<CodecArena> FrozenConfig::arena() const {
    const std::uint64_t generation = m_state->registry->generation();
    std::shared_ptr<CodecArena> current;
    {
        std::shared_lock lock(m_state->mutex);
        if (m_state->arena && m_state->arena->generation() == generation) {
            current = m_state->arena;
        }
    }
    if (!current) {
        std::unique_lock lock(m_state->mutex);
        if (!m_state->arena || m_state->arena->generation() != generation) {
            if (m_state->arena) {
                spdlog::debug("JsonBind: config {} drops codecs of generation {} for generation {}",
                              m_state->id, m_state->arena->generation(), generation);
            }
            m_state->arena = std::make_shared<CodecArena>(m_state->options, *m_state->registry, generation);
        }
        current = m_state->arena;
    }
    current->sync_field_overrides();
    return current;
}

inline ResolveResult FrozenConfig::resolve(TypeId type) const {
    auto a = arena();
    const CompiledCodec* codec = &a->resolve(type);
    return ResolveResult(std::move(a), codec);
}

} // namespace JsonBind
