#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "descriptor_cache.hpp"
#include "extension.hpp"

namespace JsonBind {

// Holds the customization state shared by frozen configurations: type-level
// overrides, the ordered extension chain and the descriptor cache.
//
// Lifecycle: a registry starts empty; register_* and clear_* are the only
// mutators. All of them except the field-level registrations bump
// generation(), which makes every frozen configuration drop its compiled
// codecs on the next resolution. A field-level registration only appends
// its owner to the field log; configurations then retire the owner's codec
// and keep the rest (see CodecArena::sync_field_overrides). Mutators
// are meant for startup and test setup/teardown; they are thread-safe, but
// racing them against resolution of the affected types gives no guarantee
// about which state a codec observes.
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    static Registry& global() {
        static Registry instance;
        return instance;
    }

    void register_type_encoder(TypeMatcher type, EncoderFn fn) {
        {
            std::unique_lock lock(m_mutex);
            put(m_typeEncoders, type, std::move(fn));
        }
        bump("type encoder", type.display_name());
    }

    void register_type_decoder(TypeMatcher type, DecoderFn fn) {
        {
            std::unique_lock lock(m_mutex);
            put(m_typeDecoders, type, std::move(fn));
        }
        bump("type decoder", type.display_name());
    }

    void register_field_encoder(TypeMatcher owner, std::string field, EncoderFn fn) {
        std::uint64_t revision;
        {
            std::unique_lock lock(m_mutex);
            field_override(owner, field).set_encoder(std::move(fn));
            revision = log_field_owner(owner);
        }
        spdlog::debug("JsonBind: registry field encoder {}.{} -> field revision {}", owner.display_name(), field, revision);
    }

    void register_field_decoder(TypeMatcher owner, std::string field, DecoderFn fn) {
        std::uint64_t revision;
        {
            std::unique_lock lock(m_mutex);
            field_override(owner, field).set_decoder(std::move(fn));
            revision = log_field_owner(owner);
        }
        spdlog::debug("JsonBind: registry field decoder {}.{} -> field revision {}", owner.display_name(), field, revision);
    }

    void register_extension(std::shared_ptr<Extension> extension) {
        if (!extension) {
            return;
        }
        {
            std::unique_lock lock(m_mutex);
            m_extensions.push_back(std::move(extension));
        }
        bump("extension", "");
    }

    // Drops type-level and field-level encoders. Idempotent.
    void clear_encoders() {
        {
            std::unique_lock lock(m_mutex);
            m_typeEncoders.clear();
            clear_field_overrides(&FieldOverrideExtension::drop_encoder);
        }
        bump("clear", "encoders");
    }

    // Drops type-level and field-level decoders. Idempotent.
    void clear_decoders() {
        {
            std::unique_lock lock(m_mutex);
            m_typeDecoders.clear();
            clear_field_overrides(&FieldOverrideExtension::drop_decoder);
        }
        bump("clear", "decoders");
    }

    // Drops user extensions; registered field overrides stay. Idempotent.
    void clear_extensions() {
        {
            std::unique_lock lock(m_mutex);
            std::erase_if(m_extensions, [](const std::shared_ptr<Extension>& e) {
                return dynamic_cast<FieldOverrideExtension*>(e.get()) == nullptr;
            });
        }
        bump("clear", "extensions");
    }

    void reset() {
        {
            std::unique_lock lock(m_mutex);
            m_typeEncoders.clear();
            m_typeDecoders.clear();
            m_extensions.clear();
        }
        bump("clear", "everything");
    }

    std::uint64_t generation() const {
        return m_generation.load(std::memory_order_acquire);
    }

    // Number of field-level registrations so far. Never reset.
    std::uint64_t field_revision() const {
        return m_fieldRevision.load(std::memory_order_acquire);
    }

    // Owners of the field-level registrations made after revision, and the
    // revision they lead up to.
    std::pair<std::vector<TypeMatcher>, std::uint64_t> field_owners_since(std::uint64_t revision) const {
        std::shared_lock lock(m_mutex);
        const std::size_t first = std::min<std::size_t>(revision, m_fieldOwners.size());
        std::vector<TypeMatcher> owners(m_fieldOwners.begin() + static_cast<std::ptrdiff_t>(first), m_fieldOwners.end());
        return {std::move(owners), m_fieldOwners.size()};
    }

    EncoderFn find_type_encoder(TypeId type) const {
        std::shared_lock lock(m_mutex);
        return find(m_typeEncoders, type);
    }

    DecoderFn find_type_decoder(TypeId type) const {
        std::shared_lock lock(m_mutex);
        return find(m_typeDecoders, type);
    }

    // Snapshot in registration order.
    std::vector<std::shared_ptr<Extension>> extensions() const {
        std::shared_lock lock(m_mutex);
        return m_extensions;
    }

    DescriptorCache& descriptors() {
        return m_descriptors;
    }

private:
    template<class Fn>
    struct OverrideTable {
        std::unordered_map<std::type_index, Fn> by_index;
        std::unordered_map<std::string, Fn> by_name;

        void clear() {
            by_index.clear();
            by_name.clear();
        }
    };

    template<class Fn>
    static void put(OverrideTable<Fn>& table, const TypeMatcher& type, Fn fn) {
        if (type.index) {
            table.by_index.insert_or_assign(*type.index, std::move(fn));
        } else {
            table.by_name.insert_or_assign(type.name, std::move(fn));
        }
    }

    template<class Fn>
    static Fn find(const OverrideTable<Fn>& table, TypeId type) {
        if (auto it = table.by_index.find(type.index()); it != table.by_index.end()) {
            return it->second;
        }
        if (auto it = table.by_name.find(type.name()); it != table.by_name.end()) {
            return it->second;
        }
        return {};
    }

    // Reuses the override entry for (owner, field) so that registering an
    // encoder and then a decoder for one slot keeps a single chain entry.
    FieldOverrideExtension& field_override(TypeMatcher owner, std::string field) {
        for (auto& e : m_extensions) {
            auto* fo = dynamic_cast<FieldOverrideExtension*>(e.get());
            if (fo && fo->field() == field && fo->owner().index == owner.index && fo->owner().name == owner.name) {
                return *fo;
            }
        }
        auto fo = std::make_shared<FieldOverrideExtension>(std::move(owner), std::move(field));
        FieldOverrideExtension& ref = *fo;
        m_extensions.push_back(std::move(fo));
        return ref;
    }

    void clear_field_overrides(void (FieldOverrideExtension::*drop)()) {
        std::erase_if(m_extensions, [drop](const std::shared_ptr<Extension>& e) {
            auto* fo = dynamic_cast<FieldOverrideExtension*>(e.get());
            if (!fo) {
                return false;
            }
            (fo->*drop)();
            return fo->empty();
        });
    }

    // Caller holds m_mutex exclusively.
    std::uint64_t log_field_owner(const TypeMatcher & owner) {
        m_fieldOwners.push_back(owner);
        m_fieldRevision.store(m_fieldOwners.size(), std::memory_order_release);
        return m_fieldOwners.size();
    }

    void bump(std::string_view what, std::string_view subject) {
        auto g = m_generation.fetch_add(1, std::memory_order_acq_rel) + 1;
        spdlog::debug("JsonBind: registry {} {} -> generation {}", what, subject, g);
    }

    mutable std::shared_mutex m_mutex;
    OverrideTable<EncoderFn> m_typeEncoders;
    OverrideTable<DecoderFn> m_typeDecoders;
    std::vector<std::shared_ptr<Extension>> m_extensions;
    std::atomic<std::uint64_t> m_generation{0};
    std::vector<TypeMatcher> m_fieldOwners;
    std::atomic<std::uint64_t> m_fieldRevision{0};
    DescriptorCache m_descriptors;
};

} // namespace JsonBind
