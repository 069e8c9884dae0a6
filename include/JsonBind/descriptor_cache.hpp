#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "descriptor.hpp"

namespace JsonBind {

// Configuration-independent store of structural descriptors, shared by all
// frozen configurations of one registry. Entries are never evicted.
class DescriptorCache {
public:
    std::shared_ptr<const Descriptor> get(TypeId type) {
        {
            std::shared_lock lock(m_mutex);
            auto it = m_descriptors.find(type);
            if (it != m_descriptors.end()) {
                return it->second;
            }
        }
        return build(type);
    }

    std::size_t size() const {
        std::shared_lock lock(m_mutex);
        return m_descriptors.size();
    }

private:
    // Builds the descriptor of root and of every type reachable from it that
    // is not published yet. Each type gets its arena slot (the
    // under-construction marker) before its children are visited, so cyclic
    // type graphs terminate. The finished graph is published
    // insert-if-absent: a concurrent builder that got there first wins.
    std::shared_ptr<const Descriptor> build(TypeId root) {
        std::vector<std::shared_ptr<Descriptor>> arena;
        std::unordered_map<TypeId, std::size_t> slots;
        std::vector<TypeId> pending{root};

        while (!pending.empty()) {
            TypeId type = pending.back();
            pending.pop_back();
            if (slots.contains(type) || published(type)) {
                continue;
            }
            const std::size_t slot = arena.size();
            slots.emplace(type, slot);
            arena.emplace_back(nullptr);

            auto d = std::make_shared<Descriptor>(type.info().describe());
            for (const TypeId& child : d->children) {
                pending.push_back(child);
            }
            arena[slot] = std::move(d);
        }

        std::unique_lock lock(m_mutex);
        for (const auto& [type, slot] : slots) {
            auto [it, inserted] = m_descriptors.try_emplace(type, arena[slot]);
            if (inserted) {
                spdlog::debug("JsonBind: described {} as {}", type.name(), kind_to_string(it->second->kind));
            }
        }
        return m_descriptors.at(root);
    }

    bool published(TypeId type) const {
        std::shared_lock lock(m_mutex);
        return m_descriptors.contains(type);
    }

    mutable std::shared_mutex m_mutex;
    std::unordered_map<TypeId, std::shared_ptr<const Descriptor>> m_descriptors;
};

} // namespace JsonBind
