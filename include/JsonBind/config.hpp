#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>

#include "descriptor.hpp"
#include "naming.hpp"
#include "registry.hpp"
#include "stream.hpp"

namespace JsonBind {

class FrozenConfig;
class CodecArena;

// Behavior flags. Plain value type; freeze() turns it into a usable handle.
struct Config {
    FloatPrecision float_precision = FloatPrecision::Full;
    bool case_sensitive = false;
    bool disallow_unknown_fields = false;
    bool support_private_fields = false;   // members whose name ends in '_'
    NamingStrategy naming = NamingStrategy::Identity;
    bool escape_html = false;
    bool sort_map_keys = false;
    std::size_t max_skip_depth = 64;
    std::size_t max_depth = 512;          // nested containers while decoding or encoding

    FrozenConfig freeze(Registry & registry = Registry::global()) const;
};

// Outcome of resolving one type under one frozen configuration. Holds the
// codec cache generation it came from alive, so the codec stays valid for
// as long as the result exists.
class ResolveResult {
public:
    ResolveResult(std::shared_ptr<CodecArena> arena, const CompiledCodec* codec)
        : m_arena(std::move(arena)), m_codec(codec) {}

    explicit operator bool() const {
        return m_codec && m_codec->encode_error.empty() && m_codec->decode_error.empty();
    }
    bool can_encode() const { return m_codec && m_codec->encode; }
    bool can_decode() const { return m_codec && m_codec->decode; }

    const CompiledCodec& codec() const { return *m_codec; }
    const BuildError& encode_error() const { return m_codec->encode_error; }
    const BuildError& decode_error() const { return m_codec->decode_error; }

    void encode(const void* ptr, Stream & stream) const {
        if (!can_encode()) {
            stream.set_error(EncodeError::BUILD_ERROR);
            return;
        }
        m_codec->encode(ptr, stream);
    }
    void decode(void* ptr, Iterator & iter) const {
        if (!can_decode()) {
            iter.set_error(DecodeError::BUILD_ERROR);
            return;
        }
        m_codec->decode(ptr, iter);
    }

private:
    std::shared_ptr<CodecArena> m_arena;
    const CompiledCodec* m_codec;
};

namespace detail {

inline std::uint64_t next_config_id() {
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

struct FrozenState {
    Config options;
    std::uint64_t id;
    Registry* registry;
    mutable std::shared_mutex mutex;
    mutable std::shared_ptr<CodecArena> arena;
};

} // namespace detail

// Immutable configuration handle seeding its own codec cache. Copies share
// the cache; two freezes of equal options do not.
class FrozenConfig {
public:
    const Config& options() const { return m_state->options; }
    std::uint64_t id() const { return m_state->id; }
    Registry& registry() const { return *m_state->registry; }

    StreamOptions stream_options() const {
        return StreamOptions{m_state->options.float_precision, m_state->options.escape_html,
                             m_state->options.max_depth};
    }

    // Current codec cache; replaced when the registry generation moved.
    std::shared_ptr<CodecArena> arena() const;

    ResolveResult resolve(TypeId type) const;

    template<class T>
    ResolveResult resolve() const {
        return resolve(type_id<T>());
    }

private:
    friend struct Config;
    explicit FrozenConfig(std::shared_ptr<detail::FrozenState> state): m_state(std::move(state)) {}

    std::shared_ptr<detail::FrozenState> m_state;
};

inline FrozenConfig Config::freeze(Registry & registry) const {
    auto state = std::make_shared<detail::FrozenState>();
    state->options = *this;
    state->id = detail::next_config_id();
    state->registry = &registry;
    return FrozenConfig(std::move(state));
}

inline const FrozenConfig& ConfigDefault() {
    static const FrozenConfig cfg = Config{.escape_html = true}.freeze();
    return cfg;
}

inline const FrozenConfig& ConfigFastest() {
    static const FrozenConfig cfg = Config{.float_precision = FloatPrecision::SixDigits}.freeze();
    return cfg;
}

inline const FrozenConfig& ConfigCompatibleWithStandardLibrary() {
    static const FrozenConfig cfg = Config{.escape_html = true, .sort_map_keys = true}.freeze();
    return cfg;
}

} // namespace JsonBind
