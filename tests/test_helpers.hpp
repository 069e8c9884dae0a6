#pragma once

#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <pfr.hpp>

#include <JsonBind/json_bind.hpp>

namespace TestHelpers {

// ============================================================================
// Runner
// ============================================================================

struct TestCase {
    const char* name;
    bool (*fn)();
};

inline int RunTests(std::initializer_list<TestCase> tests) {
    int failed = 0;
    for (const auto& t : tests) {
        if (!t.fn()) {
            std::cerr << "FAILED: " << t.name << "\n";
            ++failed;
        }
    }
    std::cout << (tests.size() - failed) << "/" << tests.size() << " passed\n";
    return failed == 0 ? 0 : 1;
}

// Clears every override and extension of the process-wide registry when
// entering and leaving a test case.
class RegistryReset {
public:
    RegistryReset() { JsonBind::Registry::global().reset(); }
    ~RegistryReset() { JsonBind::Registry::global().reset(); }
    RegistryReset(const RegistryReset&) = delete;
    RegistryReset& operator=(const RegistryReset&) = delete;
};

// ============================================================================
// Parse / Serialize Helpers
// ============================================================================

template<typename T>
bool ParseSucceeds(T& obj, std::string_view json, const JsonBind::FrozenConfig& cfg = JsonBind::ConfigDefault()) {
    auto res = JsonBind::Parse(obj, json, cfg);
    if (!res) {
        std::cerr << "  " << JsonBind::ParseResultToString(res, json) << "\n";
    }
    return static_cast<bool>(res);
}

template<typename T>
bool ParseFailsWith(T& obj, std::string_view json, JsonBind::DecodeError expected,
                    const JsonBind::FrozenConfig& cfg = JsonBind::ConfigDefault()) {
    auto res = JsonBind::Parse(obj, json, cfg);
    return !res && res.error() == expected;
}

template<typename T>
bool ParseFailsWith(T& obj, std::string_view json, JsonBind::ReaderError expected,
                    const JsonBind::FrozenConfig& cfg = JsonBind::ConfigDefault()) {
    auto res = JsonBind::Parse(obj, json, cfg);
    return !res && res.error() == JsonBind::DecodeError::READER_ERROR && res.readerError() == expected;
}

template<typename T>
bool SerializesTo(const T& obj, std::string_view expected,
                  const JsonBind::FrozenConfig& cfg = JsonBind::ConfigDefault()) {
    std::string out;
    auto res = JsonBind::Serialize(obj, out, cfg);
    if (!res) {
        std::cerr << "  " << JsonBind::SerializeResultToString(res) << "\n";
        return false;
    }
    if (out != expected) {
        std::cerr << "  got " << out << "\n  expected " << expected << "\n";
        return false;
    }
    return true;
}

/// Parse JSON, serialize back, compare byte-by-byte
template<typename T>
bool RoundTripEquals(T& obj, std::string_view original_json,
                     const JsonBind::FrozenConfig& cfg = JsonBind::ConfigDefault()) {
    if (!ParseSucceeds(obj, original_json, cfg)) {
        return false;
    }
    return SerializesTo(obj, original_json, cfg);
}

// ============================================================================
// Struct Comparison Helpers (Using PFR)
// ============================================================================

template<class T>
constexpr bool is_annotated_v = JsonBind::is_annotated_v<std::remove_cvref_t<T>>;

/// Compare two values field-by-field
template<typename T>
bool DeepEqual(const T& a, const T& b) {
    if constexpr (is_annotated_v<T>) {
        return DeepEqual(a.get(), b.get());
    }
    else if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>
                       || std::is_same_v<T, std::string>) {
        return a == b;
    }
    else if constexpr (requires { a.has_value(); a.value(); }) {
        if (a.has_value() != b.has_value()) return false;
        if (!a.has_value()) return true;
        return DeepEqual(a.value(), b.value());
    }
    // unique_ptr / shared_ptr
    else if constexpr (requires { a.get(); a.operator bool(); }) {
        bool a_null = (a.get() == nullptr);
        bool b_null = (b.get() == nullptr);
        if (a_null != b_null) return false;
        if (a_null) return true;
        return DeepEqual(*a, *b);
    }
    // maps
    else if constexpr (requires { typename T::key_type; typename T::mapped_type; }) {
        if (a.size() != b.size()) return false;
        for (const auto& [k, v] : a) {
            auto it = b.find(k);
            if (it == b.end() || !DeepEqual(v, it->second)) return false;
        }
        return true;
    }
    else if constexpr (requires { a.begin(); a.end(); a.size(); }) {
        if (a.size() != b.size()) return false;
        auto it_a = a.begin();
        auto it_b = b.begin();
        while (it_a != a.end()) {
            if (!DeepEqual(static_cast<const typename T::value_type&>(*it_a),
                           static_cast<const typename T::value_type&>(*it_b))) return false;
            ++it_a;
            ++it_b;
        }
        return true;
    }
    else if constexpr (std::is_aggregate_v<T>) {
        constexpr std::size_t fields_count = pfr::tuple_size_v<T>;
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return (true && ... && DeepEqual(pfr::get<I>(a), pfr::get<I>(b)));
        }(std::make_index_sequence<fields_count>{});
    }
    else {
        return a == b;
    }
}

} // namespace TestHelpers
