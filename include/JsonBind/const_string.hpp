#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace JsonBind {

// String literal usable as a template argument, as in key<"id">.
template <typename CharT, std::size_t N>
struct ConstString {
    CharT m_data[N + 1]{};
    static constexpr std::size_t Length = N;

    constexpr ConstString(const CharT (&literal)[N + 1]) {
        std::copy_n(literal, N + 1, m_data);
    }

    constexpr std::string_view toStringView() const {
        return std::string_view(m_data, N);
    }

    // A usable wire key: not empty, nothing that would need escaping.
    constexpr bool check() const {
        return N > 0 && std::none_of(m_data, m_data + N, [](CharT c) {
            return static_cast<std::uint8_t>(c) < 0x20 || c == '"' || c == '\\';
        });
    }
};

template <typename CharT, std::size_t N>
ConstString(const CharT (&literal)[N]) -> ConstString<CharT, N - 1>;

} // namespace JsonBind
