#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace JsonBind {

enum class NamingStrategy {
    Identity,
    LowerCamel,   // user_id -> userId
    UpperCamel,   // user_id -> UserId
    Snake,        // userId  -> user_id
    Kebab         // userId  -> user-id
};

namespace naming_detail {

constexpr bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
constexpr bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }
constexpr char to_lower(char c) { return is_upper(c) ? char(c - 'A' + 'a') : c; }
constexpr char to_upper(char c) { return is_lower(c) ? char(c - 'a' + 'A') : c; }

// Splits on '_' and '-' and on case boundaries: "HTTPServer_id" gives
// {"HTTP", "Server", "id"}.
inline std::vector<std::string_view> split_words(std::string_view name) {
    std::vector<std::string_view> words;
    std::size_t start = 0;
    auto flush = [&](std::size_t end) {
        if (end > start) {
            words.push_back(name.substr(start, end - start));
        }
    };
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '_' || c == '-') {
            flush(i);
            start = i + 1;
            continue;
        }
        if (i == start || !is_upper(c)) {
            continue;
        }
        char prev = name[i - 1];
        bool nextLower = i + 1 < name.size() && is_lower(name[i + 1]);
        if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && nextLower)) {
            flush(i);
            start = i;
        }
    }
    flush(name.size());
    return words;
}

} // namespace naming_detail

inline std::string apply_naming(NamingStrategy strategy, std::string_view name) {
    using namespace naming_detail;
    if (strategy == NamingStrategy::Identity) {
        return std::string(name);
    }
    std::string out;
    out.reserve(name.size() + 4);
    bool first = true;
    for (std::string_view w : split_words(name)) {
        switch (strategy) {
        case NamingStrategy::Snake:
        case NamingStrategy::Kebab:
            if (!first) out.push_back(strategy == NamingStrategy::Snake ? '_' : '-');
            for (char c : w) out.push_back(to_lower(c));
            break;
        case NamingStrategy::LowerCamel:
        case NamingStrategy::UpperCamel:
            for (std::size_t i = 0; i < w.size(); ++i) {
                if (i == 0 && !(first && strategy == NamingStrategy::LowerCamel)) {
                    out.push_back(to_upper(w[i]));
                } else {
                    out.push_back(to_lower(w[i]));
                }
            }
            break;
        case NamingStrategy::Identity:
            break;
        }
        first = false;
    }
    return out;
}

inline void ascii_lower_in_place(std::string & s) {
    for (char & c : s) {
        c = naming_detail::to_lower(c);
    }
}

} // namespace JsonBind
