#pragma once

#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

#include "parse_result.hpp"

namespace JsonBind {

namespace error_formatting_detail {

inline constexpr const char* ws = " \t\n\r\f\v";

inline std::string& rtrim(std::string& s, const char* t = ws)
{
    s.erase(s.find_last_not_of(t) + 1);
    return s;
}

inline std::string& ltrim(std::string& s, const char* t = ws)
{
    s.erase(0, s.find_first_not_of(t));
    return s;
}

inline std::string& trim(std::string& s, const char* t = ws)
{
    return ltrim(rtrim(s, t), t);
}

}

// Human readable description of a failed parse, with the input around the
// error position.
inline std::string ParseResultToString(const ParseResult & res, std::string_view input, std::size_t window = 40) {
    if (res) {
        return "no error";
    }
    if (res.error() == DecodeError::BUILD_ERROR) {
        return fmt::format("cannot decode '{}': {}", res.buildError().type_name, res.buildError().reason);
    }
    const std::size_t pos = res.pos() < input.size() ? res.pos() : input.size();
    const std::size_t from = pos >= window ? pos - window : 0;
    const std::size_t to = pos + window < input.size() ? pos + window : input.size();
    std::string before(input.substr(from, pos - from));
    std::string after(input.substr(pos, to - pos));
    error_formatting_detail::trim(before);
    error_formatting_detail::trim(after);

    std::string detail;
    if (res.error() == DecodeError::READER_ERROR) {
        detail = fmt::format(" ({})", error_to_string(res.readerError()));
    } else if (!res.message().empty()) {
        detail = fmt::format(" ({})", res.message());
    }
    return fmt::format("parsing error '{}'{} at offset {}: '...{} <-- {}...'",
                       error_to_string(res.error()), detail, pos, before, after);
}

inline std::string SerializeResultToString(const SerializeResult & res) {
    if (res) {
        return "no error";
    }
    if (res.error() == EncodeError::BUILD_ERROR && !res.buildError().empty()) {
        return fmt::format("cannot encode '{}': {}", res.buildError().type_name, res.buildError().reason);
    }
    if (!res.message().empty()) {
        return fmt::format("serialization error '{}' ({})", error_to_string(res.error()), res.message());
    }
    return fmt::format("serialization error '{}'", error_to_string(res.error()));
}

} // namespace JsonBind
