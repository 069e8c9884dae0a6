#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"
#include "const_string.hpp"

namespace JsonBind {

namespace options {

namespace detail {

struct not_json_tag{};
struct key_tag{};
struct omit_empty_tag{};
struct read_only_tag{};
struct write_only_tag{};

}

// Field is invisible to JSON in both directions.
struct not_json {
    using tag = detail::not_json_tag;
    static constexpr std::string_view to_string() {
        return "not_json";
    }
};

// Explicit wire name. Exempt from naming strategies and private-name rules.
template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ JsonBind ]]] key is empty or contains characters that need escaping");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

// Skip the field on encode when its value is empty: false, 0, "", empty
// sequence or map, null optional.
struct omit_empty {
    using tag = detail::omit_empty_tag;
    static constexpr std::string_view to_string() {
        return "omit_empty";
    }
};

// Encoded, ignored on decode.
struct read_only {
    using tag = detail::read_only_tag;
    static constexpr std::string_view to_string() {
        return "read_only";
    }
};

// Decoded, never encoded.
struct write_only {
    using tag = detail::write_only_tag;
    static constexpr std::string_view to_string() {
        return "write_only";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};

template<class Field>
struct annotation_meta {
    using value_t = Field;
    using options      = field_options<OptionsPack<>>;
    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ JsonBind ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ JsonBind ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t = T;
    using options      = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

} // namespace detail

} // namespace options

} // namespace JsonBind
