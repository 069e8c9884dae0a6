#pragma once

#include <string_view>

#include "config.hpp"
#include "parse_result.hpp"
#include "type_builder.hpp"

namespace JsonBind {

template<class T>
ResolveResult Resolve(const FrozenConfig & cfg = ConfigDefault()) {
    return cfg.resolve<T>();
}

// Decodes one value from an iterator positioned before it. Leaves the
// iterator after the value, so hand-written decoders can nest calls.
template <class T>
void ReadValue(T & obj, Iterator & iter, const FrozenConfig & cfg = ConfigDefault()) {
    ResolveResult codec = cfg.resolve<T>();
    codec.decode(&obj, iter);
}

template <class T>
ParseResult ParseWithIterator(T & obj, Iterator & iter, const FrozenConfig & cfg = ConfigDefault()) {
    ResolveResult codec = cfg.resolve<T>();
    if (!codec.can_decode()) {
        iter.set_error(DecodeError::BUILD_ERROR);
        return ParseResult(DecodeError::BUILD_ERROR, ReaderError::NO_ERROR, iter.offset(), {}, codec.decode_error());
    }
    codec.decode(&obj, iter);
    if (iter.ok()) {
        iter.finish();
    }
    const std::size_t pos = iter.error_pos() ? static_cast<std::size_t>(iter.error_pos() - iter.begin()) : iter.offset();
    return ParseResult(iter.error(), iter.reader_error(), pos, iter.custom_message());
}

template <class T>
ParseResult Parse(T & obj, std::string_view input, const FrozenConfig & cfg = ConfigDefault()) {
    Iterator iter(input, cfg.options().max_skip_depth, cfg.options().max_depth);
    return ParseWithIterator(obj, iter, cfg);
}

} // namespace JsonBind
