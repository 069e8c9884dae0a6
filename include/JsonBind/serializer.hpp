#pragma once

#include <string>

#include "config.hpp"
#include "parse_result.hpp"
#include "type_builder.hpp"

namespace JsonBind {

// Encodes obj into a stream that may already hold output.
template <class T>
void WriteValue(const T & obj, Stream & stream, const FrozenConfig & cfg = ConfigDefault()) {
    ResolveResult codec = cfg.resolve<T>();
    codec.encode(&obj, stream);
}

// Replaces the content of out. On failure out holds the partial output.
template <class T>
SerializeResult Serialize(const T & obj, std::string & out, const FrozenConfig & cfg = ConfigDefault()) {
    out.clear();
    ResolveResult codec = cfg.resolve<T>();
    if (!codec.can_encode()) {
        return SerializeResult(EncodeError::BUILD_ERROR, {}, codec.encode_error());
    }
    Stream stream(out, cfg.stream_options());
    codec.encode(&obj, stream);
    return SerializeResult(stream.error(), stream.custom_message());
}

} // namespace JsonBind
