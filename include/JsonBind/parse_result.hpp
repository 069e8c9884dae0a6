#pragma once

#include <cstddef>
#include <string>

#include "errors.hpp"

namespace JsonBind {

class ParseResult {
    DecodeError m_error = DecodeError::NO_ERROR;
    ReaderError m_readerError = ReaderError::NO_ERROR;
    std::size_t m_pos = 0;
    std::string m_message;
    BuildError m_buildError;

public:
    ParseResult() = default;
    ParseResult(DecodeError err, ReaderError rerr, std::size_t pos, std::string message, BuildError buildError = {}):
        m_error(err), m_readerError(rerr), m_pos(pos), m_message(std::move(message)), m_buildError(std::move(buildError))
    {}
    operator bool() const {
        return m_error == DecodeError::NO_ERROR;
    }
    // Offset into the input where the error was detected.
    std::size_t pos() const {
        return m_pos;
    }
    DecodeError error() const {
        return m_error;
    }
    ReaderError readerError() const {
        return m_readerError;
    }
    ErrorKind kind() const {
        return error_kind(m_error);
    }
    // Set by custom codecs reporting their own failure.
    const std::string& message() const {
        return m_message;
    }
    const BuildError& buildError() const {
        return m_buildError;
    }
};

class SerializeResult {
    EncodeError m_error = EncodeError::NO_ERROR;
    std::string m_message;
    BuildError m_buildError;

public:
    SerializeResult() = default;
    SerializeResult(EncodeError err, std::string message, BuildError buildError = {}):
        m_error(err), m_message(std::move(message)), m_buildError(std::move(buildError))
    {}
    operator bool() const {
        return m_error == EncodeError::NO_ERROR;
    }
    EncodeError error() const {
        return m_error;
    }
    ErrorKind kind() const {
        return error_kind(m_error);
    }
    const std::string& message() const {
        return m_message;
    }
    const BuildError& buildError() const {
        return m_buildError;
    }
};

} // namespace JsonBind
