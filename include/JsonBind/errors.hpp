#pragma once

#include <string>
#include <string_view>

namespace JsonBind {

enum class ReaderError {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    EXCESS_CHARACTERS,
    ILLFORMED_NULL,
    ILLFORMED_BOOL,
    ILLFORMED_OBJECT,
    ILLFORMED_STRING,
    ILLFORMED_NUMBER,
    ILLFORMED_ARRAY,
    SKIPPING_STACK_OVERFLOW,
    NESTING_TOO_DEEP,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE
};

constexpr std::string_view error_to_string(ReaderError e) {
    switch(e) {
    case ReaderError::NO_ERROR: return "NO_ERROR"; break;
    case ReaderError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA"; break;
    case ReaderError::EXCESS_CHARACTERS: return "EXCESS_CHARACTERS"; break;
    case ReaderError::ILLFORMED_NULL: return "ILLFORMED_NULL"; break;
    case ReaderError::ILLFORMED_BOOL: return "ILLFORMED_BOOL"; break;
    case ReaderError::ILLFORMED_OBJECT: return "ILLFORMED_OBJECT"; break;
    case ReaderError::ILLFORMED_STRING: return "ILLFORMED_STRING"; break;
    case ReaderError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER"; break;
    case ReaderError::ILLFORMED_ARRAY: return "ILLFORMED_ARRAY"; break;
    case ReaderError::SKIPPING_STACK_OVERFLOW: return "SKIPPING_STACK_OVERFLOW"; break;
    case ReaderError::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP"; break;
    case ReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    }
    return "N/A";
}


enum class DecodeError {
    NO_ERROR,
    READER_ERROR,

    NON_BOOL_JSON_IN_BOOL_VALUE,
    WRONG_JSON_FOR_NUMBER_STORAGE,
    FLOAT_VALUE_IN_INTEGER_STORAGE,
    NON_STRING_IN_STRING_STORAGE,
    NON_ARRAY_IN_ARRAY_LIKE_VALUE,
    NON_OBJECT_IN_MAP_LIKE_VALUE,
    NON_OBJECT_IN_STRUCT,
    ILLFORMED_MAP_KEY,
    FIXED_SIZE_CONTAINER_OVERFLOW,

    EXCESS_FIELD,

    CUSTOM_CODEC_ERROR,
    TRANSFORMER_ERROR,
    BUILD_ERROR
};

constexpr std::string_view error_to_string(DecodeError e) {
    switch(e) {
    case DecodeError::NO_ERROR: return "NO_ERROR"; break;
    case DecodeError::READER_ERROR: return "READER_ERROR"; break;
    case DecodeError::NON_BOOL_JSON_IN_BOOL_VALUE: return "NON_BOOL_JSON_IN_BOOL_VALUE"; break;
    case DecodeError::WRONG_JSON_FOR_NUMBER_STORAGE: return "WRONG_JSON_FOR_NUMBER_STORAGE"; break;
    case DecodeError::FLOAT_VALUE_IN_INTEGER_STORAGE: return "FLOAT_VALUE_IN_INTEGER_STORAGE"; break;
    case DecodeError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE"; break;
    case DecodeError::NON_ARRAY_IN_ARRAY_LIKE_VALUE: return "NON_ARRAY_IN_ARRAY_LIKE_VALUE"; break;
    case DecodeError::NON_OBJECT_IN_MAP_LIKE_VALUE: return "NON_OBJECT_IN_MAP_LIKE_VALUE"; break;
    case DecodeError::NON_OBJECT_IN_STRUCT: return "NON_OBJECT_IN_STRUCT"; break;
    case DecodeError::ILLFORMED_MAP_KEY: return "ILLFORMED_MAP_KEY"; break;
    case DecodeError::FIXED_SIZE_CONTAINER_OVERFLOW: return "FIXED_SIZE_CONTAINER_OVERFLOW"; break;
    case DecodeError::EXCESS_FIELD: return "EXCESS_FIELD"; break;
    case DecodeError::CUSTOM_CODEC_ERROR: return "CUSTOM_CODEC_ERROR"; break;
    case DecodeError::TRANSFORMER_ERROR: return "TRANSFORMER_ERROR"; break;
    case DecodeError::BUILD_ERROR: return "BUILD_ERROR"; break;
    }
    return "N/A";
}


enum class EncodeError {
    NO_ERROR,
    UNSUPPORTED_VALUE,
    INVALID_RAW_JSON,
    NESTING_TOO_DEEP,
    CUSTOM_CODEC_ERROR,
    TRANSFORMER_ERROR,
    BUILD_ERROR
};

constexpr std::string_view error_to_string(EncodeError e) {
    switch(e) {
    case EncodeError::NO_ERROR: return "NO_ERROR"; break;
    case EncodeError::UNSUPPORTED_VALUE: return "UNSUPPORTED_VALUE"; break;
    case EncodeError::INVALID_RAW_JSON: return "INVALID_RAW_JSON"; break;
    case EncodeError::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP"; break;
    case EncodeError::CUSTOM_CODEC_ERROR: return "CUSTOM_CODEC_ERROR"; break;
    case EncodeError::TRANSFORMER_ERROR: return "TRANSFORMER_ERROR"; break;
    case EncodeError::BUILD_ERROR: return "BUILD_ERROR"; break;
    }
    return "N/A";
}


// Coarse classification shared by decode and encode failures.
enum class ErrorKind {
    None,
    Build,
    Syntax,
    TypeMismatch,
    CustomCodec
};

constexpr std::string_view error_to_string(ErrorKind k) {
    switch(k) {
    case ErrorKind::None: return "None"; break;
    case ErrorKind::Build: return "Build"; break;
    case ErrorKind::Syntax: return "Syntax"; break;
    case ErrorKind::TypeMismatch: return "TypeMismatch"; break;
    case ErrorKind::CustomCodec: return "CustomCodec"; break;
    }
    return "N/A";
}

constexpr ErrorKind error_kind(DecodeError e) {
    switch(e) {
    case DecodeError::NO_ERROR:
        return ErrorKind::None;
    case DecodeError::READER_ERROR:
    case DecodeError::ILLFORMED_MAP_KEY:
        return ErrorKind::Syntax;
    case DecodeError::CUSTOM_CODEC_ERROR:
    case DecodeError::TRANSFORMER_ERROR:
        return ErrorKind::CustomCodec;
    case DecodeError::BUILD_ERROR:
        return ErrorKind::Build;
    default:
        return ErrorKind::TypeMismatch;
    }
}

constexpr ErrorKind error_kind(EncodeError e) {
    switch(e) {
    case EncodeError::NO_ERROR:
        return ErrorKind::None;
    case EncodeError::BUILD_ERROR:
        return ErrorKind::Build;
    case EncodeError::UNSUPPORTED_VALUE:
    case EncodeError::NESTING_TOO_DEEP:
        return ErrorKind::TypeMismatch;
    default:
        return ErrorKind::CustomCodec;
    }
}


struct BuildError {
    std::string type_name;
    std::string reason;

    bool empty() const {
        return reason.empty();
    }
};

} // namespace JsonBind
