#pragma once

#include <string>
#include <string_view>

#include "errors.hpp"
#include "result.hpp"
#include "value.hpp"

namespace MapFusion {

namespace error_formatting_detail {

inline std::string describe(const Value & v) {
    return std::string(kind_to_string(v.kind())) + " " + to_string(v);
}

inline std::string message(const ErrorInfo & info) {
    switch(info.error) {
    case MarshalError::NO_ERROR:
        return "No error";
    case MarshalError::MISSING_REQUIRED_FIELD:
        return "Value for key " + info.key + " is not present, and this field is not nilable and has no default.";
    case MarshalError::TYPE_MISMATCH:
        return "Expected " + info.expectedType + " for key " + info.key + ", got " + describe(info.offendingValue);
    case MarshalError::UNKNOWN_KEY:
        return "Unknown map key: " + info.key;
    case MarshalError::DUPLICATE_KEY:
        return "Duplicate map key after normalization: " + info.key;
    case MarshalError::NOT_A_MAP:
        return "Error: " + std::string(kind_to_string(info.offendingValue.kind()))
            + " is an invalid type, a Map is required";
    }
    return "N/A";
}

}

/// "<message>\n  parsing <TypeName>[#<field>]"
inline std::string ErrorMessage(const ErrorInfo & info) {
    std::string ret = error_formatting_detail::message(info);
    if(info.error == MarshalError::NO_ERROR) {
        return ret;
    }
    ret += "\n  parsing " + info.typeName;
    if(!info.field.empty()) {
        ret += "#" + info.field;
    }
    return ret;
}

template <class T>
std::string ResultToString(const FromMapResult<T> & res) {
    return ErrorMessage(res.errorInfo());
}

/// ErrorMessage plus the key path from the root map
template <class T>
std::string ResultToStringWithPath(const FromMapResult<T> & res) {
    if(res) {
        return ErrorMessage(res.errorInfo());
    }
    return ErrorMessage(res.errorInfo()) + "\n  at " + res.errorPath().toString();
}

} // namespace MapFusion
