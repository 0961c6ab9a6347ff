#pragma once

#include <optional>
#include <string>
#include <utility>

#include "value.hpp"
#include "path.hpp"
#include "errors.hpp"

namespace MapFusion {

struct ErrorInfo {
    MarshalError error = MarshalError::NO_ERROR;
    std::string  typeName;      // type whose construction failed (innermost for nested objects)
    std::string  field;         // field name, or the input key for UNKNOWN_KEY / DUPLICATE_KEY
    std::string  key;           // map key the field binds to
    std::string  expectedType;  // TYPE_MISMATCH, NOT_A_MAP
    Value        offendingValue;
    path::Path   path;          // keys from the root map
};

template <class T>
class FromMapResult {
    std::optional<T> m_value;
    ErrorInfo m_info;

public:
    using value_type = T;

    FromMapResult(T && value): m_value(std::move(value)) {}
    FromMapResult(ErrorInfo info): m_info(std::move(info)) {}

    operator bool() const {
        return m_info.error == MarshalError::NO_ERROR;
    }
    MarshalError error() const {
        return m_info.error;
    }
    const std::string & typeName() const {
        return m_info.typeName;
    }
    const std::string & field() const {
        return m_info.field;
    }
    const std::string & key() const {
        return m_info.key;
    }
    const std::string & expectedType() const {
        return m_info.expectedType;
    }
    const Value & offendingValue() const {
        return m_info.offendingValue;
    }
    const path::Path & errorPath() const {
        return m_info.path;
    }
    const ErrorInfo & errorInfo() const & {
        return m_info;
    }
    ErrorInfo && errorInfo() && {
        return std::move(m_info);
    }

    T & value() & {
        return m_value.value();
    }
    const T & value() const & {
        return m_value.value();
    }
    T && value() && {
        return std::move(m_value).value();
    }
    T * operator->() {
        return std::addressof(*m_value);
    }
    const T * operator->() const {
        return std::addressof(*m_value);
    }
    T & operator*() & {
        return *m_value;
    }
    const T & operator*() const & {
        return *m_value;
    }
};

// In-place construction reports status only; the target is untouched on failure.
template <>
class FromMapResult<void> {
    ErrorInfo m_info;

public:
    using value_type = void;

    FromMapResult() = default;
    FromMapResult(ErrorInfo info): m_info(std::move(info)) {}

    operator bool() const {
        return m_info.error == MarshalError::NO_ERROR;
    }
    MarshalError error() const {
        return m_info.error;
    }
    const std::string & typeName() const {
        return m_info.typeName;
    }
    const std::string & field() const {
        return m_info.field;
    }
    const std::string & key() const {
        return m_info.key;
    }
    const std::string & expectedType() const {
        return m_info.expectedType;
    }
    const Value & offendingValue() const {
        return m_info.offendingValue;
    }
    const path::Path & errorPath() const {
        return m_info.path;
    }
    const ErrorInfo & errorInfo() const & {
        return m_info;
    }
    ErrorInfo && errorInfo() && {
        return std::move(m_info);
    }
};

} // namespace MapFusion
