#pragma once

#include <cstdint>
#include <string_view>
namespace MapFusion {


enum class MarshalError {
    NO_ERROR,

    MISSING_REQUIRED_FIELD,
    TYPE_MISMATCH,
    UNKNOWN_KEY,

    DUPLICATE_KEY,
    NOT_A_MAP
};

constexpr std::string_view error_to_string(MarshalError e) {
    switch(e) {
    case MarshalError::NO_ERROR: return "NO_ERROR"; break;
    case MarshalError::MISSING_REQUIRED_FIELD: return "MISSING_REQUIRED_FIELD"; break;
    case MarshalError::TYPE_MISMATCH: return "TYPE_MISMATCH"; break;
    case MarshalError::UNKNOWN_KEY: return "UNKNOWN_KEY"; break;
    case MarshalError::DUPLICATE_KEY: return "DUPLICATE_KEY"; break;
    case MarshalError::NOT_A_MAP: return "NOT_A_MAP"; break;
    }
    return "N/A";
}


// ============================================================================
// Schema configuration errors, detected while the field table is built
// ============================================================================

enum class SchemaConfigError : std::uint8_t {
    none,
    duplicate_key,
    conflicting_unknown_key_policies,
    unresolved_cast,
    missing_presence_field,
    presence_field_not_bool
};

constexpr std::string_view config_error_to_string(SchemaConfigError e) {
    switch(e) {
    case SchemaConfigError::none                             : return "none"; break;
    case SchemaConfigError::duplicate_key                    : return "duplicate_key"; break;
    case SchemaConfigError::conflicting_unknown_key_policies : return "conflicting_unknown_key_policies"; break;
    case SchemaConfigError::unresolved_cast                  : return "unresolved_cast"; break;
    case SchemaConfigError::missing_presence_field           : return "missing_presence_field"; break;
    case SchemaConfigError::presence_field_not_bool          : return "presence_field_not_bool"; break;
    }
    return "N/A";
}

} // namespace MapFusion
