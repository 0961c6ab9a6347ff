#pragma once

#include <MapFusion/from_map.hpp>
#include <MapFusion/to_map.hpp>
#include <MapFusion/error_formatting.hpp>
#include <string_view>
#include <cstddef>
#include <pfr.hpp>

namespace TestHelpers {

// ============================================================================
// Construction Helpers
// ============================================================================

/// Check that construction succeeds, leaving the result in obj
template<typename T, typename M>
bool ConstructSucceeds(T& obj, const M& input) {
    return static_cast<bool>(MapFusion::FromMap(obj, input));
}

/// Check that construction fails (any error)
template<typename T, typename M>
bool ConstructFails(const M& input) {
    return !MapFusion::FromMap<T>(input);
}

/// Check that construction fails with a specific error code
template<typename T, typename M>
bool ConstructFailsWith(const M& input, MapFusion::MarshalError expected) {
    auto result = MapFusion::FromMap<T>(input);
    return !result && result.error() == expected;
}

/// Check error code and the reported field
template<typename T, typename M>
bool ConstructFailsAt(const M& input, MapFusion::MarshalError expected, std::string_view field) {
    auto result = MapFusion::FromMap<T>(input);
    return !result && result.error() == expected && result.field() == field;
}

/// Check the key path of the reported error, e.g. "$.location.note.message"
template<typename T, typename M>
bool ConstructFailsWithPath(const M& input, std::string_view path) {
    auto result = MapFusion::FromMap<T>(input);
    return !result && result.errorPath().toString() == path;
}

// ============================================================================
// Round Trip Helpers
// ============================================================================

/// ToMap output equals the expected map
template<typename T>
bool ExportsAs(const T& obj, const MapFusion::Map& expected) {
    return MapFusion::ToMap(obj) == expected;
}

/// FromMap(ToMap(obj)) reproduces obj, compared with eq
template<typename T, typename Eq>
bool RoundTrips(const T& obj, Eq eq) {
    auto back = MapFusion::FromMap<T>(MapFusion::ToMap(obj));
    return back && eq(*back, obj);
}

/// FromMap(ToMap(obj)) reproduces obj field-for-field (plain aggregates)
template<typename T>
bool RoundTrips(const T& obj) {
    return RoundTrips(obj, [](const T& a, const T& b) { return pfr::eq_fields(a, b); });
}

/// Map -> object -> map reproduces the input
template<typename T>
bool MapRoundTrips(const MapFusion::Map& input) {
    auto obj = MapFusion::FromMap<T>(input);
    return obj && MapFusion::ToMap(*obj) == input;
}

} // namespace TestHelpers
