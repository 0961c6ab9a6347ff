#pragma once
#include <rapidyaml.hpp>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>

#include "value.hpp"
#include "document.hpp"

// Parse errors are reported through exceptions when rapidyaml is built with
// RYML_DEFAULT_CALLBACK_USES_EXCEPTIONS (the CMake target defines it);
// otherwise rapidyaml's default handler aborts on malformed input.

namespace MapFusion {

namespace yaml_detail {

inline std::string_view view(c4::csubstr s) {
    return std::string_view(s.data(), s.size());
}

// JSON-like scalar typing: only true/false are booleans, yes/no/on/off stay strings
inline Value read_scalar(std::string_view s, bool quoted) {
    if(quoted) {
        return Value(std::string(s));
    }
    if(s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") {
        return Value{};
    }
    if(s == "true") return Value(true);
    if(s == "false") return Value(false);

    char first = s.front();
    if((first >= '0' && first <= '9') || first == '-' || first == '.') {
        std::int64_t i{};
        auto [iptr, iec] = std::from_chars(s.data(), s.data() + s.size(), i);
        if(iec == std::errc() && iptr == s.data() + s.size()) {
            return Value(i);
        }
        double d{};
        auto [dptr, dec] = std::from_chars(s.data(), s.data() + s.size(), d);
        if(dec == std::errc() && dptr == s.data() + s.size()) {
            return Value(d);
        }
    }
    return Value(std::string(s));
}

inline Value read_node(ryml::ConstNodeRef node) {
    if(node.is_map()) {
        Map map;
        for(ryml::ConstNodeRef child : node.children()) {
            map.insert_or_assign(std::string(view(child.key())), read_node(child));
        }
        return Value(std::move(map));
    }
    if(node.is_seq()) {
        Array arr;
        arr.reserve(node.num_children());
        for(ryml::ConstNodeRef child : node.children()) {
            arr.push_back(read_node(child));
        }
        return Value(std::move(arr));
    }
    if(!node.has_val()) {
        return Value{};
    }
    return read_scalar(view(node.val()), node.is_val_quoted());
}

inline bool write_float(ryml::NodeRef node, double d) {
    if(!std::isfinite(d)) return false;
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if(ec != std::errc()) return false;
    std::string s(buf, ptr);
    // keep the value a float when read back
    if(s.find_first_of(".e") == std::string::npos) {
        s += ".0";
    }
    node << std::string_view(s);
    return true;
}

inline bool write_node(ryml::NodeRef node, const Value & v) {
    switch(v.kind()) {
    case ValueKind::NIL:
        node << std::string_view("~");
        return true;
    case ValueKind::BOOL:
        node << std::string_view(v.asBool() ? "true" : "false");
        return true;
    case ValueKind::INT: {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v.asInt());
        if(ec != std::errc()) return false;
        node << std::string_view(buf, ptr - buf);
        return true;
    }
    case ValueKind::FLOAT:
        return write_float(node, v.asFloat());
    case ValueKind::STRING:
        node << std::string_view(v.asString());
        node |= ryml::VALQUO;
        return true;
    case ValueKind::TIMESTAMP:
        node << std::string_view(timestamp_to_string(v.asTimestamp()));
        node |= ryml::VALQUO;
        return true;
    case ValueKind::ARRAY:
        node |= ryml::SEQ;
        for(const auto & item : v.asArray()) {
            if(!write_node(node.append_child(), item)) return false;
        }
        return true;
    case ValueKind::MAP:
        node |= ryml::MAP;
        for(const auto & [k, item] : v.asMap()) {
            ryml::NodeRef child = node.append_child();
            child.set_key_serialized(k);
            if(!write_node(child, item)) return false;
        }
        return true;
    }
    return false;
}

} // namespace yaml_detail


/// Parses a single YAML document into a Value tree
inline DocumentResult ReadYaml(std::string_view yaml, Value & out) {
    ryml::Tree tree;
    try {
        tree = ryml::parse_in_arena(c4::csubstr(yaml.data(), yaml.size()));
    } catch (const std::exception & e) {
        return DocumentResult(DocumentError::ILLFORMED_DOCUMENT, 0, e.what());
    }

    ryml::ConstNodeRef root = tree.crootref();
    if(root.is_stream()) {
        if(root.num_children() != 1) {
            return DocumentResult(DocumentError::UNSUPPORTED_VALUE, 0, "multi-document streams are not supported");
        }
        root = root.first_child();
    }
    out = yaml_detail::read_node(root);
    return {};
}

/// Writes a Value tree as YAML. Strings and timestamps are emitted quoted.
inline DocumentResult WriteYaml(const Value & v, std::string & out) {
    ryml::Tree tree;
    if(!yaml_detail::write_node(tree.rootref(), v)) {
        return DocumentResult(DocumentError::UNSUPPORTED_VALUE, 0, "value not representable in YAML");
    }
    out = ryml::emitrs_yaml<std::string>(tree);
    return {};
}

} // namespace MapFusion
