#pragma once
#include <yyjson.h>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "value.hpp"
#include "document.hpp"

namespace MapFusion {

namespace yyjson_detail {

struct DocDeleter {
    void operator()(yyjson_doc * doc) const noexcept { yyjson_doc_free(doc); }
};
struct MutDocDeleter {
    void operator()(yyjson_mut_doc * doc) const noexcept { yyjson_mut_doc_free(doc); }
};

inline bool read_node(yyjson_val * node, Value & out) {
    switch(yyjson_get_type(node)) {
    case YYJSON_TYPE_NULL:
        out = Value{};
        return true;
    case YYJSON_TYPE_BOOL:
        out = Value(yyjson_get_bool(node) != 0);
        return true;
    case YYJSON_TYPE_NUM:
        if(yyjson_is_sint(node)) {
            out = Value(yyjson_get_sint(node));
        } else if(yyjson_is_uint(node)) {
            std::uint64_t u = yyjson_get_uint(node);
            if(u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return false;
            }
            out = Value(static_cast<std::int64_t>(u));
        } else {
            out = Value(yyjson_get_real(node));
        }
        return true;
    case YYJSON_TYPE_STR:
        out = Value(std::string(yyjson_get_str(node), yyjson_get_len(node)));
        return true;
    case YYJSON_TYPE_ARR: {
        Array arr;
        arr.reserve(yyjson_arr_size(node));
        yyjson_arr_iter it = yyjson_arr_iter_with(node);
        while(yyjson_val * item = yyjson_arr_iter_next(&it)) {
            Value v;
            if(!read_node(item, v)) return false;
            arr.push_back(std::move(v));
        }
        out = Value(std::move(arr));
        return true;
    }
    case YYJSON_TYPE_OBJ: {
        Map map;
        yyjson_obj_iter it = yyjson_obj_iter_with(node);
        while(yyjson_val * key = yyjson_obj_iter_next(&it)) {
            Value v;
            if(!read_node(yyjson_obj_iter_get_val(key), v)) return false;
            map.insert_or_assign(std::string(yyjson_get_str(key), yyjson_get_len(key)), std::move(v));
        }
        out = Value(std::move(map));
        return true;
    }
    default:
        return false;
    }
}

inline yyjson_mut_val * write_node(yyjson_mut_doc * doc, const Value & v) {
    switch(v.kind()) {
    case ValueKind::NIL:
        return yyjson_mut_null(doc);
    case ValueKind::BOOL:
        return yyjson_mut_bool(doc, v.asBool());
    case ValueKind::INT:
        return yyjson_mut_sint(doc, v.asInt());
    case ValueKind::FLOAT:
        if(!std::isfinite(v.asFloat())) return nullptr;
        return yyjson_mut_real(doc, v.asFloat());
    case ValueKind::STRING:
        return yyjson_mut_strncpy(doc, v.asString().data(), v.asString().size());
    case ValueKind::TIMESTAMP: {
        std::string s = timestamp_to_string(v.asTimestamp());
        return yyjson_mut_strncpy(doc, s.data(), s.size());
    }
    case ValueKind::ARRAY: {
        yyjson_mut_val * arr = yyjson_mut_arr(doc);
        for(const auto & item : v.asArray()) {
            yyjson_mut_val * child = write_node(doc, item);
            if(!child || !yyjson_mut_arr_add_val(arr, child)) return nullptr;
        }
        return arr;
    }
    case ValueKind::MAP: {
        yyjson_mut_val * obj = yyjson_mut_obj(doc);
        for(const auto & [k, item] : v.asMap()) {
            yyjson_mut_val * key = yyjson_mut_strncpy(doc, k.data(), k.size());
            yyjson_mut_val * child = write_node(doc, item);
            if(!key || !child || !yyjson_mut_obj_add(obj, key, child)) return nullptr;
        }
        return obj;
    }
    }
    return nullptr;
}

} // namespace yyjson_detail


/// Parses JSON text into a Value tree. Duplicate object keys keep the last value.
inline DocumentResult ReadJson(std::string_view json, Value & out) {
    yyjson_read_err err{};
    std::unique_ptr<yyjson_doc, yyjson_detail::DocDeleter> doc(
        yyjson_read_opts(const_cast<char *>(json.data()), json.size(), YYJSON_READ_NOFLAG, nullptr, &err));
    if(!doc) {
        return DocumentResult(DocumentError::ILLFORMED_DOCUMENT, err.pos, err.msg ? err.msg : "");
    }
    Value v;
    if(!yyjson_detail::read_node(yyjson_doc_get_root(doc.get()), v)) {
        return DocumentResult(DocumentError::UNSUPPORTED_VALUE, 0, "integer out of int64 range");
    }
    out = std::move(v);
    return {};
}

/// Writes a Value tree as JSON. Timestamps become ISO-8601 strings;
/// non-finite floats cannot be represented.
inline DocumentResult WriteJson(const Value & v, std::string & out, bool pretty = false) {
    std::unique_ptr<yyjson_mut_doc, yyjson_detail::MutDocDeleter> doc(yyjson_mut_doc_new(nullptr));
    if(!doc) {
        return DocumentResult(DocumentError::WRITER_ERROR);
    }
    yyjson_mut_val * root = yyjson_detail::write_node(doc.get(), v);
    if(!root) {
        return DocumentResult(DocumentError::UNSUPPORTED_VALUE, 0, "value not representable in JSON");
    }
    yyjson_mut_doc_set_root(doc.get(), root);

    yyjson_write_err err{};
    std::size_t len = 0;
    char * text = yyjson_mut_write_opts(doc.get(), pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG,
                                        nullptr, &len, &err);
    if(!text) {
        return DocumentResult(DocumentError::WRITER_ERROR, 0, err.msg ? err.msg : "");
    }
    out.assign(text, len);
    std::free(text);
    return {};
}

} // namespace MapFusion
