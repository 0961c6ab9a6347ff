#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace MapFusion {
namespace path {

// Keys from the root map down to the value being marshaled. Elements are
// owned strings: input keys are normalized copies, so nothing static to point at.
struct Path {
    std::vector<std::string> storage;

    void push_child(std::string_view key) {
        storage.emplace_back(key);
    }
    void pop() {
        storage.pop_back();
    }
    std::size_t size() const {
        return storage.size();
    }
    bool empty() const {
        return storage.empty();
    }

    // "$.location.note.message"
    std::string toString() const {
        std::string ret = "$";
        for(const auto & el : storage) {
            ret += "." + el;
        }
        return ret;
    }

    friend bool operator==(const Path&, const Path&) = default;
};

} // namespace path
} // namespace MapFusion
