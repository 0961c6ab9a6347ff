// JSON text <-> Value tree <-> struct, using the yyjson bridge
// Compile: g++ -std=c++23 -I../include json_document.cpp -lyyjson -o json_document

#include <MapFusion/yyjson.hpp>
#include <MapFusion/from_map.hpp>
#include <MapFusion/to_map.hpp>
#include <MapFusion/error_formatting.hpp>
#include <iostream>
#include <optional>
#include <string>

using namespace MapFusion;
using namespace MapFusion::options;

struct Motor {
    Annotated<int, key<"rpm">>       speed = 0;
    Annotated<bool, defaulted>       reversed = false;
};

struct Robot {
    std::string            name;
    Motor                  left;
    Motor                  right;
    std::optional<double>  battery;
    Unmapped<>             vendor;
};

int main() {
    const char* json = R"({
        "name": "rover",
        "left":  {"rpm": 1200},
        "right": {"rpm": 1180, "reversed": true},
        "battery": 0.82,
        "firmware": "2.4.1"
    })";

    Value doc;
    if (auto r = ReadJson(json, doc); !r) {
        std::cout << "JSON error at " << r.pos() << ": " << r.message() << std::endl;
        return 1;
    }

    auto robot = FromValue<Robot>(doc);
    if (!robot) {
        std::cout << ResultToStringWithPath(robot) << std::endl;
        return 1;
    }
    std::cout << robot->name << ": left " << robot->left.speed.value
              << " rpm, right " << robot->right.speed.value << " rpm"
              << (robot->right.reversed ? " (reversed)" : "") << std::endl;

    robot->battery.reset();
    std::string out;
    if (auto w = WriteJson(ToValue(*robot), out, true); !w) {
        std::cout << "Write error: " << document_error_to_string(w.error()) << std::endl;
        return 1;
    }
    std::cout << out << std::endl;
    return 0;
}
