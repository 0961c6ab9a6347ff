// The three unknown-key policies side by side
// Compile: g++ -std=c++23 -I../include unknown_keys.cpp -o unknown_keys

#include <MapFusion/from_map.hpp>
#include <MapFusion/to_map.hpp>
#include <MapFusion/error_formatting.hpp>
#include <iostream>
#include <string>

using namespace MapFusion;
using namespace MapFusion::options;

// Extra keys are dropped
struct Lenient {
    std::string id;
};

// Extra keys are an error
struct Strict {
    std::string id;
};
template<> struct MapFusion::Annotated<Strict> {
    using Options = OptionsPack<options::strict>;
};

// Extra keys are kept and written back
struct Preserving {
    std::string id;
    Unmapped<>  rest;
};

int main() {
    const Map input{{"id", "42"}, {"color", "teal"}, {"size", 3}};

    auto lenient = FromMap<Lenient>(input);
    std::cout << "Lenient:    " << to_string(ToValue(*lenient)) << std::endl;

    auto strict = FromMap<Strict>(input);
    std::cout << "Strict:     " << ResultToString(strict) << std::endl;

    auto preserving = FromMap<Preserving>(input);
    std::cout << "Preserving: " << to_string(ToValue(*preserving))
              << " (" << preserving->rest.size() << " captured)" << std::endl;
    return 0;
}
