// Attaching marshaling metadata to types you cannot (or do not want to) edit
// Compile: g++ -std=c++23 -I../include external_meta.cpp -o external_meta

#include <MapFusion/from_map.hpp>
#include <MapFusion/to_map.hpp>
#include <MapFusion/error_formatting.hpp>
#include <iostream>
#include <string>

using namespace MapFusion;

// A third-party style aggregate: field names do not match the wire keys
struct UserRecord {
    std::string user_name;
    int         login_count = 0;
    std::string session_token;
};

template<> struct MapFusion::AnnotatedField<UserRecord, 0> {
    using Options = OptionsPack<options::key<"userName">>;
};
template<> struct MapFusion::AnnotatedField<UserRecord, 1> {
    using Options = OptionsPack<options::key<"logins">, options::defaulted>;
};
template<> struct MapFusion::AnnotatedField<UserRecord, 2> {
    using Options = OptionsPack<options::ignore_on_write>;
};
template<> struct MapFusion::Annotated<UserRecord> {
    using Options = OptionsPack<options::strict, options::type_name<"User">>;
};

// A class with invariants and private members
class Temperature {
    double kelvin_ = 0;
    friend struct MapFusion::StructMeta<Temperature>;
public:
    Temperature() = default;
    double celsius() const { return kelvin_ - 273.15; }
};

template<> struct MapFusion::StructMeta<Temperature> {
    using Fields = StructFields<
        Field<&Temperature::kelvin_, "kelvin", options::key<"K">>
    >;
};

int main() {
    auto user = FromMap<UserRecord>(Map{{"userName", "ada"}, {"session_token", "s3cr3t"}});
    if (!user) {
        std::cout << ResultToString(user) << std::endl;
        return 1;
    }
    std::cout << "User: " << user->user_name << ", logins: " << user->login_count << std::endl;
    std::cout << "Exported (no token): " << to_string(ToValue(*user)) << std::endl;

    auto rejected = FromMap<UserRecord>(Map{{"userName", "ada"}, {"admin", true}});
    std::cout << "Strict type:\n" << ResultToString(rejected) << std::endl;

    auto t = FromMap<Temperature>(Map{{"K", 300}});
    if (!t) {
        std::cout << ResultToString(t) << std::endl;
        return 1;
    }
    std::cout << "Temperature: " << t->celsius() << " C" << std::endl;
    return 0;
}
