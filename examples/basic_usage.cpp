// Basic MapFusion usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <MapFusion/from_map.hpp>
#include <MapFusion/to_map.hpp>
#include <MapFusion/error_formatting.hpp>
#include <iostream>
#include <optional>
#include <string>

using namespace MapFusion;
using namespace MapFusion::options;

struct Config {
    std::string app_name;
    int version;
    Annotated<bool, key<"debug">, defaulted> debug_mode = false;

    struct Server {
        std::string host;
        int port;
    };
    Server server;
    std::optional<std::string> motd;
};

int main() {
    Map input{
        {"app_name", "MyApp"},
        {"version", 1},
        {"server", Map{
            {"host", "localhost"},
            {"port", 8080},
        }},
    };

    auto config = FromMap<Config>(input);

    if (!config) {
        std::cout << "Construction error:\n" << ResultToStringWithPath(config) << std::endl;
        return 1;
    }

    std::cout << "Successfully constructed!" << std::endl;
    std::cout << "App: " << config->app_name << std::endl;
    std::cout << "Version: " << config->version << std::endl;
    std::cout << "Debug: " << (config->debug_mode ? "ON" : "OFF") << std::endl;
    std::cout << "Server: " << config->server.host << ":" << config->server.port << std::endl;
    std::cout << "Exported: " << to_string(ToValue(*config)) << std::endl;

    // a port that is not an integer
    input["server"].asMap()["port"] = "eighty";
    auto broken = FromMap<Config>(input);
    std::cout << "\nExpected failure:\n" << ResultToStringWithPath(broken) << std::endl;

    return 0;
}
