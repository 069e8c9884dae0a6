// Basic JsonBind usage example

#include <JsonBind/json_bind.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

using namespace JsonBind;
using namespace JsonBind::options;

using Clock = std::chrono::system_clock;

struct AppConfig {
    std::string app_name;
    int version = 0;
    bool debug_mode = false;

    struct Server {
        std::string host;
        int port = 0;
    };
    Server server;

    Annotated<std::vector<std::string>, key<"tags">, omit_empty> labels;
    Annotated<std::string, write_only> password;
    Clock::time_point started;
};

int main() {
    spdlog::set_level(spdlog::level::debug);

    // time points have no JSON shape of their own
    RegisterTypeEncoder<Clock::time_point>([](const Clock::time_point & t, Stream & stream) {
        stream.write_int(std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count());
    });
    RegisterTypeDecoder<Clock::time_point>([](Clock::time_point & t, Iterator & iter) {
        t = Clock::time_point(std::chrono::seconds(iter.read_int<std::int64_t>()));
    });

    const std::string_view json = R"({
        "app_name": "MyApp",
        "version": 1,
        "debug_mode": true,
        "server": {
            "host": "localhost",
            "port": 8080
        },
        "password": "hunter2",
        "started": 1700000000
    })";

    AppConfig config;
    auto result = Parse(config, json);
    if (!result) {
        std::cout << ParseResultToString(result, json) << std::endl;
        return 1;
    }

    std::cout << "App: " << config.app_name << std::endl;
    std::cout << "Server: " << config.server.host << ":" << config.server.port << std::endl;

    std::string out;
    auto written = Serialize(config, out, Config{.naming = NamingStrategy::UpperCamel}.freeze());
    if (!written) {
        std::cout << SerializeResultToString(written) << std::endl;
        return 1;
    }
    std::cout << out << std::endl;
    return 0;
}
