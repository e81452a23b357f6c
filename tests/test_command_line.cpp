#include <catch2/catch_test_macros.hpp>

#include "command_line.hpp"

#include <string>
#include <vector>

using json = nlohmann::json;
using Args = std::vector<std::string>;

TEST_CASE("livecapctl requests", "[cli]") {

    SECTION("SimpleCommands") {
        REQUIRE(*build_request({"stop"}) == json{{"cmd", "stop"}});
        REQUIRE(*build_request({"status"}) == json{{"cmd", "status"}});
        REQUIRE(*build_request({"devices"}) == json{{"cmd", "devices"}});
    }

    SECTION("StartWithAndWithoutDevice") {
        REQUIRE(*build_request({"start"}) == json{{"cmd", "start"}});
        auto r = build_request({"start", "--device", "alsa_input.usb"});
        REQUIRE(r.has_value());
        REQUIRE((*r)["device"] == "alsa_input.usb");
    }

    SECTION("DeviceSelection") {
        auto r = build_request({"device", "mic"});
        REQUIRE(*r == json{{"cmd", "select_device"}, {"device", "mic"}});

        auto def = build_request({"device"});
        REQUIRE((*def)["device"] == "");
    }

    SECTION("HistoryLimit") {
        REQUIRE((*build_request({"history"}))["limit"] == 10);
        REQUIRE((*build_request({"history", "--limit", "3"}))["limit"] == 3);
        auto search = build_request({"history", "--search", "weather", "--limit", "5"});
        REQUIRE(*search == json{{"cmd", "history"}, {"limit", 5}, {"search", "weather"}});
        REQUIRE_FALSE(build_request({"history", "--limit", "0"}).has_value());
        REQUIRE_FALSE(build_request({"history", "--limit", "many"}).has_value());
    }

    SECTION("SetDisplayOptions") {
        auto r = build_request({"set", "--font", "DejaVu Sans", "--size", "32", "--color",
                                "#ffff00", "--position", "bottom", "--fullscreen", "off",
                                "--history", "0"});
        REQUIRE(r.has_value());
        REQUIRE((*r)["cmd"] == "configure");
        REQUIRE((*r)["font_family"] == "DejaVu Sans");
        REQUIRE((*r)["font_size"] == 32);
        REQUIRE((*r)["text_color"] == "#ffff00");
        REQUIRE((*r)["position"] == "bottom");
        REQUIRE((*r)["fullscreen"] == false);
        REQUIRE((*r)["history_lines"] == 0);
    }

    SECTION("SetRejectsBadValues") {
        REQUIRE_FALSE(build_request({"set"}).has_value());
        REQUIRE_FALSE(build_request({"set", "--position", "left"}).has_value());
        REQUIRE_FALSE(build_request({"set", "--fullscreen", "maybe"}).has_value());
        REQUIRE_FALSE(build_request({"set", "--history", "-1"}).has_value());
        REQUIRE_FALSE(build_request({"set", "--size", "12px"}).has_value());
    }

    SECTION("Errors") {
        REQUIRE(build_request({}).error() == "missing command");
        REQUIRE(build_request({"rewind"}).error() == "unknown command: rewind");
        REQUIRE(build_request({"start", "--device"}).error() == "--device needs a value");
        REQUIRE(build_request({"stop", "--now", "1"}).error() == "unknown option --now");
        REQUIRE(build_request({"status", "extra"}).error() == "unexpected argument 'extra'");
        REQUIRE(build_request({"device", "a", "b"}).error() == "unexpected argument 'b'");
    }
}
