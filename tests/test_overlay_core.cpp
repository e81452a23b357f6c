#include <catch2/catch_test_macros.hpp>

#include "mocks.hpp"
#include "overlay_core.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>

using json = nlohmann::json;
using Steps = std::vector<ScriptedRecognizer::Step>;

namespace {

Config quiet_config() {
    Config c;
    c.history.enabled = false;
    c.pipeline.autostart = false;
    return c;
}

struct Harness {
    MockAudioSource source{{{"mic", "Test Microphone"}, {"usb", "USB Headset"}}};
    RecordingDisplay display;
    std::atomic<int> notified{0};
    OverlayCore core;

    explicit Harness(Config config = quiet_config(), std::string config_path = {})
        : core(std::move(config), std::move(config_path), false, source, display,
               [this] { ++notified; }) {
        core.init();
    }

    // Loads a scripted recognizer and waits until it is attached.
    bool load(Steps steps = {}) {
        core.load_model([steps](std::stop_token)
                            -> std::expected<std::unique_ptr<Recognizer>, CaptionError> {
            return std::make_unique<ScriptedRecognizer>(steps);
        });
        return wait_until([&] {
            core.on_notify();
            return core.model_state() != ModelState::Loading;
        });
    }

    json send(const json& cmd) { return core.handle_command(cmd); }

    bool shown(const std::string& text) {
        return wait_until([&] {
            core.on_notify();
            return !display.texts.empty() && display.texts.back() == text;
        });
    }
};

std::string tmp_path(const std::string& stem) {
    return (std::filesystem::temp_directory_path() /
            (stem + std::to_string(getpid()))).string();
}

} // namespace

TEST_CASE("Model loading", "[core]") {

    SECTION("InitConfiguresDisplay") {
        Harness h;
        REQUIRE(h.display.configures == 1);
        REQUIRE(h.display.texts == std::vector<std::string>{""});
        REQUIRE(h.core.model_state() == ModelState::Idle);
    }

    SECTION("StartBeforeModelIsRejected") {
        Harness h;
        auto resp = h.send({{"cmd", "start"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "model_missing");
        REQUIRE(h.source.opens() == 0);
    }

    SECTION("AutostartAfterLoad") {
        Config c = quiet_config();
        c.pipeline.autostart = true;
        c.audio.device = "usb";
        Harness h(c);

        REQUIRE(h.load());
        REQUIRE(h.core.model_state() == ModelState::Ready);
        REQUIRE(h.core.pipeline_status().state == PipelineState::Running);
        REQUIRE(h.source.last_device() == "usb");
    }

    SECTION("NoAutostartWhenDisabled") {
        Harness h;
        REQUIRE(h.load());
        REQUIRE(h.core.pipeline_status().state == PipelineState::Stopped);
        REQUIRE(h.source.opens() == 0);
    }

    SECTION("LoadFailureIsReported") {
        Harness h;
        h.core.load_model([](std::stop_token)
                              -> std::expected<std::unique_ptr<Recognizer>, CaptionError> {
            return std::unexpected(CaptionError{CaptionErrc::ModelMissing, "archive missing"});
        });
        REQUIRE(wait_until([&] {
            h.core.on_notify();
            return h.core.model_state() != ModelState::Loading;
        }));

        REQUIRE(h.core.model_state() == ModelState::Failed);
        auto status = h.send({{"cmd", "status"}});
        REQUIRE(status["model"] == "failed");
        REQUIRE(status["model_error"] == "archive missing");
    }
}

TEST_CASE("Control commands", "[core]") {

    SECTION("StartStop") {
        Harness h;
        REQUIRE(h.load());

        auto started = h.send({{"cmd", "start"}});
        REQUIRE(started["status"] == "ok");
        REQUIRE(started["state"] == "running");

        auto again = h.send({{"cmd", "start"}});
        REQUIRE(again["code"] == "already_running");

        auto stopped = h.send({{"cmd", "stop"}});
        REQUIRE(stopped["state"] == "stopped");
        REQUIRE(h.source.closes() == 1);
    }

    SECTION("StartOnUnknownDevice") {
        Harness h;
        REQUIRE(h.load());
        auto resp = h.send({{"cmd", "start"}, {"device", "hdmi"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "device_error");
        REQUIRE(h.core.pipeline_status().state == PipelineState::Stopped);
    }

    SECTION("CaptionsReachTheDisplay") {
        Harness h;
        REQUIRE(h.load({ScriptedRecognizer::partial("hello"),
                        ScriptedRecognizer::final("hello world"),
                        ScriptedRecognizer::partial("next")}));
        REQUIRE(h.send({{"cmd", "start"}})["status"] == "ok");

        h.source.push_frames(3);
        REQUIRE(h.shown("next"));
        REQUIRE(h.display.history == std::vector<std::string>{"hello world"});

        auto status = h.send({{"cmd", "status"}});
        REQUIRE(status["caption"] == "next");
        REQUIRE(status["utterance_open"] == true);
        REQUIRE(status["frames"] == 3);
        REQUIRE(status["utterances"] == 1);
    }

    SECTION("DeviceLossShowsInStatus") {
        Harness h;
        REQUIRE(h.load());
        REQUIRE(h.send({{"cmd", "start"}, {"device", "mic"}})["status"] == "ok");

        h.source.lose("device unplugged");
        REQUIRE(wait_until([&] {
            h.core.on_notify();
            return h.core.pipeline_status().state == PipelineState::Errored;
        }));

        auto status = h.send({{"cmd", "status"}});
        REQUIRE(status["state"] == "errored");
        REQUIRE(status["reason"] == "device unplugged");

        // Starting again recovers.
        REQUIRE(h.send({{"cmd", "start"}, {"device", "mic"}})["status"] == "ok");
        REQUIRE(h.core.pipeline_status().state == PipelineState::Running);
    }

    SECTION("ListDevices") {
        Harness h;
        auto resp = h.send({{"cmd", "devices"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["devices"].size() == 2);
        REQUIRE(resp["devices"][1]["id"] == "usb");
        REQUIRE(resp["devices"][1]["name"] == "USB Headset");
        REQUIRE(resp["selected"] == "");
    }

    SECTION("SelectDevicePersists") {
        auto path = tmp_path("lc_test_core_config_");
        {
            Harness h(quiet_config(), path);
            auto resp = h.send({{"cmd", "select_device"}, {"device", "usb"}});
            REQUIRE(resp["status"] == "ok");
            REQUIRE(h.core.config().audio.device == "usb");

            auto bad = h.send({{"cmd", "select_device"}, {"device", "hdmi"}});
            REQUIRE(bad["code"] == "device_error");
            REQUIRE(h.core.config().audio.device == "usb");
        }
        REQUIRE(Config::load(path).audio.device == "usb");
        std::filesystem::remove(path);
    }

    SECTION("SelectedDeviceUsedOnNextStart") {
        Harness h;
        REQUIRE(h.load());
        REQUIRE(h.send({{"cmd", "select_device"}, {"device", "usb"}})["status"] == "ok");
        REQUIRE(h.send({{"cmd", "start"}})["device"] == "usb");
        REQUIRE(h.source.last_device() == "usb");
    }

    SECTION("ConfigureDisplay") {
        auto path = tmp_path("lc_test_core_display_");
        {
            Harness h(quiet_config(), path);
            auto resp = h.send({{"cmd", "configure"}, {"font_size", 40}, {"position", "top"}});
            REQUIRE(resp["status"] == "ok");
            REQUIRE(resp["display"]["font_size"] == 40);
            REQUIRE(resp["display"]["position"] == "top");
            REQUIRE(resp["display"]["font_family"] == "Helvetica");

            REQUIRE(h.display.configures == 2);
            REQUIRE(h.display.settings.font_size == 40);
            REQUIRE(h.display.settings.mode == DockMode::DockTop);
        }
        auto saved = Config::load(path);
        REQUIRE(saved.display.font_size == 40);
        REQUIRE(saved.display.mode == DockMode::DockTop);
        std::filesystem::remove(path);
    }

    SECTION("RunOverridesAreNotPersisted") {
        auto path = tmp_path("lc_test_core_overrides_");
        {
            Config on_disk;
            on_disk.pipeline.autostart = true;
            on_disk.display.font_family = "DejaVu Sans";
            REQUIRE(on_disk.save(path));
        }

        // As if started with --device usb --no-autostart.
        Config c = Config::load(path);
        c.history.enabled = false;
        c.audio.device = "usb";
        c.pipeline.autostart = false;
        {
            Harness h(c, path);
            REQUIRE(h.send({{"cmd", "configure"}, {"fullscreen", true}})["status"] == "ok");
        }

        auto saved = Config::load(path);
        REQUIRE(saved.display.fullscreen);
        REQUIRE(saved.display.font_family == "DejaVu Sans");
        REQUIRE(saved.audio.device.empty());
        REQUIRE(saved.pipeline.autostart);
        std::filesystem::remove(path);
    }

    SECTION("HistoryFromCaptionLog") {
        auto db_path = tmp_path("lc_test_core_db_") + ".sqlite";
        Config c = quiet_config();
        c.history.enabled = true;
        c.history.path = db_path;
        {
            Harness h(c);
            REQUIRE(h.load({ScriptedRecognizer::final("first line"),
                            ScriptedRecognizer::final("second line")}));
            REQUIRE(h.send({{"cmd", "start"}, {"device", "mic"}})["status"] == "ok");
            h.source.push_frames(2);

            json resp;
            REQUIRE(wait_until([&] {
                resp = h.send({{"cmd", "history"}, {"limit", 5}});
                return resp["entries"].size() == 2;
            }));
            REQUIRE(resp["entries"][0]["text"] == "second line");
            REQUIRE(resp["entries"][0]["device"] == "mic");
            REQUIRE(resp["entries"][1]["text"] == "first line");

            auto filtered = h.send({{"cmd", "history"}, {"search", "first"}});
            REQUIRE(filtered["entries"].size() == 1);
            REQUIRE(filtered["entries"][0]["text"] == "first line");
        }
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
    }

    SECTION("RefusedStartKeepsLoggedDevice") {
        auto db_path = tmp_path("lc_test_core_refused_") + ".sqlite";
        Config c = quiet_config();
        c.history.enabled = true;
        c.history.path = db_path;
        {
            Harness h(c);
            REQUIRE(h.load({ScriptedRecognizer::final("still the mic")}));
            REQUIRE(h.send({{"cmd", "start"}, {"device", "mic"}})["status"] == "ok");

            auto again = h.send({{"cmd", "start"}, {"device", "usb"}});
            REQUIRE(again["code"] == "already_running");
            REQUIRE(h.source.last_device() == "mic");

            h.source.push_frames(1);
            json resp;
            REQUIRE(wait_until([&] {
                resp = h.send({{"cmd", "history"}});
                return resp["entries"].size() == 1;
            }));
            REQUIRE(resp["entries"][0]["text"] == "still the mic");
            REQUIRE(resp["entries"][0]["device"] == "mic");
        }
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
    }

    SECTION("HistoryWithLogDisabled") {
        Harness h;
        auto resp = h.send({{"cmd", "history"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["entries"].empty());
    }

    SECTION("BadRequests") {
        Harness h;
        REQUIRE(h.send(json::array({"start"}))["message"] == "invalid request");
        REQUIRE(h.send({{"cmd", "rewind"}})["message"] == "unknown command");
        REQUIRE(h.send(json::object())["message"] == "unknown command");

        auto wrong_type = h.send({{"cmd", "history"}, {"limit", "ten"}});
        REQUIRE(wrong_type["status"] == "error");
        REQUIRE(wrong_type["message"].get<std::string>().starts_with("invalid request"));
    }
}
