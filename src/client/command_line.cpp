#include "command_line.hpp"

#include <charconv>

using json = nlohmann::json;

namespace {

std::expected<int, std::string> parse_int(const std::string& flag, const std::string& value) {
    int out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::unexpected(flag + " expects a number, got '" + value + "'");
    }
    return out;
}

std::expected<bool, std::string> parse_switch(const std::string& flag, const std::string& value) {
    if (value == "on" || value == "true" || value == "1") return true;
    if (value == "off" || value == "false" || value == "0") return false;
    return std::unexpected(flag + " expects on or off, got '" + value + "'");
}

} // namespace

std::expected<json, std::string> build_request(const std::vector<std::string>& args) {
    if (args.empty()) return std::unexpected("missing command");

    const std::string& command = args[0];

    // Every option takes a value.
    std::vector<std::pair<std::string, std::string>> options;
    std::vector<std::string> positional;
    for (size_t i = 1; i < args.size(); i++) {
        if (args[i].starts_with("--")) {
            if (i + 1 >= args.size()) return std::unexpected(args[i] + " needs a value");
            options.emplace_back(args[i], args[i + 1]);
            ++i;
        } else {
            positional.push_back(args[i]);
        }
    }

    auto reject_extra = [&](size_t max_positional) -> std::expected<void, std::string> {
        if (positional.size() > max_positional) {
            return std::unexpected("unexpected argument '" + positional[max_positional] + "'");
        }
        return {};
    };

    json req;

    if (command == "start") {
        req = {{"cmd", "start"}};
        for (auto& [flag, value] : options) {
            if (flag != "--device") return std::unexpected("unknown option " + flag);
            req["device"] = value;
        }
        if (auto r = reject_extra(0); !r) return std::unexpected(r.error());
        return req;
    }

    if (command == "stop" || command == "status" || command == "devices") {
        if (!options.empty()) return std::unexpected("unknown option " + options[0].first);
        if (auto r = reject_extra(0); !r) return std::unexpected(r.error());
        return json{{"cmd", command}};
    }

    if (command == "device") {
        if (!options.empty()) return std::unexpected("unknown option " + options[0].first);
        if (auto r = reject_extra(1); !r) return std::unexpected(r.error());
        // No id selects the default input.
        return json{{"cmd", "select_device"},
                    {"device", positional.empty() ? std::string() : positional[0]}};
    }

    if (command == "history") {
        req = {{"cmd", "history"}, {"limit", 10}};
        for (auto& [flag, value] : options) {
            if (flag == "--search") {
                req["search"] = value;
                continue;
            }
            if (flag != "--limit") return std::unexpected("unknown option " + flag);
            auto n = parse_int(flag, value);
            if (!n) return std::unexpected(n.error());
            if (*n <= 0) return std::unexpected("--limit must be positive");
            req["limit"] = *n;
        }
        if (auto r = reject_extra(0); !r) return std::unexpected(r.error());
        return req;
    }

    if (command == "set") {
        req = {{"cmd", "configure"}};
        for (auto& [flag, value] : options) {
            if (flag == "--font") {
                req["font_family"] = value;
            } else if (flag == "--size") {
                auto n = parse_int(flag, value);
                if (!n) return std::unexpected(n.error());
                req["font_size"] = *n;
            } else if (flag == "--color") {
                req["text_color"] = value;
            } else if (flag == "--position") {
                if (value != "floating" && value != "top" && value != "bottom") {
                    return std::unexpected("--position expects floating, top or bottom");
                }
                req["position"] = value;
            } else if (flag == "--fullscreen") {
                auto on = parse_switch(flag, value);
                if (!on) return std::unexpected(on.error());
                req["fullscreen"] = *on;
            } else if (flag == "--history") {
                auto n = parse_int(flag, value);
                if (!n) return std::unexpected(n.error());
                if (*n < 0) return std::unexpected("--history must not be negative");
                req["history_lines"] = *n;
            } else {
                return std::unexpected("unknown option " + flag);
            }
        }
        if (auto r = reject_extra(0); !r) return std::unexpected(r.error());
        if (req.size() == 1) return std::unexpected("set needs at least one option");
        return req;
    }

    return std::unexpected("unknown command: " + command);
}
