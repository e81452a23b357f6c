#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Turns `livecapctl` arguments (command first) into a control request.
std::expected<nlohmann::json, std::string> build_request(const std::vector<std::string>& args);
