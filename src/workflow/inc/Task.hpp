#pragma once

#include "GitConfig.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct Task {
    std::string id;                          // Unique, filesystem-safe identifier
    std::optional<std::string> description;
    bool enabled = true;
    nlohmann::ordered_json params;           // Arbitrary nested value, null when absent
    std::optional<GitConfig> git;
    std::optional<std::string> handler;      // Overrides the id for handler lookup
    std::optional<std::string> config_error; // Set when the definition could not be decoded

    const std::string& handler_name() const { return handler ? *handler : id; }

    // Description when present, otherwise the id
    const std::string& display_name() const { return description ? *description : id; }
};
