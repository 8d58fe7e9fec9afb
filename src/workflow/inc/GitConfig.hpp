#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

// Post-task git actions, always executed in the order add -> commit -> push
struct GitConfig {
    std::vector<std::string> add;                            // Files to stage; a single string becomes one entry
    std::optional<std::variant<std::string, bool>> commit;   // Message, or true for the task description
    bool push = false;

    bool has_add() const { return !add.empty(); }

    bool has_commit() const {
        if (!commit) return false;
        if (const auto* flag = std::get_if<bool>(&*commit)) return *flag;
        return !std::get<std::string>(*commit).empty();
    }
};
