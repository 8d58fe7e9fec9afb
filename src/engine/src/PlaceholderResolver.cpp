#include "PlaceholderResolver.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace PlaceholderResolver {

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        if (dot == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

bool is_index(const std::string& segment) {
    return !segment.empty() && std::all_of(segment.begin(), segment.end(),
        [](unsigned char c) { return std::isdigit(c); });
}

}

const nlohmann::ordered_json* lookup(const std::string& path, const nlohmann::ordered_json& root) {
    const nlohmann::ordered_json* current = &root;

    for (const auto& segment : split_path(path)) {
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) return nullptr;
            current = &*it;
        } else if (current->is_array() && is_index(segment)) {
            size_t index = 0;
            try {
                index = std::stoul(segment);
            } catch (const std::out_of_range&) {
                return nullptr;
            }
            if (index >= current->size()) return nullptr;
            current = &(*current)[index];
        } else {
            return nullptr;
        }
    }
    return current;
}

std::string to_text(const nlohmann::ordered_json& value) {
    if (value.is_string()) return value.get<std::string>();

    // Whole floats print without a fraction: 1.0 -> "1"
    if (value.is_number_float()) {
        double number = value.get<double>();
        if (std::isfinite(number) && number == std::trunc(number) && std::fabs(number) < 1e15) {
            return std::to_string(static_cast<long long>(number));
        }
    }
    return value.dump();
}

std::string resolve_string(const std::string& text, const nlohmann::ordered_json& root) {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;

    while (pos < text.size()) {
        size_t start = text.find("${", pos);
        if (start == std::string::npos) break;

        size_t close = text.find('}', start + 2);
        if (close == std::string::npos) break;

        // A reference never spans lines
        size_t newline = text.find('\n', start + 2);
        if (newline != std::string::npos && newline < close) {
            result.append(text, pos, newline + 1 - pos);
            pos = newline + 1;
            continue;
        }

        result.append(text, pos, start - pos);
        const nlohmann::ordered_json* found = lookup(text.substr(start + 2, close - start - 2), root);
        if (found) {
            result += to_text(*found);
        } else {
            result.append(text, start, close + 1 - start);
        }
        pos = close + 1;
    }

    result.append(text, pos, std::string::npos);
    return result;
}

nlohmann::ordered_json resolve(const nlohmann::ordered_json& value, const nlohmann::ordered_json& root) {
    if (value.is_string()) {
        return resolve_string(value.get_ref<const std::string&>(), root);
    }

    if (value.is_array()) {
        nlohmann::ordered_json resolved = nlohmann::ordered_json::array();
        for (const auto& item : value) {
            resolved.push_back(resolve(item, root));
        }
        return resolved;
    }

    if (value.is_object()) {
        nlohmann::ordered_json resolved = nlohmann::ordered_json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            resolved[it.key()] = resolve(it.value(), root);
        }
        return resolved;
    }

    return value;
}

}
