#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Resolves ${dotted.path} references against the configuration document.
// Unresolvable references are left exactly as written.
namespace PlaceholderResolver {

// Strings are substituted, sequences and mappings are walked recursively,
// every other value is returned unchanged. Mapping keys are never touched.
nlohmann::ordered_json resolve(const nlohmann::ordered_json& value, const nlohmann::ordered_json& root);

std::string resolve_string(const std::string& text, const nlohmann::ordered_json& root);

// Walks `root` one dotted segment at a time; sequences accept decimal indices.
// Returns nullptr as soon as a segment is missing.
const nlohmann::ordered_json* lookup(const std::string& path, const nlohmann::ordered_json& root);

// Text used in place of a placeholder
std::string to_text(const nlohmann::ordered_json& value);

}
