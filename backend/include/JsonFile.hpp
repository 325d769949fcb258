#pragma once
// JsonFile.hpp
// Crash-safe JSON snapshots: write to `<path>.tmp`, then rename over `path`.

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// `indent` is passed to json::dump (-1 for compact). Errors are logged under
// `[tag]` and reported as false; a failed write leaves `path` untouched.
bool write_json_atomically(const std::string& path, const json& j, int indent, const std::string& tag);
