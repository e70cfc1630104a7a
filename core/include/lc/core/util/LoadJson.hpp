// LoadJson.hpp - JSON loading and validation utilities
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <initializer_list>
#include <string>

namespace lc::json {

/**
 * Read and parse a JSON file.
 * @throws std::runtime_error if the file is missing, unreadable or not JSON
 */
nlohmann::json load_json_file(const std::filesystem::path& path);

/**
 * Ensure a JSON value is an object and holds no keys outside `known`.
 * @param context Description for error messages (e.g., file path)
 * @throws std::runtime_error naming the first unknown key
 */
void require_known_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> known,
    const std::string& context);

} // namespace lc::json
