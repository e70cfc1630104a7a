#include "lc/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace lc::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void require_known_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> known,
    const std::string& context)
{
    if (!json.is_object()) {
        throw std::runtime_error(context + " must be a JSON object");
    }
    for (const auto& item : json.items()) {
        const std::string& key = item.key();
        const bool found = std::any_of(known.begin(), known.end(),
            [&key](const char* k) { return key == k; });
        if (!found) {
            throw std::runtime_error(context + " has unknown field: " + key);
        }
    }
}

} // namespace lc::json
