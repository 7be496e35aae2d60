//
// Settings Store Implementation
//

#include "settings_store.hh"

#include <failsafe/failsafe.hh>
#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace font_demo {

stored_settings load_settings(const std::filesystem::path& path) {
    stored_settings settings;
    if (!std::filesystem::exists(path)) {
        LOG_INFO("No settings file at", path.string(), "- using defaults");
        return settings;
    }

    std::ifstream file(path);
    THROW_IF(!file, std::runtime_error, "Cannot open settings file:", path.string());

    auto json = nlohmann::json::parse(file);

    if (auto it = json.find("families"); it != json.end()) {
        for (const auto& [family, ids] : it->items()) {
            settings.families[family] = ids.get<std::vector<std::string>>();
        }
    }
    if (auto it = json.find("custom_fonts"); it != json.end()) {
        for (const auto& [id, font_path] : it->items()) {
            settings.custom_fonts[id] = font_path.get<std::string>();
        }
    }

    return settings;
}

void save_settings(const std::filesystem::path& path,
                   const font_cfg::font_definitions& defs,
                   const font_cfg::custom_font_paths& custom) {
    nlohmann::json json;
    json["families"] = nlohmann::json::object();
    for (const auto& [family, ids] : defs.families) {
        json["families"][family] = ids;
    }
    json["custom_fonts"] = nlohmann::json::object();
    for (const auto& [id, font_path] : custom) {
        json["custom_fonts"][id] = font_path;
    }

    std::ofstream file(path, std::ios::trunc);
    THROW_IF(!file, std::runtime_error, "Cannot write settings file:", path.string());
    file << json.dump(2) << '\n';
    THROW_IF(!file, std::runtime_error, "Failed to write settings file:", path.string());

    LOG_INFO("Saved font settings to", path.string());
}

} // namespace font_demo
