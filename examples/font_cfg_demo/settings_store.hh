//
// Settings Store - Persists the demo's font configuration
//
// The font_cfg library leaves persistence to the host. This demo stores the
// family fallback lists and the paths of user-added fonts as JSON:
//
//   {
//     "families": { "Proportional": ["sans", "emoji"], ... },
//     "custom_fonts": { "sans": "/usr/share/fonts/.../DejaVuSans.ttf", ... }
//   }
//
// Font bytes are not stored; they are reloaded with load_custom_fonts().
//

#pragma once

#include <font_cfg/font_definitions.hh>

#include <filesystem>

namespace font_demo {

/// Persisted part of the font configuration
struct stored_settings {
    font_cfg::family_map families;
    font_cfg::custom_font_paths custom_fonts;
};

/// Read settings; a missing file yields empty settings
/// @throws nlohmann::json::exception on malformed content
/// @throws std::runtime_error if the file exists but cannot be read
stored_settings load_settings(const std::filesystem::path& path);

/// Write settings, replacing the file
/// @throws std::runtime_error if the file cannot be written
void save_settings(const std::filesystem::path& path,
                   const font_cfg::font_definitions& defs,
                   const font_cfg::custom_font_paths& custom);

} // namespace font_demo
