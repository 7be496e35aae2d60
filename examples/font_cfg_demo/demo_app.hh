//
// Demo Application - Hosts the font configuration window
//
// Owns the font configuration and the custom font registry, feeds them to
// font_cfg_window every frame and saves them when the user asks for it.
//

#pragma once

#include <font_cfg/font_cfg_window.hh>
#include <font_cfg/font_definitions.hh>
#include <font_cfg/imgui_font_context.hh>

#include <filesystem>
#include <string>

namespace font_demo {

/// Main demo application
class demo_app {
public:
    /// Requires a current ImGui context; its atlas receives applied fonts
    explicit demo_app(std::filesystem::path settings_path);

    /// Load saved families and custom fonts, then apply them
    void load_settings();

    /// Render the complete UI (inside an ImGui frame)
    void render();

    /// Rebuild the font atlas if fonts were applied (outside a frame)
    /// @return true if the font texture must be re-uploaded
    bool update_fonts();

    [[nodiscard]] bool quit_requested() const { return m_quit; }

private:
    std::filesystem::path m_settings_path;

    font_cfg::font_definitions m_defs;
    font_cfg::custom_font_paths m_custom;
    font_cfg::imgui_font_context m_fonts;
    font_cfg::font_cfg_window m_window;

    std::string m_preview_text = "The quick brown fox jumps over the lazy dog 0123456789";
    std::string m_status;
    bool m_quit = false;

    void render_menu();
    void render_preview();
    void save();
};

} // namespace font_demo
