//
// Demo Application Implementation
//

#include "demo_app.hh"
#include "settings_store.hh"

#include <font_cfg/font_loader.hh>
#include <failsafe/failsafe.hh>

#include <imgui.h>
#include <imgui_stdlib.h>

#include <exception>
#include <utility>

namespace font_demo {

demo_app::demo_app(std::filesystem::path settings_path)
    : m_settings_path(std::move(settings_path)),
      m_defs(font_cfg::font_definitions::with_standard_families()),
      m_fonts(ImGui::GetIO().Fonts, 18.0f) {
    m_window.set_open(true);
}

void demo_app::load_settings() {
    stored_settings settings;
    try {
        settings = font_demo::load_settings(m_settings_path);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot read settings from", m_settings_path.string(), ":", e.what());
        m_status = e.what();
        return;
    }

    for (auto& [family, ids] : settings.families) {
        m_defs.families[family] = std::move(ids);
    }
    m_custom = std::move(settings.custom_fonts);

    try {
        font_cfg::load_custom_fonts(m_custom, m_defs.fonts);
    } catch (const std::exception& e) {
        // Fonts loaded before the failing one are kept
        LOG_ERROR("Cannot load custom fonts:", e.what());
        m_status = e.what();
    }

    m_fonts.set_fonts(m_defs);
}

void demo_app::render() {
    render_menu();
    render_preview();

    if (m_window.show(m_fonts, m_defs, &m_custom) == font_cfg::ui_message::save_request) {
        save();
    }
}

bool demo_app::update_fonts() {
    return m_fonts.rebuild();
}

void demo_app::render_menu() {
    if (ImGui::BeginMainMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Save")) {
                save();
            }
            if (ImGui::MenuItem("Quit", "Alt+F4")) {
                m_quit = true;
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View")) {
            ImGui::MenuItem(m_window.title().c_str(), nullptr, m_window.open_flag());
            ImGui::EndMenu();
        }

        ImGui::EndMainMenuBar();
    }
}

void demo_app::render_preview() {
    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x + 380, viewport->WorkPos.y + 10),
                            ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(500, 400), ImGuiCond_FirstUseEver);

    if (ImGui::Begin("Preview")) {
        ImGui::InputText("Text", &m_preview_text);

        ImGui::SeparatorText("Families");
        for (const auto& [family, ids] : m_fonts.active().families) {
            ImGui::TextDisabled("%s", family.c_str());
            if (ImFont* font = m_fonts.family_font(family)) {
                ImGui::PushFont(font);
                ImGui::TextWrapped("%s", m_preview_text.c_str());
                ImGui::PopFont();
            } else {
                ImGui::TextDisabled("(no usable font, default font in use)");
            }
        }

        if (!m_status.empty()) {
            ImGui::SeparatorText("Status");
            ImGui::TextWrapped("%s", m_status.c_str());
        }
    }
    ImGui::End();
}

void demo_app::save() {
    try {
        save_settings(m_settings_path, m_defs, m_custom);
        m_status = "Saved to " + m_settings_path.string();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot save settings:", e.what());
        m_status = e.what();
    }
}

} // namespace font_demo
