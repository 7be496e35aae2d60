//
// Font Configuration Window Implementation
//

#include <font_cfg/font_cfg_window.hh>

#include <imgui.h>

#include <utility>

namespace font_cfg {

    font_cfg_window::font_cfg_window(std::string title, ui_style style)
        : m_ui(style),
          m_title(std::move(title)) {
    }

    ui_message font_cfg_window::show(font_context& ctx, font_definitions& defs,
                                     custom_font_paths* custom) {
        if (!m_open) {
            return ui_message::none;
        }

        auto msg = ui_message::none;
        ImGui::SetNextWindowSize(ImVec2(m_ui.style().max_width + 40.0f, 400.0f), ImGuiCond_FirstUseEver);
        if (ImGui::Begin(m_title.c_str(), &m_open)) {
            msg = m_ui.show(ctx, defs, custom);
        }
        ImGui::End();
        return msg;
    }

} // namespace font_cfg
