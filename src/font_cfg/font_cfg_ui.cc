//
// Font Configuration UI Implementation
//

#include <font_cfg/font_cfg_ui.hh>
#include <font_cfg/font_edits.hh>
#include <font_cfg/font_loader.hh>
#include <failsafe/failsafe.hh>

#include <imgui_stdlib.h>

#include <cstdint>
#include <exception>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace font_cfg {

    font_cfg_ui::font_cfg_ui(ui_style style)
        : m_style(style) {
    }

    ui_message font_cfg_ui::show(font_context& ctx, font_definitions& defs,
                                 custom_font_paths* custom) {
        ImGui::PushID(this);
        ImGui::PushItemWidth(m_style.max_width);

        show_fonts(defs, custom);
        separator();
        show_families(defs);
        separator();
        auto msg = show_footer(ctx, defs);

        ImGui::PopItemWidth();
        ImGui::PopID();
        return msg;
    }

    void font_cfg_ui::open_add_form() {
        m_add_new = true;
        m_err_msg.clear();
    }

    bool font_cfg_ui::add_font(font_definitions& defs, custom_font_paths* custom) {
        std::vector<std::uint8_t> bytes;
        try {
            bytes = read_font_file(m_path_buf);
        } catch (const std::exception& e) {
            LOG_WARN("Cannot add font", m_name_buf, ":", e.what());
            m_err_msg = e.what();
            return false;
        }

        insert_font(defs, m_name_buf, font_data::from_owned(std::move(bytes)), custom, m_path_buf);

        m_name_buf.clear();
        m_path_buf.clear();
        m_err_msg.clear();
        m_add_new = false;
        return true;
    }

    void font_cfg_ui::show_fonts(font_definitions& defs, custom_font_paths* custom) {
        ImGui::PushID("fonts");

        ImGui::TextUnformatted("Fonts");
        ImGui::SameLine();
        if (ImGui::Button("+##add")) {
            open_add_form();
        }

        if (m_add_new) {
            ImGui::InputTextWithHint("##name", m_style.name_hint, &m_name_buf);
            ImGui::InputTextWithHint("##path", m_style.path_hint, &m_path_buf);
            if (ImGui::Button("Add new font")) {
                add_font(defs, custom);
            }
        }

        if (!m_err_msg.empty()) {
            ImGui::TextColored(m_style.error_color, "%s", m_err_msg.c_str());
        }

        for (auto it = defs.fonts.begin(); it != defs.fonts.end();) {
            auto next = std::next(it);

            ImGui::PushID(it->first.c_str());
            ImGui::TextUnformatted(it->first.c_str());
            ImGui::SameLine();
            bool remove = ImGui::Button("-");
            ImGui::PopID();

            if (remove) {
                remove_font(defs, std::string(it->first), custom);
            }
            it = next;
        }

        ImGui::PopID();
    }

    void font_cfg_ui::show_families(font_definitions& defs) {
        ImGui::PushID("families");

        ImGui::TextUnformatted("Families");
        ImGui::SameLine();
        if (ImGui::Button("+##add")) {
            m_add_family = !m_add_family;
            m_family_buf.clear();
        }

        if (m_add_family) {
            ImGui::InputTextWithHint("##name", "Name of new family", &m_family_buf);
            if (ImGui::Button("Add family")) {
                add_family(defs, m_family_buf);
                m_family_buf.clear();
                m_add_family = false;
            }
        }

        // Appending while iterating would disturb the traversal, apply it afterwards
        std::optional<std::string> push_new_to;

        for (auto it = defs.families.begin(); it != defs.families.end();) {
            auto next = std::next(it);
            const std::string& family = it->first;

            ImGui::PushID(family.c_str());
            ImGui::TextUnformatted(family.c_str());
            ImGui::SameLine();
            if (ImGui::Button("+")) {
                push_new_to = family;
            }
            ImGui::SameLine();
            bool remove = ImGui::Button("-");

            if (!remove) {
                auto& slots = it->second;
                for (std::size_t i = 0; i < slots.size();) {
                    ImGui::PushID(static_cast<int>(i));
                    ImGui::InputText("##slot", &slots[i]);
                    ImGui::SameLine();
                    bool remove_slot = ImGui::Button("-");
                    ImGui::PopID();

                    if (remove_slot) {
                        remove_family_slot(defs, family, i);
                    } else {
                        ++i;
                    }
                }
            }
            ImGui::PopID();

            if (remove) {
                remove_family(defs, std::string(family));
            }
            it = next;
        }

        if (push_new_to) {
            append_family_slot(defs, *push_new_to);
        }

        ImGui::PopID();
    }

    ui_message font_cfg_ui::show_footer(font_context& ctx, const font_definitions& defs) {
        auto msg = ui_message::none;

        if (ImGui::Button("Apply")) {
            ctx.set_fonts(defs);
        }
        ImGui::SameLine();
        if (ImGui::Button("Save")) {
            LOG_DEBUG("Save requested");
            msg = ui_message::save_request;
        }

        return msg;
    }

    void font_cfg_ui::separator() const {
        if (m_style.show_separators) {
            ImGui::Separator();
        }
    }

} // namespace font_cfg
