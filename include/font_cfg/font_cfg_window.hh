/**
 * @file font_cfg_window.hh
 * @brief font_cfg_ui inside a closable ImGui window.
 *
 * The window starts closed. Its close button clears the open flag; the host
 * reopens it with set_open() or toggle(), or by binding open_flag() to a
 * menu item.
 */

#pragma once

#include <font_cfg/export.h>
#include <font_cfg/font_cfg_ui.hh>

#include <string>

namespace font_cfg {

    /**
     * @brief Closable window hosting a font_cfg_ui.
     */
    class FONT_CFG_EXPORT font_cfg_window {
    public:
        explicit font_cfg_window(std::string title = "Font definitions", ui_style style = {});

        /**
         * @brief Show the window if it is open.
         * @return the editor's message, none while closed or collapsed
         */
        ui_message show(font_context& ctx, font_definitions& defs,
                        custom_font_paths* custom = nullptr);

        [[nodiscard]] bool is_open() const noexcept { return m_open; }
        void set_open(bool open) noexcept { m_open = open; }
        void toggle() noexcept { m_open = !m_open; }

        /// Mutable open flag, e.g. for ImGui::MenuItem
        [[nodiscard]] bool* open_flag() noexcept { return &m_open; }

        [[nodiscard]] font_cfg_ui& editor() noexcept { return m_ui; }
        [[nodiscard]] const std::string& title() const noexcept { return m_title; }

    private:
        font_cfg_ui m_ui;
        std::string m_title;
        bool m_open = false;
    };

} // namespace font_cfg
