/**
 * @file font_cfg_ui.hh
 * @brief Dear ImGui editor for font_definitions.
 *
 * The editor renders, in this order:
 * - the font table, with a sub-form to add a font from a file
 * - the family table, with editable fallback lists
 * - "Apply" and "Save" buttons
 *
 * Edits are applied to the caller's font_definitions during show(). The
 * active fonts of the rendering context only change on "Apply". "Save" is
 * reported to the caller, which owns persistence.
 *
 * @section ui_usage Usage Example
 *
 * @code{.cpp}
 * font_cfg_ui editor;
 * // every frame, inside an ImGui window:
 * if (editor.show(fonts, defs, &custom_paths) == ui_message::save_request) {
 *     save_settings(defs, custom_paths);
 * }
 * @endcode
 */

#pragma once

#include <font_cfg/export.h>
#include <font_cfg/font_context.hh>
#include <font_cfg/font_definitions.hh>

#include <imgui.h>

#include <string>

namespace font_cfg {

    /**
     * @brief Appearance settings of the editor.
     */
    struct FONT_CFG_EXPORT ui_style {
        float max_width = 300.0f;                             ///< Width of the editor's inputs
        ImVec4 error_color = ImVec4(0.55f, 0.0f, 0.0f, 1.0f); ///< Color of the error label
        const char* name_hint = "Identifier for new font";
        const char* path_hint = "Path to new font";
        bool show_separators = true;
    };

    /**
     * @brief Font definitions editor state.
     *
     * Holds only the transient input buffers; the edited tables belong to
     * the caller and are passed to every show() call.
     */
    class FONT_CFG_EXPORT font_cfg_ui {
    public:
        explicit font_cfg_ui(ui_style style = {});

        /**
         * @brief Render one frame of the editor and apply the user's edits.
         * @param ctx Rendering context receiving the fonts on "Apply"
         * @param defs Definitions to edit
         * @param custom Optional registry of user-added font paths
         * @return save_request if "Save" was clicked
         */
        ui_message show(font_context& ctx, font_definitions& defs,
                        custom_font_paths* custom = nullptr);

        /// Open the "add font" sub-form and clear the error message
        void open_add_form();

        /**
         * @brief Load the file in path_buffer() as font name_buffer().
         *
         * On failure the error message is set and the buffers are kept so
         * the user can correct them. On success the buffers and the error
         * message are cleared and the sub-form is closed.
         *
         * @return true if the font was inserted
         */
        bool add_font(font_definitions& defs, custom_font_paths* custom);

        [[nodiscard]] std::string& name_buffer() noexcept { return m_name_buf; }
        [[nodiscard]] std::string& path_buffer() noexcept { return m_path_buf; }
        [[nodiscard]] const std::string& error_message() const noexcept { return m_err_msg; }
        [[nodiscard]] bool is_adding() const noexcept { return m_add_new; }

        [[nodiscard]] const ui_style& style() const noexcept { return m_style; }

    private:
        ui_style m_style;

        std::string m_name_buf;
        std::string m_path_buf;
        std::string m_err_msg;
        bool m_add_new = false;

        std::string m_family_buf;
        bool m_add_family = false;

        void show_fonts(font_definitions& defs, custom_font_paths* custom);
        void show_families(font_definitions& defs);
        ui_message show_footer(font_context& ctx, const font_definitions& defs);
        void separator() const;
    };

} // namespace font_cfg
