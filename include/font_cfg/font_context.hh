/**
 * @file font_context.hh
 * @brief Destination of the editor's "Apply" button.
 *
 * The editor never talks to a renderer directly. Hosts hand it a
 * font_context, and "Apply" passes the edited font_definitions to it.
 * imgui_font_context is the implementation for Dear ImGui font atlases.
 */

#pragma once

#include <font_cfg/export.h>
#include <font_cfg/font_definitions.hh>

namespace font_cfg {

    /**
     * @brief Host rendering context whose active font set can be replaced.
     */
    class FONT_CFG_EXPORT font_context {
    public:
        virtual ~font_context() = default;

        /// Replace the active fonts with a copy of @p defs
        virtual void set_fonts(const font_definitions& defs) = 0;
    };

} // namespace font_cfg
