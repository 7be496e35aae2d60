/**
 * @file imgui_font_context.hh
 * @brief Applies font definitions to a Dear ImGui font atlas.
 *
 * @section ctx_frames Frame Boundaries
 *
 * The atlas cannot be modified while a frame is being built, so applying is
 * split in two steps:
 * - set_fonts(), called from the editor's "Apply" button, stores a copy
 * - rebuild(), called by the host between frames, rebuilds the atlas
 *
 * @section ctx_families Families
 *
 * Each family becomes one ImFont. The first resolvable identifier of the
 * family is loaded normally and the following ones are merged into it, so
 * glyphs missing from the first font are taken from the next ones in list
 * order. Identifiers missing from the fonts table are skipped.
 *
 * @section ctx_usage Usage Example
 *
 * @code{.cpp}
 * imgui_font_context fonts(ImGui::GetIO().Fonts);
 * fonts.set_fonts(defs);
 * // ... between frames:
 * if (fonts.rebuild()) {
 *     ImGui_ImplOpenGL3_DestroyFontsTexture();
 *     ImGui_ImplOpenGL3_CreateFontsTexture();
 * }
 * @endcode
 */

#pragma once

#include <font_cfg/export.h>
#include <font_cfg/font_context.hh>

#include <imgui.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace font_cfg {

    /**
     * @brief font_context implementation backed by an ImFontAtlas.
     */
    class FONT_CFG_EXPORT imgui_font_context : public font_context {
    public:
        /**
         * @param atlas Atlas to rebuild (not owned, must outlive this object)
         * @param font_size Nominal pixel size of every family font
         * @param glyph_ranges Glyph ranges for every font, nullptr for ImGui's default
         */
        explicit imgui_font_context(ImFontAtlas* atlas,
                                    float font_size = 16.0f,
                                    const ImWchar* glyph_ranges = nullptr);

        void set_fonts(const font_definitions& defs) override;

        /// Whether set_fonts() was called since the last rebuild()
        [[nodiscard]] bool has_pending() const noexcept {
            return m_pending.has_value();
        }

        /**
         * @brief Rebuild the atlas from the pending definitions.
         * @return true if the atlas changed and its texture must be re-uploaded
         */
        bool rebuild();

        /// Font created for a family, nullptr if the family had no usable font
        [[nodiscard]] ImFont* family_font(std::string_view family) const;

        /// Definitions the atlas was last built from
        [[nodiscard]] const font_definitions& active() const noexcept {
            return m_active;
        }

        /// Number of rebuilds that actually modified the atlas
        [[nodiscard]] std::size_t generation() const noexcept {
            return m_generation;
        }

        [[nodiscard]] float font_size() const noexcept {
            return m_font_size;
        }

    private:
        ImFontAtlas* m_atlas;
        float m_font_size;
        const ImWchar* m_glyph_ranges;

        std::optional<font_definitions> m_pending;
        // Font bytes referenced by the atlas (FontDataOwnedByAtlas = false)
        font_definitions m_active;
        std::map<std::string, ImFont*, std::less<>> m_family_fonts;
        bool m_built = false;
        std::size_t m_generation = 0;

        /// Add the fonts of one family, returns the resulting font or nullptr
        ImFont* add_family_font(const std::string& family, const std::vector<std::string>& ids);

        /// Clear the atlas and fall back to ImGui's built-in font
        void build_default();

        /// Point io.FontDefault at the new Proportional font if the atlas is io.Fonts
        void update_default_font();
    };

} // namespace font_cfg
