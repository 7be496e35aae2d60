/**
 * @file font_definitions.hh
 * @brief In-memory font configuration edited by font_cfg_ui.
 *
 * A font configuration consists of two tables owned by the host:
 *
 * | Table | Key | Value |
 * |-------|-----|-------|
 * | fonts | font identifier | raw font file bytes (font_data) |
 * | families | family name | ordered fallback list of identifiers |
 *
 * A family may reference an identifier that is not (or no longer) present in
 * the fonts table. Such dangling references are legal here; the rendering
 * context skips them when the configuration is applied.
 *
 * Fonts added by the user through the editor are additionally recorded in a
 * custom_font_paths registry so the host can reload them on the next run
 * (see load_custom_fonts()).
 *
 * @section defs_usage Usage Example
 *
 * @code{.cpp}
 * auto defs = font_definitions::with_standard_families();
 * defs.fonts["sans"] = font_data::from_owned(read_font_file("DejaVuSans.ttf"));
 * defs.families[std::string(family_proportional)].push_back("sans");
 * @endcode
 */

#pragma once

#include <font_cfg/export.h>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace font_cfg {

    /// Name of the family used for regular text
    inline constexpr std::string_view family_proportional = "Proportional";

    /// Name of the family used for fixed-width text
    inline constexpr std::string_view family_monospace = "Monospace";

    /**
     * @brief Per-font adjustments applied by the rendering context.
     */
    struct FONT_CFG_EXPORT font_tweak {
        float scale = 1.0f;           ///< Multiplier on the nominal pixel size
        float y_offset_factor = 0.0f; ///< Vertical shift as a fraction of the pixel size
        float y_offset = 0.0f;        ///< Vertical shift in pixels

        bool operator==(const font_tweak&) const = default;
    };

    /**
     * @brief Raw font file contents plus face selection.
     */
    struct FONT_CFG_EXPORT font_data {
        std::vector<std::uint8_t> bytes; ///< Complete font file
        std::uint32_t index = 0;         ///< Face index inside a collection (.ttc)
        font_tweak tweak;

        /// Wrap file bytes with default index and tweak
        [[nodiscard]] static font_data from_owned(std::vector<std::uint8_t> bytes);

        bool operator==(const font_data&) const = default;
    };

    /// Font identifier -> font data
    using font_map = std::map<std::string, font_data, std::less<>>;

    /// Family name -> ordered fallback identifiers
    using family_map = std::map<std::string, std::vector<std::string>, std::less<>>;

    /// Font identifier -> filesystem path, for fonts the user added
    using custom_font_paths = std::map<std::string, std::string, std::less<>>;

    /**
     * @brief Complete font configuration: font data and family fallback lists.
     */
    struct FONT_CFG_EXPORT font_definitions {
        font_map fonts;
        family_map families;

        /// Definitions with empty Proportional and Monospace families
        [[nodiscard]] static font_definitions with_standard_families();

        bool operator==(const font_definitions&) const = default;
    };

    /// Message returned by the editor each frame
    enum class ui_message {
        none,         ///< Nothing for the host to do
        save_request  ///< The user asked for the configuration to be saved
    };

} // namespace font_cfg
