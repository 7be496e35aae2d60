/**
 * @file font_loader.hh
 * @brief Reading font files and reloading user-added fonts.
 *
 * The editor records every font the user adds in a custom_font_paths
 * registry. The host persists that registry in whatever format it likes and,
 * on the next start, calls load_custom_fonts() to materialize those fonts
 * again before the editor is shown.
 *
 * @code{.cpp}
 * auto defs = font_definitions::with_standard_families();
 * try {
 *     load_custom_fonts(saved_paths, defs.fonts);
 * } catch (const std::exception& e) {
 *     // Fonts loaded before the failing entry stay in defs.fonts
 * }
 * @endcode
 */

#pragma once

#include <font_cfg/export.h>
#include <font_cfg/font_definitions.hh>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace font_cfg {

    /**
     * @brief Read a whole file into memory.
     *
     * No validation of the contents is performed.
     *
     * @param path File to read
     * @return File bytes
     * @throws std::runtime_error if the path is a directory or the file
     *         cannot be opened or read
     */
    [[nodiscard]] FONT_CFG_EXPORT std::vector<std::uint8_t>
        read_font_file(const std::filesystem::path& path);

    /**
     * @brief Load every registered custom font into a font table.
     *
     * Entries are visited in key order. Each readable file is inserted into
     * @p fonts, replacing any existing entry with the same identifier.
     * Loading stops at the first unreadable file; fonts inserted before it
     * are kept.
     *
     * @param custom Registry of identifier -> path
     * @param fonts Font table to fill
     * @throws std::runtime_error for the first file that cannot be read
     */
    FONT_CFG_EXPORT void load_custom_fonts(const custom_font_paths& custom, font_map& fonts);

} // namespace font_cfg
