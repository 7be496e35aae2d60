/**
 * @file font_edits.hh
 * @brief Mutations applied to font_definitions by the editor.
 *
 * Every button of font_cfg_ui maps onto one of these functions. They are
 * public so that hosts can script the same edits, and so the editor's
 * behaviour can be exercised without rendering a frame.
 *
 * None of the operations can fail: identifiers and family names are free
 * strings and inserting an existing key overwrites it. The boolean result
 * only reports whether the tables changed.
 *
 * Removing a font never touches family lists; families that referenced it
 * keep a dangling identifier until the user edits them.
 */

#pragma once

#include <font_cfg/export.h>
#include <font_cfg/font_definitions.hh>
#include <cstddef>
#include <string>
#include <string_view>

namespace font_cfg {

    /**
     * @brief Insert or replace a font.
     * @param defs Definitions to modify
     * @param id Font identifier
     * @param data Font data
     * @param custom Optional registry; receives id -> path when non-null
     * @param path Path recorded in @p custom
     */
    FONT_CFG_EXPORT void insert_font(font_definitions& defs,
                                     const std::string& id,
                                     font_data data,
                                     custom_font_paths* custom,
                                     const std::string& path);

    /**
     * @brief Remove a font from the fonts table and from the registry.
     * @return true if the font was present in @p defs
     */
    FONT_CFG_EXPORT bool remove_font(font_definitions& defs,
                                     std::string_view id,
                                     custom_font_paths* custom);

    /// Create an empty family; an existing family is left as is
    /// @return true if the family was created
    FONT_CFG_EXPORT bool add_family(font_definitions& defs, const std::string& family);

    /// Remove a family and its fallback list
    FONT_CFG_EXPORT bool remove_family(font_definitions& defs, std::string_view family);

    /**
     * @brief Append one empty identifier slot to a family.
     *
     * A missing family is not an error; nothing happens and false is
     * returned.
     */
    FONT_CFG_EXPORT bool append_family_slot(font_definitions& defs, std::string_view family);

    /// Remove the slot at @p index, keeping the order of the others
    FONT_CFG_EXPORT bool remove_family_slot(font_definitions& defs,
                                            std::string_view family,
                                            std::size_t index);

} // namespace font_cfg
