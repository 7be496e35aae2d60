//
// Font definition edits
//

#include <font_cfg/font_edits.hh>
#include <failsafe/failsafe.hh>
#include <iterator>
#include <utility>

namespace font_cfg {

    void insert_font(font_definitions& defs,
                     const std::string& id,
                     font_data data,
                     custom_font_paths* custom,
                     const std::string& path) {
        LOG_DEBUG("Adding font", id, "size:", data.bytes.size());
        defs.fonts.insert_or_assign(id, std::move(data));
        if (custom) {
            custom->insert_or_assign(id, path);
        }
    }

    bool remove_font(font_definitions& defs, std::string_view id, custom_font_paths* custom) {
        if (custom) {
            if (auto it = custom->find(id); it != custom->end()) {
                custom->erase(it);
            }
        }

        auto it = defs.fonts.find(id);
        if (it == defs.fonts.end()) {
            return false;
        }
        LOG_DEBUG("Removing font", it->first);
        defs.fonts.erase(it);
        return true;
    }

    bool add_family(font_definitions& defs, const std::string& family) {
        auto [it, inserted] = defs.families.try_emplace(family);
        if (inserted) {
            LOG_DEBUG("Adding family", family);
        }
        return inserted;
    }

    bool remove_family(font_definitions& defs, std::string_view family) {
        auto it = defs.families.find(family);
        if (it == defs.families.end()) {
            return false;
        }
        LOG_DEBUG("Removing family", it->first, "with", it->second.size(), "entries");
        defs.families.erase(it);
        return true;
    }

    bool append_family_slot(font_definitions& defs, std::string_view family) {
        auto it = defs.families.find(family);
        if (it == defs.families.end()) {
            LOG_WARN("Cannot append to missing family", std::string(family));
            return false;
        }
        it->second.emplace_back();
        return true;
    }

    bool remove_family_slot(font_definitions& defs, std::string_view family, std::size_t index) {
        auto it = defs.families.find(family);
        if (it == defs.families.end() || index >= it->second.size()) {
            return false;
        }
        auto& slots = it->second;
        slots.erase(std::next(slots.begin(), static_cast<std::ptrdiff_t>(index)));
        return true;
    }

} // namespace font_cfg
