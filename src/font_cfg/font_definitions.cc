//
// Font definitions
//

#include <font_cfg/font_definitions.hh>
#include <utility>

namespace font_cfg {

    font_data font_data::from_owned(std::vector<std::uint8_t> bytes) {
        font_data data;
        data.bytes = std::move(bytes);
        return data;
    }

    font_definitions font_definitions::with_standard_families() {
        font_definitions defs;
        defs.families.emplace(family_proportional, std::vector<std::string>{});
        defs.families.emplace(family_monospace, std::vector<std::string>{});
        return defs;
    }

} // namespace font_cfg
