//
// Font file loading
//

#include <font_cfg/font_loader.hh>
#include <failsafe/failsafe.hh>
#include <fstream>
#include <stdexcept>

namespace font_cfg {

    std::vector<std::uint8_t> read_font_file(const std::filesystem::path& path) {
        // A directory opens fine as a stream but reports a bogus size
        THROW_IF(std::filesystem::is_directory(path), std::runtime_error,
                 "Not a regular file:", path.string());

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        THROW_IF(!file, std::runtime_error, "Cannot open file:", path.string());

        auto size = file.tellg();
        THROW_IF(size < 0, std::runtime_error, "Cannot determine size of file:", path.string());
        file.seekg(0, std::ios::beg);

        std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
        THROW_IF(!file.read(reinterpret_cast<char*>(data.data()), size),
                 std::runtime_error, "Failed to read file:", path.string());

        return data;
    }

    void load_custom_fonts(const custom_font_paths& custom, font_map& fonts) {
        for (const auto& [id, path] : custom) {
            fonts.insert_or_assign(id, font_data::from_owned(read_font_file(path)));
            LOG_DEBUG("Loaded custom font", id, "from", path);
        }
        LOG_INFO("Loaded", custom.size(), "custom fonts");
    }

} // namespace font_cfg
