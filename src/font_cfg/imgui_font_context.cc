//
// ImGui Font Context Implementation
//

#include <font_cfg/imgui_font_context.hh>
#include <failsafe/failsafe.hh>

#include <climits>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace font_cfg {

    namespace {

        // ImGui refuses font blobs of this size or less
        constexpr std::size_t MIN_FONT_FILE_SIZE = 100;

    } // anonymous namespace

    imgui_font_context::imgui_font_context(ImFontAtlas* atlas,
                                           float font_size,
                                           const ImWchar* glyph_ranges)
        : m_atlas(atlas),
          m_font_size(font_size),
          m_glyph_ranges(glyph_ranges) {
        ENFORCE(m_atlas != nullptr);
        ENFORCE(m_font_size > 0.0f);
    }

    void imgui_font_context::set_fonts(const font_definitions& defs) {
        LOG_INFO("Applying", defs.fonts.size(), "fonts in", defs.families.size(), "families");
        m_pending = defs;
    }

    bool imgui_font_context::rebuild() {
        if (!m_pending) {
            return false;
        }

        font_definitions defs = std::move(*m_pending);
        m_pending.reset();

        if (m_built && defs == m_active) {
            return false;
        }

        m_atlas->Clear();
        m_family_fonts.clear();
        m_active = std::move(defs);

        for (const auto& [family, ids] : m_active.families) {
            if (ImFont* font = add_family_font(family, ids)) {
                m_family_fonts.emplace(family, font);
            }
        }

        if (m_atlas->Fonts.Size == 0) {
            m_atlas->AddFontDefault();
        }

        if (!m_atlas->Build()) {
            LOG_ERROR("Font atlas build failed, falling back to the default font");
            build_default();
        }

        m_built = true;
        ++m_generation;
        update_default_font();

        LOG_INFO("Font atlas rebuilt:", m_atlas->Fonts.Size, "fonts");
        return true;
    }

    ImFont* imgui_font_context::family_font(std::string_view family) const {
        auto it = m_family_fonts.find(family);
        return it != m_family_fonts.end() ? it->second : nullptr;
    }

    ImFont* imgui_font_context::add_family_font(const std::string& family,
                                                const std::vector<std::string>& ids) {
        ImFont* font = nullptr;

        for (const auto& id : ids) {
            auto it = m_active.fonts.find(id);
            if (it == m_active.fonts.end()) {
                LOG_WARN("Family", family, "references unknown font", id);
                continue;
            }

            const auto& data = it->second;
            if (data.bytes.size() <= MIN_FONT_FILE_SIZE ||
                data.bytes.size() > static_cast<std::size_t>(INT_MAX)) {
                LOG_WARN("Font", id, "has an unusable size:", data.bytes.size());
                continue;
            }

            float size = m_font_size * data.tweak.scale;

            ImFontConfig config;
            config.FontDataOwnedByAtlas = false;
            config.MergeMode = (font != nullptr);
            config.FontNo = static_cast<int>(data.index);
            config.GlyphOffset = ImVec2(0.0f, data.tweak.y_offset + data.tweak.y_offset_factor * size);
            std::snprintf(config.Name, sizeof(config.Name), "%s/%s", family.c_str(), id.c_str());

            // Atlas only reads the bytes; m_active keeps them alive
            ImFont* added = m_atlas->AddFontFromMemoryTTF(
                const_cast<std::uint8_t*>(data.bytes.data()),
                static_cast<int>(data.bytes.size()),
                size, &config, m_glyph_ranges);

            if (!font) {
                font = added;
            }
        }

        return font;
    }

    void imgui_font_context::build_default() {
        m_atlas->Clear();
        m_family_fonts.clear();
        m_atlas->AddFontDefault();
        THROW_IF(!m_atlas->Build(), std::runtime_error, "Cannot build the default ImGui font");
    }

    void imgui_font_context::update_default_font() {
        if (ImGui::GetCurrentContext() == nullptr) {
            return;
        }
        ImGuiIO& io = ImGui::GetIO();
        if (io.Fonts == m_atlas) {
            io.FontDefault = family_font(family_proportional);
        }
    }

} // namespace font_cfg
