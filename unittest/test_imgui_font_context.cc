//
// Unit tests for applying font definitions to an ImGui atlas
//

#include <doctest/doctest.h>
#include <font_cfg/imgui_font_context.hh>
#include <font_cfg/font_loader.hh>
#include "test_data.hh"

#include <utility>

using namespace font_cfg;
using namespace font_cfg::test;

namespace {

    // Families whose entries cannot be loaded leave only the default font
    font_definitions unresolvable_definitions() {
        auto defs = font_definitions::with_standard_families();
        defs.fonts["tiny"] = font_data::from_owned(make_font_bytes(16));
        defs.families["Proportional"] = {"missing", "tiny"};
        defs.families["Monospace"] = {""};
        return defs;
    }

    // Proportional merges Bold into Regular, Monospace uses Bold alone
    font_definitions fixture_definitions() {
        auto defs = font_definitions::with_standard_families();

        auto regular = font_data::from_owned(read_font_file(testdata_path("SourceCodePro-Regular.ttf")));
        regular.tweak.y_offset = 2.0f;
        regular.tweak.y_offset_factor = 0.1f;
        auto bold = font_data::from_owned(read_font_file(testdata_path("SourceCodePro-Bold.ttf")));
        bold.tweak.scale = 1.25f;

        defs.fonts["regular"] = std::move(regular);
        defs.fonts["bold"] = std::move(bold);
        defs.families["Proportional"] = {"regular", "missing", "bold"};
        defs.families["Monospace"] = {"bold"};
        return defs;
    }

} // anonymous namespace

TEST_SUITE("imgui_font_context") {

    TEST_CASE("rebuild without pending fonts does nothing") {
        imgui_test_context imgui;
        imgui_font_context fonts(ImGui::GetIO().Fonts);

        CHECK_FALSE(fonts.has_pending());
        CHECK_FALSE(fonts.rebuild());
        CHECK(fonts.generation() == 0);
    }

    TEST_CASE("set_fonts is deferred until rebuild") {
        imgui_test_context imgui;
        imgui_font_context fonts(ImGui::GetIO().Fonts);
        auto defs = unresolvable_definitions();

        fonts.set_fonts(defs);
        CHECK(fonts.has_pending());
        CHECK(fonts.active().families.empty());

        CHECK(fonts.rebuild());
        CHECK_FALSE(fonts.has_pending());
        CHECK(fonts.active() == defs);
        CHECK(fonts.generation() == 1);
    }

    TEST_CASE("unresolvable families fall back to the default font") {
        imgui_test_context imgui;
        ImFontAtlas* atlas = ImGui::GetIO().Fonts;
        imgui_font_context fonts(atlas);

        fonts.set_fonts(unresolvable_definitions());
        REQUIRE(fonts.rebuild());

        CHECK(atlas->Fonts.Size == 1);
        CHECK(atlas->IsBuilt());
        CHECK(fonts.family_font("Proportional") == nullptr);
        CHECK(fonts.family_font("Monospace") == nullptr);
        CHECK(ImGui::GetIO().FontDefault == nullptr);
    }

    TEST_CASE("applying identical definitions twice is idempotent") {
        imgui_test_context imgui;
        ImFontAtlas* atlas = ImGui::GetIO().Fonts;
        imgui_font_context fonts(atlas);
        auto defs = unresolvable_definitions();

        fonts.set_fonts(defs);
        REQUIRE(fonts.rebuild());
        int font_count = atlas->Fonts.Size;

        fonts.set_fonts(defs);
        CHECK_FALSE(fonts.rebuild());

        CHECK(fonts.generation() == 1);
        CHECK(fonts.active() == defs);
        CHECK(atlas->Fonts.Size == font_count);
    }

    TEST_CASE("changed definitions rebuild again") {
        imgui_test_context imgui;
        imgui_font_context fonts(ImGui::GetIO().Fonts);
        auto defs = unresolvable_definitions();

        fonts.set_fonts(defs);
        REQUIRE(fonts.rebuild());

        defs.families["Extra"] = {"missing"};
        fonts.set_fonts(defs);
        CHECK(fonts.rebuild());
        CHECK(fonts.generation() == 2);
        CHECK(fonts.active().families.count("Extra") == 1);
    }

    TEST_CASE("works on an atlas outside the ImGui context") {
        imgui_test_context imgui;
        ImFontAtlas atlas;
        imgui_font_context fonts(&atlas);

        fonts.set_fonts(unresolvable_definitions());
        CHECK(fonts.rebuild());
        CHECK(atlas.Fonts.Size == 1);
        CHECK(ImGui::GetIO().Fonts != &atlas);
    }

    TEST_CASE("null atlas is rejected") {
        CHECK_THROWS((void)imgui_font_context(nullptr));
    }

    TEST_CASE("each family becomes one font with its fallbacks merged") {
        imgui_test_context imgui;
        ImFontAtlas* atlas = ImGui::GetIO().Fonts;
        imgui_font_context fonts(atlas);

        fonts.set_fonts(fixture_definitions());
        REQUIRE(fonts.rebuild());

        CHECK(atlas->IsBuilt());
        CHECK(atlas->Fonts.Size == 2);

        ImFont* proportional = fonts.family_font("Proportional");
        ImFont* monospace = fonts.family_font("Monospace");
        REQUIRE(proportional != nullptr);
        REQUIRE(monospace != nullptr);
        CHECK(proportional != monospace);
        CHECK(fonts.family_font("Unknown") == nullptr);

        CHECK(proportional->FontSize == doctest::Approx(16.0f));
        CHECK(monospace->FontSize == doctest::Approx(20.0f));
        CHECK(proportional->FindGlyphNoFallback('A') != nullptr);
    }

    TEST_CASE("font tweaks reach the atlas configuration") {
        imgui_test_context imgui;
        ImFontAtlas* atlas = ImGui::GetIO().Fonts;
        imgui_font_context fonts(atlas);

        fonts.set_fonts(fixture_definitions());
        REQUIRE(fonts.rebuild());

        // Monospace/bold, Proportional/regular, Proportional/bold in family order
        REQUIRE(atlas->ConfigData.Size == 3);
        const ImFontConfig& mono = atlas->ConfigData[0];
        const ImFontConfig& regular = atlas->ConfigData[1];
        const ImFontConfig& merged = atlas->ConfigData[2];

        CHECK_FALSE(mono.MergeMode);
        CHECK(mono.SizePixels == doctest::Approx(20.0f));
        CHECK_FALSE(regular.MergeMode);
        CHECK(regular.GlyphOffset.y == doctest::Approx(2.0f + 0.1f * 16.0f));
        CHECK(merged.MergeMode);
        CHECK(merged.GlyphOffset.y == doctest::Approx(0.0f));
        CHECK_FALSE(regular.FontDataOwnedByAtlas);
    }

    TEST_CASE("Proportional becomes the default font of the context") {
        imgui_test_context imgui;
        imgui_font_context fonts(ImGui::GetIO().Fonts);

        fonts.set_fonts(fixture_definitions());
        REQUIRE(fonts.rebuild());

        REQUIRE(fonts.family_font("Proportional") != nullptr);
        CHECK(ImGui::GetIO().FontDefault == fonts.family_font("Proportional"));

        ImFont* used = nullptr;
        imgui.frame([&] { used = ImGui::GetFont(); });
        CHECK(used == fonts.family_font("Proportional"));
    }

    TEST_CASE("a standalone atlas leaves the context default font alone") {
        imgui_test_context imgui;
        ImFontAtlas atlas;
        imgui_font_context fonts(&atlas);

        fonts.set_fonts(fixture_definitions());
        REQUIRE(fonts.rebuild());

        CHECK(atlas.Fonts.Size == 2);
        CHECK(fonts.family_font("Proportional") != nullptr);
        CHECK(ImGui::GetIO().FontDefault == nullptr);
    }
}
