//
// Shared helpers for font_cfg unit tests
//

#pragma once

#include <font_cfg/font_context.hh>
#include <font_cfg/font_definitions.hh>

#include <imgui.h>
#include <imgui_internal.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace font_cfg::test {

    /// Font files shipped with the tests (Source Code Pro, SIL OFL 1.1)
    [[nodiscard]] inline std::filesystem::path testdata_path(const std::string& name) {
#ifdef TESTDATA_DIR
        return std::filesystem::path(TESTDATA_DIR) / name;
#else
        return std::filesystem::path(__FILE__).parent_path() / "testdata" / name;
#endif
    }

    /// Deterministic pseudo font file contents
    [[nodiscard]] inline std::vector<std::uint8_t> make_font_bytes(std::size_t size, std::uint8_t seed = 0) {
        std::vector<std::uint8_t> bytes(size);
        for (std::size_t i = 0; i < size; ++i) {
            bytes[i] = static_cast<std::uint8_t>((i * 31u + seed) & 0xFFu);
        }
        return bytes;
    }

    /// Temporary directory removed on destruction
    class temp_dir {
    public:
        temp_dir() {
            std::random_device rd;
            std::mt19937_64 gen(rd());
            m_path = std::filesystem::temp_directory_path() /
                     ("font_cfg_test_" + std::to_string(gen()));
            std::filesystem::create_directories(m_path);
        }

        ~temp_dir() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

        /// Write @p bytes to a file inside the directory and return its path
        std::filesystem::path write(const std::string& name, const std::vector<std::uint8_t>& bytes) const {
            auto file_path = m_path / name;
            std::ofstream file(file_path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Cannot create test file: " + file_path.string());
            }
            file.write(reinterpret_cast<const char*>(bytes.data()),
                       static_cast<std::streamsize>(bytes.size()));
            return file_path;
        }

        /// Path inside the directory that does not exist
        [[nodiscard]] std::filesystem::path missing(const std::string& name) const {
            return m_path / "missing" / name;
        }

    private:
        std::filesystem::path m_path;
    };

    /// font_context that records every applied configuration
    class recording_context : public font_context {
    public:
        void set_fonts(const font_definitions& defs) override {
            applied.push_back(defs);
        }

        std::vector<font_definitions> applied;
    };

    /// Headless ImGui context able to run frames and synthesize clicks
    class imgui_test_context {
    public:
        imgui_test_context() {
            m_ctx = ImGui::CreateContext();
            ImGuiIO& io = ImGui::GetIO();
            io.DisplaySize = ImVec2(1024.0f, 768.0f);
            io.DeltaTime = 1.0f / 60.0f;
            io.IniFilename = nullptr;

            unsigned char* pixels = nullptr;
            int width = 0;
            int height = 0;
            io.Fonts->GetTexDataAsRGBA32(&pixels, &width, &height);
        }

        ~imgui_test_context() {
            ImGui::DestroyContext(m_ctx);
        }

        imgui_test_context(const imgui_test_context&) = delete;
        imgui_test_context& operator=(const imgui_test_context&) = delete;

        /// Run one frame with @p body inside a fixed full-screen window
        template<typename Body>
        void frame(Body&& body) {
            ImGui::NewFrame();
            ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f), ImGuiCond_Always);
            ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize, ImGuiCond_Always);
            ImGui::Begin("test", nullptr,
                         ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                         ImGuiWindowFlags_NoSavedSettings);
            body();
            ImGui::End();
            ImGui::Render();
        }

        /// Run one frame with @p body at top level
        template<typename Body>
        void raw_frame(Body&& body) {
            ImGui::NewFrame();
            body();
            ImGui::Render();
        }

        /// Move the mouse to @p pos, press and release, one frame per step
        template<typename Body>
        void click(ImVec2 pos, Body&& body) {
            ImGuiIO& io = ImGui::GetIO();
            io.AddMousePosEvent(pos.x, pos.y);
            frame(body);
            io.AddMouseButtonEvent(ImGuiMouseButton_Left, true);
            frame(body);
            io.AddMouseButtonEvent(ImGuiMouseButton_Left, false);
            frame(body);
        }

        /// Same as click() for bodies that open their own windows
        template<typename Body>
        void raw_click(ImVec2 pos, Body&& body) {
            ImGuiIO& io = ImGui::GetIO();
            io.AddMousePosEvent(pos.x, pos.y);
            raw_frame(body);
            io.AddMouseButtonEvent(ImGuiMouseButton_Left, true);
            raw_frame(body);
            io.AddMouseButtonEvent(ImGuiMouseButton_Left, false);
            raw_frame(body);
        }

        /**
         * Press the item @p id from code during the next frame, then run a
         * second frame so the press settles.
         */
        template<typename Body>
        void activate(ImGuiID id, Body&& body) {
            ImGui::ActivateItemByID(id);
            frame(body);
            frame(body);
        }

        /**
         * Hover the display row by row until item @p id reports hovered and
         * return that position. Nothing is clicked.
         */
        template<typename Body>
        ImVec2 find_item(ImGuiID id, Body&& body, ImVec2 limit = ImVec2(480.0f, 480.0f), float step = 5.0f) {
            ImGuiIO& io = ImGui::GetIO();
            for (float y = step * 0.5f; y < limit.y; y += step) {
                for (float x = step * 0.5f; x < limit.x; x += step) {
                    io.AddMousePosEvent(x, y);
                    frame(body);
                    if (ImGui::GetCurrentContext()->HoveredId == id) {
                        return ImVec2(x, y);
                    }
                }
            }
            throw std::runtime_error("Item not found on screen");
        }

    private:
        ImGuiContext* m_ctx = nullptr;
    };

    [[nodiscard]] inline ImVec2 rect_center(ImVec2 min, ImVec2 max) {
        return ImVec2((min.x + max.x) * 0.5f, (min.y + max.y) * 0.5f);
    }

} // namespace font_cfg::test
