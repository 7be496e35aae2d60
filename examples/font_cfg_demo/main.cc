//
// font_cfg demo: the font definitions window in an SDL2 + OpenGL3 host
//
// Usage: font_cfg_demo [settings.json]
//

#include "demo_app.hh"

#include <imgui.h>
#include <imgui_impl_opengl3.h>
#include <imgui_impl_sdl2.h>

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>

#include <failsafe/failsafe.hh>

#include <exception>
#include <memory>
#include <stdexcept>

namespace font_demo {

    /// SDL_Init / SDL_Quit pair
    struct sdl_library {
        sdl_library() {
            THROW_IF(SDL_Init(SDL_INIT_VIDEO) != 0, std::runtime_error,
                     "SDL_Init failed:", SDL_GetError());
        }
        ~sdl_library() {
            SDL_Quit();
        }
        sdl_library(const sdl_library&) = delete;
        sdl_library& operator=(const sdl_library&) = delete;
    };

    /**
     * Window, GL context and ImGui backends of the demo, torn down in
     * reverse order of creation. A constructor failure releases whatever
     * was already created.
     */
    class sdl_host {
    public:
        sdl_host(const char* title, int width, int height)
            : m_window(nullptr, &SDL_DestroyWindow),
              m_gl(nullptr, &SDL_GL_DeleteContext) {
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 2);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_FORWARD_COMPATIBLE_FLAG);
            SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

            m_window.reset(SDL_CreateWindow(title, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                            width, height,
                                            SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE |
                                            SDL_WINDOW_ALLOW_HIGHDPI));
            THROW_IF(!m_window, std::runtime_error, "SDL_CreateWindow failed:", SDL_GetError());

            m_gl.reset(SDL_GL_CreateContext(m_window.get()));
            THROW_IF(!m_gl, std::runtime_error, "SDL_GL_CreateContext failed:", SDL_GetError());
            SDL_GL_MakeCurrent(m_window.get(), m_gl.get());
            SDL_GL_SetSwapInterval(1);

            IMGUI_CHECKVERSION();
            ImGui::CreateContext();
            ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
            ImGui::StyleColorsDark();
            ImGui_ImplSDL2_InitForOpenGL(m_window.get(), m_gl.get());
            ImGui_ImplOpenGL3_Init("#version 150");
        }

        ~sdl_host() {
            ImGui_ImplOpenGL3_Shutdown();
            ImGui_ImplSDL2_Shutdown();
            ImGui::DestroyContext();
        }

        sdl_host(const sdl_host&) = delete;
        sdl_host& operator=(const sdl_host&) = delete;

        /// Drain pending events, false once the user closed the window
        bool poll_events() {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL2_ProcessEvent(&event);
                if (event.type == SDL_QUIT) {
                    m_closed = true;
                } else if (event.type == SDL_WINDOWEVENT &&
                           event.window.event == SDL_WINDOWEVENT_CLOSE &&
                           event.window.windowID == SDL_GetWindowID(m_window.get())) {
                    m_closed = true;
                }
            }
            return !m_closed;
        }

        /// Re-upload the font atlas texture after it was rebuilt
        void reload_fonts() {
            ImGui_ImplOpenGL3_DestroyFontsTexture();
            ImGui_ImplOpenGL3_CreateFontsTexture();
        }

        void begin_frame() {
            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();
        }

        void end_frame() {
            ImGui::Render();

            int w = 0;
            int h = 0;
            SDL_GL_GetDrawableSize(m_window.get(), &w, &h);
            glViewport(0, 0, w, h);
            glClearColor(0.12f, 0.12f, 0.14f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);

            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            SDL_GL_SwapWindow(m_window.get());
        }

    private:
        sdl_library m_sdl;
        std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> m_window;
        std::unique_ptr<void, decltype(&SDL_GL_DeleteContext)> m_gl;
        bool m_closed = false;
    };

    int run(const char* settings_path) {
        sdl_host host("font_cfg demo", 1280, 800);

        demo_app app(settings_path);
        app.load_settings();

        while (host.poll_events() && !app.quit_requested()) {
            // The atlas is only rebuilt outside NewFrame/Render
            if (app.update_fonts()) {
                host.reload_fonts();
            }
            host.begin_frame();
            app.render();
            host.end_frame();
        }
        return 0;
    }

} // namespace font_demo

int main(int argc, char** argv) {
    try {
        return font_demo::run(argc > 1 ? argv[1] : "font_cfg_demo.json");
    } catch (const std::exception& e) {
        LOG_ERROR("font_cfg_demo:", e.what());
        return 1;
    }
}
