// FastDAQ live view
// Uses Dear ImGui with SDL2 + OpenGL 2.1, or the SDL renderer with --software

#include "app.hpp"
#include "fastdaq/logging.hpp"

#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl2.h"
#include "imgui_impl_sdlrenderer2.h"

#include <SDL.h>
#include <SDL_opengl.h>

#include <cstdio>
#include <iostream>
#include <string>

namespace {

void printHelp() {
    std::cout << "fastdaq_gui - live view for the acquisition pipeline\n\n";
    std::cout << "  --config <file>   Load key=value settings at startup\n";
    std::cout << "  --start           Start acquiring immediately\n";
    std::cout << "  --software        Use the SDL renderer instead of OpenGL\n";
    std::cout << "  -v, --verbose     Debug logging\n";
}

int failStartup(const std::string& msg) {
    LOG_GUI(ERROR, "%s", msg.c_str());
    std::cerr << msg << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    // INFO keeps per-frame DEBUG output from slowing the UI
    fastdaq::setLogLevel(fastdaq::LogLevel::INFO);
    fastdaq::initLogLevelFromEnv();

    fastdaq::gui::App::Options opts;
    bool force_software_renderer = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                opts.config_path = argv[++i];
            }
        } else if (arg == "--start") {
            opts.autostart = true;
        } else if (arg == "--software" || arg == "-sw") {
            force_software_renderer = true;
        } else if (arg == "--opengl" || arg == "--gl") {
            force_software_renderer = false;
        } else if (arg == "--verbose" || arg == "-v") {
            fastdaq::setLogLevel(fastdaq::LogLevel::DEBUG);
        } else if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        }
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        const char* sdl_err = SDL_GetError();
        return failStartup(std::string("SDL_Init failed: ") + (sdl_err ? sdl_err : "<unknown>"));
    }

    SDL_Window* window = nullptr;
    SDL_GLContext gl_context = nullptr;
    SDL_Renderer* sdl_renderer = nullptr;
    bool using_software_renderer = force_software_renderer;

    auto cleanupSdl = [&]() {
        if (sdl_renderer) {
            SDL_DestroyRenderer(sdl_renderer);
            sdl_renderer = nullptr;
        }
        if (gl_context) {
            SDL_GL_DeleteContext(gl_context);
            gl_context = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }
        SDL_Quit();
    };

    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!using_software_renderer) {
        SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
        SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
        SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 2);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 1);
        window_flags = (SDL_WindowFlags)(window_flags | SDL_WINDOW_OPENGL);
    }

    window = SDL_CreateWindow("FastDAQ", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              1280, 800, window_flags);
    if (!window) {
        const char* sdl_err = SDL_GetError();
        std::string msg = std::string("SDL_CreateWindow failed: ") + (sdl_err ? sdl_err : "<unknown>");
        cleanupSdl();
        return failStartup(msg);
    }

    if (using_software_renderer) {
        sdl_renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!sdl_renderer) {
            LOG_GUI(WARN, "Accelerated SDL renderer unavailable (%s), using software", SDL_GetError());
            sdl_renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
        }
        if (!sdl_renderer) {
            const char* sdl_err = SDL_GetError();
            std::string msg = std::string("SDL_CreateRenderer failed: ") + (sdl_err ? sdl_err : "<unknown>");
            cleanupSdl();
            return failStartup(msg);
        }
    } else {
        gl_context = SDL_GL_CreateContext(window);
        if (!gl_context) {
            const char* sdl_err = SDL_GetError();
            std::string msg = std::string("SDL_GL_CreateContext failed: ") + (sdl_err ? sdl_err : "<unknown>");
            cleanupSdl();
            return failStartup(msg);
        }
        SDL_GL_MakeCurrent(window, gl_context);
        if (SDL_GL_SetSwapInterval(1) != 0) {
            LOG_GUI(WARN, "SDL_GL_SetSwapInterval failed/non-vsync: %s", SDL_GetError());
        }
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;

    bool backend_ok;
    if (using_software_renderer) {
        backend_ok = ImGui_ImplSDL2_InitForSDLRenderer(window, sdl_renderer) &&
                     ImGui_ImplSDLRenderer2_Init(sdl_renderer);
    } else {
        backend_ok = ImGui_ImplSDL2_InitForOpenGL(window, gl_context) &&
                     ImGui_ImplOpenGL2_Init();
    }
    if (!backend_ok) {
        ImGui::DestroyContext();
        cleanupSdl();
        return failStartup("ImGui backend initialisation failed");
    }
    LOG_GUI(INFO, "UI ready (%s renderer)", using_software_renderer ? "SDL" : "OpenGL");

    int exit_code = 0;
    try {
        fastdaq::gui::App app(opts);

        bool running = true;
        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL2_ProcessEvent(&event);

                if (event.type == SDL_QUIT) {
                    running = false;
                }
                if (event.type == SDL_WINDOWEVENT &&
                    event.window.event == SDL_WINDOWEVENT_CLOSE &&
                    event.window.windowID == SDL_GetWindowID(window)) {
                    running = false;
                }
            }

            if (using_software_renderer) {
                ImGui_ImplSDLRenderer2_NewFrame();
            } else {
                ImGui_ImplOpenGL2_NewFrame();
            }
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            app.render();

            ImGui::Render();
            if (using_software_renderer) {
                SDL_SetRenderDrawColor(sdl_renderer, 26, 26, 31, 255);
                SDL_RenderClear(sdl_renderer);
                ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), sdl_renderer);
                SDL_RenderPresent(sdl_renderer);
            } else {
                glViewport(0, 0, (int)io.DisplaySize.x, (int)io.DisplaySize.y);
                glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
                glClear(GL_COLOR_BUFFER_BIT);
                ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());
                SDL_GL_SwapWindow(window);
            }
        }
    } catch (const std::exception& e) {
        LOG_GUI(ERROR, "Fatal: %s", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 2;
    }

    if (using_software_renderer) {
        ImGui_ImplSDLRenderer2_Shutdown();
    } else {
        ImGui_ImplOpenGL2_Shutdown();
    }
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    cleanupSdl();
    return exit_code;
}
