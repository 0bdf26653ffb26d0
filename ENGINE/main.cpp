#include "main.hpp"

#include <SDL.h>
#include <SDL_image.h>
#include <SDL_ttf.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "render/canvas_renderer.hpp"
#include "ui/styles.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

namespace {

const mablocks::log::Channel kMainLog{"Main"};

}

#if defined(_WIN32)
extern "C" {
        __declspec(dllexport) int AmdPowerXpressRequestHighPerformance = 1;
        __declspec(dllexport) int NvOptimusEnablement                = 0x00000001;
}
#endif

namespace mablocks {

namespace {

const log::Channel kLog{"MainApp"};

constexpr Uint32 kIdleWaitMs = 100;

double seconds_now() {
    return static_cast<double>(SDL_GetTicks64()) / 1000.0;
}

}

MainApp::MainApp(SDL_Window* window, SDL_Renderer* renderer, AppPaths paths, AppConfig config)
: window_(window),
  renderer_(renderer),
  paths_(std::move(paths)),
  config_(std::move(config)),
  engine_(config_),
  canvas_renderer_(std::make_unique<CanvasRenderer>(renderer)) {
        engine_.set_autosave(paths_.autosave_file(), config_.autosave_interval_seconds);
}

MainApp::~MainApp() = default;

void MainApp::setup(const std::vector<std::string>& initial_images) {
        const fs::path autosave = paths_.autosave_file();
        std::error_code ec;
        if (fs::exists(autosave, ec)) {
                load_from(autosave);
        }
        for (const auto& path : initial_images) {
                engine_.request_image(path, false);
        }
        int w = 0;
        SDL_GetWindowSize(window_, &w, nullptr);
        toolbar_.layout(w);
}

Viewport MainApp::current_viewport() const {
        int w = 0;
        int h = 0;
        SDL_GetRendererOutputSize(renderer_, &w, &h);
        Viewport viewport;
        viewport.width = static_cast<float>(w);
        viewport.height = static_cast<float>(std::max(h - kToolbarHeight, 0));
        return viewport;
}

void MainApp::save_to(const fs::path& path) {
        try {
                engine_.save_session(path);
        } catch (const std::runtime_error& ex) {
                kLog.error(std::string("Save failed: ") + ex.what());
        }
}

void MainApp::load_from(const fs::path& path) {
        try {
                engine_.load_session(path);
        } catch (const std::runtime_error& ex) {
                kLog.error(std::string("Load failed: ") + ex.what());
        }
}

void MainApp::handle_toolbar(ToolbarAction action) {
        switch (action) {
                case ToolbarAction::Save:
                        save_to(paths_.default_session_file());
                        break;
                case ToolbarAction::Load:
                        load_from(paths_.default_session_file());
                        break;
                case ToolbarAction::ResetCounters:
                        engine_.reset_all_counters();
                        break;
                case ToolbarAction::BoxUnbox:
                        engine_.toggle_compact_group();
                        break;
                case ToolbarAction::ToggleFileNames:
                        engine_.toggle_file_names();
                        break;
                case ToolbarAction::None:
                        break;
        }
}

void MainApp::render() {
        SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
        SDL_RenderClear(renderer_);
        canvas_renderer_->render(engine_, current_viewport(), input_.snapshot());
        toolbar_.set_file_names_shown(engine_.show_file_names());
        toolbar_.render(renderer_);
        SDL_RenderPresent(renderer_);
}

void MainApp::main_loop() {
        Uint64 last_ticks = SDL_GetTicks64();
        while (!quit_) {
                // Sleep until the next event, frame or decode; the canvas is
                // otherwise static.
                Uint32 wait_ms = kIdleWaitMs;
                if (auto next = engine_.next_frame_in()) {
                        wait_ms = static_cast<Uint32>(std::clamp<long long>(next->count(), 1, kIdleWaitMs));
                }
                if (engine_.is_decoding() || engine_.manager().any_dragging() || engine_.resize_state()) {
                        wait_ms = 1;
                }

                SDL_Event e;
                if (SDL_WaitEventTimeout(&e, static_cast<int>(wait_ms))) {
                        do {
                                if (e.type == SDL_QUIT) {
                                        quit_ = true;
                                }
                                if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                                        toolbar_.layout(e.window.data1);
                                }
                                input_.handleEvent(e);
                        } while (SDL_PollEvent(&e));
                }
                input_.update();
                const InputSnapshot& input = input_.snapshot();

                const SDL_Point pointer{static_cast<int>(input.pointer.x), static_cast<int>(input.pointer.y)};
                handle_toolbar(toolbar_.handle_pointer(pointer, input.has_pointer, input.primary_clicked));

                const Uint64 now_ticks = SDL_GetTicks64();
                const float dt = static_cast<float>(now_ticks - last_ticks) / 1000.0f;
                last_ticks = now_ticks;

                engine_.update(input, current_viewport(), dt);
                engine_.tick_autosave(seconds_now());
                render();
        }
        save_to(paths_.autosave_file());
}

}

int main(int argc, char* argv[]) {
        mablocks::log::reset_time_origin();
        kMainLog.info("Starting MaBlocks...");

        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
                mablocks::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
                return 1;
        }

        if (SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "best") != SDL_TRUE) {
                if (SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "2") != SDL_TRUE) {
                        SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1");
                }
        }
        SDL_EventState(SDL_DROPFILE, SDL_ENABLE);

        if (TTF_Init() < 0) {
                mablocks::log::error(std::string("TTF_Init failed: ") + TTF_GetError());
                SDL_Quit();
                return 1;
        }

        const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG | IMG_INIT_TIF | IMG_INIT_WEBP;
        if (!(IMG_Init(img_flags) & (IMG_INIT_PNG | IMG_INIT_JPG))) {
                mablocks::log::error(std::string("IMG_Init failed: ") + IMG_GetError());
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        auto discovered = mablocks::AppPaths::discover();
        mablocks::AppPaths paths = discovered ? *discovered : mablocks::AppPaths::at(fs::current_path() / "mablocks_data");
        try {
                paths.ensure_dirs_exist();
        } catch (const std::runtime_error& ex) {
                kMainLog.error(ex.what());
                IMG_Quit();
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        mablocks::AppConfig config = mablocks::load_config(paths.settings_file());
        mablocks::Styles::configure_label_font(config.font_path, config.label_font_size);

        SDL_Window* window = SDL_CreateWindow("MaBlocks", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                              config.window_width, config.window_height,
                                              SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
        if (!window) {
                mablocks::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                IMG_Quit();
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_Renderer* renderer =
                SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
                mablocks::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                SDL_DestroyWindow(window);
                IMG_Quit();
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_RendererInfo info;
        SDL_GetRendererInfo(renderer, &info);
        kMainLog.info(std::string("Renderer: ") + (info.name ? info.name : "Unknown"));

        std::vector<std::string> initial_images;
        for (int i = 1; i < argc; ++i) {
                if (argv[i] && *argv[i]) initial_images.emplace_back(argv[i]);
        }

        {
                mablocks::MainApp app(window, renderer, paths, config);
                app.setup(initial_images);
                app.main_loop();
        }

        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        kMainLog.info("Exited cleanly.");
        return 0;
}
