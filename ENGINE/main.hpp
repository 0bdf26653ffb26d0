#pragma once

#include <SDL.h>
#include <memory>
#include <string>
#include <vector>

#include "core/app_config.hpp"
#include "core/app_paths.hpp"
#include "core/canvas_engine.hpp"
#include "ui/toolbar.hpp"
#include "utils/input.hpp"

namespace mablocks {

class CanvasRenderer;

class MainApp {

        public:
    MainApp(SDL_Window* window, SDL_Renderer* renderer, AppPaths paths, AppConfig config);
    ~MainApp();

    // Restores the autosave and queues `initial_images`.
    void setup(const std::vector<std::string>& initial_images);
    void main_loop();

        private:
    void handle_toolbar(ToolbarAction action);
    void save_to(const std::filesystem::path& path);
    void load_from(const std::filesystem::path& path);
    Viewport current_viewport() const;
    void render();

    SDL_Window*   window_   = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    AppPaths      paths_;
    AppConfig     config_;
    CanvasEngine  engine_;
    Input         input_;
    Toolbar       toolbar_;
    std::unique_ptr<CanvasRenderer> canvas_renderer_;
    bool          quit_ = false;
};

}
