#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <SDL.h>

#include "blocks/block_manager.hpp"
#include "core/app_config.hpp"
#include "core/constants.hpp"
#include "interaction/resize.hpp"
#include "loader/decode_queue.hpp"
#include "persistence/session_store.hpp"
#include "utils/input.hpp"

namespace mablocks {

// Screen area the canvas is drawn into.
struct Viewport {
    SDL_FPoint origin{0.0f, static_cast<float>(kToolbarHeight)};
    float      width = static_cast<float>(kInitialWindowWidth);
    float      height = static_cast<float>(kInitialWindowHeight - kToolbarHeight);
};

// Single-threaded owner of the canvas state. Everything here runs on the
// thread that calls update(); only the decode queue does work elsewhere.
class CanvasEngine {
public:
    explicit CanvasEngine(const AppConfig& config = AppConfig::defaults(),
                          DecodeQueue::DecodeFunction decoder = decode_image);

    CanvasEngine(const CanvasEngine&) = delete;
    CanvasEngine& operator=(const CanvasEngine&) = delete;

    BlockManager& manager() { return manager_; }
    const BlockManager& manager() const { return manager_; }

    void request_image(const std::string& path, bool full = false);
    std::size_t poll_decoded();
    void ingest(std::vector<DecodeResult> results);
    bool is_decoding() const { return decoder_.is_busy(); }
    void wait_for_decodes() { decoder_.wait_idle(); }

    bool advance_animations(float dt_seconds);
    std::optional<std::chrono::milliseconds> next_frame_in() const;

    // Ctrl toggles chain membership. Otherwise an animated block either
    // starts/stops playback or, when only its first frame is loaded, asks
    // the decoder for the full sequence.
    void handle_block_click(BlockId id, bool ctrl);

    float zoom() const { return zoom_; }
    void apply_zoom(float factor);
    float working_inner_width() const { return working_inner_width_; }
    bool set_viewport_width(float width_px);
    SDL_FPoint canvas_size(float viewport_height_px) const;
    SDL_FPoint scroll() const { return scroll_; }
    void scroll_by(SDL_FPoint delta, const Viewport& viewport);
    SDL_FPoint screen_to_world(SDL_FPoint screen, const Viewport& viewport) const;
    SDL_FRect world_to_screen(const SDL_FRect& world, const Viewport& viewport) const;
    bool show_file_names() const { return show_file_names_; }
    void toggle_file_names() { show_file_names_ = !show_file_names_; }

    void reflow();
    void reorder_and_reflow(std::optional<BlockId> leader);
    void toggle_compact_group();
    void reset_all_counters();
    void increment_counter(BlockId id);
    void decrement_counter(BlockId id);
    void close_block(BlockId id, bool cascade);
    void toggle_chain(BlockId id);
    void clear_chain_group();

    void start_resize(BlockId id, SDL_FPoint screen_pointer, const Viewport& viewport);
    void update_resize(SDL_FPoint screen_pointer);
    void finish_resize();
    const std::optional<ResizeState>& resize_state() const { return resize_; }
    std::optional<BlockId> drop_target() const { return drop_target_; }

    void update(const InputSnapshot& input, const Viewport& viewport, float dt_seconds);

    // Throws std::runtime_error; a failed load leaves the canvas untouched.
    void save_session(const std::filesystem::path& path) const;
    void load_session(const std::filesystem::path& path);
    void apply_session(session::SessionData data);

    void set_autosave(std::filesystem::path path, double interval_seconds);
    bool tick_autosave(double now_seconds);

private:
    void handle_pointer(const InputSnapshot& input,
                        const Viewport& viewport,
                        bool& should_reflow,
                        std::optional<BlockId>& dropped_leader);
    void continue_drag(BlockId id,
                       const InputSnapshot& input,
                       const Viewport& viewport,
                       bool& should_reflow,
                       std::optional<BlockId>& dropped_leader);
    const Block* block_under(SDL_FPoint world) const;
    void integrate(DecodeResult& result, std::vector<BlockId>& added);

    BlockManager manager_;
    DecodeQueue  decoder_;

    float      zoom_ = 1.0f;
    float      working_inner_width_ = kCanvasWorkingWidth;
    SDL_FPoint scroll_{0.0f, 0.0f};
    bool       show_file_names_ = false;

    std::optional<ResizeState> resize_;
    std::optional<BlockId>     drag_candidate_;
    SDL_FPoint                 drag_press_screen_{0.0f, 0.0f};
    SDL_FPoint                 drag_press_world_{0.0f, 0.0f};
    std::optional<BlockId>     drop_target_;

    std::optional<std::filesystem::path> autosave_path_;
    double autosave_interval_ = kAutosaveIntervalSeconds;
    double last_autosave_ = 0.0;
};

}
