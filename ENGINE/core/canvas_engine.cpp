#include "core/canvas_engine.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <utility>

#include "interaction/block_controls.hpp"
#include "interaction/drag.hpp"
#include "utils/log.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"CanvasEngine"};

constexpr float kWheelScrollStep = 48.0f;

void collect_image_paths(const Block& block, std::set<std::string>& out) {
    if (!block.is_group() && !block.path.empty()) {
        out.insert(block.path);
    }
    for (const auto& child : block.children()) {
        collect_image_paths(*child, out);
    }
}

bool beyond_slop(SDL_FPoint a, SDL_FPoint b) {
    const float slop = static_cast<float>(Input::kClickSlopPx);
    return std::fabs(a.x - b.x) > slop || std::fabs(a.y - b.y) > slop;
}

}

CanvasEngine::CanvasEngine(const AppConfig& config, DecodeQueue::DecodeFunction decoder)
    : manager_(config.max_cached_animations),
      decoder_(std::move(decoder)),
      autosave_interval_(config.autosave_interval_seconds) {}

void CanvasEngine::request_image(const std::string& path, bool full) {
    if (path.empty()) {
        return;
    }
    kLog.debug("Requesting " + std::string(full ? "full" : "first-frame") + " decode of " + path);
    decoder_.request(path, full);
}

std::size_t CanvasEngine::poll_decoded() {
    std::vector<DecodeResult> results = decoder_.drain();
    const std::size_t count = results.size();
    if (count > 0) {
        ingest(std::move(results));
    }
    return count;
}

void CanvasEngine::ingest(std::vector<DecodeResult> results) {
    if (results.empty()) {
        return;
    }
    // Measured before anything from this batch lands.
    const float current_max_h = manager_.max_block_height();

    std::vector<BlockId> added;
    for (auto& result : results) {
        if (!result.ok()) {
            kLog.error(result.error.empty() ? "Failed to load image: " + result.path : result.error);
            continue;
        }
        integrate(result, added);
    }

    if (!added.empty() && current_max_h > 0.0f) {
        for (BlockId id : added) {
            if (Block* block = manager_.find(id)) {
                block->set_preferred_size(SDL_FPoint{current_max_h * block->aspect_ratio(), current_max_h});
            }
        }
    }
    reorder_and_reflow(std::nullopt);
}

void CanvasEngine::integrate(DecodeResult& result, std::vector<BlockId>& added) {
    const bool restoring = std::any_of(manager_.blocks().begin(), manager_.blocks().end(), [&](const auto& block) {
        return block->needs_frames_for(result.path, result.full);
    });

    if (restoring) {
        std::vector<BlockId> updated;
        for (auto& block : manager_.blocks()) {
            block->populate_frames(result.path, result.frames, result.has_animation, result.full, &updated);
        }
        if (result.full) {
            for (BlockId id : updated) {
                if (manager_.find_recursive(id)) {
                    manager_.mark_animation_used(id);
                }
            }
        }
        return;
    }

    auto block = Block::make_image(manager_.allocate_id(),
                                   result.path,
                                   std::move(result.frames),
                                   scaled_size(result.original_size),
                                   result.has_animation,
                                   result.full);
    block->pos.position = SDL_FPoint{kCanvasPadding, kCanvasPadding};
    if (result.full && block->anim.frames.size() > 1) {
        block->anim.animation_enabled = true;
    }
    const BlockId id = block->id();
    manager_.push(std::move(block));
    if (result.full) {
        manager_.mark_animation_used(id);
    }
    kLog.info("Added block " + id.to_string() + " for " + result.path);
    added.push_back(id);
}

bool CanvasEngine::advance_animations(float dt_seconds) {
    bool changed = false;
    for (auto& block : manager_.blocks()) {
        if (block->update_animation(dt_seconds)) {
            changed = true;
        }
    }
    return changed;
}

std::optional<std::chrono::milliseconds> CanvasEngine::next_frame_in() const {
    std::optional<std::chrono::milliseconds> next;
    for (const auto& block : manager_.blocks()) {
        if (auto remaining = block->time_until_next_frame()) {
            next = next ? std::min(*next, *remaining) : *remaining;
        }
    }
    return next;
}

void CanvasEngine::handle_block_click(BlockId id, bool ctrl) {
    if (ctrl) {
        manager_.toggle_chain(id);
        return;
    }
    Block* block = manager_.find(id);
    if (!block || !block->anim.has_animation) {
        return;
    }
    if (!block->is_full_sequence) {
        request_image(block->path, true);
        return;
    }
    block->toggle_animation();
    if (block->anim.animation_enabled) {
        manager_.mark_animation_used(id);
    }
}

void CanvasEngine::apply_zoom(float factor) {
    if (!std::isfinite(factor) || factor <= 0.0f || factor == 1.0f) {
        return;
    }
    zoom_ = std::clamp(zoom_ * factor, kMinZoom, kMaxZoom);
}

bool CanvasEngine::set_viewport_width(float width_px) {
    float target = std::isfinite(width_px)
                       ? std::max(width_px / zoom_ - kCanvasPadding * 2.0f, kMinCanvasInnerWidth)
                       : kCanvasWorkingWidth / zoom_;
    if (std::isnan(target)) {
        target = kCanvasWorkingWidth / zoom_;
    }
    if (std::fabs(target - working_inner_width_) <= 0.5f) {
        return false;
    }
    working_inner_width_ = target;
    reflow();
    return true;
}

SDL_FPoint CanvasEngine::canvas_size(float viewport_height_px) const {
    float content_height = 0.0f;
    for (const auto& block : manager_.blocks()) {
        content_height = std::max(content_height, block->pos.position.y + block->outer_size().y);
    }
    const float min_height = viewport_height_px / zoom_;
    const float canvas_height = std::max(content_height + kCanvasPadding, min_height);
    return SDL_FPoint{(working_inner_width_ + kCanvasPadding * 2.0f) * zoom_, canvas_height * zoom_};
}

void CanvasEngine::scroll_by(SDL_FPoint delta, const Viewport& viewport) {
    const SDL_FPoint size = canvas_size(viewport.height);
    const float max_x = std::max(0.0f, size.x - viewport.width);
    const float max_y = std::max(0.0f, size.y - viewport.height);
    scroll_.x = std::clamp(scroll_.x + delta.x, 0.0f, max_x);
    scroll_.y = std::clamp(scroll_.y + delta.y, 0.0f, max_y);
}

SDL_FPoint CanvasEngine::screen_to_world(SDL_FPoint screen, const Viewport& viewport) const {
    return SDL_FPoint{(screen.x - viewport.origin.x + scroll_.x) / zoom_,
                      (screen.y - viewport.origin.y + scroll_.y) / zoom_};
}

SDL_FRect CanvasEngine::world_to_screen(const SDL_FRect& world, const Viewport& viewport) const {
    return SDL_FRect{world.x * zoom_ + viewport.origin.x - scroll_.x,
                     world.y * zoom_ + viewport.origin.y - scroll_.y,
                     world.w * zoom_,
                     world.h * zoom_};
}

void CanvasEngine::reflow() {
    manager_.reflow(working_inner_width_);
}

void CanvasEngine::reorder_and_reflow(std::optional<BlockId> leader) {
    manager_.reorder_and_reflow(leader, working_inner_width_);
}

void CanvasEngine::toggle_compact_group() {
    if (manager_.toggle_compact_group()) {
        reflow();
    }
}

void CanvasEngine::reset_all_counters() {
    manager_.reset_all_counters();
}

void CanvasEngine::increment_counter(BlockId id) {
    if (Block* block = manager_.find(id)) {
        block->increment_counter();
    }
}

void CanvasEngine::decrement_counter(BlockId id) {
    if (Block* block = manager_.find(id)) {
        block->decrement_counter();
    }
}

void CanvasEngine::close_block(BlockId id, bool cascade) {
    const std::vector<BlockId> removed = cascade ? manager_.remove_cascade(id) : manager_.remove_with_children(id);
    if (removed.empty()) {
        return;
    }
    if (resize_ && std::find(removed.begin(), removed.end(), resize_->id) != removed.end()) {
        resize_.reset();
    }
    if (drag_candidate_ && std::find(removed.begin(), removed.end(), *drag_candidate_) != removed.end()) {
        drag_candidate_.reset();
    }
    reflow();
}

void CanvasEngine::toggle_chain(BlockId id) {
    manager_.toggle_chain(id);
}

void CanvasEngine::clear_chain_group() {
    manager_.clear_chain_group();
}

void CanvasEngine::start_resize(BlockId id, SDL_FPoint screen_pointer, const Viewport& viewport) {
    if (!manager_.find(id)) {
        return;
    }
    resize_ = begin_resize(manager_, id, screen_pointer, screen_to_world(screen_pointer, viewport));
}

void CanvasEngine::update_resize(SDL_FPoint screen_pointer) {
    if (!resize_) {
        return;
    }
    if (!apply_resize(manager_, *resize_, screen_pointer, zoom_)) {
        resize_.reset();
    }
}

void CanvasEngine::finish_resize() {
    resize_.reset();
}

const Block* CanvasEngine::block_under(SDL_FPoint world) const {
    const auto& blocks = manager_.blocks();
    for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
        if ((*it)->contains(world)) {
            return it->get();
        }
    }
    return nullptr;
}

void CanvasEngine::update(const InputSnapshot& input, const Viewport& viewport, float dt_seconds) {
    poll_decoded();

    if (input.toggle_file_names) {
        toggle_file_names();
    }
    for (const auto& path : input.dropped_files) {
        request_image(path, false);
    }

    advance_animations(dt_seconds);
    manager_.enforce_chain_constraints();

    apply_zoom(input.zoom_delta);
    set_viewport_width(viewport.width);

    bool should_reflow = false;
    std::optional<BlockId> dropped_leader;

    if (input.secondary_released && resize_) {
        finish_resize();
        should_reflow = true;
    }
    if (resize_ && input.has_pointer) {
        update_resize(input.pointer);
    }

    if (input.middle_down) {
        scroll_by(SDL_FPoint{-input.pointer_delta.x, -input.pointer_delta.y}, viewport);
    }
    if (input.scroll_x != 0.0f || input.scroll_y != 0.0f) {
        scroll_by(SDL_FPoint{-input.scroll_x * kWheelScrollStep, -input.scroll_y * kWheelScrollStep}, viewport);
    }

    handle_pointer(input, viewport, should_reflow, dropped_leader);

    if (dropped_leader) {
        reorder_and_reflow(dropped_leader);
    } else if (should_reflow) {
        reflow();
    }
}

void CanvasEngine::continue_drag(BlockId id,
                                 const InputSnapshot& input,
                                 const Viewport& viewport,
                                 bool& should_reflow,
                                 std::optional<BlockId>& dropped_leader) {
    if (input.primary_down && input.has_pointer) {
        float edge_scroll = 0.0f;
        if (input.pointer.y < viewport.origin.y) {
            edge_scroll = input.pointer.y - viewport.origin.y;
        } else if (input.pointer.y > viewport.origin.y + viewport.height) {
            edge_scroll = input.pointer.y - (viewport.origin.y + viewport.height);
        }
        if (edge_scroll != 0.0f) {
            scroll_by(SDL_FPoint{0.0f, edge_scroll}, viewport);
        }
        drag_to(manager_, id, screen_to_world(input.pointer, viewport));
    }

    const SDL_FPoint world = screen_to_world(input.pointer, viewport);
    if (!input.primary_down) {
        const DropOutcome outcome = end_drag(manager_, id, world);
        drop_target_.reset();
        if (outcome.target_group) {
            should_reflow = true;
        } else {
            dropped_leader = outcome.reorder_leader;
        }
        return;
    }
    drop_target_ = hovered_drop_target(manager_, world);
}

void CanvasEngine::handle_pointer(const InputSnapshot& input,
                                  const Viewport& viewport,
                                  bool& should_reflow,
                                  std::optional<BlockId>& dropped_leader) {
    if (auto dragging = dragging_block(manager_)) {
        continue_drag(*dragging, input, viewport, should_reflow, dropped_leader);
        return;
    }
    drop_target_.reset();

    const bool in_canvas = input.has_pointer && input.pointer.y >= viewport.origin.y &&
                           input.pointer.y <= viewport.origin.y + viewport.height &&
                           input.pointer.x >= viewport.origin.x &&
                           input.pointer.x <= viewport.origin.x + viewport.width;
    if (!in_canvas) {
        if (!input.primary_down) {
            drag_candidate_.reset();
        }
        return;
    }

    const SDL_FPoint world = screen_to_world(input.pointer, viewport);
    const Block* hit = block_under(world);
    if (hit) {
        const BlockId id = hit->id();
        const ControlHover hover = control_hover(control_rects(world_to_screen(hit->rect(), viewport), zoom_),
                                                 input.pointer, input.has_pointer, hit->is_group());

        if (input.primary_clicked && hover.close) {
            close_block(id, input.shift);
            drag_candidate_.reset();
            return;
        }
        if (input.primary_clicked && hover.chain) {
            toggle_chain(id);
        } else if (input.primary_clicked && hover.counter) {
            increment_counter(id);
        }
        if (input.secondary_clicked && hover.counter) {
            decrement_counter(id);
        }
        if (input.secondary_pressed && !hover.any()) {
            start_resize(id, input.pointer, viewport);
        }
        if (input.primary_pressed && !hover.any()) {
            drag_candidate_ = id;
            drag_press_screen_ = input.pointer;
            drag_press_world_ = world;
        }
        if (input.primary_clicked && !hover.any()) {
            handle_block_click(id, input.ctrl);
        }
    } else if (input.primary_clicked) {
        clear_chain_group();
    }

    if (drag_candidate_ && input.primary_down && beyond_slop(drag_press_screen_, input.pointer)) {
        const BlockId leader = *drag_candidate_;
        drag_candidate_.reset();
        if (begin_drag(manager_, leader, drag_press_world_)) {
            drag_to(manager_, leader, world);
            drop_target_ = hovered_drop_target(manager_, world);
        }
    }
    if (!input.primary_down) {
        drag_candidate_.reset();
    }
}

void CanvasEngine::save_session(const std::filesystem::path& path) const {
    session::save(path, manager_, zoom_, show_file_names_);
}

void CanvasEngine::load_session(const std::filesystem::path& path) {
    apply_session(session::load(path));
}

void CanvasEngine::apply_session(session::SessionData data) {
    std::set<std::string> paths;
    for (const auto& block : data.blocks) {
        collect_image_paths(*block, paths);
    }

    manager_.restore(std::move(data.blocks), std::move(data.remembered_chains), std::move(data.history));
    zoom_ = std::clamp(data.zoom, kMinZoom, kMaxZoom);
    show_file_names_ = data.show_file_names;
    resize_.reset();
    drag_candidate_.reset();
    drop_target_.reset();
    scroll_ = SDL_FPoint{0.0f, 0.0f};

    for (const auto& path : paths) {
        request_image(path, false);
    }
    reorder_and_reflow(std::nullopt);
}

void CanvasEngine::set_autosave(std::filesystem::path path, double interval_seconds) {
    autosave_path_ = std::move(path);
    if (std::isfinite(interval_seconds) && interval_seconds > 0.0) {
        autosave_interval_ = interval_seconds;
    }
}

bool CanvasEngine::tick_autosave(double now_seconds) {
    if (!autosave_path_ || now_seconds - last_autosave_ <= autosave_interval_) {
        return false;
    }
    last_autosave_ = now_seconds;
    try {
        save_session(*autosave_path_);
        kLog.info("Auto-saved session");
        return true;
    } catch (const std::runtime_error& ex) {
        kLog.error(std::string("Auto-save failed: ") + ex.what());
        return false;
    }
}

}
