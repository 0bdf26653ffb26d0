#include "blocks/block.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <utility>

#include "core/constants.hpp"
#include "utils/display_color.hpp"

namespace mablocks {

Block::Block(BlockId id, bool is_group, float aspect_ratio)
    : color(display_color::color_from_id(id)),
      id_(id),
      is_group_(is_group),
      aspect_ratio_(aspect_ratio) {}

std::unique_ptr<Block> Block::make_image(BlockId id,
                                         std::string source_path,
                                         FrameList frames,
                                         SDL_FPoint size,
                                         bool has_animation,
                                         bool full_sequence) {
    const float ratio = (size.y > 0.0f && std::isfinite(size.x / size.y)) ? size.x / size.y : 1.0f;
    std::unique_ptr<Block> block(new Block(id, false, ratio));
    block->path = std::move(source_path);
    block->anim.frames = std::move(frames);
    block->anim.has_animation = has_animation;
    block->image_size = size;
    block->preferred_image_size = size;
    block->is_full_sequence = full_sequence;
    return block;
}

std::unique_ptr<Block> Block::make_group(BlockId id, BlockList children) {
    std::unique_ptr<Block> group(new Block(id, true, 1.0f));
    group->image_size = SDL_FPoint{kDefaultGroupSize, kDefaultGroupSize};
    group->preferred_image_size = group->image_size;
    group->is_full_sequence = true;
    for (auto& child : children) {
        group->adopt_child(std::move(child));
    }
    group->update_group_name();
    return group;
}

SDL_FPoint Block::outer_size() const {
    return SDL_FPoint{image_size.x + kBlockPadding * 2.0f, image_size.y + kBlockPadding * 2.0f};
}

SDL_FRect Block::rect() const {
    const SDL_FPoint outer = outer_size();
    return SDL_FRect{pos.position.x, pos.position.y, outer.x, outer.y};
}

SDL_FPoint Block::center() const {
    const SDL_FRect r = rect();
    return SDL_FPoint{r.x + r.w * 0.5f, r.y + r.h * 0.5f};
}

bool Block::contains(SDL_FPoint world) const {
    const SDL_FRect r = rect();
    return world.x >= r.x && world.x <= r.x + r.w && world.y >= r.y && world.y <= r.y + r.h;
}

void Block::set_preferred_size(SDL_FPoint size) {
    preferred_image_size = size;
    image_size = size;
}

void Block::reset_to_preferred_size() {
    image_size = preferred_image_size;
}

void Block::constrain_to_width(float max_width) {
    if (image_size.x <= max_width + std::numeric_limits<float>::epsilon()) {
        return;
    }
    const float width = std::max(max_width, 1.0f);
    image_size = SDL_FPoint{width, width / aspect_ratio_};
}

bool Block::update_animation(float dt_seconds) {
    if (!anim.animation_enabled || anim.frames.size() <= 1) {
        return false;
    }
    anim.frame_elapsed += std::chrono::duration<double>(std::max(dt_seconds, 0.0f));

    bool updated = false;
    for (;;) {
        const auto frame_duration = std::chrono::duration<double, std::milli>(
            std::max(anim.frames[anim.current_frame].duration, std::chrono::milliseconds(1)));
        if (anim.frame_elapsed < frame_duration) {
            break;
        }
        anim.frame_elapsed -= frame_duration;
        anim.current_frame = (anim.current_frame + 1) % anim.frames.size();
        updated = true;
    }
    return updated;
}

std::optional<std::chrono::milliseconds> Block::time_until_next_frame() const {
    if (!anim.animation_enabled || anim.frames.size() <= 1) {
        return std::nullopt;
    }
    const auto frame_duration = std::chrono::duration<double, std::milli>(anim.frames[anim.current_frame].duration);
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(frame_duration - anim.frame_elapsed);
    if (remaining.count() <= 0) {
        return std::chrono::milliseconds(1);
    }
    return remaining;
}

void Block::toggle_animation() {
    if (anim.frames.size() <= 1) {
        return;
    }
    anim.animation_enabled = !anim.animation_enabled;
    if (!anim.animation_enabled) {
        stop_animation();
    }
}

void Block::stop_animation() {
    anim.animation_enabled = false;
    anim.current_frame = 0;
    anim.frame_elapsed = std::chrono::duration<double, std::milli>(0.0);
}

bool Block::truncate_to_first_frame() {
    if (!is_full_sequence || anim.frames.size() <= 1) {
        return false;
    }
    anim.frames.resize(1);
    is_full_sequence = false;
    stop_animation();
    return true;
}

const AnimationFrame* Block::visible_frame() const {
    if (anim.frames.empty()) {
        return nullptr;
    }
    return &anim.frames[std::min(anim.current_frame, anim.frames.size() - 1)];
}

void Block::increment_counter() {
    if (is_group_) return;
    ++counter;
}

void Block::decrement_counter() {
    if (is_group_) return;
    counter = std::max(counter - 1, 0);
}

void Block::reset_counters_recursive() {
    counter = 0;
    for (auto& child : group_.children) {
        child->reset_counters_recursive();
    }
}

std::string Block::file_name() const {
    const std::string name = std::filesystem::path(path).filename().string();
    return name.empty() ? std::string("unnamed") : name;
}

std::string Block::display_name() const {
    return is_group_ ? group_.group_name : file_name();
}

void Block::update_group_name() {
    if (!is_group_) {
        return;
    }
    const std::size_t count = group_.children.size();
    if (count > 1) {
        group_.group_name = "Group of " + std::to_string(count);
    } else if (count == 1) {
        group_.group_name = "Box: " + group_.children.front()->file_name();
    } else {
        group_.group_name = "Empty Group";
    }
}

void Block::set_group_name(std::string name) {
    if (is_group_) {
        group_.group_name = std::move(name);
    }
}

void Block::adopt_child(std::unique_ptr<Block> child) {
    if (!child) {
        throw std::invalid_argument("Block::adopt_child: null child");
    }
    if (!is_group_) {
        throw std::invalid_argument("Block::adopt_child: block " + id_.to_string() + " is not a group");
    }
    if (child->is_group()) {
        throw std::invalid_argument("Block::adopt_child: group " + child->id().to_string() +
                                    " cannot be nested inside group " + id_.to_string());
    }
    child->pos.is_dragging = false;
    child->chained = false;
    group_.children.push_back(std::move(child));
    update_group_name();
}

BlockList Block::release_children() {
    BlockList out;
    out.swap(group_.children);
    update_group_name();
    return out;
}

int Block::depth() const {
    int deepest = 0;
    for (const auto& child : group_.children) {
        deepest = std::max(deepest, child->depth());
    }
    return deepest + 1;
}

void Block::collect_ids(std::vector<BlockId>& out) const {
    out.push_back(id_);
    for (const auto& child : group_.children) {
        child->collect_ids(out);
    }
}

bool Block::needs_frames_for(const std::string& source_path, bool full) const {
    if (!is_group_ && path == source_path) {
        if (anim.frames.empty() || (full && !is_full_sequence)) {
            return true;
        }
    }
    return std::any_of(group_.children.begin(), group_.children.end(), [&](const auto& child) {
        return child->needs_frames_for(source_path, full);
    });
}

bool Block::populate_frames(const std::string& source_path,
                            const FrameList& frames,
                            bool has_animation,
                            bool full,
                            std::vector<BlockId>* updated) {
    bool any = false;
    if (!is_group_ && path == source_path && !frames.empty()) {
        if (full && !is_full_sequence) {
            anim.frames = frames;
            anim.has_animation = has_animation;
            is_full_sequence = true;
            stop_animation();
            anim.animation_enabled = anim.frames.size() > 1;
            any = true;
        } else if (anim.frames.empty()) {
            anim.frames = frames;
            anim.has_animation = has_animation;
            is_full_sequence = full;
            stop_animation();
            any = true;
        }
        if (any && updated) {
            updated->push_back(id_);
        }
    }
    for (auto& child : group_.children) {
        if (child->populate_frames(source_path, frames, has_animation, full, updated)) {
            any = true;
        }
    }
    return any;
}

int Block::row_index(float y) {
    if (std::isnan(y)) {
        return 0;
    }
    y = std::clamp(y, -kMaxCanvasCoordinate, kMaxCanvasCoordinate);
    return static_cast<int>(y / kRowQuantizationHeight);
}

bool Block::layout_less(const Block& a, const Block& b) {
    if (a.is_group() != b.is_group()) {
        return a.is_group();
    }
    const int a_row = row_index(a.pos.position.y);
    const int b_row = row_index(b.pos.position.y);
    if (a_row != b_row) {
        return a_row < b_row;
    }
    return a.pos.position.x < b.pos.position.x;
}

}
