#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <SDL.h>

#include "blocks/animation_frame.hpp"
#include "blocks/block_id.hpp"

namespace mablocks {

class Block;
using BlockList = std::vector<std::unique_ptr<Block>>;

struct BlockPosition {
    SDL_FPoint position{0.0f, 0.0f};
    SDL_FPoint drag_offset{0.0f, 0.0f};
    bool is_dragging = false;
};

struct AnimationState {
    FrameList frames;
    std::size_t current_frame = 0;
    std::chrono::duration<double, std::milli> frame_elapsed{0.0};
    bool animation_enabled = false;
    bool has_animation = false;
};

struct GroupData {
    std::string group_name;
    BlockList children;
};

// A positioned tile: either one image (with optional animation frames) or a
// group holding an ordered list of image blocks. Groups never contain groups.
class Block {
public:
    static std::unique_ptr<Block> make_image(BlockId id,
                                             std::string path,
                                             FrameList frames,
                                             SDL_FPoint image_size,
                                             bool has_animation,
                                             bool is_full_sequence);
    static std::unique_ptr<Block> make_group(BlockId id, BlockList children);

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

    BlockId id() const { return id_; }
    bool is_group() const { return is_group_; }
    float aspect_ratio() const { return aspect_ratio_; }

    SDL_FPoint outer_size() const;
    SDL_FRect rect() const;
    SDL_FPoint center() const;
    bool contains(SDL_FPoint world) const;

    void set_preferred_size(SDL_FPoint size);
    void reset_to_preferred_size();
    void constrain_to_width(float max_width);

    bool update_animation(float dt_seconds);
    std::optional<std::chrono::milliseconds> time_until_next_frame() const;
    void toggle_animation();
    void stop_animation();
    bool truncate_to_first_frame();
    const AnimationFrame* visible_frame() const;

    void increment_counter();
    void decrement_counter();
    void reset_counters_recursive();

    std::string file_name() const;
    std::string display_name() const;
    void update_group_name();
    void set_group_name(std::string name);

    const BlockList& children() const { return group_.children; }
    std::size_t child_count() const { return group_.children.size(); }
    void adopt_child(std::unique_ptr<Block> child);
    BlockList release_children();
    int depth() const;
    void collect_ids(std::vector<BlockId>& out) const;

    bool needs_frames_for(const std::string& source_path, bool full) const;
    bool populate_frames(const std::string& source_path,
                         const FrameList& frames,
                         bool has_animation,
                         bool full,
                         std::vector<BlockId>* updated = nullptr);

    static int row_index(float y);
    static bool layout_less(const Block& a, const Block& b);

    std::string path;
    BlockPosition pos;
    AnimationState anim;
    SDL_FPoint image_size{0.0f, 0.0f};
    SDL_FPoint preferred_image_size{0.0f, 0.0f};
    SDL_Color color{255, 255, 255, 255};
    bool chained = false;
    int counter = 0;
    bool is_full_sequence = false;

private:
    Block(BlockId id, bool is_group, float aspect_ratio);

    BlockId id_;
    bool is_group_ = false;
    float aspect_ratio_ = 1.0f;
    GroupData group_;
};

}
