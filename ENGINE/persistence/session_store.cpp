#include "persistence/session_store.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "blocks/block_manager.hpp"
#include "core/constants.hpp"
#include "persistence/json_file.hpp"
#include "utils/display_color.hpp"
#include "utils/log.hpp"

namespace mablocks::session {

namespace {

const log::Channel kLog{"SessionStore"};

using nlohmann::json;

std::optional<BlockId> parse_id(const json& value) {
    if (value.is_number_unsigned()) {
        return BlockId{value.get<std::uint64_t>()};
    }
    if (value.is_number_integer()) {
        const auto raw = value.get<std::int64_t>();
        if (raw > 0) return BlockId{static_cast<std::uint64_t>(raw)};
        return std::nullopt;
    }
    if (value.is_string()) {
        try {
            std::size_t consumed = 0;
            const std::string& text = value.get_ref<const std::string&>();
            const auto raw = std::stoull(text, &consumed);
            if (consumed == text.size() && raw > 0) return BlockId{raw};
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

SDL_FPoint read_pair(const json& node, const char* key, SDL_FPoint fallback) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_array() || it->size() < 2) {
        return fallback;
    }
    const json& x = (*it)[0];
    const json& y = (*it)[1];
    if (!x.is_number() || !y.is_number()) {
        return fallback;
    }
    const double px = x.get<double>();
    const double py = y.get<double>();
    if (!std::isfinite(px) || !std::isfinite(py)) {
        return fallback;
    }
    const double limit = kMaxCanvasCoordinate;
    return SDL_FPoint{static_cast<float>(std::clamp(px, -limit, limit)),
                      static_cast<float>(std::clamp(py, -limit, limit))};
}

SDL_FPoint sanitize_size(SDL_FPoint size) {
    if (!std::isfinite(size.x) || size.x <= 0.0f) size.x = kMinBlockSize;
    if (!std::isfinite(size.y) || size.y <= 0.0f) size.y = kMinBlockSize;
    return size;
}

json pair_to_json(SDL_FPoint p) {
    return json::array({p.x, p.y});
}

class SkeletonBuilder {
public:
    std::unique_ptr<Block> build(const json& node) {
        if (!node.is_object()) {
            kLog.warn("Skipping block entry that is not an object.");
            return nullptr;
        }
        const auto id = parse_id(node.value("id", json()));
        if (!id) {
            kLog.warn("Skipping block entry without a valid id.");
            return nullptr;
        }
        if (!seen_.insert(*id).second) {
            kLog.warn("Skipping duplicate block id " + id->to_string() + ".");
            return nullptr;
        }
        return node.value("is_group", false) ? build_group(node, *id) : build_image(node, *id);
    }

private:
    std::unique_ptr<Block> build_image(const json& node, BlockId id) {
        const std::string path = node.value("path", std::string());
        if (path.empty()) {
            kLog.warn("Skipping image block " + id.to_string() + " with an empty path.");
            return nullptr;
        }
        const SDL_FPoint size = sanitize_size(read_pair(node, "size", SDL_FPoint{kMinBlockSize, kMinBlockSize}));
        auto block = Block::make_image(id, path, FrameList{}, size, false, false);
        apply_common(*block, node, size);
        block->counter = std::max(node.value("counter", 0), 0);
        return block;
    }

    std::unique_ptr<Block> build_group(const json& node, BlockId id) {
        BlockList children;
        auto it = node.find("children");
        if (it != node.end() && it->is_array()) {
            for (const auto& child_node : *it) {
                auto child = build(child_node);
                if (!child) continue;
                if (child->is_group()) {
                    kLog.warn("Flattening nested group " + child->id().to_string() +
                              " into group " + id.to_string() + ".");
                    for (auto& grandchild : child->release_children()) {
                        children.push_back(std::move(grandchild));
                    }
                    continue;
                }
                children.push_back(std::move(child));
            }
        }

        const SDL_FPoint size = sanitize_size(read_pair(node, "size", SDL_FPoint{kDefaultGroupSize, kDefaultGroupSize}));
        auto group = Block::make_group(id, std::move(children));
        const std::string name = node.value("group_name", std::string());
        apply_common(*group, node, size);
        if (!name.empty()) {
            group->set_group_name(name);
        }
        return group;
    }

    static void apply_common(Block& block, const json& node, SDL_FPoint size) {
        block.pos.position = read_pair(node, "position", SDL_FPoint{kCanvasPadding, kCanvasPadding});
        block.set_preferred_size(size);
        block.chained = node.value("chained", false);
        auto color_it = node.find("color");
        if (color_it != node.end()) {
            if (auto color = display_color::read(*color_it)) {
                block.color = *color;
            }
        }
    }

    std::unordered_set<BlockId> seen_;
};

std::vector<BlockId> read_id_list(const json& value) {
    std::vector<BlockId> ids;
    if (!value.is_array()) return ids;
    for (const auto& entry : value) {
        if (auto id = parse_id(entry)) ids.push_back(*id);
    }
    return ids;
}

}

json block_to_json(const Block& block) {
    json node = json::object();
    node["id"] = block.id().value;
    node["position"] = pair_to_json(block.pos.position);
    node["size"] = pair_to_json(block.image_size);
    node["path"] = block.path;
    node["chained"] = block.chained;
    node["animation_enabled"] = block.anim.animation_enabled;
    node["counter"] = block.counter;
    node["is_group"] = block.is_group();
    node["group_name"] = block.is_group() ? block.display_name() : std::string();
    node["color"] = display_color::to_json(block.color);
    json children = json::array();
    for (const auto& child : block.children()) {
        children.push_back(block_to_json(*child));
    }
    node["children"] = std::move(children);
    return node;
}

json to_json(const BlockManager& manager, float zoom, bool show_file_names) {
    json doc = json::object();
    json blocks = json::array();
    for (const auto& block : manager.blocks()) {
        blocks.push_back(block_to_json(*block));
    }
    doc["blocks"] = std::move(blocks);

    json chains = json::array();
    for (const auto& chain : manager.remembered_chains().chains()) {
        json ids = json::array();
        for (BlockId id : chain) ids.push_back(id.value);
        chains.push_back(std::move(ids));
    }
    doc["remembered_chains"] = std::move(chains);

    const BoxHistory& history = manager.box_history();
    json unboxed = json::array();
    for (BlockId id : history.last_unboxed_ids) unboxed.push_back(id.value);
    doc["last_unboxed_ids"] = std::move(unboxed);
    doc["last_boxed_id"] = history.last_boxed_id ? json(history.last_boxed_id->value) : json(nullptr);
    doc["zoom"] = zoom;
    doc["show_file_names"] = show_file_names;
    return doc;
}

namespace {

SessionData parse_document(const json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Session document is not a JSON object.");
    }
    SessionData data;

    auto blocks_it = document.find("blocks");
    if (blocks_it != document.end()) {
        if (!blocks_it->is_array()) {
            throw std::runtime_error("Session field 'blocks' is not an array.");
        }
        SkeletonBuilder builder;
        for (const auto& node : *blocks_it) {
            if (auto block = builder.build(node)) {
                data.blocks.push_back(std::move(block));
            }
        }
    }

    auto chains_it = document.find("remembered_chains");
    if (chains_it != document.end() && chains_it->is_array()) {
        for (const auto& entry : *chains_it) {
            const auto ids = read_id_list(entry);
            ChainedIds chain(ids.begin(), ids.end());
            if (chain.size() >= 2) {
                data.remembered_chains.push_back(std::move(chain));
            }
        }
    }

    data.history.last_unboxed_ids = read_id_list(document.value("last_unboxed_ids", json::array()));
    data.history.last_boxed_id = parse_id(document.value("last_boxed_id", json()));

    const auto zoom_it = document.find("zoom");
    if (zoom_it != document.end() && zoom_it->is_number()) {
        const float zoom = zoom_it->get<float>();
        data.zoom = std::isfinite(zoom) ? std::clamp(zoom, kMinZoom, kMaxZoom) : 1.0f;
    }
    data.show_file_names = document.value("show_file_names", false);
    return data;
}

}

SessionData from_json(const json& document) {
    try {
        return parse_document(document);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("Malformed session document: ") + ex.what());
    }
}

void save(const std::filesystem::path& path, const BlockManager& manager, float zoom, bool show_file_names) {
    json_file::write(path, to_json(manager, zoom, show_file_names), 2);
    kLog.info("Saved " + std::to_string(manager.size()) + " block(s) to " + path.string());
}

SessionData load(const std::filesystem::path& path) {
    SessionData data = from_json(json_file::read(path));
    kLog.info("Loaded " + std::to_string(data.blocks.size()) + " block(s) from " + path.string());
    return data;
}

}
