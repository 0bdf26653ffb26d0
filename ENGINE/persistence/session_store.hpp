#pragma once

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include "blocks/block.hpp"
#include "blocks/chain_registry.hpp"

namespace mablocks {

class BlockManager;

namespace session {

// A session document turned back into blocks. Image blocks come back as
// skeletons (no frames); the caller asks the decoder for their first frames.
struct SessionData {
    BlockList               blocks;
    std::vector<ChainedIds> remembered_chains;
    BoxHistory              history;
    float                   zoom = 1.0f;
    bool                    show_file_names = false;
};

nlohmann::json block_to_json(const Block& block);
nlohmann::json to_json(const BlockManager& manager, float zoom, bool show_file_names);

// Missing keys take defaults. Throws std::runtime_error when the document is
// not an object or `blocks` is not an array. Groups found inside groups are
// flattened into their parent with a warning.
SessionData from_json(const nlohmann::json& document);

void save(const std::filesystem::path& path, const BlockManager& manager, float zoom, bool show_file_names);
SessionData load(const std::filesystem::path& path);

}

}
