#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

namespace mablocks::json_file {

// Throws std::runtime_error when the file cannot be opened or parsed.
nlohmann::json read(const std::filesystem::path& path);

// Writes through "<path>.tmp" and renames over the target so a crash never
// leaves a half-written document. Throws std::runtime_error on failure.
void write(const std::filesystem::path& path, const nlohmann::json& data, int indent = 2);

}
