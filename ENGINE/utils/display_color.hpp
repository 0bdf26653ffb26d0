#pragma once

#include <optional>

#include <SDL.h>
#include <nlohmann/json_fwd.hpp>

#include "blocks/block_id.hpp"

namespace mablocks::display_color {

inline constexpr double kSaturationMin   = 0.6;
inline constexpr double kSaturationRange = 0.4;
inline constexpr double kLightnessMin    = 0.5;
inline constexpr double kLightnessRange  = 0.2;

// Folder tint for a block. Pure function of the id, stable across processes.
SDL_Color color_from_id(BlockId id);

SDL_Color hsl_to_rgb(double hue_unit, double saturation, double lightness);

std::optional<SDL_Color> read(const nlohmann::json& value);
nlohmann::json to_json(SDL_Color color);

bool same_color(SDL_Color a, SDL_Color b);

}
