#include "display_color.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace mablocks::display_color {

namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
constexpr std::uint64_t kFnvPrime  = 1099511628211ull;

std::array<std::uint8_t, 8> id_bytes(BlockId id) {
    std::uint64_t hash = kFnvOffset;
    for (int shift = 0; shift < 64; shift += 8) {
        hash ^= (id.value >> shift) & 0xFFu;
        hash *= kFnvPrime;
    }
    std::array<std::uint8_t, 8> out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<std::uint8_t>((hash >> (i * 8)) & 0xFFu);
    }
    return out;
}

double hue_to_channel(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 0.5) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

Uint8 to_channel(double unit) {
    return static_cast<Uint8>(std::lround(std::clamp(unit, 0.0, 1.0) * 255.0));
}

}

SDL_Color hsl_to_rgb(double hue_unit, double saturation, double lightness) {
    hue_unit = hue_unit - std::floor(hue_unit);
    saturation = std::clamp(saturation, 0.0, 1.0);
    lightness = std::clamp(lightness, 0.0, 1.0);

    if (saturation <= 0.0) {
        const Uint8 gray = to_channel(lightness);
        return SDL_Color{gray, gray, gray, 255};
    }

    const double q = lightness < 0.5 ? lightness * (1.0 + saturation)
                                     : lightness + saturation - lightness * saturation;
    const double p = 2.0 * lightness - q;
    return SDL_Color{
        to_channel(hue_to_channel(p, q, hue_unit + 1.0 / 3.0)),
        to_channel(hue_to_channel(p, q, hue_unit)),
        to_channel(hue_to_channel(p, q, hue_unit - 1.0 / 3.0)),
        255};
}

SDL_Color color_from_id(BlockId id) {
    const auto b = id_bytes(id);
    const double h = (static_cast<double>(b[0]) + static_cast<double>(b[1]) * 256.0) / 65535.0;
    const double s = kSaturationMin + (static_cast<double>(b[2]) / 255.0) * kSaturationRange;
    const double l = kLightnessMin + (static_cast<double>(b[3]) / 255.0) * kLightnessRange;
    return hsl_to_rgb(h, s, l);
}

std::optional<SDL_Color> read(const nlohmann::json& value) {
    if (!value.is_array() || value.size() < 3 || value.size() > 4) {
        return std::nullopt;
    }
    std::array<int, 4> channels{0, 0, 0, 255};
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (!value[i].is_number_integer()) {
            return std::nullopt;
        }
        channels[i] = std::clamp(value[i].get<int>(), 0, 255);
    }
    // An all-zero color is what older documents wrote for "unset".
    if (channels[0] == 0 && channels[1] == 0 && channels[2] == 0 && channels[3] == 0) {
        return std::nullopt;
    }
    return SDL_Color{static_cast<Uint8>(channels[0]), static_cast<Uint8>(channels[1]),
                     static_cast<Uint8>(channels[2]), static_cast<Uint8>(channels[3])};
}

nlohmann::json to_json(SDL_Color color) {
    return nlohmann::json::array({color.r, color.g, color.b, color.a});
}

bool same_color(SDL_Color a, SDL_Color b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

}
