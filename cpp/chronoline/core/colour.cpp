#include "chronoline/core/colour.h"

#include <cmath>
#include <cstdio>
#include <random>

namespace chronoline {

namespace {

int hexDigit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseHexByte(std::string_view pair, std::uint8_t& out) noexcept {
    const int hi = hexDigit(pair[0]);
    const int lo = hexDigit(pair[1]);
    if (hi < 0 || lo < 0) return false;
    out = static_cast<std::uint8_t>((hi << 4) | lo);
    return true;
}

std::uint8_t lightenComponent(std::uint8_t c) noexcept {
    const double v = static_cast<double>(c);
    return static_cast<std::uint8_t>(std::round(v + 0.5 * (255.0 - v)));
}

std::uint8_t offsetComponent(std::uint8_t c, int offset) noexcept {
    const int v = static_cast<int>(c) + offset;
    if (v < 0) return 0;
    if (v > 255) return 255;
    return static_cast<std::uint8_t>(v);
}

} // namespace

std::optional<Colour> Colour::fromHex(std::string_view hex) {
    // Drop a trailing alpha component
    if (hex.size() == 8 || hex.size() == 9) {
        hex = hex.substr(0, hex.size() - 2);
    }
    if (hex.size() != 6 && hex.size() != 7) {
        return std::nullopt;
    }
    if (hex.size() == 7 && hex[0] != '#') {
        return std::nullopt;
    }

    // Work from the end so a leading '#' does not matter
    const std::size_t len = hex.size();
    Colour colour;
    if (!parseHexByte(hex.substr(len - 6, 2), colour.r)) return std::nullopt;
    if (!parseHexByte(hex.substr(len - 4, 2), colour.g)) return std::nullopt;
    if (!parseHexByte(hex.substr(len - 2, 2), colour.b)) return std::nullopt;
    return colour;
}

Colour Colour::fromAnyString(std::string_view text) noexcept {
    std::uint16_t a = 0;
    std::uint16_t b = 0;
    std::uint16_t c = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<std::uint8_t>(text[i]);
        if (i % 3 == 0) a = static_cast<std::uint16_t>((a + byte) % 256);
        if ((i + 1) % 3 == 0) b = static_cast<std::uint16_t>((b + byte) % 256);
        if ((i + 2) % 3 == 0) c = static_cast<std::uint16_t>((c + byte) % 256);
    }
    return Colour::fromRgb(static_cast<std::uint8_t>(a), static_cast<std::uint8_t>(b), static_cast<std::uint8_t>(c));
}

Colour Colour::lightened(Colour colour) noexcept {
    return Colour::fromRgb(lightenComponent(colour.r), lightenComponent(colour.g), lightenComponent(colour.b));
}

Colour Colour::nearby(Colour colour, std::uint8_t maxComponentOffset, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    const int limit = static_cast<int>(maxComponentOffset);
    std::uniform_int_distribution<int> dist(-limit, limit);
    colour.r = offsetComponent(colour.r, dist(rng));
    colour.g = offsetComponent(colour.g, dist(rng));
    colour.b = offsetComponent(colour.b, dist(rng));
    return colour;
}

std::string Colour::toHex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return std::string(buf);
}

} // namespace chronoline
