#ifndef CHRONOLINE_CORE_COLOUR_H
#define CHRONOLINE_CORE_COLOUR_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chronoline {

// 8-bit RGB colour used by every output record.
struct Colour {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    static constexpr Colour fromRgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
        return Colour{r, g, b};
    }

    /**
     * Parse "#rrggbb", "rrggbb" or the same with a trailing alpha pair, which
     * is dropped.
     * @return Empty if the string is not a hex colour
     */
    static std::optional<Colour> fromHex(std::string_view hex);

    // Repeatable colour derived from the bytes of a string.
    static Colour fromAnyString(std::string_view text) noexcept;

    // Halfway towards white.
    static Colour lightened(Colour colour) noexcept;

    // Each component moved by at most +/- maxComponentOffset, repeatable for a given seed.
    static Colour nearby(Colour colour, std::uint8_t maxComponentOffset, std::uint64_t seed);

    std::string toHex() const;

    bool operator==(const Colour& other) const noexcept { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const Colour& other) const noexcept { return !(*this == other); }
};

} // namespace chronoline

#endif // CHRONOLINE_CORE_COLOUR_H
