#pragma once

#include <datapod/datapod.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

namespace dp = ::datapod;

namespace geoformat {

    // Canonical value every converter reads and writes. Degrees, signed.
    // Negative longitude is West, negative latitude is South; nothing is clamped.
    struct Coordinate {
        double longitude = 0.0;
        double latitude = 0.0;
    };

    enum class Axis { Longitude, Latitude };

    // 1/256 arc-second units per degree, shared by the fixed-point formats
    inline constexpr double kFixedPointScale = 60.0 * 60.0 * 256.0;

    // Encoded magnitude of 180 and 90 degrees; anything above is the negative half
    inline constexpr std::uint32_t kLongitudeLimit = 0x9e34000;
    inline constexpr std::uint32_t kLatitudeLimit = 0x4f1a000;

    inline constexpr std::uint32_t limitFor(Axis axis) {
        return axis == Axis::Longitude ? kLongitudeLimit : kLatitudeLimit;
    }

    inline double &component(Coordinate &c, Axis axis) {
        return axis == Axis::Longitude ? c.longitude : c.latitude;
    }

    inline double component(const Coordinate &c, Axis axis) {
        return axis == Axis::Longitude ? c.longitude : c.latitude;
    }

    // Result of a successful auto-detection
    struct Detection {
        std::string name;
        std::size_t index = 0;
        Coordinate coordinate;
    };

    class UnrecognizedError : public std::runtime_error {
      public:
        explicit UnrecognizedError(const std::string &input)
            : std::runtime_error("geoformat: unrecognized coordinate \"" + input + '\"'), input_(input) {}

        const std::string &input() const { return input_; }

      private:
        std::string input_;
    };

    // dp::Geo stores {latitude, longitude, altitude}
    inline dp::Geo toGeo(const Coordinate &c) { return dp::Geo{c.latitude, c.longitude, 0.0}; }

    inline Coordinate fromGeo(const dp::Geo &g) { return Coordinate{g.longitude, g.latitude}; }

    std::ostream &operator<<(std::ostream &os, const Coordinate &c);

} // namespace geoformat
