#pragma once

#include "geoformat/converter.hpp"

#include <cstdint>
#include <memory>

namespace geoformat {

    namespace parcel_id {
        // bit 31: West/South
        inline constexpr std::uint32_t kHemisphereBit = 0x80000000u;
        // low byte of a raw word: extended area
        inline constexpr std::uint32_t kExtendedMask = 0xffu;
        inline constexpr int kShift = 3;

        // round(|degrees| * F), low byte cleared, shifted up by 3, hemisphere bit on top
        std::uint32_t encode(double degrees);

        double decode(std::uint32_t word);
    } // namespace parcel_id

    // "PID 1800, 80000800"
    std::unique_ptr<Converter> makeParcelId();

} // namespace geoformat
