#pragma once

#include "geoformat/converter.hpp"

#include <cstdint>
#include <memory>

namespace geoformat {

    // 32-bit fixed point in 1/256 arc-seconds. Values up to the axis limit are
    // non-negative degrees; the top half of the range is two's complement.
    namespace fixed_point {
        inline constexpr double kWrap = 4294967296.0;

        double decode(std::int64_t raw, Axis axis);

        // Reduce a scaled integer modulo 2^32, negatives wrapping to the top half
        std::uint32_t wrap(double scaled);

        // Hex: truncate toward zero before wrapping
        std::uint32_t encodeTruncated(double degrees);

        // Decimal: floor(x + 0.5) before wrapping
        std::uint32_t encodeRounded(double degrees);

        ComponentCodec hexCodec(Axis axis);
        ComponentCodec decimalCodec(Axis axis);
    } // namespace fixed_point

    // "9e34000, 4f1a000"
    std::unique_ptr<Converter> makeHex();

    // "0x9e34000, 0x4f1a000"
    std::unique_ptr<Converter> makeHexC();

    // "D 123456, D -654321"; output always wrapped, so negatives print as 2^32 + y
    std::unique_ptr<Converter> makeDecimalFixedPoint();

} // namespace geoformat
