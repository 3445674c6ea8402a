#include "geoformat/fixed_point.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace geoformat {

    namespace fixed_point {
        double decode(std::int64_t raw, Axis axis) {
            if (raw <= static_cast<std::int64_t>(limitFor(axis)))
                return static_cast<double>(raw) / kFixedPointScale;
            return (static_cast<double>(raw) - kWrap) / kFixedPointScale;
        }

        std::uint32_t wrap(double scaled) {
            double r = std::fmod(scaled, kWrap);
            if (r < 0.0)
                r += kWrap;
            return static_cast<std::uint32_t>(r);
        }

        std::uint32_t encodeTruncated(double degrees) {
            // Products within rounding noise of a whole unit count as that unit
            double scaled = degrees * kFixedPointScale;
            double nearest = std::round(scaled);
            if (std::fabs(scaled - nearest) <= 1e-12 * std::max(1.0, std::fabs(scaled)))
                scaled = nearest;
            return wrap(std::trunc(scaled));
        }

        std::uint32_t encodeRounded(double degrees) { return wrap(std::floor(degrees * kFixedPointScale + 0.5)); }

        ComponentCodec hexCodec(Axis axis) {
            ComponentCodec codec;
            codec.decode = [axis](const std::string &field) -> std::optional<double> {
                auto raw = static_cast<std::int64_t>(std::stoul(field, nullptr, 16));
                return decode(raw, axis);
            };
            codec.encode = [](double degrees) {
                std::ostringstream oss;
                oss << std::hex << encodeTruncated(degrees);
                return oss.str();
            };
            return codec;
        }

        ComponentCodec decimalCodec(Axis axis) {
            ComponentCodec codec;
            codec.decode = [axis](const std::string &field) -> std::optional<double> {
                return decode(std::stoll(field), axis);
            };
            codec.encode = [](double degrees) { return "D " + std::to_string(encodeRounded(degrees)); };
            return codec;
        }
    } // namespace fixed_point

    namespace {
        ComponentCodec withPrefix(ComponentCodec inner, const std::string &prefix) {
            auto encode = inner.encode;
            inner.encode = [encode, prefix](double degrees) { return prefix + encode(degrees); };
            return inner;
        }
    } // namespace

    std::unique_ptr<Converter> makeHex() {
        std::regex pattern(R"(\s*([0-9a-f]{1,8})\s*(?:,\s*|\s+)([0-9a-f]{1,8})\s*)", std::regex::icase);
        return std::make_unique<PairConverter>("Hex", std::move(pattern), fixed_point::hexCodec(Axis::Longitude),
                                               fixed_point::hexCodec(Axis::Latitude));
    }

    std::unique_ptr<Converter> makeHexC() {
        std::regex pattern(R"(\s*0x([0-9a-f]{1,8})\s*(?:,\s*|\s+)0x([0-9a-f]{1,8})\s*)", std::regex::icase);
        return std::make_unique<PairConverter>("Hex (C)", std::move(pattern),
                                               withPrefix(fixed_point::hexCodec(Axis::Longitude), "0x"),
                                               withPrefix(fixed_point::hexCodec(Axis::Latitude), "0x"));
    }

    std::unique_ptr<Converter> makeDecimalFixedPoint() {
        std::regex pattern(R"(\s*D\s*([+-]?\d{1,10})\s*,\s*D\s*([+-]?\d{1,10})\s*)", std::regex::icase);
        return std::make_unique<PairConverter>("Decimal Fixed Point", std::move(pattern),
                                               fixed_point::decimalCodec(Axis::Longitude),
                                               fixed_point::decimalCodec(Axis::Latitude));
    }

} // namespace geoformat
