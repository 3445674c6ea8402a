#include "geoformat/parcel_id.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace geoformat {

    namespace parcel_id {
        std::uint32_t encode(double degrees) {
            double scaled = std::fmod(std::round(std::fabs(degrees) * kFixedPointScale), 4294967296.0);
            auto magnitude = static_cast<std::uint32_t>(scaled);
            magnitude &= ~kExtendedMask;
            std::uint32_t word = magnitude << kShift;
            if (degrees < 0.0)
                word |= kHemisphereBit;
            return word;
        }

        double decode(std::uint32_t word) {
            bool negative = (word & kHemisphereBit) != 0;
            word &= ~kHemisphereBit;

            std::uint32_t magnitude;
            std::uint32_t extended = word & kExtendedMask;
            if (extended != 0)
                magnitude = ((word >> kShift) & ~kExtendedMask) | extended;
            else
                magnitude = word >> kShift;

            double degrees = static_cast<double>(magnitude) / kFixedPointScale;
            return negative ? -degrees : degrees;
        }
    } // namespace parcel_id

    namespace {
        ComponentCodec parcelCodec() {
            ComponentCodec codec;
            codec.decode = [](const std::string &field) -> std::optional<double> {
                return parcel_id::decode(static_cast<std::uint32_t>(std::stoul(field, nullptr, 16)));
            };
            codec.encode = [](double degrees) {
                std::ostringstream oss;
                oss << std::uppercase << std::hex << parcel_id::encode(degrees);
                return oss.str();
            };
            return codec;
        }
    } // namespace

    std::unique_ptr<Converter> makeParcelId() {
        std::regex pattern(R"(\s*PID\s*(?:0x)?([0-9a-f]{1,8})\s*(?:,\s*|\s+)(?:0x)?([0-9a-f]{1,8})\s*)",
                           std::regex::icase);
        return std::make_unique<PairConverter>("Parcel ID", std::move(pattern), parcelCodec(), parcelCodec(),
                                               PairConverter::Layout{"PID ", ", "});
    }

} // namespace geoformat
