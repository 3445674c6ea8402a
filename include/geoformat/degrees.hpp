#pragma once

#include "geoformat/converter.hpp"

#include <memory>

namespace geoformat {

    // "-27.1234567, 109.2345678": two signed decimals, comma and/or space between.
    // The loosest grammar in the registry, so it is tried first.
    std::unique_ptr<Converter> makeDecimalDegrees();

    // "27.12345670W 109.23456780N": unsigned magnitude with an E/W and N/S suffix
    std::unique_ptr<Converter> makeWolframAlpha();

    // Display-only. Each component is rescaled by acos(0)/90 and laid out like
    // Decimal Degrees; nothing is ever parsed.
    class RadianConverter : public Converter {
      public:
        RadianConverter();

        const std::string &name() const override { return name_; }
        std::optional<Coordinate> parse(std::string_view text) const override;
        std::string format(const Coordinate &c) const override;

        static double rescale(double degrees);

      private:
        std::string name_;
    };

} // namespace geoformat
