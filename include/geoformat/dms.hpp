#pragma once

#include "geoformat/converter.hpp"

#include <array>
#include <memory>
#include <regex>
#include <string>
#include <string_view>

namespace geoformat {

    namespace dms {
        // Punctuation between fields is noise. Keeps digits and '.', plus any '+', '-'
        // or N/S/E/W (upper-cased) that does not touch a letter; every other run of
        // characters becomes a single space. Leading and trailing noise is dropped.
        std::string reduce(std::string_view text);

        struct Parts {
            bool negative = false;
            double degrees = 0.0; // whole number
            int minutes = 0;
            double seconds = 0.0;
        };

        // Truncating split. Minutes are rounded to 8 places before truncation, so
        // 16.9999999999 minutes is 17 minutes, not 16 and 59.99 seconds.
        Parts decompose(double degrees);

        // d + m/60 + s/3600, negated for W, S or '-'. A space inside `seconds`
        // stands for the decimal point.
        double compose(const std::string &degrees, const std::string &minutes, std::string seconds,
                       const std::string &flag);

        // Seconds zero-padded to two integer digits
        std::string seconds_text(double seconds, int decimals);

        // Whole number, zero-padded to `width` digits
        std::string whole(double value, std::size_t width);
    } // namespace dms

    // Degrees, minutes and seconds with the hemisphere letter (or sign) either in
    // front of or after each triple, longitude or latitude first:
    //   W109 16'36.88", S27 07'32.46"
    //   27 07 32.46 S 109 16 36.88 W
    // Output: W109 16'36.9", S27 07'32.5"
    class DmsConverter : public Converter {
      public:
        DmsConverter();

        const std::string &name() const override { return name_; }
        std::optional<Coordinate> parse(std::string_view text) const override;
        std::string format(const Coordinate &c) const override;

      private:
        struct Variant {
            std::regex pattern;
            bool latitudeFirst;
            bool frontFlag;
        };

        std::string name_;
        std::array<Variant, 4> variants_;
    };

    // Swedish AIP style, latitude first, seconds as "whole fraction":
    //   S27 07 32 460 W109 16 36 880
    class LfvConverter : public Converter {
      public:
        LfvConverter();

        const std::string &name() const override { return name_; }
        std::optional<Coordinate> parse(std::string_view text) const override;
        std::string format(const Coordinate &c) const override;

      private:
        std::string name_;
        std::regex pattern_;
    };

    // Navigation display glyphs, latitude then longitude, tab separated:
    //   S27°07′32.5″	W109°16′36.9″
    class NaviDisplayConverter : public Converter {
      public:
        NaviDisplayConverter();

        const std::string &name() const override { return name_; }
        std::optional<Coordinate> parse(std::string_view text) const override;
        std::string format(const Coordinate &c) const override;

      private:
        std::string name_;
        std::regex pattern_;
    };

} // namespace geoformat
