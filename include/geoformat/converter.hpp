#pragma once

#include "geoformat/types.hpp"

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace geoformat {

    // A stateless codec between Coordinate and one textual dialect.
    // parse() returns nullopt when its grammar rejects the text; format() never fails.
    class Converter {
      public:
        virtual ~Converter() = default;

        virtual const std::string &name() const = 0;
        virtual std::optional<Coordinate> parse(std::string_view text) const = 0;
        virtual std::string format(const Coordinate &c) const = 0;
    };

    // One half of a pair grammar: turns a captured field into degrees and back.
    struct ComponentCodec {
        std::function<std::optional<double>(const std::string &field)> decode;
        std::function<std::string(double degrees)> encode;
    };

    // Two-field grammar: the pattern captures the longitude field in group 1 and
    // the latitude field in group 2, each handed to its own codec.
    class PairConverter : public Converter {
      public:
        struct Layout {
            std::string prefix;
            std::string separator = ", ";
        };

        PairConverter(std::string name, std::regex pattern, ComponentCodec longitude, ComponentCodec latitude,
                      Layout layout);
        PairConverter(std::string name, std::regex pattern, ComponentCodec longitude, ComponentCodec latitude);

        const std::string &name() const override { return name_; }
        std::optional<Coordinate> parse(std::string_view text) const override;
        std::string format(const Coordinate &c) const override;

      private:
        std::string name_;
        std::regex pattern_;
        ComponentCodec longitude_;
        ComponentCodec latitude_;
        Layout layout_;
    };

    namespace detail {
        // Fixed-width decimal rendering, "%.<digits>f" in the classic locale
        std::string fixed(double value, int digits);

        std::optional<double> to_double(const std::string &s);
    } // namespace detail

} // namespace geoformat
