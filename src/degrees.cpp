#include "geoformat/degrees.hpp"

#include <cctype>
#include <cmath>

namespace geoformat {

    namespace {
        const char *const kSignedDecimal = R"([+-]?(?:\d+(?:\.\d*)?|\.\d+))";

        ComponentCodec plainDegrees() {
            ComponentCodec codec;
            codec.decode = [](const std::string &field) { return detail::to_double(field); };
            codec.encode = [](double degrees) { return detail::fixed(degrees, 7); };
            return codec;
        }

        // Suffix letters: `positive` for values >= 0, `negative` below
        ComponentCodec suffixedDegrees(char positive, char negative) {
            ComponentCodec codec;
            codec.decode = [positive, negative](const std::string &field) -> std::optional<double> {
                if (field.empty())
                    return std::nullopt;
                char flag = static_cast<char>(std::toupper(static_cast<unsigned char>(field.back())));
                auto magnitude = detail::to_double(field.substr(0, field.size() - 1));
                if (!magnitude)
                    return std::nullopt;
                if (flag == positive)
                    return *magnitude;
                if (flag == negative)
                    return -*magnitude;
                return std::nullopt;
            };
            codec.encode = [positive, negative](double degrees) {
                return detail::fixed(std::fabs(degrees), 8) + (degrees >= 0.0 ? positive : negative);
            };
            return codec;
        }
    } // namespace

    std::unique_ptr<Converter> makeDecimalDegrees() {
        const std::string num = kSignedDecimal;
        std::regex pattern(R"(\s*()" + num + R"()\s*(?:,\s*|\s+)()" + num + R"()\s*)");
        return std::make_unique<PairConverter>("Decimal Degrees", std::move(pattern), plainDegrees(), plainDegrees());
    }

    std::unique_ptr<Converter> makeWolframAlpha() {
        const std::string mag = R"((?:\d+(?:\.\d*)?|\.\d+))";
        std::regex pattern(R"(\s*()" + mag + R"([EW])\s*,?\s*()" + mag + R"([NS])\s*)", std::regex::icase);
        return std::make_unique<PairConverter>("WolframAlpha", std::move(pattern), suffixedDegrees('E', 'W'),
                                               suffixedDegrees('N', 'S'), PairConverter::Layout{"", " "});
    }

    RadianConverter::RadianConverter() : name_("Radian") {}

    std::optional<Coordinate> RadianConverter::parse(std::string_view) const { return std::nullopt; }

    double RadianConverter::rescale(double degrees) { return degrees / 90.0 * std::acos(0.0); }

    std::string RadianConverter::format(const Coordinate &c) const {
        return detail::fixed(rescale(c.longitude), 7) + ", " + detail::fixed(rescale(c.latitude), 7);
    }

} // namespace geoformat
