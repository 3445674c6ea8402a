#include "geoformat/dms.hpp"

#include <cctype>
#include <cmath>

namespace geoformat {

    namespace dms {
        namespace {
            bool is_letter(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }

            bool is_hemisphere(char c) {
                switch (c) {
                case 'N':
                case 'S':
                case 'E':
                case 'W':
                case 'n':
                case 's':
                case 'e':
                case 'w':
                    return true;
                default:
                    return false;
                }
            }

            bool is_negative_flag(const std::string &flag) { return flag == "W" || flag == "S" || flag == "-"; }
        } // namespace

        std::string reduce(std::string_view text) {
            std::string out;
            out.reserve(text.size());
            bool gap = false;

            for (std::size_t i = 0; i < text.size(); ++i) {
                char c = text[i];
                char kept = 0;
                bool touches_letter =
                    (i > 0 && is_letter(text[i - 1])) || (i + 1 < text.size() && is_letter(text[i + 1]));
                if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
                    kept = c;
                } else if ((c == '+' || c == '-') && !touches_letter) {
                    kept = c;
                } else if (is_hemisphere(c) && !touches_letter) {
                    kept = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                }

                if (kept == 0) {
                    gap = true;
                    continue;
                }
                if (gap && !out.empty())
                    out += ' ';
                gap = false;
                out += kept;
            }
            return out;
        }

        Parts decompose(double degrees) {
            Parts p;
            p.negative = degrees < 0.0;
            double a = std::fabs(degrees);
            p.degrees = std::trunc(a);
            double minutes = std::round((a - p.degrees) * 60.0 * 1e8) / 1e8;
            p.minutes = static_cast<int>(std::trunc(minutes));
            p.seconds = (minutes - p.minutes) * 60.0;
            if (p.seconds < 0.0)
                p.seconds = 0.0;
            return p;
        }

        double compose(const std::string &degrees, const std::string &minutes, std::string seconds,
                       const std::string &flag) {
            for (auto &c : seconds) {
                if (c == ' ')
                    c = '.';
            }
            double value = std::stod(degrees) + std::stod(minutes) / 60.0 + std::stod(seconds) / 3600.0;
            return is_negative_flag(flag) ? -value : value;
        }

        std::string seconds_text(double seconds, int decimals) {
            std::string s = detail::fixed(seconds, decimals);
            std::size_t width = static_cast<std::size_t>(decimals) + 3;
            if (s.size() < width)
                s.insert(0, width - s.size(), '0');
            return s;
        }

        std::string whole(double value, std::size_t width) {
            std::string s = detail::fixed(value, 0);
            if (s.size() < width)
                s.insert(0, width - s.size(), '0');
            return s;
        }
    } // namespace dms

    namespace {
        constexpr const char *kDegrees = R"((\d{1,3}))";
        constexpr const char *kMinutes = R"((\d{1,2}))";
        constexpr const char *kSeconds = R"((\d{1,2}(?:[. ]\d+)?))";

        // Flag, degrees, minutes, seconds: four groups per triple either way
        std::string front(const std::string &flags) {
            return "([" + flags + "])? ?" + kDegrees + " " + kMinutes + " " + kSeconds;
        }

        std::string trailing(const std::string &flags) {
            return std::string(kDegrees) + " " + kMinutes + " " + kSeconds + " ?([" + flags + "])?";
        }

        constexpr const char *kEastWest = "EW+-";
        constexpr const char *kNorthSouth = "NS+-";

        // U+00B0, U+2032, U+2033 in UTF-8
        constexpr const char *kDegreeSign = "\xC2\xB0";
        constexpr const char *kPrime = "\xE2\x80\xB2";
        constexpr const char *kDoublePrime = "\xE2\x80\xB3";

        char hemisphere(bool negative, Axis axis) {
            if (axis == Axis::Longitude)
                return negative ? 'W' : 'E';
            return negative ? 'S' : 'N';
        }
    } // namespace

    DmsConverter::DmsConverter()
        : name_("DMS"), variants_{{
                            {std::regex(front(kEastWest) + " " + front(kNorthSouth)), false, true},
                            {std::regex(front(kNorthSouth) + " " + front(kEastWest)), true, true},
                            {std::regex(trailing(kEastWest) + " " + trailing(kNorthSouth)), false, false},
                            {std::regex(trailing(kNorthSouth) + " " + trailing(kEastWest)), true, false},
                        }} {}

    std::optional<Coordinate> DmsConverter::parse(std::string_view text) const {
        const std::string reduced = dms::reduce(text);
        std::smatch m;

        for (const auto &variant : variants_) {
            if (!std::regex_match(reduced, m, variant.pattern))
                continue;

            auto triple = [&](std::size_t base) {
                std::size_t flag = variant.frontFlag ? base : base + 3;
                std::size_t first = variant.frontFlag ? base + 1 : base;
                return dms::compose(m[first].str(), m[first + 1].str(), m[first + 2].str(), m[flag].str());
            };

            double a = triple(1);
            double b = triple(5);
            return variant.latitudeFirst ? Coordinate{b, a} : Coordinate{a, b};
        }
        return std::nullopt;
    }

    std::string DmsConverter::format(const Coordinate &c) const {
        auto triple = [](double degrees, Axis axis) {
            auto p = dms::decompose(degrees);
            return hemisphere(p.negative, axis) + dms::whole(p.degrees, 1) + " " + dms::whole(p.minutes, 2) + "'" +
                   dms::seconds_text(p.seconds, 1) + "\"";
        };
        return triple(c.longitude, Axis::Longitude) + ", " + triple(c.latitude, Axis::Latitude);
    }

    LfvConverter::LfvConverter()
        : name_("DMS (LFV)"),
          pattern_(R"(([NS]) ?(\d{1,2}) (\d{1,2}) (\d{1,2}) (\d{1,3}) ([EW]) ?(\d{1,3}) (\d{1,2}) (\d{1,2}) (\d{1,3}))") {
    }

    std::optional<Coordinate> LfvConverter::parse(std::string_view text) const {
        const std::string reduced = dms::reduce(text);
        std::smatch m;
        if (!std::regex_match(reduced, m, pattern_))
            return std::nullopt;

        double lat = dms::compose(m[2].str(), m[3].str(), m[4].str() + "." + m[5].str(), m[1].str());
        double lon = dms::compose(m[7].str(), m[8].str(), m[9].str() + "." + m[10].str(), m[6].str());
        return Coordinate{lon, lat};
    }

    std::string LfvConverter::format(const Coordinate &c) const {
        auto triple = [](double degrees, Axis axis) {
            auto p = dms::decompose(degrees);
            std::string seconds = dms::seconds_text(p.seconds, 3);
            seconds[seconds.size() - 4] = ' ';
            std::size_t width = axis == Axis::Longitude ? 3 : 2;
            return hemisphere(p.negative, axis) + dms::whole(p.degrees, width) + " " + dms::whole(p.minutes, 2) + " " +
                   seconds;
        };
        return triple(c.latitude, Axis::Latitude) + " " + triple(c.longitude, Axis::Longitude);
    }

    NaviDisplayConverter::NaviDisplayConverter()
        : name_("DMS (NaviDisplay)"),
          pattern_(std::string(R"(\s*([NS])(\d{1,3}))") + kDegreeSign + R"((\d{1,2}))" + kPrime + R"((\d{1,2}(?:\.\d+)?))" +
                   kDoublePrime + R"([\s,]+([EW])(\d{1,3}))" + kDegreeSign + R"((\d{1,2}))" + kPrime +
                   R"((\d{1,2}(?:\.\d+)?))" + kDoublePrime + R"(\s*)") {}

    std::optional<Coordinate> NaviDisplayConverter::parse(std::string_view text) const {
        const std::string s(text);
        std::smatch m;
        if (!std::regex_match(s, m, pattern_))
            return std::nullopt;

        double lat = dms::compose(m[2].str(), m[3].str(), m[4].str(), m[1].str());
        double lon = dms::compose(m[6].str(), m[7].str(), m[8].str(), m[5].str());
        return Coordinate{lon, lat};
    }

    std::string NaviDisplayConverter::format(const Coordinate &c) const {
        auto triple = [](double degrees, Axis axis) {
            auto p = dms::decompose(degrees);
            return hemisphere(p.negative, axis) + dms::whole(p.degrees, 1) + kDegreeSign + dms::whole(p.minutes, 2) +
                   kPrime + dms::seconds_text(p.seconds, 1) + kDoublePrime;
        };
        return triple(c.latitude, Axis::Latitude) + "\t" + triple(c.longitude, Axis::Longitude);
    }

} // namespace geoformat
