#include "geoformat/converter.hpp"

#include <iomanip>
#include <locale>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace geoformat {

    std::ostream &operator<<(std::ostream &os, const Coordinate &c) {
        os << "(lon=" << c.longitude << ", lat=" << c.latitude << ")";
        return os;
    }

    namespace detail {
        std::string fixed(double value, int digits) {
            std::ostringstream oss;
            oss.imbue(std::locale::classic());
            oss << std::fixed << std::setprecision(digits) << value;
            return oss.str();
        }

        std::optional<double> to_double(const std::string &s) {
            try {
                std::size_t used = 0;
                double v = std::stod(s, &used);
                if (used != s.size())
                    return std::nullopt;
                return v;
            } catch (const std::invalid_argument &) {
                return std::nullopt;
            } catch (const std::out_of_range &) {
                return std::nullopt;
            }
        }
    } // namespace detail

    PairConverter::PairConverter(std::string name, std::regex pattern, ComponentCodec longitude,
                                 ComponentCodec latitude, Layout layout)
        : name_(std::move(name)), pattern_(std::move(pattern)), longitude_(std::move(longitude)),
          latitude_(std::move(latitude)), layout_(std::move(layout)) {}

    PairConverter::PairConverter(std::string name, std::regex pattern, ComponentCodec longitude,
                                 ComponentCodec latitude)
        : PairConverter(std::move(name), std::move(pattern), std::move(longitude), std::move(latitude), Layout{}) {}

    std::optional<Coordinate> PairConverter::parse(std::string_view text) const {
        const std::string s(text);
        std::smatch m;
        if (!std::regex_match(s, m, pattern_))
            return std::nullopt;

        auto lon = longitude_.decode(m[1].str());
        auto lat = latitude_.decode(m[2].str());
        if (!lon || !lat)
            return std::nullopt;

        return Coordinate{*lon, *lat};
    }

    std::string PairConverter::format(const Coordinate &c) const {
        return layout_.prefix + longitude_.encode(c.longitude) + layout_.separator + latitude_.encode(c.latitude);
    }

} // namespace geoformat
