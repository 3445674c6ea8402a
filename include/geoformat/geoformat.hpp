#pragma once

#include "converter.hpp"
#include "degrees.hpp"
#include "dms.hpp"
#include "fixed_point.hpp"
#include "parcel_id.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "writer.hpp"

namespace geoformat {

    inline std::vector<std::string> listFormatNames() { return Registry::defaults().names(); }

    inline std::optional<Detection> detectAndParse(std::string_view text) { return Registry::defaults().detect(text); }

    inline std::vector<std::string> formatAll(const Coordinate &c) { return Registry::defaults().formatAll(c); }

    inline std::string formatOne(std::string_view name, const Coordinate &c) {
        return Registry::defaults().formatOne(name, c);
    }

    inline std::string formatOne(size_t index, const Coordinate &c) { return Registry::defaults().formatOne(index, c); }

} // namespace geoformat

namespace gf = geoformat;
