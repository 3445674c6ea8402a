#pragma once

#include "geoformat/registry.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace geoformat {

    // {"coordinate": {...}, "representations": [{"name": ..., "text": ...}, ...]}
    boost::json::value toJson(const Coordinate &c, const Registry &registry);

    // As above, plus the "format" the input was detected as
    boost::json::value toJson(const Detection &d, const Registry &registry);

    // Only the named representation; throws std::out_of_range for an unknown name
    boost::json::value toJson(const Detection &d, const Registry &registry, std::string_view only);

    // JSON array of toJson(d) for every detection
    void WriteConversionTable(const std::vector<Detection> &detections, const Registry &registry,
                              const std::filesystem::path &outPath);

} // namespace geoformat
