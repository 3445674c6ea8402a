#include "geoformat/writer.hpp"

#include <fstream>
#include <stdexcept>

namespace geoformat {

    namespace {
        boost::json::object coordinateJson(const Coordinate &c) {
            boost::json::object coord;
            coord["longitude"] = c.longitude;
            coord["latitude"] = c.latitude;
            return coord;
        }

        boost::json::object representation(const std::string &name, const std::string &text) {
            boost::json::object rep;
            rep["name"] = name;
            rep["text"] = text;
            return rep;
        }
    } // namespace

    boost::json::value toJson(const Coordinate &c, const Registry &registry) {
        boost::json::object j;
        j["coordinate"] = coordinateJson(c);

        auto names = registry.names();
        auto texts = registry.formatAll(c);
        boost::json::array reps;
        for (size_t i = 0; i < names.size(); ++i)
            reps.push_back(representation(names[i], texts[i]));
        j["representations"] = std::move(reps);

        return j;
    }

    boost::json::value toJson(const Detection &d, const Registry &registry) {
        auto j = toJson(d.coordinate, registry);
        j.as_object()["format"] = d.name;
        return j;
    }

    boost::json::value toJson(const Detection &d, const Registry &registry, std::string_view only) {
        boost::json::object j;
        j["coordinate"] = coordinateJson(d.coordinate);

        boost::json::array reps;
        reps.push_back(representation(std::string(only), registry.formatOne(only, d.coordinate)));
        j["representations"] = std::move(reps);
        j["format"] = d.name;

        return j;
    }

    void WriteConversionTable(const std::vector<Detection> &detections, const Registry &registry,
                              const std::filesystem::path &outPath) {
        boost::json::array table;
        for (const auto &d : detections)
            table.push_back(toJson(d, registry));

        std::ofstream ofs(outPath);
        if (!ofs)
            throw std::runtime_error("Cannot open for write: " + outPath.string());
        ofs << boost::json::serialize(table) << "\n";
    }

} // namespace geoformat
