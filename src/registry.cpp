#include "geoformat/registry.hpp"

#include "geoformat/degrees.hpp"
#include "geoformat/dms.hpp"
#include "geoformat/fixed_point.hpp"
#include "geoformat/parcel_id.hpp"

#include <stdexcept>

namespace geoformat {

    Registry Registry::standard() {
        Registry r;
        r.add(makeDecimalDegrees());
        r.add(makeWolframAlpha());
        r.add(makeHex());
        r.add(makeHexC());
        r.add(makeDecimalFixedPoint());
        r.add(std::make_unique<DmsConverter>());
        r.add(std::make_unique<LfvConverter>());
        r.add(std::make_unique<NaviDisplayConverter>());
        r.add(std::make_unique<RadianConverter>());
        r.add(makeParcelId());
        return r;
    }

    const Registry &Registry::defaults() {
        static const Registry instance = standard();
        return instance;
    }

    void Registry::add(std::unique_ptr<Converter> converter) {
        if (!converter)
            throw std::invalid_argument("Registry::add: null converter");
        converters_.push_back(std::move(converter));
    }

    const Converter &Registry::at(size_t index) const {
        if (index >= converters_.size())
            throw std::out_of_range("Converter index out of range");
        return *converters_[index];
    }

    const Converter *Registry::find(std::string_view name) const {
        auto idx = indexOf(name);
        return idx ? converters_[*idx].get() : nullptr;
    }

    std::optional<size_t> Registry::indexOf(std::string_view name) const {
        for (size_t i = 0; i < converters_.size(); ++i) {
            if (converters_[i]->name() == name)
                return i;
        }
        return std::nullopt;
    }

    std::vector<std::string> Registry::names() const {
        std::vector<std::string> out;
        out.reserve(converters_.size());
        for (const auto &c : converters_)
            out.push_back(c->name());
        return out;
    }

    std::optional<Detection> Registry::detect(std::string_view text) const {
        for (size_t i = 0; i < converters_.size(); ++i) {
            if (auto c = converters_[i]->parse(text))
                return Detection{converters_[i]->name(), i, *c};
        }
        return std::nullopt;
    }

    Detection Registry::parse(std::string_view text) const {
        auto d = detect(text);
        if (!d)
            throw UnrecognizedError(std::string(text));
        return *d;
    }

    std::vector<std::string> Registry::formatAll(const Coordinate &c) const {
        std::vector<std::string> out;
        out.reserve(converters_.size());
        for (const auto &conv : converters_)
            out.push_back(conv->format(c));
        return out;
    }

    std::string Registry::formatOne(std::string_view name, const Coordinate &c) const {
        const auto *conv = find(name);
        if (!conv)
            throw std::out_of_range("Unknown format name: " + std::string(name));
        return conv->format(c);
    }

    std::string Registry::formatOne(size_t index, const Coordinate &c) const { return at(index).format(c); }

    std::optional<std::string> Session::detect(std::string_view text) {
        current_ = registry_->detect(text);
        if (!current_)
            return std::nullopt;
        return current_->name;
    }

    const Detection &Session::detection() const {
        if (!current_)
            throw std::runtime_error("Session: no coordinate resolved");
        return *current_;
    }

    const Coordinate &Session::coordinate() const { return detection().coordinate; }

    const std::string &Session::formatName() const { return detection().name; }

    std::vector<std::string> Session::formatAll() const { return registry_->formatAll(detection().coordinate); }

} // namespace geoformat
