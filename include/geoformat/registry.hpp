#pragma once

#include "geoformat/converter.hpp"
#include "geoformat/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geoformat {

    // Ordered set of converters. Order is detection priority: the first converter
    // whose grammar accepts an input wins, so looser grammars come first.
    class Registry {
      private:
        std::vector<std::unique_ptr<Converter>> converters_;

      public:
        Registry() = default;
        Registry(Registry &&) = default;
        Registry &operator=(Registry &&) = default;
        Registry(const Registry &) = delete;
        Registry &operator=(const Registry &) = delete;

        // The ten built-in dialects, Decimal Degrees first and Parcel ID last
        static Registry standard();

        // Shared immutable instance of standard(), built once
        static const Registry &defaults();

        void add(std::unique_ptr<Converter> converter);

        size_t size() const { return converters_.size(); }
        bool empty() const { return converters_.empty(); }

        const Converter &at(size_t index) const;
        const Converter *find(std::string_view name) const;
        std::optional<size_t> indexOf(std::string_view name) const;

        std::vector<std::string> names() const;

        // First converter that accepts `text`, or nullopt when none does
        std::optional<Detection> detect(std::string_view text) const;

        // Same as detect() but throws UnrecognizedError
        Detection parse(std::string_view text) const;

        // One string per converter, aligned with names()
        std::vector<std::string> formatAll(const Coordinate &c) const;

        std::string formatOne(std::string_view name, const Coordinate &c) const;
        std::string formatOne(size_t index, const Coordinate &c) const;
    };

    // Idle until a detect() succeeds; then Resolved, holding the coordinate and the
    // name of the converter that produced it. One per UI; not for concurrent use.
    class Session {
      private:
        const Registry *registry_;
        std::optional<Detection> current_;

      public:
        explicit Session(const Registry &registry = Registry::defaults()) : registry_(&registry) {}

        std::optional<std::string> detect(std::string_view text);

        bool resolved() const { return current_.has_value(); }
        void reset() { current_.reset(); }

        const Coordinate &coordinate() const;
        const std::string &formatName() const;
        const Detection &detection() const;

        std::vector<std::string> formatAll() const;

        const Registry &registry() const { return *registry_; }
    };

} // namespace geoformat
