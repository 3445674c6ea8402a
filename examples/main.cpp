#include "geoformat/geoformat.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

    void usage(std::ostream &os) {
        os << "usage: geoformat_cli [--list] [--json] [--format <name>] [text...]\n"
           << "  reads one coordinate per line from stdin when no text is given\n";
    }

    void printText(const gf::Detection &d, const gf::Registry &registry) {
        std::cout << "INPUT FORMAT: " << d.name << "\n";
        auto names = registry.names();
        auto texts = registry.formatAll(d.coordinate);
        for (size_t i = 0; i < names.size(); ++i)
            std::cout << "  " << names[i] << ": " << texts[i] << "\n";
    }

} // namespace

int main(int argc, char **argv) {
    try {
        const auto &registry = gf::Registry::defaults();

        bool json = false;
        std::string only;
        std::vector<std::string> inputs;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--list") {
                for (const auto &name : registry.names())
                    std::cout << name << "\n";
                return 0;
            } else if (arg == "--json") {
                json = true;
            } else if (arg == "--format") {
                if (++i >= argc)
                    throw std::runtime_error("--format needs a format name");
                only = argv[i];
                if (!registry.find(only))
                    throw std::out_of_range("Unknown format name: " + only);
            } else if (arg == "--help" || arg == "-h") {
                usage(std::cout);
                return 0;
            } else {
                inputs.push_back(arg);
            }
        }

        if (inputs.empty()) {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (!line.empty())
                    inputs.push_back(line);
            }
        }

        gf::Session session(registry);
        std::vector<gf::Detection> detections;
        int failures = 0;

        for (const auto &input : inputs) {
            if (!session.detect(input)) {
                std::cerr << "ERROR: " << gf::UnrecognizedError(input).what() << "\n";
                ++failures;
                continue;
            }

            if (json) {
                detections.push_back(session.detection());
            } else if (!only.empty()) {
                std::cout << registry.formatOne(only, session.coordinate()) << "\n";
            } else {
                printText(session.detection(), registry);
            }
        }

        if (json) {
            boost::json::array table;
            for (const auto &d : detections)
                table.push_back(only.empty() ? gf::toJson(d, registry) : gf::toJson(d, registry, only));
            std::cout << boost::json::serialize(table) << "\n";
        }

        return failures == 0 ? 0 : 1;
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
