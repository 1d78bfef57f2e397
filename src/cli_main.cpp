#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "vetter/Compose.hpp"
#include "vetter/Errors.hpp"
#include "vetter/Loader.hpp"

using namespace vetter;

namespace {

constexpr int kExitValid = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitUsage = 2;

std::string joined_rule_names() {
    std::string out;
    for (const auto& name : rule_names()) {
        if (!out.empty()) out += "|";
        out += name;
    }
    return out;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("vetter", "Validate a JSON/TOML document against composed stock rules");
        options.positional_help("FILE");

        options.add_options()
            ("r,rule", "Base rule: " + joined_rule_names(), cxxopts::value<std::string>()->default_value("any"))
            ("min", "Lower bound for numbers", cxxopts::value<double>())
            ("max", "Upper bound for numbers", cxxopts::value<double>())
            ("pattern", "Regular expression strings must contain", cxxopts::value<std::string>())
            ("trim", "Trim strings before checking")
            ("nilable", "Also accept null")
            ("each", "Validate every element of an array")
            ("map", "Validate every value of an object")
            ("s,scope", "Root label used in error paths", cxxopts::value<std::string>()->default_value(""))
            ("print", "Print the sanitized document")
            ("v,verbose", "Report progress on stderr")
            ("h,help", "Show help");

        options.add_options()
            ("file", "Document to validate", cxxopts::value<std::string>());

        options.parse_positional({"file"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return kExitValid;
        }
        if (!result.count("file")) {
            std::cerr << "Error: missing document file\n";
            std::cerr << options.help() << "\n";
            return kExitUsage;
        }
        if (result.count("each") && result.count("map")) {
            std::cerr << "Error: --each and --map are exclusive\n";
            return kExitUsage;
        }

        const bool verbose = result.count("verbose") > 0;

        ComposeOptions compose;
        compose.rule = result["rule"].as<std::string>();
        if (result.count("min")) compose.min = result["min"].as<double>();
        if (result.count("max")) compose.max = result["max"].as<double>();
        if (result.count("pattern")) compose.pattern = result["pattern"].as<std::string>();
        compose.trim = result.count("trim") > 0;
        compose.nilable = result.count("nilable") > 0;
        if (result.count("each")) compose.wrap = Wrap::Each;
        if (result.count("map")) compose.wrap = Wrap::Map;

        Validator validator = compose_validator(compose);

        const std::string path = result["file"].as<std::string>();
        Value document = load_document(path);
        if (verbose) {
            std::cerr << "loaded " << path << " (" << type_name(document) << ")\n";
        }

        Value sanitized;
        try {
            sanitized = validator.run(document, result["scope"].as<std::string>());
        } catch (const ValidationError& err) {
            std::cerr << "Error: " << err.what() << "\n";
            return kExitInvalid;
        }

        if (result.count("print")) {
            std::cout << sanitized.dump(2) << "\n";
        } else {
            std::cout << "valid\n";
        }
        return kExitValid;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitUsage;
    }
}
