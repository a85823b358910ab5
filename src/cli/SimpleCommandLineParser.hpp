/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for osm-print
 *
 * Supports --long VALUE, --long=VALUE, -s VALUE, boolean flags and
 * positional arguments. Negative numbers and comma lists ("-1,2,3,4") are
 * accepted as option values.
 */

#pragma once

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace osmprint {

class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required = false;
        bool has_value = true;
        std::string default_value;   // shown in help only; never applied
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        register_option({long_name, short_name, description, required, true, default_value});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option({long_name, short_name, description, false, false, ""});
    }

    /**
     * @brief Parse argv; values stay available until the next parse()
     * @return false on --help, an unknown option, a missing value or a
     *         missing required option (see help_requested())
     */
    bool parse(int argc, char* argv[]) {
        values_.clear();
        positional_.clear();
        help_requested_ = false;

        std::vector<std::string> args(argv + 1, argv + argc);
        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            std::string name;
            std::optional<std::string> inline_value;
            if (arg.starts_with("--")) {
                name = arg.substr(2);
                const size_t eq = name.find('=');
                if (eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.erase(eq);
                }
            } else if (arg.size() > 1 && arg.front() == '-' && !is_number(arg)) {
                auto it = short_to_long_.find(arg.substr(1));
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return false;
                }
                name = it->second;
            } else {
                positional_.push_back(arg);
                continue;
            }

            const Option* option = find_option(name);
            if (!option) {
                std::cerr << "Unknown option: --" << name << std::endl;
                return false;
            }

            if (!option->has_value) {
                values_[name] = "true";
            } else if (inline_value) {
                values_[name] = *inline_value;
            } else if (i + 1 < args.size() && is_value_token(args[i + 1])) {
                values_[name] = args[++i];
            } else {
                std::cerr << "Option " << arg << " requires a value" << std::endl;
                return false;
            }
        }

        for (const auto& option : options_) {
            if (option.required && values_.find(option.long_name) == values_.end()) {
                std::cerr << "Required option --" << option.long_name << " not provided" << std::endl;
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = values_.find(option_name);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value && *value == "true";
    }

    /// Value converted with operator>>; nullopt if absent or not fully convertible
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value) {
            return std::nullopt;
        }

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result)) {
            return std::nullopt;
        }
        iss >> std::ws;
        if (!iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    const std::vector<std::string>& get_positional() const { return positional_; }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << "OSM PRINT - Layered 3D-Printable City Models from OpenStreetMap Data\n\n";
        std::cout << description_ << "\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS] [INPUT.json]\n\n";

        std::cout << "QUICK START:\n";
        std::cout << "    # Generate a 3MF model from an Overpass export\n";
        std::cout << "    " << program_name_ << " --input map.json --bounds 51.500,-0.130,51.505,-0.120\n\n";
        std::cout << "    # Create and use a configuration file\n";
        std::cout << "    " << program_name_ << " --create-config my_area.json\n";
        std::cout << "    " << program_name_ << " --config my_area.json\n\n";

        std::cout << "REGION:\n";
        std::cout << "    Decimal degrees as south,west,north,east, or --south/--west/--north/--east.\n";
        std::cout << "    Without bounds, the input's \"bounds\" object or the extent of its nodes is used.\n\n";

        std::cout << "OPTIONS:\n";
        for (const auto& option : options_) {
            std::string usage = "    ";
            if (!option.short_name.empty()) {
                usage += "-" + option.short_name + ", ";
            }
            usage += "--" + option.long_name;
            if (option.has_value) {
                usage += " VALUE";
            }
            if (usage.size() < 32) {
                usage.resize(32, ' ');
            } else {
                usage += "  ";
            }
            std::cout << usage << option.description;
            if (!option.default_value.empty()) {
                std::cout << " (default: " << option.default_value << ")";
            }
            std::cout << "\n";
        }
        std::cout << "    -h, --help                  Show this help\n\n";

        std::cout << "OUTPUT:\n";
        std::cout << "    <output-dir>/<base-name>.3mf with five layers (base, water, grass, roads,\n";
        std::cout << "    buildings), plus <base-name>.stl when requested.\n";
    }

private:
    std::string program_name_;
    std::string description_;
    std::vector<Option> options_;                  // registration order, for help
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_;
    bool help_requested_ = false;

    void register_option(Option option) {
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
        for (auto& existing : options_) {
            if (existing.long_name == option.long_name) {
                existing = std::move(option);
                return;
            }
        }
        options_.push_back(std::move(option));
    }

    const Option* find_option(const std::string& long_name) const {
        for (const auto& option : options_) {
            if (option.long_name == long_name) {
                return &option;
            }
        }
        return nullptr;
    }

    static bool is_number(const std::string& token) {
        if (token.empty()) return false;
        char* end = nullptr;
        std::strtod(token.c_str(), &end);
        return end != token.c_str() && *end == '\0';
    }

    // Negative numbers and negative coordinate lists are values, not options
    static bool is_value_token(const std::string& token) {
        return !token.starts_with("-") || is_number(token) || token.find(',') != std::string::npos;
    }
};

} // namespace osmprint
