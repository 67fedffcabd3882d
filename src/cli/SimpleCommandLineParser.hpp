/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for cadastral-gen
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>
#include <cctype>

namespace cadgen {

/**
 * @brief Long/short option parser with grouped help output
 *
 * Options are registered under a help section; show_help() prints the
 * sections in registration order.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;
        std::string section;

        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required,
               bool has_value, const std::string& default_value, const std::string& section)
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value),
              section(section) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description), current_section_("OPTIONS") {}

    /**
     * @brief Options added after this call are listed under the given heading
     */
    void begin_section(const std::string& heading) {
        current_section_ = heading;
    }

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, required, true,
                               default_value, current_section_));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false, false, "", current_section_));
    }

    /**
     * @return false when help was shown or on a usage error; see help_requested()
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;
        error_.clear();

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h" || arg == "-?") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // --option=value
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    return fail("Unknown option: --" + option_name);
                }

                if (it->second.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || looks_like_option(args_[i + 1])) {
                            return fail("Option --" + option_name + " requires a value");
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    if (inline_value) {
                        return fail("Option --" + option_name + " does not take a value");
                    }
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1 && !is_number(arg)) {
                std::string short_name = arg.substr(1);

                auto it = short_to_long_.find(short_name);
                if (it == short_to_long_.end()) {
                    return fail("Unknown option: -" + short_name);
                }

                const std::string option_name = it->second;
                const auto& option = options_.at(option_name);

                if (option.has_value) {
                    if (i + 1 >= args_.size() || looks_like_option(args_[i + 1])) {
                        return fail("Option -" + short_name + " requires a value");
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                return fail("Required option --" + name + " not provided");
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    /**
     * @brief Parse the whole value as T; trailing garbage is rejected
     */
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }
    const std::string& error() const { return error_; }

    void show_help() const {
        std::cout << description_ << "\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --roads FILE [--buildings FILE] --output FILE [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --config FILE [OPTIONS]\n\n";

        for (const auto& section : sections_) {
            std::cout << section << ":\n";
            for (const auto& name : option_order_) {
                const auto& option = options_.at(name);
                if (option.section == section) {
                    print_option(option);
                }
            }
            std::cout << "\n";
        }

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --roads roads.gpkg --buildings buildings.gpkg --output erven.gpkg\n";
        std::cout << "    " << program_name_ << " --roads roads.shp --blocks --output blocks.gpkg --buffer 8\n";
        std::cout << "    " << program_name_ << " --config township.json --max-area 0 --log-level \"3,ShapeRegularizer=5\"\n\n";

        std::cout << "EXIT CODES:\n";
        std::cout << "    0 success, 1 processing error, 2 invalid configuration or usage, 130 cancelled\n";
    }

private:
    void register_option(const Option& option) {
        if (options_.find(option.long_name) == options_.end()) {
            option_order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
        bool known = false;
        for (const auto& section : sections_) {
            if (section == option.section) {
                known = true;
                break;
            }
        }
        if (!known) {
            sections_.push_back(option.section);
        }
    }

    bool fail(const std::string& message) {
        error_ = message;
        std::cerr << message << std::endl;
        return false;
    }

    static bool is_number(const std::string& text) {
        if (text.size() < 2 || text[0] != '-') return false;
        return std::isdigit(static_cast<unsigned char>(text[1])) || text[1] == '.';
    }

    static bool looks_like_option(const std::string& text) {
        return text.starts_with("-") && text.size() > 1 && !is_number(text);
    }

    void print_option(const Option& option) const {
        std::string left = "    ";
        if (!option.short_name.empty()) {
            left += "-" + option.short_name + ", ";
        }
        left += "--" + option.long_name;
        if (option.has_value) {
            left += " VALUE";
        }
        if (left.size() < 34) {
            left.append(34 - left.size(), ' ');
        } else {
            left += "  ";
        }

        std::cout << left << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::string current_section_;
    std::vector<std::string> sections_;
    std::vector<std::string> option_order_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
    std::string error_;
};

} // namespace cadgen
