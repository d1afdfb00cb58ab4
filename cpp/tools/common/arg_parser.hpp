#ifndef NFCOLLECT_TOOLS_ARG_PARSER_HPP
#define NFCOLLECT_TOOLS_ARG_PARSER_HPP

#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace nfcollect {
namespace tools {

/**
 * Simple command-line argument parser
 *
 * Options are "-x <value>" / "--long <value>" or boolean flags; anything
 * not starting with '-' is collected as a positional argument.
 */
class ArgParser {
public:
    explicit ArgParser(const std::string& description)
        : description_(description), show_help_(false) {}

    // Add string option
    void add_option(const std::string& short_name,
                    const std::string& long_name,
                    std::string& target,
                    const std::string& description,
                    bool required = false) {
        Option opt;
        opt.short_name = short_name;
        opt.long_name = long_name;
        opt.description = description;
        opt.required = required;
        opt.default_text = target;
        opt.assign = [&target](const std::string& value) { target = value; };
        options_.push_back(opt);
    }

    // Add unsigned integer option; the value must fit the target type
    template<typename T>
    typename std::enable_if<std::is_unsigned<T>::value && std::is_integral<T>::value, void>::type
    add_option(const std::string& short_name,
               const std::string& long_name,
               T& target,
               const std::string& description) {
        Option opt;
        opt.short_name = short_name;
        opt.long_name = long_name;
        opt.description = description;
        opt.default_text = std::to_string(target);
        opt.assign = [&target](const std::string& value) {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                throw std::invalid_argument(value);
            }
            unsigned long long parsed = std::stoull(value);
            if (parsed > std::numeric_limits<T>::max()) {
                throw std::out_of_range(value);
            }
            target = static_cast<T>(parsed);
        };
        options_.push_back(opt);
    }

    // Add flag (boolean) option
    void add_flag(const std::string& short_name,
                  const std::string& long_name,
                  bool& target,
                  const std::string& description) {
        Option opt;
        opt.short_name = short_name;
        opt.long_name = long_name;
        opt.description = description;
        opt.is_flag = true;
        opt.flag_target = &target;
        options_.push_back(opt);

        target = false;
    }

    // Add positional argument, filled in order
    void add_positional(const std::string& name,
                        std::string& target,
                        const std::string& description,
                        bool required = true) {
        Positional pos;
        pos.name = name;
        pos.description = description;
        pos.required = required;
        pos.target = &target;
        positionals_.push_back(pos);
    }

    // Parse arguments
    bool parse(int argc, char** argv) {
        program_name_ = argv[0];
        size_t next_positional = 0;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                show_help_ = true;
                return false;
            }

            if (arg.size() > 1 && arg[0] == '-') {
                Option* opt = find_option(arg);
                if (!opt) {
                    error_ = "Unknown option: " + arg;
                    return false;
                }

                if (opt->is_flag) {
                    *opt->flag_target = true;
                    opt->was_set = true;
                    continue;
                }

                if (i + 1 >= argc) {
                    error_ = "Option " + arg + " requires a value";
                    return false;
                }

                std::string value = argv[++i];
                try {
                    opt->assign(value);
                    opt->was_set = true;
                } catch (const std::exception&) {
                    error_ = "Invalid value '" + value + "' for option " + arg;
                    return false;
                }
                continue;
            }

            if (next_positional >= positionals_.size()) {
                error_ = "Unexpected argument: " + arg;
                return false;
            }
            *positionals_[next_positional].target = arg;
            positionals_[next_positional].was_set = true;
            next_positional++;
        }

        for (const auto& opt : options_) {
            if (opt.required && !opt.was_set) {
                error_ = "Required option --" + opt.long_name + " not provided";
                return false;
            }
        }

        for (const auto& pos : positionals_) {
            if (pos.required && !pos.was_set) {
                error_ = "Missing argument <" + pos.name + ">";
                return false;
            }
        }

        return true;
    }

    // Was the option given on the command line?
    bool was_set(const std::string& long_name) const {
        for (const auto& opt : options_) {
            if (opt.long_name == long_name) {
                return opt.was_set;
            }
        }
        return false;
    }

    // Print help
    void print_help(std::ostream& out = std::cout) const {
        out << description_ << "\n";
        out << "Usage: " << program_name_ << " [OPTIONS]";
        for (const auto& pos : positionals_) {
            out << (pos.required ? " <" : " [<") << pos.name << (pos.required ? ">" : ">]");
        }
        out << "\n\n";

        if (!positionals_.empty()) {
            out << "Arguments:\n";
            for (const auto& pos : positionals_) {
                out << "  " << pos.name << "\n      " << pos.description << "\n\n";
            }
        }

        out << "Options:\n";
        for (const auto& opt : options_) {
            out << "  ";

            if (!opt.short_name.empty()) {
                out << opt.short_name;
                if (!opt.long_name.empty()) {
                    out << ", ";
                }
            }

            if (!opt.long_name.empty()) {
                out << "--" << opt.long_name;
            }

            if (!opt.is_flag) {
                out << " <value>";
            }

            out << "\n";
            out << "      " << opt.description;

            if (!opt.required && !opt.is_flag && !opt.default_text.empty()) {
                out << " (default: " << opt.default_text << ")";
            }

            if (opt.required) {
                out << " [REQUIRED]";
            }

            out << "\n\n";
        }
    }

    std::string error() const { return error_; }

    bool should_show_help() const { return show_help_; }

private:
    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        std::string default_text;
        bool required = false;
        bool is_flag = false;
        bool was_set = false;

        std::function<void(const std::string&)> assign;
        bool* flag_target = nullptr;
    };

    struct Positional {
        std::string name;
        std::string description;
        bool required = true;
        bool was_set = false;
        std::string* target = nullptr;
    };

    Option* find_option(const std::string& name) {
        for (auto& opt : options_) {
            if ((!opt.short_name.empty() && name == opt.short_name) ||
                name == "--" + opt.long_name) {
                return &opt;
            }
        }
        return nullptr;
    }

    std::string description_;
    std::string program_name_;
    std::string error_;
    bool show_help_;
    std::vector<Option> options_;
    std::vector<Positional> positionals_;
};

} // namespace tools
} // namespace nfcollect

#endif // NFCOLLECT_TOOLS_ARG_PARSER_HPP
