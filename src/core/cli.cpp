#include "relaysave/core/cli.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>

namespace relaysave::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.relaysave.conf");
    add_option("", "verbose", "Enable debug logging");
    add_option("", "store", "Record store database path", true);
    add_option("o", "out", "Output file for fetch", true);
    add_option("", "secret-key", "Hex secret key for sealed files", true);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool takes_value,
                                   const std::string& default_value) {
    specs_.push_back({short_name, long_name, description, takes_value, default_value});
}

const CommandLineParser::OptionSpec* CommandLineParser::find_long(const std::string& long_name) const {
    for (const auto& spec : specs_) {
        if (spec.long_name == long_name) return &spec;
    }
    return nullptr;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_short(char short_name) const {
    for (const auto& spec : specs_) {
        if (spec.short_name.size() == 1 && spec.short_name[0] == short_name) return &spec;
    }
    return nullptr;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            positional_args_.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg.starts_with("--")) {
            if (!parse_long(arg, argc, argv, i)) return false;
        } else if (!parse_short_group(arg, argc, argv, i)) {
            return false;
        }
    }

    return true;
}

// --name, --name=value or --name value
bool CommandLineParser::parse_long(const std::string& arg, int argc, char* argv[], int& i) {
    auto eq_pos = arg.find('=');
    auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

    const auto* spec = find_long(name);
    if (!spec) {
        error_ = "Unknown option: --" + name;
        return false;
    }

    if (!spec->takes_value) {
        if (eq_pos != std::string::npos) {
            error_ = "Option --" + name + " does not take a value";
            return false;
        }
        values_[name] = "true";
    } else if (eq_pos != std::string::npos) {
        values_[name] = arg.substr(eq_pos + 1);
    } else if (i + 1 < argc) {
        values_[name] = argv[++i];
    } else {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return true;
}

// -hv, -ofile or -o file
bool CommandLineParser::parse_short_group(const std::string& arg, int argc, char* argv[], int& i) {
    for (size_t j = 1; j < arg.size(); ++j) {
        const auto* spec = find_short(arg[j]);
        if (!spec) {
            error_ = std::string("Unknown option: -") + arg[j];
            return false;
        }

        if (!spec->takes_value) {
            values_[spec->long_name] = "true";
            continue;
        }

        if (j + 1 < arg.size()) {
            values_[spec->long_name] = arg.substr(j + 1);
        } else if (i + 1 < argc) {
            values_[spec->long_name] = argv[++i];
        } else {
            error_ = std::string("Option -") + arg[j] + " requires a value";
            return false;
        }
        break;
    }
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return values_.count(name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto it = values_.find(name);
    if (it != values_.end()) {
        return it->second;
    }

    const auto* spec = find_long(name);
    if (spec && !spec->default_value.empty()) {
        return spec->default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    if (value.empty()) return default_value;

    int result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return default_value;
    }
    return result;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& spec : specs_) {
        std::string flags = spec.short_name.empty() ? "    " : "-" + spec.short_name + ", ";
        flags += "--" + spec.long_name;
        if (spec.takes_value) {
            flags += " <value>";
        }

        std::cout << "  " << std::left << std::setw(28) << flags << spec.description;
        if (!spec.default_value.empty()) {
            std::cout << " (default: " << spec.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 0.3.0\n";
    std::cout << "Record kinds 30078/30079/30080, payload version 2\n";
}

}
