#pragma once

#include <map>
#include <string>
#include <vector>

namespace relaysave::core {

// Options are looked up by long name; a short alias maps to the same entry.
// Everything after "--" is positional.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool takes_value = false,
                    const std::string& default_value = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct OptionSpec {
        std::string short_name;
        std::string long_name;
        std::string description;
        bool takes_value;
        std::string default_value;
    };

    const OptionSpec* find_long(const std::string& long_name) const;
    const OptionSpec* find_short(char short_name) const;

    bool parse_long(const std::string& arg, int argc, char* argv[], int& i);
    bool parse_short_group(const std::string& arg, int argc, char* argv[], int& i);

    std::string program_name_;
    std::vector<OptionSpec> specs_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
