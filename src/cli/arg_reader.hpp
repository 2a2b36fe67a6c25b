#pragma once

#include <string>
#include <vector>
#include <optional>
#include <initializer_list>

// Hand-rolled argv reader. Options are consumed as they are queried
// (`--name value` or `--name=value`); whatever is left must be positional.
// Everything after a bare "--" is positional. Malformed input throws
// std::invalid_argument (validation exit code).
class ArgReader {
public:
    explicit ArgReader(std::vector<std::string> args);

    // True if any of the names was present. All occurrences are consumed.
    bool flag(std::initializer_list<const char*> names);

    // Last value given for the option, if any.
    std::optional<std::string> option(std::initializer_list<const char*> names);

    // Every value given for a repeatable option, in order.
    std::vector<std::string> options(std::initializer_list<const char*> names);

    std::optional<int> int_option(std::initializer_list<const char*> names);

    // Remove and return the first argument when it is not an option
    // (subcommand dispatch).
    std::optional<std::string> take_command();

    // Remaining arguments. Throws on any leftover "-x" / "--x" option.
    std::vector<std::string> positionals() const;

    bool empty() const { return args_.empty() && rest_.empty(); }

private:
    std::vector<std::string> args_;
    std::vector<std::string> rest_;     // after "--"
};
