#include "arg_reader.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace {

bool matches(const std::string& arg, std::initializer_list<const char*> names) {
    for (const char* n : names) {
        if (arg == n) return true;
    }
    return false;
}

// "--name=value" -> value when the prefix names one of the options
std::optional<std::string> inline_value(const std::string& arg,
                                        std::initializer_list<const char*> names) {
    for (const char* n : names) {
        std::string prefix = std::string(n) + "=";
        if (arg.compare(0, prefix.size(), prefix) == 0) {
            return arg.substr(prefix.size());
        }
    }
    return std::nullopt;
}

bool looks_like_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

} // namespace

ArgReader::ArgReader(std::vector<std::string> args) {
    bool after_separator = false;
    for (auto& a : args) {
        if (!after_separator && a == "--") {
            after_separator = true;
            continue;
        }
        (after_separator ? rest_ : args_).push_back(std::move(a));
    }
}

bool ArgReader::flag(std::initializer_list<const char*> names) {
    bool found = false;
    for (auto it = args_.begin(); it != args_.end();) {
        if (matches(*it, names)) {
            found = true;
            it = args_.erase(it);
        } else {
            ++it;
        }
    }
    return found;
}

std::vector<std::string> ArgReader::options(std::initializer_list<const char*> names) {
    std::vector<std::string> values;
    for (size_t i = 0; i < args_.size();) {
        if (auto v = inline_value(args_[i], names)) {
            values.push_back(*v);
            args_.erase(args_.begin() + i);
            continue;
        }
        if (matches(args_[i], names)) {
            if (i + 1 >= args_.size()) {
                throw std::invalid_argument("Option " + args_[i] + " requires a value");
            }
            values.push_back(args_[i + 1]);
            args_.erase(args_.begin() + i, args_.begin() + i + 2);
            continue;
        }
        ++i;
    }
    return values;
}

std::optional<std::string> ArgReader::option(std::initializer_list<const char*> names) {
    auto values = options(names);
    if (values.empty()) return std::nullopt;
    return values.back();
}

std::optional<int> ArgReader::int_option(std::initializer_list<const char*> names) {
    auto value = option(names);
    if (!value) return std::nullopt;
    int parsed = safe_stoi(*value, -1);
    if (parsed < 0) {
        throw std::invalid_argument(fmt::format("Expected a non-negative number for {}, got '{}'",
                                                *names.begin(), *value));
    }
    return parsed;
}

std::optional<std::string> ArgReader::take_command() {
    if (args_.empty() || looks_like_option(args_.front())) return std::nullopt;
    std::string cmd = args_.front();
    args_.erase(args_.begin());
    return cmd;
}

std::vector<std::string> ArgReader::positionals() const {
    for (const auto& a : args_) {
        if (looks_like_option(a)) throw std::invalid_argument("Unknown option: " + a);
    }
    std::vector<std::string> out = args_;
    out.insert(out.end(), rest_.begin(), rest_.end());
    return out;
}
