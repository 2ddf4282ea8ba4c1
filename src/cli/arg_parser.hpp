#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <core/types.hpp>

// Command arguments split into positionals, "--name value" options and
// bare "--flag" switches. Which names take a value is declared up front;
// "--name=value" is accepted for those as well.
struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    std::optional<std::string> option(const std::string& name) const;
    bool flag(const std::string& name) const { return flags.count(name) > 0; }
};

Result<ParsedArgs> parse_args(const std::vector<std::string>& args,
                              const std::set<std::string>& value_options,
                              const std::set<std::string>& flag_options);
