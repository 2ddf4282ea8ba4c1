#include "arg_parser.hpp"

std::optional<std::string> ParsedArgs::option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

Result<ParsedArgs> parse_args(const std::vector<std::string>& args,
                              const std::set<std::string>& value_options,
                              const std::set<std::string>& flag_options) {
    ParsedArgs parsed;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        if (options_done || a.size() < 3 || a.compare(0, 2, "--") != 0) {
            if (a == "--") { options_done = true; continue; }
            parsed.positional.push_back(a);
            continue;
        }

        std::string name = a.substr(2);
        std::optional<std::string> inline_value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            inline_value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (value_options.count(name)) {
            if (inline_value) {
                parsed.options[name] = *inline_value;
            } else if (i + 1 < args.size()) {
                parsed.options[name] = args[++i];
            } else {
                return Result<ParsedArgs>::Err("Option --" + name + " needs a value");
            }
        } else if (flag_options.count(name)) {
            if (inline_value) {
                return Result<ParsedArgs>::Err("Option --" + name + " takes no value");
            }
            parsed.flags.insert(name);
        } else {
            return Result<ParsedArgs>::Err("Unknown option: --" + name);
        }
    }
    return Result<ParsedArgs>::Ok(std::move(parsed));
}
