//
// Created by gregorian-rayne on 2/10/26.
//

#include "fdeps/cli/commands/command.hpp"
#include "fdeps/version.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fdeps::cli
{
    namespace {
        // Flags every command accepts without declaring them.
        constexpr std::array<std::string_view, 5> COMMON_FLAGS = {
            "help", "verbose", "quiet", "debug", "json"
        };

        bool is_common_flag(const std::string_view name) {
            return std::ranges::find(COMMON_FLAGS, name) != COMMON_FLAGS.end();
        }

        std::optional<std::string> common_short_flag(const char c) {
            switch (c) {
                case 'h': return "help";
                case 'v': return "verbose";
                case 'q': return "quiet";
                default: return std::nullopt;
            }
        }
    }

    // ============================================================================
    // ParsedArgs Implementation
    // ============================================================================

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        args_[name] = value;
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_[name] = true;
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return args_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        if (const auto it = args_.find(name); it != args_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto val = get(name);
        if (!val) return std::nullopt;

        int parsed = 0;
        const char* first = val->data();
        const char* last = val->data() + val->size();
        if (auto [ptr, ec] = std::from_chars(first, last, parsed); ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return parsed;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        const auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    // ============================================================================
    // Command Implementation
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: " << PROJECT_NAME << " " << name();

        for (const auto args = arguments(); const auto& arg : args) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }

        ss << " [OPTIONS]";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        return "";
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n";
        std::cout << usage() << "\n\n";

        if (const auto args = arguments(); !args.empty()) {
            std::cout << "Options:\n";
            for (const auto& arg : args) {
                std::cout << "  ";
                if (arg.short_name) {
                    std::cout << "-" << arg.short_name << ", ";
                } else {
                    std::cout << "    ";
                }
                std::string spelled = arg.name;
                if (arg.takes_value) {
                    spelled += " <" + arg.value_name + ">";
                }
                std::cout << "--" << std::left << std::setw(24) << spelled;
                std::cout << arg.description;
                if (!arg.default_value.empty()) {
                    std::cout << " (default: " << arg.default_value << ")";
                }
                if (arg.required) {
                    std::cout << " [required]";
                }
                std::cout << "\n";
            }
        }

        std::cout << "\n";
        std::cout << "Common options:\n";
        std::cout << "  -h, --help                    Show this help message\n";
        std::cout << "  -v, --verbose                 Show progress and timing\n";
        std::cout << "      --debug                   Show everything, including per-file details\n";
        std::cout << "  -q, --quiet                   Only show errors\n";
    }

    void Command::apply_verbosity(const ParsedArgs& args) {
        if (args.get_flag("debug")) {
            set_verbosity(Verbosity::Debug);
        } else if (args.get_flag("verbose")) {
            set_verbosity(Verbosity::Verbose);
        } else if (args.get_flag("quiet")) {
            set_verbosity(Verbosity::Quiet);
        }
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg)
    {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Debug) {
            std::cout << "[DEBUG] " << msg << "\n";
        }
    }

    // ============================================================================
    // CommandRegistry Implementation
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry instance;
        return instance;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = std::ranges::find_if(commands_, [name](const auto& cmd) {
            return cmd->name() == name;
        });
        return it == commands_.end() ? nullptr : it->get();
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        std::ranges::sort(result, [](const Command* a, const Command* b) {
            return a->name() < b->name();
        });
        return result;
    }

    // ============================================================================
    // Argument Parser
    // ============================================================================

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        ParseResult result;

        std::unordered_map<std::string, const ArgDef*> long_map;
        std::unordered_map<char, const ArgDef*> short_map;

        for (const auto& def : defs) {
            long_map[def.name] = &def;
            if (def.short_name) {
                short_map[def.short_name] = &def;
            }
            if (!def.default_value.empty()) {
                result.args.set(def.name, def.default_value);
            }
        }

        const auto fail = [&result](std::string message) {
            result.error = std::move(message);
            result.success = false;
            return result;
        };

        bool options_ended = false;  // Set to true after seeing "--"

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg.empty()) continue;

            if (arg == "--" && !options_ended) {
                options_ended = true;
                continue;
            }

            // A lone "-" is a positional, as is anything after "--".
            if (options_ended || arg[0] != '-' || arg.size() == 1) {
                result.args.add_positional(arg);
                continue;
            }

            if (arg[1] == '-') {
                std::string name = arg.substr(2);
                std::optional<std::string> inline_value;

                if (auto eq_pos = name.find('='); eq_pos != std::string::npos) {
                    inline_value = name.substr(eq_pos + 1);
                    name = name.substr(0, eq_pos);
                }

                const auto it = long_map.find(name);
                if (it == long_map.end()) {
                    if (is_common_flag(name) && !inline_value) {
                        result.args.set_flag(name);
                        continue;
                    }
                    return fail("Unknown option: --" + name);
                }

                const ArgDef* def = it->second;
                if (!def->takes_value) {
                    if (inline_value) {
                        return fail("Option --" + name + " does not take a value");
                    }
                    result.args.set_flag(name);
                    continue;
                }

                std::string value = inline_value.value_or("");
                if (!inline_value && i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return fail("Option --" + name + " requires a value");
                }
                result.args.set(name, value);
                continue;
            }

            // Short option cluster, e.g. "-vq" or "-j4" or "-o out.json".
            for (std::size_t j = 1; j < arg.size(); ++j) {
                const char c = arg[j];

                const auto it = short_map.find(c);
                if (it == short_map.end()) {
                    if (auto common = common_short_flag(c)) {
                        result.args.set_flag(*common);
                        continue;
                    }
                    return fail(std::string("Unknown option: -") + c);
                }

                const ArgDef* def = it->second;
                if (!def->takes_value) {
                    result.args.set_flag(def->name);
                    continue;
                }

                std::string value;
                if (j + 1 < arg.size()) {
                    value = arg.substr(j + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return fail(std::string("Option -") + c + " requires a value");
                }
                result.args.set(def->name, value);
                break;  // Rest of the cluster was the value
            }
        }

        return result;
    }
}  // namespace fdeps::cli
