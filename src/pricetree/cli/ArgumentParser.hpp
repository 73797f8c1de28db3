#pragma once

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PT::CLI {

/**
 * Small long-option parser for the command line tools.
 *
 * Options are "--name", "--name value" or "--name=value". Every option can
 * appear several times; the handler runs once per occurrence, in order.
 * Errors are collected rather than thrown: parse() keeps going after a bad
 * option so that all problems are reported in one run.
 */
class ArgumentParser {
public:
    using ParseError = std::optional<std::string>;

    ArgumentParser();
    ArgumentParser(ArgumentParser const&)            = delete;
    ArgumentParser& operator=(ArgumentParser const&) = delete;
    ArgumentParser(ArgumentParser&&)                 = delete;
    ArgumentParser& operator=(ArgumentParser&&)      = delete;

    void set_program_name(std::string_view name);
    void set_unknown_argument_handler(std::function<bool(std::string_view)> handler);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
        std::string           help;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
        std::string                                 value_name{"value"};
        std::string                                 help;
    };

    struct IntOption {
        std::function<void(int)> on_value;
        std::string              help;
    };

    struct DoubleOption {
        std::function<void(double)> on_value;
        std::string                 help;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, IntOption option);
    void add_double(std::string_view name, DoubleOption option);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] bool had_errors() const;

    // One line per registered option, in registration order.
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                 name;
        std::vector<std::string>                    aliases;
        bool                                        expects_value = false;
        std::string                                 value_name;
        std::string                                 help;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    auto find_option(std::string_view name) -> OptionEntry*;
    void register_option(OptionEntry entry);
    void log_error(std::string_view message);
    void mark_error();

    std::vector<OptionEntry>                           options_;
    phmap::flat_hash_map<std::string, std::size_t>     option_lookup_;
    std::string                                        program_name_;
    std::function<bool(std::string_view)>              unknown_handler_;
    std::function<void(std::string const&)>            error_logger_;
    bool                                               had_error_ = false;
};

} // namespace PT::CLI
