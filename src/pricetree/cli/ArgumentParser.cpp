#include "cli/ArgumentParser.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iostream>
#include <system_error>

namespace PT::CLI {

ArgumentParser::ArgumentParser() {
    unknown_handler_ = [this](std::string_view token) {
        std::string message = "unknown argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        log_error(message);
        return false;
    };
}

void ArgumentParser::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void ArgumentParser::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void ArgumentParser::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void ArgumentParser::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help         = std::move(option.help);
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void ArgumentParser::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_name    = std::move(option.value_name);
    entry.help          = std::move(option.help);
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void ArgumentParser::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.value_name = "n";
    value_opt.help       = std::move(option.help);
    value_opt.on_value   = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires an integer value";
        }
        int  value  = 0;
        auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            return stored + " expects an integer value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void ArgumentParser::add_double(std::string_view name, DoubleOption option) {
    ValueOption value_opt{};
    value_opt.value_name = "x";
    value_opt.help       = std::move(option.help);
    value_opt.on_value   = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires a floating-point value";
        }
        double value  = 0.0;
        auto   result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size() || !std::isfinite(value)) {
            return stored + " expects a floating-point value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void ArgumentParser::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        mark_error();
        return;
    }
    options_[target_it->second].aliases.emplace_back(alias);
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool ArgumentParser::parse(int argc, char const* const* argv) {
    had_error_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view                raw_token{argv[i]};
        std::optional<std::string_view> attached_value;
        std::string_view                name = raw_token;
        if (raw_token.starts_with("--")) {
            if (auto equals_pos = raw_token.find('='); equals_pos != std::string_view::npos) {
                name           = raw_token.substr(0, equals_pos);
                attached_value = raw_token.substr(equals_pos + 1);
            }
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            if (unknown_handler_ && !unknown_handler_(raw_token)) {
                mark_error();
            }
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                mark_error();
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else {
            if ((i + 1) >= argc) {
                log_error(entry->name + " requires a value");
                mark_error();
                continue;
            }
            ++i;
            value = std::string_view{argv[i]};
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
                mark_error();
            }
        }
    }
    return !had_error_;
}

bool ArgumentParser::had_errors() const {
    return had_error_;
}

auto ArgumentParser::usage() const -> std::string {
    std::vector<std::string> heads;
    heads.reserve(options_.size());
    std::size_t width = 0;
    for (auto const& entry : options_) {
        std::string head = entry.name;
        for (auto const& alias : entry.aliases) {
            head.append(", ").append(alias);
        }
        if (entry.expects_value) {
            head.append(" <").append(entry.value_name).append(">");
        }
        width = std::max(width, head.size());
        heads.push_back(std::move(head));
    }

    std::string text;
    for (std::size_t i = 0; i < options_.size(); ++i) {
        text.append("  ").append(heads[i]);
        if (!options_[i].help.empty()) {
            text.append(width - heads[i].size() + 2, ' ').append(options_[i].help);
        }
        text.push_back('\n');
    }
    return text;
}

auto ArgumentParser::find_option(std::string_view name) -> OptionEntry* {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void ArgumentParser::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.insert_or_assign(options_.back().name, index);
}

void ArgumentParser::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"pricetree"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

void ArgumentParser::mark_error() {
    had_error_ = true;
}

} // namespace PT::CLI
