#include "config/LoadOptions.hpp"

#include "code/CategoryCode.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace PT {

namespace {

using Json = nlohmann::json;

auto configError(std::string message) -> Error {
    return Error{Error::Code::InvalidConfig, std::move(message)};
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto readString(Json const& object, char const* key, std::string& target) -> std::optional<Error> {
    if (!object.contains(key)) {
        return std::nullopt;
    }
    auto const& value = object.at(key);
    if (!value.is_string()) {
        return configError(std::string{key} + " must be a string");
    }
    target = value.get<std::string>();
    return std::nullopt;
}

auto readLabels(Json const& object, char const* key, std::array<std::string, kPeriodCount>& target)
        -> std::optional<Error> {
    if (!object.contains(key)) {
        return std::nullopt;
    }
    auto const& value = object.at(key);
    if (!value.is_array() || value.size() != kPeriodCount) {
        return configError(std::string{key} + " must be an array of " + std::to_string(kPeriodCount) + " strings");
    }
    for (std::size_t i = 0; i < kPeriodCount; ++i) {
        if (!value[i].is_string()) {
            return configError(std::string{key} + " must be an array of " + std::to_string(kPeriodCount) + " strings");
        }
        target[i] = value[i].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

auto ParseDelimiter(std::string_view text) -> std::optional<char> {
    if (text == "auto") {
        return CsvReader::kAutoDelimiter;
    }
    if (text == "tab" || text == "\\t" || text == "\t") {
        return '\t';
    }
    if (text == "," || text == ";" || text == "|") {
        return text.front();
    }
    return std::nullopt;
}

auto LoadOptionsFromJsonText(std::string const& text, LoadOptions base) -> Expected<LoadOptions> {
    auto doc = Json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return std::unexpected(configError("configuration is not valid JSON"));
    }
    if (!doc.is_object()) {
        return std::unexpected(configError("configuration must be a JSON object"));
    }

    if (doc.contains("columns")) {
        auto const& columns = doc.at("columns");
        if (!columns.is_object()) {
            return std::unexpected(configError("columns must be an object"));
        }
        for (auto [key, target] : {std::pair{"code", &base.columns.code},
                                   std::pair{"name", &base.columns.name},
                                   std::pair{"weight", &base.columns.weight}}) {
            if (auto error = readString(columns, key, *target)) {
                return std::unexpected(*error);
            }
        }
        if (auto error = readLabels(columns, "indices", base.columns.indices)) {
            return std::unexpected(*error);
        }
    }

    if (auto error = readLabels(doc, "period_labels", base.periodLabels)) {
        return std::unexpected(*error);
    }
    if (auto error = readString(doc, "depth_marker", base.build.depthMarker)) {
        return std::unexpected(*error);
    }

    if (doc.contains("total_labels")) {
        auto const& labels = doc.at("total_labels");
        if (!labels.is_array()) {
            return std::unexpected(configError("total_labels must be an array of strings"));
        }
        std::vector<std::string> parsed;
        for (auto const& label : labels) {
            if (!label.is_string()) {
                return std::unexpected(configError("total_labels must be an array of strings"));
            }
            parsed.push_back(label.get<std::string>());
        }
        base.build.totalLabels = std::move(parsed);
    }

    if (doc.contains("decimal_comma")) {
        if (!doc.at("decimal_comma").is_boolean()) {
            return std::unexpected(configError("decimal_comma must be a boolean"));
        }
        base.build.decimalComma = doc.at("decimal_comma").get<bool>();
    }

    if (doc.contains("delimiter")) {
        auto const& value = doc.at("delimiter");
        std::optional<char> delimiter;
        if (value.is_string()) {
            delimiter = ParseDelimiter(value.get<std::string>());
        }
        if (!delimiter) {
            return std::unexpected(configError("delimiter must be one of \",\" \";\" \"|\" \"tab\" \"auto\""));
        }
        base.delimiter = *delimiter;
    }

    return base;
}

auto LoadOptionsFromJson(std::filesystem::path const& path, LoadOptions base) -> Expected<LoadOptions> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open " + path.string()});
    }
    std::string buffer((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    return LoadOptionsFromJsonText(buffer, std::move(base));
}

bool ApplyLoadEnvOverrides(LoadOptions& options) {
    if (!apply_env("PRICETREE_DELIMITER", [&](std::string_view value) {
            auto delimiter = ParseDelimiter(value);
            if (!delimiter) {
                std::cerr << "PRICETREE_DELIMITER must be one of , ; | tab auto\n";
                return false;
            }
            options.delimiter = *delimiter;
            return true;
        })) {
        return false;
    }

    if (!apply_env("PRICETREE_DEPTH_MARKER", [&](std::string_view value) {
            options.build.depthMarker = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("PRICETREE_DECIMAL_COMMA", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "PRICETREE_DECIMAL_COMMA must be a boolean\n";
                return false;
            }
            options.build.decimalComma = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

auto ValidateLoadOptions(LoadOptions const& options) -> std::optional<std::string> {
    if (trim_ascii(options.columns.code).empty()) {
        return std::string{"code column name must not be empty"};
    }
    for (auto const& column : options.columns.indices) {
        if (trim_ascii(column).empty()) {
            return std::string{"index column names must not be empty"};
        }
    }
    if (options.build.decimalComma && options.delimiter == ',') {
        return std::string{"decimal comma cannot be combined with ',' as delimiter"};
    }
    return std::nullopt;
}

} // namespace PT
