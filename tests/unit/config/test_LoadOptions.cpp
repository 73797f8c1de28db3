#include "config/LoadOptions.hpp"

#include <doctest/doctest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using namespace PT;

namespace {

class ScopedEnv {
public:
    ScopedEnv(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&)            = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

    ~ScopedEnv() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

} // namespace

TEST_SUITE("config.load_options") {
    TEST_CASE("defaults") {
        LoadOptions options;
        CHECK(options.columns.code == "Numéro");
        CHECK(options.columns.indices[4] == "Indice février 2025");
        CHECK(options.periodLabels[0] == "Fév 2024");
        CHECK(options.build.depthMarker == "__");
        CHECK(options.delimiter == CsvReader::kAutoDelimiter);
        CHECK_FALSE(ValidateLoadOptions(options).has_value());
    }

    TEST_CASE("json overrides") {
        auto loaded = LoadOptionsFromJsonText(R"({
            "columns": {"code": "id", "indices": ["a", "b", "c", "d", "e"]},
            "period_labels": ["Mar 2024", "Dec 2024", "Jan 2025", "Feb 2025", "Mar 2025"],
            "depth_marker": "--",
            "total_labels": ["Total", "All items"],
            "decimal_comma": true,
            "delimiter": ";",
            "comment": "ignored"
        })");
        REQUIRE(loaded.has_value());
        CHECK(loaded->columns.code == "id");
        CHECK(loaded->columns.name == "Regroupement");
        CHECK(loaded->columns.indices[2] == "c");
        CHECK(loaded->periodLabels[4] == "Mar 2025");
        CHECK(loaded->build.depthMarker == "--");
        REQUIRE(loaded->build.totalLabels.size() == 2);
        CHECK(loaded->build.totalLabels[1] == "All items");
        CHECK(loaded->build.decimalComma);
        CHECK(loaded->delimiter == ';');
    }

    TEST_CASE("json errors") {
        auto notJson = LoadOptionsFromJsonText("{ not json");
        REQUIRE_FALSE(notJson.has_value());
        CHECK(notJson.error().code == Error::Code::InvalidConfig);

        auto array = LoadOptionsFromJsonText("[1, 2]");
        REQUIRE_FALSE(array.has_value());
        CHECK(array.error().code == Error::Code::InvalidConfig);

        auto wrongType = LoadOptionsFromJsonText(R"({"decimal_comma": "yes"})");
        REQUIRE_FALSE(wrongType.has_value());
        CHECK(describeError(wrongType.error()) == "invalid_config:decimal_comma must be a boolean");

        auto shortLabels = LoadOptionsFromJsonText(R"({"period_labels": ["a", "b"]})");
        REQUIRE_FALSE(shortLabels.has_value());
        CHECK(shortLabels.error().code == Error::Code::InvalidConfig);

        auto badDelimiter = LoadOptionsFromJsonText(R"({"delimiter": "::"})");
        REQUIRE_FALSE(badDelimiter.has_value());
        CHECK(badDelimiter.error().code == Error::Code::InvalidConfig);
    }

    TEST_CASE("json file") {
        auto missing = LoadOptionsFromJson("/nonexistent/pricetree/config.json");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::IoFailure);

        auto path = std::filesystem::temp_directory_path() / "pricetree_load_options_test.json";
        {
            std::ofstream out(path);
            out << R"({"delimiter": "tab"})";
        }
        auto loaded = LoadOptionsFromJson(path);
        std::filesystem::remove(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->delimiter == '\t');
    }

    TEST_CASE("environment overrides") {
        ScopedEnv delimiter("PRICETREE_DELIMITER", ";");
        ScopedEnv marker("PRICETREE_DEPTH_MARKER", "##");
        ScopedEnv comma("PRICETREE_DECIMAL_COMMA", "yes");

        LoadOptions options;
        CHECK(ApplyLoadEnvOverrides(options));
        CHECK(options.delimiter == ';');
        CHECK(options.build.depthMarker == "##");
        CHECK(options.build.decimalComma);
    }

    TEST_CASE("unusable environment value") {
        ScopedEnv delimiter("PRICETREE_DELIMITER", nullptr);
        ScopedEnv marker("PRICETREE_DEPTH_MARKER", nullptr);
        ScopedEnv comma("PRICETREE_DECIMAL_COMMA", "perhaps");

        LoadOptions options;
        CHECK_FALSE(ApplyLoadEnvOverrides(options));
    }

    TEST_CASE("validation") {
        LoadOptions options;
        options.columns.code = "  ";
        CHECK(ValidateLoadOptions(options).has_value());

        options                    = LoadOptions{};
        options.build.decimalComma = true;
        options.delimiter          = ',';
        CHECK(ValidateLoadOptions(options).has_value());

        options.delimiter = ';';
        CHECK_FALSE(ValidateLoadOptions(options).has_value());
    }

    TEST_CASE("delimiter names") {
        CHECK(ParseDelimiter("auto") == CsvReader::kAutoDelimiter);
        CHECK(ParseDelimiter("tab") == '\t');
        CHECK(ParseDelimiter("\\t") == '\t');
        CHECK(ParseDelimiter("|") == '|');
        CHECK_FALSE(ParseDelimiter("::").has_value());
        CHECK_FALSE(ParseDelimiter("").has_value());
    }
}
