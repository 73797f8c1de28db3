#include "build/TreeBuilder.hpp"
#include "export/TreeJsonExporter.hpp"
#include "PriceTreeTestHelper.hpp"

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace PT;
using Json = nlohmann::json;

TEST_SUITE("export.tree_json") {
    TEST_CASE("nodes carry their fields and children in order") {
        auto tree = Test::foodAndTransportTree();
        auto text = TreeJsonExporter::Export(tree);
        REQUIRE(text.has_value());
        auto doc = Json::parse(*text);

        CHECK(doc["code"] == "index0");
        CHECK(doc["name"] == "Root Category");
        CHECK(doc["weight"].get<double>() == doctest::Approx(100.0));
        REQUIRE(doc["children"].size() == 2);

        auto const& food = doc["children"][0];
        CHECK(food["code"] == "01");
        CHECK(food["depth"] == 0);
        CHECK(food["indices"]["n"].get<double>() == doctest::Approx(140.0));
        CHECK(food["indices"]["n-12"].get<double>() == doctest::Approx(100.0));
        CHECK(food["variation"]["yearly"].get<double>() == doctest::Approx(40.0));
        REQUIRE(food["children"].size() == 2);
        CHECK(food["children"][1]["name"] == "Meat");
        CHECK(food["children"][1]["depth"] == 1);
        CHECK_FALSE(food["children"][1].contains("children"));
        CHECK_FALSE(doc.contains("_meta"));
    }

    TEST_CASE("period keys follow the labels") {
        auto            tree = Test::foodAndTransportTree();
        TreeJsonOptions options;
        options.periodKeys = {"Fév 2024", "Nov 2024", "Déc 2024", "Jan 2025", "Fév 2025"};
        auto text          = TreeJsonExporter::Export(tree, options);
        REQUIRE(text.has_value());
        auto doc = Json::parse(*text);
        CHECK(doc["indices"].contains("Fév 2025"));
        CHECK_FALSE(doc["indices"].contains("n"));
        CHECK(doc["indices"]["Fév 2025"].get<double>() == doctest::Approx(112.0));
    }

    TEST_CASE("depth limit and metadata") {
        auto            tree = Test::foodAndTransportTree();
        TreeJsonOptions options;
        options.maxDepth        = 1;
        options.includeMetadata = true;
        options.dumpIndent      = -1;

        auto text = TreeJsonExporter::Export(tree, options);
        REQUIRE(text.has_value());
        CHECK(text->find('\n') == std::string::npos);

        auto doc = Json::parse(*text);
        REQUIRE(doc["children"].size() == 2);
        CHECK_FALSE(doc["children"][0].contains("children"));
        CHECK(doc["children"][0]["children_truncated"] == 2);
        CHECK(doc["_meta"]["node_count"] == 3);
        CHECK(doc["_meta"]["children_truncated"] == 2);
        CHECK(doc["_meta"]["generation"] == tree.generation());
    }

    TEST_CASE("empty tree") {
        auto text = TreeJsonExporter::Export(CategoryTree{});
        REQUIRE(text.has_value());
        CHECK(*text == "{}");
    }

    TEST_CASE("latin-1 names are reported instead of thrown") {
        std::vector<FlatRecord> records{
                Test::makeRecord("01", "Food", 10, {100, 100, 100, 100, 100}),
                Test::makeRecord("01.2", "__ Boissons non alcoolis\xE9" "es", 10, {100, 101, 102, 103, 104}),
        };
        auto tree = buildTree(records);

        Expected<std::string> text = std::string{};
        CHECK_NOTHROW(text = TreeJsonExporter::Export(tree));
        REQUIRE_FALSE(text.has_value());
        CHECK(text.error().code == Error::Code::MalformedInput);
        CHECK(describeError(text.error()).find("UTF-8") != std::string::npos);
    }
}
