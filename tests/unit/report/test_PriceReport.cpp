#include "report/PriceReport.hpp"

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace PT;
using Json = nlohmann::json;

namespace {

auto samplePath() -> std::filesystem::path {
    return std::filesystem::path{PRICETREE_TEST_DATA_DIR} / "indices_fevrier_2025.csv";
}

auto sampleRequest() -> PriceReportRequest {
    PriceReportRequest request;
    request.input                   = samplePath();
    request.load.build.decimalComma = true;
    return request;
}

auto sampleHeader() -> std::string {
    std::ifstream in(samplePath(), std::ios::binary);
    std::string   header;
    std::getline(in, header);
    return header;
}

} // namespace

TEST_SUITE("report.price_report") {
    TEST_CASE("json report after edits") {
        auto request = sampleRequest();
        request.edits.push_back({"01", 3000.0});
        request.format               = ReportFormat::Json;
        request.json.includeMetadata = true;
        request.validate             = true;

        auto report = runPriceReport(request);
        REQUIRE(report.has_value());
        CHECK(report->editsApplied == 1);
        CHECK(report->build.skippedTotals == 1);

        auto doc = Json::parse(report->text);
        CHECK(doc["weight"].get<double>() == doctest::Approx(3500.0));
        CHECK(doc["indices"].contains("Fév 2025"));
        CHECK(doc["_meta"]["node_count"] == report->tree.nodeCount());
    }

    TEST_CASE("table report opens the root only") {
        auto report = runPriceReport(sampleRequest());
        REQUIRE(report.has_value());
        CHECK(report->text.find("Produits alimentaires et boissons") != std::string::npos);
        CHECK(report->text.find("Pain et céréales") == std::string::npos);

        auto request      = sampleRequest();
        request.expandAll = true;
        auto expanded     = runPriceReport(request);
        REQUIRE(expanded.has_value());
        CHECK(expanded->text.find("Pain et céréales") != std::string::npos);
    }

    TEST_CASE("a failing edit names its code") {
        auto request = sampleRequest();
        request.edits.push_back({"01", 100.0});
        request.edits.push_back({"99", 5.0});
        auto report = runPriceReport(request);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == Error::Code::NotFound);
        CHECK(describeError(report.error()).starts_with("not_found:99: "));
    }

    TEST_CASE("missing input") {
        PriceReportRequest request;
        request.input = std::filesystem::path{PRICETREE_TEST_DATA_DIR} / "does_not_exist.csv";
        auto report   = runPriceReport(request);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == Error::Code::IoFailure);
    }

    TEST_CASE("latin-1 names fail the json report without aborting") {
        auto path = std::filesystem::temp_directory_path() / "pricetree_price_report_latin1.csv";
        {
            std::ofstream out(path, std::ios::binary);
            out << sampleHeader() << "\n";
            out << "01;Boissons non alcoolis\xE9" "es;25;100,0;101,0;102,0;103,0;104,0\n";
        }

        auto request   = sampleRequest();
        request.input  = path;
        request.format = ReportFormat::Json;
        auto report    = runPriceReport(request);

        request.format = ReportFormat::Table;
        auto table     = runPriceReport(request);
        std::filesystem::remove(path);

        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == Error::Code::MalformedInput);
        REQUIRE(table.has_value());
        CHECK(table->text.find("alcoolis\xE9") != std::string::npos);
    }
}
