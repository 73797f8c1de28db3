#ifdef PT_LOG_DEBUG
#include "log/TaggedLogger.hpp"
#include "build/TreeBuilder.hpp"
#include "PriceTreeTestHelper.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
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

// Clears every logger variable for the lifetime of the block.
struct QuietEnvironment {
    EnvGuard enabled{"PRICETREE_LOG_ENABLED", nullptr};
    EnvGuard shortName{"PRICETREE_LOG", nullptr};
    EnvGuard clearSkips{"PRICETREE_LOG_CLEAR_DEFAULT_SKIPS", nullptr};
    EnvGuard enableTags{"PRICETREE_LOG_ENABLE_TAGS", nullptr};
    EnvGuard skipTags{"PRICETREE_LOG_SKIP_TAGS", nullptr};
};

auto captureStderr(std::function<void()> const& fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("silent unless enabled") {
    QuietEnvironment env;

    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        CHECK_FALSE(logger.loggingEnabled());
        logger.log_impl("dropped", std::source_location::current(), "TreeBuilder");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("enabled by either variable") {
    for (auto const* name : {"PRICETREE_LOG_ENABLED", "PRICETREE_LOG"}) {
        QuietEnvironment env;
        EnvGuard         enable(name, "yes");

        auto output = captureStderr([] {
            PT::TaggedLogger logger;
            logger.log_impl("rebalanced 01", std::source_location::current(), "WeightRebalancer");
            waitForFlush();
        });

        CHECK(output.find("[WeightRebalancer]") != std::string::npos);
        CHECK(output.find("rebalanced 01") != std::string::npos);
        CHECK(output.find("[Thread 0]") != std::string::npos);
    }
}

TEST_CASE("falsy value keeps logging off") {
    QuietEnvironment env;
    EnvGuard         enable("PRICETREE_LOG_ENABLED", "0");

    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.log_impl("nothing", std::source_location::current(), "CsvReader");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("INFO is skipped by default and can be let through") {
    QuietEnvironment env;
    EnvGuard         enable("PRICETREE_LOG_ENABLED", "1");

    auto skipped = captureStderr([] {
        PT::TaggedLogger logger;
        logger.log_impl("row count", std::source_location::current(), "CsvReader", "INFO");
        waitForFlush();
    });
    CHECK(skipped.empty());

    EnvGuard clear("PRICETREE_LOG_CLEAR_DEFAULT_SKIPS", "true");
    auto     shown = captureStderr([] {
        PT::TaggedLogger logger;
        logger.log_impl("row count", std::source_location::current(), "CsvReader", "INFO");
        waitForFlush();
    });
    CHECK(shown.find("[CsvReader][INFO]") != std::string::npos);
}

TEST_CASE("skip list replaces the defaults and trims names") {
    QuietEnvironment env;
    EnvGuard         enable("PRICETREE_LOG_ENABLED", "1");
    EnvGuard         skips("PRICETREE_LOG_SKIP_TAGS", " WARN , EditSession ");

    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.log_impl("warned", std::source_location::current(), "TreeBuilder", "WARN");
        logger.log_impl("edited", std::source_location::current(), "EditSession");
        logger.log_impl("informed", std::source_location::current(), "TreeBuilder", "INFO");
        waitForFlush();
    });

    CHECK(output.find("warned") == std::string::npos);
    CHECK(output.find("edited") == std::string::npos);
    CHECK(output.find("informed") != std::string::npos);
}

TEST_CASE("enable list admits only fully listed messages") {
    QuietEnvironment env;
    EnvGuard         enable("PRICETREE_LOG_ENABLED", "1");
    EnvGuard         focus("PRICETREE_LOG_ENABLE_TAGS", "TreeBuilder,WARN");

    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.log_impl("kept", std::source_location::current(), "TreeBuilder", "WARN");
        logger.log_impl("other component", std::source_location::current(), "CsvReader", "WARN");
        waitForFlush();
    });

    CHECK(output.find("kept") != std::string::npos);
    CHECK(output.find("other component") == std::string::npos);
}

TEST_CASE("runtime switch overrides the environment") {
    QuietEnvironment env;
    EnvGuard         enable("PRICETREE_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.setLoggingEnabled(false);
        logger.log_impl("muted", std::source_location::current(), "Test");
        logger.setLoggingEnabled(true);
        logger.log_impl("audible", std::source_location::current(), "Test");
        waitForFlush();
    });

    CHECK(output.find("muted") == std::string::npos);
    CHECK(output.find("audible") != std::string::npos);
}

TEST_CASE("named threads and short source paths") {
    QuietEnvironment env;
    EnvGuard         enable("PRICETREE_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        PT::TaggedLogger logger;
        logger.setThreadName("Loader");
#line 77 "src/pricetree/ingest/FakeSource.cpp"
        logger.log_impl("located", std::source_location::current(), "Test");
#line 201 "tests/unit/log/test_TaggedLogger.cpp"
        waitForFlush();
    });

    CHECK(output.find("[Loader]") != std::string::npos);
    CHECK(output.find("[ingest/FakeSource.cpp:77]") != std::string::npos);
}

TEST_CASE("builder warnings reach the global logger") {
    QuietEnvironment            env;
    std::vector<PT::FlatRecord> records{
            PT::Test::makeRecord("01", "Food", 10, {100, 100, 100, 100, 100}),
            PT::Test::makeRecord("01", "Food again", 12, {100, 100, 100, 100, 101}),
    };

    auto output = captureStderr([&] {
        PT::set_thread_name("BuilderTest");
        PT::set_logging_enabled(true);
        auto tree = PT::buildTree(records);
        CHECK(tree.nodeCount() == 2);
        waitForFlush();
        PT::set_logging_enabled(false);
    });

    CHECK(output.find("Duplicate code 01") != std::string::npos);
    CHECK(output.find("[TreeBuilder][WARN]") != std::string::npos);
    CHECK(output.find("[BuilderTest]") != std::string::npos);
}

} // TEST_SUITE

#endif // PT_LOG_DEBUG
