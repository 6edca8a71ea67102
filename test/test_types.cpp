// kaldbridge - Amount and enum helper tests

#include <catch2/catch_test_macros.hpp>
#include <kald/types.hpp>
#include <kald/log.hpp>

#include "test_support.hpp"

using namespace kald;

TEST_CASE("Amount decimal rendering", "[types]") {
    REQUIRE(amount::to_string(0) == "0");
    REQUIRE(amount::to_string(UNIT) == "1000000000000000000");
    REQUIRE(amount::to_string(-42) == "-42");
    REQUIRE(amount::to_string(amount::from_units(10000)) == "10000000000000000000000");
}

TEST_CASE("Amount parsing", "[types]") {
    SECTION("Values above 64 bits") {
        auto v = amount::parse("10000000000000000000000");
        REQUIRE(v.has_value());
        REQUIRE(*v == amount::from_units(10000));
    }

    SECTION("Signs") {
        REQUIRE(amount::parse("-5") == Amount(-5));
        REQUIRE(amount::parse("+5") == Amount(5));
    }

    SECTION("Malformed input") {
        REQUIRE_FALSE(amount::parse("").has_value());
        REQUIRE_FALSE(amount::parse("-").has_value());
        REQUIRE_FALSE(amount::parse("12a").has_value());
        REQUIRE_FALSE(amount::parse("1.5").has_value());
    }

    SECTION("Overflow is rejected") {
        REQUIRE_FALSE(amount::parse("999999999999999999999999999999999999999999").has_value());
    }

    SECTION("Round trip of the largest value") {
        Amount max = static_cast<Amount>(~U128(0) >> 1);
        REQUIRE(amount::parse(amount::to_string(max)) == max);
    }
}

TEST_CASE("Checked arithmetic detects overflow", "[types]") {
    Amount max = static_cast<Amount>(~U128(0) >> 1);
    Amount out = 0;

    REQUIRE(amount::checked_add(UNIT, UNIT, out));
    REQUIRE(out == 2 * UNIT);

    REQUIRE_FALSE(amount::checked_add(max, 1, out));
    REQUIRE_FALSE(amount::checked_mul(max, 2, out));
    REQUIRE(amount::checked_sub(UNIT, 2 * UNIT, out));
    REQUIRE(out == -UNIT);
}

TEST_CASE("Transfer status names", "[types]") {
    REQUIRE(std::string(to_string(TransferStatus::PENDING)) == "pending");
    REQUIRE(std::string(to_string(TransferStatus::REFUNDED)) == "refunded");
    REQUIRE(parse_status("completed") == TransferStatus::COMPLETED);
    REQUIRE_FALSE(parse_status("done").has_value());

    REQUIRE_FALSE(is_terminal(TransferStatus::PENDING));
    REQUIRE_FALSE(is_terminal(TransferStatus::CONFIRMED));
    REQUIRE(is_terminal(TransferStatus::COMPLETED));
    REQUIRE(is_terminal(TransferStatus::FAILED));
    REQUIRE(is_terminal(TransferStatus::REFUNDED));
}

TEST_CASE("Error descriptions", "[types]") {
    REQUIRE(std::string(errors::describe(errors::OK)) == "ok");
    REQUIRE(std::string(errors::describe(errors::INSUFFICIENT_LIQUIDITY)) == "insufficient liquidity");
    REQUIRE(std::string(errors::describe(-999)) == "unknown error");
}

TEST_CASE("Pool keys", "[types]") {
    PoolKey a{"ethereum", "USDC"};
    PoolKey b{"ethereum", "WETH"};
    PoolKey c{"polygon", "USDC"};

    REQUIRE(a.str() == "ethereum:USDC");
    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(a != c);
    REQUIRE(PoolKeyHash{}(a) == PoolKeyHash{}(PoolKey{"ethereum", "USDC"}));
}

TEST_CASE("Log levels and sink", "[log]") {
    REQUIRE(parse_log_level("warn") == LogLevel::WARN);
    REQUIRE(parse_log_level("off") == LogLevel::OFF);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    std::vector<std::string> lines;
    logging::set_sink([&lines](LogLevel level, std::string_view component, std::string_view msg) {
        lines.push_back(std::string(to_string(level)) + " " + std::string(component) + " " +
                        std::string(msg));
    });
    LogLevel saved = logging::threshold();
    logging::set_threshold(LogLevel::INFO);

    Journal journal("unit");
    journal.debug("hidden {}", 1);
    journal.info("pool {} at {:.2f}", "ethereum:USDC", 0.5);

    logging::set_threshold(saved);
    logging::set_sink(nullptr);

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("pool ethereum:USDC at 0.50") != std::string::npos);
    REQUIRE(lines[0].find("unit") != std::string::npos);
}
