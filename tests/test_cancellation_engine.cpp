#include "guard/cancellation_engine.hpp"

#include "fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <future>
#include <set>
#include <system_error>

namespace {

guard::ClosingFill fill_on(const std::string& symbol,
                           std::int64_t order_id,
                           std::optional<std::string> side = std::nullopt,
                           const std::string& client_id = "") {
    guard::ClosingFill fill;
    fill.symbol = symbol;
    fill.order_id = order_id;
    fill.position_side = std::move(side);
    fill.client_order_id = client_id;
    fill.order_type = "STOP_MARKET";
    return fill;
}

guard::CancelPolicy policy(guard::CancelMode mode, bool hedge = false, const std::string& prefix = "brkt_") {
    guard::CancelPolicy result;
    result.mode = mode;
    result.hedge_mode = hedge;
    result.client_id_prefix = prefix;
    return result;
}

// Runs the first `budget` cancels inline, then behaves as if no thread is left.
class ThreadStarvedEngine : public guard::CancellationEngine {
public:
    ThreadStarvedEngine(guard::ExchangeGateway& gateway, guard::CancelPolicy policy, int budget)
        : guard::CancellationEngine(gateway, std::move(policy)),
          budget_(budget) {}

protected:
    std::future<bool> launch(std::function<bool()> task) override {
        if (budget_-- <= 0) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        std::promise<bool> done;
        done.set_value(task());
        return done.get_future();
    }

private:
    int budget_;
};

} // namespace

TEST_CASE("symbol mode issues a single bulk cancel") {
    fakes::FakeGateway gateway;
    gateway.add_order("BTCUSDT", 1, "brkt_tp");
    gateway.add_order("BTCUSDT", 2, "manual_1");
    gateway.add_order("ETHUSDT", 3, "brkt_tp");

    guard::CancellationEngine engine{gateway, policy(guard::CancelMode::BySymbol)};
    const auto summary = engine.execute(fill_on("BTCUSDT", 99));

    CHECK(summary.bulk);
    CHECK(summary.mode == guard::CancelMode::BySymbol);
    CHECK(summary.targeted == 2);
    CHECK(summary.cancelled == 2);
    CHECK(summary.failed == 0);
    CHECK(gateway.cancel_all_calls == std::vector<std::string>{"BTCUSDT"});
    CHECK(gateway.list_calls == 1);
    CHECK(gateway.cancel_calls.empty());
    CHECK(gateway.remaining_ids("BTCUSDT").empty());
    CHECK(gateway.remaining_ids("ETHUSDT") == std::set<std::int64_t>{3});
}

TEST_CASE("side mode cancels only the triggering position's orders") {
    fakes::FakeGateway gateway;
    gateway.add_order("BTCUSDT", 10, "a", "LONG");
    gateway.add_order("BTCUSDT", 11, "b", "LONG");
    gateway.add_order("BTCUSDT", 20, "c", "SHORT");
    gateway.add_order("BTCUSDT", 21, "d", "SHORT");

    guard::CancellationEngine engine{gateway, policy(guard::CancelMode::BySide, true)};
    const auto summary = engine.execute(fill_on("BTCUSDT", 11, std::string("LONG")));

    CHECK(summary.mode == guard::CancelMode::BySide);
    CHECK_FALSE(summary.bulk);
    CHECK(summary.targeted == 1);
    CHECK(summary.cancelled == 1);
    CHECK(gateway.cancel_calls == std::vector<std::int64_t>{10});
    CHECK(gateway.remaining_ids("BTCUSDT") == std::set<std::int64_t>{11, 20, 21});
}

TEST_CASE("side mode leaves the other side untouched when the filled order is gone") {
    fakes::FakeGateway gateway;
    gateway.add_order("BTCUSDT", 10, "a", "LONG");
    gateway.add_order("BTCUSDT", 12, "b2", "LONG");
    gateway.add_order("BTCUSDT", 20, "c", "SHORT");
    gateway.add_order("BTCUSDT", 21, "d", "SHORT");

    guard::CancellationEngine engine{gateway, policy(guard::CancelMode::BySide, true)};
    const auto summary = engine.execute(fill_on("BTCUSDT", 11, std::string("LONG")));

    CHECK(summary.targeted == 2);
    CHECK(summary.cancelled == 2);
    CHECK(gateway.remaining_ids("BTCUSDT") == std::set<std::int64_t>{20, 21});
}

TEST_CASE("prefix mode never touches untagged orders") {
    fakes::FakeGateway gateway;
    gateway.add_order("BTCUSDT", 1, "brkt_tp");
    gateway.add_order("BTCUSDT", 3, "manual_1");

    guard::CancellationEngine engine{gateway, policy(guard::CancelMode::ByPrefix, false, "brkt_")};
    const auto summary = engine.execute(fill_on("BTCUSDT", 2, std::nullopt, "brkt_sl"));

    CHECK(summary.mode == guard::CancelMode::ByPrefix);
    CHECK(summary.targeted == 1);
    CHECK(summary.cancelled == 1);
    CHECK(gateway.cancel_calls == std::vector<std::int64_t>{1});
    CHECK(gateway.remaining_ids("BTCUSDT") == std::set<std::int64_t>{3});
}

TEST_CASE("a second invocation targets a strictly smaller set") {
    fakes::FakeGateway gateway;
    gateway.add_order("BTCUSDT", 1, "brkt_tp", "LONG");
    gateway.add_order("BTCUSDT", 2, "brkt_sl", "LONG");
    gateway.add_order("BTCUSDT", 3, "brkt_x", "LONG");

    guard::CancellationEngine engine{gateway, policy(guard::CancelMode::BySide, true)};
    const auto fill = fill_on("BTCUSDT", 2, std::string("LONG"));

    const auto first = engine.execute(fill);
    const auto second = engine.execute(fill);

    CHECK(first.targeted == 2);
    CHECK(second.targeted == 0);
    CHECK(second.failed == 0);
    CHECK(gateway.list_calls == 2);
}

TEST_CASE("per-order failures do not stop the rest of the batch") {
    fakes::FakeGateway gateway;
    for (std::int64_t id = 1; id <= 6; ++id) {
        gateway.add_order("BTCUSDT", id, "brkt_" + std::to_string(id));
    }
    gateway.rejected_ids = {2, 5};

    guard::CancellationEngine engine{gateway, policy(guard::CancelMode::ByPrefix)};
    const auto summary = engine.execute(fill_on("BTCUSDT", 100));

    CHECK(summary.targeted == 6);
    CHECK(summary.cancelled == 4);
    CHECK(summary.failed == 2);
    CHECK(gateway.cancel_calls.size() == 6);
    CHECK(gateway.remaining_ids("BTCUSDT") == std::set<std::int64_t>{2, 5});
}

TEST_CASE("listing and bulk failures are reported, not thrown") {
    fakes::FakeGateway gateway;
    gateway.add_order("BTCUSDT", 1, "brkt_tp");

    SECTION("listing fails") {
        gateway.fail_listing = true;
        guard::CancellationEngine engine{gateway, policy(guard::CancelMode::ByPrefix)};
        guard::CancelSummary summary;
        REQUIRE_NOTHROW(summary = engine.execute(fill_on("BTCUSDT", 5)));
        CHECK(summary.targeted == 0);
        CHECK(gateway.cancel_calls.empty());
    }
    SECTION("bulk cancel fails") {
        gateway.add_order("BTCUSDT", 2, "brkt_sl");
        gateway.fail_cancel_all = true;
        guard::CancellationEngine engine{gateway, policy(guard::CancelMode::BySymbol)};
        guard::CancelSummary summary;
        REQUIRE_NOTHROW(summary = engine.execute(fill_on("BTCUSDT", 5)));
        CHECK(summary.bulk);
        CHECK(summary.targeted == 2);
        CHECK(summary.cancelled == 0);
        CHECK(summary.failed == 2);
    }
    SECTION("listing fails before a bulk cancel") {
        gateway.fail_listing = true;
        guard::CancellationEngine engine{gateway, policy(guard::CancelMode::BySymbol)};
        guard::CancelSummary summary;
        REQUIRE_NOTHROW(summary = engine.execute(fill_on("BTCUSDT", 5)));
        CHECK(summary.targeted == 0);
        CHECK(summary.failed == 0);
        CHECK(gateway.cancel_all_calls == std::vector<std::string>{"BTCUSDT"});
        CHECK(gateway.remaining_ids("BTCUSDT").empty());
    }
}

TEST_CASE("resolve_mode covers hedge upgrades and the missing-side fallback") {
    const auto long_fill = fill_on("BTCUSDT", 1, std::string("LONG"));
    const auto one_way_fill = fill_on("BTCUSDT", 1);

    CHECK(guard::resolve_mode(policy(guard::CancelMode::BySymbol), long_fill) == guard::CancelMode::BySymbol);
    CHECK(guard::resolve_mode(policy(guard::CancelMode::BySymbol, true), long_fill) == guard::CancelMode::BySide);
    CHECK(guard::resolve_mode(policy(guard::CancelMode::BySymbol, true), one_way_fill) == guard::CancelMode::BySymbol);
    CHECK(guard::resolve_mode(policy(guard::CancelMode::ByPrefix, true), long_fill) == guard::CancelMode::ByPrefix);
    CHECK(guard::resolve_mode(policy(guard::CancelMode::ByPrefix, false, ""), one_way_fill) == guard::CancelMode::BySymbol);

    std::string warning;
    CHECK(guard::resolve_mode(policy(guard::CancelMode::BySide), one_way_fill, &warning) == guard::CancelMode::BySymbol);
    CHECK(warning.find("BTCUSDT") != std::string::npos);

    std::string quiet;
    guard::resolve_mode(policy(guard::CancelMode::BySide), long_fill, &quiet);
    CHECK(quiet.empty());
}

TEST_CASE("side mode without a position side falls back to a bulk cancel") {
    fakes::FakeGateway gateway;
    gateway.add_order("BTCUSDT", 1, "brkt_tp");
    gateway.add_order("BTCUSDT", 2, "brkt_sl");

    guard::CancellationEngine engine{gateway, policy(guard::CancelMode::BySide)};
    const auto summary = engine.execute(fill_on("BTCUSDT", 2));

    CHECK(summary.bulk);
    CHECK(summary.targeted == 1);
    CHECK(gateway.cancel_all_calls.size() == 1);
    CHECK(gateway.remaining_ids("BTCUSDT").empty());
}

TEST_CASE("select_targets excludes the filled order itself") {
    const std::vector<guard::OpenOrder> open = {
        {1, "brkt_tp", "LONG", "TAKE_PROFIT_MARKET"},
        {2, "brkt_sl", "LONG", "STOP_MARKET"},
    };
    const auto targets = guard::select_targets(open, guard::CancelMode::ByPrefix,
                                               fill_on("BTCUSDT", 2), "brkt_");
    REQUIRE(targets.size() == 1);
    CHECK(targets.front().order_id == 1);
}

TEST_CASE("parse_cancel_mode is case-insensitive") {
    guard::CancelMode mode = guard::CancelMode::BySymbol;
    CHECK(guard::parse_cancel_mode("side", mode));
    CHECK(mode == guard::CancelMode::BySide);
    CHECK(guard::parse_cancel_mode("Prefix", mode));
    CHECK(mode == guard::CancelMode::ByPrefix);
    CHECK_FALSE(guard::parse_cancel_mode("ALL", mode));
    CHECK(mode == guard::CancelMode::ByPrefix);
    CHECK(std::string(guard::to_string(guard::CancelMode::BySymbol)) == "SYMBOL");
}

TEST_CASE("cancels that cannot be started are counted as failures") {
    fakes::FakeGateway gateway;
    for (std::int64_t id = 1; id <= 4; ++id) {
        gateway.add_order("BTCUSDT", id, "brkt_" + std::to_string(id));
    }

    ThreadStarvedEngine engine{gateway, policy(guard::CancelMode::ByPrefix), 1};
    guard::CancelSummary summary;
    REQUIRE_NOTHROW(summary = engine.execute(fill_on("BTCUSDT", 99)));

    CHECK(summary.targeted == 4);
    CHECK(summary.cancelled == 1);
    CHECK(summary.failed == 3);
    CHECK(gateway.cancel_calls.size() == 1);
    CHECK(gateway.remaining_ids("BTCUSDT").size() == 3);
}
