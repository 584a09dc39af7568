#include "guard/cancellation_engine.hpp"

#include "binance/http_client.hpp"
#include "binance/util.hpp"
#include "guard/log.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <utility>

namespace guard {
namespace {

constexpr const char* kTag = "OCO";

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

const char* to_string(CancelMode mode) noexcept {
    switch (mode) {
        case CancelMode::BySymbol: return "SYMBOL";
        case CancelMode::BySide: return "SIDE";
        case CancelMode::ByPrefix: return "PREFIX";
    }
    return "SYMBOL";
}

bool parse_cancel_mode(const std::string& text, CancelMode& mode) {
    const auto upper = binance::to_upper_copy(text);
    if (upper == "SYMBOL") {
        mode = CancelMode::BySymbol;
    } else if (upper == "SIDE") {
        mode = CancelMode::BySide;
    } else if (upper == "PREFIX") {
        mode = CancelMode::ByPrefix;
    } else {
        return false;
    }
    return true;
}

CancelMode resolve_mode(const CancelPolicy& policy, const ClosingFill& fill, std::string* warning) {
    if (policy.mode == CancelMode::ByPrefix && !policy.client_id_prefix.empty()) {
        return CancelMode::ByPrefix;
    }

    if (fill.position_side) {
        if (policy.mode == CancelMode::BySide || policy.hedge_mode) {
            return CancelMode::BySide;
        }
        return CancelMode::BySymbol;
    }

    if (policy.mode == CancelMode::BySide && warning != nullptr) {
        *warning = "fill " + std::to_string(fill.order_id) + " on " + fill.symbol
                 + " carries no position side; cancelling every open order on the symbol";
    }
    return CancelMode::BySymbol;
}

std::vector<OpenOrder> select_targets(const std::vector<OpenOrder>& open_orders,
                                      CancelMode mode,
                                      const ClosingFill& fill,
                                      const std::string& prefix) {
    std::vector<OpenOrder> targets;
    for (const auto& order : open_orders) {
        if (fill.order_id != 0 && order.order_id == fill.order_id) {
            continue;
        }

        bool matches = false;
        switch (mode) {
            case CancelMode::BySymbol:
                matches = true;
                break;
            case CancelMode::BySide:
                matches = fill.position_side && order.position_side == *fill.position_side;
                break;
            case CancelMode::ByPrefix:
                matches = !prefix.empty() && starts_with(order.client_order_id, prefix);
                break;
        }

        if (matches) {
            targets.push_back(order);
        }
    }
    return targets;
}

CancellationEngine::CancellationEngine(ExchangeGateway& gateway, CancelPolicy policy)
    : gateway_(gateway),
      policy_(std::move(policy)) {}

CancelSummary CancellationEngine::execute(const ClosingFill& fill) {
    std::string warning;
    const auto mode = resolve_mode(policy_, fill, &warning);
    if (!warning.empty()) {
        log_warn(kTag, warning);
    }

    if (mode == CancelMode::BySymbol) {
        return cancel_all(fill);
    }
    return cancel_selected(fill, mode);
}

CancelSummary CancellationEngine::cancel_all(const ClosingFill& fill) {
    CancelSummary summary;
    summary.symbol = fill.symbol;
    summary.mode = CancelMode::BySymbol;
    summary.bulk = true;

    // Listed only to count what the bulk request removes.
    bool counted = true;
    try {
        summary.targeted = select_targets(gateway_.open_orders(fill.symbol), CancelMode::BySymbol, fill, {}).size();
    } catch (const std::exception& ex) {
        counted = false;
        log_warn(kTag, "listing open orders on ", fill.symbol, " failed: ", ex.what());
    }

    try {
        gateway_.cancel_all_open_orders(fill.symbol);
    } catch (const std::exception& ex) {
        summary.failed = std::max<std::size_t>(summary.targeted, 1);
        log_warn(kTag, "cancel all on ", fill.symbol, " failed: ", ex.what());
        return summary;
    }

    summary.cancelled = summary.targeted;
    if (counted) {
        log_info(kTag, "canceled ", summary.cancelled, " open orders on ", fill.symbol);
    } else {
        log_info(kTag, "canceled open orders on ", fill.symbol, " (count unavailable)");
    }
    return summary;
}

CancelSummary CancellationEngine::cancel_selected(const ClosingFill& fill, CancelMode mode) {
    CancelSummary summary;
    summary.symbol = fill.symbol;
    summary.mode = mode;

    std::vector<OpenOrder> open;
    try {
        open = gateway_.open_orders(fill.symbol);
    } catch (const std::exception& ex) {
        log_warn(kTag, "listing open orders on ", fill.symbol, " failed: ", ex.what());
        return summary;
    }

    const auto targets = select_targets(open, mode, fill, policy_.client_id_prefix);
    summary.targeted = targets.size();

    std::vector<std::future<bool>> pending;
    pending.reserve(targets.size());
    try {
        for (const auto& order : targets) {
            pending.push_back(launch([this, &fill, order]() {
                try {
                    gateway_.cancel_order(fill.symbol, order.order_id);
                    return true;
                } catch (const binance::UpstreamError& ex) {
                    // -2011 "Unknown order sent": already filled or cancelled.
                    log_info(kTag, "cancel ", order.order_id, " (", order.client_order_id, ") on ",
                             fill.symbol, " rejected with HTTP ", ex.status_code(), ": ", ex.body());
                } catch (const std::exception& ex) {
                    log_warn(kTag, "cancel ", order.order_id, " (", order.client_order_id, ") on ",
                             fill.symbol, " failed: ", ex.what());
                }
                return false;
            }));
        }
    } catch (const std::system_error& ex) {
        summary.failed = targets.size() - pending.size();
        log_error(kTag, "could not start ", summary.failed, " cancels on ", fill.symbol, ": ", ex.what());
    }

    for (auto& result : pending) {
        if (result.get()) {
            ++summary.cancelled;
        } else {
            ++summary.failed;
        }
    }

    if (mode == CancelMode::ByPrefix) {
        log_info(kTag, "canceled ", summary.cancelled, "/", summary.targeted, " prefix(\"",
                 policy_.client_id_prefix, "\") orders on ", fill.symbol);
    } else {
        log_info(kTag, "canceled ", summary.cancelled, "/", summary.targeted, " orders on ",
                 fill.symbol, " side=", fill.position_side.value_or("?"));
    }
    return summary;
}

std::future<bool> CancellationEngine::launch(std::function<bool()> task) {
    return std::async(std::launch::async, std::move(task));
}

} // namespace guard
