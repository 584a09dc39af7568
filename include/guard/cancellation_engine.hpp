#pragma once

#include "guard/exchange_gateway.hpp"
#include "guard/order_event.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <string>
#include <vector>

namespace guard {

enum class CancelMode {
    BySymbol,
    BySide,
    ByPrefix
};

const char* to_string(CancelMode mode) noexcept;

// Accepts SYMBOL, SIDE or PREFIX in any case.
bool parse_cancel_mode(const std::string& text, CancelMode& mode);

struct CancelPolicy {
    CancelMode mode = CancelMode::BySymbol;
    std::string client_id_prefix = "brkt_";
    bool hedge_mode = false;
};

struct CancelSummary {
    std::string symbol;
    CancelMode mode = CancelMode::BySymbol;
    bool bulk = false;
    std::size_t targeted = 0;
    std::size_t cancelled = 0;
    std::size_t failed = 0;
};

// Picks the mode to apply for one fill. A side policy without a known
// position side degrades to BySymbol and fills `warning`.
CancelMode resolve_mode(const CancelPolicy& policy, const ClosingFill& fill, std::string* warning = nullptr);

// Filters a live open-order list down to the siblings of `fill`. The filled
// order itself is never a target.
std::vector<OpenOrder> select_targets(const std::vector<OpenOrder>& open_orders,
                                      CancelMode mode,
                                      const ClosingFill& fill,
                                      const std::string& prefix);

// Removes the remaining protective orders after a close fill. Never throws:
// listing and per-order failures are logged and counted in the summary.
class CancellationEngine {
public:
    CancellationEngine(ExchangeGateway& gateway, CancelPolicy policy);
    virtual ~CancellationEngine() = default;

    CancelSummary execute(const ClosingFill& fill);

protected:
    // Runs one per-order cancel off the calling thread. Throws
    // std::system_error when no thread can be started.
    virtual std::future<bool> launch(std::function<bool()> task);

private:
    CancelSummary cancel_all(const ClosingFill& fill);
    CancelSummary cancel_selected(const ClosingFill& fill, CancelMode mode);

    ExchangeGateway& gateway_;
    CancelPolicy policy_;
};

} // namespace guard
