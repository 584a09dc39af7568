#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace guard {

// Fields of one ORDER_TRADE_UPDATE that matter to the guard.
struct OrderUpdate {
    std::string symbol;
    std::string order_type;   // original type ("ot"), not the post-trigger "o"
    std::string status;
    std::optional<std::string> position_side;
    bool close_position = false;
    std::string client_order_id;
    std::int64_t order_id = 0;
};

struct ClosingFill {
    std::string symbol;
    std::optional<std::string> position_side;
    std::int64_t order_id = 0;
    std::string client_order_id;
    std::string order_type;
};

enum class ClassificationKind {
    NotApplicable,   // not an order update, or not shaped like one
    NotQualifying,   // an order update that is not a close fill
    Qualifying
};

struct Classification {
    ClassificationKind kind = ClassificationKind::NotApplicable;
    std::optional<OrderUpdate> update;
    std::optional<ClosingFill> fill;

    bool is_order_update() const noexcept { return kind != ClassificationKind::NotApplicable; }
    bool qualifies() const noexcept { return kind == ClassificationKind::Qualifying; }
};

// Recognized close-position families: STOP_MARKET, TAKE_PROFIT_MARKET and the
// limit variants STOP and TAKE_PROFIT.
bool is_protective_order_type(const std::string& order_type);

// LONG/SHORT are kept; "BOTH" (one-way accounts) and empty become nullopt.
std::optional<std::string> normalize_position_side(const std::string& raw);

bool is_close_fill(const OrderUpdate& update);

// Deterministic, no I/O. Combined-stream wrappers ({"stream":..,"data":..}) are unwrapped.
Classification classify_envelope(const nlohmann::json& envelope);

// Parse failures classify as NotApplicable.
Classification classify_message(const std::string& message);

} // namespace guard
