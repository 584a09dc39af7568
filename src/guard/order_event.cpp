#include "guard/order_event.hpp"

#include "guard/json_fields.hpp"

namespace guard {
namespace {

constexpr const char* kOrderTradeUpdate = "ORDER_TRADE_UPDATE";
constexpr const char* kStatusFilled = "FILLED";

const nlohmann::json& unwrap(const nlohmann::json& envelope) {
    if (envelope.is_object() && envelope.contains("data") && envelope["data"].is_object()) {
        return envelope["data"];
    }
    return envelope;
}

OrderUpdate decode_order(const nlohmann::json& order) {
    OrderUpdate update;
    update.symbol = get_string_optional(order, "s");
    update.order_type = get_string_optional(order, "ot");
    update.status = get_string_optional(order, "X");
    update.position_side = normalize_position_side(get_string_optional(order, "ps"));
    update.close_position = get_bool_optional(order, "cp");
    update.client_order_id = get_string_optional(order, "c");
    update.order_id = get_id_optional(order, "i");
    return update;
}

} // namespace

bool is_protective_order_type(const std::string& order_type) {
    return order_type == "STOP_MARKET"
        || order_type == "TAKE_PROFIT_MARKET"
        || order_type == "STOP"
        || order_type == "TAKE_PROFIT";
}

std::optional<std::string> normalize_position_side(const std::string& raw) {
    if (raw.empty() || raw == "BOTH") {
        return std::nullopt;
    }
    return raw;
}

bool is_close_fill(const OrderUpdate& update) {
    return update.close_position
        && is_protective_order_type(update.order_type)
        && update.status == kStatusFilled;
}

Classification classify_envelope(const nlohmann::json& envelope) {
    Classification result;

    const auto& event = unwrap(envelope);
    if (!event.is_object() || get_string_optional(event, "e") != kOrderTradeUpdate) {
        return result;
    }

    const auto it = event.find("o");
    if (it == event.end() || !it->is_object()) {
        return result;
    }

    auto update = decode_order(*it);
    if (update.symbol.empty()) {
        return result;
    }

    result.kind = ClassificationKind::NotQualifying;
    if (is_close_fill(update)) {
        result.kind = ClassificationKind::Qualifying;
        result.fill = ClosingFill{
            update.symbol,
            update.position_side,
            update.order_id,
            update.client_order_id,
            update.order_type
        };
    }
    result.update = std::move(update);
    return result;
}

Classification classify_message(const std::string& message) {
    const auto json = nlohmann::json::parse(message, nullptr, false);
    if (json.is_discarded()) {
        return Classification{};
    }
    return classify_envelope(json);
}

} // namespace guard
