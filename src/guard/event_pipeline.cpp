#include "guard/event_pipeline.hpp"

#include "binance/util.hpp"
#include "guard/log.hpp"

#include <utility>

namespace guard {
namespace {

constexpr const char* kTag = "OCO";

} // namespace

EventPipeline::EventPipeline(CancellationEngine& engine, PipelineObserver observer)
    : engine_(engine),
      observer_(std::move(observer)) {}

EventPipeline::~EventPipeline() {
    stop();
}

void EventPipeline::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread(&EventPipeline::run, this);
}

void EventPipeline::stop() {
    fills_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool EventPipeline::submit(const std::string& message) {
    auto pending = inspect(message);
    if (!pending) {
        return true;
    }
    const auto symbol = pending->fill.symbol;
    const auto order_id = pending->fill.order_id;
    if (!fills_.push(std::move(*pending))) {
        log_error(kTag, "shutting down, close fill ", order_id, " on ", symbol, " not acted on");
        return false;
    }
    return true;
}

void EventPipeline::process(const std::string& message) {
    if (auto pending = inspect(message)) {
        act(*pending);
    }
}

std::optional<EventPipeline::PendingFill> EventPipeline::inspect(const std::string& message) {
    const auto result = classify_message(message);
    if (!result.is_order_update()) {
        return std::nullopt;
    }

    const auto seen_at = binance::current_timestamp_ms();
    if (observer_.on_order_event) {
        observer_.on_order_event(seen_at);
    }

    const auto& update = *result.update;
    log_debug(kTag, "order update ", update.symbol, " ", update.order_type, " ", update.status,
              " cp=", update.close_position, " id=", update.order_id);

    if (!result.qualifies()) {
        return std::nullopt;
    }

    const auto& fill = *result.fill;
    log_info(kTag, fill.order_type, " close fill on ", fill.symbol,
             " side=", fill.position_side.value_or("-"), " order=", fill.order_id,
             " client=", fill.client_order_id);
    return PendingFill{fill, seen_at};
}

void EventPipeline::act(const PendingFill& pending) {
    const auto summary = engine_.execute(pending.fill);
    if (observer_.on_close_fill) {
        observer_.on_close_fill(pending.fill, summary, pending.detected_at_ms);
    }
}

void EventPipeline::run() {
    while (auto pending = fills_.pop()) {
        act(*pending);
    }
}

} // namespace guard
