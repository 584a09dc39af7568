#pragma once

#include "guard/cancellation_engine.hpp"
#include "guard/channel.hpp"
#include "guard/order_event.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace guard {

struct PipelineObserver {
    std::function<void(std::int64_t at_ms)> on_order_event;
    // `detected_at_ms` is when the fill was classified, before any cancel ran.
    std::function<void(const ClosingFill& fill, const CancelSummary& summary, std::int64_t detected_at_ms)> on_close_fill;
};

// Classifies raw stream messages on the submitting thread and runs the
// cancellation engine for qualifying fills on a worker. Fills are queued
// without a bound; everything else is settled before submit() returns.
class EventPipeline {
public:
    EventPipeline(CancellationEngine& engine, PipelineObserver observer);
    ~EventPipeline();

    EventPipeline(const EventPipeline&) = delete;
    EventPipeline& operator=(const EventPipeline&) = delete;

    void start();

    // Stops accepting fills, finishes the queued ones and joins.
    void stop();

    // Never blocks on the engine. Returns false only when a qualifying fill
    // arrives after stop().
    bool submit(const std::string& message);

    // Classifies and acts on one message on the calling thread.
    void process(const std::string& message);

private:
    struct PendingFill {
        ClosingFill fill;
        std::int64_t detected_at_ms = 0;
    };

    std::optional<PendingFill> inspect(const std::string& message);
    void act(const PendingFill& pending);
    void run();

    CancellationEngine& engine_;
    PipelineObserver observer_;
    WorkQueue<PendingFill> fills_;
    std::thread worker_;
};

} // namespace guard
