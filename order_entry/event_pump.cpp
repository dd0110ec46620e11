#include "event_pump.H"

namespace kestrel::oe {

EventPump::EventPump(EventQueue& queue, OrderManager& manager, std::shared_ptr<spdlog::logger> logger,
                     std::chrono::milliseconds poll_interval)
    : queue(queue), manager(manager), logger(logger), poll_interval(poll_interval) {}

EventPump::~EventPump() {
    stop();
}

void EventPump::start() {
    if (worker.joinable()) {
        return;
    }
    worker = std::thread(&EventPump::run, this);
    logger->info("Event pump started");
}

void EventPump::stop() {
    token.cancel();
    if (worker.joinable()) {
        worker.join();
        logger->info("Event pump stopped after {} events, {} failed", processed_count.load(), failed_count.load());
    }
}

void EventPump::run() {
    while (!token.is_cancelled()) {
        exchange_event event;
        if (queue.pop(event, poll_interval)) {
            dispatch(event);
        }
    }
}

size_t EventPump::process(size_t max_events) {
    size_t count = 0;
    exchange_event event;
    while (count < max_events && queue.try_pop(event)) {
        dispatch(event);
        count++;
    }
    return count;
}

void EventPump::dispatch(const exchange_event& event) {
    try {
        if (std::holds_alternative<order_update_event>(event)) {
            manager.handle_order_update(std::get<order_update_event>(event));
        } else {
            manager.handle_order_fill(std::get<order_fill_event>(event));
        }
        processed_count++;
    } catch (const std::exception& e) {
        failed_count++;
        logger->error("Failed to apply exchange event: {}", e.what());
    }
}

} // namespace kestrel::oe
