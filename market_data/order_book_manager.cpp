#include "order_book_manager.H"

#include <algorithm>

namespace kestrel::md {

OrderBookManager::OrderBookManager(std::shared_ptr<spdlog::logger> logger) : logger(logger) {}

OrderBook& OrderBookManager::get_or_create(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = books.find(symbol);
    if (it != books.end()) {
        return *it->second;
    }

    auto book = std::make_unique<OrderBook>(symbol, logger);
    auto& ref = *book;
    books.emplace(symbol, std::move(book));
    logger->info("Created order book for {}", symbol);
    return ref;
}

OrderBook* OrderBookManager::get(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = books.find(symbol);
    return it == books.end() ? nullptr : it->second.get();
}

const OrderBook* OrderBookManager::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = books.find(symbol);
    return it == books.end() ? nullptr : it->second.get();
}

std::vector<std::string> OrderBookManager::symbols() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> result;
    result.reserve(books.size());
    for (const auto& [symbol, book] : books) {
        result.push_back(symbol);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t OrderBookManager::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return books.size();
}

} // namespace kestrel::md
