#include "source_collector.hpp"
#include <future>
#include <thread>
#include <spdlog/spdlog.h>

SourceCollector::SourceCollector(std::vector<std::shared_ptr<OddsSource>> sources, std::chrono::milliseconds timeout)
    : sources_(std::move(sources)), timeout_(timeout) {}

CycleSnapshot SourceCollector::collect(uint64_t cycle_id) const {
    CycleSnapshot snapshot;
    snapshot.cycle_id = cycle_id;
    snapshot.started_at = Clock::now();

    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    std::vector<std::future<std::vector<OddsQuote>>> futures;
    futures.reserve(sources_.size());

    for (const auto& source : sources_) {
        auto promise = std::make_shared<std::promise<std::vector<OddsQuote>>>();
        futures.push_back(promise->get_future());

        // Detached so a hung source never blocks the cycle; it owns its state
        std::thread([source, promise]() {
            try {
                promise->set_value(source->fetch_quotes());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();
    }

    for (size_t i = 0; i < sources_.size(); ++i) {
        const std::string source_id = sources_[i]->id();
        auto& future = futures[i];

        if (future.wait_until(deadline) != std::future_status::ready) {
            spdlog::warn("[{}] Source timed out after {} ms, absent this cycle", source_id, timeout_.count());
            snapshot.absent_sources.push_back(source_id);
            continue;
        }

        try {
            auto quotes = future.get();
            for (auto& quote : quotes) {
                quote.source_id = source_id;
            }
            spdlog::debug("[{}] Got {} quotes", source_id, quotes.size());
            snapshot.quotes.insert(snapshot.quotes.end(),
                                   std::make_move_iterator(quotes.begin()),
                                   std::make_move_iterator(quotes.end()));
            snapshot.reported_sources.push_back(source_id);
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Source unavailable: {}", source_id, e.what());
            snapshot.absent_sources.push_back(source_id);
        } catch (...) {
            spdlog::warn("[{}] Source unavailable: unknown error", source_id);
            snapshot.absent_sources.push_back(source_id);
        }
    }

    return snapshot;
}
