#include "redis_bus.hpp"
#include "json_schemas.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iterator>
#include <mutex>
#include <thread>
#include <unordered_map>

using json = nlohmann::json;

namespace {

const char* kConsumerGroup = "liveedge_group";

std::string epoch_millis(TimePoint tp) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count());
}

} // namespace

class RedisBus::Impl {
public:
    Impl(const Config& config)
        : config_(config), running_(false), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        stop_subscribers();
        disconnect();
    }

    bool connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
            redis_->ping();
            spdlog::info("Connected to Redis at {}", config_.redis_url);
            backoff_ms_ = 1000;
            retry_count_ = 0;
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_.reset();
            return false;
        }
    }

    void disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (redis_) {
            redis_.reset();
            spdlog::info("Disconnected from Redis");
        }
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ping_locked();
    }

    bool ensure_connection() {
        std::lock_guard<std::mutex> reconnect_lock(reconnect_mutex_);
        if (is_connected()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;
        if (connect()) {
            spdlog::info("Redis connection restored");
            return true;
        }

        spdlog::warn("Redis reconnection failed (attempt {})", ++retry_count_);
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    void subscribe_price_ticks(std::function<void(const OddsQuote&)> callback) {
        if (tick_thread_.joinable()) {
            spdlog::warn("Price tick subscriber already running");
            return;
        }

        running_ = true;
        tick_thread_ = std::thread([this, callback]() {
            spdlog::info("Starting price tick subscriber on {}", config_.stream_price_ticks);

            sw::redis::Redis redis(config_.redis_url);

            try {
                redis.xgroup_create(config_.stream_price_ticks, kConsumerGroup, "$", true);
            } catch (const std::exception& e) {
                spdlog::debug("Consumer group already exists or error: {}", e.what());
            }

            std::string consumer_id = config_.service_name + "_" +
                std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

            using Attrs = std::vector<std::pair<std::string, std::string>>;
            using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
            using ItemStream = std::vector<Item>;

            while (running_) {
                try {
                    std::unordered_map<std::string, ItemStream> result;
                    redis.xreadgroup(kConsumerGroup, consumer_id, config_.stream_price_ticks, ">",
                                     std::chrono::milliseconds(1000), 100,
                                     std::inserter(result, result.end()));

                    for (const auto& stream : result) {
                        for (const auto& item : stream.second) {
                            handle_tick(item.second, callback);
                            redis.xack(config_.stream_price_ticks, kConsumerGroup, item.first);
                        }
                    }
                } catch (const std::exception& e) {
                    spdlog::error("Error in price tick subscriber: {}", e.what());
                    std::this_thread::sleep_for(std::chrono::seconds(1));
                }
            }

            spdlog::info("Price tick subscriber stopped");
        });
    }

    void stop_subscribers() {
        running_ = false;
        if (tick_thread_.joinable()) {
            tick_thread_.join();
        }
    }

    bool publish_recommendation(const Recommendation& recommendation) {
        if (!ensure_connection()) {
            return false;
        }

        try {
            std::unordered_map<std::string, std::string> fields = {
                {"data", recommendation_to_json(recommendation).dump()},
                {"match_id", recommendation.match.match_id},
                {"outcome", to_string(recommendation.decision.outcome)},
                {"timestamp", epoch_millis(recommendation.decision.timestamp)}
            };

            std::lock_guard<std::mutex> lock(mutex_);
            if (!redis_) {
                return false;
            }
            redis_->xadd(config_.stream_recommendations, "*", fields.begin(), fields.end());
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to publish recommendation: {}", e.what());
            return false;
        }
    }

private:
    template <typename Fields>
    void handle_tick(const Fields& fields, const std::function<void(const OddsQuote&)>& callback) {
        if (!fields) {
            return;
        }
        try {
            for (const auto& field : *fields) {
                if (field.first == "data") {
                    callback(quote_from_json(json::parse(field.second)));
                }
            }
        } catch (const std::exception& e) {
            spdlog::warn("Discarding malformed price tick: {}", e.what());
        }
    }

    // Caller holds mutex_
    bool ping_locked() const {
        if (!redis_) {
            return false;
        }
        try {
            redis_->ping();
            return true;
        } catch (const std::exception& e) {
            spdlog::debug("Redis ping failed: {}", e.what());
            return false;
        }
    }

    const Config& config_;
    mutable std::mutex mutex_;
    std::mutex reconnect_mutex_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_;
    std::thread tick_thread_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

RedisBus::RedisBus(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}

RedisBus::~RedisBus() = default;

bool RedisBus::is_connected() const {
    return pImpl_->is_connected();
}

void RedisBus::subscribe_price_ticks(std::function<void(const OddsQuote&)> callback) {
    pImpl_->subscribe_price_ticks(std::move(callback));
}

void RedisBus::stop_subscribers() {
    pImpl_->stop_subscribers();
}

bool RedisBus::publish_recommendation(const Recommendation& recommendation) {
    return pImpl_->publish_recommendation(recommendation);
}

void RedisBus::publish(const Recommendation& recommendation) {
    if (!pImpl_->publish_recommendation(recommendation)) {
        spdlog::warn("Recommendation for {} not published to Redis", recommendation.match.match_id);
    }
}
