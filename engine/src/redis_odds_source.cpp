#include "redis_odds_source.hpp"
#include "json_schemas.hpp"
#include <sw/redis++/redis++.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <mutex>
#include <stdexcept>

using json = nlohmann::json;

class RedisOddsSource::Impl {
public:
    Impl(const Config& config, const std::string& source_id)
        : key_(config.odds_snapshot_prefix + source_id), redis_(config.redis_url) {}

    std::vector<OddsQuote> fetch(const std::string& source_id) {
        sw::redis::OptionalString payload;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            payload = redis_.get(key_);
        }
        if (!payload) {
            throw std::runtime_error("no snapshot under " + key_);
        }

        auto j = json::parse(*payload);
        if (!j.is_array()) {
            throw std::runtime_error("snapshot under " + key_ + " is not an array");
        }

        std::vector<OddsQuote> quotes;
        quotes.reserve(j.size());
        size_t skipped = 0;
        for (const auto& entry : j) {
            try {
                quotes.push_back(quote_from_json(entry));
            } catch (const std::exception& e) {
                skipped++;
                spdlog::debug("Source {}: skipping quote: {}", source_id, e.what());
            }
        }

        if (skipped > 0) {
            spdlog::warn("Source {}: skipped {} unreadable quotes out of {}", source_id, skipped, j.size());
        }
        return quotes;
    }

private:
    std::string key_;
    std::mutex mutex_;
    sw::redis::Redis redis_;
};

RedisOddsSource::RedisOddsSource(const Config& config, std::string source_id)
    : source_id_(std::move(source_id)), pImpl_(std::make_unique<Impl>(config, source_id_)) {}

RedisOddsSource::~RedisOddsSource() = default;

std::vector<OddsQuote> RedisOddsSource::fetch_quotes() {
    return pImpl_->fetch(source_id_);
}
