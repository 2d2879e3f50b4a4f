#include "redis_execution_client.hpp"
#include "json_schemas.hpp"
#include <sw/redis++/redis++.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <unordered_map>

using json = nlohmann::json;

namespace {

sw::redis::Redis make_redis(const Config& config) {
    sw::redis::ConnectionOptions opts(config.redis_url);
    sw::redis::ConnectionPoolOptions pool_opts;
    // Every evaluation worker may be blocked on a reply at the same time
    pool_opts.size = static_cast<std::size_t>(std::max(1, config.thread_pool_size));
    return sw::redis::Redis(opts, pool_opts);
}

} // namespace

class RedisExecutionClient::Impl {
public:
    Impl(const Config& config) : config_(config), redis_(make_redis(config)) {}

    ExecutionResult submit(const BetIntent& intent) {
        ExecutionResult result;
        try {
            std::unordered_map<std::string, std::string> fields = {
                {"data", intent_to_json(intent).dump()},
                {"intent_id", intent.intent_id},
                {"timestamp", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                    intent.created_at.time_since_epoch()).count())}
            };
            redis_.xadd(config_.stream_intents, "*", fields.begin(), fields.end());
        } catch (const std::exception& e) {
            spdlog::error("Failed to submit intent {}: {}", intent.intent_id, e.what());
            result.reason = e.what();
            return result;
        }

        // From here on the intent is on the stream and may be acted upon
        result.status = ExecutionStatus::Unconfirmed;
        try {
            // BLPOP only takes whole seconds
            auto timeout = std::chrono::seconds(std::max(1, (config_.intent_reply_timeout_ms + 999) / 1000));
            auto reply = redis_.blpop(config_.intent_reply_prefix + intent.intent_id, timeout);
            if (!reply) {
                result.reason = "no reply from execution layer";
                return result;
            }
            return execution_result_from_json(json::parse(reply->second));
        } catch (const std::exception& e) {
            spdlog::error("Lost track of intent {} after submission: {}", intent.intent_id, e.what());
            result.reason = e.what();
            return result;
        }
    }

private:
    const Config& config_;
    sw::redis::Redis redis_;
};

RedisExecutionClient::RedisExecutionClient(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}

RedisExecutionClient::~RedisExecutionClient() = default;

ExecutionResult RedisExecutionClient::submit_intent(const BetIntent& intent) {
    return pImpl_->submit(intent);
}
