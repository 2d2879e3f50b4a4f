#pragma once

#include "config.hpp"
#include "execution_client.hpp"
#include <memory>

// Hands approved intents to the execution layer over Redis: XADD on
// STREAM_INTENTS, then BLPOP on INTENT_REPLY_PREFIX + intent id. A failed
// XADD is a rejection; no reply within INTENT_REPLY_TIMEOUT_MS leaves the
// intent unconfirmed.
class RedisExecutionClient : public ExecutionClient {
public:
    explicit RedisExecutionClient(const Config& config);
    ~RedisExecutionClient() override;

    ExecutionResult submit_intent(const BetIntent& intent) override;

    // Non-copyable
    RedisExecutionClient(const RedisExecutionClient&) = delete;
    RedisExecutionClient& operator=(const RedisExecutionClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
