#pragma once

#include "config.hpp"
#include "recommendation_sink.hpp"
#include "types.hpp"
#include <functional>
#include <memory>

class RedisBus : public RecommendationSink {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus() override;

    bool is_connected() const;

    // Live quote ticks between cycles
    void subscribe_price_ticks(std::function<void(const OddsQuote&)> callback);
    void stop_subscribers();

    bool publish_recommendation(const Recommendation& recommendation);
    void publish(const Recommendation& recommendation) override;

    // Non-copyable
    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
