#pragma once

#include "types.hpp"

// Receives every recommendation that reached the gate, approved or not
class RecommendationSink {
public:
    virtual ~RecommendationSink() = default;

    virtual void publish(const Recommendation& recommendation) = 0;
};
