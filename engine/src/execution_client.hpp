#pragma once

#include "types.hpp"

class ExecutionClient {
public:
    virtual ~ExecutionClient() = default;

    virtual ExecutionResult submit_intent(const BetIntent& intent) = 0;
};
