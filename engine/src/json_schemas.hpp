#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>

// Wire formats shared with the odds collectors and the execution layer.
// The from_json readers throw on missing fields or unknown codes.

OddsQuote quote_from_json(const nlohmann::json& j);

nlohmann::json recommendation_to_json(const Recommendation& recommendation);

nlohmann::json intent_to_json(const BetIntent& intent);
ExecutionResult execution_result_from_json(const nlohmann::json& j);
