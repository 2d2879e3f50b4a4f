#pragma once

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>

// GET /health. The status callback fills the "components" and "last_cycle" sections
// and returns false when a required dependency is down.
class HealthServer {
public:
    using StatusFn = std::function<bool(nlohmann::json& status)>;

    HealthServer(const Config& config, StatusFn status_fn);
    ~HealthServer();

    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
