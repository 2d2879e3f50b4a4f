#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class HealthServer::Impl {
public:
    Impl(const Config& config, StatusFn status_fn)
        : config_(config), status_fn_(std::move(status_fn)), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        running_ = true;

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            health_status["service"] = config_.service_name;
            health_status["timestamp"] = util::format_iso8601(std::chrono::system_clock::now());

            bool healthy = false;
            try {
                healthy = status_fn_(health_status);
            } catch (const std::exception& e) {
                spdlog::error("Health check failed: {}", e.what());
                health_status["error"] = e.what();
            }

            health_status["status"] = healthy ? "healthy" : "unhealthy";
            res.status = healthy ? 200 : 503;
            res.set_content(health_status.dump(2), "application/json");
        });

        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server starting on {}:{}", config_.health_host, config_.health_port);
            if (!server_.listen(config_.health_host.c_str(), config_.health_port)) {
                spdlog::error("Health check server failed to listen on {}:{}",
                              config_.health_host, config_.health_port);
            }
        });
    }

    void stop() {
        if (running_) {
            running_ = false;
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    const Config& config_;
    StatusFn status_fn_;
    std::atomic<bool> running_;
    httplib::Server server_;
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, StatusFn status_fn)
    : pImpl_(std::make_unique<Impl>(config, std::move(status_fn))) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}
