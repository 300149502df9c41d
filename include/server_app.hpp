#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "announcement_log.hpp"
#include "coordinator.hpp"

namespace spex {

// Small REST surface next to the voice loop: status, the announcement log,
// a way to inject commands and a gallery reload after retraining.
class ServerApp {
public:
    ServerApp(Coordinator& coordinator, const AnnouncementLog& log, std::string host = "0.0.0.0", int port = 8000);
    ~ServerApp();

    // Binds synchronously (port 0 picks a free one) and serves on a
    // background thread. False when the socket cannot be bound.
    bool start();
    void stop();

    int port() const { return port_; }
    bool running() const { return http_running_; }

private:
    void setup_routes();

    Coordinator& coordinator_;
    const AnnouncementLog& log_;
    std::string host_;
    int port_;

    std::atomic<bool> http_running_{false};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;
};

std::string status_to_json(const CoordinatorStatus& st);

}  // namespace spex
