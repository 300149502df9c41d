#include "server_app.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace spex {

std::string status_to_json(const CoordinatorStatus& st) {
    std::ostringstream oss;
    oss << "{\"running\":" << (st.running ? "true" : "false")
        << ",\"uptime_sec\":" << st.uptime_sec
        << ",\"idle_sec\":" << st.idle_sec
        << ",\"gallery_size\":" << st.gallery_size
        << ",\"queued\":" << st.queued
        << "}";
    return oss.str();
}

ServerApp::ServerApp(Coordinator& coordinator, const AnnouncementLog& log, std::string host, int port)
    : coordinator_(coordinator), log_(log), host_(std::move(host)), port_(port) {}

ServerApp::~ServerApp() {
    stop();
}

bool ServerApp::start() {
    if (http_running_) return true;
    http_srv_ = std::make_unique<httplib::Server>();
    setup_routes();

    if (port_ == 0) {
        port_ = http_srv_->bind_to_any_port(host_);
        if (port_ <= 0) port_ = 0;
    } else if (!http_srv_->bind_to_port(host_, port_)) {
        port_ = 0;
    }
    if (port_ == 0) {
        std::cerr << "[ERROR] Unable to bind HTTP server on " << host_ << std::endl;
        http_srv_.reset();
        return false;
    }

    http_running_ = true;
    http_thread_ = std::thread([this] { http_srv_->listen_after_bind(); });
    std::cout << "[INFO] HTTP control surface on " << host_ << ":" << port_ << std::endl;
    return true;
}

void ServerApp::stop() {
    if (http_srv_) {
        http_srv_->stop();
    }
    if (http_thread_.joinable()) http_thread_.join();
    http_running_ = false;
}

void ServerApp::setup_routes() {
    http_srv_->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(status_to_json(coordinator_.status()), "application/json");
    });

    http_srv_->Get("/announcements", [this](const httplib::Request&, httplib::Response& res) {
        const auto lines = log_.lines();
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < lines.size(); ++i) {
            oss << lines[i];
            if (i + 1 < lines.size()) oss << ",";
        }
        oss << "]";
        res.set_content(oss.str(), "application/json");
    });

    http_srv_->Post("/command", [this](const httplib::Request& req, httplib::Response& res) {
        const auto first = req.body.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            res.status = 400;
            res.set_content("{\"error\":\"empty command\"}", "application/json");
            return;
        }
        const auto last = req.body.find_last_not_of(" \t\r\n");
        const std::string utterance = req.body.substr(first, last - first + 1);
        if (!coordinator_.submit_utterance(utterance)) {
            res.status = 503;
            res.set_content("{\"queued\":false}", "application/json");
            return;
        }
        std::cout << "[INFO] HTTP command: " << utterance << std::endl;
        res.status = 202;
        res.set_content("{\"queued\":true}", "application/json");
    });

    http_srv_->Post("/gallery/reload", [this](const httplib::Request&, httplib::Response& res) {
        const size_t loaded = coordinator_.reload_gallery();
        res.set_content("{\"loaded\":" + std::to_string(loaded) + "}", "application/json");
    });

    http_srv_->set_default_headers({{"Cache-Control", "no-store"}});
}

}  // namespace spex
