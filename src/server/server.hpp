#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "../core/gallery.hpp"
#include "../core/pipeline.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

nlohmann::json event_to_json(const DetectionEvent& event);
nlohmann::json status_to_json(const PipelineStatus& status);

// REST + MJPEG front of one Pipeline.
class ServerApp {
public:
    ServerApp(const PipelineConfig& cfg, Pipeline& pipeline, Gallery& gallery);
    ~ServerApp();

    // binds and starts listening on a background thread
    bool start();
    void stop();

private:
    void setup_routes();

    PipelineConfig cfg_;
    Pipeline& pipeline_;
    Gallery& gallery_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> stopping_{false};
};

#endif
