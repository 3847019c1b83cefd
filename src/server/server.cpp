#include "server.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const size_t DEFAULT_LOG_LIMIT = 50;

void set_json(httplib::Response& res, const json& j, int status = 200) {
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

json error_json(const std::string& message) {
    json j;
    j["status"] = "error";
    j["message"] = message;
    return j;
}

size_t parse_limit(const httplib::Request& req) {
    if (!req.has_param("limit")) return DEFAULT_LOG_LIMIT;
    const std::string value = req.get_param_value("limit");
    size_t used = 0;
    long long limit = std::stoll(value, &used);
    if (used != value.size() || limit < 0) throw std::invalid_argument("limit must be a non-negative integer");
    return static_cast<size_t>(limit);
}

}

json event_to_json(const DetectionEvent& event) {
    json j;
    j["timestamp"] = event.timestamp;
    j["num_persons"] = event.num_persons;
    j["identified_count"] = event.identified_count;
    j["names"] = event.names;
    return j;
}

json status_to_json(const PipelineStatus& status) {
    json j;
    j["person_detected"] = status.person_present;
    j["identified_count"] = status.identified_count;
    j["frame_count"] = status.frame_index;
    j["detections_count"] = status.active_detection_count;
    j["state"] = pipeline_state_str(status.state);
    return j;
}

ServerApp::ServerApp(const PipelineConfig& cfg, Pipeline& pipeline, Gallery& gallery)
    : cfg_(cfg), pipeline_(pipeline), gallery_(gallery) {}

ServerApp::~ServerApp() {
    stop();
}

void ServerApp::setup_routes() {
    server_->set_default_headers({ { "Access-Control-Allow-Origin", "*" } });

    server_->Get("/", [&](const httplib::Request& req, httplib::Response& res) {
        json j;
        j["system"] = "GODS_EYE";
        j["status"] = "ONLINE";
        j["message"] = "Surveillance pipeline active";
        set_json(res, j);
    });

    server_->Get("/status", [&](const httplib::Request& req, httplib::Response& res) {
        json j;
        j["status"] = "success";
        // state and counters come from one snapshot
        j["data"] = status_to_json(pipeline_.status());
        set_json(res, j);
    });

    server_->Get("/logs", [&](const httplib::Request& req, httplib::Response& res) {
        size_t limit = DEFAULT_LOG_LIMIT;
        try {
            limit = parse_limit(req);
        } catch (const std::exception& e) {
            set_json(res, error_json(std::string("invalid limit: ") + e.what()), 400);
            return;
        }

        json logs = json::array();
        for (const DetectionEvent& event : pipeline_.logs(limit)) {
            logs.push_back(event_to_json(event));
        }

        json j;
        j["status"] = "success";
        j["count"] = logs.size();
        j["logs"] = std::move(logs);
        set_json(res, j);
    });

    // gallery endpoints
    server_->Get("/faces", [&](const httplib::Request& req, httplib::Response& res) {
        json j;
        j["status"] = "success";
        j["faces"] = gallery_.names();
        set_json(res, j);
    });

    server_->Post("/faces", [&](const httplib::Request& req, httplib::Response& res) {
        std::cout << "[server] info: received add face request.\n";
        auto file_it = req.files.find("imageFile");
        if (file_it == req.files.end()) {
            set_json(res, error_json("Missing image"), 400);
            return;
        }

        const auto& file = file_it->second;
        std::string error;
        if (!gallery_.add_reference(file.filename, file.content, error)) {
            set_json(res, error_json(error), 400);
            return;
        }

        json j;
        j["status"] = "success";
        j["faces"] = gallery_.names();
        set_json(res, j);
    });

    server_->Delete(R"(/faces/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
        const std::string name = req.matches[1];
        std::cout << "[server] info: received remove face request for '" << name << "'.\n";
        if (!gallery_.remove_reference(name)) {
            set_json(res, error_json("No such face: " + name), 404);
            return;
        }

        json j;
        j["status"] = "success";
        j["faces"] = gallery_.names();
        set_json(res, j);
    });

    // stream endpoint
    server_->Get("/video_feed", [&](const httplib::Request& req, httplib::Response& res) {
        if (pipeline_.state() != PipelineState::STOPPED) {
            set_json(res, error_json("stream busy"), 409);
            return;
        }

        res.set_content_provider(
            "multipart/x-mixed-replace; boundary=frame",
            [&](size_t offset, httplib::DataSink& sink) -> bool {
                auto write_frame = [&](const std::vector<uchar>& buf) -> bool {
                    if (stopping_.load() || !sink.is_writable()) return false;

                    std::string header = "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: " +
                                         std::to_string(buf.size()) + "\r\n\r\n";
                    if (!sink.write(header.c_str(), header.size())) // header
                        return false;
                    if (!sink.write(reinterpret_cast<const char*>(buf.data()), buf.size())) // jpeg data
                        return false;
                    return sink.write("\r\n", 2); // trailing newline
                };

                try {
                    pipeline_.stream(write_frame);
                } catch (const std::exception& e) {
                    std::cerr << "[server] error: video feed ended: " << e.what() << "\n";
                }
                sink.done();
                return true;
            });
    });
}

bool ServerApp::start() {
    stopping_.store(false);
    std::cout << "[server] info: starting server listening thread.\n";

    if (!cfg_.tls_cert.empty()) {
        server_ = std::make_unique<httplib::SSLServer>(cfg_.tls_cert.c_str(), cfg_.tls_key.c_str());
    } else {
        server_ = std::make_unique<httplib::Server>();
    }
    if (!server_->is_valid()) {
        std::cerr << "[server] error: failed to initialize server (check TLS certificate).\n";
        return false;
    }

    setup_routes();

    int bind_result = server_->bind_to_port(cfg_.host, cfg_.port);
    if (bind_result <= 0) {
        std::cerr << "[server] error: failed to bind to port " << cfg_.port << "\n";
        return false;
    }

    std::cout << "[server] info: server bound on " << (cfg_.tls_cert.empty() ? "http" : "https") << "://"
              << cfg_.host << ":" << cfg_.port << "\n";

    listen_thread_ = std::thread([this]() {
        server_->listen_after_bind();
    });
    return true;
}

void ServerApp::stop() {
    if (stopping_.exchange(true)) return;

    // ends any running video feed at the next frame boundary
    pipeline_.request_stop();

    if (server_) server_->stop();
    if (listen_thread_.joinable()) listen_thread_.join();
    std::cout << "[server] info: exiting server.\n";
}
