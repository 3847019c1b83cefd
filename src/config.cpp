#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("config: invalid value for '") + key + "': " + e.what());
    }
}

int parse_int(const char* key, const char* value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != std::strlen(value)) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("config: '") + key + "' expects an integer, got '" + value + "'");
    }
}

uint32_t parse_interval(const char* key, const char* value) {
    int parsed = parse_int(key, value);
    if (parsed < 1) throw std::runtime_error(std::string("config: '") + key + "' must be >= 1");
    return static_cast<uint32_t>(parsed);
}

uint16_t checked_port(const char* key, int port) {
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::string("config: '") + key + "' must be in 1..65535, got " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

}

PipelineConfig load_config_file(const std::string& path, PipelineConfig cfg) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("config: could not open " + path);
    }

    json j;
    try {
        ifs >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("config: failed to parse " + path + ": " + e.what());
    }

    read_key(j, "camera_index", cfg.camera_index);
    read_key(j, "capture_width", cfg.capture_width);
    read_key(j, "capture_height", cfg.capture_height);
    read_key(j, "capture_fps", cfg.capture_fps);
    read_key(j, "detect_interval", cfg.detect_interval);
    read_key(j, "resolve_interval", cfg.resolve_interval);
    read_key(j, "bucket_size", cfg.bucket_size);
    read_key(j, "crop_padding", cfg.crop_padding);
    read_key(j, "cache_capacity", cfg.cache_capacity);
    read_key(j, "log_tail_capacity", cfg.log_tail_capacity);
    read_key(j, "jpeg_quality", cfg.jpeg_quality);
    read_key(j, "event_store_path", cfg.event_store_path);
    read_key(j, "event_store_kind", cfg.event_store_kind);
    read_key(j, "gallery_dir", cfg.gallery_dir);

    if (j.contains("models")) {
        const json& m = j["models"];
        read_key(m, "detector_param", cfg.detector_param);
        read_key(m, "detector_bin", cfg.detector_bin);
        read_key(m, "retinaface_param", cfg.retinaface_param);
        read_key(m, "retinaface_bin", cfg.retinaface_bin);
        read_key(m, "mobilefacenet_param", cfg.mobilefacenet_param);
        read_key(m, "mobilefacenet_bin", cfg.mobilefacenet_bin);
        read_key(m, "detector_conf_threshold", cfg.detector_conf_threshold);
        read_key(m, "detector_nms_threshold", cfg.detector_nms_threshold);
        read_key(m, "verify_distance_threshold", cfg.verify_distance_threshold);
        read_key(m, "threads", cfg.model_threads);
        read_key(m, "use_vulkan", cfg.use_vulkan);
    }

    if (j.contains("server")) {
        const json& s = j["server"];
        read_key(s, "host", cfg.host);
        int port = cfg.port;
        read_key(s, "port", port);
        cfg.port = checked_port("port", port);
        read_key(s, "tls_cert", cfg.tls_cert);
        read_key(s, "tls_key", cfg.tls_key);
    }

    return cfg;
}

void apply_env_overrides(PipelineConfig& cfg) {
    if (const char* v = std::getenv("GODSEYE_CAMERA")) cfg.camera_index = parse_int("GODSEYE_CAMERA", v);
    if (const char* v = std::getenv("GODSEYE_PORT")) cfg.port = checked_port("GODSEYE_PORT", parse_int("GODSEYE_PORT", v));
    if (const char* v = std::getenv("GODSEYE_DETECT_INTERVAL")) cfg.detect_interval = parse_interval("GODSEYE_DETECT_INTERVAL", v);
    if (const char* v = std::getenv("GODSEYE_RESOLVE_INTERVAL")) cfg.resolve_interval = parse_interval("GODSEYE_RESOLVE_INTERVAL", v);
    if (const char* v = std::getenv("GODSEYE_GALLERY_DIR")) cfg.gallery_dir = v;
    if (const char* v = std::getenv("GODSEYE_EVENT_STORE")) cfg.event_store_path = v;
}

void validate_config(const PipelineConfig& cfg) {
    if (cfg.detect_interval < 1) throw std::runtime_error("config: detect_interval must be >= 1");
    if (cfg.resolve_interval < 1) throw std::runtime_error("config: resolve_interval must be >= 1");
    if (cfg.bucket_size < 1) throw std::runtime_error("config: bucket_size must be >= 1");
    if (cfg.crop_padding < 0) throw std::runtime_error("config: crop_padding must be >= 0");
    if (cfg.log_tail_capacity < 1) throw std::runtime_error("config: log_tail_capacity must be >= 1");
    if (cfg.jpeg_quality < 1 || cfg.jpeg_quality > 100) throw std::runtime_error("config: jpeg_quality must be in 1..100");
    if (cfg.event_store_kind != "csv" && cfg.event_store_kind != "sqlite") {
        throw std::runtime_error("config: event_store_kind must be 'csv' or 'sqlite', got '" + cfg.event_store_kind + "'");
    }
    if (cfg.tls_cert.empty() != cfg.tls_key.empty()) {
        throw std::runtime_error("config: tls_cert and tls_key must be set together");
    }
}

PipelineConfig parse_args(int argc, char** argv) {
    PipelineConfig cfg;

    for (int i = 1; i + 1 < argc; ++i) {
        if (arg_eq(argv[i], "--config")) {
            cfg = load_config_file(argv[i + 1], cfg);
            break;
        }
    }

    apply_env_overrides(cfg);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (arg_eq(arg, "--config") && next) {
            ++i;
        } else if (arg_eq(arg, "--camera") && next) {
            cfg.camera_index = parse_int("--camera", next);
            ++i;
        } else if (arg_eq(arg, "--port") && next) {
            cfg.port = checked_port("--port", parse_int("--port", next));
            ++i;
        } else if (arg_eq(arg, "--gallery") && next) {
            cfg.gallery_dir = next;
            ++i;
        } else if (arg_eq(arg, "--events") && next) {
            cfg.event_store_path = next;
            ++i;
        } else if (arg_eq(arg, "--help")) {
            std::cout << "Usage: godseye [--config <json>] [--camera <index>] [--port <n>]\n"
                      << "               [--gallery <dir>] [--events <path>]\n";
            std::exit(0);
        } else {
            throw std::runtime_error(std::string("config: unknown argument '") + arg + "'");
        }
    }

    validate_config(cfg);
    return cfg;
}
