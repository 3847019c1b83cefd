#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <string>

struct PipelineConfig {
    // capture
    int camera_index = 0;
    int capture_width = 640;
    int capture_height = 480;
    int capture_fps = 30;

    // scheduling
    uint32_t detect_interval = 5;   // D
    uint32_t resolve_interval = 10; // F
    int bucket_size = 50;           // Q, pixels
    int crop_padding = 10;
    size_t cache_capacity = 0;      // 0 = unbounded

    // outputs
    size_t log_tail_capacity = 1000;
    int jpeg_quality = 80;
    std::string event_store_path = "detection_history.csv";
    std::string event_store_kind = "csv"; // csv | sqlite
    std::string gallery_dir = "known_faces";

    // models
    std::string detector_param = "models/yolov8n/yolov8n.param";
    std::string detector_bin = "models/yolov8n/yolov8n.bin";
    std::string retinaface_param = "models/retinaface/mnet.25-opt.param";
    std::string retinaface_bin = "models/retinaface/mnet.25-opt.bin";
    std::string mobilefacenet_param = "models/mobilefacenet/mobilefacenet.param";
    std::string mobilefacenet_bin = "models/mobilefacenet/mobilefacenet.bin";
    float detector_conf_threshold = 0.25f;
    float detector_nms_threshold = 0.45f;
    float verify_distance_threshold = 0.4f;
    int model_threads = 4;
    bool use_vulkan = false;

    // server
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    std::string tls_cert;
    std::string tls_key;
};

// throws std::runtime_error on unreadable file or bad values
PipelineConfig load_config_file(const std::string& path, PipelineConfig base = PipelineConfig());
void apply_env_overrides(PipelineConfig& cfg);
void validate_config(const PipelineConfig& cfg);

// file (--config), then env, then flags
PipelineConfig parse_args(int argc, char** argv);

#endif
