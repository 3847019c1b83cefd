#include <opencv2/opencv.hpp>

#include "config.hpp"
#include "core/event_log.hpp"
#include "core/event_store.hpp"
#include "core/frame_source.hpp"
#include "core/gallery.hpp"
#include "core/identity_resolver.hpp"
#include "core/pipeline.hpp"
#include "models/mobileface_verifier.hpp"
#include "models/yolo_person_detector.hpp"
#include "server/server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_exit_main_thread(false);

void signal_handler(int signum) {
    g_exit_main_thread.store(true);
}

}

int main(int argc, char** argv) {
    PipelineConfig cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[main] error: " << e.what() << std::endl;
        return 2;
    }

    // signal handling
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // init networks
    YoloPersonDetector detector;
    if (!detector.load(cfg)) {
        std::cerr << "[main] error: person detector unavailable, exiting." << std::endl;
        return 1;
    }

    MobileFaceVerifier verifier;
    FaceVerifier* verifier_ptr = &verifier;
    if (!verifier.load(cfg)) {
        std::cerr << "[main] warning: face models unavailable, identities will not be resolved.\n";
        verifier_ptr = nullptr;
    }

    Gallery gallery(cfg.gallery_dir);
    if (!gallery.reload()) {
        std::cerr << "[main] warning: gallery " << cfg.gallery_dir << " could not be loaded.\n";
    }

    std::unique_ptr<EventStore> store;
    try {
        store = make_event_store(cfg.event_store_kind, cfg.event_store_path);
    } catch (const std::exception& e) {
        std::cerr << "[main] error: " << e.what() << std::endl;
        return 2;
    }
    EventLog event_log(std::move(store), cfg.log_tail_capacity);
    event_log.open();

    OpenCvFrameSource camera(cfg.capture_width, cfg.capture_height, cfg.capture_fps);
    IdentityResolver resolver(gallery, verifier_ptr, cfg.crop_padding);
    Pipeline pipeline(cfg, camera, detector, resolver, event_log);

    ServerApp server(cfg, pipeline, gallery);
    if (!server.start()) {
        return 1;
    }
    std::cout << "[main] info: system online, awaiting targets.\n";

    while (!g_exit_main_thread.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[main] info: initiating shutdown.\n";
    server.stop();
    std::cout << "[main] info: system offline.\n";
    return 0;
}
