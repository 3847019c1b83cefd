#include <opencv2/opencv.hpp>

#include "../src/config.hpp"
#include "../src/models/mobileface_verifier.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

bool run_check(MobileFaceVerifier& verifier, const std::string& label, const cv::Mat& probe, const GalleryEntry& reference) {
    std::cout << "[" << label << "] " << reference.path << "\n";
    verifier.on_new_probe();
    VerifyResult result = verifier.verify(probe, reference);
    if (result.status == VerifyStatus::Error) {
        std::cout << "  ERROR: verification failed\n";
        return false;
    }
    std::cout << "  Result: verified=" << (result.status == VerifyStatus::Matched ? "true" : "false")
              << ", distance=" << std::fixed << std::setprecision(4) << result.distance << "\n";
    return true;
}

GalleryEntry load_entry(const std::string& path) {
    GalleryEntry entry;
    entry.path = path;
    entry.name = path;
    entry.image = cv::imread(path, cv::IMREAD_COLOR);
    return entry;
}

}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: verify_faces <probe image> [reference image] [--config <json>]\n";
        return 2;
    }

    PipelineConfig cfg;
    std::string reference_path;
    try {
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                cfg = load_config_file(argv[++i], cfg);
            } else {
                reference_path = arg;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    MobileFaceVerifier verifier;
    if (!verifier.load(cfg)) {
        std::cerr << "error: failed to load face models.\n";
        return 1;
    }

    GalleryEntry probe = load_entry(argv[1]);
    if (probe.image.empty()) {
        std::cerr << "error: failed to read image: " << argv[1] << "\n";
        return 1;
    }

    bool ok = run_check(verifier, "same image", probe.image, probe);

    // upper 60% of the image, roughly a head crop from a person box
    cv::Mat head_crop = probe.image(cv::Rect(0, 0, probe.image.cols, std::max(1, probe.image.rows * 6 / 10))).clone();
    ok = run_check(verifier, "head crop", head_crop, probe) && ok;

    if (!reference_path.empty()) {
        GalleryEntry reference = load_entry(reference_path);
        if (reference.image.empty()) {
            std::cerr << "error: failed to read image: " << reference_path << "\n";
            return 1;
        }
        ok = run_check(verifier, "reference", probe.image, reference) && ok;
    }

    std::cout << "done.\n";
    return ok ? 0 : 1;
}
