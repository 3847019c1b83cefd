#ifndef MODELS_MOBILEFACE_VERIFIER_HPP
#define MODELS_MOBILEFACE_VERIFIER_HPP

#include <opencv2/opencv.hpp>
#include <net.h>

#include "../config.hpp"
#include "../core/face_verifier.hpp"
#include "retinaface.hpp"

#include <string>
#include <unordered_map>
#include <vector>

// RetinaFace alignment + MobileFaceNet embedding, cosine distance.
// distance = 1 - cos(probe, reference); matched when distance <= threshold.
class MobileFaceVerifier : public FaceVerifier {
public:
    explicit MobileFaceVerifier(float distance_threshold = 0.4f) : distance_threshold_(distance_threshold) {}

    bool load(const PipelineConfig& cfg);
    bool ready() const { return ready_; }

    VerifyResult verify(const cv::Mat& probe, const GalleryEntry& reference) override;
    void on_gallery_reload() override { reference_embeddings_.clear(); }
    void on_new_probe() override { probe_embedding_.clear(); probe_data_ = nullptr; }

    // unit-length embedding, empty on failure
    std::vector<float> embed(const cv::Mat& bgr);

private:
    std::vector<float> compute_feature_embedding(const cv::Mat& face);

    RetinaFaceLocator locator_;
    ncnn::Net mobilefacenet_net_;
    float distance_threshold_;
    bool ready_ = false;

    std::unordered_map<std::string, std::vector<float>> reference_embeddings_; // by path

    // embedding of the current probe, reused across gallery entries
    std::vector<float> probe_embedding_;
    const uchar* probe_data_ = nullptr;
};

#endif
