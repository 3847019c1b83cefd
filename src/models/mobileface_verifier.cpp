#include "mobileface_verifier.hpp"

#include "../utils.hpp"

#include <iostream>

bool MobileFaceVerifier::load(const PipelineConfig& cfg) {
    distance_threshold_ = cfg.verify_distance_threshold;

    if (!locator_.load(cfg.retinaface_param, cfg.retinaface_bin, cfg.model_threads, cfg.use_vulkan)) {
        ready_ = false;
        return false;
    }

    mobilefacenet_net_.opt.use_vulkan_compute = cfg.use_vulkan;
    mobilefacenet_net_.opt.num_threads = cfg.model_threads;
    // https://github.com/liguiyuan/mobilefacenet-ncnn/tree/master/models
    if (mobilefacenet_net_.load_param(cfg.mobilefacenet_param.c_str()) != 0 ||
            mobilefacenet_net_.load_model(cfg.mobilefacenet_bin.c_str()) != 0) {
        std::cerr << "[embed] error: failed to load MobileFaceNet model from " << cfg.mobilefacenet_param << ".\n";
        ready_ = false;
        return false;
    }
    std::cout << "[embed] info: MobileFaceNet model loaded successfully.\n";

    ready_ = true;
    return true;
}

std::vector<float> MobileFaceVerifier::compute_feature_embedding(const cv::Mat& face) {
    cv::Mat input = face;
    if (input.cols != 112 || input.rows != 112) {
        cv::resize(face, input, cv::Size(112, 112));
    }
    if (!input.isContinuous()) input = input.clone();

    ncnn::Mat in = ncnn::Mat::from_pixels(input.data, ncnn::Mat::PIXEL_BGR2RGB, 112, 112);
    const float mean_vals[3] = {127.5f, 127.5f, 127.5f};
    const float norm_vals[3] = {1.f / 128.f, 1.f / 128.f, 1.f / 128.f};
    in.substract_mean_normalize(mean_vals, norm_vals);

    ncnn::Extractor ex = mobilefacenet_net_.create_extractor();
    ex.set_light_mode(true);
    ex.input("data", in);

    ncnn::Mat feat;
    if (ex.extract("fc1", feat) != 0) {
        std::cerr << "[embed] error: failed to extract feature embedding." << std::endl;
        return std::vector<float>();
    }

    std::vector<float> embedding(feat.w);
    for (int i = 0; i < feat.w; i++) {
        embedding[i] = feat[i];
    }
    l2_normalize(embedding);
    return embedding;
}

std::vector<float> MobileFaceVerifier::embed(const cv::Mat& bgr) {
    if (!ready_ || bgr.empty()) return std::vector<float>();

    std::vector<FaceObject> faces = locator_.detect(bgr);
    if (!faces.empty()) {
        cv::Mat aligned = align_face(bgr, faces.front());
        if (!aligned.empty()) return compute_feature_embedding(aligned);
    }

    // no face found, embed the whole crop
    return compute_feature_embedding(bgr);
}

VerifyResult MobileFaceVerifier::verify(const cv::Mat& probe, const GalleryEntry& reference) {
    VerifyResult result;
    if (!ready_) return result;

    auto it = reference_embeddings_.find(reference.path);
    if (it == reference_embeddings_.end()) {
        std::vector<float> embedding = embed(reference.image);
        if (embedding.empty()) {
            std::cerr << "[embed] warning: could not embed reference '" << reference.name << "'.\n";
            return result;
        }
        it = reference_embeddings_.emplace(reference.path, std::move(embedding)).first;
    }

    if (probe_data_ != probe.data || probe_embedding_.empty()) {
        probe_embedding_ = embed(probe);
        probe_data_ = probe.data;
    }
    if (probe_embedding_.empty() || probe_embedding_.size() != it->second.size()) return result;

    result.distance = 1.0f - dot(probe_embedding_, it->second);
    result.status = result.distance <= distance_threshold_ ? VerifyStatus::Matched : VerifyStatus::NotMatched;
    return result;
}
