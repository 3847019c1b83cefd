#include "yolo_person_detector.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace {

void nms_sorted_boxes(const std::vector<DetectorBox>& boxes, std::vector<int>& picked, float nms_threshold) {
    picked.clear();

    const int n = boxes.size();
    for (int i = 0; i < n; ++i) {
        const DetectorBox& a = boxes[i];

        bool keep = true;
        for (int j = 0; j < (int)picked.size(); ++j) {
            const DetectorBox& b = boxes[picked[j]];
            if (a.class_id != b.class_id) continue;

            float inter_area = (a.bbox & b.bbox).area();
            float union_area = a.bbox.area() + b.bbox.area() - inter_area;
            if (union_area > 0 && inter_area / union_area > nms_threshold) keep = false;
        }

        if (keep) picked.push_back(i);
    }
}

}

bool YoloPersonDetector::load(const PipelineConfig& cfg) {
    conf_threshold_ = cfg.detector_conf_threshold;
    nms_threshold_ = cfg.detector_nms_threshold;

    net_.opt.use_vulkan_compute = cfg.use_vulkan;
    net_.opt.num_threads = cfg.model_threads;
    if (net_.load_param(cfg.detector_param.c_str()) != 0 ||
            net_.load_model(cfg.detector_bin.c_str()) != 0) {
        std::cerr << "[detect] error: failed to load YOLOv8 model from " << cfg.detector_param << ".\n";
        ready_ = false;
        return false;
    }
    std::cout << "[detect] info: YOLOv8 model loaded successfully.\n";
    ready_ = true;
    return true;
}

std::vector<DetectorBox> YoloPersonDetector::detect(const cv::Mat& frame) {
    if (!ready_) throw std::runtime_error("detector model not loaded");
    if (frame.empty()) return {};

    // letterbox into target_size x target_size
    const int w = frame.cols;
    const int h = frame.rows;
    const float scale = std::min(target_size_ / (float)w, target_size_ / (float)h);
    const int resized_w = static_cast<int>(w * scale);
    const int resized_h = static_cast<int>(h * scale);
    const int pad_x = (target_size_ - resized_w) / 2;
    const int pad_y = (target_size_ - resized_h) / 2;

    cv::Mat continuous = frame.isContinuous() ? frame : frame.clone();
    ncnn::Mat resized = ncnn::Mat::from_pixels_resize(continuous.data, ncnn::Mat::PIXEL_BGR2RGB, w, h, resized_w, resized_h);
    ncnn::Mat in;
    ncnn::copy_make_border(resized, in, pad_y, target_size_ - resized_h - pad_y, pad_x, target_size_ - resized_w - pad_x,
                           ncnn::BORDER_CONSTANT, 114.f);

    const float norm_vals[3] = {1 / 255.f, 1 / 255.f, 1 / 255.f};
    in.substract_mean_normalize(0, norm_vals);

    ncnn::Extractor ex = net_.create_extractor();
    ex.input("in0", in);
    ncnn::Mat out;
    if (ex.extract("out0", out) != 0) {
        throw std::runtime_error("failed to extract YOLOv8 output");
    }

    // rows are attributes; accept the transposed export as well
    const bool transposed = out.w < out.h;
    const int num_attrs = transposed ? out.w : out.h;
    const int num_anchors = transposed ? out.h : out.w;
    if (num_attrs < 5 || num_anchors <= 0) {
        throw std::runtime_error("unexpected YOLOv8 output shape " + std::to_string(out.w) + "x" + std::to_string(out.h));
    }
    auto attr = [&](int a, int i) -> float {
        return transposed ? out.row(i)[a] : out.row(a)[i];
    };

    std::vector<DetectorBox> proposals;
    for (int i = 0; i < num_anchors; ++i) {
        int best_class = -1;
        float best_score = 0.f;
        for (int c = 4; c < num_attrs; ++c) {
            float score = attr(c, i);
            if (score > best_score) {
                best_score = score;
                best_class = c - 4;
            }
        }
        if (best_class < 0 || best_score < conf_threshold_) continue;

        const float cx = attr(0, i);
        const float cy = attr(1, i);
        const float bw = attr(2, i);
        const float bh = attr(3, i);

        // back to frame coordinates
        float x0 = std::max(std::min((cx - bw * 0.5f - pad_x) / scale, (float)w - 1), 0.f);
        float y0 = std::max(std::min((cy - bh * 0.5f - pad_y) / scale, (float)h - 1), 0.f);
        float x1 = std::max(std::min((cx + bw * 0.5f - pad_x) / scale, (float)w - 1), 0.f);
        float y1 = std::max(std::min((cy + bh * 0.5f - pad_y) / scale, (float)h - 1), 0.f);
        if (x1 <= x0 || y1 <= y0) continue;

        DetectorBox box;
        box.class_id = best_class;
        box.bbox = cv::Rect2f(x0, y0, x1 - x0, y1 - y0);
        box.confidence = std::min(best_score, 1.0f);
        proposals.push_back(box);
    }

    std::sort(proposals.begin(), proposals.end(),
              [](const DetectorBox& a, const DetectorBox& b) { return a.confidence > b.confidence; });

    std::vector<int> picked;
    nms_sorted_boxes(proposals, picked, nms_threshold_);

    std::vector<DetectorBox> boxes;
    boxes.reserve(picked.size());
    for (int index : picked) {
        boxes.push_back(proposals[index]);
    }
    return boxes;
}
