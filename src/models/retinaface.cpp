#include "retinaface.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace {

struct StrideSpec {
    int feat_stride;
    float scales[2];
};

const StrideSpec STRIDES[] = {
    { 32, { 32.f, 16.f } },
    { 16, { 8.f, 4.f } },
    { 8, { 2.f, 1.f } }
};

inline float intersection_area(const FaceObject& a, const FaceObject& b) {
    cv::Rect_<float> inter = a.rect & b.rect;
    return inter.area();
}

ncnn::Mat generate_anchors(int base_size, const ncnn::Mat& ratios, const ncnn::Mat& scales) {
    int num_ratio = ratios.w;
    int num_scale = scales.w;

    ncnn::Mat anchors;
    anchors.create(4, num_ratio * num_scale);

    const float cx = 0;
    const float cy = 0;

    for (int i = 0; i < num_ratio; ++i) {
        float ar = ratios[i];

        int r_w = round(base_size / sqrt(ar));
        int r_h = round(r_w * ar);

        for (int j = 0; j < num_scale; ++j) {
            float scale = scales[j];

            float rs_w = r_w * scale;
            float rs_h = r_h * scale;

            float* anchor = anchors.row(i * num_scale + j);
            anchor[0] = cx - rs_w * 0.5f;
            anchor[1] = cy - rs_h * 0.5f;
            anchor[2] = cx + rs_w * 0.5f;
            anchor[3] = cy + rs_h * 0.5f;
        }
    }

    return anchors;
}

void generate_proposals(const ncnn::Mat& anchors, int feat_stride, const ncnn::Mat& score_blob, const ncnn::Mat& bbox_blob,
                        const ncnn::Mat& landmark_blob, float prob_threshold, std::vector<FaceObject>& faceobjects) {
    const int w = score_blob.w;
    const int h = score_blob.h;
    const int num_anchors = anchors.h;

    for (int q = 0; q < num_anchors; q++) {
        const float* anchor = anchors.row(q);

        const ncnn::Mat score = score_blob.channel(q + num_anchors);
        const ncnn::Mat bbox = bbox_blob.channel_range(q * 4, 4);
        const ncnn::Mat landmark = landmark_blob.channel_range(q * 10, 10);

        const float anchor_w = anchor[2] - anchor[0];
        const float anchor_h = anchor[3] - anchor[1];

        float anchor_y = anchor[1];
        for (int i = 0; i < h; i++) {
            float anchor_x = anchor[0];

            for (int j = 0; j < w; j++) {
                const int index = i * w + j;
                const float prob = score[index];

                if (prob >= prob_threshold) {
                    const float cx = anchor_x + anchor_w * 0.5f;
                    const float cy = anchor_y + anchor_h * 0.5f;

                    const float pb_cx = cx + anchor_w * bbox.channel(0)[index];
                    const float pb_cy = cy + anchor_h * bbox.channel(1)[index];
                    const float pb_w = anchor_w * std::exp(bbox.channel(2)[index]);
                    const float pb_h = anchor_h * std::exp(bbox.channel(3)[index]);

                    FaceObject obj;
                    obj.rect.x = pb_cx - pb_w * 0.5f;
                    obj.rect.y = pb_cy - pb_h * 0.5f;
                    obj.rect.width = pb_w + 1;
                    obj.rect.height = pb_h + 1;
                    for (int k = 0; k < 5; ++k) {
                        obj.landmarks[k].x = cx + (anchor_w + 1) * landmark.channel(k * 2)[index];
                        obj.landmarks[k].y = cy + (anchor_h + 1) * landmark.channel(k * 2 + 1)[index];
                    }
                    obj.prob = prob;

                    faceobjects.push_back(obj);
                }

                anchor_x += feat_stride;
            }

            anchor_y += feat_stride;
        }
    }
}

void nms_sorted_bboxes(const std::vector<FaceObject>& faceobjects, std::vector<int>& picked, float nms_threshold) {
    picked.clear();

    const int n = faceobjects.size();

    std::vector<float> areas(n);
    for (int i = 0; i < n; ++i) {
        areas[i] = faceobjects[i].rect.area();
    }

    for (int i = 0; i < n; ++i) {
        const FaceObject& a = faceobjects[i];

        bool keep = true;
        for (int j = 0; j < (int)picked.size(); ++j) {
            const FaceObject& b = faceobjects[picked[j]];

            float inter_area = intersection_area(a, b);
            float union_area = areas[i] + areas[picked[j]] - inter_area;
            if (union_area > 0 && inter_area / union_area > nms_threshold) keep = false;
        }

        if (keep) picked.push_back(i);
    }
}

}

bool RetinaFaceLocator::load(const std::string& param_path, const std::string& bin_path, int num_threads, bool use_vulkan) {
    net_.opt.use_vulkan_compute = use_vulkan;
    net_.opt.num_threads = num_threads;
    // https://github.com/nihui/ncnn-assets/tree/master/models
    if (net_.load_param(param_path.c_str()) != 0 || net_.load_model(bin_path.c_str()) != 0) {
        std::cerr << "[retina] error: failed to load RetinaFace model from " << param_path << ".\n";
        ready_ = false;
        return false;
    }
    std::cout << "[retina] info: RetinaFace model loaded successfully.\n";
    ready_ = true;
    return true;
}

std::vector<FaceObject> RetinaFaceLocator::detect(const cv::Mat& bgr) {
    std::vector<FaceObject> faceobjects;
    if (!ready_ || bgr.empty()) return faceobjects;

    const int img_w = bgr.cols;
    const int img_h = bgr.rows;

    cv::Mat continuous = bgr.isContinuous() ? bgr : bgr.clone();
    ncnn::Mat in = ncnn::Mat::from_pixels(continuous.data, ncnn::Mat::PIXEL_BGR2RGB, img_w, img_h);

    ncnn::Extractor ex = net_.create_extractor();
    ex.set_light_mode(true);
    ex.input("data", in);

    ncnn::Mat ratios(1);
    ratios[0] = 1.f;

    std::vector<FaceObject> faceproposals;
    for (const StrideSpec& spec : STRIDES) {
        const std::string suffix = "_stride" + std::to_string(spec.feat_stride);
        ncnn::Mat score_blob, bbox_blob, landmark_blob;
        if (ex.extract(("face_rpn_cls_prob_reshape" + suffix).c_str(), score_blob) != 0 ||
                ex.extract(("face_rpn_bbox_pred" + suffix).c_str(), bbox_blob) != 0 ||
                ex.extract(("face_rpn_landmark_pred" + suffix).c_str(), landmark_blob) != 0) {
            std::cerr << "[retina] error: failed to extract stride " << spec.feat_stride << " outputs.\n";
            return faceobjects;
        }

        ncnn::Mat scales(2);
        scales[0] = spec.scales[0];
        scales[1] = spec.scales[1];
        ncnn::Mat anchors = generate_anchors(16, ratios, scales);

        generate_proposals(anchors, spec.feat_stride, score_blob, bbox_blob, landmark_blob, prob_threshold_, faceproposals);
    }

    std::sort(faceproposals.begin(), faceproposals.end(),
              [](const FaceObject& a, const FaceObject& b) { return a.prob > b.prob; });

    std::vector<int> picked;
    nms_sorted_bboxes(faceproposals, picked, nms_threshold_);

    faceobjects.reserve(picked.size());
    for (int index : picked) {
        FaceObject face = faceproposals[index];

        // clip to image size
        float x0 = std::max(std::min(face.rect.x, (float)img_w - 1), 0.f);
        float y0 = std::max(std::min(face.rect.y, (float)img_h - 1), 0.f);
        float x1 = std::max(std::min(face.rect.x + face.rect.width, (float)img_w - 1), 0.f);
        float y1 = std::max(std::min(face.rect.y + face.rect.height, (float)img_h - 1), 0.f);
        face.rect = cv::Rect_<float>(x0, y0, x1 - x0, y1 - y0);
        if (face.rect.width <= 0 || face.rect.height <= 0) continue;

        faceobjects.push_back(face);
    }

    return faceobjects;
}

cv::Mat align_face(const cv::Mat& bgr, const FaceObject& face) {
    std::vector<cv::Point2f> src(face.landmarks.begin(), face.landmarks.end());
    std::vector<cv::Point2f> dst(g_EMBEDDING_REFERENCE.begin(), g_EMBEDDING_REFERENCE.end());

    cv::Mat transform = cv::estimateAffinePartial2D(src, dst);
    if (transform.empty()) return cv::Mat();

    cv::Mat aligned;
    cv::warpAffine(bgr, aligned, transform, cv::Size(112, 112), cv::INTER_LINEAR);
    return aligned;
}
