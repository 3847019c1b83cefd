#include "identity_resolver.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

cv::Rect padded_crop_rect(const cv::Rect& bbox, int padding, const cv::Size& frame_size) {
    const int x1 = std::max(0, bbox.x - padding);
    const int y1 = std::max(0, bbox.y - padding);
    const int x2 = std::min(frame_size.width, bbox.x + bbox.width + padding);
    const int y2 = std::min(frame_size.height, bbox.y + bbox.height + padding);
    if (x2 <= x1 || y2 <= y1) return cv::Rect();
    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

IdentityResolver::IdentityResolver(Gallery& gallery, FaceVerifier* verifier, int padding)
    : gallery_(gallery), verifier_(verifier), padding_(padding), snapshot_(gallery.snapshot()),
      generation_(gallery.generation()) {}

void IdentityResolver::refresh() {
    const uint64_t generation = gallery_.generation();
    if (generation == generation_) return;

    snapshot_ = gallery_.snapshot();
    generation_ = generation;
    if (verifier_) verifier_->on_gallery_reload();
    std::cout << "[resolver] info: gallery reloaded, " << snapshot_->size() << " reference(s).\n";
}

bool IdentityResolver::available() const {
    return verifier_ != nullptr && !snapshot_->empty();
}

size_t IdentityResolver::gallery_size() const {
    return snapshot_->size();
}

Resolution IdentityResolver::resolve(const cv::Mat& frame, const cv::Rect& bbox) {
    const cv::Rect crop_rect = bbox.empty() ? cv::Rect() : padded_crop_rect(bbox, padding_, frame.size());
    if (crop_rect.empty()) {
        // nothing on screen to verify
        Resolution resolution;
        resolution.attempted = available();
        resolution.identity = resolution.attempted ? Identity{ IDENTITY_UNKNOWN, 0.0f, false }
                                                   : Identity{ IDENTITY_NOT_ATTEMPTED, 0.0f, false };
        return resolution;
    }
    return resolve_crop(frame(crop_rect));
}

Resolution IdentityResolver::resolve_crop(const cv::Mat& crop) {
    Resolution resolution;
    if (!available()) {
        resolution.identity = Identity{ IDENTITY_NOT_ATTEMPTED, 0.0f, false };
        return resolution;
    }
    resolution.attempted = true;
    verifier_->on_new_probe();

    for (const GalleryEntry& entry : *snapshot_) {
        VerifyResult result;
        try {
            ++verify_calls_;
            result = verifier_->verify(crop, entry);
        } catch (const std::exception& e) {
            result.status = VerifyStatus::Error;
            std::cerr << "[resolver] warning: verifier threw for '" << entry.name << "': " << e.what() << "\n";
        }

        if (result.status == VerifyStatus::Error) {
            std::cerr << "[resolver] warning: verification against '" << entry.name << "' failed, treating as no match.\n";
            continue;
        }
        if (result.status == VerifyStatus::Matched) {
            const float confidence = std::min(1.0f, std::max(0.0f, 1.0f - result.distance));
            resolution.identity = Identity{ entry.name, confidence, true };
            return resolution;
        }
    }

    resolution.identity = Identity{ IDENTITY_UNKNOWN, 0.0f, false };
    return resolution;
}
