#ifndef CORE_FACE_VERIFIER_HPP
#define CORE_FACE_VERIFIER_HPP

#include <opencv2/core.hpp>

#include "gallery.hpp"

enum class VerifyStatus {
    Matched,
    NotMatched,
    Error
};

struct VerifyResult {
    VerifyStatus status = VerifyStatus::Error;
    float distance = 1.0f;
};

// verify(probe, reference) -> matched + distance. Implementations report
// failures as VerifyStatus::Error instead of throwing.
class FaceVerifier {
public:
    virtual ~FaceVerifier() = default;

    virtual VerifyResult verify(const cv::Mat& probe, const GalleryEntry& reference) = 0;

    // gallery contents changed, drop anything derived from old references
    virtual void on_gallery_reload() {}

    // a new probe follows; work derived from the previous one may be dropped
    virtual void on_new_probe() {}
};

#endif
