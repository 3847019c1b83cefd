#ifndef CORE_IDENTITY_RESOLVER_HPP
#define CORE_IDENTITY_RESOLVER_HPP

#include <opencv2/core.hpp>

#include "../types.hpp"
#include "face_verifier.hpp"
#include "gallery.hpp"

#include <cstdint>

struct Resolution {
    bool attempted = false; // false: empty gallery or no verifier
    Identity identity;
};

// bbox grown by padding on every side, clamped to the frame
cv::Rect padded_crop_rect(const cv::Rect& bbox, int padding, const cv::Size& frame_size);

// Matches crops against the gallery in gallery order, first match wins.
class IdentityResolver {
public:
    // verifier may be null when the face models are unavailable
    IdentityResolver(Gallery& gallery, FaceVerifier* verifier, int padding = 10);

    // picks up gallery changes; call before each resolution cycle
    void refresh();

    bool available() const;
    size_t gallery_size() const;

    Resolution resolve(const cv::Mat& frame, const cv::Rect& bbox);
    Resolution resolve_crop(const cv::Mat& crop);

    uint64_t verify_calls() const { return verify_calls_; }

private:
    Gallery& gallery_;
    FaceVerifier* verifier_;
    int padding_;
    GallerySnapshot snapshot_;
    uint64_t generation_ = 0;
    uint64_t verify_calls_ = 0;
};

#endif
