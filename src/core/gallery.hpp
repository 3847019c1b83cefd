#ifndef CORE_GALLERY_HPP
#define CORE_GALLERY_HPP

#include <opencv2/core.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct GalleryEntry {
    std::string name; // file stem
    std::string path;
    cv::Mat image;
};

using GallerySnapshot = std::shared_ptr<const std::vector<GalleryEntry>>;

// Directory of named reference images. Mutations rewrite the directory and
// publish a new snapshot; readers hold snapshots, never the live list.
class Gallery {
public:
    explicit Gallery(std::string dir);

    // rescans the directory; creates it when missing
    bool reload();

    GallerySnapshot snapshot() const;
    std::vector<std::string> names() const;
    size_t size() const;

    // bumped on every reload
    uint64_t generation() const { return generation_.load(); }

    // filename gives the display name; content must decode as an image
    bool add_reference(const std::string& filename, const std::string& content, std::string& error);
    bool remove_reference(const std::string& name);

    const std::string& dir() const { return dir_; }

private:
    bool reload_locked();

    std::string dir_;
    std::mutex mutation_mutex_; // held across scan, write, remove and publish
    mutable std::mutex mutex_;
    GallerySnapshot entries_;
    std::atomic<uint64_t> generation_{0};
};

bool is_gallery_image(const std::string& filename);

#endif
