#include "gallery.hpp"

#include <opencv2/imgcodecs.hpp>

#include "../utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

bool is_gallery_image(const std::string& filename) {
    const std::string lower = to_lower(filename);
    return ends_with(lower, ".jpg") || ends_with(lower, ".jpeg") || ends_with(lower, ".png");
}

Gallery::Gallery(std::string dir)
    : dir_(std::move(dir)), entries_(std::make_shared<const std::vector<GalleryEntry>>()) {}

bool Gallery::reload() {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    return reload_locked();
}

bool Gallery::reload_locked() {
    std::vector<GalleryEntry> entries;

    std::error_code ec;
    if (!fs::exists(dir_, ec)) {
        fs::create_directories(dir_, ec);
        if (ec) {
            std::cerr << "[gallery] error: could not create " << dir_ << ": " << ec.message() << "\n";
            return false;
        }
        std::cout << "[gallery] info: created empty gallery at " << dir_ << ".\n";
    }

    for (const auto& file : fs::directory_iterator(dir_, ec)) {
        if (!file.is_regular_file()) continue;
        const std::string filename = file.path().filename().string();
        if (!is_gallery_image(filename)) continue;

        cv::Mat image = cv::imread(file.path().string(), cv::IMREAD_COLOR);
        if (image.empty()) {
            std::cerr << "[gallery] warning: failed to read reference image " << file.path() << ", skipping.\n";
            continue;
        }

        GalleryEntry entry;
        entry.name = file.path().stem().string();
        entry.path = file.path().string();
        entry.image = std::move(image);
        entries.push_back(std::move(entry));
    }
    if (ec) {
        std::cerr << "[gallery] error: could not list " << dir_ << ": " << ec.message() << "\n";
        return false;
    }

    // verification order is gallery order, keep it stable
    std::sort(entries.begin(), entries.end(), [](const GalleryEntry& a, const GalleryEntry& b) {
        return a.name != b.name ? a.name < b.name : a.path < b.path;
    });

    const size_t count = entries.size();
    { std::lock_guard<std::mutex> lock(mutex_);
        entries_ = std::make_shared<const std::vector<GalleryEntry>>(std::move(entries));
    }
    generation_.fetch_add(1);

    std::cout << "[gallery] info: loaded " << count << " reference image(s) from " << dir_ << ".\n";
    return true;
}

GallerySnapshot Gallery::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::vector<std::string> Gallery::names() const {
    GallerySnapshot entries = snapshot();
    std::vector<std::string> names;
    names.reserve(entries->size());
    for (const GalleryEntry& entry : *entries) {
        names.push_back(entry.name);
    }
    return names;
}

size_t Gallery::size() const {
    return snapshot()->size();
}

bool Gallery::add_reference(const std::string& filename, const std::string& content, std::string& error) {
    const fs::path name_path(filename);
    if (filename.empty() || name_path.filename().string() != filename || filename[0] == '.') {
        error = "invalid filename";
        return false;
    }
    if (!is_gallery_image(filename)) {
        error = "unsupported image type";
        return false;
    }

    std::vector<uchar> data(content.begin(), content.end());
    if (cv::imdecode(data, cv::IMREAD_COLOR).empty()) {
        error = "invalid image";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutation_mutex_);
    std::error_code ec;
    fs::create_directories(dir_, ec);

    const fs::path target = fs::path(dir_) / name_path;
    { std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "could not write " + target.string();
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            error = "could not write " + target.string();
            return false;
        }
    }

    std::cout << "[gallery] info: added reference '" << name_path.stem().string() << "'.\n";
    if (!reload_locked()) {
        error = "gallery reload failed";
        return false;
    }
    return true;
}

bool Gallery::remove_reference(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    GallerySnapshot entries = snapshot();

    bool removed = false;
    for (const GalleryEntry& entry : *entries) {
        if (entry.name != name) continue;
        std::error_code ec;
        if (fs::remove(entry.path, ec)) {
            removed = true;
        } else if (ec) {
            std::cerr << "[gallery] error: could not remove " << entry.path << ": " << ec.message() << "\n";
        }
    }

    if (!removed) return false;
    std::cout << "[gallery] info: removed reference '" << name << "'.\n";
    return reload_locked();
}
