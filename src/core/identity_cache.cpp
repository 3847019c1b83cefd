#include "identity_cache.hpp"

#include <cmath>

BucketKey bucket_key_for(const cv::Rect& bbox, int bucket_size) {
    const float cx = bbox.x + bbox.width * 0.5f;
    const float cy = bbox.y + bbox.height * 0.5f;
    BucketKey key;
    key.bx = static_cast<int>(std::floor(cx / bucket_size));
    key.by = static_cast<int>(std::floor(cy / bucket_size));
    return key;
}

std::optional<Identity> IdentityCache::lookup(const BucketKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second.identity;
}

void IdentityCache::store(const BucketKey& key, const Identity& identity) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.identity = identity;
        order_.splice(order_.begin(), order_, it->second.order_it);
        return;
    }

    if (capacity_ > 0 && entries_.size() >= capacity_) {
        entries_.erase(order_.back());
        order_.pop_back();
    }

    order_.push_front(key);
    entries_.emplace(key, Entry{ identity, order_.begin() });
}

void IdentityCache::clear() {
    entries_.clear();
    order_.clear();
}
