#ifndef CORE_IDENTITY_CACHE_HPP
#define CORE_IDENTITY_CACHE_HPP

#include <opencv2/core.hpp>

#include "../types.hpp"

#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>

struct BucketKey {
    int bx = 0;
    int by = 0;

    bool operator==(const BucketKey& other) const {
        return bx == other.bx && by == other.by;
    }

    struct Hash {
        size_t operator()(const BucketKey& k) const {
            return std::hash<int64_t>()((static_cast<int64_t>(k.bx) << 32) ^ static_cast<uint32_t>(k.by));
        }
    };
};

// floor(cx / Q), floor(cy / Q) of the box center
BucketKey bucket_key_for(const cv::Rect& bbox, int bucket_size);

// Position-keyed identity memo. One entry per bucket, last write wins, no
// expiry. A non-zero capacity evicts the least recently stored bucket.
class IdentityCache {
public:
    explicit IdentityCache(size_t capacity = 0) : capacity_(capacity) {}

    std::optional<Identity> lookup(const BucketKey& key) const;
    void store(const BucketKey& key, const Identity& identity);
    void clear();

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        Identity identity;
        std::list<BucketKey>::iterator order_it;
    };

    size_t capacity_;
    std::unordered_map<BucketKey, Entry, BucketKey::Hash> entries_;
    std::list<BucketKey> order_; // front = most recently stored
};

#endif
