#include "transform_cache.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace jsxform {

LRUCache::LRUCache(size_t capacity) : capacity_(capacity) {}

std::optional<std::string> LRUCache::get(const std::string& key) {
    std::unique_lock lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }

    items_.splice(items_.begin(), items_, it->second);
    return it->second->second;
}

void LRUCache::put(const std::string& key, std::string value) {
    if (capacity_ == 0) {
        return;
    }
    std::unique_lock lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(value);
        items_.splice(items_.begin(), items_, it->second);
        return;
    }

    if (items_.size() >= capacity_) {
        auto& lru = items_.back();
        index_.erase(lru.first);
        items_.pop_back();
    }

    items_.emplace_front(key, std::move(value));
    index_[key] = items_.begin();
}

bool LRUCache::contains(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return index_.find(key) != index_.end();
}

size_t LRUCache::size() const {
    std::shared_lock lock(mutex_);
    return items_.size();
}

TransformCache::TransformCache(size_t capacity) : cache_(capacity) {}

std::string TransformCache::compute_key(std::string_view request_body) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(request_body.data()), request_body.size(), hash);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::optional<std::string> TransformCache::lookup(std::string_view request_body) {
    if (!enabled()) {
        return std::nullopt;
    }
    return cache_.get(compute_key(request_body));
}

void TransformCache::store(std::string_view request_body, std::string response) {
    if (!enabled()) {
        return;
    }
    cache_.put(compute_key(request_body), std::move(response));
}

}  // namespace jsxform
