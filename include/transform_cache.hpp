#pragma once

#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace jsxform {

// Thread-safe LRU cache of encoded responses
class LRUCache {
public:
    explicit LRUCache(size_t capacity);

    // Returns the value if found, updates LRU order
    [[nodiscard]] std::optional<std::string> get(const std::string& key);

    // Insert or update
    void put(const std::string& key, std::string value);

    // Doesn't update LRU order
    [[nodiscard]] bool contains(const std::string& key) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    size_t capacity_;

    // front = most recent, back = least recent
    std::list<std::pair<std::string, std::string>> items_;
    std::unordered_map<std::string, std::list<std::pair<std::string, std::string>>::iterator> index_;

    mutable std::shared_mutex mutex_;
};

// Responses keyed by the SHA-256 of the request body. A transform is a pure
// function of its request, so a hit is the response a rerun would produce.
class TransformCache {
public:
    explicit TransformCache(size_t capacity);

    [[nodiscard]] std::optional<std::string> lookup(std::string_view request_body);
    void store(std::string_view request_body, std::string response);

    [[nodiscard]] bool enabled() const noexcept { return cache_.capacity() > 0; }
    [[nodiscard]] size_t size() const { return cache_.size(); }

    // Hex SHA-256
    [[nodiscard]] static std::string compute_key(std::string_view request_body);

private:
    LRUCache cache_;
};

}  // namespace jsxform
