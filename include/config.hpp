#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

namespace jsxform {

// Process-wide settings of the transform service
struct Config {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t thread_count = 0;      // 0 = hardware concurrency
    size_t cache_size = 1024;     // Max cached responses (LRU), 0 disables the cache
    bool verify_output = true;    // Compile every output with QuickJS
    size_t max_memory_mb = 64;    // Per-worker QuickJS memory limit

    [[nodiscard]] size_t get_thread_count() const noexcept {
        return thread_count == 0 ? std::thread::hardware_concurrency() : thread_count;
    }
};

}  // namespace jsxform
