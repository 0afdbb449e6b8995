#pragma once

#include "config.hpp"
#include "thread_pool.hpp"
#include "transform.hpp"
#include "transform_cache.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace jsxform {

struct TransformReply {
    unsigned status = 200;
    std::string body;  // JSON
};

// Decodes a request body, transforms it and encodes the reply:
// 200 result, 400 ConfigError, 422 ParseError, 500 EmitError
[[nodiscard]] TransformReply run_transform_request(Transformer& transformer, std::string_view body);

// HTTP front end: POST /transform, GET /health
class Server {
public:
    explicit Server(const Config& config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    void run();
    void stop();

    [[nodiscard]] TransformCache& cache() noexcept { return *cache_; }

private:
    Config config_;
    std::unique_ptr<TransformCache> cache_;
    std::unique_ptr<ThreadPool> thread_pool_;
    bool running_ = false;
};

}  // namespace jsxform
