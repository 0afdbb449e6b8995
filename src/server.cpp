#include "server.hpp"
#include "request.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace jsxform {

TransformReply run_transform_request(Transformer& transformer, std::string_view body) {
    try {
        TransformRequest request = parse_request(body);
        TransformResult result = transformer.transform(request);
        return {200, encode_response(result)};
    } catch (const ConfigError& e) {
        return {400, encode_error("ConfigError", e.what())};
    } catch (const ParseError& e) {
        return {422, encode_error(e)};
    } catch (const EmitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return {500, encode_error("EmitError", e.what())};
    }
}

namespace {

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, Server& server, ThreadPool& pool)
        : stream_(std::move(socket))
        , server_(server)
        , thread_pool_(pool)
    {
    }

    void run() {
        do_read();
    }

private:
    void do_read() {
        request_ = {};

        stream_.expires_after(std::chrono::seconds(30));

        http::async_read(stream_, buffer_, request_,
            beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec == http::error::end_of_stream) {
            return do_close();
        }

        if (ec) {
            std::cerr << "Read error: " << ec.message() << "\n";
            return;
        }

        handle_request();
    }

    void handle_request() {
        if (request_.target() == "/health") {
            if (request_.method() != http::verb::get) {
                send_json(405, encode_error("MethodNotAllowed", "use GET /health"));
                return;
            }
            send_json(200, R"({"status":"ok"})");
            return;
        }

        if (request_.target() == "/transform") {
            if (request_.method() != http::verb::post) {
                send_json(405, encode_error("MethodNotAllowed", "use POST /transform"));
                return;
            }
            handle_transform();
            return;
        }

        send_json(404, encode_error("NotFound", "no route for " + std::string(request_.target())));
    }

    void handle_transform() {
        std::string body = request_.body();

        if (auto cached = server_.cache().lookup(body)) {
            send_json(200, std::move(*cached), "hit");
            return;
        }

        auto self = shared_from_this();
        thread_pool_.enqueue_with_callback(
            [body](Transformer& transformer) {
                return run_transform_request(transformer, body);
            },
            [self, body](TransformReply reply) {
                if (reply.status == 200) {
                    self->server_.cache().store(body, reply.body);
                }
                net::post(self->stream_.get_executor(), [self, reply = std::move(reply)]() mutable {
                    self->send_json(reply.status, std::move(reply.body), "miss");
                });
            },
            [self](std::string error) {
                std::cerr << "Error: transform failed: " << error << "\n";
                net::post(self->stream_.get_executor(), [self, error = std::move(error)]() {
                    self->send_json(500, encode_error("InternalError", error));
                });
            }
        );
    }

    void send_json(unsigned status, std::string body, std::string_view cache_state = {}) {
        http::response<http::string_body> res{
            static_cast<http::status>(status),
            request_.version()
        };
        res.set(http::field::server, "jsxform");
        res.set(http::field::content_type, "application/json");
        if (!cache_state.empty()) {
            res.set("x-jsxform-cache", beast::string_view(cache_state.data(), cache_state.size()));
        }
        res.keep_alive(request_.keep_alive());
        res.body() = std::move(body);
        res.prepare_payload();

        send_response(std::move(res));
    }

    void send_response(http::response<http::string_body> res) {
        auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

        http::async_write(stream_, *sp,
            [self = shared_from_this(), sp](beast::error_code ec, std::size_t) {
                self->on_write(ec, sp->need_eof());
            });
    }

    void on_write(beast::error_code ec, bool close) {
        if (ec) {
            std::cerr << "Write error: " << ec.message() << "\n";
            return;
        }

        if (close) {
            return do_close();
        }

        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    Server& server_;
    ThreadPool& thread_pool_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, Server& server, ThreadPool& pool)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server)
        , thread_pool_(pool)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set reuse_address: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

private:
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            std::cerr << "Accept error: " << ec.message() << "\n";
        } else {
            std::make_shared<Session>(std::move(socket), server_, thread_pool_)->run();
        }

        do_accept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Server& server_;
    ThreadPool& thread_pool_;
};

}  // namespace

Server::Server(const Config& config)
    : config_(config)
    , cache_(std::make_unique<TransformCache>(config_.cache_size))
    , thread_pool_(std::make_unique<ThreadPool>(config_))
{
}

Server::~Server() {
    stop();
}

void Server::run() {
    running_ = true;

    net::io_context ioc{static_cast<int>(config_.get_thread_count())};

    auto endpoint = tcp::endpoint{net::ip::make_address(config_.host), config_.port};

    std::make_shared<Listener>(ioc, endpoint, *this, *thread_pool_)->run();

    std::cout << "Server listening on " << config_.host << ":" << config_.port << "\n";

    std::vector<std::thread> io_threads;
    const auto io_thread_count = std::max<size_t>(1, config_.get_thread_count() / 2);
    io_threads.reserve(io_thread_count);

    for (size_t i = 0; i < io_thread_count; ++i) {
        io_threads.emplace_back([&ioc] { ioc.run(); });
    }

    for (auto& t : io_threads) {
        t.join();
    }
}

void Server::stop() {
    if (running_) {
        running_ = false;
        thread_pool_->shutdown();
    }
}

}  // namespace jsxform
