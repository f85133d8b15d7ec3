#include "gAI/RESTServer.hpp"
#include "gAI/RequestHandler.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <array>
#include <csignal>
#include <cstdint>
#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace gAI {

class RESTServer::Impl {
public:
    Impl(ServerConfig config, std::shared_ptr<PredictionOrchestrator> orchestrator)
        : config_(config),
          handler_(std::make_shared<RequestHandler>(config, std::move(orchestrator))),
          ioc_(),
          acceptor_(ioc_),
          signals_(ioc_, SIGINT, SIGTERM),
          workers_(config.threads) {}

    ~Impl() {
        workers_.join();
    }

    void start() {
        try {
            auto const address = net::ip::make_address(config_.host);
            tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.port)};

            acceptor_.open(endpoint.protocol());
            acceptor_.set_option(net::socket_base::reuse_address(true));
            acceptor_.bind(endpoint);
            acceptor_.listen(net::socket_base::max_listen_connections);

            signals_.async_wait([this](beast::error_code ec, int signal) {
                if (!ec) {
                    std::cout << "[RESTServer] Received signal " << signal << ", shutting down" << std::endl;
                    stop();
                }
            });

            std::cout << "[RESTServer] Starting server on http://" << config_.host << ":" << config_.port << std::endl;
            std::cout << "Available endpoints:" << std::endl;
            std::cout << "  GET /" << std::endl;
            std::cout << "  GET /health" << std::endl;
            std::cout << "    Returns: {status, model_loaded, processor_loaded, detector_loaded}" << std::endl;
            std::cout << "  POST /predict" << std::endl;
            std::cout << "    multipart/form-data with one image in field \"file\"" << std::endl;
            std::cout << "  POST /predict-batch" << std::endl;
            std::cout << "    multipart/form-data with up to " << config_.maxBatchSize
                      << " images in fields \"files\"" << std::endl;

            accept();
            ioc_.run();
        }
        catch (const std::exception& e) {
            std::cerr << "[RESTServer] Error: " << e.what() << std::endl;
            throw;
        }
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
    }

private:
    void accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (!ec) {
                    std::make_shared<Session>(std::move(socket), handler_, workers_, requestLimit())->start();
                } else if (ec == net::error::operation_aborted) {
                    return;
                } else {
                    std::cerr << "[RESTServer] Accept failed: " << ec.message() << std::endl;
                }
                accept();
            });
    }

    // A batch body may carry maxBatchSize files plus multipart framing
    std::uint64_t requestLimit() const {
        return static_cast<std::uint64_t>(config_.maxUploadBytes) * config_.maxBatchSize + 64 * 1024;
    }

    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket,
                std::shared_ptr<RequestHandler> handler,
                net::thread_pool& workers,
                std::uint64_t bodyLimit)
            : socket_(std::move(socket)),
              handler_(std::move(handler)),
              workers_(workers),
              token_(std::make_shared<CancellationToken>()) {
            parser_.body_limit(bodyLimit);
        }

        void start() {
            read_request();
        }

    private:
        void read_request() {
            auto self = shared_from_this();

            http::async_read(
                socket_,
                buffer_,
                parser_,
                [self](beast::error_code ec, std::size_t) {
                    if (ec == http::error::body_limit) {
                        self->write_too_large();
                    } else if (!ec) {
                        self->process_request();
                    }
                });
        }

        // Predictions block, so they run on the worker pool; the session strand
        // keeps watching the socket and cancels the request if the peer leaves
        void process_request() {
            auto self = shared_from_this();
            watch_disconnect();

            net::post(workers_, [self] {
                Response response = self->handler_->handle(self->parser_.get(), self->token_);
                net::post(self->socket_.get_executor(), [self, response = std::move(response)]() mutable {
                    beast::error_code ec;
                    self->socket_.cancel(ec);
                    self->response_ = std::move(response);
                    self->write_response();
                });
            });
        }

        void watch_disconnect() {
            auto self = shared_from_this();
            socket_.async_read_some(
                net::buffer(probe_),
                [self](beast::error_code ec, std::size_t) {
                    if (ec && ec != net::error::operation_aborted) {
                        std::cerr << "[RESTServer] Client disconnected, cancelling request" << std::endl;
                        self->token_->cancel();
                    }
                });
        }

        void write_too_large() {
            Request request;
            request.version(11);
            response_ = jsonResponse(request, http::status::payload_too_large,
                                     json{{"detail", "Request body too large"}});
            write_response();
        }

        void write_response() {
            auto self = shared_from_this();

            http::async_write(
                socket_,
                response_,
                [self](beast::error_code ec, std::size_t) {
                    self->socket_.shutdown(tcp::socket::shutdown_send, ec);
                });
        }

        tcp::socket socket_;
        std::shared_ptr<RequestHandler> handler_;
        net::thread_pool& workers_;
        std::shared_ptr<CancellationToken> token_;
        beast::flat_buffer buffer_;
        http::request_parser<http::string_body> parser_;
        Response response_;
        std::array<char, 1> probe_;
    };

    ServerConfig config_;
    std::shared_ptr<RequestHandler> handler_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    net::signal_set signals_;
    net::thread_pool workers_;
};

RESTServer::RESTServer(ServerConfig config, std::shared_ptr<PredictionOrchestrator> orchestrator)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(orchestrator))) {}

RESTServer::~RESTServer() = default;

void RESTServer::start() {
    pImpl_->start();
}

void RESTServer::stop() {
    pImpl_->stop();
}

} // namespace gAI
