#include "gAI/ArtifactStore.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace gAI {

class HttpArtifactStore::Impl {
public:
    Impl(std::string host, int port, std::chrono::milliseconds idleTimeout)
        : host_(std::move(host)), port_(port), idleTimeout_(idleTimeout) {}

    // Every step runs asynchronously with its own expiry, so a peer that
    // stops sending fails the download after idleTimeout_ instead of hanging
    std::optional<FetchError> download(const std::string& bucket,
                                       const std::string& key,
                                       const std::string& localPath) {
        std::string target = "/" + bucket + "/" + key;

        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        beast::flat_buffer buffer;
        beast::error_code failure;
        const char* failedStep = "";

        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, host_);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

        http::response_parser<http::file_body> parser;
        // Model weights are far larger than the default 8 MB limit
        parser.body_limit(boost::none);

        beast::error_code ec;
        parser.get().body().open(localPath.c_str(), beast::file_mode::write, ec);
        if (ec) {
            return FetchError{FetchErrorKind::PermissionError, key,
                              "Cannot open " + localPath + ": " + ec.message()};
        }

        auto fail = [&](const char* step, beast::error_code error) {
            failedStep = step;
            failure = error;
        };

        // Reads chunk by chunk, renewing the expiry while data keeps arriving
        std::function<void(beast::error_code, std::size_t)> onRead =
            [&](beast::error_code error, std::size_t) {
                if (error) {
                    return fail("Read", error);
                }
                if (parser.is_done()) {
                    return;
                }
                stream.expires_after(idleTimeout_);
                http::async_read_some(stream, buffer, parser, onRead);
            };

        resolver.async_resolve(host_, std::to_string(port_),
            [&](beast::error_code error, tcp::resolver::results_type results) {
                if (error) {
                    return fail("Resolve", error);
                }
                stream.expires_after(idleTimeout_);
                stream.async_connect(results, [&](beast::error_code error, const tcp::endpoint&) {
                    if (error) {
                        return fail("Connect", error);
                    }
                    stream.expires_after(idleTimeout_);
                    http::async_write(stream, req, [&](beast::error_code error, std::size_t) {
                        if (error) {
                            return fail("Write", error);
                        }
                        onRead({}, 0);
                    });
                });
            });

        ioc.run();

        if (failure) {
            std::string reason = failure == beast::error::timeout
                                     ? "timed out after " + std::to_string(idleTimeout_.count()) + " ms"
                                     : failure.message();
            return FetchError{FetchErrorKind::NetworkError, key,
                              std::string(failedStep) + " failed: " + reason};
        }

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        const int status = parser.get().result_int();
        if (status == 200) {
            return std::nullopt;
        }
        std::string message;
        switch (fetchErrorKindForStatus(status)) {
            case FetchErrorKind::MissingFile:
                message = "Object not found: " + target;
                break;
            case FetchErrorKind::PermissionError:
                message = "Access denied (" + std::to_string(status) + "): " + target;
                break;
            case FetchErrorKind::NetworkError:
                message = "Unexpected HTTP status " + std::to_string(status) + " for " + target;
                break;
        }
        return FetchError{fetchErrorKindForStatus(status), key, message};
    }

private:
    std::string host_;
    int port_;
    std::chrono::milliseconds idleTimeout_;
};

HttpArtifactStore::HttpArtifactStore(std::string host, int port, std::chrono::milliseconds idleTimeout)
    : pImpl_(std::make_unique<Impl>(std::move(host), port, idleTimeout)) {}

HttpArtifactStore::~HttpArtifactStore() = default;

std::optional<FetchError> HttpArtifactStore::download(const std::string& bucket,
                                                      const std::string& key,
                                                      const std::string& localPath) {
    return pImpl_->download(bucket, key, localPath);
}

} // namespace gAI
