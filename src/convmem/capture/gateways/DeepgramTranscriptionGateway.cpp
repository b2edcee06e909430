#include "convmem/capture/gateways/DeepgramTranscriptionGateway.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <sstream>
#include <utility>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace convmem::capture::gateways {

namespace {

using LogLevel = ErrorHandler::LogLevel;

ErrorInfo toErrorInfo(const beast::error_code& ec, const std::string& what) {
    ErrorInfo info(ErrorType::NetworkError, what + ": " + ec.message(), ec.value());
    const bool closed = ec == websocket::error::closed ||
                        ec == net::error::operation_aborted ||
                        ec == ssl::error::stream_truncated ||
                        ec == net::error::eof;
    if (ec == beast::error::timeout) {
        info.errorType = ErrorType::TimeoutError;
    }
    info.details = nlohmann::json{{"category", ec.category().name()}, {"closed", closed}};
    return info;
}

class DeepgramStream : public TranscriptionStream, public std::enable_shared_from_this<DeepgramStream> {
public:
    DeepgramStream(net::io_context& ioc,
                   std::shared_ptr<ssl::context> sslCtx,
                   DeepgramTranscriptionGateway::Endpoint endpoint,
                   TranscriptionOptions options,
                   const ErrorHandler& logger)
        : m_ioc(ioc)
        , m_sslCtx(std::move(sslCtx))
        , m_resolver(ioc)
        , m_ws(ioc, *m_sslCtx)
        , m_endpoint(std::move(endpoint))
        , m_options(std::move(options))
        , m_logger(logger)
    {}

    void asyncConnect(CompletionHandler handler) override {
        m_connectHandler = std::move(handler);
        m_resolver.async_resolve(m_endpoint.host, m_endpoint.port,
                                 beast::bind_front_handler(&DeepgramStream::onResolve, shared_from_this()));
    }

    void asyncSend(Payload frame, CompletionHandler handler) override {
        if (!m_connected || m_closing) {
            post(std::move(handler), ErrorInfo(ErrorType::NetworkError, "Transcription stream is not open"));
            return;
        }
        m_writeInFlight = true;
        auto self = shared_from_this();
        m_ws.async_write(net::buffer(*frame),
                         [self, frame, handler = std::move(handler)](beast::error_code ec, std::size_t) {
                             self->m_writeInFlight = false;
                             std::optional<ErrorInfo> err;
                             if (ec) err = toErrorInfo(ec, "websocket write");
                             handler(err);
                             if (self->m_closePending) {
                                 self->m_closePending = false;
                                 self->doClose();
                             }
                         });
    }

    void asyncRead(ReadHandler handler) override {
        if (!m_connected) {
            net::post(m_ioc, [handler = std::move(handler)]() {
                handler(ErrorInfo(ErrorType::NetworkError, "Transcription stream is not open"), std::string());
            });
            return;
        }
        auto self = shared_from_this();
        m_ws.async_read(m_readBuffer,
                        [self, handler = std::move(handler)](beast::error_code ec, std::size_t) {
                            if (ec) {
                                handler(toErrorInfo(ec, "websocket read"), std::string());
                                return;
                            }
                            auto message = beast::buffers_to_string(self->m_readBuffer.data());
                            self->m_readBuffer.consume(self->m_readBuffer.size());
                            handler(std::nullopt, std::move(message));
                        });
    }

    void asyncClose(CompletionHandler handler) override {
        if (!m_connected || m_closing) {
            post(std::move(handler), std::nullopt);
            return;
        }
        m_closeHandler = std::move(handler);
        if (m_writeInFlight) {
            // websocket 同一时刻只允许一个写类操作，等写完成后再关闭
            m_closePending = true;
            return;
        }
        doClose();
    }

    void cancel() override {
        m_connected = false;
        m_resolver.cancel();
        beast::get_lowest_layer(m_ws).close();
    }

private:
    void post(CompletionHandler handler, std::optional<ErrorInfo> err) {
        if (!handler) return;
        net::post(m_ioc, [handler = std::move(handler), err = std::move(err)]() { handler(err); });
    }

    void finishConnect(std::optional<ErrorInfo> err) {
        if (err) {
            m_logger.log(LogLevel::Warning, "Deepgram connect failed", err);
        }
        auto handler = std::move(m_connectHandler);
        m_connectHandler = nullptr;
        if (handler) handler(err);
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            finishConnect(toErrorInfo(ec, "resolve " + m_endpoint.host));
            return;
        }
        beast::get_lowest_layer(m_ws).expires_after(std::chrono::milliseconds(m_options.connectTimeoutMs));
        beast::get_lowest_layer(m_ws).async_connect(
            results, beast::bind_front_handler(&DeepgramStream::onConnect, shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            finishConnect(toErrorInfo(ec, "connect " + m_endpoint.host));
            return;
        }
        // SNI
        if (!SSL_set_tlsext_host_name(m_ws.next_layer().native_handle(), m_endpoint.host.c_str())) {
            beast::error_code sniEc{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            finishConnect(toErrorInfo(sniEc, "set SNI hostname"));
            return;
        }
        m_ws.next_layer().set_verify_callback(ssl::host_name_verification(m_endpoint.host));
        beast::get_lowest_layer(m_ws).expires_after(std::chrono::milliseconds(m_options.connectTimeoutMs));
        m_ws.next_layer().async_handshake(
            ssl::stream_base::client,
            beast::bind_front_handler(&DeepgramStream::onSslHandshake, shared_from_this()));
    }

    void onSslHandshake(beast::error_code ec) {
        if (ec) {
            finishConnect(toErrorInfo(ec, "TLS handshake"));
            return;
        }
        // websocket 自带超时管理
        beast::get_lowest_layer(m_ws).expires_never();
        m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

        const std::string authorization = "Token " + m_options.apiKey;
        m_ws.set_option(websocket::stream_base::decorator([authorization](websocket::request_type& req) {
            req.set(beast::http::field::authorization, authorization);
            req.set(beast::http::field::user_agent, "convmem-capture/1.0");
        }));

        const auto hostHeader = m_endpoint.port == "443" ? m_endpoint.host : m_endpoint.host + ":" + m_endpoint.port;
        const auto target = DeepgramTranscriptionGateway::buildListenTarget(m_endpoint.path, m_options);
        m_ws.async_handshake(hostHeader, target,
                             beast::bind_front_handler(&DeepgramStream::onHandshake, shared_from_this()));
    }

    void onHandshake(beast::error_code ec) {
        if (ec) {
            finishConnect(toErrorInfo(ec, "websocket handshake"));
            return;
        }
        m_ws.binary(true);
        m_connected = true;
        m_logger.log(LogLevel::Info, "Deepgram stream connected to " + m_endpoint.host);
        finishConnect(std::nullopt);
    }

    void doClose() {
        m_closing = true;
        auto self = shared_from_this();
        m_ws.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
            self->m_connected = false;
            std::optional<ErrorInfo> err;
            if (ec) err = toErrorInfo(ec, "websocket close");
            auto handler = std::move(self->m_closeHandler);
            self->m_closeHandler = nullptr;
            if (handler) handler(err);
        });
    }

    net::io_context& m_ioc;
    // 流可能比网关活得久
    std::shared_ptr<ssl::context> m_sslCtx;
    tcp::resolver m_resolver;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> m_ws;
    beast::flat_buffer m_readBuffer;
    DeepgramTranscriptionGateway::Endpoint m_endpoint;
    TranscriptionOptions m_options;
    const ErrorHandler& m_logger;

    CompletionHandler m_connectHandler;
    CompletionHandler m_closeHandler;
    bool m_connected{false};
    bool m_writeInFlight{false};
    bool m_closePending{false};
    bool m_closing{false};
};

} // namespace

DeepgramTranscriptionGateway::DeepgramTranscriptionGateway(const ErrorHandler& logger, bool verifyPeer)
    : m_logger(logger)
    , m_sslCtx(std::make_shared<ssl::context>(ssl::context::tlsv12_client))
{
    m_sslCtx->set_default_verify_paths();
    m_sslCtx->set_verify_mode(verifyPeer ? ssl::verify_peer : ssl::verify_none);
}

DeepgramTranscriptionGateway::~DeepgramTranscriptionGateway() = default;

std::shared_ptr<TranscriptionStream> DeepgramTranscriptionGateway::openStream(net::io_context& ioc,
                                                                              const TranscriptionOptions& options) {
    ErrorInfo err;
    auto endpoint = parseUrl(options.url, &err);
    if (!endpoint) {
        m_logger.log(LogLevel::Error, "Invalid transcription URL", err);
        return nullptr;
    }
    return std::make_shared<DeepgramStream>(ioc, m_sslCtx, std::move(*endpoint), options, m_logger);
}

std::optional<DeepgramTranscriptionGateway::Endpoint> DeepgramTranscriptionGateway::parseUrl(const std::string& url,
                                                                                           ErrorInfo* err) {
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        setError(err, ErrorType::ConfigurationError, "Transcription URL must start with wss://: " + url);
        return std::nullopt;
    }

    Endpoint ep;
    const auto rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    const auto authority = rest.substr(0, slash);
    ep.path = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = "443";
    }
    if (ep.host.empty() || ep.port.empty()) {
        setError(err, ErrorType::ConfigurationError, "Transcription URL has no host: " + url);
        return std::nullopt;
    }
    return ep;
}

std::string DeepgramTranscriptionGateway::buildListenTarget(const std::string& path, const TranscriptionOptions& options) {
    std::ostringstream oss;
    oss << (path.empty() ? "/" : path);
    oss << (path.find('?') == std::string::npos ? "?" : "&");
    oss << "punctuate=" << (options.punctuate ? "true" : "false")
        << "&encoding=" << options.encoding
        << "&sample_rate=" << options.sampleRate
        << "&channels=" << options.channels;
    if (!options.model.empty()) oss << "&model=" << options.model;
    if (!options.language.empty()) oss << "&language=" << options.language;
    return oss.str();
}

} // namespace convmem::capture::gateways
