#pragma once

#include "convmem/capture/ErrorHandler.h"
#include "convmem/capture/gateways/TranscriptionGateway.h"

#include <memory>
#include <optional>
#include <string>

namespace boost::asio::ssl {
class context;
}

namespace convmem::capture::gateways {

/**
 * @brief Deepgram 实时转写（wss，Boost.Beast 实现）
 *
 * 握手带 `Authorization: Token <key>`，音频以二进制帧发送，服务端事件为 JSON 文本帧。
 */
class DeepgramTranscriptionGateway : public TranscriptionGateway {
public:
    struct Endpoint {
        std::string host;
        std::string port;
        std::string path;
    };

    explicit DeepgramTranscriptionGateway(const ErrorHandler& logger, bool verifyPeer = true);
    ~DeepgramTranscriptionGateway() override;

    std::shared_ptr<TranscriptionStream> openStream(boost::asio::io_context& ioc,
                                                    const TranscriptionOptions& options) override;

    // 仅接受 wss://host[:port][/path]
    static std::optional<Endpoint> parseUrl(const std::string& url, ErrorInfo* err = nullptr);

    // path + "?punctuate=...&encoding=...&sample_rate=...&channels=..."（model/language 非空时追加）
    static std::string buildListenTarget(const std::string& path, const TranscriptionOptions& options);

private:
    const ErrorHandler& m_logger;
    std::shared_ptr<boost::asio::ssl::context> m_sslCtx;
};

} // namespace convmem::capture::gateways
