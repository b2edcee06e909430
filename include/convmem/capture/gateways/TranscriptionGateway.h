#pragma once

#include "convmem/capture/ErrorTypes.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

namespace convmem::capture::gateways {

/**
 * @brief 流式转写连接参数
 */
struct TranscriptionOptions {
    std::string url{"wss://api.deepgram.com/v1/listen"};
    std::string apiKey;
    std::uint32_t sampleRate{16000};
    std::uint32_t channels{1};
    std::string encoding{"linear16"};
    bool punctuate{true};
    std::string model;    // 为空时不传
    std::string language; // 为空时不传
    int connectTimeoutMs{10000};
};

/**
 * @brief 一条定稿转写片段
 */
struct TranscriptFragment {
    std::string text;
    bool isFinal{true};
    std::string eventType;
};

/**
 * @brief 解析服务端事件
 *
 * 仅当事件 is_final 为 true 且转写文本（channel.alternatives[0].transcript 或顶层 transcript）
 * 去除首尾空白后非空时返回片段；其余事件（中间结果、元数据、非 JSON）返回 nullopt。
 */
std::optional<TranscriptFragment> parseTranscriptEvent(const std::string& message);

/**
 * @brief 一条双向流式连接
 *
 * 所有异步操作的完成回调都在创建该流的 io_context 上执行；同一时刻至多一个挂起的写和一个挂起的读。
 */
class TranscriptionStream {
public:
    using CompletionHandler = std::function<void(const std::optional<ErrorInfo>& err)>;
    using ReadHandler = std::function<void(const std::optional<ErrorInfo>& err, std::string message)>;
    using Payload = std::shared_ptr<const std::vector<std::uint8_t>>;

    virtual ~TranscriptionStream() = default;

    virtual void asyncConnect(CompletionHandler handler) = 0;
    virtual void asyncSend(Payload frame, CompletionHandler handler) = 0;
    virtual void asyncRead(ReadHandler handler) = 0;

    // 优雅关闭；有挂起写时待其完成后再关闭
    virtual void asyncClose(CompletionHandler handler) = 0;

    // 强制关闭底层连接，挂起的读写以错误完成
    virtual void cancel() = 0;
};

/**
 * @brief 转写服务网关：为每个会话在其私有事件循环上创建连接
 */
class TranscriptionGateway {
public:
    virtual ~TranscriptionGateway() = default;

    virtual std::shared_ptr<TranscriptionStream> openStream(boost::asio::io_context& ioc,
                                                            const TranscriptionOptions& options) = 0;
};

} // namespace convmem::capture::gateways
