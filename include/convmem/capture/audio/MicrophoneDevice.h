#pragma once

#include "convmem/capture/ErrorTypes.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace convmem::capture::audio {

/**
 * @brief 采集参数（S16 线性 PCM）
 */
struct MicrophoneConfig {
    std::uint32_t sampleRate{16000};
    std::uint32_t channels{1};
    std::uint32_t framesPerBuffer{8000};
    std::string deviceName; // 为空时选择默认设备（跳过 loopback）
};

// 在音频驱动线程上调用；实现不得阻塞
using CaptureCallback = std::function<void(const void* pcm, std::size_t bytes, std::uint32_t frames)>;

/**
 * @brief 麦克风设备抽象
 *
 * open() 成功后设备即处于采集状态；stop()/close() 可重复调用，未打开时为空操作。
 * stop() 返回后不再有回调在执行。
 */
class MicrophoneDevice {
public:
    virtual ~MicrophoneDevice() = default;

    virtual bool open(const MicrophoneConfig& cfg, CaptureCallback onData, ErrorInfo* err = nullptr) = 0;
    virtual void stop() = 0;
    virtual void close() = 0;
    virtual bool isActive() const = 0;
};

} // namespace convmem::capture::audio
