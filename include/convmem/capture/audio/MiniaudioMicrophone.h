#pragma once

#include "convmem/capture/audio/MicrophoneDevice.h"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace convmem::capture::audio {

/**
 * @brief 基于 miniaudio 的麦克风采集
 *
 * 设备以 S16 / 指定采样率与声道打开，miniaudio 在需要时做格式转换。
 * 未指定设备名时，若默认输入是 loopback（扬声器回环），改选第一个非 loopback 设备。
 */
class MiniaudioMicrophone : public MicrophoneDevice {
public:
    MiniaudioMicrophone() = default;
    ~MiniaudioMicrophone() override;

    MiniaudioMicrophone(const MiniaudioMicrophone&) = delete;
    MiniaudioMicrophone& operator=(const MiniaudioMicrophone&) = delete;

    bool open(const MicrophoneConfig& cfg, CaptureCallback onData, ErrorInfo* err = nullptr) override;
    void stop() override;
    void close() override;
    bool isActive() const override;

    // 列出可用的输入设备名称（枚举失败时返回空）
    static std::vector<std::string> listCaptureDevices();

private:
    static void dataCallbackCapture(void* pUserData, const void* pInput, std::uint32_t frameCount);
    void onCaptureFrames(const void* pInput, std::uint32_t frameCount);

    mutable std::mutex m_mu;
    void* m_context{nullptr}; // 实际类型为 ma_context*
    void* m_device{nullptr};  // 实际类型为 ma_device*
    MicrophoneConfig m_cfg{};
    CaptureCallback m_onData;
    std::atomic<bool> m_capturing{false};
};

} // namespace convmem::capture::audio
