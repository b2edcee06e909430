#include "convmem/capture/audio/MiniaudioMicrophone.h"

#include <miniaudio.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace {
ma_device* toDevice(void* ptr) { return reinterpret_cast<ma_device*>(ptr); }
ma_context* toContext(void* ptr) { return reinterpret_cast<ma_context*>(ptr); }

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isLoopbackName(const ma_device_info& info) {
    return toLowerCopy(info.name).find("loopback") != std::string::npos;
}
} // namespace

namespace convmem::capture::audio {

MiniaudioMicrophone::~MiniaudioMicrophone() {
    stop();
    close();
}

void MiniaudioMicrophone::dataCallbackCapture(void* pUserData, const void* pInput, std::uint32_t frameCount) {
    auto* self = reinterpret_cast<MiniaudioMicrophone*>(pUserData);
    if (self != nullptr) {
        self->onCaptureFrames(pInput, frameCount);
    }
}

void MiniaudioMicrophone::onCaptureFrames(const void* pInput, std::uint32_t frameCount) {
    if (!m_capturing.load(std::memory_order_acquire) || pInput == nullptr || !m_onData) {
        return;
    }
    const auto bytes = static_cast<std::size_t>(frameCount) * m_cfg.channels * sizeof(std::int16_t);
    m_onData(pInput, bytes, frameCount);
}

bool MiniaudioMicrophone::open(const MicrophoneConfig& cfg, CaptureCallback onData, ErrorInfo* err) {
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_device != nullptr) {
        return true;
    }

    auto* ctx = new ma_context();
    if (ma_context_init(nullptr, 0, nullptr, ctx) != MA_SUCCESS) {
        delete ctx;
        setError(err, ErrorType::DeviceError, "ma_context_init failed");
        return false;
    }

    ma_device_config deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.sampleRate = cfg.sampleRate;
    deviceConfig.capture.format = ma_format_s16;
    deviceConfig.capture.channels = cfg.channels;
    deviceConfig.periodSizeInFrames = cfg.framesPerBuffer;
    deviceConfig.dataCallback = [](ma_device* device, void* /*pOutput*/, const void* pInput, ma_uint32 frameCount) {
        dataCallbackCapture(device->pUserData, pInput, frameCount);
    };
    deviceConfig.pUserData = this;

    ma_device_info* playbackInfos = nullptr;
    ma_uint32 playbackCount = 0;
    ma_device_info* captureInfos = nullptr;
    ma_uint32 captureCount = 0;
    if (ma_context_get_devices(ctx, &playbackInfos, &playbackCount, &captureInfos, &captureCount) != MA_SUCCESS ||
        captureInfos == nullptr || captureCount == 0) {
        ma_context_uninit(ctx);
        delete ctx;
        setError(err, ErrorType::DeviceError, "No audio input device available");
        return false;
    }

    const ma_device_info* chosen = nullptr;
    if (!cfg.deviceName.empty()) {
        const auto wanted = toLowerCopy(cfg.deviceName);
        for (ma_uint32 i = 0; i < captureCount; ++i) {
            if (toLowerCopy(captureInfos[i].name).find(wanted) != std::string::npos) {
                chosen = &captureInfos[i];
                break;
            }
        }
        if (chosen == nullptr) {
            ma_context_uninit(ctx);
            delete ctx;
            setError(err, ErrorType::DeviceError, "Audio input device not found: " + cfg.deviceName);
            return false;
        }
    } else {
        chosen = &captureInfos[0];
        for (ma_uint32 i = 0; i < captureCount; ++i) {
            if (captureInfos[i].isDefault) {
                chosen = &captureInfos[i];
                break;
            }
        }
        // 避免把播放声当作输入
        if (isLoopbackName(*chosen)) {
            for (ma_uint32 i = 0; i < captureCount; ++i) {
                if (!isLoopbackName(captureInfos[i])) {
                    chosen = &captureInfos[i];
                    break;
                }
            }
        }
    }
    deviceConfig.capture.pDeviceID = &chosen->id;

    // 回调在 ma_device_start 之后才会触发，先就位参数
    m_cfg = cfg;
    m_onData = std::move(onData);

    auto* device = new ma_device();
    if (ma_device_init(ctx, &deviceConfig, device) != MA_SUCCESS) {
        delete device;
        ma_context_uninit(ctx);
        delete ctx;
        m_onData = nullptr;
        setError(err, ErrorType::DeviceError, "ma_device_init failed");
        return false;
    }

    m_capturing.store(true, std::memory_order_release);
    if (ma_device_start(device) != MA_SUCCESS) {
        m_capturing.store(false, std::memory_order_release);
        ma_device_uninit(device);
        delete device;
        ma_context_uninit(ctx);
        delete ctx;
        m_onData = nullptr;
        setError(err, ErrorType::DeviceError, "ma_device_start failed");
        return false;
    }

    m_context = ctx;
    m_device = device;
    return true;
}

void MiniaudioMicrophone::stop() {
    std::lock_guard<std::mutex> lk(m_mu);
    if (!m_capturing.exchange(false) || m_device == nullptr) {
        return;
    }
    // ma_device_stop 会等待正在执行的回调结束
    ma_device_stop(toDevice(m_device));
}

void MiniaudioMicrophone::close() {
    std::lock_guard<std::mutex> lk(m_mu);
    m_capturing.store(false, std::memory_order_release);
    if (m_device != nullptr) {
        ma_device_uninit(toDevice(m_device));
        delete toDevice(m_device);
        m_device = nullptr;
    }
    if (m_context != nullptr) {
        ma_context_uninit(toContext(m_context));
        delete toContext(m_context);
        m_context = nullptr;
    }
    m_onData = nullptr;
}

bool MiniaudioMicrophone::isActive() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_device != nullptr && m_capturing.load(std::memory_order_acquire);
}

std::vector<std::string> MiniaudioMicrophone::listCaptureDevices() {
    std::vector<std::string> names;
    ma_context ctx;
    if (ma_context_init(nullptr, 0, nullptr, &ctx) != MA_SUCCESS) {
        return names;
    }
    ma_device_info* playbackInfos = nullptr;
    ma_uint32 playbackCount = 0;
    ma_device_info* captureInfos = nullptr;
    ma_uint32 captureCount = 0;
    if (ma_context_get_devices(&ctx, &playbackInfos, &playbackCount, &captureInfos, &captureCount) == MA_SUCCESS) {
        for (ma_uint32 i = 0; i < captureCount; ++i) {
            names.emplace_back(captureInfos[i].name);
        }
    }
    ma_context_uninit(&ctx);
    return names;
}

} // namespace convmem::capture::audio
