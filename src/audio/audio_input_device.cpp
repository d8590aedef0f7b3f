#include "audio/audio_input_device.hpp"
#include "audio/audio_input_device_portaudio.hpp"
#include "audio/audio_input_device_synthetic.hpp"
#include <filesystem>

namespace audio {

namespace {
const std::string kSyntheticPrefix = "synthetic:";
}

std::vector<AudioDeviceInfo> AudioInputFactory::enumerate_devices() {
    std::vector<AudioDeviceInfo> devices = AudioInputDevice_PortAudio::enumerate_portaudio_devices();

    AudioDeviceInfo synthetic;
    synthetic.id = "synthetic:<file.wav>";
    synthetic.name = "Synthetic Device (File Playback)";
    synthetic.driver = "Synthetic";
    synthetic.default_sample_rate = 16000;
    synthetic.max_channels = 1;
    synthetic.is_default = false;
    devices.push_back(synthetic);

    return devices;
}

std::string AudioInputFactory::synthetic_path(const std::string& device_id) {
    if (device_id.compare(0, kSyntheticPrefix.size(), kSyntheticPrefix) == 0) {
        return device_id.substr(kSyntheticPrefix.size());
    }
    return "";
}

std::unique_ptr<IAudioInputDevice> AudioInputFactory::create_device(const std::string& device_id) {
    if (device_id.compare(0, kSyntheticPrefix.size(), kSyntheticPrefix) == 0) {
        return std::make_unique<AudioInputDevice_Synthetic>();
    }
    if (device_id.empty() || device_id == "default" || device_id.compare(0, 10, "portaudio:") == 0) {
        return std::make_unique<AudioInputDevice_PortAudio>();
    }
    return nullptr;
}

bool AudioInputFactory::is_device_available(const std::string& device_id) {
    std::string path = synthetic_path(device_id);
    if (!path.empty()) {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec);
    }
    if (device_id.empty() || device_id == "default") {
        for (const auto& dev : AudioInputDevice_PortAudio::enumerate_portaudio_devices()) {
            if (dev.is_default) return true;
        }
        return false;
    }
    for (const auto& dev : AudioInputDevice_PortAudio::enumerate_portaudio_devices()) {
        if (dev.id == device_id) {
            return true;
        }
    }
    return false;
}

} // namespace audio
