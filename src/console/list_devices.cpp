#include <iostream>
#include "audio/audio_input_device.hpp"

int main() {
    auto devices = audio::AudioInputFactory::enumerate_devices();
    if (devices.empty()) {
        std::cout << "No input devices found." << std::endl;
        return 0;
    }
    std::cout << "Input devices:" << std::endl;
    for (size_t i = 0; i < devices.size(); ++i) {
        std::cout << i << ": " << devices[i].name << " (" << devices[i].driver << ")";
        if (devices[i].is_default) {
            std::cout << " [DEFAULT]";
        }
        std::cout << "\n  ID: " << devices[i].id << "\n";
    }
    return 0;
}
