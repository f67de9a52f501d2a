#pragma once

#include <expected>
#include <string>
#include <vector>

struct InputDevice {
    std::string id;           // node name used to target the device
    std::string description;  // human-readable name
    bool is_default = false;
};

// Device inventory and live input stream. Implementations push captured
// samples into the SampleRing they were constructed with.
class AudioSource {
public:
    virtual ~AudioSource() = default;
    virtual std::vector<InputDevice> list_devices() = 0;
    // Empty device_id opens the system default. Returns the name of the
    // device actually opened.
    virtual std::expected<std::string, std::string> open(const std::string& device_id) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};
