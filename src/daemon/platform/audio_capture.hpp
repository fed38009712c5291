#pragma once

#include <cstdint>

class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
    virtual uint32_t sample_rate() const = 0;
    virtual uint16_t channels() const = 0;
};
