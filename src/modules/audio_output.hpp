#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include "modules/media_types.hpp"

namespace voxplay::modules {

// Pull-model output stream. The device thread asks for `frames`
// interleaved S16 frames per period by invoking the render callback,
// which must fill the whole buffer (padding with silence) and must not
// allocate, lock or block.
using RenderCallback = std::function<void(int16_t* out, size_t frames)>;

class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    // Opens the device, negotiating as close to `requested` as it can.
    // Returns the format the device actually runs at.
    virtual std::expected<PcmFormat, MediaError> open(const PcmFormat& requested) = 0;

    virtual std::expected<void, MediaError> start(RenderCallback render) = 0;

    // Halts the device thread and drops queued audio. Callable repeatedly.
    virtual void stop() = 0;

    // Asks the device thread to drop queued audio at its next period.
    virtual void flush() = 0;

    virtual void close() = 0;

    // Frames written to the device but not yet audible.
    virtual int64_t queued_frames() const = 0;

    virtual bool is_running() const = 0;

    // Set when the device thread gave up after repeated write failures.
    virtual bool failed() const = 0;
};

using OutputFactory = std::function<std::unique_ptr<AudioOutput>()>;

} // namespace voxplay::modules
