/*
 * Frame Capture and Encoding Abstraction
 *
 * The streaming loop pulls raw RGBA frames from a FrameCapturer and
 * compresses them with a FrameEncoder. Platform capture backends and
 * alternative encoders plug in behind these interfaces.
 */

#ifndef CODEC_H
#define CODEC_H

#include <cstdint>
#include <vector>

namespace streaming {

struct RawFrame {
    std::vector<uint8_t> rgba;      // width * height * 4 bytes, no padding
    int width = 0;
    int height = 0;
};

class FrameCapturer {
public:
    virtual ~FrameCapturer() = default;

    // Capture one frame scaled to width x height. False if none available.
    virtual bool capture(int width, int height, RawFrame& frame) = 0;
};

class FrameEncoder {
public:
    virtual ~FrameEncoder() = default;

    virtual const char* name() const = 0;

    /**
     * Encode one frame
     * @param quality 0..100
     * @param output Encoded bytes (cleared first)
     * @return false on encoder failure
     */
    virtual bool encode(const RawFrame& frame, int quality, std::vector<uint8_t>& output) = 0;
};

} // namespace streaming

#endif // CODEC_H
