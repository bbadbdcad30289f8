/*
 * WebP Encoder using libwebp
 * Lossy encoding of RGBA screen frames, quality set per frame
 * from the active streaming preset
 */

#ifndef WEBP_ENCODER_H
#define WEBP_ENCODER_H

#include "codec.h"
#include <cstdint>
#include <vector>

namespace streaming {

class WebPEncoder : public FrameEncoder {
public:
    WebPEncoder() = default;

    const char* name() const override { return "WebP"; }

    bool encode(const RawFrame& frame, int quality, std::vector<uint8_t>& output) override;

private:
    // Stats
    int frame_count_ = 0;
    int64_t total_size_ = 0;
};

} // namespace streaming

#endif // WEBP_ENCODER_H
