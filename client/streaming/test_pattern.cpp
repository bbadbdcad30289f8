/*
 * Test Pattern Capturer Implementation
 */

#include "test_pattern.h"
#include <cmath>

namespace streaming {

bool TestPatternCapturer::capture(int width, int height, RawFrame& frame) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    frame.width = width;
    frame.height = height;
    frame.rgba.resize(static_cast<size_t>(width) * height * 4);

    uint8_t* buffer = frame.rgba.data();
    float t = frame_num_ * 0.05f;

    // Moving circle center
    float cx = 0.5f + 0.3f * sinf(t);
    float cy = 0.5f + 0.3f * cosf(t * 0.7f);

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            size_t idx = (static_cast<size_t>(y) * width + x) * 4;

            float fx = static_cast<float>(x) / width;
            float fy = static_cast<float>(y) / height;
            float dist = sqrtf((fx - cx) * (fx - cx) + (fy - cy) * (fy - cy));

            uint8_t r, g, b;
            if (dist < 0.15f) {
                r = 255;
                g = 255;
                b = 255;
            } else {
                // Background gradient
                r = static_cast<uint8_t>(128 + 127 * sinf(fx * 3.14159f + t));
                g = static_cast<uint8_t>(128 + 127 * sinf(fy * 3.14159f + t * 1.3f));
                b = static_cast<uint8_t>(128 + 127 * sinf((fx + fy) * 3.14159f + t * 0.7f));
            }

            // Title bar
            if (y < 20) {
                r = 255;
                g = 255;
                b = 255;
            }

            buffer[idx + 0] = r;
            buffer[idx + 1] = g;
            buffer[idx + 2] = b;
            buffer[idx + 3] = 255;
        }
    }

    frame_num_++;
    return true;
}

} // namespace streaming
