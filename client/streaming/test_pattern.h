/*
 * Test Pattern Capturer
 *
 * Animated synthetic frames for running a host without a platform
 * capture backend.
 */

#ifndef TEST_PATTERN_H
#define TEST_PATTERN_H

#include "codec.h"

namespace streaming {

class TestPatternCapturer : public FrameCapturer {
public:
    TestPatternCapturer() = default;

    bool capture(int width, int height, RawFrame& frame) override;

private:
    int frame_num_ = 0;
};

} // namespace streaming

#endif // TEST_PATTERN_H
