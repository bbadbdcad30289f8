/*
 * WebP Encoder using libwebp (lossy mode)
 * Using a fast method for low latency; the preset quality
 * trades size against fidelity
 */

#include "webp_encoder.h"
#include "../../common/utils/debug_flags.h"
#include <webp/encode.h>
#include <cstdio>

namespace streaming {

bool WebPEncoder::encode(const RawFrame& frame, int quality, std::vector<uint8_t>& output) {
    output.clear();

    if (frame.width <= 0 || frame.height <= 0 ||
        frame.rgba.size() < static_cast<size_t>(frame.width) * frame.height * 4) {
        fprintf(stderr, "WebP: Invalid frame %dx%d\n", frame.width, frame.height);
        return false;
    }

    WebPConfig config;
    if (!WebPConfigPreset(&config, WEBP_PRESET_PICTURE, static_cast<float>(quality))) {
        fprintf(stderr, "WebP: Failed to initialize config\n");
        return false;
    }

    config.lossless = 0;
    config.method = 0;             // Fastest encoding (0-6, default 4)

    if (!WebPValidateConfig(&config)) {
        fprintf(stderr, "WebP: Invalid config (quality %d)\n", quality);
        return false;
    }

    WebPMemoryWriter writer;
    WebPMemoryWriterInit(&writer);

    WebPPicture picture;
    if (!WebPPictureInit(&picture)) {
        fprintf(stderr, "WebP: Failed to initialize picture\n");
        return false;
    }

    picture.width = frame.width;
    picture.height = frame.height;
    picture.writer = WebPMemoryWrite;
    picture.custom_ptr = &writer;

    if (!WebPPictureImportRGBA(&picture, frame.rgba.data(), frame.width * 4)) {
        fprintf(stderr, "WebP: Failed to import RGBA\n");
        WebPPictureFree(&picture);
        return false;
    }

    if (!WebPEncode(&config, &picture)) {
        fprintf(stderr, "WebP: Encoding failed (error code: %d)\n", picture.error_code);
        WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
        return false;
    }

    output.assign(writer.mem, writer.mem + writer.size);

    WebPPictureFree(&picture);
    WebPMemoryWriterClear(&writer);

    frame_count_++;
    total_size_ += static_cast<int64_t>(output.size());

    if (g_debug_stream && frame_count_ % 30 == 0) {
        float avg_size = static_cast<float>(total_size_) / frame_count_;
        fprintf(stderr, "WebP: frame=%d size=%zu bytes q=%d (avg %.1f KB)\n",
                frame_count_, output.size(), quality, avg_size / 1024.0f);
    }

    return true;
}

} // namespace streaming
