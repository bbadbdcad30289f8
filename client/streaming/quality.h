/*
 * Streaming Quality
 *
 * Capture presets and the size-based quality controller. The
 * controller sees one encoded frame size per sampling tick and moves
 * at most one step per tick:
 *
 *   general ladder:  high <-> medium <-> low
 *   game ladder:     game <-> gamelow
 *
 * The general ladder only moves with auto quality enabled; the game
 * ladder always follows the frame size while game mode is on.
 */

#ifndef QUALITY_H
#define QUALITY_H

#include <cstddef>
#include <string>

namespace streaming {

enum class Quality {
    LOW,
    MEDIUM,
    HIGH,
    GAME,
    GAME_LOW
};

struct QualityPreset {
    int width;
    int height;
    int fps;
    int encoder_quality;    // 0..100
};

const QualityPreset& preset(Quality quality);
const char* quality_name(Quality quality);

// Accepts "low", "medium", "high", "game", "gamelow"
bool parse_quality(const std::string& name, Quality& out);

constexpr size_t DOWNGRADE_THRESHOLD = 200 * 1024;
constexpr size_t UPGRADE_THRESHOLD = 50 * 1024;

class QualityController {
public:
    explicit QualityController(Quality initial = Quality::MEDIUM);

    // Active preset (game ladder while game mode is on)
    Quality quality() const;

    // Manual selection on the general ladder. Rejects game presets.
    bool set_quality(Quality quality);

    void set_game_mode(bool enabled);
    bool game_mode() const { return game_mode_; }

    void set_auto_quality(bool enabled) { auto_quality_ = enabled; }
    bool auto_quality() const { return auto_quality_; }

    /**
     * One sampling tick
     * @param last_frame_size Encoded size of the latest frame in bytes
     * @return true if the active preset changed
     */
    bool sample(size_t last_frame_size);

private:
    Quality general_;
    Quality game_;
    bool game_mode_;
    bool auto_quality_;
};

} // namespace streaming

#endif // QUALITY_H
