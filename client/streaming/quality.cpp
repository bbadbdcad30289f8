/*
 * Streaming Quality Implementation
 */

#include "quality.h"

namespace streaming {

static const QualityPreset PRESET_LOW      = { 854,  480,  10, 40 };
static const QualityPreset PRESET_MEDIUM   = { 1280, 720,  15, 60 };
static const QualityPreset PRESET_HIGH     = { 1920, 1080, 25, 80 };
static const QualityPreset PRESET_GAME     = { 1920, 1080, 60, 70 };
static const QualityPreset PRESET_GAME_LOW = { 1280, 720,  60, 50 };

const QualityPreset& preset(Quality quality) {
    switch (quality) {
        case Quality::LOW:      return PRESET_LOW;
        case Quality::MEDIUM:   return PRESET_MEDIUM;
        case Quality::HIGH:     return PRESET_HIGH;
        case Quality::GAME:     return PRESET_GAME;
        case Quality::GAME_LOW: return PRESET_GAME_LOW;
    }
    return PRESET_MEDIUM;
}

const char* quality_name(Quality quality) {
    switch (quality) {
        case Quality::LOW:      return "low";
        case Quality::MEDIUM:   return "medium";
        case Quality::HIGH:     return "high";
        case Quality::GAME:     return "game";
        case Quality::GAME_LOW: return "gamelow";
    }
    return "unknown";
}

bool parse_quality(const std::string& name, Quality& out) {
    if (name == "low") { out = Quality::LOW; return true; }
    if (name == "medium") { out = Quality::MEDIUM; return true; }
    if (name == "high") { out = Quality::HIGH; return true; }
    if (name == "game") { out = Quality::GAME; return true; }
    if (name == "gamelow") { out = Quality::GAME_LOW; return true; }
    return false;
}

QualityController::QualityController(Quality initial)
    : general_(Quality::MEDIUM)
    , game_(Quality::GAME)
    , game_mode_(false)
    , auto_quality_(true)
{
    set_quality(initial);
}

Quality QualityController::quality() const {
    return game_mode_ ? game_ : general_;
}

bool QualityController::set_quality(Quality quality) {
    if (quality == Quality::GAME || quality == Quality::GAME_LOW) {
        return false;
    }
    general_ = quality;
    return true;
}

void QualityController::set_game_mode(bool enabled) {
    if (enabled && !game_mode_) {
        game_ = Quality::GAME;
    }
    game_mode_ = enabled;
}

bool QualityController::sample(size_t last_frame_size) {
    if (last_frame_size == 0) {
        return false;
    }

    if (game_mode_) {
        if (last_frame_size > DOWNGRADE_THRESHOLD && game_ == Quality::GAME) {
            game_ = Quality::GAME_LOW;
            return true;
        }
        if (last_frame_size < UPGRADE_THRESHOLD && game_ == Quality::GAME_LOW) {
            game_ = Quality::GAME;
            return true;
        }
        return false;
    }

    if (!auto_quality_) {
        return false;
    }

    if (last_frame_size > DOWNGRADE_THRESHOLD) {
        if (general_ == Quality::HIGH) { general_ = Quality::MEDIUM; return true; }
        if (general_ == Quality::MEDIUM) { general_ = Quality::LOW; return true; }
    } else if (last_frame_size < UPGRADE_THRESHOLD) {
        if (general_ == Quality::LOW) { general_ = Quality::MEDIUM; return true; }
        if (general_ == Quality::MEDIUM) { general_ = Quality::HIGH; return true; }
    }
    return false;
}

} // namespace streaming
