#pragma once

#include "Types.hpp"

namespace core {

/**
 * Indicator colors for visual feedback (RGB, 0-1).
 * The host maps states to colors; the FSM itself has no visual side effects.
 */
struct IndicatorColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

constexpr IndicatorColor INDICATOR_GRAY{0.5f, 0.5f, 0.5f};
constexpr IndicatorColor INDICATOR_RED{1.0f, 0.0f, 0.0f};
constexpr IndicatorColor INDICATOR_BLUE{0.0f, 0.0f, 1.0f};
constexpr IndicatorColor INDICATOR_YELLOW{1.0f, 0.92f, 0.016f};
constexpr IndicatorColor INDICATOR_GREEN{0.0f, 1.0f, 0.0f};

// Shown when a snap completes
constexpr IndicatorColor SNAP_COMPLETED_COLOR = INDICATOR_GREEN;

inline IndicatorColor getIndicatorColor(GestureState state) {
    switch (state) {
        case GestureState::Idle:     return INDICATOR_RED;
        case GestureState::Ready:    return INDICATOR_BLUE;
        case GestureState::Snapping: return INDICATOR_YELLOW;
        case GestureState::Uninitialized:
        default:
            return INDICATOR_GRAY;
    }
}

} // namespace core
