#pragma once

// ============================================================================
// InertiaController - Decay animation after a drag or two-finger pan
// ============================================================================

#include "../animation/AnimationHandleGuard.h"

#include <QPointF>
#include <QEasingCurve>

/**
 * @brief Launches a short ease-out glide from the release velocity.
 *
 * Each release is independent: the previous animation is always stopped
 * first, and nothing is resumed later.
 */
class InertiaController
{
public:
    static constexpr qreal MIN_RELEASE_SPEED = 50.0;   ///< px/s, at or below: no inertia
    static constexpr qreal DECAY_FACTOR = 0.3;         ///< Target displacement = velocity * factor
    static constexpr qreal DURATION_SECONDS = 0.4;

    /**
     * @param guard Guard that owns the animation handle (not owned).
     */
    explicit InertiaController(AnimationHandleGuard* guard);

    /**
     * @brief Handle a gesture release.
     * @param currentPosition Viewport position at release.
     * @param velocity Smoothed release velocity (px/s).
     * @param onFrame Receives every intermediate position.
     * @return True if an inertia animation was launched.
     */
    bool onRelease(QPointF currentPosition, QPointF velocity,
                   const AnimationBackend::FrameCallback& onFrame);

    /**
     * @brief Where an inertia animation released at position with velocity ends.
     */
    static QPointF inertiaTarget(QPointF position, QPointF velocity);

    /**
     * @brief The request onRelease() would issue, for inspection.
     */
    static AnimationRequest makeRequest(QPointF position, QPointF velocity);

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

private:
    AnimationHandleGuard* m_guard;  ///< Not owned
    bool m_enabled = true;
};
