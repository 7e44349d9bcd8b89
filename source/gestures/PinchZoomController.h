#pragma once

// ============================================================================
// PinchZoomController - Two-finger zoom and two-finger pan
// ============================================================================
// Finger distance changes larger than DEAD_ZONE (relative to the distance
// at pinch start) zoom around the finger midpoint. Smaller changes are a
// two-finger pan that tracks velocity for inertia at pinch end.
// ============================================================================

#include "../core/PointerSignalTracker.h"
#include "../animation/ViewportAnimation.h"

#include <QPointF>

class ViewportState;
class AnimationHandleGuard;
class InertiaController;

class PinchZoomController
{
public:
    enum class Mode {
        None,   ///< No move seen yet
        Pan,    ///< Last step was a two-finger pan
        Zoom    ///< Last step was a zoom
    };

    static constexpr qreal DEAD_ZONE = 4.0;       ///< Distance change treated as pan
    static constexpr qreal MIN_DISTANCE = 1.0;    ///< Closer touches cannot define a zoom

    /**
     * @param state Viewport to control (not owned).
     * @param guard Animation guard, stopped at pinch start (not owned).
     * @param inertia Used at pinch end after a pan (not owned).
     */
    PinchZoomController(ViewportState* state, AnimationHandleGuard* guard,
                        InertiaController* inertia);

    /**
     * @brief Begin a pinch with two touch points.
     * @return False (and no state change) if the touches are closer than MIN_DISTANCE.
     */
    bool start(QPointF touchA, QPointF touchB);

    /**
     * @brief Apply the next pair of touch points.
     * @param dt Seconds since the previous move (or start).
     *
     * A pair closer than MIN_DISTANCE is skipped; the next pair pans from
     * its midpoint.
     */
    void move(QPointF touchA, QPointF touchB, qreal dt);

    /**
     * @brief Finish the pinch.
     * @param currentPosition Viewport position at release.
     * @param onFrame Frame callback for a possible inertia animation.
     * @return True if inertia was launched.
     */
    bool end(QPointF currentPosition, const AnimationBackend::FrameCallback& onFrame);

    /**
     * @brief Abandon the pinch without inertia.
     */
    void cancel();

    bool isActive() const { return m_active; }
    Mode mode() const { return m_mode; }
    QPointF velocity() const { return m_tracker.velocity(); }
    qreal startDistance() const { return m_distance0; }
    qreal startScale() const { return m_scale0; }
    QPointF startCenter() const { return m_center0; }

    static qreal distance(QPointF a, QPointF b);
    static QPointF midpoint(QPointF a, QPointF b);

private:
    ViewportState* m_state;             ///< Not owned
    AnimationHandleGuard* m_guard;      ///< Not owned
    InertiaController* m_inertia;       ///< Not owned

    bool m_active = false;
    Mode m_mode = Mode::None;

    qreal m_distance0 = 0;      ///< Finger distance at start
    qreal m_scale0 = 1.0;       ///< Viewport scale at start
    QPointF m_center0;          ///< Midpoint at start
    QPointF m_lastCenter;       ///< Midpoint of the previous step

    PointerSignalTracker m_tracker;     ///< Two-finger pan velocity
};
