#include "PinchZoomController.h"
#include "InertiaController.h"
#include "../core/ViewportState.h"
#include "../animation/AnimationHandleGuard.h"

#include <QLineF>
#include <cmath>

PinchZoomController::PinchZoomController(ViewportState* state, AnimationHandleGuard* guard,
                                         InertiaController* inertia)
    : m_state(state)
    , m_guard(guard)
    , m_inertia(inertia)
{
}

qreal PinchZoomController::distance(QPointF a, QPointF b)
{
    return QLineF(a, b).length();
}

QPointF PinchZoomController::midpoint(QPointF a, QPointF b)
{
    return (a + b) / 2.0;
}

// ===== Gesture =====

bool PinchZoomController::start(QPointF touchA, QPointF touchB)
{
    const qreal distance0 = distance(touchA, touchB);
    if (!(distance0 >= MIN_DISTANCE)) {
        return false;
    }

    // Cancel before resetting tracking state
    m_guard->stop();

    m_distance0 = distance0;
    m_scale0 = m_state->scale();
    m_center0 = midpoint(touchA, touchB);
    m_lastCenter = m_center0;
    m_tracker.start(m_center0, 0.0);
    m_mode = Mode::None;
    m_active = true;
    return true;
}

void PinchZoomController::move(QPointF touchA, QPointF touchB, qreal dt)
{
    if (!m_active) {
        return;
    }

    qreal distance1 = distance(touchA, touchB);
    QPointF center1 = midpoint(touchA, touchB);

    if (!(distance1 >= MIN_DISTANCE)) {
        m_lastCenter = center1;
        return;
    }

    if (std::abs(distance1 - m_distance0) > DEAD_ZONE) {
        m_mode = Mode::Zoom;
        qreal rawScale = m_scale0 * distance1 / m_distance0;

        // Position and scale are written in one step
        m_state->zoomAroundPoint(rawScale, center1);
    } else {
        m_mode = Mode::Pan;
        QPointF delta = center1 - m_lastCenter;
        m_state->setPosition(m_state->position() + delta);
        m_tracker.accumulate(delta, dt);
    }

    m_lastCenter = center1;
}

bool PinchZoomController::end(QPointF currentPosition, const AnimationBackend::FrameCallback& onFrame)
{
    if (!m_active) {
        return false;
    }

    m_active = false;
    Mode endMode = m_mode;
    m_mode = Mode::None;

    // Zoom gestures carry no momentum
    if (endMode != Mode::Pan || m_tracker.velocity().isNull()) {
        return false;
    }

    return m_inertia->onRelease(currentPosition, m_tracker.velocity(), onFrame);
}

void PinchZoomController::cancel()
{
    m_active = false;
    m_mode = Mode::None;
    m_tracker.resetVelocity();
}
