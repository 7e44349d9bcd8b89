#include "InertiaController.h"
#include "../core/PointerSignalTracker.h"

#include <QDebug>

InertiaController::InertiaController(AnimationHandleGuard* guard)
    : m_guard(guard)
{
}

QPointF InertiaController::inertiaTarget(QPointF position, QPointF velocity)
{
    return position + velocity * DECAY_FACTOR;
}

AnimationRequest InertiaController::makeRequest(QPointF position, QPointF velocity)
{
    AnimationRequest request;
    request.from = position;
    request.to = inertiaTarget(position, velocity);
    request.durationSeconds = DURATION_SECONDS;
    request.easing = QEasingCurve(QEasingCurve::OutQuad);
    return request;
}

bool InertiaController::onRelease(QPointF currentPosition, QPointF velocity,
                                  const AnimationBackend::FrameCallback& onFrame)
{
    // Never let two inertia animations overlap
    m_guard->stop();

    if (!m_enabled) {
        return false;
    }

    qreal speed = PointerSignalTracker::magnitudeOf(velocity);
    if (!(speed > MIN_RELEASE_SPEED)) {
        return false;
    }

#ifdef GLIDEVIEW_DEBUG
    qDebug() << "[Inertia] Release at" << currentPosition << "speed" << speed;
#endif

    return m_guard->start(makeRequest(currentPosition, velocity), onFrame);
}
