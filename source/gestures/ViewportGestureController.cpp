#include "ViewportGestureController.h"
#include "../core/ViewportState.h"
#include "../animation/AnimationHandleGuard.h"
#include "../animation/QtAnimationBackend.h"

#include <QtMath>
#include <QDebug>

static AnimationBackend* resolveBackend(AnimationBackend* backend,
                                        std::unique_ptr<AnimationBackend>& owned)
{
    if (backend) {
        return backend;
    }
    owned = std::make_unique<QtAnimationBackend>();
    return owned.get();
}

// ===== Constructor =====

ViewportGestureController::ViewportGestureController(AnimationBackend* backend, QObject* parent)
    : QObject(parent)
    , m_state(new ViewportState(this))
    , m_guard(new AnimationHandleGuard(resolveBackend(backend, m_ownedBackend), this))
    , m_inertia(m_guard)
    , m_pinch(m_state, m_guard, &m_inertia)
{
    connect(m_state, &ViewportState::viewportChanged,
            this, &ViewportGestureController::viewportChanged);

    applySettings(m_settings);
}

ViewportGestureController::~ViewportGestureController()
{
    // The guard outlives m_ownedBackend (it is destroyed with the QObject children)
    m_guard->stop();
    m_guard->setBackend(nullptr);
}

void ViewportGestureController::applySettings(const ViewportSettings& settings)
{
    m_settings = settings;
    m_inertia.setEnabled(settings.inertiaEnabled);
}

AnimationBackend::FrameCallback ViewportGestureController::positionWriter()
{
    ViewportState* state = m_state;
    return [state](QPointF position) {
        state->setPosition(position);
    };
}

void ViewportGestureController::setGestureState(GestureState state)
{
    if (m_gestureState == state) {
        return;
    }
    m_gestureState = state;
    emit gestureStateChanged(state);
}

// ===== Drag =====

void ViewportGestureController::dragStart(QPointF position, qreal timestamp)
{
    m_guard->stop();

    if (m_pinch.isActive()) {
        m_pinch.cancel();
    }

    m_dragTracker.start(position, timestamp);
    m_lastDragPointer = position;
    setGestureState(GestureState::Dragging);
}

void ViewportGestureController::dragMove(QPointF position, qreal timestamp)
{
    if (m_gestureState != GestureState::Dragging) {
        return;
    }

    QPointF delta = position - m_lastDragPointer;
    m_lastDragPointer = position;

    m_state->setPosition(m_state->position() + delta);
    m_dragTracker.update(position, timestamp);
}

bool ViewportGestureController::dragEnd(QPointF position, qreal timestamp)
{
    if (m_gestureState != GestureState::Dragging) {
        return false;
    }

    // A release at the last move position must not dilute the velocity,
    // but a pointer held still before release loses it
    if (position != m_lastDragPointer) {
        dragMove(position, timestamp);
    } else {
        m_dragTracker.decayIdle(timestamp);
    }

    setGestureState(GestureState::Idle);
    return m_inertia.onRelease(m_state->position(), m_dragTracker.velocity(), positionWriter());
}

// ===== Pinch =====

bool ViewportGestureController::pinchStart(const QVector<QPointF>& touches, qreal timestamp)
{
    if (touches.size() < 2) {
#ifdef GLIDEVIEW_DEBUG
        qDebug() << "[Gesture] pinchStart ignored with" << touches.size() << "touch points";
#endif
        return false;
    }

    if (!m_pinch.start(touches.at(0), touches.at(1))) {
#ifdef GLIDEVIEW_DEBUG
        qDebug() << "[Gesture] pinchStart ignored for coincident touch points";
#endif
        return false;
    }

    // Clean break: a drag turning into a pinch gets no inertia
    if (m_gestureState == GestureState::Dragging) {
        m_dragTracker.resetVelocity();
    }

    m_lastPinchTime = timestamp;
    setGestureState(GestureState::Pinching);
    return true;
}

void ViewportGestureController::pinchMove(const QVector<QPointF>& touches, qreal timestamp)
{
    if (m_gestureState != GestureState::Pinching || touches.size() < 2) {
        return;
    }

    qreal dt = timestamp - m_lastPinchTime;
    m_lastPinchTime = timestamp;

    m_pinch.move(touches.at(0), touches.at(1), dt);
}

bool ViewportGestureController::pinchEnd()
{
    if (m_gestureState != GestureState::Pinching) {
        return false;
    }

    setGestureState(GestureState::Idle);
    return m_pinch.end(m_state->position(), positionWriter());
}

// ===== Discrete Zoom =====

void ViewportGestureController::startDiscreteZoom(qreal newScale, QPointF pivot)
{
    m_guard->stop();
    m_state->zoomAroundPoint(newScale, pivot);
}

void ViewportGestureController::wheelZoom(QPointF pointerPos, qreal notches)
{
    if (m_gestureState != GestureState::Idle || qFuzzyIsNull(notches)) {
        return;
    }

    qreal factor = qPow(m_settings.wheelZoomStep, notches);
    startDiscreteZoom(m_state->scale() * factor, pointerPos);
}

void ViewportGestureController::zoomIn(QPointF pivot)
{
    startDiscreteZoom(m_state->scale() * m_settings.buttonZoomStep, pivot);
}

void ViewportGestureController::zoomOut(QPointF pivot)
{
    startDiscreteZoom(m_state->scale() / m_settings.buttonZoomStep, pivot);
}

void ViewportGestureController::resetView()
{
    cancelGesture();
    m_state->reset();
}

void ViewportGestureController::cancelGesture()
{
    m_guard->stop();
    m_pinch.cancel();
    m_dragTracker.resetVelocity();
    setGestureState(GestureState::Idle);
}
