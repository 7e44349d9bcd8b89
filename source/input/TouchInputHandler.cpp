#include "TouchInputHandler.h"
#include "../gestures/ViewportGestureController.h"
#include "../compat/qt_compat.h"

#include <QMouseEvent>
#include <QWheelEvent>

// ===== Constructor =====

TouchInputHandler::TouchInputHandler(ViewportGestureController* controller, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
{
    m_clock.start();
}

qreal TouchInputHandler::now() const
{
    return m_clock.nsecsElapsed() / 1.0e9;
}

bool TouchInputHandler::isTouchInput(QMouseEvent* event)
{
    // Touch events are synthesized to mouse events with this source
    return (event->source() != Qt::MouseEventNotSynthesized);
}

void TouchInputHandler::setEnabled(bool enabled)
{
    if (m_enabled == enabled) {
        return;
    }
    if (!enabled) {
        resetAllState();
    }
    m_enabled = enabled;
}

void TouchInputHandler::resetAllState()
{
    if (m_gestureType != GestureType::None) {
        m_controller->cancelGesture();
    }
    m_gestureType = GestureType::None;
    m_pinchTouchCount = 0;
    m_waitingForFreshTouch = false;
}

// ===== Touch Event Handling =====

bool TouchInputHandler::handleTouchEvent(QTouchEvent* event)
{
    if (!m_enabled) {
        return false;  // Don't consume event
    }

    const qreal t = now();

    // Positions of fingers still on the screen
    QVector<QPointF> active;
    QPointF lastReleased;
    for (const GV_TouchPoint& point : GV_TOUCH_POINTS(event)) {
        if (GV_TP_STATE(point) == GV_TP_RELEASED) {
            lastReleased = GV_TP_POS(point);
        } else {
            active.append(GV_TP_POS(point));
        }
    }

    // ===== TouchBegin =====
    if (event->type() == QEvent::TouchBegin) {
        m_waitingForFreshTouch = false;

        if (active.size() == 1) {
            m_controller->dragStart(active.first(), t);
            m_gestureType = GestureType::OneFinger;
        } else if (m_controller->pinchStart(active, t)) {
            m_gestureType = GestureType::TwoFinger;
            m_pinchTouchCount = active.size();
        }
        event->accept();
        return true;
    }

    // ===== TouchUpdate =====
    if (event->type() == QEvent::TouchUpdate) {
        if (m_waitingForFreshTouch) {
            event->accept();
            return true;
        }

        switch (m_gestureType) {
        case GestureType::OneFinger:
            if (active.size() == 1) {
                m_controller->dragMove(active.first(), t);
            } else if (m_controller->pinchStart(active, t)) {
                // 1->2 fingers: the drag ends without inertia
                m_gestureType = GestureType::TwoFinger;
                m_pinchTouchCount = active.size();
            }
            break;

        case GestureType::TwoFinger:
            if (active.size() == m_pinchTouchCount) {
                m_controller->pinchMove(active, t);
            } else if (active.size() >= 2) {
                // Finger count changed: the first two points may be a
                // different pair now, so take a new baseline
                if (m_controller->pinchStart(active, t)) {
                    m_pinchTouchCount = active.size();
                }
            } else {
                // 2->1 fingers: finish the pinch, ignore the leftover finger
                m_controller->pinchEnd();
                m_gestureType = GestureType::None;
                m_pinchTouchCount = 0;
                m_waitingForFreshTouch = true;
            }
            break;

        case GestureType::None:
        case GestureType::Mouse:
            if (active.size() >= 2 && m_controller->pinchStart(active, t)) {
                m_gestureType = GestureType::TwoFinger;
                m_pinchTouchCount = active.size();
            }
            break;
        }

        event->accept();
        return true;
    }

    // ===== TouchEnd / TouchCancel =====
    if (event->type() == QEvent::TouchEnd || event->type() == QEvent::TouchCancel) {
        const bool cancelled = (event->type() == QEvent::TouchCancel);

        if (cancelled) {
            m_controller->cancelGesture();
        } else if (m_gestureType == GestureType::OneFinger) {
            m_controller->dragEnd(lastReleased, t);
        } else if (m_gestureType == GestureType::TwoFinger) {
            m_controller->pinchEnd();
        }

        m_gestureType = GestureType::None;
        m_pinchTouchCount = 0;
        m_waitingForFreshTouch = false;
        event->accept();
        return true;
    }

    // Fallback - accept but don't claim handling
    event->accept();
    return true;
}

// ===== Mouse =====

bool TouchInputHandler::handleMousePress(QMouseEvent* event)
{
    if (!m_enabled || isTouchInput(event) || event->button() != Qt::LeftButton) {
        return false;
    }
    if (m_gestureType != GestureType::None) {
        return false;
    }

    m_controller->dragStart(GV_MOUSE_POS(event), now());
    m_gestureType = GestureType::Mouse;
    event->accept();
    return true;
}

bool TouchInputHandler::handleMouseMove(QMouseEvent* event)
{
    if (!m_enabled || m_gestureType != GestureType::Mouse || isTouchInput(event)) {
        return false;
    }

    m_controller->dragMove(GV_MOUSE_POS(event), now());
    event->accept();
    return true;
}

bool TouchInputHandler::handleMouseRelease(QMouseEvent* event)
{
    if (!m_enabled || m_gestureType != GestureType::Mouse || event->button() != Qt::LeftButton) {
        return false;
    }

    m_controller->dragEnd(GV_MOUSE_POS(event), now());
    m_gestureType = GestureType::None;
    event->accept();
    return true;
}

// ===== Wheel =====

bool TouchInputHandler::handleWheelEvent(QWheelEvent* event)
{
    if (!m_enabled) {
        return false;
    }

    QPoint pixelDelta = event->pixelDelta();
    QPoint angleDelta = event->angleDelta();

    qreal notches = 0;
    if (!angleDelta.isNull()) {
        notches = angleDelta.y() / WHEEL_UNITS_PER_NOTCH;
    } else if (!pixelDelta.isNull()) {
        notches = pixelDelta.y() / PIXELS_PER_NOTCH;
    }

    if (!qFuzzyIsNull(notches)) {
        m_controller->wheelZoom(GV_WHEEL_POS(event), notches);
    }

    event->accept();
    return true;
}
