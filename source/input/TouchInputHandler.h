#pragma once

// ============================================================================
// TouchInputHandler - Qt input events to viewport gestures
// ============================================================================
// - 1 finger (or left mouse button) = drag with inertia
// - 2 fingers = pinch (zoom or two-finger pan)
// - Clean break on finger count change: 1->2 ends the drag without inertia,
//   2->1 ends the pinch and waits for a fresh TouchBegin
// - Mouse wheel / touchpad scroll = zoom around the pointer
// ============================================================================

#include <QObject>
#include <QPointF>
#include <QVector>
#include <QElapsedTimer>

class QTouchEvent;
class QMouseEvent;
class QWheelEvent;
class ViewportGestureController;

class TouchInputHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct an input handler.
     * @param controller The controller to drive (not owned).
     * @param parent QObject parent for memory management.
     */
    explicit TouchInputHandler(ViewportGestureController* controller, QObject* parent = nullptr);
    ~TouchInputHandler() override = default;

    /**
     * @brief Handle a touch event.
     * @return True if the event was consumed.
     */
    bool handleTouchEvent(QTouchEvent* event);

    bool handleMousePress(QMouseEvent* event);
    bool handleMouseMove(QMouseEvent* event);
    bool handleMouseRelease(QMouseEvent* event);

    /**
     * @brief Zoom on wheel or touchpad scroll.
     * @return True if the event was consumed.
     */
    bool handleWheelEvent(QWheelEvent* event);

    /**
     * @brief Enable or disable input handling. Disabling cancels any gesture.
     */
    void setEnabled(bool enabled);
    bool isEnabled() const { return m_enabled; }

    /**
     * @brief Force reset all gesture state.
     * Call this on hideEvent, focus loss, etc. to prevent stale state.
     */
    void resetAllState();

    /**
     * @brief Check if a mouse event was synthesized from touch input.
     */
    static bool isTouchInput(QMouseEvent* event);

private:
    enum class GestureType {
        None,       // No gesture active
        OneFinger,  // 1-finger drag
        TwoFinger,  // 2-finger pinch
        Mouse       // Left-button drag
    };

    /**
     * @brief Seconds since the handler was created.
     */
    qreal now() const;

    ViewportGestureController* m_controller;   ///< Not owned
    bool m_enabled = true;

    GestureType m_gestureType = GestureType::None;
    int m_pinchTouchCount = 0;      ///< Fingers down when the pinch baseline was taken

    // After a 2->1 transition don't start a drag from the leftover finger.
    // Wait for a fresh TouchBegin to avoid a jump from stale positions.
    bool m_waitingForFreshTouch = false;

    QElapsedTimer m_clock;

    // Mouse wheel: 120 units = 15 degrees = one notch
    static constexpr qreal WHEEL_UNITS_PER_NOTCH = 120.0;
    // Touchpad: pixel delta per notch
    static constexpr qreal PIXELS_PER_NOTCH = 50.0;
};
