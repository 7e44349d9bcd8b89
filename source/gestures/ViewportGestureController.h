#pragma once

// ============================================================================
// ViewportGestureController - Pan, pinch, wheel zoom and inertia for one canvas
// ============================================================================
// One instance per canvas. Owns the ViewportState, the animation guard and
// all per-gesture tracking state, so independent canvases never share
// velocity, position or animation handles.
//
// Ordering rules:
// - Every gesture start stops the in-flight animation before resetting
//   tracking state.
// - Drag/pinch moves and animation frames write ViewportState synchronously.
// ============================================================================

#include "InertiaController.h"
#include "PinchZoomController.h"
#include "../core/PointerSignalTracker.h"
#include "../core/ViewportSettings.h"

#include <QObject>
#include <QPointF>
#include <QVector>

#include <memory>

class ViewportState;
class AnimationHandleGuard;
class AnimationBackend;

class ViewportGestureController : public QObject
{
    Q_OBJECT

public:
    enum class GestureState {
        Idle,
        Dragging,
        Pinching
    };
    Q_ENUM(GestureState)

    /**
     * @brief Construct a controller.
     * @param backend Animation backend (not owned). If null, a Qt backend is created and owned.
     * @param parent QObject parent for memory management.
     */
    explicit ViewportGestureController(AnimationBackend* backend = nullptr, QObject* parent = nullptr);
    ~ViewportGestureController() override;

    ViewportState* state() const { return m_state; }
    AnimationHandleGuard* animationGuard() const { return m_guard; }
    GestureState gestureState() const { return m_gestureState; }

    /**
     * @brief Smoothed velocity of the current (or last) drag, px/s.
     */
    QPointF dragVelocity() const { return m_dragTracker.velocity(); }

    const PinchZoomController& pinch() const { return m_pinch; }

    void applySettings(const ViewportSettings& settings);
    const ViewportSettings& settings() const { return m_settings; }

    // ===== Single-pointer drag =====

    void dragStart(QPointF position, qreal timestamp);
    void dragMove(QPointF position, qreal timestamp);

    /**
     * @brief Finish a drag.
     * @return True if an inertia animation was launched.
     */
    bool dragEnd(QPointF position, qreal timestamp);

    // ===== Two-finger pinch =====

    /**
     * @brief Begin a pinch. Ends any active drag without inertia.
     * @param touches Current touch points; the first two are used.
     * @return False (and no state change) with fewer than two points.
     */
    bool pinchStart(const QVector<QPointF>& touches, qreal timestamp);

    /**
     * @brief Update the pinch. Ignored with fewer than two points.
     */
    void pinchMove(const QVector<QPointF>& touches, qreal timestamp);

    /**
     * @brief Finish the pinch.
     * @return True if an inertia animation was launched.
     */
    bool pinchEnd();

    // ===== Discrete zoom =====

    /**
     * @brief Zoom by mouse wheel notches around the pointer.
     * @param notches Positive zooms in, negative zooms out.
     *
     * Ignored while a drag or pinch is active.
     */
    void wheelZoom(QPointF pointerPos, qreal notches);

    void zoomIn(QPointF pivot);
    void zoomOut(QPointF pivot);

    /**
     * @brief Return to position (0,0) and scale 1.0.
     */
    void resetView();

    /**
     * @brief Stop animation and abandon any gesture without inertia.
     * Call this when the canvas is hidden or loses input focus mid-gesture.
     */
    void cancelGesture();

signals:
    /**
     * @brief Emitted whenever position or scale changes.
     */
    void viewportChanged(QPointF position, qreal scale);

    void gestureStateChanged(ViewportGestureController::GestureState state);

private:
    void setGestureState(GestureState state);
    void startDiscreteZoom(qreal newScale, QPointF pivot);
    AnimationBackend::FrameCallback positionWriter();

    std::unique_ptr<AnimationBackend> m_ownedBackend;

    ViewportState* m_state = nullptr;           ///< Child QObject
    AnimationHandleGuard* m_guard = nullptr;    ///< Child QObject

    InertiaController m_inertia;
    PinchZoomController m_pinch;
    PointerSignalTracker m_dragTracker;

    GestureState m_gestureState = GestureState::Idle;
    QPointF m_lastDragPointer;
    qreal m_lastPinchTime = 0;

    ViewportSettings m_settings;
};
