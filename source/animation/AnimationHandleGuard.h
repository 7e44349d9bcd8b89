#pragma once

// ============================================================================
// AnimationHandleGuard - Owns the single in-flight viewport animation
// ============================================================================
// At most one animation handle exists per guard. stop() always leaves the
// guard empty, even when the backend throws or cannot cancel, and frames
// from a released animation never reach the caller's frame callback.
// ============================================================================

#include "ViewportAnimation.h"

#include <QObject>

class AnimationHandleGuard : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct a guard.
     * @param backend Backend used to create animations (not owned, may be null).
     * @param parent QObject parent for memory management.
     */
    explicit AnimationHandleGuard(AnimationBackend* backend, QObject* parent = nullptr);
    ~AnimationHandleGuard() override;

    /**
     * @brief Cancel and forget the current animation, if any.
     *
     * Uses the handle's advertised capabilities: with StatusQuery the
     * handle is cancelled only while running; without it, Cancel is
     * invoked directly. Backend exceptions are logged, never propagated.
     * The handle is null when this returns.
     */
    void stop();

    /**
     * @brief Create and launch a new animation.
     * @param request Start/end values, duration and easing.
     * @param onFrame Receives every intermediate value while this animation is current.
     * @param onFinish Optional, called after the handle is cleared on natural completion.
     * @return True if the animation was launched, false if the backend failed.
     *
     * Any previous animation is stopped first. Failures leave the handle null.
     */
    bool start(const AnimationRequest& request,
               AnimationBackend::FrameCallback onFrame,
               AnimationBackend::FinishCallback onFinish = {});

    /**
     * @brief Whether an animation handle is currently held.
     */
    bool hasHandle() const { return m_handle != nullptr; }

    ViewportAnimation* handle() const { return m_handle; }

    AnimationBackend* backend() const { return m_backend; }
    void setBackend(AnimationBackend* backend) { m_backend = backend; }

private:
    void releaseHandle();

    AnimationBackend* m_backend = nullptr;  ///< Not owned
    ViewportAnimation* m_handle = nullptr;  ///< Child of this guard while held
    quint64 m_generation = 0;               ///< Bumped on every release, fences stale callbacks
};
