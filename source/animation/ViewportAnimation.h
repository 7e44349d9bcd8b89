#pragma once

// ============================================================================
// ViewportAnimation - Adapter contract for viewport animation primitives
// ============================================================================
// Every animation backend (Qt, test fakes, future platform animators) is
// wrapped behind this interface. Backends differ in what they can do:
// some can report whether they are running, some can be cancelled, some
// can do neither. They advertise this through capabilities() so the
// caller never has to inspect the object at runtime.
//
// Faults are reported by throwing std::exception-derived exceptions.
// AnimationHandleGuard is the only caller and it contains them.
// ============================================================================

#include <QObject>
#include <QPointF>
#include <QEasingCurve>
#include <QFlags>

#include <functional>

/**
 * @brief Parameters of a single position animation.
 */
struct AnimationRequest {
    QPointF from;                   ///< Start value (viewport position)
    QPointF to;                     ///< End value (viewport position)
    qreal durationSeconds = 0.0;    ///< Total duration in seconds
    QEasingCurve easing;            ///< Progress curve
};

/**
 * @brief One in-flight animation produced by an AnimationBackend.
 *
 * The object is created stopped; start() launches it. While running it
 * delivers intermediate values to the frame callback it was created with,
 * and calls the finish callback once when it completes on its own.
 */
class ViewportAnimation : public QObject
{
    Q_OBJECT

public:
    enum Capability {
        NoCapability = 0x0,
        StatusQuery  = 0x1,     ///< isRunning() is meaningful
        Cancel       = 0x2      ///< cancel() stops frame delivery
    };
    Q_DECLARE_FLAGS(Capabilities, Capability)

    explicit ViewportAnimation(QObject* parent = nullptr) : QObject(parent) {}
    ~ViewportAnimation() override = default;

    /**
     * @brief Operations this animation actually supports.
     */
    virtual Capabilities capabilities() const = 0;

    /**
     * @brief Launch the animation.
     */
    virtual void start() = 0;

    /**
     * @brief Whether the animation is still delivering frames.
     * Only meaningful when capabilities() contains StatusQuery.
     */
    virtual bool isRunning() const { return false; }

    /**
     * @brief Stop frame delivery without calling the finish callback.
     * Only meaningful when capabilities() contains Cancel.
     */
    virtual void cancel() {}
};

Q_DECLARE_OPERATORS_FOR_FLAGS(ViewportAnimation::Capabilities)

/**
 * @brief Factory for ViewportAnimation objects.
 */
class AnimationBackend
{
public:
    using FrameCallback = std::function<void(QPointF)>;
    using FinishCallback = std::function<void()>;

    virtual ~AnimationBackend() = default;

    /**
     * @brief Create a stopped animation for the given request.
     * @param request Start/end values, duration and easing.
     * @param onFrame Called with the live intermediate value on every tick.
     * @param onFinish Called once when the animation completes by itself.
     * @return A new animation owned by the caller, never null on success.
     *
     * May throw if the backend cannot create the animation.
     */
    virtual ViewportAnimation* createAnimation(const AnimationRequest& request,
                                               FrameCallback onFrame,
                                               FinishCallback onFinish) = 0;
};
