#pragma once

// ============================================================================
// FakeAnimationBackend - Scripted AnimationBackend for unit tests
// ============================================================================
// Frames and completion are delivered by hand, so tests control time.
// Each fault flag makes the matching operation throw std::runtime_error,
// or a plain int when foreignFaults is set.
// ============================================================================

#include "ViewportAnimation.h"

#include <QPointer>
#include <QVector>

#include <stdexcept>

class FakeAnimation : public ViewportAnimation
{
public:
    FakeAnimation(Capabilities caps,
                  AnimationBackend::FrameCallback onFrame,
                  AnimationBackend::FinishCallback onFinish)
        : m_caps(caps)
        , m_onFrame(std::move(onFrame))
        , m_onFinish(std::move(onFinish))
    {
    }

    Capabilities capabilities() const override { return m_caps; }

    void start() override
    {
        ++startCount;
        if (throwOnStart) {
            fail("fake start failure");
        }
        m_running = true;
    }

    bool isRunning() const override
    {
        ++queryCount;
        if (throwOnQuery) {
            fail("fake status failure");
        }
        return m_running;
    }

    void cancel() override
    {
        ++cancelCount;
        if (throwOnCancel) {
            fail("fake cancel failure");
        }
        m_running = false;
    }

    /**
     * @brief Deliver one frame if the animation is still running.
     */
    void deliverFrame(QPointF value)
    {
        if (m_running && m_onFrame) {
            m_onFrame(value);
        }
    }

    /**
     * @brief Run to completion and report it.
     */
    void complete()
    {
        m_running = false;
        if (m_onFinish) {
            m_onFinish();
        }
    }

    bool running() const { return m_running; }

    bool foreignFaults = false;
    bool throwOnStart = false;
    bool throwOnQuery = false;
    bool throwOnCancel = false;

    int startCount = 0;
    mutable int queryCount = 0;
    int cancelCount = 0;

private:
    void fail(const char* what) const
    {
        if (foreignFaults) {
            throw 42;
        }
        throw std::runtime_error(what);
    }

    Capabilities m_caps;
    AnimationBackend::FrameCallback m_onFrame;
    AnimationBackend::FinishCallback m_onFinish;
    bool m_running = false;
};

class FakeAnimationBackend : public AnimationBackend
{
public:
    ViewportAnimation* createAnimation(const AnimationRequest& request,
                                       FrameCallback onFrame,
                                       FinishCallback onFinish) override
    {
        requests.append(request);
        if (throwOnCreate) {
            if (foreignFaults) {
                throw 42;
            }
            throw std::runtime_error("fake create failure");
        }
        if (returnNull) {
            return nullptr;
        }

        auto* animation = new FakeAnimation(capabilities, std::move(onFrame), std::move(onFinish));
        animation->foreignFaults = foreignFaults;
        animation->throwOnStart = throwOnStart;
        animation->throwOnQuery = throwOnQuery;
        animation->throwOnCancel = throwOnCancel;
        animations.append(animation);
        return animation;
    }

    /**
     * @brief Most recently created animation, or null if it was deleted.
     */
    FakeAnimation* last() const
    {
        return animations.isEmpty() ? nullptr : animations.last().data();
    }

    ViewportAnimation::Capabilities capabilities =
        ViewportAnimation::StatusQuery | ViewportAnimation::Cancel;

    bool foreignFaults = false;
    bool throwOnCreate = false;
    bool returnNull = false;
    bool throwOnStart = false;
    bool throwOnQuery = false;
    bool throwOnCancel = false;

    QVector<AnimationRequest> requests;
    QVector<QPointer<FakeAnimation>> animations;
};
