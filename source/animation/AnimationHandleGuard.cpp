#include "AnimationHandleGuard.h"

#include <QPointer>
#include <QDebug>

#include <exception>

AnimationHandleGuard::AnimationHandleGuard(AnimationBackend* backend, QObject* parent)
    : QObject(parent)
    , m_backend(backend)
{
}

AnimationHandleGuard::~AnimationHandleGuard()
{
    stop();
}

// ===== Stop =====

void AnimationHandleGuard::stop()
{
    if (!m_handle) {
        return;
    }

    try {
        const ViewportAnimation::Capabilities caps = m_handle->capabilities();
        if (caps.testFlag(ViewportAnimation::StatusQuery)) {
            if (m_handle->isRunning() && caps.testFlag(ViewportAnimation::Cancel)) {
                m_handle->cancel();
            }
        } else if (caps.testFlag(ViewportAnimation::Cancel)) {
            m_handle->cancel();
        }
    } catch (const std::exception& e) {
        qWarning() << "[AnimationGuard] Failed to cancel animation:" << e.what();
    } catch (...) {
        qWarning() << "[AnimationGuard] Failed to cancel animation: unknown error";
    }

    releaseHandle();
}

// ===== Start =====

bool AnimationHandleGuard::start(const AnimationRequest& request,
                                 AnimationBackend::FrameCallback onFrame,
                                 AnimationBackend::FinishCallback onFinish)
{
    stop();

    if (!m_backend) {
        qWarning() << "[AnimationGuard] No animation backend set";
        return false;
    }

    const quint64 generation = m_generation;
    QPointer<AnimationHandleGuard> self(this);

    auto frame = [self, generation, onFrame](QPointF value) {
        if (!self || self->m_generation != generation) {
            return;  // Superseded animation that could not be cancelled
        }
        if (onFrame) {
            onFrame(value);
        }
    };

    auto finish = [self, generation, onFinish]() {
        if (!self || self->m_generation != generation) {
            return;
        }
        self->releaseHandle();
        if (onFinish) {
            onFinish();
        }
    };

    try {
        ViewportAnimation* animation = m_backend->createAnimation(request, frame, finish);
        if (!animation) {
            qWarning() << "[AnimationGuard] Backend returned no animation";
            return false;
        }
        animation->setParent(this);
        m_handle = animation;
        animation->start();
    } catch (const std::exception& e) {
        qWarning() << "[AnimationGuard] Failed to start animation:" << e.what();
        releaseHandle();
        return false;
    } catch (...) {
        qWarning() << "[AnimationGuard] Failed to start animation: unknown error";
        releaseHandle();
        return false;
    }

#ifdef GLIDEVIEW_DEBUG
    qDebug() << "[AnimationGuard] Started animation" << request.from << "->" << request.to
             << "over" << request.durationSeconds << "s";
#endif
    return true;
}

// ===== Release =====

void AnimationHandleGuard::releaseHandle()
{
    ++m_generation;
    if (m_handle) {
        // May be called from inside the handle's own callbacks
        m_handle->deleteLater();
        m_handle = nullptr;
    }
}
