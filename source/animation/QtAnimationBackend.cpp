#include "QtAnimationBackend.h"

#include <QVariantAnimation>
#include <QtMath>

#include <stdexcept>

// ===== QtViewportAnimation =====

QtViewportAnimation::QtViewportAnimation(const AnimationRequest& request,
                                         AnimationBackend::FrameCallback onFrame,
                                         AnimationBackend::FinishCallback onFinish,
                                         QObject* parent)
    : ViewportAnimation(parent)
    , m_onFrame(std::move(onFrame))
    , m_onFinish(std::move(onFinish))
{
    m_animation = new QVariantAnimation(this);
    m_animation->setStartValue(request.from);
    m_animation->setEndValue(request.to);
    m_animation->setDuration(qRound(request.durationSeconds * 1000.0));
    m_animation->setEasingCurve(request.easing);

    connect(m_animation, &QVariantAnimation::valueChanged, this, [this](const QVariant& value) {
        if (m_cancelled || !m_onFrame) {
            return;
        }
        m_onFrame(value.toPointF());
    });

    // finished() is also emitted by stop(), so cancel() sets m_cancelled first
    connect(m_animation, &QVariantAnimation::finished, this, [this]() {
        if (m_cancelled || !m_onFinish) {
            return;
        }
        m_onFinish();
    });
}

QtViewportAnimation::~QtViewportAnimation()
{
    m_cancelled = true;
    if (m_animation) {
        m_animation->stop();
    }
}

void QtViewportAnimation::start()
{
    m_animation->start();
}

bool QtViewportAnimation::isRunning() const
{
    return m_animation->state() == QAbstractAnimation::Running;
}

void QtViewportAnimation::cancel()
{
    m_cancelled = true;
    m_animation->stop();
}

// ===== QtAnimationBackend =====

ViewportAnimation* QtAnimationBackend::createAnimation(const AnimationRequest& request,
                                                       FrameCallback onFrame,
                                                       FinishCallback onFinish)
{
    if (request.durationSeconds < 0.0 || qIsNaN(request.durationSeconds)) {
        throw std::invalid_argument("QtAnimationBackend: invalid animation duration");
    }
    return new QtViewportAnimation(request, std::move(onFrame), std::move(onFinish));
}
