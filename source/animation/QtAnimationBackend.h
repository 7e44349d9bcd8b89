#pragma once

// ============================================================================
// QtAnimationBackend - ViewportAnimation on top of QVariantAnimation
// ============================================================================

#include "ViewportAnimation.h"

class QVariantAnimation;

/**
 * @brief ViewportAnimation driven by Qt's animation framework.
 *
 * Supports both StatusQuery and Cancel. Frames arrive from the Qt
 * animation timer (~60 FPS) on the GUI thread.
 */
class QtViewportAnimation : public ViewportAnimation
{
    Q_OBJECT

public:
    QtViewportAnimation(const AnimationRequest& request,
                        AnimationBackend::FrameCallback onFrame,
                        AnimationBackend::FinishCallback onFinish,
                        QObject* parent = nullptr);
    ~QtViewportAnimation() override;

    Capabilities capabilities() const override { return StatusQuery | Cancel; }
    void start() override;
    bool isRunning() const override;
    void cancel() override;

private:
    QVariantAnimation* m_animation = nullptr;
    AnimationBackend::FrameCallback m_onFrame;
    AnimationBackend::FinishCallback m_onFinish;
    bool m_cancelled = false;
};

/**
 * @brief Default AnimationBackend used by ViewportGestureController.
 */
class QtAnimationBackend : public AnimationBackend
{
public:
    ViewportAnimation* createAnimation(const AnimationRequest& request,
                                       FrameCallback onFrame,
                                       FinishCallback onFinish) override;
};
