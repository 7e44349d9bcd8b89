#ifndef PINCHZOOMCONTROLLERTESTS_H
#define PINCHZOOMCONTROLLERTESTS_H

#include <QObject>
#include <QTest>
#include "PinchZoomController.h"
#include "InertiaController.h"
#include "../core/ViewportState.h"
#include "../animation/AnimationHandleGuard.h"
#include "../animation/FakeAnimationBackend.h"

/**
 * Unit tests for PinchZoomController.
 * Run with: glideview --test-pinch
 */
class PinchZoomControllerTests : public QObject {
    Q_OBJECT

private:
    struct Rig {
        FakeAnimationBackend backend;
        ViewportState state;
        AnimationHandleGuard guard{&backend};
        InertiaController inertia{&guard};
        PinchZoomController pinch{&state, &guard, &inertia};
    };

    static bool near(QPointF a, QPointF b, qreal tolerance = 1e-9) {
        return qAbs(a.x() - b.x()) <= tolerance && qAbs(a.y() - b.y()) <= tolerance;
    }

    // Two touches on a horizontal line, `distance` apart, centred at `center`
    static void touchesAround(QPointF center, qreal distance, QPointF& a, QPointF& b) {
        a = center - QPointF(distance / 2.0, 0);
        b = center + QPointF(distance / 2.0, 0);
    }

private slots:
    void testDoubleDistanceDoublesScale() {
        Rig rig;
        rig.pinch.start(QPointF(100, 200), QPointF(200, 200));
        QCOMPARE(rig.pinch.startDistance(), 100.0);
        QCOMPARE(rig.pinch.startCenter(), QPointF(150, 200));

        rig.pinch.move(QPointF(50, 200), QPointF(250, 200), 0.016);

        QCOMPARE(rig.pinch.mode(), PinchZoomController::Mode::Zoom);
        QCOMPARE(rig.state.scale(), 2.0);
        // Content point (150, 200) stays under the centre
        QCOMPARE(rig.state.position(), QPointF(-150, -200));
    }

    void testPivotInvariant_data() {
        QTest::addColumn<qreal>("scale0");
        QTest::addColumn<QPointF>("position0");
        QTest::addColumn<qreal>("distance0");
        QTest::addColumn<qreal>("distance1");
        QTest::addColumn<QPointF>("center1");

        QTest::newRow("zoom in from 1x") << 1.0 << QPointF(0, 0) << 100.0 << 200.0 << QPointF(150, 200);
        QTest::newRow("zoom out from 2x") << 2.0 << QPointF(-80, 35) << 200.0 << 120.0 << QPointF(320, 90);
        QTest::newRow("zoom in from 0.5x, moving centre") << 0.5 << QPointF(60, -40) << 80.0 << 300.0 << QPointF(41, 277);
        QTest::newRow("saturates at max") << 6.0 << QPointF(10, 10) << 50.0 << 150.0 << QPointF(200, 100);
    }

    void testPivotInvariant() {
        QFETCH(qreal, scale0);
        QFETCH(QPointF, position0);
        QFETCH(qreal, distance0);
        QFETCH(qreal, distance1);
        QFETCH(QPointF, center1);

        Rig rig;
        rig.state.setTransform(position0, scale0);

        QPointF a, b;
        touchesAround(QPointF(0, 0), distance0, a, b);
        rig.pinch.start(a, b);

        const QPointF contentBefore = rig.state.screenToContent(center1);

        touchesAround(center1, distance1, a, b);
        rig.pinch.move(a, b, 0.016);

        QCOMPARE(rig.pinch.mode(), PinchZoomController::Mode::Zoom);
        QVERIFY(rig.state.scale() >= ViewportState::MIN_SCALE);
        QVERIFY(rig.state.scale() <= ViewportState::MAX_SCALE);
        QVERIFY(near(rig.state.screenToContent(center1), contentBefore, 1e-6));
    }

    void testScaleSaturates() {
        {
            Rig rig;
            rig.state.setScale(0.5);
            rig.pinch.start(QPointF(0, 0), QPointF(200, 0));
            rig.pinch.move(QPointF(90, 0), QPointF(110, 0), 0.016);   // raw 0.05
            QCOMPARE(rig.state.scale(), ViewportState::MIN_SCALE);
        }
        {
            Rig rig;
            rig.state.setScale(5.0);
            rig.pinch.start(QPointF(0, 0), QPointF(50, 0));
            rig.pinch.move(QPointF(0, 0), QPointF(500, 0), 0.016);    // raw 50
            QCOMPARE(rig.state.scale(), ViewportState::MAX_SCALE);
        }
    }

    void testZoomIsRelativeToPinchStart() {
        Rig rig;
        rig.pinch.start(QPointF(0, 0), QPointF(100, 0));
        rig.pinch.move(QPointF(0, 0), QPointF(150, 0), 0.016);
        QCOMPARE(rig.state.scale(), 1.5);
        rig.pinch.move(QPointF(0, 0), QPointF(300, 0), 0.016);
        QCOMPARE(rig.state.scale(), 3.0);
    }

    void testDeadZonePans() {
        Rig rig;
        rig.state.setTransform(QPointF(5, 5), 1.5);
        rig.pinch.start(QPointF(0, 0), QPointF(100, 0));

        // Distance 103: inside the dead zone
        rig.pinch.move(QPointF(10, 20), QPointF(113, 20), 0.1);

        QCOMPARE(rig.pinch.mode(), PinchZoomController::Mode::Pan);
        QCOMPARE(rig.state.scale(), 1.5);
        // Centre moved from (50, 0) to (61.5, 20)
        QCOMPARE(rig.state.position(), QPointF(16.5, 25));
    }

    void testPanVelocityUsesDragSmoothing() {
        Rig rig;
        rig.pinch.start(QPointF(0, 0), QPointF(100, 0));

        rig.pinch.move(QPointF(10, 0), QPointF(110, 0), 0.1);     // 100 px/s
        QVERIFY(near(rig.pinch.velocity(), QPointF(80, 0), 1e-9));

        rig.pinch.move(QPointF(20, 0), QPointF(120, 0), 0.1);     // 0.8*100 + 0.2*80
        QVERIFY(near(rig.pinch.velocity(), QPointF(96, 0), 1e-9));

        // dt <= 0 leaves velocity unchanged but still moves the viewport
        rig.pinch.move(QPointF(30, 0), QPointF(130, 0), 0.0);
        QVERIFY(near(rig.pinch.velocity(), QPointF(96, 0), 1e-9));
        QCOMPARE(rig.state.position(), QPointF(30, 0));
    }

    void testPanEndLaunchesInertia() {
        Rig rig;
        rig.pinch.start(QPointF(0, 0), QPointF(100, 0));
        rig.pinch.move(QPointF(10, 0), QPointF(110, 0), 0.1);

        QVector<QPointF> frames;
        QVERIFY(rig.pinch.end(rig.state.position(),
                              [&frames](QPointF p) { frames.append(p); }));
        QVERIFY(!rig.pinch.isActive());
        QCOMPARE(rig.backend.requests.size(), 1);
        QCOMPARE(rig.backend.requests.first().from, QPointF(10, 0));
        QVERIFY(near(rig.backend.requests.first().to, QPointF(10 + 80 * 0.3, 0), 1e-9));
    }

    void testZoomEndHasNoMomentum() {
        Rig rig;
        rig.pinch.start(QPointF(0, 0), QPointF(100, 0));
        rig.pinch.move(QPointF(10, 0), QPointF(110, 0), 0.1);    // pan builds velocity
        rig.pinch.move(QPointF(0, 0), QPointF(200, 0), 0.1);     // then zoom

        QVERIFY(!rig.pinch.end(rig.state.position(), [](QPointF) {}));
        QVERIFY(rig.backend.requests.isEmpty());
    }

    void testStartStopsRunningAnimation() {
        Rig rig;
        QVERIFY(rig.inertia.onRelease(QPointF(0, 0), QPointF(500, 0), [](QPointF) {}));
        FakeAnimation* glide = rig.backend.last();

        rig.pinch.start(QPointF(0, 0), QPointF(100, 0));
        QVERIFY(!rig.guard.hasHandle());
        QCOMPARE(glide->cancelCount, 1);
    }

    void testCoincidentTouchesDoNotStartPinch() {
        Rig rig;
        rig.state.setTransform(QPointF(12, -7), 1.5);

        QVERIFY(!rig.pinch.start(QPointF(50, 50), QPointF(50, 50)));
        QVERIFY(!rig.pinch.isActive());

        rig.pinch.move(QPointF(0, 50), QPointF(100, 50), 0.016);
        QCOMPARE(rig.state.scale(), 1.5);
        QCOMPARE(rig.state.position(), QPointF(12, -7));
    }

    void testFingersMeetingMidPinchIsSkipped() {
        Rig rig;
        QVERIFY(rig.pinch.start(QPointF(0, 0), QPointF(100, 0)));

        rig.pinch.move(QPointF(50, 0), QPointF(50, 0), 0.016);
        QCOMPARE(rig.state.scale(), 1.0);
        QCOMPARE(rig.state.position(), QPointF(0, 0));

        // Spreading again zooms relative to the original start distance
        rig.pinch.move(QPointF(0, 0), QPointF(200, 0), 0.016);
        QCOMPARE(rig.state.scale(), 2.0);
    }

    void testMoveWithoutStartIsIgnored() {
        Rig rig;
        rig.pinch.move(QPointF(0, 0), QPointF(300, 0), 0.016);
        QCOMPARE(rig.state.scale(), 1.0);
        QCOMPARE(rig.state.position(), QPointF(0, 0));
        QVERIFY(!rig.pinch.end(QPointF(0, 0), [](QPointF) {}));
    }
};

#endif // PINCHZOOMCONTROLLERTESTS_H
