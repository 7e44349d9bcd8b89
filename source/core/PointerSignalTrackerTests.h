#pragma once

// ============================================================================
// PointerSignalTrackerTests - Unit tests for velocity estimation
// ============================================================================
// Run with: glideview --test-tracker
// ============================================================================

#include "PointerSignalTracker.h"
#include <QDebug>
#include <QtMath>
#include <limits>

namespace PointerSignalTrackerTests {

inline bool fuzzyEqual(qreal a, qreal b)
{
    return qAbs(a - b) <= 1e-9 * qMax(1.0, qMax(qAbs(a), qAbs(b)));
}

/**
 * @brief Velocity and magnitude are zero right after start().
 */
inline bool testStartResetsVelocity()
{
    qDebug() << "=== Test: start() resets velocity ===";

    PointerSignalTracker tracker;
    tracker.start(QPointF(0, 0), 0.0);
    tracker.update(QPointF(30, 40), 0.1);

    if (tracker.magnitude() <= 0) {
        qDebug() << "FAIL: velocity should be non-zero after movement";
        return false;
    }

    tracker.start(QPointF(10, 10), 5.0);
    if (tracker.velocity() != QPointF(0, 0) || tracker.magnitude() != 0.0) {
        qDebug() << "FAIL: velocity not reset by start()";
        return false;
    }
    if (tracker.lastPosition() != QPointF(10, 10) || tracker.lastTimestamp() != 5.0) {
        qDebug() << "FAIL: start() did not record the sample";
        return false;
    }

    qDebug() << "PASS";
    return true;
}

/**
 * @brief Smoothing is 0.8 * instant + 0.2 * previous.
 */
inline bool testExponentialSmoothing()
{
    qDebug() << "=== Test: exponential smoothing ===";

    PointerSignalTracker tracker;
    tracker.start(QPointF(0, 0), 0.0);

    // 50 px over 0.1 s = 500 px/s, first sample: 0.8 * 500 = 400
    tracker.update(QPointF(50, 0), 0.1);
    if (!fuzzyEqual(tracker.velocity().x(), 400.0) || tracker.velocity().y() != 0.0) {
        qDebug() << "FAIL: first sample velocity" << tracker.velocity();
        return false;
    }

    // Second sample at 500 px/s: 0.8 * 500 + 0.2 * 400 = 480
    tracker.update(QPointF(100, 0), 0.2);
    if (!fuzzyEqual(tracker.velocity().x(), 480.0)) {
        qDebug() << "FAIL: second sample velocity" << tracker.velocity();
        return false;
    }

    if (!(tracker.magnitude() > 50.0)) {
        qDebug() << "FAIL: release speed should exceed the inertia threshold";
        return false;
    }

    qDebug() << "PASS";
    return true;
}

/**
 * @brief dt <= 0 leaves velocity unchanged and never produces NaN/Inf.
 */
inline bool testNonPositiveDt()
{
    qDebug() << "=== Test: non-positive dt ===";

    PointerSignalTracker tracker;
    tracker.start(QPointF(0, 0), 1.0);
    tracker.update(QPointF(20, 10), 1.1);
    const QPointF before = tracker.velocity();

    // Duplicate timestamp
    tracker.update(QPointF(500, 500), 1.1);
    // Out-of-order timestamp
    tracker.update(QPointF(-300, 40), 0.5);
    // NaN timestamp
    tracker.update(QPointF(7, 7), std::numeric_limits<qreal>::quiet_NaN());

    if (tracker.velocity() != before) {
        qDebug() << "FAIL: velocity changed on dt <= 0:" << tracker.velocity() << "expected" << before;
        return false;
    }
    if (!qIsFinite(tracker.velocity().x()) || !qIsFinite(tracker.velocity().y())) {
        qDebug() << "FAIL: non-finite velocity";
        return false;
    }

    // Last sample is still recorded
    if (tracker.lastPosition() != QPointF(7, 7)) {
        qDebug() << "FAIL: last position not updated";
        return false;
    }

    qDebug() << "PASS";
    return true;
}

/**
 * @brief magnitude() is the Euclidean norm and never negative.
 */
inline bool testMagnitude()
{
    qDebug() << "=== Test: magnitude ===";

    PointerSignalTracker tracker;
    tracker.start(QPointF(0, 0), 0.0);
    if (tracker.magnitude() != 0.0) {
        qDebug() << "FAIL: magnitude should be exactly 0 after start";
        return false;
    }

    // Moving left and up: components negative, magnitude positive
    tracker.update(QPointF(-30, -40), 1.0);
    // velocity = 0.8 * (-30, -40) = (-24, -32), |v| = 40
    if (!fuzzyEqual(tracker.magnitude(), 40.0)) {
        qDebug() << "FAIL: magnitude" << tracker.magnitude() << "expected 40";
        return false;
    }

    if (!fuzzyEqual(PointerSignalTracker::magnitudeOf(QPointF(3, -4)), 5.0)) {
        qDebug() << "FAIL: magnitudeOf(3,-4)";
        return false;
    }

    qDebug() << "PASS";
    return true;
}

/**
 * @brief Velocity halves per idle interval; short pauses keep it.
 */
inline bool testIdleDecay()
{
    qDebug() << "=== Test: idle decay ===";

    PointerSignalTracker tracker;
    tracker.start(QPointF(0, 0), 0.0);
    tracker.update(QPointF(50, 0), 0.1);     // 400 px/s

    tracker.decayIdle(0.12);
    if (!fuzzyEqual(tracker.velocity().x(), 400.0)) {
        qDebug() << "FAIL: 20 ms pause changed velocity to" << tracker.velocity().x();
        return false;
    }

    tracker.decayIdle(0.21);
    if (!fuzzyEqual(tracker.velocity().x(), 100.0)) {
        qDebug() << "FAIL: 110 ms pause gave" << tracker.velocity().x() << "expected 100";
        return false;
    }
    if (tracker.lastTimestamp() != 0.1 || tracker.lastPosition() != QPointF(50, 0)) {
        qDebug() << "FAIL: decayIdle() moved the last sample";
        return false;
    }

    tracker.start(QPointF(0, 0), 0.0);
    tracker.update(QPointF(50, 0), 0.1);
    tracker.decayIdle(2.1);
    if (tracker.magnitude() > 1e-6) {
        qDebug() << "FAIL: velocity survived a 2 s hold:" << tracker.magnitude();
        return false;
    }

    qDebug() << "PASS";
    return true;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running PointerSignalTracker Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testStartResetsVelocity();
    allPass &= testExponentialSmoothing();
    allPass &= testNonPositiveDt();
    allPass &= testMagnitude();
    allPass &= testIdleDecay();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PointerSignalTrackerTests
