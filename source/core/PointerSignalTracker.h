#pragma once

// ============================================================================
// PointerSignalTracker - Smoothed velocity from timestamped positions
// ============================================================================

#include <QPointF>

/**
 * @brief Estimates pointer velocity with exponential smoothing.
 *
 * velocity = 0.8 * instant + 0.2 * previous, where instant = delta / dt.
 * Samples with dt <= 0 (duplicate or out-of-order timestamps) update the
 * last position and time but leave the velocity untouched.
 *
 * Units follow the caller: positions in viewport pixels and time in
 * seconds give a velocity in pixels per second.
 */
class PointerSignalTracker
{
public:
    static constexpr qreal INSTANT_WEIGHT = 0.8;
    static constexpr qreal HISTORY_WEIGHT = 0.2;
    static constexpr qreal IDLE_INTERVAL = 0.05;    ///< Seconds without movement per halving

    /**
     * @brief Begin tracking a new gesture at a position.
     */
    void start(QPointF position, qreal timestamp);

    /**
     * @brief Feed the next sample.
     */
    void update(QPointF position, qreal timestamp);

    /**
     * @brief Blend a displacement over an interval into the velocity.
     * @param delta Displacement covered during dt.
     * @param dt Interval length; values <= 0 are ignored.
     */
    void accumulate(QPointF delta, qreal dt);

    /**
     * @brief Halve the velocity for every IDLE_INTERVAL since the last sample.
     *
     * For a pointer that stopped moving before it was released. The last
     * sample itself is unchanged.
     */
    void decayIdle(qreal timestamp);

    /**
     * @brief Forget the velocity without touching the last sample.
     */
    void resetVelocity() { m_velocity = QPointF(0, 0); }

    QPointF velocity() const { return m_velocity; }
    QPointF lastPosition() const { return m_lastPosition; }
    qreal lastTimestamp() const { return m_lastTimestamp; }

    /**
     * @brief Euclidean norm of the velocity.
     */
    qreal magnitude() const;

    static qreal magnitudeOf(QPointF v);

private:
    QPointF m_lastPosition;
    qreal m_lastTimestamp = 0.0;
    QPointF m_velocity;
};
