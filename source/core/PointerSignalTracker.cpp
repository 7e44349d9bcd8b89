#include "PointerSignalTracker.h"

#include <QtMath>
#include <cmath>

void PointerSignalTracker::start(QPointF position, qreal timestamp)
{
    m_lastPosition = position;
    m_lastTimestamp = timestamp;
    m_velocity = QPointF(0, 0);
}

void PointerSignalTracker::update(QPointF position, qreal timestamp)
{
    accumulate(position - m_lastPosition, timestamp - m_lastTimestamp);

    m_lastPosition = position;
    m_lastTimestamp = timestamp;
}

void PointerSignalTracker::accumulate(QPointF delta, qreal dt)
{
    // !(dt > 0) also rejects NaN
    if (!(dt > 0.0)) {
        return;
    }

    QPointF instant = delta / dt;
    if (!qIsFinite(instant.x()) || !qIsFinite(instant.y())) {
        return;
    }

    m_velocity = INSTANT_WEIGHT * instant + HISTORY_WEIGHT * m_velocity;
}

void PointerSignalTracker::decayIdle(qreal timestamp)
{
    const qreal idle = timestamp - m_lastTimestamp;
    if (!(idle > IDLE_INTERVAL)) {
        return;
    }

    const qreal halvings = std::floor(idle / IDLE_INTERVAL);
    m_velocity *= std::pow(0.5, halvings);
}

qreal PointerSignalTracker::magnitude() const
{
    return magnitudeOf(m_velocity);
}

qreal PointerSignalTracker::magnitudeOf(QPointF v)
{
    return std::sqrt(v.x() * v.x() + v.y() * v.y());
}
