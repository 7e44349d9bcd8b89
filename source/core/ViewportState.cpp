#include "ViewportState.h"

#include <QtMath>

ViewportState::ViewportState(QObject* parent)
    : QObject(parent)
{
}

qreal ViewportState::clampScale(qreal scale)
{
    if (qIsNaN(scale)) {
        return MIN_SCALE;
    }
    return qBound(MIN_SCALE, scale, MAX_SCALE);
}

QPointF ViewportState::screenToContent(QPointF screenPt) const
{
    return (screenPt - m_position) / m_scale;
}

QPointF ViewportState::contentToScreen(QPointF contentPt) const
{
    return contentPt * m_scale + m_position;
}

// ===== Setters =====

void ViewportState::setPosition(QPointF position)
{
    if (position == m_position) {
        return;
    }
    m_position = position;
    emit viewportChanged(m_position, m_scale);
}

void ViewportState::setScale(qreal scale)
{
    scale = clampScale(scale);
    if (qFuzzyCompare(m_scale, scale)) {
        return;
    }
    m_scale = scale;
    emit viewportChanged(m_position, m_scale);
}

void ViewportState::setTransform(QPointF position, qreal scale)
{
    scale = clampScale(scale);
    if (position == m_position && qFuzzyCompare(m_scale, scale)) {
        return;
    }
    m_position = position;
    m_scale = scale;
    emit viewportChanged(m_position, m_scale);
}

void ViewportState::zoomAroundPoint(qreal newScale, QPointF pivot)
{
    newScale = clampScale(newScale);

    // Content point under the pivot at the current scale
    QPointF contentPt = (pivot - m_position) / m_scale;

    // Keep it under the pivot at the new scale
    setTransform(pivot - contentPt * newScale, newScale);
}

void ViewportState::reset()
{
    setTransform(QPointF(0, 0), 1.0);
}
