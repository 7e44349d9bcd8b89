#pragma once

// ============================================================================
// ViewportState - Authoritative position/scale of one canvas
// ============================================================================
// Screen mapping: a content point c is drawn at c * scale + position.
// Scale is clamped to [MIN_SCALE, MAX_SCALE] on every write.
// ============================================================================

#include <QObject>
#include <QPointF>

class ViewportState : public QObject
{
    Q_OBJECT

public:
    static constexpr qreal MIN_SCALE = 0.2;
    static constexpr qreal MAX_SCALE = 8.0;

    explicit ViewportState(QObject* parent = nullptr);

    QPointF position() const { return m_position; }
    qreal scale() const { return m_scale; }

    /**
     * @brief Clamp a scale value to the valid range.
     */
    static qreal clampScale(qreal scale);

    /**
     * @brief Map a screen point to content coordinates.
     */
    QPointF screenToContent(QPointF screenPt) const;

    /**
     * @brief Map a content point to screen coordinates.
     */
    QPointF contentToScreen(QPointF contentPt) const;

public slots:
    void setPosition(QPointF position);
    void setScale(qreal scale);

    /**
     * @brief Set position and scale together, emitting a single change.
     * @param position New position.
     * @param scale New scale (clamped).
     */
    void setTransform(QPointF position, qreal scale);

    /**
     * @brief Change scale while keeping the content under a pivot fixed.
     * @param newScale Requested scale (clamped).
     * @param pivot Screen point that must not move.
     */
    void zoomAroundPoint(qreal newScale, QPointF pivot);

    /**
     * @brief Return to position (0,0) at scale 1.0.
     */
    void reset();

signals:
    /**
     * @brief Emitted after any change to position or scale.
     */
    void viewportChanged(QPointF position, qreal scale);

private:
    QPointF m_position;
    qreal m_scale = 1.0;
};
