#pragma once

// ============================================================================
// CanvasView - Widget host for a gesture-driven viewport
// ============================================================================
// Paints a grid sheet under the current viewport transform and routes
// touch, mouse, wheel and key input to its own ViewportGestureController.
// Each CanvasView has an independent controller.
// ============================================================================

#include "../gestures/ViewportGestureController.h"

#include <QWidget>
#include <QColor>
#include <QSizeF>

class TouchInputHandler;
class QPaintEvent;
class QMouseEvent;
class QWheelEvent;
class QKeyEvent;
class QHideEvent;

class CanvasView : public QWidget {
    Q_OBJECT

public:
    explicit CanvasView(QWidget* parent = nullptr);
    ~CanvasView() override = default;

    ViewportGestureController* controller() const { return m_controller; }
    TouchInputHandler* inputHandler() const { return m_input; }

    /**
     * @brief Size of the grid sheet in content units.
     */
    void setSheetSize(const QSizeF& size);
    QSizeF sheetSize() const { return m_sheetSize; }

    void setGridSpacing(qreal spacing);

public slots:
    void zoomIn();
    void zoomOut();
    void resetView();

protected:
    bool event(QEvent* event) override;
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void hideEvent(QHideEvent* event) override;

private:
    QPointF viewCenter() const;

    ViewportGestureController* m_controller = nullptr;
    TouchInputHandler* m_input = nullptr;

    QSizeF m_sheetSize = QSizeF(2000, 1400);
    qreal m_gridSpacing = 50.0;
    QColor m_gridColor = QColor(200, 200, 220);
    QColor m_backgroundColor = QColor(64, 64, 64);
};
