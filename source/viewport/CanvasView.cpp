#include "CanvasView.h"
#include "../input/TouchInputHandler.h"
#include "../core/ViewportState.h"

#include <QPainter>
#include <QPaintEvent>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QKeyEvent>
#include <QTouchEvent>

CanvasView::CanvasView(QWidget* parent)
    : QWidget(parent)
{
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setAttribute(Qt::WA_AcceptTouchEvents, true);
    setFocusPolicy(Qt::StrongFocus);

    m_controller = new ViewportGestureController(nullptr, this);
    m_controller->applySettings(ViewportSettings::load());
    m_input = new TouchInputHandler(m_controller, this);

    connect(m_controller, &ViewportGestureController::viewportChanged, this, [this]() {
        update();
    });
    connect(m_controller, &ViewportGestureController::gestureStateChanged, this,
            [this](ViewportGestureController::GestureState state) {
        if (state == ViewportGestureController::GestureState::Idle) {
            unsetCursor();
        } else {
            setCursor(Qt::ClosedHandCursor);
        }
    });
}

void CanvasView::setSheetSize(const QSizeF& size)
{
    m_sheetSize = size;
    update();
}

void CanvasView::setGridSpacing(qreal spacing)
{
    if (spacing <= 0 || qFuzzyCompare(m_gridSpacing, spacing)) {
        return;
    }
    m_gridSpacing = spacing;
    update();
}

QPointF CanvasView::viewCenter() const
{
    return QPointF(width() / 2.0, height() / 2.0);
}

// ===== Commands =====

void CanvasView::zoomIn()
{
    m_controller->zoomIn(viewCenter());
}

void CanvasView::zoomOut()
{
    m_controller->zoomOut(viewCenter());
}

void CanvasView::resetView()
{
    m_controller->resetView();
}

// ===== Painting =====

void CanvasView::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), m_backgroundColor);

    const ViewportState* state = m_controller->state();

    painter.save();
    painter.translate(state->position());
    painter.scale(state->scale(), state->scale());

    QRectF sheet(QPointF(0, 0), m_sheetSize);
    painter.fillRect(sheet, Qt::white);

    // Cosmetic pen keeps grid lines 1px wide at any zoom
    QPen gridPen(m_gridColor, 0);
    painter.setPen(gridPen);
    for (qreal x = m_gridSpacing; x < m_sheetSize.width(); x += m_gridSpacing) {
        painter.drawLine(QPointF(x, 0), QPointF(x, m_sheetSize.height()));
    }
    for (qreal y = m_gridSpacing; y < m_sheetSize.height(); y += m_gridSpacing) {
        painter.drawLine(QPointF(0, y), QPointF(m_sheetSize.width(), y));
    }

    painter.setPen(QPen(QColor(180, 180, 180), 0));
    painter.drawRect(sheet);
    painter.restore();

    // Zoom indicator
    painter.setPen(Qt::white);
    painter.drawText(rect().adjusted(8, 8, -8, -8), Qt::AlignRight | Qt::AlignBottom,
                     QString("%1%").arg(qRound(state->scale() * 100)));
}

// ===== Input =====

bool CanvasView::event(QEvent* event)
{
    switch (event->type()) {
    case QEvent::TouchBegin:
    case QEvent::TouchUpdate:
    case QEvent::TouchEnd:
    case QEvent::TouchCancel:
        if (m_input->handleTouchEvent(static_cast<QTouchEvent*>(event))) {
            return true;
        }
        break;
    default:
        break;
    }
    return QWidget::event(event);
}

void CanvasView::mousePressEvent(QMouseEvent* event)
{
    if (!m_input->handleMousePress(event)) {
        QWidget::mousePressEvent(event);
    }
}

void CanvasView::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_input->handleMouseMove(event)) {
        QWidget::mouseMoveEvent(event);
    }
}

void CanvasView::mouseReleaseEvent(QMouseEvent* event)
{
    if (!m_input->handleMouseRelease(event)) {
        QWidget::mouseReleaseEvent(event);
    }
}

void CanvasView::wheelEvent(QWheelEvent* event)
{
    if (!m_input->handleWheelEvent(event)) {
        QWidget::wheelEvent(event);
    }
}

void CanvasView::keyPressEvent(QKeyEvent* event)
{
    switch (event->key()) {
    case Qt::Key_Plus:
    case Qt::Key_Equal:
        zoomIn();
        break;
    case Qt::Key_Minus:
        zoomOut();
        break;
    case Qt::Key_0:
        resetView();
        break;
    default:
        QWidget::keyPressEvent(event);
        return;
    }
    event->accept();
}

void CanvasView::hideEvent(QHideEvent* event)
{
    // Don't resume a half-finished gesture when shown again
    m_input->resetAllState();
    m_controller->cancelGesture();
    QWidget::hideEvent(event);
}
