// ============================================================================
// qt_compat.h - Qt5 / Qt6 compatibility shims for GlideView
// ============================================================================
// Include this header in .cpp files that read touch points or pointer
// positions from input events.
// ============================================================================
#pragma once

#include <QtCore/qglobal.h>
#include <QTouchEvent>

// ============================================================================
// Touch-point types
// ============================================================================
// Qt6: QEventPoint, event->points(), pt.position(), QEventPoint::State enum
// Qt5: QTouchEvent::TouchPoint, event->touchPoints(), pt.pos(), Qt::TouchPointState
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  include <QEventPoint>
   using GV_TouchPoint = QEventPoint;
#  define GV_TOUCH_POINTS(event)   (event)->points()
#  define GV_TP_POS(pt)            (pt).position()
#  define GV_TP_STATE(pt)          (pt).state()
#  define GV_TP_RELEASED           QEventPoint::Released
#else
   using GV_TouchPoint = QTouchEvent::TouchPoint;
#  define GV_TOUCH_POINTS(event)   (event)->touchPoints()
#  define GV_TP_POS(pt)            (pt).pos()
#  define GV_TP_STATE(pt)          (pt).state()
#  define GV_TP_RELEASED           Qt::TouchPointReleased
#endif

// ============================================================================
// Pointer event position (QPointF)
// ============================================================================
// Qt6 unified all events under QSinglePointEvent::position().
// Qt5 QMouseEvent uses localPos().
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  define GV_MOUSE_POS(event)    (event)->position()
#else
#  define GV_MOUSE_POS(event)    (event)->localPos()
#endif
// QWheelEvent::position() exists since Qt 5.14, so works in both Qt5.15 and Qt6.
#define GV_WHEEL_POS(event)      (event)->position()
