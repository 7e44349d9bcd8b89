// ============================================================================
// GlideView - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QTest>
#include <QDebug>

#include "viewport/CanvasView.h"

#ifdef Q_OS_WIN
#include <windows.h>
#endif

#include "core/PointerSignalTrackerTests.h"
#include "core/ViewportStateTests.h"
#include "animation/AnimationHandleGuardTests.h"
#include "gestures/InertiaControllerTests.h"
#include "gestures/PinchZoomControllerTests.h"
#include "gestures/ViewportGestureControllerTests.h"

// ============================================================================
// Test Runners
// ============================================================================

template <typename Suite>
static int runQtTestSuite()
{
    Suite suite;
    return QTest::qExec(&suite);
}

static int runTests(const QString& testType)
{
#ifdef Q_OS_WIN
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#endif

    const bool all = (testType == "all");
    int failures = 0;

    if (all || testType == "tracker") {
        failures += PointerSignalTrackerTests::runAllTests() ? 0 : 1;
    }
    if (all || testType == "viewport") {
        failures += runQtTestSuite<ViewportStateTests>();
    }
    if (all || testType == "guard") {
        failures += runQtTestSuite<AnimationHandleGuardTests>();
    }
    if (all || testType == "inertia") {
        failures += runQtTestSuite<InertiaControllerTests>();
    }
    if (all || testType == "pinch") {
        failures += runQtTestSuite<PinchZoomControllerTests>();
    }
    if (all || testType == "gestures") {
        failures += runQtTestSuite<ViewportGestureControllerTests>();
    }

    if (all) {
        qDebug() << "";
        qDebug() << (failures == 0 ? "=== ALL SUITES PASSED ===" : "=== SOME SUITES FAILED ===");
    }

    return failures == 0 ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("GlideView");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--test-tracker") {
            testToRun = "tracker";
        } else if (arg == "--test-viewport") {
            testToRun = "viewport";
        } else if (arg == "--test-guard") {
            testToRun = "guard";
        } else if (arg == "--test-inertia") {
            testToRun = "inertia";
        } else if (arg == "--test-pinch") {
            testToRun = "pinch";
        } else if (arg == "--test-gestures") {
            testToRun = "gestures";
        } else if (arg == "--test-all") {
            testToRun = "all";
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Launch Application ==========
    auto* view = new CanvasView();
    view->setAttribute(Qt::WA_DeleteOnClose);
    view->setWindowTitle(QStringLiteral("GlideView"));
    view->resize(1024, 720);
    view->show();

    return app.exec();
}
