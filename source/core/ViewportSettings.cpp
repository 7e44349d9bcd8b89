#include "ViewportSettings.h"

#include <QSettings>
#include <QDebug>
#include <QtMath>

// Zoom steps must be finite and greater than 1.0
static qreal sanitizeStep(qreal value, qreal fallback, const char* key)
{
    if (qIsFinite(value) && value > 1.0) {
        return value;
    }
    qWarning() << "ViewportSettings: ignoring invalid" << key << value;
    return fallback;
}

ViewportSettings ViewportSettings::load()
{
    QSettings settings("GlideView", "App");
    return load(settings);
}

ViewportSettings ViewportSettings::load(QSettings& settings)
{
    ViewportSettings result;

    settings.beginGroup("viewport");
    result.inertiaEnabled = settings.value("inertiaEnabled", true).toBool();
    result.wheelZoomStep = sanitizeStep(
        settings.value("wheelZoomStep", DEFAULT_WHEEL_ZOOM_STEP).toReal(),
        DEFAULT_WHEEL_ZOOM_STEP, "wheelZoomStep");
    result.buttonZoomStep = sanitizeStep(
        settings.value("buttonZoomStep", DEFAULT_BUTTON_ZOOM_STEP).toReal(),
        DEFAULT_BUTTON_ZOOM_STEP, "buttonZoomStep");
    settings.endGroup();

    return result;
}

void ViewportSettings::save() const
{
    QSettings settings("GlideView", "App");
    save(settings);
}

void ViewportSettings::save(QSettings& settings) const
{
    settings.beginGroup("viewport");
    settings.setValue("inertiaEnabled", inertiaEnabled);
    settings.setValue("wheelZoomStep", wheelZoomStep);
    settings.setValue("buttonZoomStep", buttonZoomStep);
    settings.endGroup();
}
