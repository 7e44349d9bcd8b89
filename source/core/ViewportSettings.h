#pragma once

// ============================================================================
// ViewportSettings - Persistent viewport preferences
// ============================================================================
// Stored with QSettings("GlideView", "App") under the "viewport/" group.
// ============================================================================

#include <QtGlobal>

class QSettings;

struct ViewportSettings {
    static constexpr qreal DEFAULT_WHEEL_ZOOM_STEP = 1.05;
    static constexpr qreal DEFAULT_BUTTON_ZOOM_STEP = 1.2;

    bool inertiaEnabled = true;                         ///< Glide after drag/pan release
    qreal wheelZoomStep = DEFAULT_WHEEL_ZOOM_STEP;      ///< Scale factor per wheel notch
    qreal buttonZoomStep = DEFAULT_BUTTON_ZOOM_STEP;    ///< Scale factor per zoom command

    /**
     * @brief Load from the application settings store.
     */
    static ViewportSettings load();

    /**
     * @brief Load from an explicit settings object.
     */
    static ViewportSettings load(QSettings& settings);

    void save() const;
    void save(QSettings& settings) const;
};
