#pragma once

// ============================================================================
// SessionConfig - Tunables for a selection session
// ============================================================================
// Every value has a compiled default. load() overlays whatever the user has
// stored in QSettings("BlockCrop", "App"); missing or invalid keys keep the
// default.
// ============================================================================

#include <QtGlobal>

struct SessionConfig {
    // ===== Rendering =====
    qreal referenceDpi = 130;       ///< DPI shown at zoom 1.0
    qreal minRenderDpi = 72;        ///< Lower bound for view rasterization
    qreal maxRenderDpi = 1200;      ///< Upper bound (memory guard at high zoom)
    qreal exportDpi = 300;          ///< Default export DPI when nothing is cached

    // ===== View =====
    qreal minZoom = 0.1;
    qreal maxZoom = 5.0;

    // ===== Interaction (view pixels) =====
    qreal dragThreshold = 4;        ///< Smaller drags count as clicks
    qreal deleteTolerance = 6;      ///< Max secondary-button travel for delete

    // ===== Export =====
    int separatorMargin = 16;       ///< Gap between stacked group segments (pixels)

    // ===== Cache =====
    int cacheCapacity = 6;          ///< Max pages held by PageRasterCache

    /**
     * @brief Load settings, falling back to defaults for missing keys.
     */
    static SessionConfig load();
};
