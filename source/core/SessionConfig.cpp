#include "SessionConfig.h"

#include <QSettings>
#include <QDebug>

namespace {

// Read a positive number, keeping the default for anything else.
qreal readPositive(const QSettings& settings, const QString& key, qreal fallback)
{
    bool ok = false;
    qreal value = settings.value(key, fallback).toDouble(&ok);
    if (!ok || value <= 0) {
        qWarning() << "SessionConfig: Ignoring invalid value for" << key;
        return fallback;
    }
    return value;
}

} // namespace

SessionConfig SessionConfig::load()
{
    SessionConfig config;
    QSettings settings("BlockCrop", "App");

    settings.beginGroup("render");
    config.referenceDpi = readPositive(settings, "referenceDpi", config.referenceDpi);
    config.minRenderDpi = readPositive(settings, "minDpi", config.minRenderDpi);
    config.maxRenderDpi = readPositive(settings, "maxDpi", config.maxRenderDpi);
    config.exportDpi = readPositive(settings, "exportDpi", config.exportDpi);
    settings.endGroup();

    if (config.maxRenderDpi < config.minRenderDpi) {
        qWarning() << "SessionConfig: maxDpi below minDpi, using defaults";
        config.minRenderDpi = SessionConfig().minRenderDpi;
        config.maxRenderDpi = SessionConfig().maxRenderDpi;
    }

    settings.beginGroup("view");
    config.minZoom = readPositive(settings, "minZoom", config.minZoom);
    config.maxZoom = readPositive(settings, "maxZoom", config.maxZoom);
    settings.endGroup();

    if (config.maxZoom < config.minZoom) {
        config.minZoom = SessionConfig().minZoom;
        config.maxZoom = SessionConfig().maxZoom;
    }

    settings.beginGroup("interaction");
    config.dragThreshold = readPositive(settings, "dragThreshold", config.dragThreshold);
    config.deleteTolerance = readPositive(settings, "deleteTolerance", config.deleteTolerance);
    settings.endGroup();

    // Margin may legitimately be 0
    config.separatorMargin = qMax(0, settings.value("export/separatorMargin", config.separatorMargin).toInt());
    config.cacheCapacity = qBound(1, settings.value("cache/capacity", config.cacheCapacity).toInt(), 64);

    return config;
}
