#include "settings/GeometrySettingsManager.h"
#include "settings/Settings.h"
#include <QSettings>
#include <cmath>

GeometrySettingsManager& GeometrySettingsManager::instance()
{
    static GeometrySettingsManager instance;
    return instance;
}

qreal GeometrySettingsManager::loadLineHitTolerance() const
{
    auto settings = LayerKit::getSettings();
    bool ok = false;
    const qreal value = settings.value(kSettingsKeyLineHitTolerance, kDefaultLineHitTolerance).toDouble(&ok);
    if (ok && std::isfinite(value) && value >= 0.0) {
        return value;
    }
    return kDefaultLineHitTolerance;
}

void GeometrySettingsManager::saveLineHitTolerance(qreal tolerance)
{
    auto settings = LayerKit::getSettings();
    settings.setValue(kSettingsKeyLineHitTolerance, tolerance);
}

int GeometrySettingsManager::loadCurveSamples() const
{
    auto settings = LayerKit::getSettings();
    bool ok = false;
    const int value = settings.value(kSettingsKeyCurveSamples, kDefaultCurveSamples).toInt(&ok);
    if (ok && value >= LayerKit::HitTest::kMinCurveSamples && value <= LayerKit::HitTest::kMaxCurveSamples) {
        return value;
    }
    return kDefaultCurveSamples;
}

void GeometrySettingsManager::saveCurveSamples(int samples)
{
    auto settings = LayerKit::getSettings();
    settings.setValue(kSettingsKeyCurveSamples, samples);
}

int GeometrySettingsManager::loadMaxNestingDepth() const
{
    auto settings = LayerKit::getSettings();
    bool ok = false;
    const int value = settings.value(kSettingsKeyMaxNestingDepth, kDefaultMaxNestingDepth).toInt(&ok);
    if (ok && value >= 1 && value <= LayerKit::Groups::kMaxConfigurableDepth) {
        return value;
    }
    return kDefaultMaxNestingDepth;
}

void GeometrySettingsManager::saveMaxNestingDepth(int depth)
{
    auto settings = LayerKit::getSettings();
    settings.setValue(kSettingsKeyMaxNestingDepth, depth);
}

qreal GeometrySettingsManager::loadHandleHitTolerance() const
{
    auto settings = LayerKit::getSettings();
    bool ok = false;
    const qreal value = settings.value(kSettingsKeyHandleHitTolerance, kDefaultHandleHitTolerance).toDouble(&ok);
    if (ok && std::isfinite(value) && value >= 0.0) {
        return value;
    }
    return kDefaultHandleHitTolerance;
}

void GeometrySettingsManager::saveHandleHitTolerance(qreal tolerance)
{
    auto settings = LayerKit::getSettings();
    settings.setValue(kSettingsKeyHandleHitTolerance, tolerance);
}

HitTestOptions GeometrySettingsManager::loadHitTestOptions() const
{
    HitTestOptions options;
    options.minLineTolerance = loadLineHitTolerance();
    options.curveSamples = loadCurveSamples();
    return options;
}
