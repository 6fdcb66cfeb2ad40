#ifndef GEOMETRYSETTINGSMANAGER_H
#define GEOMETRYSETTINGSMANAGER_H

#include "Constants.h"
#include "geometry/HitTestController.h"

/**
 * @brief Singleton class for managing geometry kernel settings.
 *
 * Stored values outside their valid range are ignored and the default
 * is returned instead.
 */
class GeometrySettingsManager
{
public:
    static GeometrySettingsManager& instance();

    // Minimum distance for line, arrow and path hits
    qreal loadLineHitTolerance() const;
    void saveLineHitTolerance(qreal tolerance);

    // Chords used to approximate curved arrows when hit-testing
    int loadCurveSamples() const;
    void saveCurveSamples(int samples);

    // Group nesting depth before a cycle is assumed
    int loadMaxNestingDepth() const;
    void saveMaxNestingDepth(int depth);

    qreal loadHandleHitTolerance() const;
    void saveHandleHitTolerance(qreal tolerance);

    HitTestOptions loadHitTestOptions() const;

    // Default values
    static constexpr qreal kDefaultLineHitTolerance = LayerKit::HitTest::kMinLineTolerance;
    static constexpr int kDefaultCurveSamples = LayerKit::HitTest::kCurveSamples;
    static constexpr int kDefaultMaxNestingDepth = LayerKit::Groups::kMaxNestingDepth;
    static constexpr qreal kDefaultHandleHitTolerance = LayerKit::Handles::kHitTolerance;

private:
    GeometrySettingsManager() = default;
    GeometrySettingsManager(const GeometrySettingsManager&) = delete;
    GeometrySettingsManager& operator=(const GeometrySettingsManager&) = delete;

    static constexpr const char* kSettingsKeyLineHitTolerance = "geometry/lineHitTolerance";
    static constexpr const char* kSettingsKeyCurveSamples = "geometry/curveSamples";
    static constexpr const char* kSettingsKeyMaxNestingDepth = "geometry/maxNestingDepth";
    static constexpr const char* kSettingsKeyHandleHitTolerance = "geometry/handleHitTolerance";
};

#endif // GEOMETRYSETTINGSMANAGER_H
