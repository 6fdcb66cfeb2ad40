#ifndef LAYERKIT_CONSTANTS_H
#define LAYERKIT_CONSTANTS_H

namespace LayerKit {

// ============================================================================
// TEXT MEASUREMENT (single-line heuristic)
// ============================================================================
namespace Text {
constexpr double kDefaultFontSize = 16.0;
constexpr double kLineHeightRatio = 1.2;       // height = fontSize * ratio
constexpr double kCharWidthRatio = 0.6;        // estimated glyph advance
constexpr double kFallbackWidthEms = 5.0;      // empty text width in fontSize units
}  // namespace Text

// ============================================================================
// SHAPE DEFAULTS
// ============================================================================
namespace Shape {
constexpr int kMinSides = 3;
constexpr int kDefaultPolygonSides = 6;
constexpr int kDefaultStarPoints = 5;
constexpr int kMaxSides = 1024;                // larger counts have no geometry
constexpr int kMaxStarPoints = 1024;
constexpr double kStarInnerRadiusRatio = 0.4;  // innerRadius when not given
}  // namespace Shape

// ============================================================================
// ARROWS
// ============================================================================
namespace Arrow {
constexpr double kDefaultArrowSize = 15.0;
constexpr double kDefaultStrokeWidth = 2.0;
constexpr double kDefaultHeadScale = 1.0;
constexpr double kHeadLengthRatio = 1.56;      // flank length vs. arrow size
constexpr double kHeadDepthRatio = 1.3;        // tip-to-shaft distance vs. arrow size
constexpr double kHeadHalfAngleDegrees = 30.0;
constexpr double kHeadThicknessRatio = 1.5;    // chevron/base thickness vs. half shaft
constexpr double kShaftSizeRatio = 0.4;        // shaft width vs. arrow size
constexpr double kShaftStrokeRatio = 1.5;      // shaft width vs. stroke width
constexpr double kMinShaftWidth = 4.0;
constexpr double kCurveThreshold = 1.0;        // control point offset that makes a curve
constexpr int kCurveSegments = 20;
}  // namespace Arrow

// ============================================================================
// HIT TESTING (layer units, zoom independent)
// ============================================================================
namespace HitTest {
constexpr double kMinLineTolerance = 6.0;
constexpr double kStrokePadding = 4.0;         // added to strokeWidth
constexpr int kCurveSamples = 20;
constexpr int kMinCurveSamples = 2;
constexpr int kMaxCurveSamples = 200;
}  // namespace HitTest

// ============================================================================
// SELECTION HANDLES
// ============================================================================
namespace Handles {
constexpr double kSize = 8.0;
constexpr double kRotationOffset = 20.0;
constexpr double kHitTolerance = 4.0;
}  // namespace Handles

// ============================================================================
// GROUP HIERARCHY
// ============================================================================
namespace Groups {
constexpr int kMaxNestingDepth = 3;
constexpr int kTraversalSlack = 5;             // extra levels before a cycle is assumed
constexpr int kMaxConfigurableDepth = 32;
}  // namespace Groups

}  // namespace LayerKit

#endif  // LAYERKIT_CONSTANTS_H
