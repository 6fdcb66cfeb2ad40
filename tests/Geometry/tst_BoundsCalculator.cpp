#include <QtTest/QtTest>
#include <cmath>
#include <limits>
#include <QtMath>
#include "geometry/BoundsCalculator.h"
#include "geometry/PolygonGeometry.h"

namespace {

Layer makeRect(qreal x, qreal y, qreal width, qreal height)
{
    Layer layer;
    layer.type = LayerType::Rectangle;
    layer.x = x;
    layer.y = y;
    layer.width = width;
    layer.height = height;
    return layer;
}

Layer makeLine(qreal x1, qreal y1, qreal x2, qreal y2)
{
    Layer layer;
    layer.type = LayerType::Line;
    layer.x1 = x1;
    layer.y1 = y1;
    layer.x2 = x2;
    layer.y2 = y2;
    return layer;
}

Layer makeEllipse(qreal x, qreal y, qreal radiusX, qreal radiusY)
{
    Layer layer;
    layer.type = LayerType::Ellipse;
    layer.x = x;
    layer.y = y;
    layer.radiusX = radiusX;
    layer.radiusY = radiusY;
    return layer;
}

Layer makeCircle(qreal x, qreal y, qreal radius)
{
    Layer layer;
    layer.type = LayerType::Circle;
    layer.x = x;
    layer.y = y;
    layer.radius = radius;
    return layer;
}

bool approx(qreal a, qreal b, qreal epsilon = 1e-3)
{
    return qAbs(a - b) < epsilon;
}

qreal area(const QRectF& rect)
{
    return rect.width() * rect.height();
}

} // namespace

/**
 * @brief Tests for BoundsCalculator
 *
 * Covers:
 * - Per-type bounds (rectangular, line, ellipse, polygon, star, text)
 * - Normalization of negative extents
 * - Missing and non-finite fields
 * - Merge, intersection, containment, expand and center
 */
class TestBoundsCalculator : public QObject
{
    Q_OBJECT

private slots:
    // Rectangular bounds
    void testRectangle_Basic();
    void testRectangle_NegativeWidth();
    void testRectangle_NegativeHeight();
    void testRectangle_ZeroSize();
    void testRectangle_MissingWidth();
    void testRectangle_NonFiniteField();
    void testRectangularVariants_UseSameBounds();

    // Line bounds
    void testLine_SwappedEndpoints();
    void testLine_MissingCoordinate();
    void testArrow_UsesEndpoints();

    // Ellipse and circle bounds
    void testEllipse_Scenario();
    void testCircle_Radius();
    void testEllipse_RadiusXOnly();
    void testEllipse_RadiusXOverridesRadius();
    void testEllipse_NegativeRadius();
    void testEllipse_NoRadius();
    void testEllipse_MissingCenter();

    // Polygon, path and star bounds
    void testPolygon_PointsEnvelope();
    void testPolygon_SinglePoint();
    void testPolygon_SkipsIncompletePoints();
    void testPath_Envelope();
    void testPolygon_RegularFromRadius();
    void testStar_FromRadii();
    void testStar_MissingRadius();
    void testStar_TooManyPoints();

    // Text bounds
    void testText_EstimatedWidth();
    void testText_ExplicitSize();
    void testText_WidthOnlyKeepsBaseline();
    void testText_DefaultFontSize();
    void testText_NonPositiveFontSize();
    void testText_WrongType();
    void testText_MissingPosition();

    // No-geometry types
    void testGroup_NoBounds();
    void testUnknown_NoBounds();

    // Properties
    void testNormalization_Idempotent();
    void testContainment_CircleInsideBounds();
    void testContainment_EllipseInsideBounds();
    void testContainment_PolygonsInsideBounds();

    // Set algebra
    void testMerge_Empty();
    void testMerge_AllNull();
    void testMerge_Singleton();
    void testMerge_IgnoresNull();
    void testMerge_ContainsInputs();
    void testMerge_KeepsZeroSizeEntries();
    void testMultiLayerBounds();
    void testMultiLayerBounds_NoneMeasurable();
    void testPointInBounds_InclusiveEdges();
    void testPointInBounds_Outside();
    void testPointInBounds_Null();
    void testIntersect_Overlap();
    void testIntersect_TouchingEdges();
    void testIntersect_Separated();
    void testIntersect_Null();
    void testExpand_Grow();
    void testExpand_Shrink();
    void testExpand_ShrinkPastCenter();
    void testExpand_NonFiniteAmount();
    void testCenter();
    void testCenter_Null();
};

// ============================================================================
// Rectangular Bounds Tests
// ============================================================================

void TestBoundsCalculator::testRectangle_Basic()
{
    auto bounds = BoundsCalculator::getLayerBounds(makeRect(10, 20, 100, 50));
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(10, 20, 100, 50));
}

void TestBoundsCalculator::testRectangle_NegativeWidth()
{
    auto bounds = BoundsCalculator::getLayerBounds(makeRect(110, 20, -100, 50));
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(10, 20, 100, 50));
}

void TestBoundsCalculator::testRectangle_NegativeHeight()
{
    auto bounds = BoundsCalculator::getLayerBounds(makeRect(10, 80, 40, -60));
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(10, 20, 40, 60));
}

void TestBoundsCalculator::testRectangle_ZeroSize()
{
    auto bounds = BoundsCalculator::getLayerBounds(makeRect(10, 20, 0, 0));
    QVERIFY(bounds.has_value());
    QCOMPARE(bounds->x(), 10.0);
    QCOMPARE(bounds->y(), 20.0);
    QCOMPARE(bounds->width(), 0.0);
    QCOMPARE(bounds->height(), 0.0);
}

void TestBoundsCalculator::testRectangle_MissingWidth()
{
    Layer layer = makeRect(10, 20, 100, 50);
    layer.width.reset();
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

void TestBoundsCalculator::testRectangle_NonFiniteField()
{
    Layer layer = makeRect(10, 20, 100, 50);
    layer.height = std::numeric_limits<qreal>::quiet_NaN();
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());

    layer.height = 50;
    layer.x = std::numeric_limits<qreal>::infinity();
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

void TestBoundsCalculator::testRectangularVariants_UseSameBounds()
{
    const QList<LayerType> types = {LayerType::Blur, LayerType::TextBox, LayerType::Image};
    for (LayerType type : types) {
        Layer layer = makeRect(30, 40, -20, 10);
        layer.type = type;
        auto bounds = BoundsCalculator::getLayerBounds(layer);
        QVERIFY(bounds.has_value());
        QCOMPARE(*bounds, QRectF(10, 40, 20, 10));
    }
}

// ============================================================================
// Line Bounds Tests
// ============================================================================

void TestBoundsCalculator::testLine_SwappedEndpoints()
{
    auto bounds = BoundsCalculator::getLayerBounds(makeLine(100, 80, 10, 20));
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(10, 20, 90, 60));
}

void TestBoundsCalculator::testLine_MissingCoordinate()
{
    Layer layer = makeLine(0, 0, 10, 10);
    layer.y2.reset();
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

void TestBoundsCalculator::testArrow_UsesEndpoints()
{
    Layer layer = makeLine(50, 50, 0, 100);
    layer.type = LayerType::Arrow;
    layer.arrowSize = 40;
    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(0, 50, 50, 50));
}

// ============================================================================
// Ellipse Bounds Tests
// ============================================================================

void TestBoundsCalculator::testEllipse_Scenario()
{
    auto bounds = BoundsCalculator::getLayerBounds(makeEllipse(50, 50, 40, 20));
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(10, 30, 80, 40));
}

void TestBoundsCalculator::testCircle_Radius()
{
    auto bounds = BoundsCalculator::getLayerBounds(makeCircle(100, 100, 25));
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(75, 75, 50, 50));
}

void TestBoundsCalculator::testEllipse_RadiusXOnly()
{
    Layer layer;
    layer.type = LayerType::Ellipse;
    layer.x = 50;
    layer.y = 50;
    layer.radiusX = 10;

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(bounds->x(), 40.0);
    QCOMPARE(bounds->y(), 50.0);
    QCOMPARE(bounds->width(), 20.0);
    QCOMPARE(bounds->height(), 0.0);
}

void TestBoundsCalculator::testEllipse_RadiusXOverridesRadius()
{
    Layer layer = makeCircle(50, 50, 10);
    layer.type = LayerType::Ellipse;
    layer.radiusX = 30;

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(20, 40, 60, 20));
}

void TestBoundsCalculator::testEllipse_NegativeRadius()
{
    auto bounds = BoundsCalculator::getLayerBounds(makeEllipse(0, 0, -10, -5));
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(-10, -5, 20, 10));
}

void TestBoundsCalculator::testEllipse_NoRadius()
{
    Layer layer;
    layer.type = LayerType::Circle;
    layer.x = 50;
    layer.y = 50;
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

void TestBoundsCalculator::testEllipse_MissingCenter()
{
    Layer layer = makeCircle(50, 50, 10);
    layer.y.reset();
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

// ============================================================================
// Polygon Bounds Tests
// ============================================================================

void TestBoundsCalculator::testPolygon_PointsEnvelope()
{
    Layer layer;
    layer.type = LayerType::Polygon;
    layer.points = {PointRecord(0, 0), PointRecord(10, 5), PointRecord(-5, 20)};

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(-5, 0, 15, 20));
}

void TestBoundsCalculator::testPolygon_SinglePoint()
{
    Layer layer;
    layer.type = LayerType::Polygon;
    layer.points = {PointRecord(10, 10)};
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());

    layer.type = LayerType::Path;
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

void TestBoundsCalculator::testPolygon_SkipsIncompletePoints()
{
    PointRecord xOnly;
    xOnly.x = 100;

    Layer layer;
    layer.type = LayerType::Polygon;
    layer.points = {PointRecord(0, 0), xOnly, PointRecord(10, 10)};

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(0, 0, 10, 10));
}

void TestBoundsCalculator::testPath_Envelope()
{
    Layer layer;
    layer.type = LayerType::Path;
    layer.points = {PointRecord(5, 5), PointRecord(25, -5), PointRecord(15, 30)};

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(5, -5, 20, 35));
}

void TestBoundsCalculator::testPolygon_RegularFromRadius()
{
    Layer layer;
    layer.type = LayerType::Polygon;
    layer.x = 0;
    layer.y = 0;
    layer.radius = 10;

    // Default hexagon, first vertex at the top
    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QVERIFY(approx(bounds->left(), -8.660));
    QVERIFY(approx(bounds->top(), -10.0));
    QVERIFY(approx(bounds->width(), 17.321));
    QVERIFY(approx(bounds->height(), 20.0));
}

void TestBoundsCalculator::testStar_FromRadii()
{
    Layer layer;
    layer.type = LayerType::Star;
    layer.x = 100;
    layer.y = 100;
    layer.outerRadius = 50;
    layer.innerRadius = 20;
    layer.starPoints = 5;

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QVERIFY(approx(bounds->top(), 50.0));
    QVERIFY(approx(bounds->left(), 52.447));
    QVERIFY(approx(bounds->width(), 95.106));
    QVERIFY(approx(bounds->height(), 90.451));
}

void TestBoundsCalculator::testStar_MissingRadius()
{
    Layer layer;
    layer.type = LayerType::Star;
    layer.x = 100;
    layer.y = 100;
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

void TestBoundsCalculator::testStar_TooManyPoints()
{
    Layer layer;
    layer.type = LayerType::Star;
    layer.x = 0;
    layer.y = 0;
    layer.outerRadius = 10;
    layer.starPoints = 1500000000;
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

// ============================================================================
// Text Bounds Tests
// ============================================================================

void TestBoundsCalculator::testText_EstimatedWidth()
{
    Layer layer;
    layer.type = LayerType::Text;
    layer.x = 10;
    layer.y = 50;
    layer.fontSize = 20;
    layer.text = QStringLiteral("abc");

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(10, 30, 36, 24));
}

void TestBoundsCalculator::testText_ExplicitSize()
{
    Layer layer;
    layer.type = LayerType::Text;
    layer.x = 10;
    layer.y = 50;
    layer.fontSize = 20;
    layer.text = QStringLiteral("abc");
    layer.width = 200;
    layer.height = 40;

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(10, 50, 200, 40));
}

void TestBoundsCalculator::testText_WidthOnlyKeepsBaseline()
{
    Layer layer;
    layer.type = LayerType::Text;
    layer.x = 10;
    layer.y = 50;
    layer.fontSize = 20;
    layer.width = 200;

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(10, 30, 200, 24));
}

void TestBoundsCalculator::testText_DefaultFontSize()
{
    Layer layer;
    layer.type = LayerType::Text;
    layer.x = 0;
    layer.y = 16;

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(bounds->y(), 0.0);
    QCOMPARE(bounds->width(), 80.0);
    QCOMPARE(bounds->height(), 19.2);
}

void TestBoundsCalculator::testText_NonPositiveFontSize()
{
    Layer layer;
    layer.type = LayerType::Text;
    layer.x = 0;
    layer.y = 16;
    layer.fontSize = -4;

    auto bounds = BoundsCalculator::getLayerBounds(layer);
    QVERIFY(bounds.has_value());
    QCOMPARE(bounds->height(), 19.2);
}

void TestBoundsCalculator::testText_WrongType()
{
    Layer layer = makeRect(0, 0, 10, 10);
    QVERIFY(!BoundsCalculator::getTextBounds(layer).has_value());
}

void TestBoundsCalculator::testText_MissingPosition()
{
    Layer layer;
    layer.type = LayerType::Text;
    layer.x = 10;
    layer.text = QStringLiteral("hello");
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

// ============================================================================
// No-Geometry Type Tests
// ============================================================================

void TestBoundsCalculator::testGroup_NoBounds()
{
    Layer layer = makeRect(0, 0, 10, 10);
    layer.type = LayerType::Group;
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

void TestBoundsCalculator::testUnknown_NoBounds()
{
    Layer layer = makeRect(0, 0, 10, 10);
    layer.type = LayerType::Unknown;
    QVERIFY(!BoundsCalculator::getLayerBounds(layer).has_value());
}

// ============================================================================
// Property Tests
// ============================================================================

void TestBoundsCalculator::testNormalization_Idempotent()
{
    const QList<Layer> layers = {
        makeRect(110, 90, -100, -70),
        makeRect(0, 0, 5, -5),
        makeLine(100, 80, 10, 20),
        makeLine(-5, 10, -50, -10),
    };

    for (const Layer& layer : layers) {
        auto once = BoundsCalculator::getLayerBounds(layer);
        QVERIFY(once.has_value());
        QVERIFY(once->width() >= 0.0);
        QVERIFY(once->height() >= 0.0);

        auto twice = BoundsCalculator::getLayerBounds(
            makeRect(once->x(), once->y(), once->width(), once->height()));
        QVERIFY(twice.has_value());
        QCOMPARE(*twice, *once);
    }
}

void TestBoundsCalculator::testContainment_CircleInsideBounds()
{
    const Layer circle = makeCircle(40, -20, 15);
    auto bounds = BoundsCalculator::getLayerBounds(circle);
    QVERIFY(bounds.has_value());

    for (int i = 0; i < 36; ++i) {
        const qreal angle = i * M_PI / 18.0;
        const QPointF point(40 + 14.9 * std::cos(angle), -20 + 14.9 * std::sin(angle));
        QVERIFY(BoundsCalculator::isPointInBounds(point, bounds));
    }
}

void TestBoundsCalculator::testContainment_EllipseInsideBounds()
{
    const Layer ellipse = makeEllipse(50, 50, 40, 20);
    auto bounds = BoundsCalculator::getLayerBounds(ellipse);
    QVERIFY(bounds.has_value());

    for (int i = 0; i < 36; ++i) {
        const qreal angle = i * M_PI / 18.0;
        const QPointF point(50 + 39.9 * std::cos(angle), 50 + 19.9 * std::sin(angle));
        QVERIFY(BoundsCalculator::isPointInBounds(point, bounds));
    }
}

void TestBoundsCalculator::testContainment_PolygonsInsideBounds()
{
    Layer pointsPolygon;
    pointsPolygon.type = LayerType::Polygon;
    pointsPolygon.points = {PointRecord(0, 0), PointRecord(60, 10), PointRecord(30, 20),
                            PointRecord(70, 70), PointRecord(-10, 50)};

    Layer regular;
    regular.type = LayerType::Polygon;
    regular.x = 100;
    regular.y = -40;
    regular.radius = 35;
    regular.sides = 5;

    Layer star;
    star.type = LayerType::Star;
    star.x = -60;
    star.y = 30;
    star.outerRadius = 45;
    star.innerRadius = 15;
    star.starPoints = 7;

    for (const Layer& layer : {pointsPolygon, regular, star}) {
        auto bounds = BoundsCalculator::getLayerBounds(layer);
        auto vertices = PolygonGeometry::layerVertices(layer);
        QVERIFY(bounds.has_value());
        QVERIFY(vertices.has_value());

        // Sample a grid reaching past the bounds on every side
        const QRectF area = BoundsCalculator::expandBounds(*bounds, 10);
        int inside = 0;
        for (qreal x = area.left(); x <= area.right(); x += 1.5) {
            for (qreal y = area.top(); y <= area.bottom(); y += 1.5) {
                const QPointF point(x, y);
                if (PolygonGeometry::isPointInPolygon(point, *vertices)) {
                    ++inside;
                    QVERIFY(BoundsCalculator::isPointInBounds(point, bounds));
                }
            }
        }
        QVERIFY(inside > 0);
    }
}

// ============================================================================
// Set Algebra Tests
// ============================================================================

void TestBoundsCalculator::testMerge_Empty()
{
    QVERIFY(!BoundsCalculator::mergeBounds(QVector<std::optional<QRectF>>()).has_value());
    QVERIFY(!BoundsCalculator::mergeBounds(QVector<QRectF>()).has_value());
}

void TestBoundsCalculator::testMerge_AllNull()
{
    QVector<std::optional<QRectF>> list = {std::nullopt, std::nullopt};
    QVERIFY(!BoundsCalculator::mergeBounds(list).has_value());
}

void TestBoundsCalculator::testMerge_Singleton()
{
    const QRectF rect(3.5, -2, 10.25, 7);
    auto merged = BoundsCalculator::mergeBounds(QVector<QRectF>{rect});
    QVERIFY(merged.has_value());
    QCOMPARE(*merged, rect);
}

void TestBoundsCalculator::testMerge_IgnoresNull()
{
    QVector<std::optional<QRectF>> list = {std::nullopt, QRectF(0, 0, 10, 10), std::nullopt,
                                           QRectF(20, 30, 5, 5)};
    auto merged = BoundsCalculator::mergeBounds(list);
    QVERIFY(merged.has_value());
    QCOMPARE(*merged, QRectF(0, 0, 25, 35));
}

void TestBoundsCalculator::testMerge_ContainsInputs()
{
    const QRectF a(0, 0, 100, 20);
    const QRectF b(-40, 50, 10, 90);
    auto merged = BoundsCalculator::mergeBounds(QVector<QRectF>{a, b});
    QVERIFY(merged.has_value());

    QVERIFY(BoundsCalculator::boundsIntersect(merged, a));
    QVERIFY(BoundsCalculator::boundsIntersect(merged, b));
    QVERIFY(area(*merged) >= qMax(area(a), area(b)));
    QVERIFY(BoundsCalculator::isPointInBounds(a.topLeft(), merged));
    QVERIFY(BoundsCalculator::isPointInBounds(b.bottomRight(), merged));
}

void TestBoundsCalculator::testMerge_KeepsZeroSizeEntries()
{
    auto merged = BoundsCalculator::mergeBounds(QVector<QRectF>{QRectF(0, 0, 10, 10),
                                                                QRectF(50, 60, 0, 0)});
    QVERIFY(merged.has_value());
    QCOMPARE(*merged, QRectF(0, 0, 50, 60));
}

void TestBoundsCalculator::testMultiLayerBounds()
{
    Layer invalid;
    invalid.type = LayerType::Rectangle;

    const QVector<Layer> layers = {makeRect(0, 0, 10, 10), makeCircle(50, 50, 10), invalid};
    auto bounds = BoundsCalculator::getMultiLayerBounds(layers);
    QVERIFY(bounds.has_value());
    QCOMPARE(*bounds, QRectF(0, 0, 60, 60));
}

void TestBoundsCalculator::testMultiLayerBounds_NoneMeasurable()
{
    Layer group;
    group.type = LayerType::Group;
    QVERIFY(!BoundsCalculator::getMultiLayerBounds({group}).has_value());
    QVERIFY(!BoundsCalculator::getMultiLayerBounds({}).has_value());
}

void TestBoundsCalculator::testPointInBounds_InclusiveEdges()
{
    const QRectF rect(10, 20, 100, 50);
    QVERIFY(BoundsCalculator::isPointInBounds(QPointF(10, 20), rect));
    QVERIFY(BoundsCalculator::isPointInBounds(QPointF(110, 70), rect));
    QVERIFY(BoundsCalculator::isPointInBounds(QPointF(110, 20), rect));
    QVERIFY(BoundsCalculator::isPointInBounds(QPointF(10, 70), rect));
    QVERIFY(BoundsCalculator::isPointInBounds(QPointF(60, 45), rect));
}

void TestBoundsCalculator::testPointInBounds_Outside()
{
    const QRectF rect(10, 20, 100, 50);
    QVERIFY(!BoundsCalculator::isPointInBounds(QPointF(9.99, 45), rect));
    QVERIFY(!BoundsCalculator::isPointInBounds(QPointF(60, 70.01), rect));
}

void TestBoundsCalculator::testPointInBounds_Null()
{
    QVERIFY(!BoundsCalculator::isPointInBounds(QPointF(0, 0), std::nullopt));
}

void TestBoundsCalculator::testIntersect_Overlap()
{
    QVERIFY(BoundsCalculator::boundsIntersect(QRectF(0, 0, 100, 100), QRectF(50, 50, 100, 100)));
    QVERIFY(BoundsCalculator::boundsIntersect(QRectF(0, 0, 100, 100), QRectF(10, 10, 5, 5)));
}

void TestBoundsCalculator::testIntersect_TouchingEdges()
{
    QVERIFY(BoundsCalculator::boundsIntersect(QRectF(0, 0, 10, 10), QRectF(10, 0, 10, 10)));
    QVERIFY(BoundsCalculator::boundsIntersect(QRectF(0, 0, 10, 10), QRectF(10, 10, 5, 5)));
    QVERIFY(BoundsCalculator::boundsIntersect(QRectF(5, 5, 0, 0), QRectF(0, 0, 5, 5)));
}

void TestBoundsCalculator::testIntersect_Separated()
{
    QVERIFY(!BoundsCalculator::boundsIntersect(QRectF(0, 0, 10, 10), QRectF(10.5, 0, 10, 10)));
    QVERIFY(!BoundsCalculator::boundsIntersect(QRectF(0, 0, 10, 10), QRectF(0, -20, 10, 10)));
}

void TestBoundsCalculator::testIntersect_Null()
{
    QVERIFY(!BoundsCalculator::boundsIntersect(std::nullopt, QRectF(0, 0, 10, 10)));
    QVERIFY(!BoundsCalculator::boundsIntersect(QRectF(0, 0, 10, 10), std::nullopt));
}

void TestBoundsCalculator::testExpand_Grow()
{
    QCOMPARE(BoundsCalculator::expandBounds(QRectF(10, 20, 100, 50), 5), QRectF(5, 15, 110, 60));
}

void TestBoundsCalculator::testExpand_Shrink()
{
    QCOMPARE(BoundsCalculator::expandBounds(QRectF(10, 20, 100, 50), -5), QRectF(15, 25, 90, 40));
}

void TestBoundsCalculator::testExpand_ShrinkPastCenter()
{
    // Height collapses first, width keeps shrinking
    QCOMPARE(BoundsCalculator::expandBounds(QRectF(10, 20, 100, 50), -30), QRectF(40, 45, 40, 0));
    QCOMPARE(BoundsCalculator::expandBounds(QRectF(10, 20, 100, 50), -80), QRectF(60, 45, 0, 0));
}

void TestBoundsCalculator::testExpand_NonFiniteAmount()
{
    const QRectF rect(10, 20, 100, 50);
    QCOMPARE(BoundsCalculator::expandBounds(rect, std::numeric_limits<qreal>::quiet_NaN()), rect);
    QCOMPARE(BoundsCalculator::expandBounds(rect, std::numeric_limits<qreal>::infinity()), rect);
}

void TestBoundsCalculator::testCenter()
{
    auto center = BoundsCalculator::getBoundsCenter(QRectF(10, 20, 100, 50));
    QVERIFY(center.has_value());
    QCOMPARE(*center, QPointF(60, 45));
}

void TestBoundsCalculator::testCenter_Null()
{
    QVERIFY(!BoundsCalculator::getBoundsCenter(std::nullopt).has_value());
}

QTEST_MAIN(TestBoundsCalculator)
#include "tst_BoundsCalculator.moc"
