#include <gtest/gtest.h>

#include "polyseq/shape/euclidean_rhythm.h"
#include "polyseq/shape/shape_builder.h"
#include "polyseq/shape/shape_spec.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace polyseq;

namespace {

std::vector<int> onsets(const std::vector<bool>& pattern) {
    std::vector<int> out;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i]) out.push_back(static_cast<int>(i));
    }
    return out;
}

bool samePoint(const Point2& a, const Point2& b) {
    return std::fabs(a.x - b.x) < 1e-9 && std::fabs(a.y - b.y) < 1e-9;
}

} // namespace

TEST(ShapeBuilderTest, RegularSquareStartsOnPositiveX) {
    const BaseShape shape = ShapeBuilder::buildRegular(100.0, 4);
    ASSERT_EQ(shape.points.size(), 4u);
    ASSERT_EQ(shape.segments.size(), 4u);

    EXPECT_NEAR(shape.points[0].x, 100.0, 1e-9);
    EXPECT_NEAR(shape.points[0].y, 0.0, 1e-9);
    EXPECT_NEAR(shape.points[1].x, 0.0, 1e-9);
    EXPECT_NEAR(shape.points[1].y, 100.0, 1e-9);
    EXPECT_NEAR(shape.points[2].x, -100.0, 1e-9);

    EXPECT_EQ(shape.segments[3].a, 3u);
    EXPECT_EQ(shape.segments[3].b, 0u);
}

TEST(ShapeBuilderTest, RegularPolygonHasOneEdgePerVertex) {
    for (int n : {3, 5, 7, 12, 64}) {
        const BaseShape shape = ShapeBuilder::buildRegular(50.0, n);
        EXPECT_EQ(shape.points.size(), static_cast<std::size_t>(n));
        EXPECT_EQ(shape.segments.size(), static_cast<std::size_t>(n));
        for (const Point2& p : shape.points) {
            EXPECT_NEAR(std::hypot(p.x, p.y), 50.0, 1e-9);
        }
    }
}

TEST(ShapeBuilderTest, TwoPointShapeIsAClosedCycle) {
    const BaseShape shape = ShapeBuilder::buildRegular(10.0, 2);
    ASSERT_EQ(shape.points.size(), 2u);
    ASSERT_EQ(shape.segments.size(), 2u);
    EXPECT_EQ(shape.segments[0].a, 0u);
    EXPECT_EQ(shape.segments[0].b, 1u);
    EXPECT_EQ(shape.segments[1].a, 1u);
    EXPECT_EQ(shape.segments[1].b, 0u);
}

TEST(ShapeBuilderTest, ClampedSegmentCountStillClosesTheCycle) {
    ShapeSpec spec;
    spec.radius = 10.0;
    spec.segmentCount = 0;
    const BaseShape shape = ShapeBuilder::build(spec);
    ASSERT_EQ(shape.points.size(), 2u);
    EXPECT_EQ(shape.segments.size(), 2u);
}

TEST(ShapeBuilderTest, PentagramIsOneClosedPath) {
    const BaseShape shape = ShapeBuilder::buildStar(100.0, 5, 2);
    ASSERT_EQ(shape.points.size(), 5u);
    ASSERT_EQ(shape.segments.size(), 5u);

    const std::vector<std::uint32_t> expected = {0, 2, 4, 1, 3};
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(shape.segments[i].a, expected[i]);
        EXPECT_EQ(shape.segments[i].b, expected[(i + 1) % expected.size()]);
    }
}

TEST(ShapeBuilderTest, StarWithCommonDivisorSplitsIntoSubPaths) {
    // {6/2}: two triangles, emitted one after the other.
    const BaseShape shape = ShapeBuilder::buildStar(100.0, 6, 2);
    ASSERT_EQ(shape.segments.size(), 6u);

    EXPECT_EQ(shape.segments[0].a, 0u);
    EXPECT_EQ(shape.segments[1].a, 2u);
    EXPECT_EQ(shape.segments[2].a, 4u);
    EXPECT_EQ(shape.segments[2].b, 0u);

    EXPECT_EQ(shape.segments[3].a, 1u);
    EXPECT_EQ(shape.segments[4].a, 3u);
    EXPECT_EQ(shape.segments[5].a, 5u);
    EXPECT_EQ(shape.segments[5].b, 1u);
}

TEST(ShapeBuilderTest, StarPathsCoverEveryVertexOnce) {
    for (int n = 3; n <= 16; ++n) {
        for (int k = 2; k < n; ++k) {
            const BaseShape star = ShapeBuilder::buildStar(10.0, n, k);
            ASSERT_EQ(star.segments.size(), static_cast<std::size_t>(n));

            int g = n;
            for (int a = n, b = k; b != 0;) {
                const int t = a % b;
                a = b;
                b = t;
                g = a;
            }
            const std::size_t pathLength = static_cast<std::size_t>(n / g);

            std::vector<int> visits(static_cast<std::size_t>(n), 0);
            for (int path = 0; path < g; ++path) {
                const std::size_t first = static_cast<std::size_t>(path) * pathLength;
                for (std::size_t j = 0; j < pathLength; ++j) {
                    const LineSegment& s = star.segments[first + j];
                    ++visits[s.a];
                    // Chained within the path, closing on its own start.
                    const LineSegment& next = star.segments[first + (j + 1) % pathLength];
                    EXPECT_EQ(s.b, next.a) << "{" << n << "/" << k << "}";
                }
            }
            for (int v : visits) EXPECT_EQ(v, 1) << "{" << n << "/" << k << "}";
        }
    }
}

TEST(ShapeBuilderTest, StarSkipOutsideRangeFallsBackToRegular) {
    for (int k : {0, 1, 6, 9}) {
        const BaseShape star = ShapeBuilder::buildStar(100.0, 6, k);
        ASSERT_EQ(star.segments.size(), 6u);
        for (std::uint32_t i = 0; i < 6; ++i) {
            EXPECT_EQ(star.segments[i].a, i);
            EXPECT_EQ(star.segments[i].b, (i + 1) % 6);
        }
    }
}

TEST(ShapeBuilderTest, BuildDispatchesOnFamily) {
    ShapeSpec spec;
    spec.radius = 100.0;
    spec.segmentCount = 5;
    spec.shapeFamily = ShapeFamily::Star;
    spec.starSkip = 2;
    EXPECT_EQ(ShapeBuilder::build(spec).segments[0].b, 2u);

    spec.shapeFamily = ShapeFamily::Regular;
    EXPECT_EQ(ShapeBuilder::build(spec).segments[0].b, 1u);

    spec.shapeFamily = ShapeFamily::Euclidean;
    spec.euclidPulses = 2;
    EXPECT_EQ(ShapeBuilder::build(spec).points.size(), 2u);
    EXPECT_EQ(ShapeBuilder::build(spec).segments.size(), 2u);
}

TEST(ShapeBuilderTest, EuclideanWithoutPulsesFallsBackToRegular) {
    ShapeSpec spec;
    spec.radius = 100.0;
    spec.segmentCount = 6;
    spec.shapeFamily = ShapeFamily::Euclidean;
    spec.euclidPulses = 0;
    const BaseShape shape = ShapeBuilder::build(spec);
    EXPECT_EQ(shape.points.size(), 6u);
    EXPECT_EQ(shape.segments.size(), 6u);
}

TEST(EuclideanRhythmTest, TresilloOnsets) {
    EXPECT_EQ(onsets(euclideanRhythm(8, 3)), (std::vector<int>{0, 2, 5}));
}

TEST(EuclideanRhythmTest, PulseCountIsExact) {
    for (int n = 1; n <= 24; ++n) {
        for (int k = 0; k <= n; ++k) {
            const std::vector<bool> pattern = euclideanRhythm(n, k);
            ASSERT_EQ(pattern.size(), static_cast<std::size_t>(n));
            EXPECT_EQ(std::count(pattern.begin(), pattern.end(), true), k) << "E(" << n << "," << k << ")";
        }
    }
}

TEST(EuclideanRhythmTest, EdgeCases) {
    const std::vector<bool> none = euclideanRhythm(8, 0);
    EXPECT_EQ(std::count(none.begin(), none.end(), true), 0);

    const std::vector<bool> all = euclideanRhythm(8, 8);
    EXPECT_EQ(std::count(all.begin(), all.end(), true), 8);

    const std::vector<bool> clamped = euclideanRhythm(8, 12);
    EXPECT_EQ(std::count(clamped.begin(), clamped.end(), true), 8);

    EXPECT_TRUE(euclideanRhythm(0, 3).empty());
}

TEST(EuclideanRhythmTest, OnsetsAreSpreadOut) {
    // No gap may be more than one step longer than another.
    for (int n = 2; n <= 16; ++n) {
        for (int k = 1; k < n; ++k) {
            const std::vector<int> on = onsets(euclideanRhythm(n, k));
            int shortest = n;
            int longest = 0;
            for (std::size_t i = 0; i < on.size(); ++i) {
                const int next = on[(i + 1) % on.size()];
                const int gap = (next - on[i] + n) % n == 0 ? n : (next - on[i] + n) % n;
                shortest = std::min(shortest, gap);
                longest = std::max(longest, gap);
            }
            EXPECT_LE(longest - shortest, 1) << "E(" << n << "," << k << ")";
        }
    }
}

TEST(ShapeBuilderTest, EuclideanKeepsOnlyOnsetVertices) {
    const BaseShape shape = ShapeBuilder::buildEuclidean(100.0, 8, 3);
    ASSERT_EQ(shape.points.size(), 3u);
    EXPECT_EQ(shape.segments.size(), 3u);

    const BaseShape full = ShapeBuilder::buildRegular(100.0, 8);
    EXPECT_TRUE(samePoint(shape.points[0], full.points[0]));
    EXPECT_TRUE(samePoint(shape.points[1], full.points[2]));
    EXPECT_TRUE(samePoint(shape.points[2], full.points[5]));
}

TEST(ShapeBuilderTest, EuclideanWithFewOnsets) {
    const BaseShape two = ShapeBuilder::buildEuclidean(100.0, 8, 2);
    ASSERT_EQ(two.segments.size(), 2u);
    EXPECT_EQ(two.segments[1].a, 1u);
    EXPECT_EQ(two.segments[1].b, 0u);
    EXPECT_TRUE(ShapeBuilder::buildEuclidean(100.0, 8, 1).segments.empty());
    EXPECT_TRUE(ShapeBuilder::buildEuclidean(100.0, 8, 0).points.empty());
}

TEST(ShapeBuilderTest, SubdivisionMultipliesEdges) {
    const BaseShape square = ShapeBuilder::buildRegular(100.0, 4);
    const BaseShape fine = ShapeBuilder::subdivide(square, 3);

    EXPECT_EQ(fine.segments.size(), 12u);
    EXPECT_EQ(fine.points.size(), 12u);

    // Path order: original vertex, inserted points, next original vertex.
    EXPECT_TRUE(samePoint(fine.points[0], square.points[0]));
    EXPECT_TRUE(samePoint(fine.points[3], square.points[1]));
    EXPECT_NEAR(fine.points[1].x, 100.0 * 2.0 / 3.0, 1e-9);
    EXPECT_NEAR(fine.points[1].y, 100.0 / 3.0, 1e-9);

    for (const Point2& original : square.points) {
        const bool kept = std::any_of(fine.points.begin(), fine.points.end(),
            [&](const Point2& p) { return samePoint(p, original); });
        EXPECT_TRUE(kept);
    }
    for (const LineSegment& s : fine.segments) {
        EXPECT_LT(s.a, fine.points.size());
        EXPECT_LT(s.b, fine.points.size());
    }
}

TEST(ShapeBuilderTest, FractalComposesWithStar) {
    ShapeSpec spec;
    spec.segmentCount = 5;
    spec.shapeFamily = ShapeFamily::Star;
    spec.starSkip = 2;
    spec.useFractal = true;
    spec.fractalDivisions = 4;
    const BaseShape shape = ShapeBuilder::build(spec);
    EXPECT_EQ(shape.segments.size(), 20u);
    EXPECT_EQ(shape.points.size(), 5u + 5u * 3u);
}

TEST(ShapeBuilderTest, FractalFamilySubdividesRegularPath) {
    ShapeSpec spec;
    spec.segmentCount = 6;
    spec.shapeFamily = ShapeFamily::Fractal;
    spec.fractalDivisions = 2;
    EXPECT_EQ(ShapeBuilder::build(spec).segments.size(), 12u);
}

TEST(ShapeBuilderTest, OversizedShapeThrows) {
    EXPECT_THROW(ShapeBuilder::buildRegular(10.0, 2000000), std::length_error);

    const BaseShape big = ShapeBuilder::buildRegular(10.0, 100000);
    EXPECT_THROW(ShapeBuilder::subdivide(big, 64), std::length_error);
}

TEST(ShapeSpecTest, SanitizeClampsIntoDomain) {
    ShapeSpec raw;
    raw.radius = std::numeric_limits<double>::quiet_NaN();
    raw.segmentCount = 0;
    raw.starSkip = -3;
    raw.euclidPulses = 99;
    raw.fractalDivisions = 0;
    raw.copies = -2;
    raw.modulusValue = 0;
    raw.altStepN = 0;

    const ShapeSpec spec = sanitizeShapeSpec(raw);
    EXPECT_DOUBLE_EQ(spec.radius, kDefaultRadius);
    EXPECT_EQ(spec.segmentCount, 2);
    EXPECT_EQ(spec.starSkip, 1);
    EXPECT_EQ(spec.euclidPulses, 2);
    EXPECT_EQ(spec.fractalDivisions, 1);
    EXPECT_EQ(spec.copies, 0);
    EXPECT_EQ(spec.modulusValue, 1);
    EXPECT_EQ(spec.altStepN, 1);

    raw.radius = -5.0;
    EXPECT_DOUBLE_EQ(sanitizeShapeSpec(raw).radius, 1.0);
}

TEST(ShapeSpecTest, FamilyPredicates) {
    ShapeSpec spec;
    spec.segmentCount = 7;
    spec.shapeFamily = ShapeFamily::Star;
    spec.starSkip = 3;
    EXPECT_TRUE(isStarActive(spec));
    EXPECT_FALSE(starCutsActive(spec));
    spec.useCuts = true;
    EXPECT_TRUE(starCutsActive(spec));
    spec.starSkip = 7;
    EXPECT_FALSE(isStarActive(spec));

    spec.useIntersections = true;
    spec.copies = 1;
    EXPECT_FALSE(crossCopyIntersectionsActive(spec));
    spec.copies = 2;
    EXPECT_TRUE(crossCopyIntersectionsActive(spec));

    spec.shapeFamily = ShapeFamily::Regular;
    spec.fractalDivisions = 3;
    EXPECT_EQ(effectiveFractalDivisions(spec), 1);
    spec.useFractal = true;
    EXPECT_EQ(effectiveFractalDivisions(spec), 3);
}

TEST(SpecSnapshotTest, ThresholdsGateRebuilds) {
    ShapeSpec spec;
    spec.radius = 100.0;

    SpecSnapshot snapshot;
    EXPECT_TRUE(snapshot.requiresRebuild(spec));
    snapshot.capture(spec);
    EXPECT_FALSE(snapshot.requiresRebuild(spec));

    ShapeSpec drift = spec;
    drift.radius = 100.4;
    EXPECT_FALSE(snapshot.requiresRebuild(drift));
    drift.radius = 100.6;
    EXPECT_TRUE(snapshot.requiresRebuild(drift));

    ShapeSpec recount = spec;
    recount.segmentCount = 5;
    EXPECT_TRUE(snapshot.requiresRebuild(recount));

    snapshot.clear();
    EXPECT_TRUE(snapshot.requiresRebuild(spec));
}

TEST(SpecSnapshotTest, TransformFieldsOnlyRebuildWithCrossCopyIntersections) {
    ShapeSpec spec;
    spec.copies = 3;

    SpecSnapshot snapshot;
    snapshot.capture(spec);

    ShapeSpec turned = spec;
    turned.angleDegrees = spec.angleDegrees + 5.0;
    EXPECT_TRUE(snapshot.transformsChanged(turned));
    EXPECT_FALSE(snapshot.requiresRebuild(turned));

    spec.useIntersections = true;
    snapshot.capture(spec);
    turned.useIntersections = true;
    EXPECT_TRUE(snapshot.requiresRebuild(turned));
}
