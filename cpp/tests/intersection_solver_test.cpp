#include <gtest/gtest.h>

#include "polyseq/geometry/intersection_solver.h"
#include "polyseq/shape/shape_builder.h"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace polyseq;

namespace {

std::vector<Segment2> outline(const BaseShape& shape) {
    return toSegments(shape.points, shape.segments);
}

std::vector<Segment2> rotated(const BaseShape& shape, double degrees) {
    const double r = degrees * 3.14159265358979323846 / 180.0;
    std::vector<Point2> points;
    for (const Point2& p : shape.points) {
        points.push_back(Point2{p.x * std::cos(r) - p.y * std::sin(r), p.x * std::sin(r) + p.y * std::cos(r)});
    }
    return toSegments(points, shape.segments);
}

} // namespace

TEST(IntersectionSolverTest, CrossingSegmentsMeetAtTheCenter) {
    const IntersectionSolver solver;
    const auto hit = solver.intersect(
        Segment2{Point2{0.0, 0.0}, Point2{10.0, 10.0}},
        Segment2{Point2{0.0, 10.0}, Point2{10.0, 0.0}});
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->x, 5.0, 1e-9);
    EXPECT_NEAR(hit->y, 5.0, 1e-9);
}

TEST(IntersectionSolverTest, ParallelAndDegenerateSegmentsNeverIntersect) {
    const IntersectionSolver solver;
    EXPECT_FALSE(solver.intersect(
        Segment2{Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        Segment2{Point2{0.0, 1.0}, Point2{10.0, 1.0}}).has_value());
    // Collinear overlap is treated as parallel.
    EXPECT_FALSE(solver.intersect(
        Segment2{Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        Segment2{Point2{5.0, 0.0}, Point2{15.0, 0.0}}).has_value());
    EXPECT_FALSE(solver.intersect(
        Segment2{Point2{3.0, 3.0}, Point2{3.0, 3.0}},
        Segment2{Point2{0.0, 0.0}, Point2{10.0, 10.0}}).has_value());
}

TEST(IntersectionSolverTest, LinesMeetingOutsideEitherSegmentAreRejected) {
    const IntersectionSolver solver;
    EXPECT_FALSE(solver.intersect(
        Segment2{Point2{0.0, 0.0}, Point2{1.0, 1.0}},
        Segment2{Point2{0.0, 10.0}, Point2{10.0, 0.0}}).has_value());
}

TEST(IntersectionSolverTest, TouchingEndpointsCountWithinEpsilon) {
    const IntersectionSolver solver;
    const auto hit = solver.intersect(
        Segment2{Point2{0.0, 0.0}, Point2{10.0, 0.0}},
        Segment2{Point2{10.0, -5.0}, Point2{10.0, 5.0}});
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->x, 10.0, 1e-9);
}

TEST(IntersectionSolverTest, MergeKeepsTheFirstAcceptedPoint) {
    const IntersectionSolver solver;
    const IntersectionPoint a{Point2{0.0, 0.0}, IntersectionProvenance{0, 0, 0, 1}};
    const IntersectionPoint b{Point2{3.0, 0.0}, IntersectionProvenance{0, 2, 0, 3}};

    std::vector<IntersectionPoint> forward;
    EXPECT_TRUE(solver.accept(forward, a));
    EXPECT_FALSE(solver.accept(forward, b));
    ASSERT_EQ(forward.size(), 1u);
    EXPECT_DOUBLE_EQ(forward[0].point.x, 0.0);

    std::vector<IntersectionPoint> backward;
    EXPECT_TRUE(solver.accept(backward, b));
    EXPECT_FALSE(solver.accept(backward, a));
    ASSERT_EQ(backward.size(), 1u);
    EXPECT_DOUBLE_EQ(backward[0].point.x, 3.0);

    const IntersectionPoint far{Point2{5.0, 0.0}, IntersectionProvenance{0, 4, 0, 5}};
    EXPECT_TRUE(solver.accept(forward, far));
    EXPECT_EQ(forward.size(), 2u);
}

TEST(IntersectionSolverTest, MergeThresholdIsConfigurable) {
    IntersectionOptions options;
    options.mergeThreshold = 1.0;
    const IntersectionSolver solver(options);
    std::vector<IntersectionPoint> accepted;
    EXPECT_TRUE(solver.accept(accepted, IntersectionPoint{Point2{0.0, 0.0}, {}}));
    EXPECT_TRUE(solver.accept(accepted, IntersectionPoint{Point2{3.0, 0.0}, {}}));
}

TEST(IntersectionSolverTest, PentagramHasFiveInnerCrossings) {
    const BaseShape star = ShapeBuilder::buildStar(100.0, 5, 2);
    const IntersectionSolver solver;
    const std::vector<IntersectionPoint> hits = solver.findSelfIntersections(outline(star));
    ASSERT_EQ(hits.size(), 5u);

    // Inner pentagon radius of a unit pentagram is cos(72) / cos(36).
    const double inner = 100.0 * std::cos(72.0 * 3.14159265358979323846 / 180.0)
        / std::cos(36.0 * 3.14159265358979323846 / 180.0);
    for (const IntersectionPoint& ip : hits) {
        EXPECT_NEAR(std::hypot(ip.point.x, ip.point.y), inner, 1e-6);
        EXPECT_EQ(ip.source.copyA, 0u);
        EXPECT_NE(ip.source.segmentA, ip.source.segmentB);
    }
}

TEST(IntersectionSolverTest, ConvexOutlineHasNoSelfIntersections) {
    const IntersectionSolver solver;
    EXPECT_TRUE(solver.findSelfIntersections(outline(ShapeBuilder::buildRegular(100.0, 8))).empty());
}

TEST(IntersectionSolverTest, CrossCopyNeedsAtLeastTwoCopies) {
    const IntersectionSolver solver;
    EXPECT_TRUE(solver.findCrossCopyIntersections({}).empty());
    EXPECT_TRUE(solver.findCrossCopyIntersections({outline(ShapeBuilder::buildStar(100.0, 5, 2))}).empty());
}

TEST(IntersectionSolverTest, RotatedSquaresCrossEightTimes) {
    const BaseShape square = ShapeBuilder::buildRegular(100.0, 4);
    const IntersectionSolver solver;
    const std::vector<IntersectionPoint> hits =
        solver.findCrossCopyIntersections({outline(square), rotated(square, 45.0)});
    ASSERT_EQ(hits.size(), 8u);
    for (const IntersectionPoint& ip : hits) {
        EXPECT_EQ(ip.source.copyA, 0u);
        EXPECT_EQ(ip.source.copyB, 1u);
    }
}

TEST(IntersectionSolverTest, FindIntersectionsBetweenTwoLists) {
    const IntersectionSolver solver;
    const std::vector<Segment2> a = {Segment2{Point2{-10.0, 0.0}, Point2{10.0, 0.0}}};
    const std::vector<Segment2> b = {
        Segment2{Point2{-5.0, -5.0}, Point2{-5.0, 5.0}},
        Segment2{Point2{5.0, -5.0}, Point2{5.0, 5.0}},
    };
    const std::vector<IntersectionPoint> hits = solver.findIntersections(a, b);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[1].source.segmentB, 1u);
}

TEST(IntersectionSolverTest, SegmentIndicesAreValidated) {
    const std::vector<Point2> points = {Point2{0.0, 0.0}, Point2{1.0, 0.0}};
    EXPECT_THROW(toSegments(points, {LineSegment{0, 2}}), std::out_of_range);
}
