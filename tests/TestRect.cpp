/**
 * @file TestRect.cpp
 * @brief Unit tests for bounce::math::Rect, Vec2 and StateHash.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bounce/math/Rect.hpp"
#include "bounce/math/StateHash.hpp"
#include "bounce/math/Vec2.hpp"

using namespace bounce;
using namespace bounce::math;

TEST_CASE("Rect edges follow screen coordinates", "[math][rect]")
{
    const Rectd r{10.0, 20.0, 30.0, 40.0};

    REQUIRE(r.left() == 10.0);
    REQUIRE(r.right() == 40.0);
    REQUIRE(r.top() == 20.0);
    REQUIRE(r.bottom() == 60.0);
    REQUIRE(r.area() == 1200.0);
}

TEST_CASE("Rect overlap is strict", "[math][rect]")
{
    const Rectd a{0.0, 0.0, 10.0, 10.0};

    REQUIRE(a.overlaps(Rectd{5.0, 5.0, 10.0, 10.0}));
    REQUIRE_FALSE(a.overlaps(Rectd{10.0, 0.0, 10.0, 10.0}));
    REQUIRE_FALSE(a.overlaps(Rectd{0.0, 10.0, 10.0, 10.0}));
    REQUIRE(a.touches(Rectd{10.0, 0.0, 10.0, 10.0}));
    REQUIRE_FALSE(a.overlaps(Rectd{30.0, 30.0, 1.0, 1.0}));
}

TEST_CASE("Rect containment is inclusive", "[math][rect]")
{
    const Rectd outer{0.0, 0.0, 100.0, 50.0};

    REQUIRE(outer.contains(Vec2d{100.0, 50.0}));
    REQUIRE_FALSE(outer.contains(Vec2d{100.5, 0.0}));
    REQUIRE(outer.contains(Rectd{0.0, 0.0, 100.0, 50.0}));
    REQUIRE_FALSE(outer.contains(Rectd{-1.0, 0.0, 10.0, 10.0}));
}

TEST_CASE("Rect merge covers both inputs", "[math][rect]")
{
    const Rectd a{0.0, 0.0, 10.0, 10.0};
    const Rectd b{20.0, -5.0, 5.0, 5.0};
    const Rectd u = a.merge(b);

    REQUIRE(u == Rectd{0.0, -5.0, 25.0, 15.0});
    REQUIRE(u.contains(a));
    REQUIRE(u.contains(b));
}

TEST_CASE("Rect fromCorners orders its corners", "[math][rect]")
{
    const auto r = Rectd::fromCorners(Vec2d{10.0, 2.0}, Vec2d{4.0, 8.0});

    REQUIRE(r == Rectd{4.0, 2.0, 6.0, 6.0});
    REQUIRE(r.isValid());
    REQUIRE_FALSE(Rectd{}.isValid());
}

TEST_CASE("Vec2 arithmetic", "[math][vec2]")
{
    Vec2d v{3.0, -4.0};
    v += Vec2d{1.0, 1.0};

    REQUIRE(v == Vec2d{4.0, -3.0});
    REQUIRE((v * 2.0) == Vec2d{8.0, -6.0});
    REQUIRE(-v == Vec2d{-4.0, 3.0});
    REQUIRE_THAT(v.lengthSquared(), Catch::Matchers::WithinAbs(25.0, 1e-12));
}

TEST_CASE("StateHash is order sensitive", "[math][hash]")
{
    StateHash a;
    StateHash b;
    a.combine(1.0, 2.0);
    b.combine(2.0).combine(1.0);

    REQUIRE(a.digest() != b.digest());
    REQUIRE(a.digest() != StateHash::kOffsetBasis);

    StateHash c;
    c.combine(1.0).combine(2.0);
    REQUIRE(a.digest() == c.digest());
}

TEST_CASE("StateHash of one byte matches FNV-1a", "[math][hash]")
{
    StateHash h;
    h.combine(core::u8{0x61});

    REQUIRE(h.digest() == 0xaf63dc4c8601ec8cULL);
}
