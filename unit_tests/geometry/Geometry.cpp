#include "vecto/Kinda.h"
#include "vecto/Vector2.h"

// Third party headers
#include "gtest/gtest.h"

#include <cmath>
#include <limits>

using namespace Vecto::Geometry;

namespace Vecto
{
  namespace Test
  {
    namespace Geometry
    {
      const float PI_F = 3.14159265358979323846f;
      const float TAU_F = 2.0f * PI_F;
      const double PI_D = 3.14159265358979323846;

      TEST(Geometry_Vector2Float, FromAngle)
      {
        EXPECT_EQ(Vec2::RIGHT, Vec2::from_angle(0.0f));
        EXPECT_TRUE(approx_eq(Vec2(0.0f, 1.0f), Vec2::from_angle(PI_F / 2.0f)));
        EXPECT_TRUE(approx_eq(Vector2d::LEFT, Vector2d::from_angle(PI_D)));
      }

      TEST(Geometry_Vector2Float, Angle)
      {
        EXPECT_EQ(0.0f, Vec2::RIGHT.angle());
        EXPECT_EQ(PI_F / 2.0f, Vec2::DOWN.angle()) << "DOWN is +Y";
        EXPECT_EQ(-PI_F / 2.0f, Vec2::UP.angle());
        EXPECT_EQ(-PI_F / 4.0f, Vec2(1.0f, -1.0f).angle());
        EXPECT_EQ(PI_F, Vec2::LEFT.angle());
      }

      TEST(Geometry_Vector2Float, Abs)
      {
        EXPECT_EQ(Vec2(1.5f, 2.0f), Vec2(-1.5f, 2.0f).abs());
        EXPECT_EQ(Vector2d(3.0, 4.0), Vector2d(-3.0, -4.0).abs());
      }

      TEST(Geometry_Vector2Float, CrossAndDot)
      {
        Vector2d a(1.0, 2.0), b(3.0, 4.0);
        EXPECT_EQ(1.0 * 4.0 - 2.0 * 3.0, a.cross(b));
        EXPECT_EQ(-a.cross(b), b.cross(a)) << "cross product is anti-symmetric";
        EXPECT_EQ(1.0 * 3.0 + 2.0 * 4.0, a.dot(b));
        EXPECT_EQ(a.dot(b), b.dot(a));
        EXPECT_EQ(0.0, Vector2d::RIGHT.dot(Vector2d::DOWN));
        EXPECT_EQ(1.0, Vector2d::RIGHT.cross(Vector2d::DOWN));
      }

      TEST(Geometry_Vector2Float, Distance)
      {
        Vector2d a(1.0, 1.0), b(4.0, 5.0);
        EXPECT_EQ(5.0, a.distance_to(b));
        EXPECT_EQ(5.0, b.distance_to(a));
        EXPECT_EQ(25.0, a.distance_squared_to(b));
        EXPECT_EQ(0.0, a.distance_to(a));
      }

      TEST(Geometry_Vector2Float, Length)
      {
        EXPECT_EQ(10.0f * std::sqrt(2.0f), Vec2::splat(10.0f).length());
        EXPECT_EQ(200.0f, Vec2::splat(10.0f).length_squared());
        EXPECT_EQ(5.0, Vector2d(3.0, -4.0).length());
        EXPECT_EQ(0.0, Vector2d::ZERO.length());
      }

      TEST(Geometry_Vector2Float, Orthogonal)
      {
        EXPECT_EQ(Vec2(3.4f, -1.2f), Vec2(1.2f, 3.4f).orthogonal());
        EXPECT_EQ(Vec2::UP, Vec2::RIGHT.orthogonal()) << "counter-clockwise with Y down";
        EXPECT_EQ(Vector2i(2, -1), Vector2i(1, 2).orthogonal()) << "needs only negation";
        Vector2d v(0.3, -2.0);
        EXPECT_EQ(0.0, v.dot(v.orthogonal()));
        EXPECT_EQ(v.length(), v.orthogonal().length());
      }

      TEST(Geometry_Vector2Float, LimitLength)
      {
        const float inv_sqrt2 = 1.0f / std::sqrt(2.0f);
        EXPECT_TRUE(approx_eq(Vec2::splat(inv_sqrt2), Vec2::splat(10.0f).limit_length(1.0f)));
        EXPECT_TRUE(approx_eq(Vec2::splat(inv_sqrt2 * 5.0f), Vec2::splat(10.0f).limit_length(5.0f)));
        EXPECT_EQ(Vec2(0.3f, 0.4f), Vec2(0.3f, 0.4f).limit_length(1.0f)) << "shorter vectors unchanged";
        EXPECT_EQ(Vec2(3.0f, 4.0f), Vec2(3.0f, 4.0f).limit_length(5.0f)) << "equal length unchanged";
      }

      TEST(Geometry_Vector2Float, LimitLengthOfZero)
      {
        EXPECT_EQ(Vec2::ZERO, Vec2::ZERO.limit_length(1.0f));
        EXPECT_EQ(Vec2::ZERO, Vec2::ZERO.limit_length(0.0f));
        EXPECT_EQ(Vec2::ZERO, Vec2::ZERO.limit_length(-3.0f));
        EXPECT_EQ(Vector2d::ZERO, Vector2d::ZERO.limit_length(100.0));

        Vec2 limited = Vec2::ZERO.limit_length(0.0f);
        EXPECT_FALSE(std::isnan(limited.x));
        EXPECT_FALSE(std::isnan(limited.y));
      }

      TEST(Geometry_Vector2Float, Normalized)
      {
        EXPECT_TRUE(approx_eq(Vec2::RIGHT, Vec2::RIGHT.normalized()));
        EXPECT_TRUE(approx_eq(Vec2::splat(std::sqrt(0.5f)), Vec2::splat(1.0f).normalized()));
        EXPECT_TRUE(approx_eq(Vector2d(0.6, -0.8), Vector2d(3.0, -4.0).normalized()));
        EXPECT_TRUE(approx_eq(1.0, Vector2d(-12.5, 0.001).normalized().length()));
      }

      TEST(Geometry_Vector2Float, NormalizedZero)
      {
        Vec2 n = Vec2::ZERO.normalized();
        EXPECT_EQ(Vec2::ZERO, n);
        EXPECT_FALSE(std::isnan(n.x));
        EXPECT_FALSE(std::isnan(n.y));
        EXPECT_EQ(Vector2d::ZERO, Vector2d::ZERO.normalized());
      }

      TEST(Geometry_Vector2Float, NormalizedTiny)
      {
        // Squared length underflows to zero, so the vector passes through
        Vector2d tiny(std::numeric_limits<double>::denorm_min(), 0.0);
        EXPECT_EQ(tiny, tiny.normalized());
      }

      TEST(Geometry_Vector2Float, Rotated)
      {
        Vec2 v(1.2f, 3.4f);
        EXPECT_TRUE(approx_eq(v, v.rotated(TAU_F))) << "full turn";
        EXPECT_TRUE(approx_eq(Vec2(-3.4f, 1.2f), v.rotated(TAU_F / 4.0f)));
        EXPECT_TRUE(kinda_eq(Vec2(-3.5444863f, -0.6607695f), v.rotated(TAU_F / 3.0f), 0.0001f));
        EXPECT_TRUE(approx_eq(v.rotated(TAU_F / 2.0f), v.rotated(TAU_F / -2.0f)));
        EXPECT_EQ(v, v.rotated(0.0f));
      }

      TEST(Geometry_Vector2Float, RotatedKeepsLength)
      {
        Vector2d v(-2.0, 0.75);
        for (int step = 0; step < 16; step++)
        {
          Vector2d r = v.rotated(step * PI_D / 8.0);
          EXPECT_NEAR(v.length(), r.length(), 1e-12) << "step " << step;
        }
      }

      TEST(Geometry_Vector2Float, CeilFloor)
      {
        EXPECT_EQ(Vec2(2.0f, -1.0f), Vec2(1.2f, -1.7f).ceil());
        EXPECT_EQ(Vec2(1.0f, -2.0f), Vec2(1.2f, -1.7f).floor());
        EXPECT_EQ(Vector2d(3.0, 3.0), Vector2d(3.0, 3.0).floor());
        EXPECT_EQ(Vector2d(3.0, -0.0), Vector2d(2.5, -0.5).ceil());
      }
    }
  }
}
