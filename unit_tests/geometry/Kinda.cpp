#include "vecto/Kinda.h"

// Third party headers
#include "gtest/gtest.h"

#include <limits>

using namespace Vecto::Geometry;

namespace Vecto
{
  namespace Test
  {
    namespace Geometry
    {
      TEST(Geometry_Kinda, ExactlyEqual)
      {
        EXPECT_TRUE(kinda_eq(1.0f, 1.0f, 0.0f)) << "equality wins even with no tolerance";
        EXPECT_TRUE(approx_eq(2.5, 2.5));
        const double inf = std::numeric_limits<double>::infinity();
        EXPECT_TRUE(approx_eq(inf, inf)) << "inf - inf is NaN, equality must be checked first";
      }

      TEST(Geometry_Kinda, WithinTolerance)
      {
        EXPECT_TRUE(kinda_eq(1.0, 1.05, 0.1));
        EXPECT_FALSE(kinda_eq(1.0, 1.2, 0.1));
        EXPECT_TRUE(kinda_eq(-1.0f, -1.05f, 0.1f));
        EXPECT_FALSE(kinda_eq(1.0, 1.0 + 1e-9, 0.0)) << "tolerance is exclusive";
      }

      TEST(Geometry_Kinda, DefaultTolerance)
      {
        EXPECT_EQ(0.00001, DEFAULT_TOLERANCE);
        EXPECT_TRUE(approx_eq(1.0, 1.000001));
        EXPECT_FALSE(approx_eq(1.0, 1.0001));
        EXPECT_TRUE(approx_eq(0.1f + 0.2f, 0.3f));
      }

      TEST(Geometry_Kinda, NaN)
      {
        const float nan = std::numeric_limits<float>::quiet_NaN();
        EXPECT_FALSE(approx_eq(nan, nan));
        EXPECT_FALSE(approx_eq(Vec2(nan, 0.0f), Vec2(nan, 0.0f)));
      }

      TEST(Geometry_Kinda, VectorNeedsBothComponents)
      {
        Vector2d a(1.0, 2.0);
        EXPECT_TRUE(kinda_eq(a, Vector2d(1.05, 1.95), 0.1));
        EXPECT_FALSE(kinda_eq(a, Vector2d(1.05, 2.5), 0.1)) << "Y outside tolerance";
        EXPECT_FALSE(kinda_eq(a, Vector2d(1.5, 2.05), 0.1)) << "X outside tolerance";
        EXPECT_TRUE(approx_eq(a, Vector2d(1.000001, 1.999999)));
        EXPECT_FALSE(approx_eq(a, Vector2d(1.0, 2.001)));
      }
    }
  }
}
