#include "vecto/EigenInterop.h"

// Third party headers
#include "gtest/gtest.h"

using namespace Vecto::Geometry;

namespace Vecto
{
  namespace Test
  {
    namespace Geometry
    {
      TEST(Geometry_EigenInterop, ToEigen)
      {
        EigenVector2d m = to_eigen(Vector2d(9.0, 8.5));
        EXPECT_EQ(9.0, m.x()) << "X value not copied";
        EXPECT_EQ(8.5, m.y()) << "Y value not copied";

        EigenVector2i i = to_eigen(Vector2i(-3, 4));
        EXPECT_EQ(-3, i.x());
        EXPECT_EQ(4, i.y());
      }

      TEST(Geometry_EigenInterop, FromEigen)
      {
        EigenVector2f m(1.5f, -2.0f);
        EXPECT_EQ(Vector2f(1.5f, -2.0f), from_eigen(m));
      }

      TEST(Geometry_EigenInterop, AgreesWithEigenMath)
      {
        Vector2d a(3.0, -4.0), b(0.5, 2.0);
        EXPECT_EQ(to_eigen(a).norm(), a.length());
        EXPECT_EQ(to_eigen(a).squaredNorm(), a.length_squared());
        EXPECT_EQ(to_eigen(a).dot(to_eigen(b)), a.dot(b));
        EXPECT_EQ(a + b, from_eigen<double>(to_eigen(a) + to_eigen(b)));
        EXPECT_EQ(a * 2.0, from_eigen<double>(to_eigen(a) * 2.0));
      }
    }
  }
}
