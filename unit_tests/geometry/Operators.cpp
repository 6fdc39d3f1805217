#include "vecto/Vector2.h"

// Third party headers
#include "gtest/gtest.h"

#include <cmath>

using namespace Vecto::Geometry;

namespace Vecto
{
  namespace Test
  {
    namespace Geometry
    {
      // Every operator, binary and compound, must agree with the scalar
      // operator applied to each component on its own.
      template<typename T>
      class Geometry_Vector2Operators : public ::testing::Test
      {
      protected:
        Vector2<T> a_ = Vector2<T>(T(17), T(-9));
        Vector2<T> b_ = Vector2<T>(T(5), T(4));
        T s_ = T(3);
      };

      typedef ::testing::Types<int, long, float, double> ComponentTypes;
      TYPED_TEST_SUITE(Geometry_Vector2Operators, ComponentTypes);

      template<typename T>
      T component_remainder(T a, T b) { return a % b; }

      float component_remainder(float a, float b) { return std::fmod(a, b); }

      double component_remainder(double a, double b) { return std::fmod(a, b); }

      TYPED_TEST(Geometry_Vector2Operators, VectorVector)
      {
        typedef TypeParam T;
        const Vector2<T> a = this->a_, b = this->b_;

        EXPECT_EQ(Vector2<T>(a.x + b.x, a.y + b.y), a + b);
        EXPECT_EQ(Vector2<T>(a.x - b.x, a.y - b.y), a - b);
        EXPECT_EQ(Vector2<T>(a.x * b.x, a.y * b.y), a * b);
        EXPECT_EQ(Vector2<T>(a.x / b.x, a.y / b.y), a / b);
        EXPECT_EQ(Vector2<T>(component_remainder(a.x, b.x), component_remainder(a.y, b.y)), a % b);
      }

      TYPED_TEST(Geometry_Vector2Operators, VectorScalar)
      {
        typedef TypeParam T;
        const Vector2<T> a = this->a_;
        const T s = this->s_;

        EXPECT_EQ(Vector2<T>(a.x + s, a.y + s), a + s);
        EXPECT_EQ(Vector2<T>(a.x - s, a.y - s), a - s);
        EXPECT_EQ(Vector2<T>(a.x * s, a.y * s), a * s);
        EXPECT_EQ(Vector2<T>(a.x / s, a.y / s), a / s);
        EXPECT_EQ(Vector2<T>(component_remainder(a.x, s), component_remainder(a.y, s)), a % s);
      }

      TYPED_TEST(Geometry_Vector2Operators, CompoundMatchesBinary)
      {
        typedef TypeParam T;
        const Vector2<T> a = this->a_, b = this->b_;
        const T s = this->s_;
        Vector2<T> v;

        v = a; v += b; EXPECT_EQ(a + b, v);
        v = a; v -= b; EXPECT_EQ(a - b, v);
        v = a; v *= b; EXPECT_EQ(a * b, v);
        v = a; v /= b; EXPECT_EQ(a / b, v);
        v = a; v %= b; EXPECT_EQ(a % b, v);

        v = a; v += s; EXPECT_EQ(a + s, v);
        v = a; v -= s; EXPECT_EQ(a - s, v);
        v = a; v *= s; EXPECT_EQ(a * s, v);
        v = a; v /= s; EXPECT_EQ(a / s, v);
        v = a; v %= s; EXPECT_EQ(a % s, v);
      }

      TYPED_TEST(Geometry_Vector2Operators, OperandsUnchanged)
      {
        typedef TypeParam T;
        Vector2<T> a = this->a_, b = this->b_;
        Vector2<T> sum = a + b;
        Vector2<T> scaled = b * this->s_;
        EXPECT_EQ(this->a_, a);
        EXPECT_EQ(this->b_, b);
        EXPECT_NE(sum, a);
        EXPECT_NE(scaled, b);
      }

      TYPED_TEST(Geometry_Vector2Operators, AddThenSubtract)
      {
        EXPECT_EQ(this->a_, (this->a_ + this->b_) - this->b_);
      }

      TEST(Geometry_Vector2, CompoundReturnsSelf)
      {
        Vector2i v(1, 2);
        Vector2i& r = (v += Vector2i(1, 1));
        EXPECT_EQ(&v, &r);
        (v *= 2) -= 1;
        EXPECT_EQ(Vector2i(3, 5), v);
      }

      TEST(Geometry_Vector2, FloatRemainderFollowsDividend)
      {
        Vector2d v(-7.5, 7.5);
        EXPECT_EQ(Vector2d(-1.5, 1.5), v % 2.0);
        v %= Vector2d(2.0, -2.0);
        EXPECT_EQ(Vector2d(-1.5, 1.5), v);
        EXPECT_EQ(Vector2i(-1, 1), Vector2i(-7, 7) % 2);
      }

      TEST(Geometry_Vector2, ScaleThenDivide)
      {
        Vector2d a(1.2, -3.4);
        for (double s : {0.5, 3.0, -7.25, 1e-3})
        {
          Vector2d back = (a * s) / s;
          EXPECT_NEAR(a.x, back.x, 1e-12) << "scalar " << s;
          EXPECT_NEAR(a.y, back.y, 1e-12) << "scalar " << s;
        }
      }

      TEST(Geometry_Vector2, ScalarPromotes)
      {
        Vector2d v(1.0, 2.0);
        EXPECT_EQ(Vector2d(2.0, 4.0), v * 2);
        EXPECT_EQ(Vector2d(1.5, 2.5), v + 0.5f);
      }
    }
  }
}
