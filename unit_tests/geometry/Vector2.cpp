#include "vecto/Vector2.h"

// Third party headers
#include "gtest/gtest.h"

#include <array>
#include <cstddef>
#include <limits>
#include <set>
#include <sstream>
#include <tuple>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace Vecto::Geometry;

namespace Vecto
{
  namespace Test
  {
    namespace Geometry
    {
      TEST(Geometry_Vector2, OnCopy)
      {
        Vector2d v1(9.0, 8.5), v2;
        v2 = v1;
        EXPECT_EQ(v1.x, v2.x) << "X value not copied";
        EXPECT_EQ(v1.y, v2.y) << "Y value not copied";
      }

      TEST(Geometry_Vector2, DefaultIsZero)
      {
        Vector2d d;
        Vector2i i;
        EXPECT_EQ(0.0, d.x);
        EXPECT_EQ(0.0, d.y);
        EXPECT_EQ(0, i.x);
        EXPECT_EQ(0, i.y);
        EXPECT_EQ(Vector2d::ZERO, d);
      }

      TEST(Geometry_Vector2, Splat)
      {
        EXPECT_EQ(Vector2i(4, 4), Vector2i::splat(4));
        EXPECT_EQ(Vector2f(2.5f, 2.5f), Vector2f::splat(2.5f));
        EXPECT_EQ(Vector2i::splat(-3), Vector2i(-3)) << "Single value constructor should splat";
      }

      TEST(Geometry_Vector2, FromTupleArrayPair)
      {
        Vector2i from_tuple(std::make_tuple(1, 2));
        Vector2i from_pair(std::make_pair(3, 4));
        std::array<int, 2> a = {{5, 6}};
        Vector2i from_array(a);
        EXPECT_EQ(Vector2i(1, 2), from_tuple);
        EXPECT_EQ(Vector2i(3, 4), from_pair);
        EXPECT_EQ(Vector2i(5, 6), from_array);
      }

      TEST(Geometry_Vector2, ToTupleRoundTrip)
      {
        std::tuple<double, double> t(1.5, -2.25);
        Vector2d v(t);
        EXPECT_EQ(t, v.to_tuple());
        EXPECT_EQ(std::make_tuple(7, 8), Vector2i(7, 8).to_tuple());
        EXPECT_EQ(std::make_pair(7, 8), Vector2i(7, 8).to_pair());
        std::array<int, 2> expected = {{7, 8}};
        EXPECT_EQ(expected, Vector2i(7, 8).to_array());
      }

      TEST(Geometry_Vector2, TryFrom)
      {
        const float values[] = {1.0f, 2.0f, 3.0f};
        Vector2f out(9.0f, 9.0f);

        EXPECT_FALSE(Vector2f::try_from(values, 0, out));
        EXPECT_FALSE(Vector2f::try_from(values, 1, out));
        EXPECT_FALSE(Vector2f::try_from(values, 3, out));
        EXPECT_EQ(Vector2f(9.0f, 9.0f), out) << "Failed conversion must leave the output untouched";

        EXPECT_TRUE(Vector2f::try_from(values, 2, out));
        EXPECT_EQ(Vector2f(values[0], values[1]), out);
      }

      TEST(Geometry_Vector2, FromSlice)
      {
        std::vector<int> two = {4, -4};
        EXPECT_EQ(Vector2i(4, -4), Vector2i::from_slice(two));

        std::array<double, 2> arr = {{0.5, 1.5}};
        EXPECT_EQ(Vector2d(0.5, 1.5), Vector2d::from_slice(arr));

        EXPECT_EQ(Vector2i(1, 2), Vector2i::from_slice({1, 2}));
      }

      TEST(Geometry_Vector2, FromSliceWrongLength)
      {
        std::vector<int> empty;
        std::vector<int> three = {1, 2, 3};
        EXPECT_THROW(Vector2i::from_slice(empty), InvalidLength);
        EXPECT_THROW(Vector2i::from_slice(three), InvalidLength);
        EXPECT_THROW(Vector2i::from_slice({1}), InvalidLength);
        EXPECT_THROW(Vector2i::from_slice(three), std::length_error);

        try
        {
          Vector2i::from_slice(three);
          FAIL() << "Expected InvalidLength";
        }
        catch (const InvalidLength& e)
        {
          EXPECT_STREQ("invalid length", e.what());
        }
      }

      TEST(Geometry_Vector2, Layout)
      {
        EXPECT_EQ(2 * sizeof(float), sizeof(Vector2f));
        EXPECT_EQ(2 * sizeof(double), sizeof(Vector2d));
        EXPECT_EQ(2 * sizeof(int), sizeof(Vector2i));

        Vector2d v(3.0, 4.0);
        EXPECT_EQ(&v.x, v.data());
        EXPECT_EQ(&v.y, v.data() + 1);

        std::vector<Vector2f> points = {Vector2f(1.0f, 2.0f), Vector2f(3.0f, 4.0f)};
        const float* flat = points.front().data();
        EXPECT_EQ(1.0f, flat[0]);
        EXPECT_EQ(2.0f, flat[1]);
        EXPECT_EQ(3.0f, flat[2]);
        EXPECT_EQ(4.0f, flat[3]);
      }

      TEST(Geometry_Vector2, Constants)
      {
        EXPECT_EQ(Vector2f(0.0f, 0.0f), Vector2f::ZERO);
        EXPECT_EQ(Vector2f(1.0f, 0.0f), Vector2f::RIGHT);
        EXPECT_EQ(Vector2f(-1.0f, 0.0f), Vector2f::LEFT);
        EXPECT_EQ(Vector2f(0.0f, -1.0f), Vector2f::UP) << "Y grows downward";
        EXPECT_EQ(Vector2f(0.0f, 1.0f), Vector2f::DOWN) << "Y grows downward";
        EXPECT_EQ(Vector2d(0.0, -1.0), Vector2d::UP);
        EXPECT_EQ(-Vector2d::DOWN, Vector2d::UP);
        EXPECT_EQ(-Vector2d::RIGHT, Vector2d::LEFT);
      }

      TEST(Geometry_Vector2, Equality)
      {
        EXPECT_TRUE(Vector2i(1, 2) == Vector2i(1, 2));
        EXPECT_FALSE(Vector2i(1, 2) == Vector2i(2, 1));
        EXPECT_TRUE(Vector2i(1, 2) != Vector2i(1, 3));
        EXPECT_FALSE(Vector2i(1, 2) != Vector2i(1, 2));
      }

      TEST(Geometry_Vector2, LexicographicOrder)
      {
        EXPECT_LT(Vector2i(1, 9), Vector2i(2, 0)) << "X decides first";
        EXPECT_LT(Vector2i(1, 2), Vector2i(1, 3)) << "Y breaks ties";
        EXPECT_FALSE(Vector2i(1, 3) < Vector2i(1, 3));
        EXPECT_LE(Vector2i(1, 3), Vector2i(1, 3));
        EXPECT_GT(Vector2i(2, 0), Vector2i(1, 9));
        EXPECT_GE(Vector2i(2, 0), Vector2i(2, 0));

        std::set<Vector2i> sorted = {Vector2i(2, 1), Vector2i(1, 5), Vector2i(1, 2)};
        std::vector<Vector2i> order(sorted.begin(), sorted.end());
        ASSERT_EQ(3u, order.size());
        EXPECT_EQ(Vector2i(1, 2), order[0]);
        EXPECT_EQ(Vector2i(1, 5), order[1]);
        EXPECT_EQ(Vector2i(2, 1), order[2]);
      }

      TEST(Geometry_Vector2, PartialOrderWithNaN)
      {
        const float nan = std::numeric_limits<float>::quiet_NaN();
        Vec2 a(nan, 0.0f), b(1.0f, 1.0f), z(0.0f, 0.0f);

        EXPECT_FALSE(a < b) << "X cannot be compared, Y must not decide";
        EXPECT_FALSE(b < a);
        EXPECT_FALSE(a > b);
        EXPECT_FALSE(a <= z);
        EXPECT_FALSE(a >= z);
        EXPECT_FALSE(a <= a) << "NaN is not equal to itself";
        EXPECT_FALSE(a == a);

        Vec2 c(1.0f, nan);
        EXPECT_FALSE(c < b);
        EXPECT_FALSE(c <= b);
        EXPECT_FALSE(c >= b);
        EXPECT_TRUE(Vec2(0.0f, nan) < b) << "X decides before Y is looked at";
        EXPECT_TRUE(b > Vec2(0.0f, nan));
      }

      TEST(Geometry_Vector2, FloatOrder)
      {
        EXPECT_LT(Vec2(-0.5f, 9.0f), Vec2(0.25f, -9.0f));
        EXPECT_LT(Vec2(0.25f, -1.5f), Vec2(0.25f, -1.0f));
        EXPECT_LE(Vec2(0.25f, -1.0f), Vec2(0.25f, -1.0f));
        EXPECT_GE(Vec2(0.25f, -1.0f), Vec2(0.25f, -1.0f));
        EXPECT_LE(Vec2(0.0f, 0.0f), Vec2(-0.0f, 0.0f)) << "signed zeros compare equal";
        EXPECT_FALSE(Vec2(0.25f, -1.0f) < Vec2(0.25f, -1.0f));
      }

      TEST(Geometry_Vector2, Hash)
      {
        std::hash<Vector2i> hasher;
        EXPECT_EQ(hasher(Vector2i(3, 4)), hasher(Vector2i(3, 4)));
        EXPECT_NE(hasher(Vector2i(3, 4)), hasher(Vector2i(4, 3))) << "Hash should depend on component order";

        std::unordered_set<Vector2i> seen;
        seen.insert(Vector2i(1, 1));
        seen.insert(Vector2i(1, 1));
        seen.insert(Vector2i(-1, 1));
        EXPECT_EQ(2u, seen.size());
      }

      TEST(Geometry_Vector2, DoubleNegation)
      {
        Vector2d v(1.25, -7.5);
        EXPECT_EQ(Vector2d(-1.25, 7.5), -v);
        EXPECT_EQ(v, -(-v));
        EXPECT_EQ(Vector2i(3, -4), -(-Vector2i(3, -4)));
      }

      TEST(Geometry_Vector2, ComponentCast)
      {
        Vector2d d(2.75, -1.5);
        Vector2i i = static_cast<Vector2i>(d);
        EXPECT_EQ(Vector2i(2, -1), i) << "Cast should truncate like the component cast";
        EXPECT_EQ(Vector2f(2.75f, -1.5f), static_cast<Vector2f>(d));
      }

      TEST(Geometry_Vector2, IntegerScalarIsConverted)
      {
        // The scalar overload takes a component, so 2.5 becomes 2 before scaling
        EXPECT_EQ(Vector2i(10, 10), Vector2i(5, 5) * 2.5);
        EXPECT_EQ(Vector2i(2, 2), Vector2i(5, 5) / 2.9);
        Vector2i v(3, -3);
        v += 1.75;
        EXPECT_EQ(Vector2i(4, -2), v);
      }

      TEST(Geometry_Vector2, OperatorMacroStaysInHeader)
      {
#ifdef VECTO_VECTOR2_OPERATOR
        FAIL() << "VECTO_VECTOR2_OPERATOR leaked out of Vector2.h";
#endif
        SUCCEED();
      }

      TEST(Geometry_Vector2, StreamOutput)
      {
        std::ostringstream os;
        os << Vector2i(3, -4);
        EXPECT_EQ("(3, -4)", os.str());
      }
    }
  }
}
