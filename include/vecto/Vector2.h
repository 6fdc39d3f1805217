#ifndef VECTO_VECTOR2_H_INCLUDED_
#define VECTO_VECTOR2_H_INCLUDED_

// Local headers
#include "Messages.h"
#include "Operators.h"
#include "Traits.h"

// Standard library headers
#include <array>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Vecto { namespace Geometry {
	/// Thrown when a sequence that does not hold exactly two values is
	/// converted to a Vector2.
	class InvalidLength : public std::length_error {
	public:
		InvalidLength() : std::length_error("invalid length") {}
	};

	/// Two component vector. Y grows downward, so UP is (0, -1).
	template<class T>
	struct Vector2 {
		T x;
		T y;

		static const Vector2<T> ZERO;
		static const Vector2<T> RIGHT;
		static const Vector2<T> LEFT;
		static const Vector2<T> UP;
		static const Vector2<T> DOWN;

		constexpr Vector2() : x(), y() {}

		constexpr Vector2(T _x, T _y) : x(_x), y(_y) {}

		/// Splats the value.
		explicit constexpr Vector2(T s) : x(s), y(s) {}

		Vector2(const std::tuple<T, T> &t);

		Vector2(const std::pair<T, T> &p);

		Vector2(const std::array<T, 2> &a);

		static Vector2<T> splat(T s);

		/// Unit vector at \a angle radians from the positive X axis.
		static Vector2<T> from_angle(T angle);

		/// Fills \a out from \a values when \a size is exactly 2.
		/// \return false, leaving \a out untouched, for any other size
		static bool try_from(const T *values, std::size_t size, Vector2<T> &out);

		/// Builds a vector from a container with data() and size().
		/// \throw InvalidLength unless the container holds exactly 2 values
		template<class Container>
		static Vector2<T> from_slice(const Container &values);

		static Vector2<T> from_slice(std::initializer_list<T> values);

		std::tuple<T, T> to_tuple() const;

		std::pair<T, T> to_pair() const;

		std::array<T, 2> to_array() const;

		/// The components as a T[2], x first.
		T *data();

		const T *data() const;

		Vector2<T> abs() const;

		/// Angle to the positive X axis in radians, in [-pi, pi].
		T angle() const;

		T cross(const Vector2<T> &with) const;

		T dot(const Vector2<T> &with) const;

		T distance_to(const Vector2<T> &to) const;

		T distance_squared_to(const Vector2<T> &to) const;

		T length() const;

		T length_squared() const;

		/// Perpendicular vector, rotated 90 degrees counter-clockwise, same length.
		Vector2<T> orthogonal() const;

		/// Scales down to \a len if longer, direction is kept.
		Vector2<T> limit_length(T len) const;

		/// Scales to unit length. A zero vector is returned unchanged.
		/// May lose precision with denormal components.
		Vector2<T> normalized() const;

		Vector2<T> rotated(T angle) const;

		Vector2<T> ceil() const;

		Vector2<T> floor() const;

		Vector2<T> operator-() const;

		VECTO_VECTOR2_OPERATOR(+, Add)
		VECTO_VECTOR2_OPERATOR(-, Sub)
		VECTO_VECTOR2_OPERATOR(*, Mul)
		VECTO_VECTOR2_OPERATOR(/, Div)
		VECTO_VECTOR2_OPERATOR(%, Rem)

		template<class U>
		explicit operator Vector2<U>() const;
	};

#undef VECTO_VECTOR2_OPERATOR

	template<class T>
	const Vector2<T> Vector2<T>::ZERO(T(0), T(0));

	template<class T>
	const Vector2<T> Vector2<T>::RIGHT(T(1), T(0));

	template<class T>
	const Vector2<T> Vector2<T>::LEFT(T(-1), T(0));

	template<class T>
	const Vector2<T> Vector2<T>::UP(T(0), T(-1));

	template<class T>
	const Vector2<T> Vector2<T>::DOWN(T(0), T(1));

	template<class T>
	Vector2<T>::Vector2(const std::tuple<T, T> &t) : x(std::get<0>(t)), y(std::get<1>(t)) {}

	template<class T>
	Vector2<T>::Vector2(const std::pair<T, T> &p) : x(p.first), y(p.second) {}

	template<class T>
	Vector2<T>::Vector2(const std::array<T, 2> &a) : x(a[0]), y(a[1]) {}

	template<class T>
	Vector2<T> Vector2<T>::splat(T s) {
		return Vector2<T>(s, s);
	}

	template<class T>
	Vector2<T> Vector2<T>::from_angle(T angle) {
		static_assert(FloatTraits<T>::supported, "from_angle needs a floating point component type");
		return Vector2<T>(FloatTraits<T>::cos(angle), FloatTraits<T>::sin(angle));
	}

	template<class T>
	bool Vector2<T>::try_from(const T *values, std::size_t size, Vector2<T> &out) {
		if (size != 2)
			return false;
		out = Vector2<T>(values[0], values[1]);
		return true;
	}

	template<class T>
	template<class Container>
	Vector2<T> Vector2<T>::from_slice(const Container &values) {
		Vector2<T> result;
		if (!try_from(values.data(), values.size(), result)) {
			Messages::out(Messages::Debug) << "Vector2 needs 2 values, got " << values.size() << "\n";
			throw InvalidLength();
		}
		return result;
	}

	template<class T>
	Vector2<T> Vector2<T>::from_slice(std::initializer_list<T> values) {
		Vector2<T> result;
		if (!try_from(values.begin(), values.size(), result)) {
			Messages::out(Messages::Debug) << "Vector2 needs 2 values, got " << values.size() << "\n";
			throw InvalidLength();
		}
		return result;
	}

	template<class T>
	std::tuple<T, T> Vector2<T>::to_tuple() const {
		return std::tuple<T, T>(this->x, this->y);
	}

	template<class T>
	std::pair<T, T> Vector2<T>::to_pair() const {
		return std::pair<T, T>(this->x, this->y);
	}

	template<class T>
	std::array<T, 2> Vector2<T>::to_array() const {
		std::array<T, 2> a = {{this->x, this->y}};
		return a;
	}

	template<class T>
	T *Vector2<T>::data() {
		return &this->x;
	}

	template<class T>
	const T *Vector2<T>::data() const {
		return &this->x;
	}

	template<class T>
	Vector2<T> Vector2<T>::abs() const {
		static_assert(FloatTraits<T>::supported, "abs needs a floating point component type");
		return Vector2<T>(FloatTraits<T>::abs(this->x), FloatTraits<T>::abs(this->y));
	}

	template<class T>
	T Vector2<T>::angle() const {
		static_assert(FloatTraits<T>::supported, "angle needs a floating point component type");
		return FloatTraits<T>::atan2(this->y, this->x);
	}

	template<class T>
	T Vector2<T>::cross(const Vector2<T> &with) const {
		static_assert(FloatTraits<T>::supported, "cross needs a floating point component type");
		return this->x * with.y - this->y * with.x;
	}

	template<class T>
	T Vector2<T>::dot(const Vector2<T> &with) const {
		static_assert(FloatTraits<T>::supported, "dot needs a floating point component type");
		return this->x * with.x + this->y * with.y;
	}

	template<class T>
	T Vector2<T>::distance_to(const Vector2<T> &to) const {
		return FloatTraits<T>::sqrt(this->distance_squared_to(to));
	}

	template<class T>
	T Vector2<T>::distance_squared_to(const Vector2<T> &to) const {
		static_assert(FloatTraits<T>::supported, "distance_to needs a floating point component type");
		return (this->x - to.x) * (this->x - to.x) + (this->y - to.y) * (this->y - to.y);
	}

	template<class T>
	T Vector2<T>::length() const {
		return FloatTraits<T>::sqrt(this->length_squared());
	}

	template<class T>
	T Vector2<T>::length_squared() const {
		static_assert(FloatTraits<T>::supported, "length needs a floating point component type");
		return this->x * this->x + this->y * this->y;
	}

	template<class T>
	Vector2<T> Vector2<T>::orthogonal() const {
		return Vector2<T>(this->y, -this->x);
	}

	template<class T>
	Vector2<T> Vector2<T>::limit_length(T len) const {
		T l = this->length();
		if (l > FloatTraits<T>::zero() && len < l)
			return (*this / l) * len;
		return *this;
	}

	template<class T>
	Vector2<T> Vector2<T>::normalized() const {
		T l = this->length_squared();
		if (l != FloatTraits<T>::zero())
			return *this / FloatTraits<T>::sqrt(l);
		return *this;
	}

	template<class T>
	Vector2<T> Vector2<T>::rotated(T angle) const {
		static_assert(FloatTraits<T>::supported, "rotated needs a floating point component type");
		T c = FloatTraits<T>::cos(angle);
		T s = FloatTraits<T>::sin(angle);
		return Vector2<T>(this->x * c - this->y * s, this->x * s + this->y * c);
	}

	template<class T>
	Vector2<T> Vector2<T>::ceil() const {
		static_assert(RoundingTraits<T>::supported, "ceil needs a component type with RoundingTraits");
		return Vector2<T>(RoundingTraits<T>::ceil(this->x), RoundingTraits<T>::ceil(this->y));
	}

	template<class T>
	Vector2<T> Vector2<T>::floor() const {
		static_assert(RoundingTraits<T>::supported, "floor needs a component type with RoundingTraits");
		return Vector2<T>(RoundingTraits<T>::floor(this->x), RoundingTraits<T>::floor(this->y));
	}

	template<class T>
	Vector2<T> Vector2<T>::operator-() const {
		return Vector2<T>(-this->x, -this->y);
	}

	template<class T>
	template<class U>
	Vector2<T>::operator Vector2<U>() const {
		return Vector2<U>((U)this->x, (U)this->y);
	}

	template<class T>
	bool operator==(const Vector2<T> &left, const Vector2<T> &right) {
		return left.x == right.x && left.y == right.y;
	}

	template<class T>
	bool operator!=(const Vector2<T> &left, const Vector2<T> &right) {
		return !(left == right);
	}

	/// Lexicographic on (x, y). A pair of components that cannot be compared
	/// (NaN) makes every relation false.
	template<class T>
	bool operator<(const Vector2<T> &left, const Vector2<T> &right) {
		if (left.x < right.x) return true;
		if (!(left.x == right.x)) return false;
		return left.y < right.y;
	}

	template<class T>
	bool operator>(const Vector2<T> &left, const Vector2<T> &right) {
		return right < left;
	}

	template<class T>
	bool operator<=(const Vector2<T> &left, const Vector2<T> &right) {
		return left < right || left == right;
	}

	template<class T>
	bool operator>=(const Vector2<T> &left, const Vector2<T> &right) {
		return right < left || left == right;
	}

	template<class T>
	std::ostream &operator<<(std::ostream &os, const Vector2<T> &v) {
		return os << "(" << v.x << ", " << v.y << ")";
	}

	typedef Vector2<double> Vector2d;
	typedef Vector2<float>  Vector2f;
	typedef Vector2<int>    Vector2i;

	typedef Vector2f Vec2;

	static_assert(sizeof(Vector2f) == 2 * sizeof(float), "Vector2f must be two packed floats");
	static_assert(sizeof(Vector2d) == 2 * sizeof(double), "Vector2d must be two packed doubles");
	static_assert(sizeof(Vector2i) == 2 * sizeof(int), "Vector2i must be two packed ints");
	static_assert(std::is_standard_layout<Vector2f>::value, "Vector2f must be standard layout");
	static_assert(std::is_standard_layout<Vector2d>::value, "Vector2d must be standard layout");
}}

namespace std {
	template<class T>
	struct hash<Vecto::Geometry::Vector2<T> > {
		std::size_t operator()(const Vecto::Geometry::Vector2<T> &v) const {
			std::size_t seed = std::hash<T>()(v.x);
			seed ^= std::hash<T>()(v.y) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
			return seed;
		}
	};
}

#endif
