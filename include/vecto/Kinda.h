#ifndef VECTO_KINDA_H_INCLUDED_
#define VECTO_KINDA_H_INCLUDED_

#include "Traits.h"
#include "Vector2.h"

namespace Vecto { namespace Geometry {
	/// Tolerance used by approx_eq.
	constexpr double DEFAULT_TOLERANCE = 0.00001;

	/// True when \a a and \a b are equal or closer than \a tolerance.
	template<class T>
	bool kinda_eq(T a, T b, T tolerance) {
		static_assert(FloatTraits<T>::supported, "kinda_eq needs a floating point type");
		if (a == b)
			return true;
		return FloatTraits<T>::abs(a - b) < tolerance;
	}

	/// Both components within \a tolerance of each other.
	template<class T>
	bool kinda_eq(const Vector2<T> &a, const Vector2<T> &b, T tolerance) {
		return kinda_eq(a.x, b.x, tolerance) && kinda_eq(a.y, b.y, tolerance);
	}

	template<class T>
	bool approx_eq(T a, T b) {
		return kinda_eq(a, b, T(DEFAULT_TOLERANCE));
	}

	template<class T>
	bool approx_eq(const Vector2<T> &a, const Vector2<T> &b) {
		return kinda_eq(a, b, T(DEFAULT_TOLERANCE));
	}
}}

#endif
