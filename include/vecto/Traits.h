#ifndef VECTO_TRAITS_H_INCLUDED_
#define VECTO_TRAITS_H_INCLUDED_

#include <cmath>

namespace Vecto { namespace Geometry {
	/// Capability set for the floating point only operations of Vector2:
	/// cosine, sine, arctangent, square root, absolute value and a zero.
	/// Component types without a specialisation have supported == false.
	template<class T>
	struct FloatTraits {
		static const bool supported = false;
	};

	/// Capability set for componentwise rounding.
	template<class T>
	struct RoundingTraits {
		static const bool supported = false;
	};

	namespace detail {
		template<class T>
		struct StdFloatTraits {
			static const bool supported = true;

			static T zero() { return T(0); }

			static T cos(T a) { return std::cos(a); }

			static T sin(T a) { return std::sin(a); }

			static T atan2(T y, T x) { return std::atan2(y, x); }

			static T sqrt(T a) { return std::sqrt(a); }

			static T abs(T a) { return std::abs(a); }
		};

		template<class T>
		struct StdRoundingTraits {
			static const bool supported = true;

			static T ceil(T a) { return std::ceil(a); }

			static T floor(T a) { return std::floor(a); }
		};
	}

	template<> struct FloatTraits<float> : detail::StdFloatTraits<float> {};
	template<> struct FloatTraits<double> : detail::StdFloatTraits<double> {};
	template<> struct FloatTraits<long double> : detail::StdFloatTraits<long double> {};

	template<> struct RoundingTraits<float> : detail::StdRoundingTraits<float> {};
	template<> struct RoundingTraits<double> : detail::StdRoundingTraits<double> {};
	template<> struct RoundingTraits<long double> : detail::StdRoundingTraits<long double> {};
}}

#endif
