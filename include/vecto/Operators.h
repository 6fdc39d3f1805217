#ifndef VECTO_OPERATORS_H_INCLUDED_
#define VECTO_OPERATORS_H_INCLUDED_

#include <cmath>
#include <type_traits>

namespace Vecto { namespace Geometry {
	template<class T>
	struct Vector2;

	namespace detail {
		/// One functor per arithmetic operator. apply() returns the result,
		/// assign() updates the left operand in place.
		struct Add {
			template<class T>
			static T apply(const T &a, const T &b) { return a + b; }

			template<class T>
			static void assign(T &a, const T &b) { a += b; }
		};

		struct Sub {
			template<class T>
			static T apply(const T &a, const T &b) { return a - b; }

			template<class T>
			static void assign(T &a, const T &b) { a -= b; }
		};

		struct Mul {
			template<class T>
			static T apply(const T &a, const T &b) { return a * b; }

			template<class T>
			static void assign(T &a, const T &b) { a *= b; }
		};

		struct Div {
			template<class T>
			static T apply(const T &a, const T &b) { return a / b; }

			template<class T>
			static void assign(T &a, const T &b) { a /= b; }
		};

		/// Truncated remainder, the result takes the sign of the dividend.
		/// Built-in % has no floating point overload so those go to fmod.
		struct Rem {
			template<class T>
			static T apply(const T &a, const T &b) {
				return apply(a, b, std::is_floating_point<T>());
			}

			template<class T>
			static void assign(T &a, const T &b) {
				assign(a, b, std::is_floating_point<T>());
			}

		private:
			template<class T>
			static T apply(const T &a, const T &b, std::true_type) { return std::fmod(a, b); }

			template<class T>
			static T apply(const T &a, const T &b, std::false_type) { return a % b; }

			template<class T>
			static void assign(T &a, const T &b, std::true_type) { a = std::fmod(a, b); }

			template<class T>
			static void assign(T &a, const T &b, std::false_type) { a %= b; }
		};

		template<class Op, class T>
		Vector2<T> componentwise(const Vector2<T> &left, const Vector2<T> &right) {
			return Vector2<T>(Op::apply(left.x, right.x), Op::apply(left.y, right.y));
		}

		template<class Op, class T>
		Vector2<T> broadcast(const Vector2<T> &left, const T &right) {
			return Vector2<T>(Op::apply(left.x, right), Op::apply(left.y, right));
		}

		template<class Op, class T>
		Vector2<T> &componentwise_assign(Vector2<T> &left, const Vector2<T> &right) {
			Op::assign(left.x, right.x);
			Op::assign(left.y, right.y);
			return left;
		}

		template<class Op, class T>
		Vector2<T> &broadcast_assign(Vector2<T> &left, const T &right) {
			Op::assign(left.x, right);
			Op::assign(left.y, right);
			return left;
		}
	}

/// Stamps the binary and compound assignment overloads of one operator into
/// Vector2, for both a vector and a scalar right hand side. The scalar is
/// converted to T first, so Vector2i(5, 5) * 2.5 scales by 2.
/// Undefined again once Vector2 is complete.
#define VECTO_VECTOR2_OPERATOR(op, Op)                                        \
	Vector2<T> operator op(const Vector2<T> &other) const {                  \
		return detail::componentwise<detail::Op>(*this, other);               \
	}                                                                         \
	Vector2<T> operator op(const T &other) const {                           \
		return detail::broadcast<detail::Op>(*this, other);                   \
	}                                                                         \
	Vector2<T> &operator op##=(const Vector2<T> &other) {                    \
		return detail::componentwise_assign<detail::Op>(*this, other);        \
	}                                                                         \
	Vector2<T> &operator op##=(const T &other) {                             \
		return detail::broadcast_assign<detail::Op>(*this, other);            \
	}
}}

#endif
