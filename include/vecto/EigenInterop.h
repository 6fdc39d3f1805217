#ifndef VECTO_EIGEN_INTEROP_H_INCLUDED_
#define VECTO_EIGEN_INTEROP_H_INCLUDED_

#include "Vector2.h"

// Third party headers
#include <Eigen/Core>

namespace Vecto { namespace Geometry {
	/// Copy into an Eigen column vector
	/// \param v Vector
	/// \return (v.x, v.y) as a 2x1 matrix
	template<class T>
	Eigen::Matrix<T, 2, 1> to_eigen(const Vector2<T> &v) {
		return Eigen::Matrix<T, 2, 1>(v.x, v.y);
	}

	/// Copy out of an Eigen column vector
	/// \param m Matrix
	/// \return The vector (m.x(), m.y())
	template<class T>
	Vector2<T> from_eigen(const Eigen::Matrix<T, 2, 1> &m) {
		return Vector2<T>(m.x(), m.y());
	}

	typedef Eigen::Matrix<float, 2, 1>  EigenVector2f;
	typedef Eigen::Matrix<double, 2, 1> EigenVector2d;
	typedef Eigen::Matrix<int, 2, 1>    EigenVector2i;
}}

#endif
