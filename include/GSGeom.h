// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GSTypes.h"

//system
#include <cmath>

namespace GeoStatsCoreLib
{
	//! 3-Tuple structure (templated version)
	/** 2D locations are stored with z = 0 and 1D locations with y = z = 0.
	**/
	template <typename Type> class Vector3Tpl
	{
	public:

		// The 3 tuple values as a union (array/separate values)
		union
		{
			struct
			{
				Type x, y, z;
			};
			Type u[3];
		};

		//! Default constructor
		/** Inits vector to (0,0,0).
		**/
		constexpr inline Vector3Tpl() : x(0), y(0), z(0) {}

		//! Constructor from a triplet of coordinates
		constexpr inline Vector3Tpl(Type _x, Type _y, Type _z) : x(_x), y(_y), z(_z) {}

		//! Constructor from an array of 3 elements
		static inline Vector3Tpl fromArray(const Type a[3]) { return Vector3Tpl(a[0], a[1], a[2]); }

		//! Dot product
		inline Type dot(const Vector3Tpl& v) const { return x*v.x + y*v.y + z*v.z; }
		//! Cross product
		inline Vector3Tpl cross(const Vector3Tpl &v) const { return Vector3Tpl((y*v.z) - (z*v.y), (z*v.x) - (x*v.z), (x*v.y) - (y*v.x)); }
		//! Returns vector square norm
		inline Type norm2() const { return x*x + y*y + z*z; }
		//! Returns vector norm
		inline Type norm() const { return std::sqrt(norm2()); }
		//! Sets vector norm to unity
		inline void normalize() { Type n = norm(); if (n > 0) *this /= n; }
		//! Returns a normalized vector which is orthogonal to this one (as any unit vector of the orthogonal plane)
		inline Vector3Tpl orthogonal() const
		{
			Vector3Tpl ort;
			if (std::abs(x) <= std::abs(y) && std::abs(x) <= std::abs(z))
				ort = Vector3Tpl(0, z, -y);
			else if (std::abs(y) <= std::abs(x) && std::abs(y) <= std::abs(z))
				ort = Vector3Tpl(-z, 0, x);
			else
				ort = Vector3Tpl(y, -x, 0);
			ort.normalize();
			return ort;
		}

		//! Inverse operator
		inline Vector3Tpl operator - () const { return Vector3Tpl(-x, -y, -z); }
		//! In-place addition operator
		inline Vector3Tpl& operator += (const Vector3Tpl& v) { x += v.x; y += v.y; z += v.z; return *this; }
		//! In-place subtraction operator
		inline Vector3Tpl& operator -= (const Vector3Tpl& v) { x -= v.x; y -= v.y; z -= v.z; return *this; }
		//! In-place multiplication (by a scalar) operator
		inline Vector3Tpl& operator *= (Type v) { x *= v; y *= v; z *= v; return *this; }
		//! In-place division (by a scalar) operator
		inline Vector3Tpl& operator /= (Type v) { x /= v; y /= v; z /= v; return *this; }
		//! Addition operator
		inline Vector3Tpl operator + (const Vector3Tpl& v) const { return Vector3Tpl(x + v.x, y + v.y, z + v.z); }
		//! Subtraction operator
		inline Vector3Tpl operator - (const Vector3Tpl& v) const { return Vector3Tpl(x - v.x, y - v.y, z - v.z); }
		//! Multiplication operator
		inline Vector3Tpl operator * (Type s) const { return Vector3Tpl(x*s, y*s, z*s); }
		//! Division operator
		inline Vector3Tpl operator / (Type s) const { return Vector3Tpl(x / s, y / s, z / s); }
		//! Direct coordinate access
		inline Type& operator [] (unsigned i) { return u[i]; }
		//! Direct coordinate access (const)
		inline const Type& operator [] (unsigned i) const { return u[i]; }
	};

	//! Multiplication of a 3D vector by a scalar (front) operator
	template <typename Type> inline Vector3Tpl<Type> operator * (Type s, const Vector3Tpl<Type>& v)
	{
		return v * s;
	}

	//! Double 3D Vector
	using GSVector3d = Vector3Tpl<double>;

	//! Default 3D Vector
	using GSVector3 = Vector3Tpl<PointCoordinateType>;
}
