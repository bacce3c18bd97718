// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//local
#include "GSTypes.h"

//system
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

namespace GeoStatsCoreLib
{
	//! Square matrix
	/** Row-major ordered matrix (i.e. elements are accessed with 'values[row][column]').
		Used to represent transition probability/rate matrices (one row/column per category).
	**/
	template <typename Scalar> class SquareMatrixTpl
	{
	public:

		//! Default constructor
		/** Warning: invalid matrix.
		**/
		SquareMatrixTpl() { init(0); }

		//! Constructor with a given size
		/** \param size the (square) matrix dimension
		**/
		explicit SquareMatrixTpl(unsigned size) { init(size); }

		//! Constructor from row-major values
		/** \param size the (square) matrix dimension
			\param values size*size values (row-major)
		**/
		SquareMatrixTpl(unsigned size, const std::vector<Scalar>& values)
		{
			if (init(size) && values.size() == static_cast<size_t>(size) * size)
			{
				for (unsigned r = 0; r < m_matrixSize; r++)
					for (unsigned c = 0; c < m_matrixSize; c++)
						m_values[r][c] = values[static_cast<size_t>(r) * size + c];
			}
		}

		//! Copy constructor
		SquareMatrixTpl(const SquareMatrixTpl& mat)
		{
			if (init(mat.size()))
			{
				for (unsigned r = 0; r < m_matrixSize; r++)
					for (unsigned c = 0; c < m_matrixSize; c++)
						m_values[r][c] = mat.m_values[r][c];
			}
		}

		//! Default destructor
		virtual ~SquareMatrixTpl()
		{
			invalidate();
		}

		//! Returns matrix size
		inline unsigned size() const { return m_matrixSize; }

		//! Returns matrix validity
		/** Matrix is invalid if its size is 0!
		**/
		inline bool isValid() const { return (m_matrixSize != 0); }

		//! Invalidates matrix
		/** Size is reset to 0.
		**/
		void invalidate()
		{
			delete [] m_underlyingData;
			m_underlyingData = nullptr;

			delete [] m_values;
			m_values = nullptr;

			m_matrixSize = 0;
		}

		//! The matrix rows
		/** public for easy/fast access
		**/
		Scalar** m_values = nullptr;

		//! Sets a particular matrix value
		void inline setValue(unsigned row, unsigned column, Scalar value)
		{
			m_values[row][column] = value;
		}

		//! Returns a particular matrix value
		Scalar inline getValue(unsigned row, unsigned column) const
		{
			return m_values[row][column];
		}

		//! Returns the values as a row-major vector
		std::vector<Scalar> toVector() const
		{
			std::vector<Scalar> values;
			values.reserve(static_cast<size_t>(m_matrixSize) * m_matrixSize);
			for (unsigned r = 0; r < m_matrixSize; r++)
				for (unsigned c = 0; c < m_matrixSize; c++)
					values.push_back(m_values[r][c]);
			return values;
		}

		//! Matrix copy operator
		SquareMatrixTpl& operator = (const SquareMatrixTpl& B)
		{
			if (this == &B)
			{
				return *this;
			}

			if (m_matrixSize != B.size())
			{
				invalidate();
				init(B.size());
			}

			for (unsigned r = 0; r < m_matrixSize; r++)
				for (unsigned c = 0; c < m_matrixSize; c++)
					m_values[r][c] = B.m_values[r][c];

			return *this;
		}

		//! Addition
		SquareMatrixTpl operator + (const SquareMatrixTpl& B) const
		{
			SquareMatrixTpl C = *this;
			C += B;

			return C;
		}

		//! In-place addition
		const SquareMatrixTpl& operator += (const SquareMatrixTpl& B)
		{
			assert(B.size() == m_matrixSize);

			for (unsigned r = 0; r < m_matrixSize; r++)
				for (unsigned c = 0; c < m_matrixSize; c++)
					m_values[r][c] += B.m_values[r][c];

			return *this;
		}

		//! Subtraction
		SquareMatrixTpl operator - (const SquareMatrixTpl& B) const
		{
			SquareMatrixTpl C = *this;
			C -= B;

			return C;
		}

		//! In-place subtraction
		const SquareMatrixTpl& operator -= (const SquareMatrixTpl& B)
		{
			assert(B.size() == m_matrixSize);

			for (unsigned r = 0; r < m_matrixSize; r++)
				for (unsigned c = 0; c < m_matrixSize; c++)
					m_values[r][c] -= B.m_values[r][c];

			return *this;
		}

		//! Multiplication (M = A*B)
		SquareMatrixTpl operator * (const SquareMatrixTpl& B) const
		{
			assert(B.size() == m_matrixSize);

			SquareMatrixTpl C(m_matrixSize);

			for (unsigned r = 0; r < m_matrixSize; r++)
			{
				for (unsigned c = 0; c < m_matrixSize; c++)
				{
					Scalar sum = 0;
					for (unsigned k = 0; k < m_matrixSize; k++)
						sum += m_values[r][k] * B.m_values[k][c];
					C.m_values[r][c] = sum;
				}
			}

			return C;
		}

		//! In-place multiplication
		inline const SquareMatrixTpl& operator *= (const SquareMatrixTpl& B)
		{
			*this = (*this) * B;

			return *this;
		}

		//! Multiplication by a vector
		/** Vec must have the same size as this matrix.
			\param vec input vector
			\param result output vector (= M * vec)
		**/
		void apply(const Scalar vec[], Scalar result[]) const
		{
			for (unsigned r = 0; r < m_matrixSize; r++)
			{
				Scalar sum = 0;
				for (unsigned k = 0; k < m_matrixSize; k++)
					sum += m_values[r][k] * vec[k];
				result[r] = sum;
			}
		}

		//! In-place transpose
		void transpose()
		{
			for (unsigned r = 0; r + 1 < m_matrixSize; r++)
				for (unsigned c = r + 1; c < m_matrixSize; c++)
					std::swap(m_values[r][c], m_values[c][r]);
		}

		//! Returns the transposed version of this matrix
		SquareMatrixTpl transposed() const
		{
			SquareMatrixTpl T(*this);
			T.transpose();

			return T;
		}

		//! Sets all elements to 0
		void clear()
		{
			for (unsigned r = 0; r < m_matrixSize; ++r)
			{
				memset(m_values[r], 0, sizeof(Scalar)*m_matrixSize);
			}
		}

		//! Returns inverse (Gauss-Jordan with partial pivoting)
		/** \return an invalid matrix if this matrix is singular
		**/
		SquareMatrixTpl inv() const
		{
			if (m_matrixSize == 0)
			{
				return SquareMatrixTpl();
			}

			//we create the n by 2n matrix, composed of this matrix and the identity
			std::vector< std::vector<Scalar> > tempM(m_matrixSize, std::vector<Scalar>(2 * m_matrixSize, 0));
			for (unsigned i = 0; i < m_matrixSize; i++)
			{
				for (unsigned j = 0; j < m_matrixSize; j++)
				{
					tempM[i][j] = m_values[i][j];
				}
				tempM[i][i + m_matrixSize] = 1;
			}

			for (unsigned i = 0; i < m_matrixSize; i++)
			{
				//we look for the pivot value (largest element of the column)
				unsigned pivot = i;
				for (unsigned j = i + 1; j < m_matrixSize; j++)
				{
					if (std::abs(tempM[j][i]) > std::abs(tempM[pivot][i]))
						pivot = j;
				}

				if (tempM[pivot][i] == 0)
				{
					//non inversible matrix!
					return SquareMatrixTpl();
				}

				if (pivot != i)
					std::swap(tempM[i], tempM[pivot]);

				//we scale the row to make the pivot equal to 1
				const Scalar pivotValue = tempM[i][i];
				for (unsigned k = 0; k < 2 * m_matrixSize; ++k)
					tempM[i][k] /= pivotValue;

				//all other elements of the column are set to zero
				for (unsigned j = 0; j < m_matrixSize; j++)
				{
					if (j != i && tempM[j][i] != 0)
					{
						const Scalar tmpVal = tempM[j][i];
						for (unsigned k = 0; k < 2 * m_matrixSize; k++)
							tempM[j][k] -= tempM[i][k] * tmpVal;
					}
				}
			}

			//result: second part or tempM
			SquareMatrixTpl result(m_matrixSize);
			for (unsigned i = 0; i < m_matrixSize; i++)
				for (unsigned j = 0; j < m_matrixSize; j++)
					result.m_values[i][j] = tempM[i][j + m_matrixSize];

			return result;
		}

		//! Matrix exponential
		/** Scaling and squaring method (truncated Taylor series).
		**/
		SquareMatrixTpl exp() const
		{
			if (m_matrixSize == 0)
			{
				return SquareMatrixTpl();
			}

			//scale the matrix so that its norm is below 1/2
			unsigned squarings = 0;
			Scalar n1 = norm1();
			if (!std::isfinite(n1))
			{
				return SquareMatrixTpl();
			}
			while (n1 > static_cast<Scalar>(0.5) && squarings < 64)
			{
				n1 /= 2;
				++squarings;
			}

			SquareMatrixTpl A(*this);
			A.scale(static_cast<Scalar>(std::ldexp(1.0, -static_cast<int>(squarings))));

			SquareMatrixTpl result(m_matrixSize);
			result.toIdentity();
			SquareMatrixTpl term(m_matrixSize);
			term.toIdentity();
			static const unsigned TaylorDegree = 18;
			for (unsigned k = 1; k <= TaylorDegree; ++k)
			{
				term = term * A;
				term.scale(static_cast<Scalar>(1) / k);
				result += term;
			}

			for (unsigned s = 0; s < squarings; ++s)
			{
				result = result * result;
			}

			return result;
		}

		//! Principal matrix square root (Denman-Beavers iteration)
		/** \return an invalid matrix if the iteration fails
		**/
		SquareMatrixTpl sqrt() const
		{
			if (m_matrixSize == 0)
			{
				return SquareMatrixTpl();
			}

			SquareMatrixTpl Y(*this);
			SquareMatrixTpl Z(m_matrixSize);
			Z.toIdentity();

			static const unsigned MaxIterationCount = 100;
			for (unsigned it = 0; it < MaxIterationCount; ++it)
			{
				SquareMatrixTpl Yinv = Y.inv();
				SquareMatrixTpl Zinv = Z.inv();
				if (!Yinv.isValid() || !Zinv.isValid())
				{
					return SquareMatrixTpl();
				}

				SquareMatrixTpl nextY = Y + Zinv;
				nextY.scale(static_cast<Scalar>(0.5));
				Z += Yinv;
				Z.scale(static_cast<Scalar>(0.5));

				Scalar delta = (nextY - Y).norm1();
				Y = nextY;
				if (delta <= static_cast<Scalar>(1.0e-12) * std::max<Scalar>(1, Y.norm1()))
				{
					return Y;
				}
			}

			return SquareMatrixTpl();
		}

		//! Principal matrix logarithm
		/** Inverse scaling and squaring method: square roots are taken
			until the matrix is close to the identity, then a Taylor
			series of log(I + X) is used.
			\return an invalid matrix if the logarithm can't be computed
		**/
		SquareMatrixTpl log() const
		{
			if (m_matrixSize == 0)
			{
				return SquareMatrixTpl();
			}

			SquareMatrixTpl identity(m_matrixSize);
			identity.toIdentity();

			SquareMatrixTpl A(*this);
			unsigned rootCount = 0;
			static const unsigned MaxRootCount = 64;
			while ((A - identity).norm1() > static_cast<Scalar>(0.25))
			{
				if (rootCount == MaxRootCount)
				{
					return SquareMatrixTpl();
				}
				A = A.sqrt();
				if (!A.isValid())
				{
					return SquareMatrixTpl();
				}
				++rootCount;
			}

			SquareMatrixTpl X = A - identity;
			SquareMatrixTpl power(X);
			SquareMatrixTpl result(m_matrixSize);
			static const unsigned SeriesDegree = 40;
			for (unsigned k = 1; k <= SeriesDegree; ++k)
			{
				SquareMatrixTpl term(power);
				term.scale(static_cast<Scalar>((k % 2) ? 1.0 : -1.0) / k);
				result += term;
				power = power * X;
			}

			result.scale(static_cast<Scalar>(std::ldexp(1.0, static_cast<int>(rootCount))));

			return result;
		}

		//! Sets matrix to identity
		void toIdentity()
		{
			clear();

			for (unsigned r = 0; r < m_matrixSize; r++)
				m_values[r][r] = 1;
		}

		//! Scales matrix (all elements are multiplied by the same coef.)
		void scale(Scalar coef)
		{
			for (unsigned r = 0; r < m_matrixSize; r++)
				for (unsigned c = 0; c < m_matrixSize; c++)
					m_values[r][c] *= coef;
		}

		//! Returns trace
		Scalar trace() const
		{
			Scalar trace = 0;

			for (unsigned r = 0; r < m_matrixSize; r++)
				trace += m_values[r][r];

			return trace;
		}

		//! Returns the sum of the elements of a given row
		Scalar rowSum(unsigned row) const
		{
			Scalar sum = 0;
			for (unsigned c = 0; c < m_matrixSize; c++)
				sum += m_values[row][c];
			return sum;
		}

		//! Returns the 1-norm (maximum absolute column sum)
		Scalar norm1() const
		{
			Scalar maxSum = 0;
			for (unsigned c = 0; c < m_matrixSize; c++)
			{
				Scalar sum = 0;
				for (unsigned r = 0; r < m_matrixSize; r++)
					sum += std::abs(m_values[r][c]);
				maxSum = std::max(maxSum, sum);
			}
			return maxSum;
		}

	private:
		//! Internal initialization
		/** \return initilization success
		**/
		bool init(unsigned size)
		{
			m_matrixSize = size;

			if ( size == 0 )
			{
				return true;
			}

			m_values = new Scalar*[m_matrixSize]{};
			m_underlyingData = new Scalar[static_cast<size_t>(m_matrixSize) * m_matrixSize]{};

			for (unsigned i = 0; i < m_matrixSize; i++)
			{
				m_values[i] = m_underlyingData + (static_cast<size_t>(i) * m_matrixSize);
			}

			return true;
		}

	private: //members

		//! Matrix size
		unsigned m_matrixSize = 0;

		//! Stores the actual data, indexed by m_values
		Scalar	*m_underlyingData = nullptr;
	};

	//! Double square matrix type
	using SquareMatrixd = SquareMatrixTpl<double>;
}
