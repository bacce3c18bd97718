// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <SquareMatrix.h>

#include <gtest/gtest.h>

#include <cmath>

using namespace GeoStatsCoreLib;

namespace
{
	void ExpectMatrixNear(const SquareMatrixd& expected, const SquareMatrixd& actual, double tolerance)
	{
		ASSERT_EQ(expected.size(), actual.size());
		for (unsigned r = 0; r < expected.size(); ++r)
		{
			for (unsigned c = 0; c < expected.size(); ++c)
			{
				EXPECT_NEAR(expected.getValue(r, c), actual.getValue(r, c), tolerance) << "(" << r << ", " << c << ")";
			}
		}
	}
}

TEST(SquareMatrix, RowMajorConstruction)
{
	SquareMatrixd M(2, { 1, 2, 3, 4 });
	ASSERT_TRUE(M.isValid());
	EXPECT_EQ(2.0, M.getValue(0, 1));
	EXPECT_EQ(3.0, M.getValue(1, 0));
	EXPECT_EQ(5.0, M.trace());
	EXPECT_EQ(7.0, M.rowSum(1));
	EXPECT_EQ(6.0, M.norm1());

	SquareMatrixd T = M.transposed();
	EXPECT_EQ(3.0, T.getValue(0, 1));

	EXPECT_FALSE(SquareMatrixd().isValid());
}

TEST(SquareMatrix, Product)
{
	SquareMatrixd A(2, { 1, 2, 3, 4 });
	SquareMatrixd B(2, { 0, 1, 1, 0 });
	ExpectMatrixNear(SquareMatrixd(2, { 2, 1, 4, 3 }), A * B, 0.0);

	double v[2] = { 1, -1 };
	double w[2] = { 0, 0 };
	A.apply(v, w);
	EXPECT_EQ(-1.0, w[0]);
	EXPECT_EQ(-1.0, w[1]);
}

TEST(SquareMatrix, Inverse)
{
	SquareMatrixd A(2, { 4, 7, 2, 6 });
	ExpectMatrixNear(SquareMatrixd(2, { 0.6, -0.7, -0.2, 0.4 }), A.inv(), 1e-12);

	SquareMatrixd identity(3);
	identity.toIdentity();
	SquareMatrixd B(3, { 2, -1, 0, -1, 2, -1, 0, -1, 2 });
	ExpectMatrixNear(identity, B * B.inv(), 1e-12);

	SquareMatrixd singular(2, { 1, 2, 2, 4 });
	EXPECT_FALSE(singular.inv().isValid());
}

TEST(SquareMatrix, Exponential)
{
	SquareMatrixd zero(3);
	SquareMatrixd identity(3);
	identity.toIdentity();
	ExpectMatrixNear(identity, zero.exp(), 0.0);

	SquareMatrixd D(2, { 1, 0, 0, 2 });
	ExpectMatrixNear(SquareMatrixd(2, { std::exp(1.0), 0, 0, std::exp(2.0) }), D.exp(), 1e-12);

	//nilpotent: exp(N) = I + N
	SquareMatrixd N(2, { 0, 3, 0, 0 });
	ExpectMatrixNear(SquareMatrixd(2, { 1, 3, 0, 1 }), N.exp(), 1e-12);

	//rotation generator
	double t = 0.7;
	SquareMatrixd J(2, { 0, -t, t, 0 });
	ExpectMatrixNear(SquareMatrixd(2, { std::cos(t), -std::sin(t), std::sin(t), std::cos(t) }), J.exp(), 1e-12);
}

TEST(SquareMatrix, SquareRoot)
{
	SquareMatrixd D(2, { 4, 0, 0, 9 });
	ExpectMatrixNear(SquareMatrixd(2, { 2, 0, 0, 3 }), D.sqrt(), 1e-12);

	SquareMatrixd A(2, { 5, 4, 4, 5 });
	SquareMatrixd R = A.sqrt();
	ASSERT_TRUE(R.isValid());
	ExpectMatrixNear(A, R * R, 1e-10);
}

TEST(SquareMatrix, LogarithmInvertsExponential)
{
	//transition rate matrix (rows sum to zero)
	SquareMatrixd Q(3, { -0.5, 0.3, 0.2,
						 0.1, -0.4, 0.3,
						 0.25, 0.25, -0.5 });
	SquareMatrixd P = Q.exp();
	ASSERT_TRUE(P.isValid());
	for (unsigned r = 0; r < 3; ++r)
	{
		EXPECT_NEAR(1.0, P.rowSum(r), 1e-12);
	}

	SquareMatrixd L = P.log();
	ASSERT_TRUE(L.isValid());
	ExpectMatrixNear(Q, L, 1e-9);

	SquareMatrixd identity(4);
	identity.toIdentity();
	ExpectMatrixNear(SquareMatrixd(4), identity.log(), 0.0);
}
