// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <SampleSet.h>
#include <TransiogramModel.h>
#include <TransitionMatrixTools.h>

#include <gtest/gtest.h>

#include <cmath>

using namespace GeoStatsCoreLib;

namespace
{
	void ExpectRowsSumToOne(const SquareMatrixd& T, double tolerance = 1e-9)
	{
		ASSERT_TRUE(T.isValid());
		for (unsigned r = 0; r < T.size(); ++r)
		{
			EXPECT_NEAR(1.0, T.rowSum(r), tolerance) << "row " << r;
		}
	}

	void ExpectMatricesNear(const SquareMatrixd& expected, const SquareMatrixd& actual, double tolerance = 1e-9)
	{
		ASSERT_TRUE(expected.isValid());
		ASSERT_TRUE(actual.isValid());
		ASSERT_EQ(expected.size(), actual.size());
		for (unsigned i = 0; i < expected.size(); ++i)
		{
			for (unsigned j = 0; j < expected.size(); ++j)
			{
				EXPECT_NEAR(expected.getValue(i, j), actual.getValue(i, j), tolerance) << "(" << i << ", " << j << ")";
			}
		}
	}

	//! Facies log A A B B sampled every unit
	void MakeFaciesLog(SampleSet& set, int& field)
	{
		ASSERT_TRUE(set.setCoordinates({ 0, 1, 2, 3 }, 1));
		field = set.addCategoricalField("facies", { "A", "A", "B", "B" });
		ASSERT_GE(field, 0);
	}
}

TEST(TransiogramModel, RangeFamilies)
{
	std::vector<double> p{ 0.2, 0.3, 0.5 };
	for (TransiogramModel::Family family : { TransiogramModel::LINEAR, TransiogramModel::GAUSSIAN, TransiogramModel::SPHERICAL, TransiogramModel::EXPONENTIAL })
	{
		TransiogramModel model(family, MetricBall(5.0), p);
		ASSERT_TRUE(model.isValid()) << TransiogramModel::FamilyName(family);
		EXPECT_EQ(3u, model.levelCount());

		for (double h : { 0.0, 0.5, 2.0, 5.0, 50.0 })
		{
			ExpectRowsSumToOne(model.evaluate(h));
		}

		//close to the identity at the origin and to the proportions far away
		SquareMatrixd T0 = model.evaluate(0.0);
		SquareMatrixd Tinf = model.evaluate(1000.0);
		for (unsigned i = 0; i < 3; ++i)
		{
			EXPECT_NEAR(1.0, T0.getValue(i, i), 1e-5);
			for (unsigned j = 0; j < 3; ++j)
			{
				EXPECT_NEAR(p[j], Tinf.getValue(i, j), 1e-5);
			}
		}
	}
}

TEST(TransiogramModel, LinearReachesProportionsAtRange)
{
	TransiogramModel model(TransiogramModel::LINEAR, MetricBall(2.0), { 0.4, 0.6 });
	SquareMatrixd T = model.evaluate(1.0);
	EXPECT_DOUBLE_EQ(0.7, T.getValue(0, 0));
	EXPECT_DOUBLE_EQ(0.3, T.getValue(0, 1));
	EXPECT_DOUBLE_EQ(0.2, T.getValue(1, 0));
	EXPECT_DOUBLE_EQ(0.8, T.getValue(1, 1));

	SquareMatrixd beyond = model.evaluate(2.0);
	EXPECT_DOUBLE_EQ(0.4, beyond.getValue(1, 0));
	EXPECT_DOUBLE_EQ(0.6, beyond.getValue(0, 1));
}

TEST(TransiogramModel, InvalidRangeModels)
{
	EXPECT_FALSE(TransiogramModel(TransiogramModel::EXPONENTIAL, MetricBall(1.0), { 0.5, 0.6 }).isValid());
	EXPECT_FALSE(TransiogramModel(TransiogramModel::EXPONENTIAL, MetricBall(1.0), {}).isValid());
	EXPECT_FALSE(TransiogramModel(TransiogramModel::EXPONENTIAL, MetricBall(0.0), { 0.5, 0.5 }).isValid());
	EXPECT_FALSE(TransiogramModel(TransiogramModel::MATRIX_EXPONENTIAL, MetricBall(1.0), { 0.5, 0.5 }).isValid());
	EXPECT_FALSE(TransiogramModel().isValid());
	EXPECT_FALSE(TransiogramModel().evaluate(1.0).isValid());
}

TEST(TransiogramModel, MatrixExponentialFromLengths)
{
	std::vector<double> lengths{ 2.0, 1.0, 4.0 };
	std::vector<double> p{ 0.3, 0.2, 0.5 };
	TransiogramModel model = TransiogramModel::MatrixExponential(lengths, p);
	ASSERT_TRUE(model.isValid());
	EXPECT_EQ(3u, model.levelCount());

	std::vector<double> meanLengths = model.meanLengths();
	ASSERT_EQ(3u, meanLengths.size());
	for (unsigned i = 0; i < 3; ++i)
	{
		EXPECT_NEAR(lengths[i], meanLengths[i], 1e-12);
	}

	for (double h : { 0.0, 0.1, 1.0, 3.0, 10.0 })
	{
		ExpectRowsSumToOne(model.evaluate(h));
	}

	SquareMatrixd T0 = model.evaluate(0.0);
	EXPECT_NEAR(1.0, T0.getValue(1, 1), 1e-12);
	EXPECT_NEAR(0.0, T0.getValue(1, 2), 1e-12);

	//slope of the auto-transiogram at the origin is -1/length
	double h = 1e-6;
	EXPECT_NEAR(-1.0 / lengths[0], (model.evaluate(h).getValue(0, 0) - 1.0) / h, 1e-4);

	std::vector<double> proportions = model.proportions();
	ASSERT_EQ(3u, proportions.size());
	double sum = proportions[0] + proportions[1] + proportions[2];
	EXPECT_NEAR(1.0, sum, 1e-12);

	EXPECT_FALSE(TransiogramModel::MatrixExponential({ 1.0 }, { 0.5, 0.5 }).isValid());
	EXPECT_FALSE(TransiogramModel::MatrixExponential({ 0.0, 1.0 }, { 0.5, 0.5 }).isValid());
}

TEST(TransiogramModel, MatrixExponentialRangeScalesLags)
{
	TransiogramModel unit = TransiogramModel::MatrixExponential({ 1.0, 2.0 }, { 0.4, 0.6 });
	TransiogramModel scaled = TransiogramModel::MatrixExponential({ 1.0, 2.0 }, { 0.4, 0.6 }, MetricBall(3.0));
	SquareMatrixd a = unit.evaluate(0.5);
	SquareMatrixd b = scaled.evaluate(1.5);
	for (unsigned i = 0; i < 2; ++i)
	{
		for (unsigned j = 0; j < 2; ++j)
		{
			EXPECT_NEAR(a.getValue(i, j), b.getValue(i, j), 1e-12);
		}
	}
	EXPECT_NEAR(3.0, scaled.meanLengths()[0], 1e-12);
}

TEST(TransiogramModel, PiecewiseLinear)
{
	SquareMatrixd T1(2, { 0.8, 0.2, 0.4, 0.6 });
	SquareMatrixd T2(2, { 0.6, 0.4, 0.5, 0.5 });
	TransiogramModel model = TransiogramModel::PiecewiseLinear({ 1.0, 2.0 }, { T1, T2 });
	ASSERT_TRUE(model.isValid());
	EXPECT_EQ(2u, model.levelCount());

	//left extrapolation towards the identity
	SquareMatrixd T0 = model.evaluate(0.0);
	EXPECT_DOUBLE_EQ(1.0, T0.getValue(0, 0));
	EXPECT_DOUBLE_EQ(0.0, T0.getValue(0, 1));
	SquareMatrixd Thalf = model.evaluate(0.5);
	EXPECT_DOUBLE_EQ(0.9, Thalf.getValue(0, 0));
	EXPECT_DOUBLE_EQ(0.2, Thalf.getValue(1, 0));

	//exact at the knots, linear in between
	EXPECT_DOUBLE_EQ(0.8, model.evaluate(1.0).getValue(0, 0));
	EXPECT_DOUBLE_EQ(0.6, model.evaluate(2.0).getValue(0, 0));
	EXPECT_NEAR(0.7, model.evaluate(1.5).getValue(0, 0), 1e-12);
	EXPECT_NEAR(0.45, model.evaluate(1.5).getValue(1, 0), 1e-12);

	//right extrapolation: normalized diagonal of the last matrix
	SquareMatrixd Tinf = model.evaluate(10.0);
	EXPECT_NEAR(0.6 / 1.1, Tinf.getValue(0, 0), 1e-12);
	EXPECT_NEAR(0.6 / 1.1, Tinf.getValue(1, 0), 1e-12);
	EXPECT_NEAR(0.5 / 1.1, Tinf.getValue(0, 1), 1e-12);
	ExpectRowsSumToOne(Tinf);

	std::vector<double> p = model.proportions();
	ASSERT_EQ(2u, p.size());
	EXPECT_NEAR(0.6 / 1.1, p[0], 1e-12);
}

TEST(TransiogramModel, InvalidPiecewiseLinear)
{
	SquareMatrixd T(2, { 0.8, 0.2, 0.4, 0.6 });
	EXPECT_FALSE(TransiogramModel::PiecewiseLinear({}, {}).isValid());
	EXPECT_FALSE(TransiogramModel::PiecewiseLinear({ 1.0, 2.0 }, { T }).isValid());
	EXPECT_FALSE(TransiogramModel::PiecewiseLinear({ 2.0, 1.0 }, { T, T }).isValid());
	EXPECT_FALSE(TransiogramModel::PiecewiseLinear({ 0.0, 1.0 }, { T, T }).isValid());
	EXPECT_FALSE(TransiogramModel::PiecewiseLinear({ 1.0, 2.0 }, { T, SquareMatrixd(3) }).isValid());
}

TEST(TransiogramModel, CarleAlongOneAxis)
{
	//lengths 1 and 3, proportions 1/4 and 3/4
	SquareMatrixd R;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 1.0, 3.0 }, { 0.25, 0.75 }, R));

	TransiogramModel carle = TransiogramModel::Carle({ R });
	ASSERT_TRUE(carle.isValid());
	EXPECT_EQ(TransiogramModel::CARLE, carle.family());
	EXPECT_EQ(2u, carle.levelCount());
	EXPECT_EQ(1u, carle.axisRateMatrices().size());

	std::vector<double> p = carle.proportions();
	ASSERT_EQ(2u, p.size());
	EXPECT_NEAR(0.25, p[0], 1e-9);
	EXPECT_NEAR(0.75, p[1], 1e-9);

	std::vector<double> lengths = carle.meanLengths();
	ASSERT_EQ(2u, lengths.size());
	EXPECT_NEAR(1.0, lengths[0], 1e-12);
	EXPECT_NEAR(3.0, lengths[1], 1e-12);

	//a single axis gives back the matrix exponential
	TransiogramModel exponential = TransiogramModel::MatrixExponential(R);
	ExpectMatricesNear(exponential.evaluate(0.7), carle.evaluate(GSVector3d(1, 0, 0), GSVector3d(1.7, 0, 0)));
	ExpectMatricesNear(exponential.evaluate(0.7), carle.evaluate(0.7));
	ExpectMatricesNear(exponential.evaluate(0.7), carle.evaluate(GSVector3d(1.7, 0, 0), GSVector3d(1, 0, 0)));

	SquareMatrixd I(2);
	I.toIdentity();
	ExpectMatricesNear(I, carle.evaluate(GSVector3d(2, 5, 0), GSVector3d(2, 5, 0)), 1e-12);
}

TEST(TransiogramModel, CarleDirectionDependentRates)
{
	//vertical lengths ten times shorter than the horizontal ones
	SquareMatrixd horizontal;
	SquareMatrixd vertical;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 1.0, 3.0 }, { 0.25, 0.75 }, horizontal));
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 0.1, 0.3 }, { 0.25, 0.75 }, vertical));

	TransiogramModel carle = TransiogramModel::Carle({ horizontal, horizontal, vertical });
	ASSERT_TRUE(carle.isValid());

	std::vector<double> lengths = carle.meanLengths();
	EXPECT_NEAR(1.0, lengths[0], 1e-12);
	EXPECT_NEAR(3.0, lengths[1], 1e-12);

	TransiogramModel exponential = TransiogramModel::MatrixExponential(horizontal);
	const GSVector3d origin(0, 0, 0);

	//along Z: ten times faster
	ExpectMatricesNear(exponential.evaluate(0.5), carle.evaluate(origin, GSVector3d(0, 0, 0.05)));
	//along Y: same as X
	ExpectMatricesNear(exponential.evaluate(0.5), carle.evaluate(origin, GSVector3d(0, 0.5, 0)));
	//oblique: sqrt(0.3^2 + (10 x 0.04)^2) = 0.5
	ExpectMatricesNear(exponential.evaluate(0.5), carle.evaluate(origin, GSVector3d(0.3, 0, 0.04)));
	//two levels: reversed lags give the same transitions
	ExpectMatricesNear(carle.evaluate(origin, GSVector3d(0.3, 0, 0.04)), carle.evaluate(origin, GSVector3d(-0.3, 0, -0.04)));

	//the scalar lag follows the axis with the largest mean length (X)
	ExpectMatricesNear(exponential.evaluate(1.2), carle.evaluate(1.2));
}

TEST(TransiogramModel, CarleRowsSumToOne)
{
	SquareMatrixd Rx;
	SquareMatrixd Ry;
	SquareMatrixd Rz;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 1.0, 2.0, 3.0 }, { 0.2, 0.3, 0.5 }, Rx));
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 2.0, 1.0, 4.0 }, { 0.2, 0.3, 0.5 }, Ry));
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 0.2, 0.3, 0.1 }, { 0.2, 0.3, 0.5 }, Rz));

	TransiogramModel carle = TransiogramModel::Carle({ Rx, Ry, Rz });
	ASSERT_TRUE(carle.isValid());
	ASSERT_EQ(3u, carle.levelCount());

	std::vector<double> p = carle.proportions();
	EXPECT_NEAR(1.0, p[0] + p[1] + p[2], 1e-12);

	const GSVector3d origin(0, 0, 0);
	for (const GSVector3d& lag : { GSVector3d(0.4, 0.2, 0.1), GSVector3d(-0.4, 0.2, -0.1), GSVector3d(0, -1.5, 0) })
	{
		ExpectRowsSumToOne(carle.evaluate(origin, lag));
	}

	//far away, every row tends to the proportions
	SquareMatrixd far = carle.evaluate(origin, GSVector3d(300, 0, 0));
	for (unsigned i = 0; i < 3; ++i)
	{
		for (unsigned j = 0; j < 3; ++j)
		{
			EXPECT_NEAR(p[j], far.getValue(i, j), 1e-6);
		}
	}
}

TEST(TransiogramModel, InvalidCarle)
{
	SquareMatrixd R;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 1.0, 3.0 }, { 0.25, 0.75 }, R));
	SquareMatrixd R3;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 1.0, 2.0, 3.0 }, { 0.2, 0.3, 0.5 }, R3));

	EXPECT_FALSE(TransiogramModel::Carle({}).isValid());
	EXPECT_FALSE(TransiogramModel::Carle({ R, R3 }).isValid());
	EXPECT_FALSE(TransiogramModel::Carle({ R, R, R, R }).isValid());
	EXPECT_FALSE(TransiogramModel::Carle({ SquareMatrixd(2) }).isValid());
	EXPECT_FALSE(TransiogramModel(TransiogramModel::CARLE, MetricBall(1.0), { 0.5, 0.5 }).isValid());
}

TEST(TransiogramModel, FamilyNames)
{
	TransiogramModel::Family family = TransiogramModel::INVALID_FAMILY;
	EXPECT_EQ(SUCCESS, TransiogramModel::FamilyFromName("matrixexponential", family));
	EXPECT_EQ(TransiogramModel::MATRIX_EXPONENTIAL, family);
	EXPECT_EQ(ERROR_INVALID_PARAMETER, TransiogramModel::FamilyFromName("Cubic", family));
	EXPECT_EQ(SUCCESS, TransiogramModel::FamilyFromName("carle", family));
	EXPECT_EQ(TransiogramModel::CARLE, family);
	EXPECT_STREQ("Carle", TransiogramModel::FamilyName(TransiogramModel::CARLE));
	EXPECT_EQ(5u, TransiogramModel::DefaultCandidates().size());
}

TEST(TransitionMatrixTools, CountMatrix)
{
	SampleSet set;
	int field = -1;
	MakeFaciesLog(set, field);

	EXPECT_DOUBLE_EQ(0.5, TransitionMatrixTools::DefaultMinLag(set));

	SquareMatrixd counts;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::CountMatrix(set, field, counts));
	ASSERT_EQ(2u, counts.size());
	EXPECT_DOUBLE_EQ(5.0, counts.getValue(0, 0));
	EXPECT_DOUBLE_EQ(1.0, counts.getValue(0, 1));
	EXPECT_DOUBLE_EQ(0.0, counts.getValue(1, 0));
	EXPECT_DOUBLE_EQ(5.0, counts.getValue(1, 1));
}

TEST(TransitionMatrixTools, ProbabilityAndRateMatrices)
{
	SampleSet set;
	int field = -1;
	MakeFaciesLog(set, field);

	SquareMatrixd P;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::ProbabilityMatrix(set, field, P));
	EXPECT_DOUBLE_EQ(0.75, P.getValue(0, 0));
	EXPECT_DOUBLE_EQ(0.25, P.getValue(0, 1));
	EXPECT_DOUBLE_EQ(1.0 / 7, P.getValue(1, 0));
	EXPECT_DOUBLE_EQ(6.0 / 7, P.getValue(1, 1));
	ExpectRowsSumToOne(P, 1e-12);

	SquareMatrixd R;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::RateMatrix(set, field, R));
	for (unsigned r = 0; r < 2; ++r)
	{
		EXPECT_NEAR(0.0, R.rowSum(r), 1e-9);
	}

	//one minimum lag recovers the probabilities
	SquareMatrixd step(R);
	step.scale(0.5);
	SquareMatrixd recovered = step.exp();
	for (unsigned r = 0; r < 2; ++r)
	{
		for (unsigned c = 0; c < 2; ++c)
		{
			EXPECT_NEAR(P.getValue(r, c), recovered.getValue(r, c), 1e-9);
		}
	}
}

TEST(TransitionMatrixTools, BaseRateMatrix)
{
	SquareMatrixd R;
	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 2.0, 4.0 }, { 0.5, 0.5 }, R));
	EXPECT_DOUBLE_EQ(-0.5, R.getValue(0, 0));
	EXPECT_DOUBLE_EQ(0.5, R.getValue(0, 1));
	EXPECT_DOUBLE_EQ(0.25, R.getValue(1, 0));
	EXPECT_DOUBLE_EQ(-0.25, R.getValue(1, 1));

	ASSERT_EQ(SUCCESS, TransitionMatrixTools::BaseRateMatrix({ 1.0, 2.0, 3.0 }, { 0.2, 0.3, 0.5 }, R));
	for (unsigned r = 0; r < 3; ++r)
	{
		EXPECT_NEAR(0.0, R.rowSum(r), 1e-12);
	}

	EXPECT_EQ(ERROR_INVALID_PARAMETER, TransitionMatrixTools::BaseRateMatrix({ 1.0 }, { 0.5, 0.5 }, R));
	EXPECT_EQ(ERROR_INVALID_PARAMETER, TransitionMatrixTools::BaseRateMatrix({ 1.0, -1.0 }, { 0.5, 0.5 }, R));
	EXPECT_EQ(ERROR_INVALID_PARAMETER, TransitionMatrixTools::BaseRateMatrix({ 1.0, 1.0 }, { 1.5, -0.5 }, R));
}

TEST(TransitionMatrixTools, Preconditions)
{
	SampleSet single(1);
	ASSERT_TRUE(single.setCoordinates({ 0.0 }, 1));
	int facies = single.addCategoricalField("facies", { "A" });
	SquareMatrixd counts;
	EXPECT_EQ(ERROR_TOO_FEW_SAMPLES, TransitionMatrixTools::CountMatrix(single, facies, counts));

	SampleSet set;
	ASSERT_TRUE(set.setCoordinates({ 0, 1, 2 }, 1));
	int z = set.addScalarField("z", { 0.1, 0.2, 0.3 });
	EXPECT_EQ(ERROR_UNKNOWN_VARIABLE, TransitionMatrixTools::CountMatrix(set, z, counts));

	int labels = set.addCategoricalField("labels", { "A", "B", "A" });
	EXPECT_EQ(ERROR_INVALID_MAX_LAG, TransitionMatrixTools::CountMatrix(set, labels, counts, -1.0));
}
