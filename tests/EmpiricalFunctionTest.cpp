// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <EmpiricalFunctionTools.h>
#include <Logger.h>
#include <PartitionTools.h>
#include <SampleSet.h>

#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace GeoStatsCoreLib;

namespace
{
	//! Random samples in the unit square with a smooth attribute
	void MakeRandomSet(unsigned count, unsigned seed, SampleSet& set, int& field)
	{
		std::mt19937 gen(seed);
		std::uniform_real_distribution<double> uniform(0.0, 1.0);

		std::vector<double> coordinates;
		std::vector<double> values;
		for (unsigned i = 0; i < count; ++i)
		{
			double x = uniform(gen);
			double y = uniform(gen);
			coordinates.push_back(x);
			coordinates.push_back(y);
			values.push_back(std::sin(3 * x) + y * y);
		}

		ASSERT_TRUE(set.setCoordinates(coordinates, 2));
		field = set.addScalarField("z", values);
		ASSERT_GE(field, 0);
	}

	//! Counts the warnings sent to the logger
	class WarningCounter : public Logger::Handler
	{
	public:
		void logMessage(const std::string&, Logger::MessageLevel level) override
		{
			if (level == Logger::LOG_WARNING)
				++warnings;
		}

		int warnings = 0;
	};

	//! Registers a handler for the lifetime of a test
	class ScopedHandler
	{
	public:
		explicit ScopedHandler(Logger::Handler* handler) { Logger::SetHandler(handler); }
		~ScopedHandler() { Logger::SetHandler(nullptr); }
	};
}

TEST(EmpiricalVariogram, ThreeEquidistantPoints)
{
	SampleSet set(3);
	ASSERT_TRUE(set.setCoordinates({ 1, 0, 0, 0, 1, 0, 0, 0, 1 }, 3));
	int field = set.addScalarField("z", { 1.0, 1.0, 1.0 });

	EmpiricalParams params;
	params.nlags = 2;
	params.maxlag = 2.0;

	EmpiricalFunction variogram;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, variogram));

	ASSERT_EQ(2u, variogram.nlags());
	EXPECT_EQ(0u, variogram.counts()[0]);
	EXPECT_EQ(3u, variogram.counts()[1]);
	EXPECT_NEAR(0.5, variogram.abscissas()[0], 1e-12);
	EXPECT_NEAR(std::sqrt(2.0), variogram.abscissas()[1], 1e-12);
	EXPECT_DOUBLE_EQ(0.0, variogram.ordinates()[1]);
	EXPECT_EQ(MATHERON, variogram.estimator());
}

TEST(EmpiricalVariogram, BinCountsMatchPairsInRange)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(150, 7, set, field);

	EmpiricalParams params;
	params.nlags = 10;
	params.maxlag = 0.4;

	EmpiricalFunction variogram;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, variogram));

	std::size_t expected = 0;
	for (unsigned i = 0; i < set.size(); ++i)
	{
		for (unsigned j = i + 1; j < set.size(); ++j)
		{
			double h = (set.getPoint(i) - set.getPoint(j)).norm();
			if (h > 0 && h <= params.maxlag)
				++expected;
		}
	}

	EXPECT_EQ(expected, variogram.totalCount());
	for (unsigned k = 0; k < variogram.nlags(); ++k)
	{
		if (variogram.counts()[k] != 0)
		{
			EXPECT_GT(variogram.abscissas()[k], k * variogram.lagSize());
			EXPECT_LE(variogram.abscissas()[k], (k + 1) * variogram.lagSize() + 1e-12);
			EXPECT_GE(variogram.ordinates()[k], 0.0);
		}
	}
}

TEST(EmpiricalVariogram, FullAndBallSearchAgree)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(200, 11, set, field);

	EmpiricalParams params;
	params.nlags = 15;
	params.maxlag = 0.3;

	for (ESTIMATOR_TYPE estimator : { MATHERON, CRESSIE })
	{
		params.estimator = estimator;

		EmpiricalFunction full;
		params.algorithm = FULL_SEARCH;
		ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, full));

		EmpiricalFunction ball;
		params.algorithm = BALL_SEARCH;
		ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, ball));

		ASSERT_EQ(full.nlags(), ball.nlags());
		for (unsigned k = 0; k < full.nlags(); ++k)
		{
			EXPECT_EQ(full.counts()[k], ball.counts()[k]);
			EXPECT_DOUBLE_EQ(full.abscissas()[k], ball.abscissas()[k]);
			EXPECT_DOUBLE_EQ(full.ordinates()[k], ball.ordinates()[k]);
		}
	}
}

TEST(EmpiricalVariogram, CityblockBallSearchAgreesWithFullSearch)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(120, 3, set, field);

	EmpiricalParams params;
	params.nlags = 8;
	params.maxlag = 0.5;
	params.distance = DistanceFunction(DistanceFunction::CITYBLOCK);

	EmpiricalFunction full;
	params.algorithm = FULL_SEARCH;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, full));

	EmpiricalFunction ball;
	params.algorithm = BALL_SEARCH;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, ball));

	for (unsigned k = 0; k < full.nlags(); ++k)
	{
		EXPECT_EQ(full.counts()[k], ball.counts()[k]);
		EXPECT_DOUBLE_EQ(full.ordinates()[k], ball.ordinates()[k]);
	}
}

TEST(EmpiricalVariogram, HomogeneousFieldIsZero)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(60, 5, set, field);
	int constant = set.addScalarField("c", std::vector<double>(set.size(), 4.2));

	EmpiricalParams params;
	params.nlags = 5;
	params.maxlag = 0.5;

	for (ESTIMATOR_TYPE estimator : { MATHERON, CRESSIE })
	{
		params.estimator = estimator;

		EmpiricalFunction variogram;
		ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, constant, params, variogram));
		EXPECT_EQ(estimator, variogram.estimator());
		EXPECT_GT(variogram.totalCount(), 0u);
		for (double y : variogram.ordinates())
		{
			EXPECT_DOUBLE_EQ(0.0, y);
		}
	}
}

TEST(EmpiricalTransiogram, FullAndBallSearchAgree)
{
	std::mt19937 gen(13);
	std::uniform_real_distribution<double> uniform(0.0, 1.0);

	SampleSet set(2);
	std::vector<double> coordinates;
	std::vector<std::string> labels;
	for (unsigned i = 0; i < 150; ++i)
	{
		double x = uniform(gen);
		double y = uniform(gen);
		coordinates.push_back(x);
		coordinates.push_back(y);
		labels.push_back(std::sin(6 * x) + y < 0.5 ? "clay" : (x < 0.7 ? "sand" : "gravel"));
	}
	ASSERT_TRUE(set.setCoordinates(coordinates, 2));
	int facies = set.addCategoricalField("facies", labels);
	ASSERT_GE(facies, 0);

	EmpiricalParams params;
	params.nlags = 6;
	params.maxlag = 0.3;

	EmpiricalFunction full;
	params.algorithm = FULL_SEARCH;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeTransiogram(set, facies, params, full));

	EmpiricalFunction ball;
	params.algorithm = BALL_SEARCH;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeTransiogram(set, facies, params, ball));

	ASSERT_EQ(full.nlags(), ball.nlags());
	ASSERT_EQ(full.levelCount(), ball.levelCount());
	EXPECT_GT(full.totalCount(), 0u);
	const unsigned levelCount = full.levelCount();
	for (unsigned k = 0; k < full.nlags(); ++k)
	{
		EXPECT_EQ(full.counts()[k], ball.counts()[k]);
		EXPECT_NEAR(full.abscissas()[k], ball.abscissas()[k], 1e-12);
		for (unsigned i = 0; i < levelCount; ++i)
		{
			for (unsigned j = 0; j < levelCount; ++j)
			{
				EXPECT_NEAR(full.transitionOrdinates(i, j)[k], ball.transitionOrdinates(i, j)[k], 1e-12);
			}
		}
	}
}

TEST(EmpiricalVariogram, MissingValuesAreIgnored)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(40, 9, set, field);
	int missing = set.addScalarField("m", std::vector<double>(set.size(), NAN_VALUE));

	EmpiricalParams params;
	params.nlags = 4;
	params.maxlag = 0.5;

	EmpiricalFunction variogram;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, missing, params, variogram));
	EXPECT_EQ(0u, variogram.totalCount());
	for (unsigned k = 0; k < variogram.nlags(); ++k)
	{
		EXPECT_DOUBLE_EQ(0.0, variogram.ordinates()[k]);
		EXPECT_DOUBLE_EQ(variogram.nominalAbscissa(k), variogram.abscissas()[k]);
	}
}

TEST(EmpiricalVariogram, CrossVariogramOfIdenticalColumns)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(80, 21, set, field);

	EmpiricalParams params;
	params.nlags = 6;
	params.maxlag = 0.6;

	EmpiricalFunction simple;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, simple));

	std::vector<EmpiricalFunction> variograms;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariograms(set, { { field, field } }, params, variograms));
	ASSERT_EQ(1u, variograms.size());
	for (unsigned k = 0; k < simple.nlags(); ++k)
	{
		EXPECT_DOUBLE_EQ(simple.ordinates()[k], variograms[0].ordinates()[k]);
	}
}

TEST(EmpiricalVariogram, DuplicatesAreSkippedWithOneWarning)
{
	SampleSet set(2);
	ASSERT_TRUE(set.setCoordinates({ 0, 0, 0, 0, 0, 0, 1, 0 }, 2));
	int field = set.addScalarField("z", { 1.0, 2.0, 3.0, 5.0 });

	EmpiricalParams params;
	params.nlags = 2;
	params.maxlag = 2.0;

	WarningCounter counter;
	ScopedHandler scope(&counter);

	EmpiricalFunction variogram;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, variogram));
	EXPECT_EQ(1, counter.warnings);
	//3 coincident pairs out of 6
	EXPECT_EQ(3u, variogram.totalCount());
}

TEST(EmpiricalVariogram, FromArrays)
{
	std::vector<double> coordinates{ 0.0, 1.0, 2.0, 3.0 };
	std::vector<double> values{ 0.0, 1.0, 0.0, 1.0 };

	EmpiricalParams params;
	params.nlags = 3;
	params.maxlag = 3.0;

	EmpiricalFunction variogram;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogramFromArrays(coordinates, 1, values, params, variogram));
	ASSERT_EQ(3u, variogram.nlags());
	EXPECT_EQ(3u, variogram.counts()[0]);
	EXPECT_EQ(2u, variogram.counts()[1]);
	EXPECT_EQ(1u, variogram.counts()[2]);
	EXPECT_DOUBLE_EQ(0.5, variogram.ordinates()[0]);
	EXPECT_DOUBLE_EQ(0.0, variogram.ordinates()[1]);
	EXPECT_DOUBLE_EQ(0.5, variogram.ordinates()[2]);
}

TEST(EmpiricalVariogram, PreconditionErrors)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(30, 1, set, field);

	EmpiricalFunction variogram;
	EmpiricalParams params;
	params.maxlag = 0.5;

	params.nlags = 0;
	EXPECT_EQ(ERROR_INVALID_LAG_COUNT, EmpiricalFunctionTools::ComputeVariogram(set, field, params, variogram));

	params.nlags = 5;
	params.maxlag = -1.0;
	EXPECT_EQ(ERROR_INVALID_MAX_LAG, EmpiricalFunctionTools::ComputeVariogram(set, field, params, variogram));

	params.maxlag = 0.5;
	params.estimator = CARLE;
	EXPECT_EQ(ERROR_UNKNOWN_ESTIMATOR, EmpiricalFunctionTools::ComputeVariogram(set, field, params, variogram));

	params.estimator = MATHERON;
	params.algorithm = INVALID_SEARCH;
	EXPECT_EQ(ERROR_UNKNOWN_ALGORITHM, EmpiricalFunctionTools::ComputeVariogram(set, field, params, variogram));

	params.algorithm = BALL_SEARCH;
	EXPECT_EQ(ERROR_UNKNOWN_VARIABLE, EmpiricalFunctionTools::ComputeVariogram(set, 42, params, variogram));

	SampleSet single(2);
	ASSERT_TRUE(single.setCoordinates({ 0.0, 0.0 }, 2));
	int z = single.addScalarField("z", { 1.0 });
	EXPECT_EQ(ERROR_TOO_FEW_SAMPLES, EmpiricalFunctionTools::ComputeVariogram(single, z, params, variogram));
}

TEST(EmpiricalVariogram, DefaultMaxLag)
{
	SampleSet set(2);
	ASSERT_TRUE(set.setCoordinates({ 0, 0, 10, 0, 0, 4, 10, 4 }, 2));
	EXPECT_DOUBLE_EQ(0.4, EmpiricalFunctionTools::DefaultMaxLag(set, EmpiricalFunction::VARIOGRAM));
	EXPECT_DOUBLE_EQ(2.0, EmpiricalFunctionTools::DefaultMaxLag(set, EmpiricalFunction::TRANSIOGRAM));
}

TEST(EmpiricalVariogram, SearchAlgorithmNames)
{
	SEARCH_ALGORITHM algorithm = INVALID_SEARCH;
	EXPECT_EQ(SUCCESS, EmpiricalAccumulator::AlgorithmFromName("Ball", algorithm));
	EXPECT_EQ(BALL_SEARCH, algorithm);
	EXPECT_EQ(SUCCESS, EmpiricalAccumulator::AlgorithmFromName("full", algorithm));
	EXPECT_EQ(FULL_SEARCH, algorithm);
	EXPECT_EQ(ERROR_UNKNOWN_ALGORITHM, EmpiricalAccumulator::AlgorithmFromName("octree", algorithm));

	ESTIMATOR_TYPE estimator = INVALID_ESTIMATOR;
	EXPECT_EQ(SUCCESS, EmpiricalEstimator::FromName("Cressie", estimator));
	EXPECT_EQ(CRESSIE, estimator);
	EXPECT_EQ(ERROR_UNKNOWN_ESTIMATOR, EmpiricalEstimator::FromName("median", estimator));
}

TEST(EmpiricalMerge, OrderIndependent)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(120, 17, set, field);

	PartitionTools::Partition parts;
	ASSERT_EQ(SUCCESS, PartitionTools::RandomPartition(set, 3, DEFAULT_RANDOM_SEED, parts));
	ASSERT_EQ(3u, parts.size());

	for (ESTIMATOR_TYPE estimator : { MATHERON, CRESSIE })
	{
		EmpiricalParams params;
		params.nlags = 6;
		params.maxlag = 0.3;
		params.estimator = estimator;

		std::vector<EmpiricalFunction> functions(parts.size());
		for (size_t i = 0; i < parts.size(); ++i)
		{
			ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(parts[i], field, params, functions[i]));
		}

		EmpiricalFunction ab, abc, bc, bca, ca, cab;
		ASSERT_EQ(SUCCESS, EmpiricalFunction::Merge(functions[0], functions[1], ab));
		ASSERT_EQ(SUCCESS, EmpiricalFunction::Merge(ab, functions[2], abc));
		ASSERT_EQ(SUCCESS, EmpiricalFunction::Merge(functions[1], functions[2], bc));
		ASSERT_EQ(SUCCESS, EmpiricalFunction::Merge(functions[0], bc, bca));
		ASSERT_EQ(SUCCESS, EmpiricalFunction::Merge(functions[2], functions[0], ca));
		ASSERT_EQ(SUCCESS, EmpiricalFunction::Merge(ca, functions[1], cab));

		for (unsigned k = 0; k < abc.nlags(); ++k)
		{
			EXPECT_EQ(abc.counts()[k], bca.counts()[k]);
			EXPECT_EQ(abc.counts()[k], cab.counts()[k]);
			EXPECT_EQ(functions[0].counts()[k] + functions[1].counts()[k] + functions[2].counts()[k], abc.counts()[k]);
			EXPECT_NEAR(abc.ordinates()[k], bca.ordinates()[k], 1e-12);
			EXPECT_NEAR(abc.ordinates()[k], cab.ordinates()[k], 1e-12);
			EXPECT_NEAR(abc.abscissas()[k], cab.abscissas()[k], 1e-12);
		}
	}
}

TEST(EmpiricalMerge, MatchesSinglePassOnSeparatedBlocks)
{
	//two clusters far apart: no pair crosses the clusters
	SampleSet set(2);
	std::vector<double> coordinates;
	std::vector<double> values;
	std::vector<std::string> labels;
	std::mt19937 gen(4);
	std::uniform_real_distribution<double> uniform(0.0, 1.0);
	for (unsigned i = 0; i < 80; ++i)
	{
		double x = uniform(gen) + (i < 40 ? 0.0 : 10.0);
		double y = uniform(gen);
		coordinates.push_back(x);
		coordinates.push_back(y);
		values.push_back(std::cos(2 * x) * y);
		labels.push_back(values.back() < -0.2 ? "low" : (values.back() < 0.2 ? "mid" : "high"));
	}
	ASSERT_TRUE(set.setCoordinates(coordinates, 2));
	int field = set.addScalarField("z", values);
	int facies = set.addCategoricalField("facies", labels);
	ASSERT_GE(facies, 0);

	//blocks start at the lower corner of the bounding box: one cluster per block
	PartitionTools::Partition parts;
	ASSERT_EQ(SUCCESS, PartitionTools::BlockPartition(set, GSVector3d(6.0, 6.0, 0.0), parts));
	ASSERT_EQ(2u, parts.size());
	EXPECT_EQ(40u, parts[0].size());
	EXPECT_EQ(40u, parts[1].size());

	for (ESTIMATOR_TYPE estimator : { MATHERON, CRESSIE })
	{
		EmpiricalParams params;
		params.nlags = 5;
		params.maxlag = 0.5;
		params.estimator = estimator;

		EmpiricalFunction whole;
		ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, whole));

		EmpiricalFunction merged;
		ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeFromPartition(set, parts, EmpiricalFunction::VARIOGRAM, field, field, params, GSVector3d(0, 0, 0), merged));

		for (unsigned k = 0; k < whole.nlags(); ++k)
		{
			EXPECT_EQ(whole.counts()[k], merged.counts()[k]);
			EXPECT_NEAR(whole.ordinates()[k], merged.ordinates()[k], 1e-10);
			EXPECT_NEAR(whole.abscissas()[k], merged.abscissas()[k], 1e-12);
		}
	}

	//Carle ratios are merged from their accumulated weights
	EmpiricalParams params;
	params.nlags = 5;
	params.maxlag = 0.5;

	EmpiricalFunction whole;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeTransiogram(set, facies, params, whole));
	ASSERT_EQ(CARLE, whole.estimator());

	EmpiricalFunction merged;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeFromPartition(set, parts, EmpiricalFunction::TRANSIOGRAM, facies, facies, params, GSVector3d(0, 0, 0), merged));
	ASSERT_EQ(whole.levelCount(), merged.levelCount());
	EXPECT_GT(whole.totalCount(), 0u);

	const unsigned levelCount = whole.levelCount();
	for (unsigned k = 0; k < whole.nlags(); ++k)
	{
		EXPECT_EQ(whole.counts()[k], merged.counts()[k]);
		EXPECT_NEAR(whole.abscissas()[k], merged.abscissas()[k], 1e-12);
		for (unsigned i = 0; i < levelCount; ++i)
		{
			for (unsigned j = 0; j < levelCount; ++j)
			{
				EXPECT_NEAR(whole.transitionOrdinates(i, j)[k], merged.transitionOrdinates(i, j)[k], 1e-12);
			}
		}
	}
}

TEST(EmpiricalMerge, IncompatibleFunctions)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(30, 2, set, field);

	EmpiricalParams params;
	params.nlags = 4;
	params.maxlag = 0.5;

	EmpiricalFunction A;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, A));

	params.nlags = 5;
	EmpiricalFunction B;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeVariogram(set, field, params, B));

	EmpiricalFunction C;
	EXPECT_EQ(ERROR_INCOMPATIBLE_FUNCTIONS, EmpiricalFunction::Merge(A, B, C));
	EXPECT_EQ(ERROR_INVALID_INPUT, EmpiricalFunction::Merge(A, EmpiricalFunction(), C));
}

TEST(EmpiricalTransiogram, RowsSumToOne)
{
	std::mt19937 gen(8);
	std::uniform_real_distribution<double> uniform(0.0, 1.0);

	SampleSet set(2);
	std::vector<double> coordinates;
	std::vector<std::string> labels;
	for (unsigned i = 0; i < 150; ++i)
	{
		double x = uniform(gen);
		double y = uniform(gen);
		coordinates.push_back(x);
		coordinates.push_back(y);
		labels.push_back(x + 0.3 * y < 0.4 ? "clay" : (x < 0.8 ? "sand" : "gravel"));
	}
	ASSERT_TRUE(set.setCoordinates(coordinates, 2));
	int facies = set.addCategoricalField("facies", labels);
	ASSERT_GE(facies, 0);

	EmpiricalParams params;
	params.nlags = 8;
	params.maxlag = 0.5;

	EmpiricalFunction transiogram;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeTransiogram(set, facies, params, transiogram));
	ASSERT_EQ(3u, transiogram.levelCount());
	EXPECT_EQ(9u, transiogram.channelCount());
	EXPECT_EQ(CARLE, transiogram.estimator());
	ASSERT_EQ(3u, transiogram.levels().size());
	EXPECT_EQ("clay", transiogram.levels()[0]);

	for (unsigned k = 0; k < transiogram.nlags(); ++k)
	{
		if (transiogram.counts()[k] == 0)
			continue;

		SquareMatrixd T = transiogram.ordinateMatrix(k);
		for (unsigned i = 0; i < 3; ++i)
		{
			if (transiogram.weights(i * 3)[k] > 0)
			{
				EXPECT_NEAR(1.0, T.rowSum(i), 1e-12);
			}
			for (unsigned j = 0; j < 3; ++j)
			{
				EXPECT_GE(T.getValue(i, j), 0.0);
				EXPECT_LE(T.getValue(i, j), 1.0);
			}
		}
	}

	//same rows for the directional (oriented) transiogram
	EmpiricalFunction directional;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeDirectionalTransiogram(set, facies, GSVector3d(1, 0, 0), 0.1, params, directional));
	for (unsigned k = 0; k < directional.nlags(); ++k)
	{
		SquareMatrixd T = directional.ordinateMatrix(k);
		for (unsigned i = 0; i < 3; ++i)
		{
			if (directional.weights(i * 3)[k] > 0)
			{
				EXPECT_NEAR(1.0, T.rowSum(i), 1e-12);
			}
		}
	}
}

TEST(EmpiricalTransiogram, OrientedTransitions)
{
	//A A B B along the X axis
	SampleSet set(1);
	ASSERT_TRUE(set.setCoordinates({ 0.0, 1.0, 2.0, 3.0 }, 1));
	int facies = set.addCategoricalField("facies", { "A", "A", "B", "B" });

	EmpiricalParams params;
	params.nlags = 1;
	params.maxlag = 1.0;

	EmpiricalFunction forward;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeDirectionalTransiogram(set, facies, GSVector3d(1, 0, 0), 0.1, params, forward));
	//from A: A->A, A->B
	EXPECT_DOUBLE_EQ(0.5, forward.transitionOrdinates(0, 0)[0]);
	EXPECT_DOUBLE_EQ(0.5, forward.transitionOrdinates(0, 1)[0]);
	//from B: B->B only
	EXPECT_DOUBLE_EQ(0.0, forward.transitionOrdinates(1, 0)[0]);
	EXPECT_DOUBLE_EQ(1.0, forward.transitionOrdinates(1, 1)[0]);

	EmpiricalFunction backward;
	ASSERT_EQ(SUCCESS, EmpiricalFunctionTools::ComputeDirectionalTransiogram(set, facies, GSVector3d(-1, 0, 0), 0.1, params, backward));
	EXPECT_DOUBLE_EQ(1.0, backward.transitionOrdinates(0, 0)[0]);
	EXPECT_DOUBLE_EQ(0.5, backward.transitionOrdinates(1, 0)[0]);
	EXPECT_DOUBLE_EQ(0.5, backward.transitionOrdinates(1, 1)[0]);
}

TEST(EmpiricalTransiogram, RequiresCategoricalVariable)
{
	SampleSet set;
	int field = -1;
	MakeRandomSet(20, 6, set, field);

	EmpiricalParams params;
	params.maxlag = 0.5;
	EmpiricalFunction transiogram;
	EXPECT_EQ(ERROR_UNKNOWN_VARIABLE, EmpiricalFunctionTools::ComputeTransiogram(set, field, params, transiogram));

	params.estimator = MATHERON;
	EXPECT_EQ(ERROR_UNKNOWN_ESTIMATOR, EmpiricalFunctionTools::ComputeTransiogram(set, field, params, transiogram));
}

TEST(EmpiricalFunction, FromBins)
{
	EmpiricalFunction function;
	ASSERT_EQ(SUCCESS, EmpiricalFunction::FromBins(EmpiricalFunction::VARIOGRAM, { 2, 0, 3 }, { 0.4, 1.5, 2.6 }, { { 1.0, 7.0, 2.0 } }, 3.0, function));
	EXPECT_EQ(3u, function.nlags());
	EXPECT_DOUBLE_EQ(1.0, function.lagSize());
	EXPECT_DOUBLE_EQ(0.0, function.ordinates()[1]);
	EXPECT_DOUBLE_EQ(2.0, function.maxOrdinate());
	EXPECT_EQ(5u, function.totalCount());

	EXPECT_EQ(ERROR_INVALID_INPUT, EmpiricalFunction::FromBins(EmpiricalFunction::TRANSIOGRAM, { 1 }, { 0.5 }, { { 1.0 }, { 0.0 } }, 1.0, function));
}
