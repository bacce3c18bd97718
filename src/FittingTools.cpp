// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <FittingTools.h>

//Local
#include <Logger.h>

//System
#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>

#ifdef GS_CORE_LIB_USES_TBB
#include <tbb/parallel_for.h>
#endif

using namespace GeoStatsCoreLib;

namespace
{
	using Vector = std::vector<double>;
	using Matrix = std::vector<Vector>;

	//! Relative step of the finite differences
	constexpr double DIFFERENCE_STEP = 1.0e-7;
	//! Convergence threshold on the relative decrease of the objective
	constexpr double COST_TOLERANCE = 1.0e-12;
	//! Convergence threshold on the (relative) step size
	constexpr double STEP_TOLERANCE = 1.0e-12;
	//! Step size below which a negligible decrease means convergence
	constexpr double SMALL_STEP = 1.0e-8;
	//! Initial damping (relative to the largest diagonal term of the normal matrix)
	constexpr double INITIAL_DAMPING = 1.0e-3;
	//! Damping above which no progress is possible anymore
	constexpr double MAX_DAMPING = 1.0e20;
	//! Lower bound of a free range or length (relative to its cap)
	constexpr double MIN_RELATIVE_SCALE = 1.0e-6;

	//! Cholesky matrix decomposition to lower triangular matrix and its conjugate transpose
	/** Restricted to positive-definite matrices
	**/
	class CholeskyDecomposition
	{
	public:

		//! Constructor
		/** \warning Input matrix is decomposed in-place
		**/
		explicit CholeskyDecomposition(const Matrix& matrix)
			: m_matrix(matrix)
		{
			assert(matrix.size() > 0 && matrix.size() == matrix[0].size());
		}

		//! Decomposition into triangular matrices
		bool decompose()
		{
			for (size_t j = 0; j < m_matrix.size(); ++j)
			{
				for (size_t i = j; i < m_matrix.size(); ++i)
				{
					double sum = 0.0;
					for (size_t k = 0; k < j; ++k)
					{
						sum += m_matrix[i][k] * m_matrix[j][k];
					}

					if (i == j)
					{
						if (!(m_matrix[i][i] - sum > 0.0))
						{
							//not positive definite
							return false;
						}
						m_matrix[i][i] = std::sqrt(m_matrix[i][i] - sum);
					}
					else
					{
						m_matrix[i][j] = (m_matrix[i][j] - sum) / m_matrix[j][j];
						m_matrix[j][i] = m_matrix[i][j];
					}
				}
			}

			return true;
		}

		//! Solve Ax = b. A is the input matrix.
		Vector solve(const Vector& b) const
		{
			Vector y(b.size());

			//forward substitution (lower triangular)
			for (size_t i = 0; i < b.size(); ++i)
			{
				double sum = 0.0;
				for (size_t j = 0; j < i; ++j)
				{
					sum += m_matrix[i][j] * y[j];
				}
				y[i] = (b[i] - sum) / m_matrix[i][i];
			}

			//back substitution (upper triangular), in place
			for (size_t i = b.size(); i-- > 0;)
			{
				double sum = 0.0;
				for (size_t j = i + 1; j < b.size(); ++j)
				{
					sum += m_matrix[i][j] * y[j];
				}
				y[i] = (y[i] - sum) / m_matrix[i][i];
			}

			return y;
		}

	protected:

		//! Decomposed matrix
		Matrix m_matrix;
	};

	//! Box-constrained least squares problem
	struct BoxProblem
	{
		//! Computes the residuals of a set of parameters
		std::function<void(const Vector& theta, Vector& residuals)> residuals;
		//! Lower bounds
		Vector lower;
		//! Upper bounds
		Vector upper;
		//! Initial guess
		Vector initial;

		//! Adds a parameter
		void addParameter(double lowerBound, double upperBound, double guess)
		{
			lower.push_back(lowerBound);
			upper.push_back(upperBound);
			initial.push_back(guess);
		}
	};

	//! Projected Levenberg-Marquardt
	/** Parameters lying on a bound with a gradient pointing outside the box are
		frozen during an iteration. Steps are projected onto the box.
	**/
	class ProjectedLevenbergMarquardt
	{
	public:

		explicit ProjectedLevenbergMarquardt(const BoxProblem& problem)
			: m_problem(problem)
		{}

		//! Minimizes the sum of the squared residuals
		/** \param[out] theta solution (best point found)
			\param[out] cost objective at the solution
			\param maxIterations maximum number of iterations
			\return whether the optimizer converged
		**/
		bool minimize(Vector& theta, double& cost, unsigned maxIterations) const
		{
			const size_t n = m_problem.initial.size();
			theta = m_problem.initial;
			project(theta);

			Vector r;
			cost = evaluate(theta, r);
			if (!std::isfinite(cost))
			{
				return false;
			}

			double mu = -1.0;
			Matrix J;
			Vector rNew;
			for (unsigned it = 0; it < maxIterations; ++it)
			{
				if (cost == 0.0)
				{
					return true;
				}

				jacobian(theta, r, J);

				//gradient and normal matrix
				Vector g(n, 0.0);
				Matrix A(n, Vector(n, 0.0));
				for (size_t i = 0; i < r.size(); ++i)
				{
					const Vector& Ji = J[i];
					for (size_t a = 0; a < n; ++a)
					{
						g[a] += Ji[a] * r[i];
						for (size_t b = 0; b <= a; ++b)
						{
							A[a][b] += Ji[a] * Ji[b];
						}
					}
				}
				for (size_t a = 0; a < n; ++a)
				{
					for (size_t b = 0; b < a; ++b)
					{
						A[b][a] = A[a][b];
					}
				}

				//active set
				std::vector<size_t> freeParams;
				double maxDiag = 0.0;
				for (size_t a = 0; a < n; ++a)
				{
					bool atLower = (theta[a] <= m_problem.lower[a]);
					bool atUpper = (theta[a] >= m_problem.upper[a]);
					if ((atLower && g[a] > 0) || (atUpper && g[a] < 0) || g[a] == 0)
					{
						continue;
					}
					freeParams.push_back(a);
					maxDiag = std::max(maxDiag, A[a][a]);
				}
				if (freeParams.empty())
				{
					//stationary point of the box
					return true;
				}

				if (mu < 0)
				{
					mu = INITIAL_DAMPING * (maxDiag > 0 ? maxDiag : 1.0);
				}

				const size_t m = freeParams.size();
				while (true)
				{
					Matrix M(m, Vector(m));
					Vector b(m);
					for (size_t p = 0; p < m; ++p)
					{
						for (size_t q = 0; q < m; ++q)
						{
							M[p][q] = A[freeParams[p]][freeParams[q]];
						}
						M[p][p] += mu;
						b[p] = -g[freeParams[p]];
					}

					CholeskyDecomposition cholesky(M);
					if (!cholesky.decompose())
					{
						mu *= 2;
						if (mu > MAX_DAMPING)
						{
							return true;
						}
						continue;
					}
					Vector delta = cholesky.solve(b);

					Vector thetaNew = theta;
					double stepNorm = 0.0;
					for (size_t p = 0; p < m; ++p)
					{
						size_t a = freeParams[p];
						thetaNew[a] = std::min(std::max(theta[a] + delta[p], m_problem.lower[a]), m_problem.upper[a]);
						stepNorm = std::max(stepNorm, std::abs(thetaNew[a] - theta[a]) / std::max(std::abs(theta[a]), 1.0));
					}

					double costNew = evaluate(thetaNew, rNew);
					if (costNew < cost)
					{
						double decrease = cost - costNew;
						theta.swap(thetaNew);
						r.swap(rNew);
						cost = costNew;
						mu /= 3;

						if ((decrease <= COST_TOLERANCE * cost && stepNorm <= SMALL_STEP) || stepNorm <= STEP_TOLERANCE)
						{
							return true;
						}
						break;
					}

					//rejected step
					mu *= 2;
					if (mu > MAX_DAMPING || stepNorm <= STEP_TOLERANCE)
					{
						return true;
					}
				}
			}

			return false;
		}

	protected:

		//! Clamps parameters to the box
		void project(Vector& theta) const
		{
			for (size_t a = 0; a < theta.size(); ++a)
			{
				theta[a] = std::min(std::max(theta[a], m_problem.lower[a]), m_problem.upper[a]);
			}
		}

		//! Returns the sum of the squared residuals (infinity if not finite)
		double evaluate(const Vector& theta, Vector& r) const
		{
			m_problem.residuals(theta, r);
			double cost = 0.0;
			for (double ri : r)
			{
				cost += ri * ri;
			}
			return std::isfinite(cost) ? cost : std::numeric_limits<double>::infinity();
		}

		//! Forward differences (backward next to the upper bound)
		void jacobian(const Vector& theta, const Vector& r, Matrix& J) const
		{
			const size_t n = theta.size();
			J.assign(r.size(), Vector(n, 0.0));

			Vector shifted(theta);
			Vector rShifted;
			for (size_t a = 0; a < n; ++a)
			{
				double h = DIFFERENCE_STEP * std::max(std::abs(theta[a]), 1.0);
				if (theta[a] + h > m_problem.upper[a])
				{
					h = -h;
				}

				shifted[a] = theta[a] + h;
				double shiftedCost = evaluate(shifted, rShifted);
				if (!std::isfinite(shiftedCost))
				{
					//try the other side
					h = -h;
					shifted[a] = theta[a] + h;
					shiftedCost = evaluate(shifted, rShifted);
				}
				shifted[a] = theta[a];

				if (std::isfinite(shiftedCost))
				{
					for (size_t i = 0; i < r.size(); ++i)
					{
						J[i][a] = (rShifted[i] - r[i]) / h;
					}
				}
			}
		}

		//! Problem
		const BoxProblem& m_problem;
	};

	//! Sets the box of a parameter
	/** \param fixedValue fixed value (NaN = free)
		\param cap upper bound of a free parameter (lower bound: 0)
		\param guess initial guess of a free parameter
		\param problem problem
		\return SUCCESS or ERROR_INFEASIBLE_BOUNDS
	**/
	ErrorCode AddParameter(double fixedValue, double cap, double guess, BoxProblem& problem)
	{
		if (!std::isnan(fixedValue))
		{
			if (!std::isfinite(fixedValue))
			{
				return ERROR_INVALID_PARAMETER;
			}
			problem.addParameter(fixedValue - FIXED_PARAMETER_TOLERANCE, fixedValue + FIXED_PARAMETER_TOLERANCE, fixedValue);
			return SUCCESS;
		}

		if (!(cap >= 0.0))
		{
			Logger::Error("[FittingTools] Infeasible bounds [0, %g]", cap);
			return ERROR_INFEASIBLE_BOUNDS;
		}

		problem.addParameter(0.0, cap, std::min(std::max(guess, 0.0), cap));
		return SUCCESS;
	}

	//! Keeps the last added parameter away from zero if it is free (ranges and lengths)
	void SetPositiveLowerBound(double fixedValue, BoxProblem& problem)
	{
		if (std::isnan(fixedValue) && !problem.lower.empty())
		{
			size_t a = problem.lower.size() - 1;
			problem.lower[a] = MIN_RELATIVE_SCALE * problem.upper[a];
			problem.initial[a] = std::max(problem.initial[a], problem.lower[a]);
		}
	}

	//! Returns a value or its default
	inline double ValueOr(double value, double defaultValue)
	{
		return std::isnan(value) ? defaultValue : value;
	}

	//! Nugget of a bounded variogram (a free nugget is capped by the sill)
	inline double FeasibleNugget(double nugget, double sill, bool freeNugget)
	{
		return freeNugget ? std::min(nugget, sill) : nugget;
	}

	//! Scaling of a power variogram (non-negative)
	inline double PowerScaling(double scaling)
	{
		return std::max(scaling, 0.0);
	}

	//! Exponent of a power variogram (in [0, 2])
	inline double PowerExponent(double exponent)
	{
		return std::min(std::max(exponent, 0.0), 2.0);
	}

	//! Normalizes proportions so that they sum to one
	bool NormalizeProportions(std::vector<double>& proportions)
	{
		double sum = 0.0;
		for (double& p : proportions)
		{
			p = std::max(p, 0.0);
			sum += p;
		}
		if (!(sum > 0.0))
		{
			return false;
		}
		for (double& p : proportions)
		{
			p /= sum;
		}
		return true;
	}

	//! Transition rate matrix of mean lengths and proportions (unchecked)
	void RatesFromLengths(const double* lengths, const double* proportions, unsigned k, SquareMatrixd& R)
	{
		for (unsigned i = 0; i < k; ++i)
		{
			for (unsigned j = 0; j < k; ++j)
			{
				if (i == j)
				{
					R.m_values[i][j] = -1.0 / lengths[i];
				}
				else
				{
					R.m_values[i][j] = (proportions[j] / (1.0 - proportions[i])) / lengths[i];
				}
			}
		}
	}
}

ErrorCode FittingTools::GetBins(const EmpiricalFunction& function, EmpiricalFunction::Kind kind, const FittingParams& params, Bins& bins)
{
	if (!function.isValid() || function.kind() != kind || function.channelCount() == 0)
	{
		Logger::Error("[FittingTools] Invalid empirical function");
		return ERROR_INVALID_INPUT;
	}

	bins = Bins();
	bins.y.resize(function.channelCount());
	bins.ymax = -std::numeric_limits<double>::infinity();

	try
	{
		double countSum = 0.0;
		const std::vector<std::size_t>& counts = function.counts();
		for (unsigned k = 0; k < function.nlags(); ++k)
		{
			if (counts[k] == 0)
			{
				continue;
			}

			double x = function.abscissas()[k];
			bins.x.push_back(x);
			bins.w.push_back(static_cast<double>(counts[k]));
			countSum += counts[k];
			bins.xmax = std::max(bins.xmax, x);

			for (unsigned c = 0; c < function.channelCount(); ++c)
			{
				double y = function.ordinates(c)[k];
				bins.y[c].push_back(y);
				bins.lambda += y * y;
				bins.ymax = std::max(bins.ymax, y);
			}
		}

		if (bins.x.empty())
		{
			Logger::Error("[FittingTools] No usable bin");
			return ERROR_NO_USABLE_BIN;
		}

		for (size_t b = 0; b < bins.x.size(); ++b)
		{
			if (params.weightFunction)
			{
				bins.w[b] = params.weightFunction(bins.x[b]);
				if (!(bins.w[b] >= 0.0) || !std::isfinite(bins.w[b]))
				{
					Logger::Error("[FittingTools] Invalid weight at lag %g", bins.x[b]);
					return ERROR_INVALID_PARAMETER;
				}
			}
			else
			{
				bins.w[b] /= countSum;
			}
		}
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}

	return SUCCESS;
}

ErrorCode FittingTools::FitVariogram(	VariogramModel::Family family,
										const EmpiricalFunction& variogram,
										const FittingParams& params,
										VariogramModel& model,
										double* residual/*=nullptr*/)
{
	if (family == VariogramModel::INVALID_FAMILY)
	{
		return ERROR_INVALID_PARAMETER;
	}

	Bins bins;
	ErrorCode result = GetBins(variogram, EmpiricalFunction::VARIOGRAM, params, bins);
	if (result != SUCCESS)
	{
		return result;
	}

	const Vector& x = bins.x;
	const Vector& y = bins.y.front();
	const Vector& w = bins.w;
	const size_t binCount = x.size();
	bool freeNugget = false;

	BoxProblem problem;
	switch (family)
	{
	case VariogramModel::NUGGET:
	{
		double nmax = ValueOr(params.maxnugget, bins.ymax);
		result = AddParameter(params.nugget, nmax, nmax / 2, problem);
		if (result != SUCCESS)
		{
			return result;
		}
		problem.residuals = [&](const Vector& theta, Vector& r)
		{
			r.resize(binCount);
			for (size_t b = 0; b < binCount; ++b)
			{
				r[b] = std::sqrt(w[b]) * (theta[0] - y[b]);
			}
		};
	}
	break;

	case VariogramModel::POWER:
	{
		//theta = [scaling, nugget, exponent]
		double smax = ValueOr(params.maxscaling, bins.ymax);
		double nmax = ValueOr(params.maxnugget, bins.ymax);
		double emax = std::min(ValueOr(params.maxexponent, 2.0), 2.0);
		if (	(!std::isnan(params.scaling) && params.scaling < 0.0)
			||	(!std::isnan(params.exponent) && !(params.exponent >= 0.0 && params.exponent <= 2.0)))
		{
			Logger::Error("[FittingTools] Power variogram requires scaling >= 0 and exponent in [0, 2]");
			return ERROR_INVALID_PARAMETER;
		}
		if (	(result = AddParameter(params.scaling, smax, smax / 3, problem)) != SUCCESS
			||	(result = AddParameter(params.nugget, nmax, 0.01 * nmax, problem)) != SUCCESS
			||	(result = AddParameter(params.exponent, emax, 0.95 * emax, problem)) != SUCCESS)
		{
			return result;
		}

		//scaling >= 0 and exponent in [0, 2] hold by construction (no penalty)
		problem.residuals = [&](const Vector& theta, Vector& r)
		{
			r.resize(binCount);
			for (size_t b = 0; b < binCount; ++b)
			{
				double gamma = PowerScaling(theta[0]) * std::pow(x[b], PowerExponent(theta[2])) + theta[1];
				r[b] = std::sqrt(w[b]) * (gamma - y[b]);
			}
		};
	}
	break;

	default:
	{
		//theta = [range, sill, nugget]
		double rmax = ValueOr(params.maxrange, bins.xmax);
		double smax = ValueOr(params.maxsill, bins.ymax);
		double nmax = ValueOr(params.maxnugget, bins.ymax);
		freeNugget = std::isnan(params.nugget);
		const bool freeSill = std::isnan(params.sill);
		result = AddParameter(params.range, rmax, rmax / 3, problem);
		if (result != SUCCESS)
		{
			return result;
		}
		SetPositiveLowerBound(params.range, problem);
		if (	(result = AddParameter(params.sill, smax, 0.95 * smax, problem)) != SUCCESS
			||	(result = AddParameter(params.nugget, nmax, 0.01 * smax, problem)) != SUCCESS)
		{
			return result;
		}

		//a fixed nugget is a lower bound of the sill
		if (!freeNugget && freeSill && problem.lower[1] < problem.upper[2])
		{
			if (problem.upper[2] > problem.upper[1])
			{
				Logger::Error("[FittingTools] Fixed nugget %g exceeds the maximum sill %g", params.nugget, smax);
				return ERROR_INFEASIBLE_BOUNDS;
			}
			problem.lower[1] = problem.upper[2];
			problem.initial[1] = std::max(problem.initial[1], problem.lower[1]);
		}

		//a free nugget never exceeds the sill (nugget <= sill by construction)
		const double order = params.order;
		problem.residuals = [&, family, order, freeNugget](const Vector& theta, Vector& r)
		{
			VariogramModel candidate(family, theta[0], theta[1], FeasibleNugget(theta[2], theta[1], freeNugget), order);
			r.resize(binCount);
			for (size_t b = 0; b < binCount; ++b)
			{
				r[b] = std::sqrt(w[b]) * (candidate.evaluate(x[b]) - y[b]);
			}
		};
	}
	break;
	}

	Vector theta;
	double cost = 0.0;
	try
	{
		ProjectedLevenbergMarquardt optimizer(problem);
		if (!optimizer.minimize(theta, cost, params.maxIterations))
		{
			if (theta.empty() || !std::isfinite(cost))
			{
				Logger::Error("[FittingTools] %s fit failed (no finite objective)", VariogramModel::FamilyName(family));
				return ERROR_INVALID_PARAMETER;
			}
			Logger::Warning("[FittingTools] %s fit did not converge after %u iterations", VariogramModel::FamilyName(family), params.maxIterations);
		}
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}

	//penalty of the remaining violation (fixed sill and nugget only)
	double penalty = 0.0;
	switch (family)
	{
	case VariogramModel::NUGGET:
		model = VariogramModel::NuggetEffect(theta[0]);
		break;
	case VariogramModel::POWER:
		model = VariogramModel::Power(PowerScaling(theta[0]), theta[1], PowerExponent(theta[2]));
		break;
	default:
	{
		double nugget = FeasibleNugget(theta[2], theta[1], freeNugget);
		model = VariogramModel(family, MetricBall(theta[0]), theta[1], nugget, params.order);
		penalty = bins.lambda * std::max(0.0, nugget - theta[1]);
	}
	break;
	}
	if (!model.isValid())
	{
		Logger::Error("[FittingTools] Fitted %s parameters don't define a valid model", VariogramModel::FamilyName(family));
		return ERROR_INVALID_PARAMETER;
	}
	model.setLagUnit(variogram.lagUnit());
	model.setValueUnit(variogram.valueUnit());

	if (residual)
	{
		*residual = cost + penalty;
	}

	return SUCCESS;
}

ErrorCode FittingTools::FitVariogram(	const std::vector<VariogramModel::Family>& families,
										const EmpiricalFunction& variogram,
										const FittingParams& params,
										VariogramModel& model,
										double* residual/*=nullptr*/)
{
	if (families.empty())
	{
		Logger::Error("[FittingTools] Empty list of candidate families");
		return ERROR_EMPTY_CANDIDATE_LIST;
	}

	//check the bins once
	{
		Bins bins;
		ErrorCode result = GetBins(variogram, EmpiricalFunction::VARIOGRAM, params, bins);
		if (result != SUCCESS)
		{
			return result;
		}
	}

	std::vector<ErrorCode> results(families.size(), SUCCESS);
	std::vector<VariogramModel> models(families.size());
	std::vector<double> residuals(families.size(), std::numeric_limits<double>::infinity());
	try
	{
		auto fitCandidate = [&](std::size_t i)
		{
			results[i] = FitVariogram(families[i], variogram, params, models[i], &residuals[i]);
		};

#ifdef GS_CORE_LIB_USES_TBB
		tbb::parallel_for(tbb::blocked_range<std::size_t>(0, families.size()),
			[&](tbb::blocked_range<std::size_t> r) {
				for (auto i = r.begin(); i != r.end(); ++i) { fitCandidate(i); }
			}
		);
#else
		for (std::size_t i = 0; i < families.size(); ++i)
		{
			fitCandidate(i);
		}
#endif
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}

	//candidates that can't be fitted are skipped
	std::size_t best = families.size();
	for (std::size_t i = 0; i < families.size(); ++i)
	{
		if (results[i] != SUCCESS)
		{
			continue;
		}
		if (best == families.size() || residuals[i] < residuals[best])
		{
			best = i;
		}
	}
	if (best == families.size())
	{
		return results.front();
	}

	model = models[best];
	if (residual)
	{
		*residual = residuals[best];
	}

	return SUCCESS;
}

ErrorCode FittingTools::FitTransiogram(	TransiogramModel::Family family,
										const EmpiricalFunction& transiogram,
										const FittingParams& params,
										TransiogramModel& model,
										double* residual/*=nullptr*/)
{
	if (family == TransiogramModel::INVALID_FAMILY)
	{
		return ERROR_INVALID_PARAMETER;
	}
	if (family == TransiogramModel::CARLE)
	{
		//built from the rate matrices of the axes (see TransitionMatrixTools)
		Logger::Error("[FittingTools] %s transiograms are not fitted", TransiogramModel::FamilyName(family));
		return ERROR_INVALID_PARAMETER;
	}

	Bins bins;
	ErrorCode result = GetBins(transiogram, EmpiricalFunction::TRANSIOGRAM, params, bins);
	if (result != SUCCESS)
	{
		return result;
	}

	const unsigned k = transiogram.levelCount();
	if (k == 0 || bins.y.size() != static_cast<size_t>(k) * k)
	{
		return ERROR_INVALID_INPUT;
	}
	if (	(!params.proportions.empty() && params.proportions.size() != k)
		||	(!params.lengths.empty() && params.lengths.size() != k))
	{
		Logger::Error("[FittingTools] Expected %u fixed proportions or lengths", k);
		return ERROR_INVALID_PARAMETER;
	}

	if (family == TransiogramModel::PIECEWISE_LINEAR)
	{
		try
		{
			std::vector<SquareMatrixd> ordinates;
			ordinates.reserve(bins.x.size());
			for (size_t b = 0; b < bins.x.size(); ++b)
			{
				SquareMatrixd T(k);
				for (unsigned c = 0; c < k * k; ++c)
				{
					T.m_values[c / k][c % k] = bins.y[c][b];
				}
				ordinates.push_back(T);
			}
			model = TransiogramModel::PiecewiseLinear(bins.x, ordinates, MetricBall(1.0, transiogram.lagUnit()));
		}
		catch (const std::bad_alloc&)
		{
			//not enough memory
			return ERROR_OUT_OF_MEMORY;
		}

		if (!model.isValid())
		{
			return ERROR_INVALID_INPUT;
		}
		if (residual)
		{
			*residual = 0.0;
		}
		return SUCCESS;
	}

	const bool matrixExponential = (family == TransiogramModel::MATRIX_EXPONENTIAL);
	const double rmax = ValueOr(params.maxrange, bins.xmax);

	//theta = [range, p1..pk] or [l1..lk, p1..pk]
	BoxProblem problem;
	if (matrixExponential)
	{
		for (unsigned i = 0; i < k; ++i)
		{
			double length = params.lengths.empty() ? NAN_VALUE : params.lengths[i];
			result = AddParameter(length, rmax, rmax / 3, problem);
			if (result != SUCCESS)
			{
				return result;
			}
			SetPositiveLowerBound(length, problem);
		}
	}
	else
	{
		result = AddParameter(params.range, rmax, rmax / 3, problem);
		if (result != SUCCESS)
		{
			return result;
		}
		SetPositiveLowerBound(params.range, problem);
	}
	const size_t firstProportion = problem.initial.size();

	//free proportions start at 95% of their cap (1), renormalized
	const double guess = 1.0 / k;
	for (unsigned j = 0; j < k; ++j)
	{
		result = AddParameter(params.proportions.empty() ? NAN_VALUE : params.proportions[j], 1.0, guess, problem);
		if (result != SUCCESS)
		{
			return result;
		}
	}

	const Vector& x = bins.x;
	const Vector& w = bins.w;
	const std::vector<Vector>& y = bins.y;
	const size_t binCount = x.size();
	const size_t channelCount = y.size();

	//proportions are normalized (they sum to one by construction)
	problem.residuals = [&, family, k, firstProportion, matrixExponential](const Vector& theta, Vector& r)
	{
		r.resize(binCount * channelCount);
		std::vector<double> proportions(theta.begin() + firstProportion, theta.end());
		if (!NormalizeProportions(proportions))
		{
			std::fill(r.begin(), r.end(), NAN_VALUE);
			return;
		}

		SquareMatrixd R(k);
		if (matrixExponential)
		{
			RatesFromLengths(theta.data(), proportions.data(), k, R);
		}

		SquareMatrixd T(k);
		for (size_t b = 0; b < binCount; ++b)
		{
			if (matrixExponential)
			{
				SquareMatrixd hR(R);
				hR.scale(x[b]);
				T = hR.exp();
				if (!T.isValid())
				{
					std::fill(r.begin(), r.end(), NAN_VALUE);
					return;
				}
			}
			else
			{
				TransiogramModel::EvaluateRangeFamily(family, x[b], theta[0], proportions, T);
			}

			double sqrtW = std::sqrt(w[b]);
			for (size_t c = 0; c < channelCount; ++c)
			{
				r[c * binCount + b] = sqrtW * (T.m_values[c / k][c % k] - y[c][b]);
			}
		}
	};

	Vector theta;
	double cost = 0.0;
	try
	{
		ProjectedLevenbergMarquardt optimizer(problem);
		if (!optimizer.minimize(theta, cost, params.maxIterations))
		{
			if (theta.empty() || !std::isfinite(cost))
			{
				Logger::Error("[FittingTools] %s fit failed (no finite objective)", TransiogramModel::FamilyName(family));
				return ERROR_INVALID_PARAMETER;
			}
			Logger::Warning("[FittingTools] %s fit did not converge after %u iterations", TransiogramModel::FamilyName(family), params.maxIterations);
		}

		std::vector<double> proportions(theta.begin() + firstProportion, theta.end());
		if (!NormalizeProportions(proportions))
		{
			Logger::Error("[FittingTools] Fitted proportions are all zero");
			return ERROR_INVALID_PARAMETER;
		}

		if (matrixExponential)
		{
			std::vector<double> lengths(theta.begin(), theta.begin() + firstProportion);
			model = TransiogramModel::MatrixExponential(lengths, proportions, MetricBall(1.0));
		}
		else
		{
			model = TransiogramModel(family, MetricBall(theta[0]), proportions);
		}
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}

	if (!model.isValid())
	{
		Logger::Error("[FittingTools] Fitted %s parameters don't define a valid model", TransiogramModel::FamilyName(family));
		return ERROR_INVALID_PARAMETER;
	}
	model.setLagUnit(transiogram.lagUnit());

	if (residual)
	{
		*residual = cost;
	}

	return SUCCESS;
}

ErrorCode FittingTools::FitTransiogram(	const std::vector<TransiogramModel::Family>& families,
										const EmpiricalFunction& transiogram,
										const FittingParams& params,
										TransiogramModel& model,
										double* residual/*=nullptr*/)
{
	if (families.empty())
	{
		Logger::Error("[FittingTools] Empty list of candidate families");
		return ERROR_EMPTY_CANDIDATE_LIST;
	}

	{
		Bins bins;
		ErrorCode result = GetBins(transiogram, EmpiricalFunction::TRANSIOGRAM, params, bins);
		if (result != SUCCESS)
		{
			return result;
		}
	}

	std::vector<ErrorCode> results(families.size(), SUCCESS);
	std::vector<TransiogramModel> models(families.size());
	std::vector<double> residuals(families.size(), std::numeric_limits<double>::infinity());
	try
	{
		auto fitCandidate = [&](std::size_t i)
		{
			results[i] = FitTransiogram(families[i], transiogram, params, models[i], &residuals[i]);
		};

#ifdef GS_CORE_LIB_USES_TBB
		tbb::parallel_for(tbb::blocked_range<std::size_t>(0, families.size()),
			[&](tbb::blocked_range<std::size_t> r) {
				for (auto i = r.begin(); i != r.end(); ++i) { fitCandidate(i); }
			}
		);
#else
		for (std::size_t i = 0; i < families.size(); ++i)
		{
			fitCandidate(i);
		}
#endif
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}

	//candidates that can't be fitted are skipped
	std::size_t best = families.size();
	for (std::size_t i = 0; i < families.size(); ++i)
	{
		if (results[i] != SUCCESS)
		{
			continue;
		}
		if (best == families.size() || residuals[i] < residuals[best])
		{
			best = i;
		}
	}
	if (best == families.size())
	{
		return results.front();
	}

	model = models[best];
	if (residual)
	{
		*residual = residuals[best];
	}

	return SUCCESS;
}
