#pragma once

#include "liblowess/core/errors.hpp"
#include "liblowess/core/local_fit_result.hpp"
#include "liblowess/core/lowess_options.hpp"
#include "liblowess/kernels/kernel_weights.hpp"
#include "liblowess/kernels/kernels.hpp"
#include "liblowess/solvers/normal_equations_solver.hpp"
#include "liblowess/utils/tracing.hpp"
#include "liblowess/weighting/neighborhood_weighter.hpp"
#include <Eigen/Dense>
#include <string>

namespace liblowess {

/**
 * Locally weighted linear regression at a single query point
 *
 * References:
 * - Cleveland (1979), "Robust locally weighted regression and smoothing
 *   scatterplots", JASA 74(368), 829-836
 * - Cleveland & Devlin (1988), "Locally weighted regression: an approach to
 *   regression analysis by local fitting", JASA 83(403), 596-610
 *
 * Robustness iterations are not performed; each call is a single weighted fit.
 *
 * The two entry points treat a singular local system differently:
 * - Fit (1-D) throws SingularSystem
 * - FitNd returns beta = 0 of length M+1 (flat line) and sets is_fallback
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Safe to call concurrently over disjoint query points
 */
class Lowess {
public:
	/**
	 * 1-D local linear fit
	 *
	 * @param x_star Query location
	 * @param x Predictors (length n)
	 * @param y Responses (length n)
	 * @param options Kernel, bandwidth, zero-radius policy
	 * @return (slope, intercept, weights)
	 * @throws ShapeMismatch if x and y lengths differ or n == 0
	 * @throws IndexOutOfRange if ceil(bandwidth * n) >= n
	 * @throws SingularSystem if the weighted design [1 | x] is rank-deficient
	 * @throws NonFiniteSystem if the weighted sums are not finite
	 */
	static core::LocalLinearFit Fit(double x_star, const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                                const core::LowessOptions &options = core::LowessOptions::Defaults());

	/**
	 * N-D local linear fit
	 *
	 * @param x_star Query location (length M)
	 * @param x Predictors (n × M, one row per observation)
	 * @param y Responses (length n)
	 * @param options Kernel, bandwidth, radial mode, zero-radius policy
	 * @return (beta, distances), beta = [intercept, slope_1, ..., slope_M]
	 * @throws ShapeMismatch on length or dimensionality disagreement
	 * @throws IndexOutOfRange if ceil(bandwidth * n) >= n (nearest-neighbour mode)
	 * @throws NonFiniteSystem if the weighted sums are not finite
	 */
	static core::LocalFitNd FitNd(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	                              const core::LowessOptions &options = core::LowessOptions::Defaults());
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::LocalLinearFit Lowess::Fit(double x_star, const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                        const core::LowessOptions &options) {
	if (y.size() != x.size()) {
		throw core::ShapeMismatch("responses have length " + std::to_string(y.size()) + " but predictors have " +
		                          std::to_string(x.size()));
	}

	LIBLOWESS_TIMING_START();

	weighting::NeighborhoodWeights nbhd = weighting::NeighborhoodWeighter::Weigh(x_star, x, options);

	solvers::NormalEquationsSolution solution =
	    solvers::NormalEquationsSolver::Fit(Eigen::MatrixXd(x), y, nbhd.weights, options.rank_tolerance);

	if (solution.status == solvers::SolveStatus::SINGULAR) {
		throw core::SingularSystem("local system at x = " + std::to_string(x_star) + " is rank-deficient (rank " +
		                           std::to_string(solution.rank) + " of 2, radius " + std::to_string(nbhd.radius) +
		                           ")");
	}
	if (solution.status == solvers::SolveStatus::NON_FINITE) {
		throw core::NonFiniteSystem("local system at x = " + std::to_string(x_star) + " has non-finite entries");
	}

	LIBLOWESS_TIMING_END("1-D local fit");
	return core::LocalLinearFit(solution.coefficients(1), solution.coefficients(0), nbhd.weights);
}

inline core::LocalFitNd Lowess::FitNd(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
                                      const Eigen::VectorXd &y, const core::LowessOptions &options) {
	if (y.size() != x.rows()) {
		throw core::ShapeMismatch("responses have length " + std::to_string(y.size()) + " but predictors have " +
		                          std::to_string(x.rows()) + " rows");
	}

	LIBLOWESS_TIMING_START();

	Eigen::VectorXd distances = weighting::NeighborhoodWeighter::ComputeDistances(x_star, x);

	Eigen::VectorXd weights;
	if (options.radial) {
		weights = kernels::KernelWeights::Radial(x_star, x, options);
	} else {
		weights = weighting::NeighborhoodWeighter::Weigh(distances, options).weights;
	}

	solvers::NormalEquationsSolution solution =
	    solvers::NormalEquationsSolver::Fit(x, y, weights, options.rank_tolerance);

	if (solution.status == solvers::SolveStatus::SINGULAR) {
		// Flat-line fallback: one zero per parameter (M+1), independent of n
		LIBLOWESS_DEBUG("singular local system (rank " << solution.rank << " of " << x.cols() + 1
		                                               << "), returning zero coefficients");
		LIBLOWESS_TIMING_END("N-D local fit");
		return core::LocalFitNd(Eigen::VectorXd::Zero(x.cols() + 1), distances, true);
	}
	if (solution.status == solvers::SolveStatus::NON_FINITE) {
		throw core::NonFiniteSystem("local system has non-finite entries; check the kernel's value for 0/0 and "
		                            "x/0 arguments");
	}

	LIBLOWESS_TIMING_END("N-D local fit");
	return core::LocalFitNd(solution.coefficients, distances);
}

// ============================================================================
// Convenience functions
// ============================================================================

/**
 * 1-D local linear fit with the tricube kernel
 *
 * @return (slope, intercept, weights)
 */
inline core::LocalLinearFit lowess(double x_star, const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                   double bandwidth = 2.0 / 3.0) {
	return Lowess::Fit(x_star, x, y, core::LowessOptions::WithBandwidth(bandwidth));
}

/**
 * N-D local linear fit
 *
 * @return (beta, distances)
 */
inline core::LocalFitNd lowess_nd(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
                                  const kernels::WeightFunction &kernel = kernels::Tricube,
                                  double bandwidth = 2.0 / 3.0, bool radial = false) {
	core::LowessOptions options = core::LowessOptions::WithKernel(kernel, bandwidth);
	options.radial = radial;
	return Lowess::FitNd(x_star, x, y, options);
}

} // namespace liblowess
