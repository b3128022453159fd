#pragma once

#include "liblowess/core/errors.hpp"
#include <Eigen/Dense>
#include <string>
#include <utility>

namespace liblowess {
namespace core {

/**
 * Result of a 1-D local linear fit
 *
 * Design notes:
 * - Slope comes before intercept, matching the (slope, intercept, weights)
 *   order callers of the 1-D fit rely on
 * - The weight vector is exposed (the N-D result exposes distances instead)
 */
struct LocalLinearFit {
	/// Local slope at the query point
	double slope = 0.0;

	/// Local intercept (value of the local line at x = 0)
	double intercept = 0.0;

	/// Kernel weight of each observation (length = n_obs), not normalized
	Eigen::VectorXd weights;

	LocalLinearFit() = default;

	LocalLinearFit(double slope_, double intercept_, Eigen::VectorXd weights_)
	    : slope(slope_), intercept(intercept_), weights(std::move(weights_)) {}

	/// Value of the local line at x
	double Evaluate(double x) const {
		return intercept + slope * x;
	}
};

/**
 * Result of an N-D local linear fit
 *
 * beta = [intercept, slope_1, ..., slope_M]. A singular local system yields
 * beta = 0 of length M+1 (flat line through the origin).
 */
struct LocalFitNd {
	/// Local coefficients (length = n_dims + 1)
	Eigen::VectorXd beta;

	/// Euclidean distance of each observation to the query point (length = n_obs)
	Eigen::VectorXd distances;

	/// True when the weighted system was singular and beta is the zero fallback
	bool is_fallback = false;

	LocalFitNd() = default;

	LocalFitNd(Eigen::VectorXd beta_, Eigen::VectorXd distances_, bool is_fallback_ = false)
	    : beta(std::move(beta_)), distances(std::move(distances_)), is_fallback(is_fallback_) {}

	/// Number of predictor dimensions M
	Eigen::Index n_dims() const {
		return beta.size() > 0 ? beta.size() - 1 : 0;
	}

	double Intercept() const {
		return beta.size() > 0 ? beta(0) : 0.0;
	}

	Eigen::VectorXd Slopes() const {
		return beta.size() > 0 ? Eigen::VectorXd(beta.tail(beta.size() - 1)) : Eigen::VectorXd();
	}

	/**
	 * Value of the local hyperplane at a point
	 *
	 * @throws ShapeMismatch if point has a different dimensionality than the fit
	 */
	double Evaluate(const Eigen::VectorXd &point) const {
		if (point.size() != n_dims()) {
			throw ShapeMismatch("point has " + std::to_string(point.size()) + " dimensions, fit has " +
			                    std::to_string(n_dims()));
		}
		return Intercept() + Slopes().dot(point);
	}
};

} // namespace core
} // namespace liblowess
