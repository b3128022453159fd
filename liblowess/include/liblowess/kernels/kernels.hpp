#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace liblowess {
namespace kernels {

/**
 * Kernel (weight) functions of normalized distance
 *
 * A kernel maps u = distance / h to a nonnegative weight. Compactly supported
 * kernels return exactly 0 for |u| >= 1. All kernels here are unnormalized
 * (peak value 1 at u = 0) since local regression weights need not integrate
 * or sum to one.
 *
 * Every kernel returns 0 for NaN input. A zero neighborhood radius produces
 * 0/0 for points at the query and x/0 = Inf for the rest, so those points
 * drop out of the fit instead of poisoning the normal equations.
 */
using WeightFunction = std::function<double(double)>;

/// Tricube: (1 - |u|^3)^3 on |u| < 1
inline double Tricube(double u) {
	const double a = std::abs(u);
	if (!(a < 1.0)) {
		return 0.0;
	}
	const double t = 1.0 - a * a * a;
	return t * t * t;
}

/// Epanechnikov: 1 - u^2 on |u| < 1
inline double Epanechnikov(double u) {
	const double a = std::abs(u);
	if (!(a < 1.0)) {
		return 0.0;
	}
	return 1.0 - a * a;
}

/// Biweight (bisquare): (1 - u^2)^2 on |u| < 1
inline double Biweight(double u) {
	const double a = std::abs(u);
	if (!(a < 1.0)) {
		return 0.0;
	}
	const double t = 1.0 - a * a;
	return t * t;
}

/// Triweight: (1 - u^2)^3 on |u| < 1
inline double Triweight(double u) {
	const double a = std::abs(u);
	if (!(a < 1.0)) {
		return 0.0;
	}
	const double t = 1.0 - a * a;
	return t * t * t;
}

/// Triangular: 1 - |u| on |u| < 1
inline double Triangular(double u) {
	const double a = std::abs(u);
	if (!(a < 1.0)) {
		return 0.0;
	}
	return 1.0 - a;
}

/// Uniform (boxcar): 1 on |u| < 1
inline double Uniform(double u) {
	return (std::abs(u) < 1.0) ? 1.0 : 0.0;
}

/// Gaussian: exp(-u^2 / 2), not compactly supported
inline double Gaussian(double u) {
	if (!std::isfinite(u)) {
		return 0.0;
	}
	return std::exp(-0.5 * u * u);
}

/**
 * Apply a kernel elementwise
 *
 * @param kernel Weight function
 * @param u Normalized distances
 * @return Weights, same length as u
 */
inline Eigen::VectorXd Apply(const WeightFunction &kernel, const Eigen::VectorXd &u) {
	Eigen::VectorXd w(u.size());
	for (Eigen::Index i = 0; i < u.size(); i++) {
		w(i) = kernel(u(i));
	}
	return w;
}

/// Names accepted by FromName()
inline std::vector<std::string> AvailableKernels() {
	return {"tricube", "epanechnikov", "biweight", "triweight", "triangular", "uniform", "gaussian"};
}

/**
 * Resolve a kernel by name (case-insensitive)
 *
 * @param name One of AvailableKernels()
 * @return The matching weight function
 * @throws std::invalid_argument for an unknown name
 */
inline WeightFunction FromName(const std::string &name) {
	std::string key = name;
	std::transform(key.begin(), key.end(), key.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (key == "tricube") {
		return Tricube;
	} else if (key == "epanechnikov") {
		return Epanechnikov;
	} else if (key == "biweight" || key == "bisquare") {
		return Biweight;
	} else if (key == "triweight") {
		return Triweight;
	} else if (key == "triangular") {
		return Triangular;
	} else if (key == "uniform") {
		return Uniform;
	} else if (key == "gaussian") {
		return Gaussian;
	}
	throw std::invalid_argument("unknown kernel '" + name + "'");
}

} // namespace kernels
} // namespace liblowess
