#pragma once

#include "liblowess/core/errors.hpp"
#include "liblowess/core/lowess_options.hpp"
#include "liblowess/kernels/kernels.hpp"
#include "liblowess/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace liblowess {
namespace weighting {

/**
 * Weights and the neighborhood they were computed from
 */
struct NeighborhoodWeights {
	/// kernel(distance / radius) per observation (length = n_obs)
	Eigen::VectorXd weights;

	/// Distance of each observation to the query point (length = n_obs)
	Eigen::VectorXd distances;

	/// Sorted index used to pick the radius: ceil(bandwidth * n_obs)
	size_t rank = 0;

	/// Neighborhood radius h
	double radius = 0.0;
};

/**
 * Neighborhood Weighter
 *
 * Turns distances to the query point into kernel weights:
 * 1. distance_i = ||x_i - x_star||
 * 2. r = ceil(bandwidth * n)
 * 3. h = distance at index r of the ascending sort (0-indexed)
 * 4. weight_i = kernel(distance_i / h)
 *
 * Step 3 makes h the boundary distance of the nearest r+1 points, not r
 * points. The rank is never clamped: r >= n raises IndexOutOfRange, so a
 * bandwidth of 1 is always rejected.
 *
 * When h == 0 (at least r+1 observations coincide with the query) the
 * division is carried out and the kernel decides what 0/0 and x/0 weigh.
 * LowessOptions::strict_bandwidth turns this into DegenerateBandwidth.
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Weights are not normalized
 */
class NeighborhoodWeighter {
public:
	/**
	 * Euclidean distance of every row of x to x_star
	 *
	 * @param x_star Query point (length M)
	 * @param x Predictors (N × M, one row per observation)
	 * @return Distances (length N)
	 * @throws ShapeMismatch if x.cols() != x_star.size()
	 */
	static Eigen::VectorXd ComputeDistances(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x);

	/// Absolute difference |x_i - x_star| (the 1-D norm)
	static Eigen::VectorXd ComputeDistances(double x_star, const Eigen::VectorXd &x);

	/**
	 * Sorted index of the neighborhood radius
	 *
	 * @param bandwidth Fraction in (0, 1]
	 * @param n Number of observations
	 * @return ceil(bandwidth * n)
	 * @throws ShapeMismatch if n == 0
	 * @throws IndexOutOfRange if the index is >= n
	 */
	static size_t BandwidthRank(double bandwidth, size_t n);

	/**
	 * The rank-th smallest distance (0-indexed)
	 *
	 * @throws IndexOutOfRange if rank >= distances.size()
	 * @throws std::invalid_argument if any distance is NaN or Inf
	 */
	static double BandwidthRadius(const Eigen::VectorXd &distances, size_t rank);

	/**
	 * Kernel weights for precomputed distances
	 *
	 * @param distances Distance of each observation to the query point
	 * @param options Kernel, bandwidth and degenerate-radius policy
	 * @return Weights, distances, rank and radius
	 */
	static NeighborhoodWeights Weigh(const Eigen::VectorXd &distances, const core::LowessOptions &options);

	/// Distances to x_star followed by Weigh()
	static NeighborhoodWeights Weigh(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
	                                 const core::LowessOptions &options);

	static NeighborhoodWeights Weigh(double x_star, const Eigen::VectorXd &x, const core::LowessOptions &options);

	/**
	 * Apply the degenerate-radius policy
	 *
	 * Logs a warning for h == 0, or throws DegenerateBandwidth when
	 * options.strict_bandwidth is set.
	 */
	static void CheckRadius(double radius, const core::LowessOptions &options);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::VectorXd NeighborhoodWeighter::ComputeDistances(const Eigen::VectorXd &x_star,
                                                              const Eigen::MatrixXd &x) {
	if (x.cols() != x_star.size()) {
		throw core::ShapeMismatch("query point has " + std::to_string(x_star.size()) +
		                          " dimensions but predictors have " + std::to_string(x.cols()));
	}
	return (x.rowwise() - x_star.transpose()).rowwise().norm();
}

inline Eigen::VectorXd NeighborhoodWeighter::ComputeDistances(double x_star, const Eigen::VectorXd &x) {
	return (x.array() - x_star).abs().matrix();
}

inline size_t NeighborhoodWeighter::BandwidthRank(double bandwidth, size_t n) {
	if (n == 0) {
		throw core::ShapeMismatch("dataset must contain at least one observation");
	}

	const size_t rank = static_cast<size_t>(std::ceil(bandwidth * static_cast<double>(n)));
	if (rank >= n) {
		throw core::IndexOutOfRange("bandwidth rank ceil(" + std::to_string(bandwidth) + " * " + std::to_string(n) +
		                            ") = " + std::to_string(rank) + " is past the last of " + std::to_string(n) +
		                            " sorted distances");
	}
	return rank;
}

inline double NeighborhoodWeighter::BandwidthRadius(const Eigen::VectorXd &distances, size_t rank) {
	const size_t n = static_cast<size_t>(distances.size());
	if (rank >= n) {
		throw core::IndexOutOfRange("rank " + std::to_string(rank) + " is out of range for " + std::to_string(n) +
		                            " distances");
	}
	if (!distances.allFinite()) {
		throw std::invalid_argument("distances must be finite (check predictors and query point for NaN/Inf)");
	}

	std::vector<double> sorted(distances.data(), distances.data() + distances.size());
	auto nth = sorted.begin() + static_cast<std::ptrdiff_t>(rank);
	std::nth_element(sorted.begin(), nth, sorted.end());
	return *nth;
}

inline void NeighborhoodWeighter::CheckRadius(double radius, const core::LowessOptions &options) {
	if (radius != 0.0) {
		return;
	}
	if (options.strict_bandwidth) {
		throw core::DegenerateBandwidth("neighborhood radius is zero: too many observations coincide with the "
		                                "query point for bandwidth " +
		                                std::to_string(options.bandwidth));
	}
	LIBLOWESS_WARN("neighborhood radius is zero (bandwidth " << options.bandwidth
	                                                         << "); weights are kernel(0/0) and kernel(x/0)");
}

inline NeighborhoodWeights NeighborhoodWeighter::Weigh(const Eigen::VectorXd &distances,
                                                       const core::LowessOptions &options) {
	options.Validate();

	NeighborhoodWeights result;
	result.distances = distances;
	result.rank = BandwidthRank(options.bandwidth, static_cast<size_t>(distances.size()));
	result.radius = BandwidthRadius(distances, result.rank);

	LIBLOWESS_TRACE("neighborhood rank " << result.rank << " of " << distances.size() << ", radius "
	                                     << result.radius);

	CheckRadius(result.radius, options);

	result.weights = kernels::Apply(options.kernel, distances / result.radius);
	return result;
}

inline NeighborhoodWeights NeighborhoodWeighter::Weigh(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
                                                       const core::LowessOptions &options) {
	return Weigh(ComputeDistances(x_star, x), options);
}

inline NeighborhoodWeights NeighborhoodWeighter::Weigh(double x_star, const Eigen::VectorXd &x,
                                                       const core::LowessOptions &options) {
	return Weigh(ComputeDistances(x_star, x), options);
}

} // namespace weighting
} // namespace liblowess
