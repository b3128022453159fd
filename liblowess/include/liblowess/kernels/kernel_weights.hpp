#pragma once

#include "liblowess/core/errors.hpp"
#include "liblowess/core/lowess_options.hpp"
#include "liblowess/kernels/kernels.hpp"
#include "liblowess/utils/tracing.hpp"
#include "liblowess/weighting/neighborhood_weighter.hpp"
#include <Eigen/Dense>
#include <string>

namespace liblowess {
namespace kernels {

/**
 * Kernel-weight helper: alternative weighting strategies for N-D data
 *
 * Radial: one isotropic kernel over the Euclidean distance, with the radius
 * set to a fixed fraction of the dataset radius seen from the query point:
 *   h = bandwidth * max_i ||x_i - x_star||
 *
 * NonRadial: a product of 1-D kernels, one per axis, each axis sized with
 * the nearest-neighbour rank rule of the Neighborhood Weighter:
 *   h_j = sorted(|x_ij - x_star_j|)[ceil(bandwidth * n)]
 *   w_i = prod_j kernel(|x_ij - x_star_j| / h_j)
 *
 * Both apply the same zero-radius policy as the Neighborhood Weighter.
 */
class KernelWeights {
public:
	/**
	 * Isotropic weights scaled by the dataset radius
	 *
	 * @param x_star Query point (length M)
	 * @param x Predictors (N × M)
	 * @param options Kernel, bandwidth, zero-radius policy
	 * @return Weights (length N)
	 */
	static Eigen::VectorXd Radial(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
	                              const core::LowessOptions &options);

	/**
	 * Per-axis product kernel weights
	 *
	 * @throws IndexOutOfRange under the same rank rule as the Neighborhood Weighter
	 */
	static Eigen::VectorXd NonRadial(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
	                                 const core::LowessOptions &options);

	/// Radial() when options.radial is set, NonRadial() otherwise
	static Eigen::VectorXd Compute(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
	                               const core::LowessOptions &options);
};

inline Eigen::VectorXd KernelWeights::Radial(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
                                             const core::LowessOptions &options) {
	options.Validate();

	Eigen::VectorXd distances = weighting::NeighborhoodWeighter::ComputeDistances(x_star, x);
	if (distances.size() == 0) {
		throw core::ShapeMismatch("dataset must contain at least one observation");
	}
	if (!distances.allFinite()) {
		throw std::invalid_argument("distances must be finite (check predictors and query point for NaN/Inf)");
	}

	const double radius = options.bandwidth * distances.maxCoeff();
	LIBLOWESS_TRACE("radial kernel radius " << radius);
	weighting::NeighborhoodWeighter::CheckRadius(radius, options);

	return Apply(options.kernel, distances / radius);
}

inline Eigen::VectorXd KernelWeights::NonRadial(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
                                                const core::LowessOptions &options) {
	options.Validate();

	if (x.cols() != x_star.size()) {
		throw core::ShapeMismatch("query point has " + std::to_string(x_star.size()) +
		                          " dimensions but predictors have " + std::to_string(x.cols()));
	}

	const size_t n = static_cast<size_t>(x.rows());
	const size_t rank = weighting::NeighborhoodWeighter::BandwidthRank(options.bandwidth, n);

	Eigen::VectorXd weights = Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n));
	for (Eigen::Index j = 0; j < x.cols(); j++) {
		Eigen::VectorXd axis_distances = (x.col(j).array() - x_star(j)).abs().matrix();
		const double radius = weighting::NeighborhoodWeighter::BandwidthRadius(axis_distances, rank);
		LIBLOWESS_TRACE("axis " << j << " radius " << radius);
		weighting::NeighborhoodWeighter::CheckRadius(radius, options);

		weights.array() *= Apply(options.kernel, axis_distances / radius).array();
	}
	return weights;
}

inline Eigen::VectorXd KernelWeights::Compute(const Eigen::VectorXd &x_star, const Eigen::MatrixXd &x,
                                              const core::LowessOptions &options) {
	if (options.radial) {
		return Radial(x_star, x, options);
	}
	return NonRadial(x_star, x, options);
}

} // namespace kernels
} // namespace liblowess
