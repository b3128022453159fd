#pragma once

#include "liblowess/kernels/kernels.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace liblowess {
namespace core {

/**
 * Configuration options for a local regression fit
 *
 * Passed explicitly on every call; there is no process-wide default kernel
 * or bandwidth. All options have the conventional LOWESS defaults.
 */
struct LowessOptions {
	/// Weight function of normalized distance
	/// Default: tricube
	kernels::WeightFunction kernel = kernels::Tricube;

	/// Fraction of the dataset used to size the neighborhood, in (0, 1]
	/// The radius is the distance at sorted index ceil(bandwidth * n), so
	/// bandwidth * n must stay below n (bandwidth = 1 is always out of range)
	/// Default: 2/3
	double bandwidth = 2.0 / 3.0;

	/// N-D only: weight with the radial kernel-weight helper instead of the
	/// nearest-neighbour radius
	/// Default: false
	bool radial = false;

	/// Throw DegenerateBandwidth when the neighborhood radius is zero instead
	/// of letting the kernel weigh the resulting 0/0 and x/0 arguments
	/// Default: false
	bool strict_bandwidth = false;

	/// Relative pivot threshold for the singularity test of the local system
	/// (-1 = auto, use Eigen default)
	/// Default: -1.0 (auto)
	double rank_tolerance = -1.0;

	LowessOptions() = default;

	static LowessOptions Defaults() {
		return LowessOptions();
	}

	static LowessOptions WithBandwidth(double bandwidth_) {
		LowessOptions opts;
		opts.bandwidth = bandwidth_;
		return opts;
	}

	static LowessOptions WithKernel(kernels::WeightFunction kernel_, double bandwidth_ = 2.0 / 3.0) {
		LowessOptions opts;
		opts.kernel = std::move(kernel_);
		opts.bandwidth = bandwidth_;
		return opts;
	}

	static LowessOptions WithKernel(const std::string &kernel_name, double bandwidth_ = 2.0 / 3.0) {
		return WithKernel(kernels::FromName(kernel_name), bandwidth_);
	}

	static LowessOptions Radial(double bandwidth_ = 2.0 / 3.0) {
		LowessOptions opts;
		opts.bandwidth = bandwidth_;
		opts.radial = true;
		return opts;
	}

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		// Written so NaN fails too
		if (!(bandwidth > 0.0 && bandwidth <= 1.0)) {
			throw std::invalid_argument("bandwidth must be in (0, 1] (got " + std::to_string(bandwidth) + ")");
		}

		if (rank_tolerance > 1.0) {
			throw std::invalid_argument("rank_tolerance must be <= 1 (got " + std::to_string(rank_tolerance) + ")");
		}

		if (!kernel) {
			throw std::invalid_argument("kernel must be set");
		}
	}
};

} // namespace core
} // namespace liblowess
