#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <liblowess/kernels/kernel_weights.hpp>
#include <Eigen/Dense>
#include <cmath>

using namespace liblowess;
using namespace liblowess::core;
using namespace liblowess::kernels;

namespace {

// 3x3 lattice {0,1,2}^2, row-major over (i, j)
Eigen::MatrixXd Lattice3x3() {
	Eigen::MatrixXd x(9, 2);
	Eigen::Index row = 0;
	for (int i = 0; i < 3; i++) {
		for (int j = 0; j < 3; j++) {
			x(row, 0) = i;
			x(row, 1) = j;
			row++;
		}
	}
	return x;
}

} // namespace

TEST_CASE("KernelWeights: Radial Scales By Dataset Radius", "[kernel_weights][radial]") {
	Eigen::MatrixXd x(3, 1);
	x << 0.0, 1.0, 4.0;
	Eigen::VectorXd x_star(1);
	x_star << 0.0;

	// max distance 4, bandwidth 0.5 -> h = 2
	auto w = KernelWeights::Radial(x_star, x, LowessOptions::Radial(0.5));

	REQUIRE(w.size() == 3);
	REQUIRE(w(0) == 1.0);
	REQUIRE(w(1) == 0.669921875);
	REQUIRE(w(2) == 0.0);
}

TEST_CASE("KernelWeights: Radial Accepts Full Bandwidth", "[kernel_weights][radial]") {
	// No rank rule in radial mode, so bandwidth = 1 is allowed
	Eigen::MatrixXd x(3, 1);
	x << 0.0, 1.0, 2.0;
	Eigen::VectorXd x_star(1);
	x_star << 0.0;

	auto w = KernelWeights::Radial(x_star, x, LowessOptions::Radial(1.0));

	REQUIRE(w(0) == 1.0);
	REQUIRE(w(1) == 0.669921875);
	REQUIRE(w(2) == 0.0);
}

TEST_CASE("KernelWeights: Radial Is Isotropic", "[kernel_weights][radial]") {
	Eigen::MatrixXd x(4, 2);
	x << 1, 0, 0, 1, -1, 0, 0, -1;
	Eigen::VectorXd x_star = Eigen::VectorXd::Zero(2);

	auto opts = LowessOptions::Radial(1.0);
	opts.kernel = Gaussian;
	auto w = KernelWeights::Radial(x_star, x, opts);

	for (Eigen::Index i = 1; i < 4; i++) {
		REQUIRE_THAT(w(i), Catch::Matchers::WithinAbs(w(0), 1e-15));
	}
	REQUIRE_THAT(w(0), Catch::Matchers::WithinAbs(std::exp(-0.5), 1e-15));
}

TEST_CASE("KernelWeights: Radial Zero Radius Policy", "[kernel_weights][degenerate]") {
	Eigen::MatrixXd x = Eigen::MatrixXd::Ones(3, 2);
	Eigen::VectorXd x_star = Eigen::VectorXd::Ones(2);

	auto opts = LowessOptions::Radial(0.5);

	SECTION("Lenient: kernel weighs 0/0") {
		auto w = KernelWeights::Radial(x_star, x, opts);
		REQUIRE(w.size() == 3);
		REQUIRE(w.isZero());
	}

	SECTION("Strict: throws") {
		opts.strict_bandwidth = true;
		REQUIRE_THROWS_AS(KernelWeights::Radial(x_star, x, opts), DegenerateBandwidth);
	}
}

TEST_CASE("KernelWeights: NonRadial Per-Axis Product", "[kernel_weights][non_radial]") {
	Eigen::MatrixXd x = Lattice3x3();
	Eigen::VectorXd x_star(2);
	x_star << 1.0, 1.0;

	// n = 9, rank ceil(0.5 * 9) = 5; per-axis distances sort to
	// [0,0,0,1,1,1,1,1,1] so h_j = 1 and only the centre survives
	auto w = KernelWeights::NonRadial(x_star, x, LowessOptions::WithBandwidth(0.5));

	REQUIRE(w.size() == 9);
	for (Eigen::Index i = 0; i < 9; i++) {
		if (i == 4) {
			REQUIRE(w(i) == 1.0);
		} else {
			REQUIRE(w(i) == 0.0);
		}
	}
}

TEST_CASE("KernelWeights: NonRadial Multiplies Axis Kernels", "[kernel_weights][non_radial]") {
	Eigen::MatrixXd x(4, 2);
	x << 0, 0, 1, 2, 2, 4, 4, 8;
	Eigen::VectorXd x_star = Eigen::VectorXd::Zero(2);

	// rank ceil(0.5 * 4) = 2: h_0 = 2, h_1 = 4
	auto w = KernelWeights::NonRadial(x_star, x, LowessOptions::WithBandwidth(0.5));

	REQUIRE(w(0) == 1.0);
	REQUIRE_THAT(w(1), Catch::Matchers::WithinAbs(Tricube(0.5) * Tricube(0.5), 1e-15));
	REQUIRE(w(2) == 0.0);
	REQUIRE(w(3) == 0.0);
}

TEST_CASE("KernelWeights: NonRadial Uses The Rank Rule", "[kernel_weights][non_radial]") {
	Eigen::MatrixXd x(3, 2);
	x << 0, 0, 1, 1, 2, 2;
	Eigen::VectorXd x_star = Eigen::VectorXd::Zero(2);

	REQUIRE_THROWS_AS(KernelWeights::NonRadial(x_star, x, LowessOptions::WithBandwidth(1.0)), IndexOutOfRange);
}

TEST_CASE("KernelWeights: Compute Dispatches On Radial Flag", "[kernel_weights]") {
	Eigen::MatrixXd x(4, 2);
	x << 0, 0, 1, 2, 2, 4, 4, 8;
	Eigen::VectorXd x_star = Eigen::VectorXd::Zero(2);

	auto radial_opts = LowessOptions::Radial(0.5);
	auto non_radial_opts = LowessOptions::WithBandwidth(0.5);

	REQUIRE(KernelWeights::Compute(x_star, x, radial_opts).isApprox(KernelWeights::Radial(x_star, x, radial_opts)));
	REQUIRE(KernelWeights::Compute(x_star, x, non_radial_opts) ==
	        KernelWeights::NonRadial(x_star, x, non_radial_opts));
}

TEST_CASE("KernelWeights: Dimensionality Mismatch", "[kernel_weights][validation]") {
	Eigen::MatrixXd x = Lattice3x3();
	Eigen::VectorXd x_star = Eigen::VectorXd::Zero(3);

	REQUIRE_THROWS_AS(KernelWeights::Radial(x_star, x, LowessOptions::Radial(0.5)), ShapeMismatch);
	REQUIRE_THROWS_AS(KernelWeights::NonRadial(x_star, x, LowessOptions::WithBandwidth(0.5)), ShapeMismatch);
}
