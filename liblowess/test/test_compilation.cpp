#include <catch2/catch_test_macros.hpp>

// All library headers compile together
#include "liblowess/core/errors.hpp"
#include "liblowess/core/local_fit_result.hpp"
#include "liblowess/core/lowess_options.hpp"
#include "liblowess/kernels/kernels.hpp"
#include "liblowess/kernels/kernel_weights.hpp"
#include "liblowess/weighting/neighborhood_weighter.hpp"
#include "liblowess/solvers/normal_equations_solver.hpp"
#include "liblowess/utils/tracing.hpp"
#include "liblowess/lowess.hpp"

#include <cmath>

using namespace liblowess;

TEST_CASE("Library headers compile together", "[compilation]") {
	SECTION("Can create core structures") {
		core::LowessOptions options;
		core::LocalLinearFit fit;
		core::LocalFitNd fit_nd;

		REQUIRE(options.bandwidth == 2.0 / 3.0);
		REQUIRE(!options.radial);
		REQUIRE(fit.weights.size() == 0);
		REQUIRE(!fit_nd.is_fallback);
	}

	SECTION("Can use kernel functions") {
		REQUIRE(kernels::Tricube(0.0) == 1.0);
		REQUIRE(std::isfinite(kernels::Gaussian(0.5)));
		REQUIRE(!kernels::AvailableKernels().empty());
	}

	SECTION("Can name solver status") {
		REQUIRE(solvers::SolveStatusName(solvers::SolveStatus::SOLVED) == "solved");
	}
}
