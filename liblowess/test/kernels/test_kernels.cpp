#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <liblowess/kernels/kernels.hpp>
#include <cmath>
#include <limits>

using namespace liblowess::kernels;

const double TOLERANCE = 1e-12;

TEST_CASE("Kernels: Tricube Values", "[kernels][tricube]") {
	REQUIRE(Tricube(0.0) == 1.0);
	REQUIRE(Tricube(0.5) == 0.669921875);
	REQUIRE(Tricube(-0.5) == 0.669921875);
	REQUIRE_THAT(Tricube(0.25), Catch::Matchers::WithinAbs(std::pow(1.0 - 0.015625, 3.0), TOLERANCE));
}

TEST_CASE("Kernels: Compact Support Is Exactly Zero", "[kernels][support]") {
	const WeightFunction compact[] = {Tricube, Epanechnikov, Biweight, Triweight, Triangular, Uniform};

	for (const auto &kernel : compact) {
		REQUIRE(kernel(1.0) == 0.0);
		REQUIRE(kernel(-1.0) == 0.0);
		REQUIRE(kernel(1.0000001) == 0.0);
		REQUIRE(kernel(25.0) == 0.0);
		REQUIRE(kernel(0.0) == 1.0);
	}
}

TEST_CASE("Kernels: Closed Forms Inside The Support", "[kernels]") {
	const double u = 0.4;

	REQUIRE_THAT(Epanechnikov(u), Catch::Matchers::WithinAbs(1.0 - u * u, TOLERANCE));
	REQUIRE_THAT(Biweight(u), Catch::Matchers::WithinAbs(std::pow(1.0 - u * u, 2.0), TOLERANCE));
	REQUIRE_THAT(Triweight(u), Catch::Matchers::WithinAbs(std::pow(1.0 - u * u, 3.0), TOLERANCE));
	REQUIRE_THAT(Triangular(u), Catch::Matchers::WithinAbs(1.0 - u, TOLERANCE));
	REQUIRE(Uniform(u) == 1.0);
	REQUIRE_THAT(Gaussian(u), Catch::Matchers::WithinAbs(std::exp(-0.5 * u * u), TOLERANCE));
}

TEST_CASE("Kernels: Gaussian Has Unbounded Support", "[kernels][gaussian]") {
	REQUIRE(Gaussian(0.0) == 1.0);
	REQUIRE(Gaussian(1.0) > 0.0);
	REQUIRE(Gaussian(3.0) > 0.0);
	REQUIRE(Gaussian(3.0) < Gaussian(1.0));
}

TEST_CASE("Kernels: Non-finite Arguments Weigh Zero", "[kernels][degenerate]") {
	// 0/0 and x/0 from a zero neighborhood radius
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const double inf = std::numeric_limits<double>::infinity();

	const WeightFunction all[] = {Tricube, Epanechnikov, Biweight, Triweight, Triangular, Uniform, Gaussian};
	for (const auto &kernel : all) {
		REQUIRE(kernel(nan) == 0.0);
		REQUIRE(kernel(inf) == 0.0);
		REQUIRE(kernel(-inf) == 0.0);
	}
}

TEST_CASE("Kernels: Apply Is Elementwise", "[kernels][apply]") {
	Eigen::VectorXd u(4);
	u << 0.0, 0.5, 1.0, 2.0;

	Eigen::VectorXd w = Apply(Tricube, u);

	REQUIRE(w.size() == 4);
	REQUIRE(w(0) == 1.0);
	REQUIRE(w(1) == 0.669921875);
	REQUIRE(w(2) == 0.0);
	REQUIRE(w(3) == 0.0);
}

TEST_CASE("Kernels: Lookup By Name", "[kernels][lookup]") {
	SECTION("Every listed name resolves") {
		for (const auto &name : AvailableKernels()) {
			WeightFunction kernel = FromName(name);
			REQUIRE(static_cast<bool>(kernel));
			REQUIRE(kernel(0.0) == 1.0);
		}
	}

	SECTION("Case-insensitive") {
		REQUIRE(FromName("TriCube")(0.5) == Tricube(0.5));
		REQUIRE(FromName("GAUSSIAN")(1.0) == Gaussian(1.0));
	}

	SECTION("Bisquare alias") {
		REQUIRE(FromName("bisquare")(0.3) == Biweight(0.3));
	}

	SECTION("Unknown name") {
		REQUIRE_THROWS_AS(FromName("cosine"), std::invalid_argument);
		REQUIRE_THROWS_AS(FromName(""), std::invalid_argument);
	}
}
