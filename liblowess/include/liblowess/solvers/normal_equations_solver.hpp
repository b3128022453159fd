#pragma once

#include "liblowess/core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>

namespace liblowess {
namespace solvers {

/**
 * Outcome of solving the weighted normal equations
 */
enum class SolveStatus {
	/// Unique solution found
	SOLVED,
	/// A is singular or numerically rank-deficient
	SINGULAR,
	/// A or b contains NaN or Inf
	NON_FINITE
};

inline std::string SolveStatusName(SolveStatus status) {
	switch (status) {
	case SolveStatus::SOLVED:
		return "solved";
	case SolveStatus::SINGULAR:
		return "singular";
	case SolveStatus::NON_FINITE:
		return "non-finite";
	default:
		return "unknown";
	}
}

/**
 * Weighted normal equations A * beta = b
 *
 * A = X' W X  ((M+1) × (M+1), symmetric)
 * b = X' W y  (length M+1)
 * where X = [1 | x] carries a leading intercept column.
 */
struct NormalEquations {
	Eigen::MatrixXd A;
	Eigen::VectorXd b;

	Eigen::Index n_params() const {
		return b.size();
	}
};

/**
 * Result of NormalEquationsSolver::Solve
 *
 * coefficients is only populated when status == SOLVED. Callers decide what
 * a singular system means for them; the solver never substitutes a value.
 */
struct NormalEquationsSolution {
	SolveStatus status = SolveStatus::SINGULAR;

	/// [intercept, slope_1, ..., slope_M] when solved, empty otherwise
	Eigen::VectorXd coefficients;

	/// Numerical rank of the system (0 when non-finite)
	size_t rank = 0;

	bool ok() const {
		return status == SolveStatus::SOLVED;
	}
};

/**
 * Weighted Least-Squares Solver for a local linear model
 *
 * Minimizes sum_i w_i * (y_i - beta_0 - sum_j beta_j x_ij)^2.
 *
 * Fit() works on the weighted design matrix:
 * 1. Xw = sqrt(W) [1 | x], yw = sqrt(W) y
 * 2. Reject NaN/Inf entries (NON_FINITE); a negative weight has no square
 *    root and lands here too
 * 3. Column-pivoting QR of Xw; rank < M+1 is SINGULAR
 * 4. Otherwise solve the least-squares problem through the QR
 *
 * Solve() takes explicit normal equations A beta = b. The rank test runs a
 * full-pivoting LU on D A D with D = diag(A)^(-1/2), so rescaling a
 * predictor does not change the verdict.
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Singularity is a status, not an exception. Shape errors still throw.
 * - Zero weights are allowed; they simply drop the observation
 */
class NormalEquationsSolver {
public:
	/**
	 * Design matrix with leading intercept column
	 *
	 * @param x Predictors (N × M)
	 * @return [1 | x] (N × (M+1))
	 */
	static Eigen::MatrixXd DesignMatrix(const Eigen::MatrixXd &x);

	/**
	 * Build the weighted normal equations
	 *
	 * @param x Predictors (N × M), without intercept column
	 * @param y Responses (length N)
	 * @param weights Observation weights (length N)
	 * @return A and b
	 * @throws ShapeMismatch if y or weights length differs from x.rows()
	 */
	static NormalEquations BuildSystem(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	                                   const Eigen::VectorXd &weights);

	/**
	 * Solve A beta = b
	 *
	 * @param system Normal equations
	 * @param rank_tolerance Relative pivot threshold for the rank test (<= 0 = Eigen default)
	 * @return Status and, when solved, the coefficients
	 * @throws ShapeMismatch if A is not square or does not match b
	 */
	static NormalEquationsSolution Solve(const NormalEquations &system, double rank_tolerance = -1.0);

	/**
	 * Weighted least-squares fit with intercept
	 *
	 * @param x Predictors (N × M), without intercept column
	 * @param y Responses (length N)
	 * @param weights Non-negative observation weights (length N)
	 * @param rank_tolerance Relative threshold on |R_kk| / |R_00| (<= 0 = Eigen default)
	 * @return Status, numerical rank of sqrt(W) [1 | x] and, when solved, the coefficients
	 * @throws ShapeMismatch if y or weights length differs from x.rows()
	 */
	static NormalEquationsSolution Fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	                                   const Eigen::VectorXd &weights, double rank_tolerance = -1.0);

private:
	static void CheckShapes(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, const Eigen::VectorXd &weights);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::MatrixXd NormalEquationsSolver::DesignMatrix(const Eigen::MatrixXd &x) {
	Eigen::MatrixXd X(x.rows(), x.cols() + 1);
	X.col(0).setOnes();
	X.rightCols(x.cols()) = x;
	return X;
}

inline void NormalEquationsSolver::CheckShapes(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
                                               const Eigen::VectorXd &weights) {
	const Eigen::Index n = x.rows();
	if (y.size() != n) {
		throw core::ShapeMismatch("responses have length " + std::to_string(y.size()) + " but predictors have " +
		                          std::to_string(n) + " rows");
	}
	if (weights.size() != n) {
		throw core::ShapeMismatch("weights have length " + std::to_string(weights.size()) +
		                          " but predictors have " + std::to_string(n) + " rows");
	}
}

inline NormalEquations NormalEquationsSolver::BuildSystem(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
                                                          const Eigen::VectorXd &weights) {
	CheckShapes(x, y, weights);

	const Eigen::MatrixXd X = DesignMatrix(x);
	const Eigen::Index p = X.cols();

	NormalEquations system;
	system.A.resize(p, p);
	system.b.resize(p);

	const Eigen::VectorXd wy = (weights.array() * y.array()).matrix();
	for (Eigen::Index k = 0; k < p; k++) {
		system.b(k) = wy.dot(X.col(k));

		const Eigen::VectorXd wx_k = (weights.array() * X.col(k).array()).matrix();
		for (Eigen::Index l = k; l < p; l++) {
			const double a_kl = wx_k.dot(X.col(l));
			system.A(k, l) = a_kl;
			system.A(l, k) = a_kl;
		}
	}
	return system;
}

inline NormalEquationsSolution NormalEquationsSolver::Solve(const NormalEquations &system, double rank_tolerance) {
	const Eigen::Index p = system.b.size();
	if (system.A.rows() != p || system.A.cols() != p) {
		throw core::ShapeMismatch("normal equations matrix is " + std::to_string(system.A.rows()) + "x" +
		                          std::to_string(system.A.cols()) + " but right-hand side has length " +
		                          std::to_string(p));
	}

	NormalEquationsSolution solution;
	if (!system.A.allFinite() || !system.b.allFinite()) {
		solution.status = SolveStatus::NON_FINITE;
		return solution;
	}

	// Jacobi scaling; a zero (or negative) diagonal entry is left unscaled
	Eigen::VectorXd d(p);
	for (Eigen::Index k = 0; k < p; k++) {
		const double a_kk = system.A(k, k);
		d(k) = a_kk > 0.0 ? 1.0 / std::sqrt(a_kk) : 1.0;
	}
	const Eigen::MatrixXd scaled = d.asDiagonal() * system.A * d.asDiagonal();

	Eigen::FullPivLU<Eigen::MatrixXd> lu(scaled);
	if (rank_tolerance > 0.0) {
		lu.setThreshold(rank_tolerance);
	}

	solution.rank = static_cast<size_t>(lu.rank());
	if (!lu.isInvertible()) {
		solution.status = SolveStatus::SINGULAR;
		return solution;
	}

	const Eigen::VectorXd z = lu.solve((d.array() * system.b.array()).matrix());
	solution.coefficients = (d.array() * z.array()).matrix();
	solution.status = SolveStatus::SOLVED;
	return solution;
}

inline NormalEquationsSolution NormalEquationsSolver::Fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
                                                          const Eigen::VectorXd &weights, double rank_tolerance) {
	CheckShapes(x, y, weights);

	const Eigen::VectorXd sqrt_w = weights.array().sqrt().matrix();
	const Eigen::MatrixXd X_w = sqrt_w.asDiagonal() * DesignMatrix(x);
	const Eigen::VectorXd y_w = (sqrt_w.array() * y.array()).matrix();

	NormalEquationsSolution solution;
	if (!X_w.allFinite() || !y_w.allFinite()) {
		solution.status = SolveStatus::NON_FINITE;
		return solution;
	}

	// Rank is taken on the weighted design, never on X'WX
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X_w);
	if (rank_tolerance > 0.0) {
		qr.setThreshold(rank_tolerance);
	}

	solution.rank = static_cast<size_t>(qr.rank());
	if (qr.rank() < X_w.cols()) {
		solution.status = SolveStatus::SINGULAR;
		return solution;
	}

	solution.coefficients = qr.solve(y_w);
	solution.status = SolveStatus::SOLVED;
	return solution;
}

} // namespace solvers
} // namespace liblowess
