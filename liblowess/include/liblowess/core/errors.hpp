#pragma once

#include <stdexcept>
#include <string>

namespace liblowess {
namespace core {

/**
 * Error types raised by the local regression routines
 *
 * Each error derives from the closest standard exception so callers that
 * only care about the broad category can keep catching std::invalid_argument,
 * std::out_of_range or std::runtime_error.
 *
 * Design notes:
 * - The N-D fit never throws SingularSystem; it maps singular systems to a
 *   zero coefficient vector. Only the 1-D fit propagates it.
 * - NonFiniteSystem is kept separate from SingularSystem so the flat-line
 *   fallback only triggers on genuine rank loss.
 */

/// Predictor/response/weight lengths disagree, or the query point's
/// dimensionality differs from the dataset's
class ShapeMismatch : public std::invalid_argument {
public:
	explicit ShapeMismatch(const std::string &message) : std::invalid_argument(message) {}
};

/// Bandwidth rank ceil(f * n) points past the end of the sorted distances
class IndexOutOfRange : public std::out_of_range {
public:
	explicit IndexOutOfRange(const std::string &message) : std::out_of_range(message) {}
};

/// Weighted normal equations have no unique solution
class SingularSystem : public std::runtime_error {
public:
	explicit SingularSystem(const std::string &message) : std::runtime_error(message) {}
};

/// Neighborhood radius is zero (only raised when strict_bandwidth is set)
class DegenerateBandwidth : public std::domain_error {
public:
	explicit DegenerateBandwidth(const std::string &message) : std::domain_error(message) {}
};

/// Weighted normal equations contain NaN or Inf entries
class NonFiniteSystem : public std::runtime_error {
public:
	explicit NonFiniteSystem(const std::string &message) : std::runtime_error(message) {}
};

} // namespace core
} // namespace liblowess
