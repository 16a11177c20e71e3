#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

/** \file blp/error.hpp exception types
 *
 * Every failure raised by the library derives from blp::error, so callers that don't care about
 * the specific kind can catch just that.  Each subclass carries the data describing the violated
 * condition, accessible through its accessors.
 */

namespace blp {

/// Base class of all exceptions thrown by the blp library.
class error : public std::runtime_error {
    public:
        /// Constructs an error with the given message.
        explicit error(const std::string &what);
};

/** Exception class thrown when arrays or matrices passed to a blp operation have incompatible
 * dimensions.
 */
class dimension_mismatch : public error {
    public:
        /** Constructor.
         * \param context short description of the checked quantity (e.g. "delta length")
         * \param expected the dimension the model requires
         * \param found the dimension actually supplied
         */
        dimension_mismatch(std::string context, std::size_t expected, std::size_t found);
        /// The checked quantity
        const std::string& context() const { return context_; }
        /// The required dimension
        std::size_t expected() const { return expected_; }
        /// The supplied dimension
        std::size_t found() const { return found_; }
    private:
        std::string context_;
        std::size_t expected_, found_;
};

/** Thrown when the products of a market are not stored in a single contiguous block, i.e. when a
 * market label reappears after a different market has started.
 */
class non_contiguous_market : public error {
    public:
        /// Constructs the exception for the split market `market_id`
        explicit non_contiguous_market(std::string market_id);
        /// The label of the market that appears in more than one block
        const std::string& marketId() const { return market_id_; }
    private:
        std::string market_id_;
};

/// Thrown when an observed product share is missing (NaN) or not strictly positive.
class non_positive_share : public error {
    public:
        /// Constructor: `index` is the offending product row, `share` its value.
        non_positive_share(std::size_t index, double share);
        /// The product row of the offending share
        std::size_t index() const { return index_; }
        /// The offending share value
        double share() const { return share_; }
    private:
        std::size_t index_;
        double share_;
};

/// Thrown when the observed inside shares of a market sum to 1 or more.
class non_positive_outside_share : public error {
    public:
        /// Constructor: `share` is the (non-positive) outside share of market `market_id`.
        non_positive_outside_share(std::string market_id, double share);
        /// The market with a non-positive outside share
        const std::string& marketId() const { return market_id_; }
        /// The calculated outside share, `1 - sum(shares)`
        double share() const { return share_; }
    private:
        std::string market_id_;
        double share_;
};

/** Thrown when integration weights are not strictly positive or do not sum to one.  The slack is
 * either the absolute deviation of the weight sum from 1, or the offending non-positive weight.
 */
class invalid_weights : public error {
    public:
        /// Constructor
        explicit invalid_weights(double slack);
        /// The weight slack
        double slack() const { return slack_; }
    private:
        double slack_;
};

/** Thrown when a Cholesky decomposition fails because the matrix is not positive definite.  The
 * context names the matrix, e.g. "X'ZWZX" or "Z'Z inversion".
 */
class singular_matrix : public error {
    public:
        /// Constructor
        explicit singular_matrix(std::string context);
        /// The name of the matrix that could not be decomposed
        const std::string& context() const { return context_; }
    private:
        std::string context_;
};

/** Thrown when the BLP contraction exhausts its iteration budget without reaching the requested
 * tolerance.
 */
class contraction_failure : public error {
    public:
        /// Constructor
        contraction_failure(std::size_t iterations, double max_gap);
        /// The number of iterations performed
        std::size_t iterations() const { return iterations_; }
        /// The largest absolute delta update of the final iteration (infinity if none was run)
        double maxGap() const { return max_gap_; }
    private:
        std::size_t iterations_;
        double max_gap_;
};

/** Thrown when a numerical routine produces a value that can't be used: an overflowing utility, a
 * predicted share below the minimum share floor, or a non-finite input share.
 */
class numerical_error : public error {
    public:
        /// Constructor
        explicit numerical_error(std::string context);
        /// The calculation during which the problem occured
        const std::string& context() const { return context_; }
    private:
        std::string context_;
};

/// Thrown by Problem::Builder::build() when a required component was never provided.
class missing_component : public error {
    public:
        /// Constructor
        explicit missing_component(std::string component);
        /// The name of the missing component
        const std::string& component() const { return component_; }
    private:
        std::string component_;
};

}
