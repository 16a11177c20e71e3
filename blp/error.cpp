#include <blp/error.hpp>
#include <sstream>
#include <string>
#include <utility>

namespace blp {

namespace {
// Formats a double the way the error messages want it (i.e. not std::to_string's fixed 6 digits)
std::string num(double d) {
    std::ostringstream s;
    s << d;
    return s.str();
}
}

error::error(const std::string &what) : std::runtime_error(what) {}

dimension_mismatch::dimension_mismatch(std::string context, std::size_t expected, std::size_t found)
    : error("dimension mismatch in " + context + ": expected " + std::to_string(expected) + " but found " + std::to_string(found)),
    context_{std::move(context)}, expected_{expected}, found_{found}
{}

non_contiguous_market::non_contiguous_market(std::string market_id)
    : error("market identifiers must appear in contiguous blocks; market `" + market_id + "' is split"),
    market_id_{std::move(market_id)}
{}

non_positive_share::non_positive_share(std::size_t index, double share)
    : error("product share at index " + std::to_string(index) + " must be positive, found " + num(share)),
    index_{index}, share_{share}
{}

non_positive_outside_share::non_positive_outside_share(std::string market_id, double share)
    : error("outside share for market `" + market_id + "' must be positive, found " + num(share)),
    market_id_{std::move(market_id)}, share_{share}
{}

invalid_weights::invalid_weights(double slack)
    : error("weights must be strictly positive and sum to one (slack " + num(slack) + ")"),
    slack_{slack}
{}

singular_matrix::singular_matrix(std::string context)
    : error("matrix in " + context + " is singular"),
    context_{std::move(context)}
{}

contraction_failure::contraction_failure(std::size_t iterations, double max_gap)
    : error("BLP contraction did not converge after " + std::to_string(iterations) + " iterations; last max gap " + num(max_gap)),
    iterations_{iterations}, max_gap_{max_gap}
{}

numerical_error::numerical_error(std::string context)
    : error("encountered a non-finite or underflowing value during " + context),
    context_{std::move(context)}
{}

missing_component::missing_component(std::string component)
    : error(component + " must be provided before solving the problem"),
    component_{std::move(component)}
{}

}
