#include <blp/MarketPartition.hpp>
#include <blp/error.hpp>
#include <cmath>
#include <unordered_set>

namespace blp {

MarketPartition::MarketPartition(const std::vector<std::string> &market_ids, const Eigen::Ref<const Eigen::VectorXd> &shares) {
    const std::size_t n = market_ids.size();
    if ((std::size_t) shares.size() != n)
        throw dimension_mismatch("shares length", n, shares.size());

    product_market_.resize(n);
    std::unordered_set<std::string> seen;

    std::size_t start = 0;
    while (start < n) {
        const std::string &id = market_ids[start];
        if (not seen.insert(id).second)
            throw non_contiguous_market(id);

        std::size_t end = start + 1;
        while (end < n and market_ids[end] == id) end++;

        double total = 0.0;
        for (std::size_t j = start; j < end; j++) {
            if (not std::isfinite(shares[j])) throw numerical_error("share validation");
            product_market_[j] = markets_.size();
            total += shares[j];
        }

        const double outside = 1.0 - total;
        if (outside <= 0.0)
            throw non_positive_outside_share(id, outside);

        markets_.emplace_back(id, start, end, outside);
        start = end;
    }
}

}
