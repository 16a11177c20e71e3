#pragma once
#include <Eigen/Core>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace blp {

/** A single market of a product table: a contiguous block of product rows together with the
 * market's observed outside share.  Segments are created by MarketPartition and never modified.
 */
class MarketSegment final {
    public:
        /// Creates a segment covering product rows `[start, end)`.
        MarketSegment(std::string id, std::size_t start, std::size_t end, double outside_share)
            : id_{std::move(id)}, start_{start}, end_{end}, outside_share_{outside_share} {}

        /// The market identifier carried from the product data
        const std::string& id() const { return id_; }
        /// The first product row of the market
        std::size_t start() const { return start_; }
        /// One past the last product row of the market
        std::size_t end() const { return end_; }
        /// The number of products in the market
        std::size_t size() const { return end_ - start_; }
        /// The observed outside-option share, \f$1 - \sum_j s_j\f$
        double outsideShare() const { return outside_share_; }

    private:
        std::string id_;
        std::size_t start_, end_;
        double outside_share_;
};

/** Splits a flat, market-sorted product table into per-market segments.
 *
 * Markets must appear in contiguous blocks: the label sequence `A A B B` is fine, while
 * `A B A` is rejected with a non_contiguous_market exception for `A`.  Labels are not sorted, so
 * markets keep the order in which they first appear.
 */
class MarketPartition final {
    public:
        /// Default constructor: an empty partition of zero markets.
        MarketPartition() = default;

        /** Builds the partition for the given per-product market labels and observed shares.
         *
         * Share positivity is the caller's responsibility (ProductData::Builder checks it before
         * getting here); this only checks finiteness and the outside share.
         *
         * \throws dimension_mismatch if `shares` and `market_ids` differ in length
         * \throws non_contiguous_market if a market label reappears after another market's block
         * \throws numerical_error if any share is not finite
         * \throws non_positive_outside_share if the shares of a market sum to 1 or more
         */
        MarketPartition(const std::vector<std::string> &market_ids, const Eigen::Ref<const Eigen::VectorXd> &shares);

        /// The number of distinct markets
        std::size_t size() const { return markets_.size(); }

        /// The market segments, in table order
        const std::vector<MarketSegment>& markets() const { return markets_; }

        /// Accesses market `m`
        const MarketSegment& operator[](std::size_t m) const { return markets_[m]; }

        /// Returns the index of the market containing product row `product`.
        std::size_t marketOf(std::size_t product) const { return product_market_[product]; }

        /// Returns the segment containing product row `product`.
        const MarketSegment& segmentOf(std::size_t product) const { return markets_[product_market_[product]]; }

    private:
        std::vector<MarketSegment> markets_;
        std::vector<std::size_t> product_market_;
};

}
