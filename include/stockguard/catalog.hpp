#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "database.hpp"

namespace stockguard {

/**
 * Owner of physical stock for products and their variants.
 *
 * Physical stock changes only through commit, manual restock and the
 * restoration that follows cancelling a paid, unfulfilled order.
 */
class Catalog {
public:
    explicit Catalog(std::shared_ptr<Database> db);

    /**
     * Create a product, or reset the stock of an existing one.
     */
    void register_product(const std::string& product_id, int64_t physical_stock);

    /**
     * Create a variant of an existing product, or reset its stock.
     * @throws NotFoundError if the product does not exist
     */
    void register_variant(const std::string& product_id, const std::string& variant_id,
                          int64_t physical_stock);

    /**
     * Add received units to physical stock.
     * @return the new physical stock
     */
    int64_t restock(const std::string& product_id, const std::optional<std::string>& variant_id,
                    int64_t quantity);

    int64_t physical_stock(const std::string& product_id,
                           const std::optional<std::string>& variant_id = std::nullopt);

    static int64_t physical_stock_in(Transaction& txn, const std::string& product_id,
                                     const std::optional<std::string>& variant_id);

    /**
     * Add `delta` (may be negative) to physical stock unless the result would
     * drop below zero.
     * @return false if the row is missing or the stock would go negative
     */
    static bool adjust_in(Transaction& txn, const std::string& product_id,
                          const std::optional<std::string>& variant_id, int64_t delta);

private:
    std::shared_ptr<Database> db_;
};

}  // namespace stockguard
