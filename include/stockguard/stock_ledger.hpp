#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "database.hpp"

namespace stockguard {

struct StockLevel {
    int64_t physical = 0;
    int64_t reserved = 0;

    int64_t available() const { return physical - reserved; }
};

/**
 * Available-to-sell = physical stock - quantity held by active reservations.
 *
 * Never stored; always derived. A reservation attempt must compute it with
 * level_in() on its own write transaction so the figure cannot go stale
 * between the check and the insert.
 */
class StockLedger {
public:
    explicit StockLedger(std::shared_ptr<Database> db);

    /**
     * @throws NotFoundError if the product or variant does not exist
     */
    int64_t available_stock(const std::string& product_id,
                            const std::optional<std::string>& variant_id = std::nullopt);

    StockLevel level(const std::string& product_id,
                     const std::optional<std::string>& variant_id = std::nullopt);

    static StockLevel level_in(Transaction& txn, const std::string& product_id,
                               const std::optional<std::string>& variant_id);

private:
    std::shared_ptr<Database> db_;
};

}  // namespace stockguard
