#include "stockguard/stock_ledger.hpp"
#include "stockguard/catalog.hpp"

namespace stockguard {

StockLedger::StockLedger(std::shared_ptr<Database> db) : db_(std::move(db)) {}

int64_t StockLedger::available_stock(const std::string& product_id,
                                     const std::optional<std::string>& variant_id) {
    return level(product_id, variant_id).available();
}

StockLevel StockLedger::level(const std::string& product_id,
                              const std::optional<std::string>& variant_id) {
    auto txn = db_->begin(Transaction::Mode::Deferred);
    auto result = level_in(*txn, product_id, variant_id);
    txn->commit();
    return result;
}

StockLevel StockLedger::level_in(Transaction& txn, const std::string& product_id,
                                 const std::optional<std::string>& variant_id) {
    StockLevel result;
    result.physical = Catalog::physical_stock_in(txn, product_id, variant_id);

    auto stmt = txn.prepare(
        "SELECT COALESCE(SUM(quantity), 0) FROM reservations "
        "WHERE product_id = ? AND variant_id IS ? AND status = 'active'");
    stmt.bind(1, product_id).bind_optional(2, variant_id);
    if (stmt.step()) result.reserved = stmt.column_int(0);
    return result;
}

}  // namespace stockguard
