#include "stockguard/catalog.hpp"
#include "stockguard/errors.hpp"
#include "stockguard/logging.hpp"
#include "stockguard/validation.hpp"

namespace stockguard {

Catalog::Catalog(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void Catalog::register_product(const std::string& product_id, int64_t physical_stock) {
    validation::require_not_empty(product_id, "product_id");
    validation::require_non_negative(physical_stock, "physical_stock");

    auto txn = db_->begin();
    txn->prepare("INSERT INTO products (id, stock) VALUES (?, ?) "
                 "ON CONFLICT(id) DO UPDATE SET stock = excluded.stock")
        .bind(1, product_id)
        .bind(2, physical_stock)
        .run();
    txn->commit();

    log_info("catalog", "product_registered",
             {{"product_id", product_id}, {"physical_stock", physical_stock}});
}

void Catalog::register_variant(const std::string& product_id, const std::string& variant_id,
                               int64_t physical_stock) {
    validation::require_not_empty(product_id, "product_id");
    validation::require_not_empty(variant_id, "variant_id");
    validation::require_non_negative(physical_stock, "physical_stock");

    auto txn = db_->begin();
    auto product = txn->prepare("SELECT 1 FROM products WHERE id = ?");
    product.bind(1, product_id);
    if (!product.step()) throw NotFoundError("Product not found: " + product_id);

    auto upsert = txn->prepare(
        "INSERT INTO variants (id, product_id, stock) VALUES (?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET stock = excluded.stock "
        "WHERE variants.product_id = excluded.product_id");
    upsert.bind(1, variant_id).bind(2, product_id).bind(3, physical_stock).run();
    if (txn->changes() == 0) {
        throw InvalidArgumentError("Variant " + variant_id + " belongs to another product");
    }
    txn->commit();

    log_info("catalog", "variant_registered",
             {{"product_id", product_id}, {"variant_id", variant_id},
              {"physical_stock", physical_stock}});
}

int64_t Catalog::restock(const std::string& product_id,
                         const std::optional<std::string>& variant_id, int64_t quantity) {
    validation::require_positive(quantity, "quantity");

    auto txn = db_->begin();
    if (!adjust_in(*txn, product_id, variant_id, quantity)) {
        throw NotFoundError("Product not found: " + product_id);
    }
    int64_t stock = physical_stock_in(*txn, product_id, variant_id);
    txn->commit();

    log_info("catalog", "restocked",
             {{"product_id", product_id}, {"variant_id", variant_id.value_or("")},
              {"quantity", quantity}, {"physical_stock", stock}});
    return stock;
}

int64_t Catalog::physical_stock(const std::string& product_id,
                                const std::optional<std::string>& variant_id) {
    auto txn = db_->begin(Transaction::Mode::Deferred);
    int64_t stock = physical_stock_in(*txn, product_id, variant_id);
    txn->commit();
    return stock;
}

int64_t Catalog::physical_stock_in(Transaction& txn, const std::string& product_id,
                                   const std::optional<std::string>& variant_id) {
    if (variant_id) {
        auto stmt = txn.prepare("SELECT stock FROM variants WHERE id = ? AND product_id = ?");
        stmt.bind(1, *variant_id).bind(2, product_id);
        if (!stmt.step()) {
            throw NotFoundError("Variant not found: " + product_id + "/" + *variant_id);
        }
        return stmt.column_int(0);
    }

    auto stmt = txn.prepare("SELECT stock FROM products WHERE id = ?");
    stmt.bind(1, product_id);
    if (!stmt.step()) throw NotFoundError("Product not found: " + product_id);
    return stmt.column_int(0);
}

bool Catalog::adjust_in(Transaction& txn, const std::string& product_id,
                        const std::optional<std::string>& variant_id, int64_t delta) {
    if (variant_id) {
        txn.prepare("UPDATE variants SET stock = stock + ? "
                    "WHERE id = ? AND product_id = ? AND stock + ? >= 0")
            .bind(1, delta)
            .bind(2, *variant_id)
            .bind(3, product_id)
            .bind(4, delta)
            .run();
    } else {
        txn.prepare("UPDATE products SET stock = stock + ? WHERE id = ? AND stock + ? >= 0")
            .bind(1, delta)
            .bind(2, product_id)
            .bind(3, delta)
            .run();
    }
    return txn.changes() == 1;
}

}  // namespace stockguard
