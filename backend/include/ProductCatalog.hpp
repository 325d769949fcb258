#pragma once
// ProductCatalog.hpp
// In-memory product store backed by a JSON file keyed by product id.
// Reads are shared, counter increments take the write lock.

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Repositories.hpp"

class ProductCatalog : public ProductRepository {
public:
    ProductCatalog();

    // Load products from JSON file: {product_id: {name, price, ...}}
    bool load(const std::string& catalog_path);

    // Save to JSON file (temp file + atomic rename)
    bool save(const std::string& catalog_path) const;

    // Insert or replace a product
    void add_product(const Product& product);

    std::vector<Product> active_products() const override;
    bool get(const std::string& product_id, Product& out) const override;
    bool increment_counter(const std::string& product_id, InteractionKind kind) override;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Product> products_;
};
