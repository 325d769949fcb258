#include "ProductCatalog.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <mutex>
#include "JsonFile.hpp"

ProductCatalog::ProductCatalog() {}

bool ProductCatalog::load(const std::string& catalog_path) {
    std::ifstream in(catalog_path);
    if (!in.is_open()) {
        std::cerr << "[Catalog] Warning: Could not open catalog file: " << catalog_path << std::endl;
        return false;
    }

    try {
        json j;
        in >> j;

        std::unordered_map<std::string, Product> loaded;
        loaded.reserve(j.size());

        // Expected format: {product_id: {name, description, price, category, ...}}
        for (auto& [key, value] : j.items()) {
            loaded[key] = product_from_json(key, value);
        }

        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            products_ = std::move(loaded);
        }

        std::cout << "[Catalog] Loaded " << size() << " products" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Catalog] Error parsing catalog file: " << e.what() << std::endl;
        return false;
    }
}

bool ProductCatalog::save(const std::string& catalog_path) const {
    try {
        json j = json::object();
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            for (const auto& [id, product] : products_) {
                j[id] = product_to_json(product);
            }
        }

        return write_json_atomically(catalog_path, j, 2, "Catalog");

    } catch (const std::exception& e) {
        std::cerr << "[Catalog] Error saving catalog: " << e.what() << std::endl;
        return false;
    }
}

void ProductCatalog::add_product(const Product& product) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    products_[product.id] = product;
}

std::vector<Product> ProductCatalog::active_products() const {
    std::vector<Product> active;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        active.reserve(products_.size());
        for (const auto& [id, product] : products_) {
            if (product.is_active()) {
                active.push_back(product);
            }
        }
    }

    // Hash order is not stable across runs
    std::sort(active.begin(), active.end(), [](const Product& a, const Product& b) {
        return a.id < b.id;
    });
    return active;
}

bool ProductCatalog::get(const std::string& product_id, Product& out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = products_.find(product_id);
    if (it == products_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool ProductCatalog::increment_counter(const std::string& product_id, InteractionKind kind) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = products_.find(product_id);
    if (it == products_.end()) {
        return false;
    }

    ProductAnalytics& analytics = it->second.analytics;
    switch (kind) {
        case InteractionKind::View:
            analytics.views += 1;
            break;
        case InteractionKind::Purchase:
            analytics.purchases += 1;
            analytics.conversion_rate = analytics.views > 0
                ? (static_cast<double>(analytics.purchases) / analytics.views) * 100.0
                : 0.0;
            break;
        case InteractionKind::AddToCart:
            analytics.add_to_cart += 1;
            break;
        case InteractionKind::AddToWishlist:
            analytics.add_to_wishlist += 1;
            break;
    }
    return true;
}

size_t ProductCatalog::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return products_.size();
}
