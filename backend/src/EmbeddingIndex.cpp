#include "EmbeddingIndex.hpp"
#include <iostream>
#include <stdexcept>

EmbeddingIndex::EmbeddingIndex() : dimension_(0) {}

void EmbeddingIndex::put(const std::string& id, std::vector<float> embedding) {
    if (ids_.empty() && vectors_.empty()) {
        dimension_ = embedding.size();
    } else if (embedding.size() != dimension_) {
        throw std::invalid_argument("embedding for " + id + " has dimension " +
                                    std::to_string(embedding.size()) + ", index expects " +
                                    std::to_string(dimension_));
    }

    auto it = vectors_.find(id);
    if (it == vectors_.end()) {
        ids_.push_back(id);
        vectors_.emplace(id, std::move(embedding));
    } else {
        it->second = std::move(embedding);
    }
}

const std::vector<float>* EmbeddingIndex::find(const std::string& id) const {
    auto it = vectors_.find(id);
    if (it == vectors_.end()) {
        return nullptr;
    }
    return &(it->second);
}

EmbeddingIndex EmbeddingIndex::for_products(const std::vector<Product>& products,
                                            const FeatureEncoder& encoder) {
    EmbeddingIndex index;
    for (const auto& product : products) {
        index.put(product.id, encoder.encode_product(product));
    }
    std::cout << "[EmbeddingIndex] Product embeddings computed for " << index.size()
              << " products (dim " << encoder.product_dimension() << ")\n";
    return index;
}

EmbeddingIndex EmbeddingIndex::for_users(const std::vector<UserRecord>& users,
                                         const FeatureEncoder& encoder) {
    EmbeddingIndex index;
    for (const auto& user : users) {
        index.put(user.id, encoder.encode_user(user));
    }
    std::cout << "[EmbeddingIndex] User embeddings computed for " << index.size()
              << " users (dim " << encoder.user_dimension() << ")\n";
    return index;
}
