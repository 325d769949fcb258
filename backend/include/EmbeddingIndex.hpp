#pragma once
// EmbeddingIndex.hpp
// Fixed-dimension embeddings keyed by user or product id.
// Filled once while a generation is built, read-only afterwards.

#include <string>
#include <unordered_map>
#include <vector>
#include "FeatureEncoder.hpp"
#include "Records.hpp"

class EmbeddingIndex {
public:
    EmbeddingIndex();

    // Throws std::invalid_argument if the vector's size differs from the
    // dimension of vectors already in the index
    void put(const std::string& id, std::vector<float> embedding);

    // nullptr when the id has no embedding
    const std::vector<float>* find(const std::string& id) const;

    // Ids in insertion order
    const std::vector<std::string>& ids() const { return ids_; }

    size_t size() const { return ids_.size(); }
    size_t dimension() const { return dimension_; }
    bool empty() const { return ids_.empty(); }

    static EmbeddingIndex for_products(const std::vector<Product>& products, const FeatureEncoder& encoder);
    static EmbeddingIndex for_users(const std::vector<UserRecord>& users, const FeatureEncoder& encoder);

private:
    size_t dimension_;
    std::vector<std::string> ids_;
    std::unordered_map<std::string, std::vector<float>> vectors_;
};
