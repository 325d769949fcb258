#pragma once
// ModelHandle.hpp
// Process-wide owner of the current model generation.
//
// Readers call current() and keep the returned shared_ptr for the whole
// request, so a refresh published mid-request never mixes an old matrix with
// new embeddings. Publishing is a single atomic pointer store.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include "EmbeddingIndex.hpp"
#include "FeatureEncoder.hpp"
#include "InteractionMatrix.hpp"
#include "InteractionStore.hpp"
#include "Repositories.hpp"

// One consistent snapshot: matrix and both embedding indexes
struct ModelGeneration {
    uint64_t number;
    Clock::time_point built_at;
    InteractionMatrix matrix;
    EmbeddingIndex user_embeddings;
    EmbeddingIndex product_embeddings;

    ModelGeneration() : number(0) {}
};

class ModelHandle {
public:
    enum class RefreshResult {
        Published,       // new generation swapped in
        AlreadyRunning,  // another refresh was in flight; merged into it
        Failed           // build threw; previous generation kept
    };

    ModelHandle(const ProductRepository& products,
                const UserRepository& users,
                const InteractionStore& store,
                const FeatureEncoder& encoder,
                const InteractionMatrixBuilder& matrix_builder);

    // Compute a new generation from a snapshot of users, products and
    // interactions. Does not publish. May throw.
    std::shared_ptr<const ModelGeneration> build() const;

    // Current generation, or nullptr before the first successful refresh
    std::shared_ptr<const ModelGeneration> current() const;

    // Publish `next` as the current generation
    void swap(std::shared_ptr<const ModelGeneration> next);

    // build() + swap(), at most one at a time. Never throws.
    RefreshResult refresh();

    bool is_ready() const { return current() != nullptr; }

    // 0 before the first generation
    uint64_t generation() const;

private:
    const ProductRepository& products_;
    const UserRepository& users_;
    const InteractionStore& store_;
    const FeatureEncoder& encoder_;
    const InteractionMatrixBuilder& matrix_builder_;

    // Read and written only through std::atomic_load / std::atomic_store
    std::shared_ptr<const ModelGeneration> current_;

    std::mutex refresh_mutex_;
    mutable std::atomic<uint64_t> next_number_{1};
};
