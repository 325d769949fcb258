#include "ModelHandle.hpp"
#include <iostream>

ModelHandle::ModelHandle(const ProductRepository& products,
                         const UserRepository& users,
                         const InteractionStore& store,
                         const FeatureEncoder& encoder,
                         const InteractionMatrixBuilder& matrix_builder)
    : products_(products),
      users_(users),
      store_(store),
      encoder_(encoder),
      matrix_builder_(matrix_builder) {}

std::shared_ptr<const ModelGeneration> ModelHandle::build() const {
    auto start = std::chrono::steady_clock::now();

    // 1. Snapshot inputs once; everything below derives from these copies
    std::vector<UserRecord> users = users_.active_users();
    std::vector<Product> products = products_.active_products();
    auto events = store_.snapshot();
    Clock::time_point now = Clock::now();

    // 2. Derive matrix and embeddings
    auto generation = std::make_shared<ModelGeneration>();
    generation->built_at = now;
    generation->matrix = matrix_builder_.build(users, products, events, now);
    generation->user_embeddings = EmbeddingIndex::for_users(users, encoder_);
    generation->product_embeddings = EmbeddingIndex::for_products(products, encoder_);
    generation->number = next_number_.fetch_add(1);

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    std::cout << "[ModelHandle] Generation " << generation->number << " built in "
              << duration_ms << "ms\n";

    return generation;
}

std::shared_ptr<const ModelGeneration> ModelHandle::current() const {
    return std::atomic_load(&current_);
}

void ModelHandle::swap(std::shared_ptr<const ModelGeneration> next) {
    if (!next) return;
    uint64_t number = next->number;
    std::atomic_store(&current_, std::move(next));
    std::cout << "[ModelHandle] Generation " << number << " published\n";
}

ModelHandle::RefreshResult ModelHandle::refresh() {
    std::unique_lock<std::mutex> lock(refresh_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        std::cout << "[ModelHandle] Refresh already in progress, request merged\n";
        return RefreshResult::AlreadyRunning;
    }

    try {
        swap(build());
        return RefreshResult::Published;
    } catch (const std::exception& e) {
        std::cerr << "[ModelHandle] ❌ Refresh failed, keeping generation "
                  << generation() << ": " << e.what() << "\n";
        return RefreshResult::Failed;
    } catch (...) {
        std::cerr << "[ModelHandle] ❌ Refresh failed with unknown error, keeping generation "
                  << generation() << "\n";
        return RefreshResult::Failed;
    }
}

uint64_t ModelHandle::generation() const {
    auto gen = current();
    return gen ? gen->number : 0;
}
