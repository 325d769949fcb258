#include "RecommendationService.hpp"
#include <iostream>
#include "EngineErrors.hpp"

RecommendationService::RecommendationService(const EngineConfig& config,
                                             const ProductRepository& products,
                                             const UserRepository& users,
                                             const InteractionStore& store,
                                             const ModelHandle& model)
    : products_(products),
      users_(users),
      store_(store),
      model_(model),
      collaborative_(config.min_neighbor_similarity, config.max_neighbors),
      trending_(products, config.trending_base_score, config.fallback_base_score),
      ranker_(config.weights, config.boosts),
      candidate_multiplier_(config.candidate_multiplier == 0 ? 1 : config.candidate_multiplier) {}

std::unordered_set<std::string> RecommendationService::recently_viewed(const UserRecord& user) const {
    std::unordered_set<std::string> viewed(user.recently_viewed.begin(), user.recently_viewed.end());
    for (const auto& product_id : store_.viewed_products(user.id)) {
        viewed.insert(product_id);
    }
    return viewed;
}

std::vector<RecommendationCandidate> RecommendationService::run_pipeline(
    const std::string& user_id,
    size_t limit,
    bool exclude_recently_viewed
) const {
    // Pin one generation for the whole request
    std::shared_ptr<const ModelGeneration> generation = model_.current();
    if (!generation) {
        throw ModelNotReady();
    }

    // Unknown users get an empty profile: both filters come back empty and
    // the trending list carries the result
    UserRecord user;
    if (!users_.get(user_id, user)) {
        user = UserRecord();
        user.id = user_id;
    }

    // 1. Candidate lists
    size_t wide_limit = limit * candidate_multiplier_;
    auto collaborative = collaborative_.recommend(user_id, generation->matrix, wide_limit);
    auto content = content_.recommend(user_id, generation->user_embeddings,
                                      generation->product_embeddings, wide_limit);
    auto trending = trending_.trending(limit);

    // 2. Weighted merge
    const SourceWeights& weights = ranker_.weights();
    std::vector<RecommendationCandidate> merged = ranker_.combine({
        {collaborative, weights.collaborative},
        {content, weights.content_based},
        {trending, weights.trending}
    });

    // 3. Drop recently viewed products before boosting
    if (exclude_recently_viewed) {
        merged = HybridRanker::exclude(std::move(merged), recently_viewed(user));
    }

    // 4. Personalization boost
    std::unordered_map<std::string, Product> products;
    for (const auto& candidate : merged) {
        Product product;
        if (products_.get(candidate.product_id, product)) {
            products.emplace(candidate.product_id, std::move(product));
        }
    }
    merged = ranker_.apply_boost(std::move(merged), products, user, HybridRanker::current_season());

    if (merged.size() > limit) {
        merged.resize(limit);
    }
    return merged;
}

std::vector<RecommendationCandidate> RecommendationService::get_recommendations(
    const std::string& user_id,
    size_t limit,
    bool exclude_recently_viewed
) const {
    if (limit == 0) {
        return {};
    }

    try {
        std::vector<RecommendationCandidate> results = run_pipeline(user_id, limit, exclude_recently_viewed);
        if (!results.empty()) {
            return results;
        }
        std::cout << "[Engine] Pipeline produced no candidates for user " << user_id
                  << ", serving fallback\n";
    } catch (const std::exception& e) {
        std::cerr << "[Engine] Error getting recommendations for user " << user_id
                  << ": " << e.what() << " (serving fallback)\n";
    } catch (...) {
        std::cerr << "[Engine] Unknown error getting recommendations for user " << user_id
                  << " (serving fallback)\n";
    }

    return trending_.fallback(limit);
}

std::string RecommendationService::get_recommendations_json(
    const std::string& user_id,
    size_t limit,
    bool exclude_recently_viewed
) const {
    json response_json;
    response_json["user_id"] = user_id;
    response_json["generation"] = model_.generation();
    response_json["recommendations"] = json::array();

    for (const auto& candidate : get_recommendations(user_id, limit, exclude_recently_viewed)) {
        response_json["recommendations"].push_back(candidate_to_json(candidate));
    }
    return response_json.dump();
}
