#pragma once
// EngineErrors.hpp
// Exceptions raised inside the recommendation pipeline.
// None of these escape RecommendationService::get_recommendations or
// InteractionTracker::track; they are caught there and logged.

#include <stdexcept>
#include <string>

// No model generation has been published yet
class ModelNotReady : public std::runtime_error {
public:
    ModelNotReady()
        : std::runtime_error("recommendation model has not been built yet") {}
};

// A read against the external user/product store failed
class TransientLookupFailure : public std::runtime_error {
public:
    explicit TransientLookupFailure(const std::string& what)
        : std::runtime_error("lookup failed: " + what) {}
};

// Tracking referenced a product the catalog does not know
class UnknownProduct : public std::runtime_error {
public:
    explicit UnknownProduct(const std::string& product_id)
        : std::runtime_error("unknown product: " + product_id) {}
};
