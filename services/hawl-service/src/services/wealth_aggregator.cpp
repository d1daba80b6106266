/**
 * @file wealth_aggregator.cpp
 * @brief WealthAggregator implementation
 */
#include "wealth_aggregator.h"
#include "../domain/models/threshold_result.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace nisab::hawl::services {

namespace {

constexpr long long kSlowAggregationMs = 100;

double parseAmount(const std::string& text, const std::string& assetId) {
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value)) {
        throw common::ParsingException("Asset " + assetId + " has a non-numeric value");
    }
    return value;
}

} // anonymous namespace

WealthAggregator::WealthAggregator(domain::IAssetRepository* assetRepo,
                                   common::IFieldCipher* cipher,
                                   domain::IClock* clock)
    : assetRepo_(assetRepo), cipher_(cipher), clock_(clock)
{
    if (!assetRepo_ || !cipher_ || !clock_) {
        throw std::invalid_argument("WealthAggregator: dependencies cannot be nullptr");
    }
}

domain::WealthSnapshot WealthAggregator::aggregateZakatableWealth(const std::string& userId) {
    auto started = std::chrono::steady_clock::now();

    std::vector<domain::ZakatableAsset> assets = assetRepo_->findByUser(userId);

    std::vector<const domain::ZakatableAsset*> eligible;
    std::vector<std::string> ciphertexts;
    eligible.reserve(assets.size());
    ciphertexts.reserve(assets.size());
    for (const auto& asset : assets) {
        if (!asset.zakatEligible) continue;
        eligible.push_back(&asset);
        ciphertexts.push_back(asset.encryptedValue);
    }

    std::vector<std::string> values = cipher_->decryptBatch(ciphertexts);
    if (values.size() != eligible.size()) {
        throw common::CryptoException("Batch decryption returned " + std::to_string(values.size()) +
                                      " values for " + std::to_string(eligible.size()) + " assets");
    }

    domain::WealthSnapshot snapshot;
    snapshot.userId = userId;
    snapshot.calculatedAt = clock_->now();
    for (auto category : domain::allAssetCategories()) {
        snapshot.breakdown[category] = 0.0;
    }

    double total = 0.0;
    for (size_t i = 0; i < eligible.size(); ++i) {
        double amount = parseAmount(values[i], eligible[i]->id) * eligible[i]->calculationModifier;
        snapshot.breakdown[eligible[i]->category] += amount;
        total += amount;
    }

    for (auto& entry : snapshot.breakdown) {
        entry.second = domain::roundMoney(entry.second);
    }
    snapshot.total = domain::roundMoney(total);
    snapshot.assetCount = static_cast<int>(eligible.size());

    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    if (elapsedMs > kSlowAggregationMs) {
        spdlog::warn("[WealthAggregator] Slow aggregation for user {}: {}ms ({} assets)",
                     userId, elapsedMs, assets.size());
    } else {
        spdlog::debug("[WealthAggregator] User {}: {} eligible assets, total {:.2f} ({}ms)",
                      userId, snapshot.assetCount, snapshot.total, elapsedMs);
    }

    return snapshot;
}

} // namespace nisab::hawl::services
