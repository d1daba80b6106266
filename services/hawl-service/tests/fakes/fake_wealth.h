#pragma once

#include "domain/ports/i_wealth_source.h"
#include "domain/repositories/i_asset_repository.h"
#include "domain/repositories/i_user_repository.h"
#include "exceptions.h"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace nisab::hawl::fakes {

class InMemoryAssets : public domain::IAssetRepository {
public:
    std::vector<domain::ZakatableAsset> findByUser(const std::string& userId) override {
        std::vector<domain::ZakatableAsset> result;
        for (const auto& asset : assets) {
            if (asset.userId == userId) result.push_back(asset);
        }
        return result;
    }

    void add(const std::string& userId, domain::AssetCategory category, const std::string& encryptedValue,
             double modifier = 1.0, bool eligible = true) {
        domain::ZakatableAsset asset;
        asset.id = "asset-" + std::to_string(assets.size() + 1);
        asset.userId = userId;
        asset.category = category;
        asset.encryptedValue = encryptedValue;
        asset.calculationModifier = modifier;
        asset.zakatEligible = eligible;
        assets.push_back(asset);
    }

    std::vector<domain::ZakatableAsset> assets;
};

class InMemoryUsers : public domain::IUserRepository {
public:
    std::vector<domain::UserProfile> findActiveUsers() override {
        if (failList) {
            throw common::DatabaseException("user query failed");
        }
        return users;
    }

    std::optional<domain::UserProfile> findById(const std::string& userId) override {
        for (const auto& user : users) {
            if (user.id == userId) return user;
        }
        return std::nullopt;
    }

    void add(const std::string& id, const std::string& currency = "USD",
             domain::NisabBasis basis = domain::NisabBasis::Gold) {
        users.push_back({id, currency, basis});
    }

    bool failList = false;
    std::vector<domain::UserProfile> users;
};

/**
 * @brief Settable per-user wealth; users listed in failing throw
 */
class FakeWealthSource : public domain::IWealthSource {
public:
    domain::WealthSnapshot aggregateZakatableWealth(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_.count(userId)) {
            throw common::CryptoException("cannot decrypt assets of " + userId);
        }
        domain::WealthSnapshot snapshot;
        snapshot.userId = userId;
        auto it = wealth_.find(userId);
        snapshot.total = it == wealth_.end() ? 0.0 : it->second;
        snapshot.breakdown[domain::AssetCategory::Cash] = snapshot.total;
        snapshot.assetCount = snapshot.total > 0.0 ? 1 : 0;
        return snapshot;
    }

    void set(const std::string& userId, double total) {
        std::lock_guard<std::mutex> lock(mutex_);
        wealth_[userId] = total;
    }

    void failFor(const std::string& userId) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(userId);
    }

private:
    std::mutex mutex_;
    std::map<std::string, double> wealth_;
    std::set<std::string> failing_;
};

} // namespace nisab::hawl::fakes
