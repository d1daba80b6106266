#pragma once

/**
 * @file service_container.h
 * @brief Owns every long-lived component of the Hawl service
 *
 * Initialization order:
 * 1. Field cipher (encryption key)
 * 2. Database connection pool and pooled query executor
 * 3. Repositories and the unit-of-work factory
 * 4. Price feed client
 * 5. Services (oracle, aggregator, ledger, lifecycle, tracker)
 * 6. Detection job and scheduler
 *
 * Accessors return non-owning pointers.
 *
 * @date 2026-10-18
 */

#include <memory>

namespace nisab::hawl { struct Config; }

namespace nisab::common {
    class DbConnectionPool;
    class IQueryExecutor;
    class IFieldCipher;
}

namespace nisab::hawl::domain {
    class IUserRepository;
}

namespace nisab::hawl::services {
    class PriceOracleCache;
    class WealthAggregator;
    class AuditLedger;
    class RecordLifecycle;
    class HawlTracker;
}

namespace nisab::hawl::infrastructure {

class HawlDetectionJob;
class HawlDetectionScheduler;

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const Config& config);

    /**
     * @brief Stop the scheduler and release everything in reverse order
     */
    void shutdown();

    common::DbConnectionPool* dbPool() const;
    common::IQueryExecutor* queryExecutor() const;
    const common::IFieldCipher* fieldCipher() const;
    domain::IUserRepository* userRepository() const;

    services::PriceOracleCache* priceOracleCache() const;
    services::WealthAggregator* wealthAggregator() const;
    services::AuditLedger* auditLedger() const;
    services::RecordLifecycle* recordLifecycle() const;
    services::HawlTracker* hawlTracker() const;

    HawlDetectionJob* detectionJob() const;
    HawlDetectionScheduler* detectionScheduler() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nisab::hawl::infrastructure
