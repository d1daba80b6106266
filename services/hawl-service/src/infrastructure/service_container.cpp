/**
 * @file service_container.cpp
 * @brief Hawl service ServiceContainer implementation
 */

#include "service_container.h"
#include "../common/config.h"

#include <spdlog/spdlog.h>

// Infrastructure
#include "db_connection_pool.h"
#include "db_connection_pool_factory.h"
#include "postgresql_query_executor.h"
#include "field_cipher.h"
#include "pg_unit_of_work.h"
#include "hawl_detection_job.h"
#include "hawl_detection_scheduler.h"
#include "http/price_feed_client.h"

// Repositories
#include "../repositories/nisab_year_record_repository.h"
#include "../repositories/audit_trail_repository.h"
#include "../repositories/price_cache_repository.h"
#include "../repositories/asset_repository.h"
#include "../repositories/user_repository.h"

// Services
#include "../services/price_oracle_cache.h"
#include "../services/wealth_aggregator.h"
#include "../services/audit_ledger.h"
#include "../services/record_lifecycle.h"
#include "../services/hawl_tracker.h"

namespace nisab::hawl::infrastructure {

struct ServiceContainer::Impl {
    domain::SystemClock clock;

    std::unique_ptr<common::AesGcmFieldCipher> cipher;

    // Database
    std::shared_ptr<common::DbConnectionPool> dbPool;
    std::unique_ptr<common::PostgreSQLQueryExecutor> queryExecutor;

    // Repositories
    std::unique_ptr<repositories::NisabYearRecordRepository> recordRepo;
    std::unique_ptr<repositories::AuditTrailRepository> auditRepo;
    std::unique_ptr<repositories::PriceCacheRepository> priceCacheRepo;
    std::unique_ptr<repositories::AssetRepository> assetRepo;
    std::unique_ptr<repositories::UserRepository> userRepo;
    std::unique_ptr<PgUnitOfWorkFactory> uowFactory;

    std::unique_ptr<http::PriceFeedClient> priceFeed;

    // Services
    std::unique_ptr<services::PriceOracleCache> priceOracleCache;
    std::unique_ptr<services::WealthAggregator> wealthAggregator;
    std::unique_ptr<services::AuditLedger> auditLedger;
    std::unique_ptr<services::RecordLifecycle> recordLifecycle;
    std::unique_ptr<services::HawlTracker> hawlTracker;

    // Background
    std::unique_ptr<HawlDetectionJob> detectionJob;
    std::unique_ptr<HawlDetectionScheduler> detectionScheduler;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const Config& config) {
    spdlog::info("Initializing Hawl service dependencies...");

    try {
        // Step 1: Field cipher
        impl_->cipher = std::make_unique<common::AesGcmFieldCipher>(config.encryptionKey);

        // Step 2: Database connection pool
        impl_->dbPool = common::DbConnectionPoolFactory::createFromEnv();
        if (!impl_->dbPool->initialize()) {
            spdlog::critical("Failed to initialize database connection pool");
            return false;
        }
        impl_->queryExecutor = std::make_unique<common::PostgreSQLQueryExecutor>(impl_->dbPool.get());
        spdlog::info("Database connection pool initialized");

        // Step 3: Repositories
        auto defaultBasis = domain::parseNisabBasis(config.defaultNisabBasis);
        if (!defaultBasis) {
            spdlog::warn("Unknown DEFAULT_NISAB_BASIS '{}', using gold", config.defaultNisabBasis);
        }

        auto* executor = impl_->queryExecutor.get();
        auto* cipher = impl_->cipher.get();
        impl_->recordRepo = std::make_unique<repositories::NisabYearRecordRepository>(executor, cipher);
        impl_->auditRepo = std::make_unique<repositories::AuditTrailRepository>(executor, cipher);
        impl_->priceCacheRepo = std::make_unique<repositories::PriceCacheRepository>(executor);
        impl_->assetRepo = std::make_unique<repositories::AssetRepository>(executor);
        impl_->userRepo = std::make_unique<repositories::UserRepository>(
            executor, config.reportingCurrency, defaultBasis.value_or(domain::NisabBasis::Gold));
        impl_->uowFactory = std::make_unique<PgUnitOfWorkFactory>(impl_->dbPool.get(), cipher);

        // Step 4: Price feed
        impl_->priceFeed = std::make_unique<http::PriceFeedClient>(
            config.metalsApiUrl, config.metalsApiKey, config.metalsApiTimeoutSec);
        spdlog::info("Price feed: {} (timeout {}s)", config.metalsApiUrl, config.metalsApiTimeoutSec);

        // Step 5: Services
        impl_->priceOracleCache = std::make_unique<services::PriceOracleCache>(
            impl_->priceCacheRepo.get(), impl_->priceFeed.get(), &impl_->clock,
            std::chrono::hours(config.priceCacheTtlHours),
            std::chrono::seconds(config.priceFeedRetrySec));
        impl_->wealthAggregator = std::make_unique<services::WealthAggregator>(
            impl_->assetRepo.get(), cipher, &impl_->clock);
        impl_->auditLedger = std::make_unique<services::AuditLedger>(impl_->auditRepo.get(), &impl_->clock);
        impl_->recordLifecycle = std::make_unique<services::RecordLifecycle>(
            impl_->uowFactory.get(), impl_->recordRepo.get(), impl_->auditLedger.get(), cipher, &impl_->clock);
        impl_->hawlTracker = std::make_unique<services::HawlTracker>(
            impl_->priceOracleCache.get(), impl_->wealthAggregator.get(), impl_->recordLifecycle.get(),
            impl_->userRepo.get(), &impl_->clock);

        // Step 6: Detection job and scheduler
        HawlDetectionJob::Options options;
        options.concurrency = config.detectionConcurrency;
        options.deadline = std::chrono::seconds(config.detectionDeadlineSec);

        auto* users = impl_->userRepo.get();
        auto* tracker = impl_->hawlTracker.get();
        impl_->detectionJob = std::make_unique<HawlDetectionJob>(
            [users]() { return users->findActiveUsers(); },
            [tracker](const domain::UserProfile& user) { return tracker->evaluate(user); },
            options);

        impl_->detectionScheduler = std::make_unique<HawlDetectionScheduler>();
        impl_->detectionScheduler->configure(
            std::chrono::minutes(config.detectionIntervalMin),
            std::chrono::seconds(config.detectionInitialDelaySec),
            config.detectionEnabled);
        auto* job = impl_->detectionJob.get();
        impl_->detectionScheduler->setRunFn([job](const std::string& trigger) { job->run(trigger); });

        spdlog::info("All Hawl service dependencies initialized successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize Hawl service: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    spdlog::info("Shutting down Hawl service dependencies...");

    // Reverse order of initialization
    if (impl_->detectionScheduler) {
        impl_->detectionScheduler->stop();
    }
    impl_->detectionScheduler.reset();
    impl_->detectionJob.reset();

    impl_->hawlTracker.reset();
    impl_->recordLifecycle.reset();
    impl_->auditLedger.reset();
    impl_->wealthAggregator.reset();
    impl_->priceOracleCache.reset();

    impl_->priceFeed.reset();

    impl_->uowFactory.reset();
    impl_->userRepo.reset();
    impl_->assetRepo.reset();
    impl_->priceCacheRepo.reset();
    impl_->auditRepo.reset();
    impl_->recordRepo.reset();

    impl_->queryExecutor.reset();
    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }

    impl_->cipher.reset();

    spdlog::info("Hawl service dependencies shut down");
}

common::DbConnectionPool* ServiceContainer::dbPool() const { return impl_->dbPool.get(); }
common::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }
const common::IFieldCipher* ServiceContainer::fieldCipher() const { return impl_->cipher.get(); }
domain::IUserRepository* ServiceContainer::userRepository() const { return impl_->userRepo.get(); }

services::PriceOracleCache* ServiceContainer::priceOracleCache() const { return impl_->priceOracleCache.get(); }
services::WealthAggregator* ServiceContainer::wealthAggregator() const { return impl_->wealthAggregator.get(); }
services::AuditLedger* ServiceContainer::auditLedger() const { return impl_->auditLedger.get(); }
services::RecordLifecycle* ServiceContainer::recordLifecycle() const { return impl_->recordLifecycle.get(); }
services::HawlTracker* ServiceContainer::hawlTracker() const { return impl_->hawlTracker.get(); }

HawlDetectionJob* ServiceContainer::detectionJob() const { return impl_->detectionJob.get(); }
HawlDetectionScheduler* ServiceContainer::detectionScheduler() const { return impl_->detectionScheduler.get(); }

} // namespace nisab::hawl::infrastructure
