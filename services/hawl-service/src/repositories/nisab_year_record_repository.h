#pragma once

#include "../domain/repositories/i_nisab_year_record_repository.h"
#include "i_query_executor.h"
#include "field_cipher.h"

namespace nisab::hawl::repositories {

/**
 * @brief nisab_year_record table operations
 *
 * total_wealth, zakat_amount, breakdown and unlock_reason are stored
 * encrypted. The executor decides the transaction scope: a pooled
 * executor for plain reads, a PostgreSQLTransaction inside a unit of work.
 */
class NisabYearRecordRepository : public domain::INisabYearRecordRepository {
public:
    /**
     * @throws std::invalid_argument if executor or cipher is nullptr
     */
    NisabYearRecordRepository(common::IQueryExecutor* executor, const common::IFieldCipher* cipher);

    std::optional<domain::NisabYearRecord> findById(const std::string& id) override;
    std::optional<domain::NisabYearRecord> findByIdForUpdate(const std::string& id) override;
    std::optional<domain::NisabYearRecord> findDraftByUser(const std::string& userId) override;

    std::vector<domain::NisabYearRecord> findByUser(
        const std::string& userId,
        const std::optional<domain::RecordStatus>& status,
        int limit,
        int offset) override;

    int countByUser(const std::string& userId, const std::optional<domain::RecordStatus>& status) override;

    void insert(domain::NisabYearRecord& record) override;
    void update(const domain::NisabYearRecord& record) override;
    void remove(const std::string& id) override;
    void lockUser(const std::string& userId) override;

private:
    std::optional<domain::NisabYearRecord> findOne(const std::string& query, const std::string& param);

    domain::NisabYearRecord rowToRecord(const Json::Value& row) const;

    common::IQueryExecutor* queryExecutor_;
    const common::IFieldCipher* cipher_;
};

} // namespace nisab::hawl::repositories
