/**
 * @file nisab_year_record_repository.cpp
 * @brief Nisab year record repository implementation
 */
#include "nisab_year_record_repository.h"
#include "row_helpers.h"
#include "query_helpers.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

using nisab::common::db::getDouble;
using nisab::common::db::getString;

namespace nisab::hawl::repositories {

namespace {

const std::string kSelectColumns =
    "SELECT id::text AS id, user_id::text AS user_id, status, currency, "
    "hawl_start_date::text AS hawl_start_date, hawl_start_date_hijri, "
    "expected_completion_date::text AS expected_completion_date, expected_completion_date_hijri, "
    "nisab_basis, threshold_value, total_wealth, zakat_amount, breakdown, notes, unlock_reason, "
    "finalized_at, unlocked_at, created_at, updated_at "
    "FROM nisab_year_record ";

} // anonymous namespace

NisabYearRecordRepository::NisabYearRecordRepository(common::IQueryExecutor* executor,
                                                     const common::IFieldCipher* cipher)
    : queryExecutor_(executor), cipher_(cipher)
{
    if (!queryExecutor_ || !cipher_) {
        throw std::invalid_argument("NisabYearRecordRepository: executor and cipher cannot be nullptr");
    }
}

std::optional<domain::NisabYearRecord> NisabYearRecordRepository::findById(const std::string& id) {
    return findOne(kSelectColumns + "WHERE id = $1::uuid", id);
}

std::optional<domain::NisabYearRecord> NisabYearRecordRepository::findByIdForUpdate(const std::string& id) {
    return findOne(kSelectColumns + "WHERE id = $1::uuid FOR UPDATE", id);
}

std::optional<domain::NisabYearRecord> NisabYearRecordRepository::findDraftByUser(const std::string& userId) {
    return findOne(kSelectColumns + "WHERE user_id = $1::uuid AND status = 'draft' LIMIT 1", userId);
}

std::vector<domain::NisabYearRecord> NisabYearRecordRepository::findByUser(
    const std::string& userId,
    const std::optional<domain::RecordStatus>& status,
    int limit,
    int offset)
{
    std::string query = kSelectColumns + "WHERE user_id = $1::uuid";
    std::vector<std::string> params = {userId};
    if (status) {
        query += " AND status = $2";
        params.push_back(domain::toString(*status));
    }
    query += " ORDER BY created_at DESC" + common::db::paginationClause(limit, offset);

    Json::Value rows = queryExecutor_->executeQuery(query, params);

    std::vector<domain::NisabYearRecord> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(rowToRecord(row));
    }
    return records;
}

int NisabYearRecordRepository::countByUser(const std::string& userId,
                                           const std::optional<domain::RecordStatus>& status) {
    std::string query = "SELECT COUNT(*) FROM nisab_year_record WHERE user_id = $1::uuid";
    std::vector<std::string> params = {userId};
    if (status) {
        query += " AND status = $2";
        params.push_back(domain::toString(*status));
    }
    return common::db::scalarToInt(queryExecutor_->executeScalar(query, params));
}

void NisabYearRecordRepository::insert(domain::NisabYearRecord& record) {
    const std::string query =
        "INSERT INTO nisab_year_record ("
        "user_id, status, currency, hawl_start_date, hawl_start_date_hijri, "
        "expected_completion_date, expected_completion_date_hijri, nisab_basis, threshold_value, "
        "total_wealth, zakat_amount, breakdown, notes, unlock_reason, "
        "finalized_at, unlocked_at, created_at, updated_at"
        ") VALUES ("
        "$1::uuid, $2, $3, $4::date, $5, $6::date, $7, $8, $9::numeric, "
        "$10, $11, $12, COALESCE($13, ''), $14, "
        "$15::timestamptz, $16::timestamptz, $17::timestamptz, $18::timestamptz"
        ") RETURNING id::text AS id";

    std::vector<std::string> params = {
        record.userId,                                                   // $1
        domain::toString(record.status),                                 // $2
        record.currency,                                                 // $3
        record.hawlStartDate.toString(),                                 // $4
        record.hawlStartDateHijri.toString(),                            // $5
        record.expectedCompletionDate.toString(),                        // $6
        record.expectedCompletionDateHijri.toString(),                   // $7
        domain::toString(record.basis),                                  // $8
        common::db::formatAmount(record.thresholdValue),                 // $9
        rows::encryptAmount(*cipher_, record.totalWealth),               // $10
        rows::encryptAmount(*cipher_, record.zakatAmount),               // $11
        record.breakdown
            ? cipher_->encrypt(rows::compactJson(domain::breakdownToJson(*record.breakdown)))
            : "",                                                        // $12
        record.notes,                                                    // $13
        record.unlockReasonEncrypted.value_or(""),                       // $14
        rows::optionalTimestampParam(record.finalizedAt),                // $15
        rows::optionalTimestampParam(record.unlockedAt),                 // $16
        rows::timestampParam(record.createdAt),                          // $17
        rows::timestampParam(record.updatedAt)                           // $18
    };

    Json::Value result = queryExecutor_->executeQuery(query, params);
    if (result.empty()) {
        throw common::DatabaseException("Insert into nisab_year_record returned no id");
    }
    record.id = result[0]["id"].asString();

    spdlog::debug("[NisabYearRecordRepository] Inserted record {} for user {}", record.id, record.userId);
}

void NisabYearRecordRepository::update(const domain::NisabYearRecord& record) {
    const std::string query =
        "UPDATE nisab_year_record SET "
        "status = $2, threshold_value = $3::numeric, total_wealth = $4, zakat_amount = $5, "
        "breakdown = $6, notes = COALESCE($7, ''), unlock_reason = $8, "
        "finalized_at = $9::timestamptz, unlocked_at = $10::timestamptz, updated_at = $11::timestamptz "
        "WHERE id = $1::uuid";

    std::vector<std::string> params = {
        record.id,
        domain::toString(record.status),
        common::db::formatAmount(record.thresholdValue),
        rows::encryptAmount(*cipher_, record.totalWealth),
        rows::encryptAmount(*cipher_, record.zakatAmount),
        record.breakdown
            ? cipher_->encrypt(rows::compactJson(domain::breakdownToJson(*record.breakdown)))
            : "",
        record.notes,
        record.unlockReasonEncrypted.value_or(""),
        rows::optionalTimestampParam(record.finalizedAt),
        rows::optionalTimestampParam(record.unlockedAt),
        rows::timestampParam(record.updatedAt)
    };

    int affected = queryExecutor_->executeCommand(query, params);
    if (affected != 1) {
        throw common::DatabaseException("Update of nisab_year_record " + record.id +
                                        " affected " + std::to_string(affected) + " rows");
    }
}

void NisabYearRecordRepository::remove(const std::string& id) {
    // audit_trail_entry rows go with it (ON DELETE CASCADE)
    int affected = queryExecutor_->executeCommand(
        "DELETE FROM nisab_year_record WHERE id = $1::uuid", {id});
    if (affected != 1) {
        throw common::DatabaseException("Delete of nisab_year_record " + id +
                                        " affected " + std::to_string(affected) + " rows");
    }
}

void NisabYearRecordRepository::lockUser(const std::string& userId) {
    queryExecutor_->executeQuery("SELECT pg_advisory_xact_lock(hashtext($1))", {userId});
}

std::optional<domain::NisabYearRecord> NisabYearRecordRepository::findOne(const std::string& query,
                                                                          const std::string& param) {
    Json::Value rows = queryExecutor_->executeQuery(query, {param});
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToRecord(rows[0]);
}

domain::NisabYearRecord NisabYearRecordRepository::rowToRecord(const Json::Value& row) const {
    domain::NisabYearRecord record;
    record.id = getString(row, "id");
    record.userId = getString(row, "user_id");

    auto status = domain::parseRecordStatus(getString(row, "status"));
    if (!status) {
        throw common::ParsingException("Unknown record status: " + getString(row, "status"));
    }
    record.status = *status;

    auto basis = domain::parseNisabBasis(getString(row, "nisab_basis"));
    if (!basis) {
        throw common::ParsingException("Unknown nisab basis: " + getString(row, "nisab_basis"));
    }
    record.basis = *basis;

    record.currency = getString(row, "currency");
    record.hawlStartDate = rows::requireDate(row, "hawl_start_date");
    record.hawlStartDateHijri = rows::requireHijriDate(row, "hawl_start_date_hijri");
    record.expectedCompletionDate = rows::requireDate(row, "expected_completion_date");
    record.expectedCompletionDateHijri = rows::requireHijriDate(row, "expected_completion_date_hijri");
    record.thresholdValue = getDouble(row, "threshold_value");

    record.totalWealth = rows::decryptAmount(*cipher_, row, "total_wealth");
    record.zakatAmount = rows::decryptAmount(*cipher_, row, "zakat_amount");
    std::string breakdown = getString(row, "breakdown");
    if (!breakdown.empty()) {
        record.breakdown = domain::breakdownFromJson(rows::parseJson(cipher_->decrypt(breakdown)));
    }

    record.notes = getString(row, "notes");
    std::string reason = getString(row, "unlock_reason");
    if (!reason.empty()) {
        record.unlockReasonEncrypted = reason;
    }

    record.finalizedAt = rows::optionalTimestamp(row, "finalized_at");
    record.unlockedAt = rows::optionalTimestamp(row, "unlocked_at");
    record.createdAt = rows::requireTimestamp(row, "created_at");
    record.updatedAt = rows::requireTimestamp(row, "updated_at");
    return record;
}

} // namespace nisab::hawl::repositories
