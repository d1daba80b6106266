/**
 * @file audit_trail_repository.cpp
 * @brief Audit trail repository implementation
 */
#include "audit_trail_repository.h"
#include "row_helpers.h"
#include "query_helpers.h"
#include "exceptions.h"
#include <stdexcept>

using nisab::common::db::getInt;
using nisab::common::db::getString;

namespace nisab::hawl::repositories {

namespace {

const std::string kSelectColumns =
    "SELECT id::text AS id, record_id::text AS record_id, user_id::text AS user_id, "
    "sequence, event_type, occurred_at, changes_summary, ip_address, user_agent "
    "FROM audit_trail_entry ";

} // anonymous namespace

AuditTrailRepository::AuditTrailRepository(common::IQueryExecutor* executor,
                                           const common::IFieldCipher* cipher)
    : queryExecutor_(executor), cipher_(cipher)
{
    if (!queryExecutor_ || !cipher_) {
        throw std::invalid_argument("AuditTrailRepository: executor and cipher cannot be nullptr");
    }
}

void AuditTrailRepository::append(domain::AuditTrailEntry& entry) {
    const std::string query =
        "INSERT INTO audit_trail_entry ("
        "record_id, user_id, sequence, event_type, occurred_at, changes_summary, ip_address, user_agent"
        ") VALUES ($1::uuid, $2::uuid, $3, $4, $5::timestamptz, $6, $7, $8) "
        "RETURNING id::text AS id";

    std::vector<std::string> params = {
        entry.recordId,
        entry.userId,
        std::to_string(entry.sequence),
        domain::toString(entry.eventType),
        rows::timestampParam(entry.timestamp),
        cipher_->encrypt(rows::compactJson(domain::changeToJson(entry.change))),
        entry.ipAddress.value_or(""),
        entry.userAgent.value_or("")
    };

    Json::Value result = queryExecutor_->executeQuery(query, params);
    if (result.empty()) {
        throw common::DatabaseException("Insert into audit_trail_entry returned no id");
    }
    entry.id = result[0]["id"].asString();
}

std::vector<domain::AuditTrailEntry> AuditTrailRepository::findByRecord(const std::string& recordId) {
    Json::Value rows = queryExecutor_->executeQuery(
        kSelectColumns + "WHERE record_id = $1::uuid ORDER BY sequence ASC", {recordId});

    std::vector<domain::AuditTrailEntry> entries;
    entries.reserve(rows.size());
    for (const auto& row : rows) {
        entries.push_back(rowToEntry(row));
    }
    return entries;
}

std::optional<domain::AuditTrailEntry> AuditTrailRepository::findLatest(const std::string& recordId) {
    Json::Value rows = queryExecutor_->executeQuery(
        kSelectColumns + "WHERE record_id = $1::uuid ORDER BY sequence DESC LIMIT 1", {recordId});
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToEntry(rows[0]);
}

domain::AuditTrailEntry AuditTrailRepository::rowToEntry(const Json::Value& row) const {
    domain::AuditTrailEntry entry;
    entry.id = getString(row, "id");
    entry.recordId = getString(row, "record_id");
    entry.userId = getString(row, "user_id");
    entry.sequence = getInt(row, "sequence");

    auto type = domain::parseAuditEventType(getString(row, "event_type"));
    if (!type) {
        throw common::ParsingException("Unknown audit event type: " + getString(row, "event_type"));
    }
    entry.eventType = *type;
    entry.timestamp = rows::requireTimestamp(row, "occurred_at");
    entry.change = domain::changeFromJson(
        entry.eventType, rows::parseJson(cipher_->decrypt(getString(row, "changes_summary"))));

    if (!row["ip_address"].isNull()) entry.ipAddress = row["ip_address"].asString();
    if (!row["user_agent"].isNull()) entry.userAgent = row["user_agent"].asString();
    return entry;
}

} // namespace nisab::hawl::repositories
