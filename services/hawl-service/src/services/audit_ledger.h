#pragma once

/**
 * @file audit_ledger.h
 * @brief Append-only lifecycle history of Nisab year records
 *
 * append() is the only write. It assigns the next per-record sequence
 * number and a timestamp that is never earlier than the previous
 * entry's, so listForRecord() always returns a replayable history.
 *
 * @date 2026-10-18
 */

#include "../domain/models/audit_trail_entry.h"
#include "../domain/ports/i_clock.h"
#include "../domain/repositories/i_audit_trail_repository.h"
#include <json/json.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace nisab::hawl::services {

/**
 * @brief Request metadata recorded with an entry
 */
struct AuditContext {
    std::optional<std::string> ipAddress;
    std::optional<std::string> userAgent;
};

/** @brief Longest textual IP address (IPv4-mapped IPv6), the ip_address column width */
constexpr size_t kMaxIpAddressLength = 45;

/**
 * @brief Trimmed client address if it is an IPv4/IPv6 literal of at most
 *        kMaxIpAddressLength characters, otherwise nullopt
 */
std::optional<std::string> normalizeClientIp(const std::string& value);

/**
 * @brief Result of replaying a record's audit trail
 */
struct IntegrityReport {
    bool valid = true;
    int entryCount = 0;
    std::vector<std::string> problems;

    Json::Value toJson() const;
};

class AuditLedger {
public:
    /**
     * @param reader Repository used for reads outside a unit of work
     * @param clock Time source for entry timestamps
     */
    AuditLedger(domain::IAuditTrailRepository* reader, domain::IClock* clock);

    /**
     * @brief Append one entry through the given (transactional) repository
     *
     * @param store Audit repository of the caller's unit of work
     * @param record Record the event happened to (after the transition)
     * @return The stored entry
     * @throws std::invalid_argument if the change shape does not fit the event type
     * @throws common::AuditWriteFailureException if the entry could not be written
     */
    domain::AuditTrailEntry append(domain::IAuditTrailRepository& store,
                                   const domain::NisabYearRecord& record,
                                   domain::AuditEventType eventType,
                                   domain::AuditChange change,
                                   const AuditContext& context = {});

    /** @brief Entries of one record in sequence order */
    std::vector<domain::AuditTrailEntry> listForRecord(const std::string& recordId);

    IntegrityReport verifyIntegrity(const std::string& recordId);

    /**
     * @brief Check sequence contiguity, timestamp order and that the events
     *        are a legal walk of the record state machine
     */
    static IntegrityReport checkEntries(const std::vector<domain::AuditTrailEntry>& entries);

private:
    domain::IAuditTrailRepository* reader_;
    domain::IClock* clock_;
};

} // namespace nisab::hawl::services
