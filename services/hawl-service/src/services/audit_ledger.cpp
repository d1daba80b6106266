/**
 * @file audit_ledger.cpp
 * @brief AuditLedger implementation
 */
#include "audit_ledger.h"
#include "exceptions.h"
#include "nisab/utils/string_utils.h"
#include "nisab/utils/time_utils.h"
#include <spdlog/spdlog.h>
#include <cctype>
#include <stdexcept>

namespace nisab::hawl::services {

using domain::AuditEventType;
using domain::AuditTrailEntry;
using domain::RecordStatus;

Json::Value IntegrityReport::toJson() const {
    Json::Value json;
    json["valid"] = valid;
    json["entryCount"] = entryCount;
    Json::Value list(Json::arrayValue);
    for (const auto& p : problems) {
        list.append(p);
    }
    json["problems"] = list;
    return json;
}

std::optional<std::string> normalizeClientIp(const std::string& value) {
    std::string ip = utils::trim(value);
    if (ip.empty() || ip.size() > kMaxIpAddressLength) {
        return std::nullopt;
    }
    for (unsigned char c : ip) {
        if (!std::isxdigit(c) && c != '.' && c != ':') {
            return std::nullopt;
        }
    }
    return ip;
}

AuditLedger::AuditLedger(domain::IAuditTrailRepository* reader, domain::IClock* clock)
    : reader_(reader), clock_(clock)
{
    if (!reader_ || !clock_) {
        throw std::invalid_argument("AuditLedger: dependencies cannot be nullptr");
    }
}

AuditTrailEntry AuditLedger::append(domain::IAuditTrailRepository& store,
                                    const domain::NisabYearRecord& record,
                                    AuditEventType eventType,
                                    domain::AuditChange change,
                                    const AuditContext& context) {
    if (!domain::changeMatchesEvent(eventType, change)) {
        throw std::invalid_argument("AuditLedger: change summary does not match event '" +
                                    domain::toString(eventType) + "'");
    }

    AuditTrailEntry entry;
    entry.recordId = record.id;
    entry.userId = record.userId;
    entry.eventType = eventType;
    entry.change = std::move(change);
    if (context.ipAddress) {
        entry.ipAddress = normalizeClientIp(*context.ipAddress);
        if (!entry.ipAddress) {
            spdlog::warn("[AuditLedger] Dropping malformed client address ({} chars) for record {}",
                         context.ipAddress->size(), record.id);
        }
    }
    entry.userAgent = context.userAgent;

    try {
        auto latest = store.findLatest(record.id);
        entry.sequence = latest ? latest->sequence + 1 : 1;
        entry.timestamp = clock_->now();
        if (latest && entry.timestamp < latest->timestamp) {
            entry.timestamp = latest->timestamp;
        }
        store.append(entry);
    } catch (const common::NisabException& e) {
        spdlog::error("[AuditLedger] Failed to append '{}' for record {}: {}",
                      domain::toString(eventType), record.id, e.what());
        throw common::AuditWriteFailureException(e.what());
    }

    spdlog::debug("[AuditLedger] Appended '{}' #{} for record {}",
                  domain::toString(eventType), entry.sequence, record.id);
    return entry;
}

std::vector<AuditTrailEntry> AuditLedger::listForRecord(const std::string& recordId) {
    return reader_->findByRecord(recordId);
}

IntegrityReport AuditLedger::verifyIntegrity(const std::string& recordId) {
    IntegrityReport report = checkEntries(reader_->findByRecord(recordId));
    if (!report.valid) {
        spdlog::warn("[AuditLedger] Integrity check failed for record {}: {} problem(s)",
                     recordId, report.problems.size());
    }
    return report;
}

IntegrityReport AuditLedger::checkEntries(const std::vector<AuditTrailEntry>& entries) {
    IntegrityReport report;
    report.entryCount = static_cast<int>(entries.size());

    auto fail = [&report](const AuditTrailEntry& e, const std::string& problem) {
        report.valid = false;
        report.problems.push_back("#" + std::to_string(e.sequence) + " " +
                                  domain::toString(e.eventType) + ": " + problem);
    };

    std::optional<RecordStatus> state;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];

        if (e.sequence != static_cast<int>(i) + 1) {
            fail(e, "expected sequence " + std::to_string(i + 1));
        }
        if (i > 0 && e.timestamp < entries[i - 1].timestamp) {
            fail(e, "timestamp " + utils::formatIso8601(e.timestamp, true) + " precedes previous entry");
        }
        if (!domain::changeMatchesEvent(e.eventType, e.change)) {
            fail(e, "change summary has the wrong shape");
        }

        switch (e.eventType) {
            case AuditEventType::Created:
                if (state) fail(e, "record already created");
                state = RecordStatus::Draft;
                break;
            case AuditEventType::Finalized:
                if (state != RecordStatus::Draft) fail(e, "finalize requires a draft");
                state = RecordStatus::Finalized;
                break;
            case AuditEventType::Unlocked:
                if (state != RecordStatus::Finalized) fail(e, "unlock requires a finalized record");
                state = RecordStatus::Unlocked;
                break;
            case AuditEventType::Edited:
                if (state != RecordStatus::Unlocked) fail(e, "edit requires an unlocked record");
                break;
            case AuditEventType::Refinalized:
                if (state != RecordStatus::Unlocked) fail(e, "refinalize requires an unlocked record");
                state = RecordStatus::Finalized;
                break;
        }
    }

    return report;
}

} // namespace nisab::hawl::services
