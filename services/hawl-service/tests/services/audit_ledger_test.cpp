/**
 * @file audit_ledger_test.cpp
 * @brief Unit tests for AuditLedger
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "services/audit_ledger.h"
#include "exceptions.h"
#include "fakes/fake_clock.h"
#include "fakes/in_memory_records.h"

using namespace nisab::hawl;
using domain::AuditEventType;
using domain::AuditTrailEntry;
using domain::RecordStatus;
using services::AuditLedger;

namespace {

class AuditLedgerTest : public ::testing::Test {
protected:
    fakes::FakeClock clock_{{2026, 3, 1}};
    fakes::InMemoryStore store_;
    std::unique_ptr<AuditLedger> ledger_;
    domain::NisabYearRecord record_;

    void SetUp() override {
        ledger_ = std::make_unique<AuditLedger>(&store_.auditReader(), &clock_);
        record_.id = "00000000-0000-4000-8000-000000000099";
        record_.userId = "11111111-1111-4111-8111-111111111111";
        record_.thresholdValue = 6000.0;
        record_.currency = "USD";
    }

    domain::CreatedChange created() {
        domain::CreatedChange c;
        c.thresholdValue = record_.thresholdValue;
        c.currency = record_.currency;
        c.hawlStartDate = {2026, 3, 1};
        c.expectedCompletionDate = {2027, 2, 18};
        return c;
    }

    domain::FinalizationChange finalization(RecordStatus from) {
        domain::FinalizationChange c;
        c.before.status = from;
        c.after.status = RecordStatus::Finalized;
        c.after.totalWealth = 12000.0;
        c.after.zakatAmount = 150.0;
        return c;
    }

    /** @brief Append and commit in its own unit of work */
    AuditTrailEntry appendCommitted(AuditEventType type, domain::AuditChange change,
                                    const services::AuditContext& context = {}) {
        auto uow = store_.begin();
        auto entry = ledger_->append(uow->audit(), record_, type, std::move(change), context);
        uow->commit();
        return entry;
    }

    static AuditTrailEntry entry(int sequence, AuditEventType type, domain::AuditChange change,
                                 std::chrono::system_clock::time_point ts) {
        AuditTrailEntry e;
        e.sequence = sequence;
        e.eventType = type;
        e.change = std::move(change);
        e.timestamp = ts;
        return e;
    }
};

// --- append ---

TEST_F(AuditLedgerTest, AssignsContiguousSequenceNumbers) {
    // Act
    auto first = appendCommitted(AuditEventType::Created, created());
    auto second = appendCommitted(AuditEventType::Finalized, finalization(RecordStatus::Draft));

    // Assert
    EXPECT_EQ(first.sequence, 1);
    EXPECT_EQ(second.sequence, 2);
    EXPECT_EQ(first.recordId, record_.id);
    EXPECT_EQ(first.userId, record_.userId);
    EXPECT_FALSE(first.id.empty());

    auto entries = ledger_->listForRecord(record_.id);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].eventType, AuditEventType::Created);
    EXPECT_EQ(entries[1].eventType, AuditEventType::Finalized);
}

TEST_F(AuditLedgerTest, TimestampNeverMovesBackwards) {
    auto first = appendCommitted(AuditEventType::Created, created());
    clock_.advance(-std::chrono::hours(2));

    auto second = appendCommitted(AuditEventType::Finalized, finalization(RecordStatus::Draft));

    EXPECT_EQ(second.timestamp, first.timestamp);
}

TEST_F(AuditLedgerTest, RecordsRequestContext) {
    services::AuditContext ctx{std::string("203.0.113.9"), std::string("curl/8.0")};

    auto e = appendCommitted(AuditEventType::Created, created(), ctx);

    ASSERT_TRUE(e.ipAddress.has_value());
    EXPECT_EQ(*e.ipAddress, "203.0.113.9");
    ASSERT_TRUE(e.userAgent.has_value());
    EXPECT_EQ(*e.userAgent, "curl/8.0");
}

TEST_F(AuditLedgerTest, MalformedClientAddressIsDropped) {
    services::AuditContext ctx{std::string(46, 'a'), std::string("curl/8.0")};

    auto e = appendCommitted(AuditEventType::Created, created(), ctx);

    EXPECT_FALSE(e.ipAddress.has_value());
    ASSERT_TRUE(e.userAgent.has_value());
    EXPECT_EQ(ledger_->listForRecord(record_.id).size(), 1u);
}

TEST(ClientIpTest, AcceptsIpv4AndIpv6Literals) {
    EXPECT_EQ(services::normalizeClientIp(" 203.0.113.9 ").value_or(""), "203.0.113.9");
    EXPECT_EQ(services::normalizeClientIp("2001:db8::1").value_or(""), "2001:db8::1");
    EXPECT_EQ(services::normalizeClientIp("0000:0000:0000:0000:0000:ffff:192.168.100.228").value_or(""),
              "0000:0000:0000:0000:0000:ffff:192.168.100.228");
}

TEST(ClientIpTest, RejectsOversizedOrNonAddressValues) {
    EXPECT_FALSE(services::normalizeClientIp("").has_value());
    EXPECT_FALSE(services::normalizeClientIp(std::string(46, '1')).has_value());
    EXPECT_FALSE(services::normalizeClientIp("unknown").has_value());
    EXPECT_FALSE(services::normalizeClientIp("10.0.0.1; DROP TABLE").has_value());
}

TEST_F(AuditLedgerTest, MismatchedChangeShapeIsRejected) {
    auto uow = store_.begin();

    EXPECT_THROW(ledger_->append(uow->audit(), record_, AuditEventType::Unlocked, created()),
                 std::invalid_argument);
    EXPECT_THROW(ledger_->append(uow->audit(), record_, AuditEventType::Edited,
                                 finalization(RecordStatus::Draft)),
                 std::invalid_argument);
}

TEST_F(AuditLedgerTest, StorageFailureBecomesAuditWriteFailure) {
    store_.failAuditAppend = true;
    auto uow = store_.begin();

    EXPECT_THROW(ledger_->append(uow->audit(), record_, AuditEventType::Created, created()),
                 nisab::common::AuditWriteFailureException);
}

TEST_F(AuditLedgerTest, UncommittedEntriesAreNotVisible) {
    {
        auto uow = store_.begin();
        ledger_->append(uow->audit(), record_, AuditEventType::Created, created());
    }

    EXPECT_TRUE(ledger_->listForRecord(record_.id).empty());
}

// --- integrity ---

TEST_F(AuditLedgerTest, LegalHistoryIsValid) {
    appendCommitted(AuditEventType::Created, created());
    appendCommitted(AuditEventType::Finalized, finalization(RecordStatus::Draft));
    appendCommitted(AuditEventType::Unlocked, domain::UnlockChange{{}, "enc:reason text"});
    appendCommitted(AuditEventType::Edited, domain::EditChange{{{"notes", "", "fixed"}}});
    appendCommitted(AuditEventType::Refinalized, finalization(RecordStatus::Unlocked));

    auto report = ledger_->verifyIntegrity(record_.id);

    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.entryCount, 5);
    EXPECT_TRUE(report.problems.empty());
}

TEST_F(AuditLedgerTest, EmptyHistoryIsValid) {
    auto report = ledger_->verifyIntegrity(record_.id);

    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.entryCount, 0);
}

TEST_F(AuditLedgerTest, SequenceGapIsReported) {
    auto t = clock_.now();
    std::vector<AuditTrailEntry> entries = {
        entry(1, AuditEventType::Created, created(), t),
        entry(3, AuditEventType::Finalized, finalization(RecordStatus::Draft), t),
    };

    auto report = AuditLedger::checkEntries(entries);

    EXPECT_FALSE(report.valid);
    ASSERT_EQ(report.problems.size(), 1u);
    EXPECT_NE(report.problems[0].find("expected sequence 2"), std::string::npos);
}

TEST_F(AuditLedgerTest, TimestampRegressionIsReported) {
    auto t = clock_.now();
    std::vector<AuditTrailEntry> entries = {
        entry(1, AuditEventType::Created, created(), t),
        entry(2, AuditEventType::Finalized, finalization(RecordStatus::Draft), t - std::chrono::seconds(1)),
    };

    auto report = AuditLedger::checkEntries(entries);

    EXPECT_FALSE(report.valid);
    EXPECT_NE(report.problems[0].find("precedes previous entry"), std::string::npos);
}

TEST_F(AuditLedgerTest, IllegalTransitionsAreReported) {
    auto t = clock_.now();
    std::vector<AuditTrailEntry> entries = {
        entry(1, AuditEventType::Created, created(), t),
        entry(2, AuditEventType::Unlocked, domain::UnlockChange{{}, "enc:x"}, t),
        entry(3, AuditEventType::Finalized, finalization(RecordStatus::Draft), t),
        entry(4, AuditEventType::Finalized, finalization(RecordStatus::Draft), t),
    };

    auto report = AuditLedger::checkEntries(entries);

    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.entryCount, 4);
    // unlock of a draft, finalize of an unlocked record, finalize of a finalized one
    EXPECT_EQ(report.problems.size(), 3u);
}

TEST_F(AuditLedgerTest, WrongChangeShapeIsReported) {
    auto t = clock_.now();
    std::vector<AuditTrailEntry> entries = {
        entry(1, AuditEventType::Created, domain::EditChange{}, t),
    };

    auto report = AuditLedger::checkEntries(entries);

    EXPECT_FALSE(report.valid);
    EXPECT_NE(report.problems[0].find("wrong shape"), std::string::npos);
}

TEST_F(AuditLedgerTest, ReportSerializesProblems) {
    services::IntegrityReport report;
    report.valid = false;
    report.entryCount = 2;
    report.problems.push_back("#2 finalized: finalize requires a draft");

    auto json = report.toJson();

    EXPECT_FALSE(json["valid"].asBool());
    EXPECT_EQ(json["entryCount"].asInt(), 2);
    ASSERT_EQ(json["problems"].size(), 1u);
}

} // namespace
