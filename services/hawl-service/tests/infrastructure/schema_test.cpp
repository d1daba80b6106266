/**
 * @file schema_test.cpp
 * @brief Checks on the persistence guarantees declared in sql/schema.sql
 */

#include <gtest/gtest.h>

#include <fstream>
#include <regex>
#include <sstream>
#include <string>

namespace {

std::string loadSchema() {
    std::ifstream in(NISAB_SCHEMA_SQL);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// CREATE TABLE body for one table, up to its closing ");"
std::string tableDefinition(const std::string& schema, const std::string& table) {
    const std::string marker = "CREATE TABLE IF NOT EXISTS " + table + " (";
    auto start = schema.find(marker);
    if (start == std::string::npos) return "";
    auto end = schema.find("\n);", start);
    return schema.substr(start, end - start);
}

class SchemaTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_ = loadSchema();
        ASSERT_FALSE(schema_.empty()) << "cannot read " << NISAB_SCHEMA_SQL;
    }

    std::string schema_;
};

TEST_F(SchemaTest, DeletingUserDoesNotCascadeToRecords) {
    std::string records = tableDefinition(schema_, "nisab_year_record");
    ASSERT_FALSE(records.empty());

    std::regex userRef(R"(user_id\s+UUID NOT NULL REFERENCES app_user\(id\) ON DELETE RESTRICT)");
    EXPECT_TRUE(std::regex_search(records, userRef));
    EXPECT_EQ(records.find("ON DELETE CASCADE"), std::string::npos);
}

TEST_F(SchemaTest, OnlyDraftRecordsCanBeDeleted) {
    EXPECT_NE(schema_.find("BEFORE DELETE ON nisab_year_record"), std::string::npos);
    EXPECT_NE(schema_.find("IF OLD.status <> 'draft' THEN"), std::string::npos);
}

TEST_F(SchemaTest, AuditIpAddressColumnWidth) {
    std::string audit = tableDefinition(schema_, "audit_trail_entry");
    EXPECT_NE(audit.find("ip_address          VARCHAR(45)"), std::string::npos);
}

TEST_F(SchemaTest, AuditRowsCannotBeUpdated) {
    EXPECT_NE(schema_.find("BEFORE UPDATE ON audit_trail_entry"), std::string::npos);
}

} // namespace
