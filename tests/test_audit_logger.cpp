#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <fstream>
#include "test_archive_fixture.hpp"
#include "consolidation/audit_logger.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace ACE;
using namespace ACE::Consolidation;
using namespace testing;

// Mock sink for AuditLogger tests
// Destination factice pour les tests AuditLogger
class MockAuditSink : public AuditSink {
public:
    MOCK_METHOD(bool, rewritesAll, (), (const, override));
    MOCK_METHOD(bool, persist, (const std::vector<AuditEntry>& entries), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

namespace {

AuditEntry makeEntry(EntityId source, EntityId target) {
    AuditEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.source_id = source;
    entry.source_name = "source " + std::to_string(source);
    entry.target_id = target;
    entry.target_name = "target " + std::to_string(target);
    entry.mentions_transferred = source;
    entry.confidence = 97.5;
    entry.method = "typo_correction";
    return entry;
}

} // namespace

class AuditLoggerTest : public ::testing::Test {
protected:
    // Register a mock and keep a raw handle for expectations
    // Enregistre un mock et garde un pointeur brut pour les attentes
    MockAuditSink* addMock(bool rewrites_all) {
        auto sink = std::make_unique<NiceMock<MockAuditSink>>();
        MockAuditSink* raw = sink.get();
        ON_CALL(*raw, rewritesAll()).WillByDefault(Return(rewrites_all));
        ON_CALL(*raw, name()).WillByDefault(Return(rewrites_all ? "file" : "table"));
        audit.addSink(std::move(sink));
        return raw;
    }

    AuditLogger audit;
};

TEST_F(AuditLoggerTest, AppendKeepsOrder) {
    audit.append(makeEntry(1, 2));
    audit.append(makeEntry(3, 2));

    ASSERT_EQ(audit.size(), 2u);
    EXPECT_EQ(audit.entries()[0].source_id, 1);
    EXPECT_EQ(audit.entries()[1].source_id, 3);
}

TEST_F(AuditLoggerTest, RewritingSinkReceivesWholeHistory) {
    MockAuditSink* file = addMock(true);
    audit.append(makeEntry(1, 2));

    EXPECT_CALL(*file, persist(SizeIs(1))).WillOnce(Return(true));
    EXPECT_TRUE(audit.flush());

    audit.append(makeEntry(3, 2));
    EXPECT_CALL(*file, persist(SizeIs(2))).WillOnce(Return(true));
    EXPECT_TRUE(audit.flush());
}

TEST_F(AuditLoggerTest, AppendOnlySinkReceivesOnlyNewEntries) {
    MockAuditSink* table = addMock(false);
    audit.append(makeEntry(1, 2));

    EXPECT_CALL(*table, persist(SizeIs(1))).WillOnce(Return(true));
    EXPECT_TRUE(audit.flush());

    audit.append(makeEntry(3, 2));
    audit.append(makeEntry(4, 2));
    EXPECT_CALL(*table, persist(ElementsAre(Field(&AuditEntry::source_id, 3), Field(&AuditEntry::source_id, 4))))
        .WillOnce(Return(true));
    EXPECT_TRUE(audit.flush());
}

TEST_F(AuditLoggerTest, FailedAppendIsRetriedOnNextFlush) {
    MockAuditSink* table = addMock(false);
    audit.append(makeEntry(1, 2));

    EXPECT_CALL(*table, persist(SizeIs(1))).WillOnce(Return(false));
    EXPECT_FALSE(audit.flush());

    audit.append(makeEntry(3, 2));
    EXPECT_CALL(*table, persist(SizeIs(2))).WillOnce(Return(true));
    EXPECT_TRUE(audit.flush());
}

TEST_F(AuditLoggerTest, OneFailingSinkDoesNotStopOthers) {
    MockAuditSink* file = addMock(true);
    MockAuditSink* table = addMock(false);
    audit.append(makeEntry(1, 2));

    EXPECT_CALL(*file, persist(_)).WillOnce(Return(false));
    EXPECT_CALL(*table, persist(_)).WillOnce(Return(true));
    EXPECT_FALSE(audit.flush());
}

TEST_F(AuditLoggerTest, RestoredEntriesAreNotAppendedTwice) {
    MockAuditSink* file = addMock(true);
    MockAuditSink* table = addMock(false);

    audit.restore({makeEntry(1, 2), makeEntry(3, 2)}, {{"table", 2}});
    audit.append(makeEntry(5, 2));

    EXPECT_CALL(*file, persist(SizeIs(3))).WillOnce(Return(true));
    EXPECT_CALL(*table, persist(ElementsAre(Field(&AuditEntry::source_id, 5)))).WillOnce(Return(true));
    EXPECT_TRUE(audit.flush());
    EXPECT_EQ(audit.entries().front().source_id, 1);
}

// Entries the table never received before the stop are appended on resume
// Les entrées jamais reçues par la table avant l'arrêt sont ajoutées à la reprise
TEST_F(AuditLoggerTest, RestoredEntriesBeyondRecordedOffsetAreAppended) {
    MockAuditSink* table = addMock(false);

    audit.restore({makeEntry(1, 2), makeEntry(3, 2), makeEntry(4, 2)}, {{"table", 1}});
    audit.append(makeEntry(5, 2));

    EXPECT_CALL(*table, persist(ElementsAre(Field(&AuditEntry::source_id, 3),
                                            Field(&AuditEntry::source_id, 4),
                                            Field(&AuditEntry::source_id, 5))))
        .WillOnce(Return(true));
    EXPECT_TRUE(audit.flush());
    EXPECT_EQ(audit.appendOffsets().at("table"), 4u);
}

TEST_F(AuditLoggerTest, UnrecordedSinkReceivesWholeRestoredTrail) {
    audit.restore({makeEntry(1, 2), makeEntry(3, 2)}, {{"table:other", 2}});
    MockAuditSink* table = addMock(false);

    EXPECT_CALL(*table, persist(SizeIs(2))).WillOnce(Return(true));
    EXPECT_TRUE(audit.flush());
}

TEST_F(AuditLoggerTest, AppendOffsetsListOnlyAppendOnlySinks) {
    MockAuditSink* file = addMock(true);
    MockAuditSink* table = addMock(false);
    audit.append(makeEntry(1, 2));

    EXPECT_EQ(audit.appendOffsets(), (std::map<std::string, size_t>{{"table", 0}}));

    EXPECT_CALL(*file, persist(_)).WillOnce(Return(true));
    EXPECT_CALL(*table, persist(_)).WillOnce(Return(false));
    EXPECT_FALSE(audit.flush());
    EXPECT_EQ(audit.appendOffsets().at("table"), 0u);
}

TEST_F(AuditLoggerTest, EntryJsonFieldNames) {
    nlohmann::json j = makeEntry(7, 9);
    EXPECT_EQ(j.at("sourceId"), 7);
    EXPECT_EQ(j.at("sourceName"), "source 7");
    EXPECT_EQ(j.at("targetId"), 9);
    EXPECT_EQ(j.at("targetName"), "target 9");
    EXPECT_EQ(j.at("mentionsTransferred"), 7);
    EXPECT_DOUBLE_EQ(j.at("confidence").get<double>(), 97.5);
    EXPECT_EQ(j.at("method"), "typo_correction");
    EXPECT_THAT(j.at("timestamp").get<std::string>(), EndsWith("Z"));

    AuditEntry back = j.get<AuditEntry>();
    EXPECT_EQ(back.source_name, "source 7");
    EXPECT_EQ(back.method, "typo_correction");
}

TEST_F(AuditLoggerTest, ParseTimestamp) {
    auto tp = parseISO8601("2024-03-01T12:30:45.250Z");
    EXPECT_EQ(Logger::timestampToISO8601(tp), "2024-03-01T12:30:45.250Z");

    AuditEntry entry = makeEntry(1, 2);
    entry.timestamp = tp;
    nlohmann::json j = entry;
    EXPECT_TRUE(j.get<AuditEntry>().timestamp == tp);
    EXPECT_THROW(parseISO8601("yesterday"), std::invalid_argument);
}

// Tests for the two concrete sinks
// Tests pour les deux destinations concrètes
class AuditSinkTest : public ACE::Testing::ArchiveFixture {};

TEST_F(AuditSinkTest, JsonFileIsPrettyPrintedArray) {
    const std::string path = (test_dir_ / "audit" / "consolidation_audit.json").string();
    JsonFileAuditSink sink(path);

    ASSERT_TRUE(sink.persist({makeEntry(1, 2), makeEntry(3, 2)}));

    std::ifstream file(path);
    nlohmann::json written = nlohmann::json::parse(file);
    ASSERT_TRUE(written.is_array());
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[1].at("sourceId"), 3);
    EXPECT_THAT(fileBytes(path), HasSubstr("\n  {"));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(AuditSinkTest, EmptyRunWritesEmptyArray) {
    const std::string path = (test_dir_ / "empty.json").string();
    JsonFileAuditSink sink(path);

    ASSERT_TRUE(sink.persist({}));
    std::ifstream file(path);
    EXPECT_EQ(nlohmann::json::parse(file), nlohmann::json::array());
}

TEST_F(AuditSinkTest, TableRowsUseArchiveAuditShape) {
    SqliteAuditSink sink(db_, "audit_log", "entity-consolidator");
    EXPECT_EQ(sink.name(), "table:audit_log");

    ASSERT_TRUE(sink.persist({makeEntry(4, 8)}));
    ASSERT_TRUE(sink.persist({makeEntry(5, 8)}));

    EXPECT_EQ(scalar("SELECT COUNT(*) FROM audit_log"), 2);
    EXPECT_EQ(text("SELECT action FROM audit_log LIMIT 1"), "entity_merge");
    EXPECT_EQ(text("SELECT object_type FROM audit_log LIMIT 1"), "entity");
    EXPECT_EQ(text("SELECT object_id FROM audit_log ORDER BY id LIMIT 1"), "8");
    EXPECT_EQ(text("SELECT user_id FROM audit_log LIMIT 1"), "entity-consolidator");

    auto payload = nlohmann::json::parse(text("SELECT payload_json FROM audit_log ORDER BY id DESC LIMIT 1"));
    EXPECT_EQ(payload.at("sourceId"), 5);
}

// Latin-1 bytes in OCR names must not abort persistence
// Les octets Latin-1 des noms OCR ne doivent pas interrompre la persistance
TEST_F(AuditSinkTest, InvalidUtf8NamesAreReplacedInFile) {
    const std::string path = (test_dir_ / "latin1.json").string();
    JsonFileAuditSink sink(path);
    AuditEntry entry = makeEntry(2, 1);
    entry.source_name = "JOS\xc9 GARCIA";
    entry.target_name = "Jos\xe9 Garcia";

    ASSERT_TRUE(sink.persist({entry}));
    std::ifstream file(path);
    nlohmann::json written = nlohmann::json::parse(file);
    EXPECT_EQ(written[0].at("targetName"), "Jos\xef\xbf\xbd Garcia");
}

TEST_F(AuditSinkTest, InvalidUtf8NamesAreReplacedInTable) {
    SqliteAuditSink sink(db_, "audit_log", "entity-consolidator");
    AuditEntry entry = makeEntry(2, 1);
    entry.source_name = "JOS\xc9 GARCIA";

    ASSERT_TRUE(sink.persist({entry}));
    auto payload = nlohmann::json::parse(text("SELECT payload_json FROM audit_log"));
    EXPECT_EQ(payload.at("sourceName"), "JOS\xef\xbf\xbd GARCIA");
}
