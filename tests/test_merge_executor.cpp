#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "test_archive_fixture.hpp"
#include "consolidation/merge_executor.hpp"

using namespace ACE;
using namespace ACE::Consolidation;
using namespace ACE::Storage;
using namespace testing;

// Fixture with a resolved schema contract and an in-memory audit trail
// Fixture avec un contrat de schéma résolu et une piste d'audit en mémoire
class MergeExecutorTest : public ACE::Testing::ArchiveFixture {
protected:
    void SetUp() override {
        ArchiveFixture::SetUp();
        auto resolved = SchemaContract::archiveDefault().resolveAgainst(db_);
        ASSERT_TRUE(resolved) << resolved.error().message;
        schema_ = std::move(resolved).value();
    }

    MergeCandidate candidate(EntityId source, EntityId target) {
        MergeCandidate c;
        c.source_id = source;
        c.target_id = target;
        c.method = ExactMatch{};
        c.confidence = 100.0;
        c.reason = "exact match (case-insensitive)";
        return c;
    }

    std::string snapshot() {
        std::string all;
        for (const char* table : {"entities", "entity_mentions", "media_items", "timeline_events", "organizations",
                                  "entity_evidence_types", "entity_relationships", "people", "entity_documents",
                                  "black_book_entries"}) {
            all += std::string(table) + ":\n" + dumpTable(table);
        }
        return all;
    }

    SchemaContract schema_;
    AuditLogger audit_;
};

TEST_F(MergeExecutorTest, TwoPersonsBecomeOne) {
    EntityId target = addEntity("Jeffrey Epstein", 12);
    EntityId source = addEntity("jeffrey epstein", 5);
    auto target_person = addPerson(target);
    auto source_person = addPerson(source);
    exec("INSERT INTO entity_documents VALUES (" + std::to_string(target_person) + ", 1)");
    exec("INSERT INTO entity_documents VALUES (" + std::to_string(source_person) + ", 1)");
    exec("INSERT INTO entity_documents VALUES (" + std::to_string(source_person) + ", 2)");
    exec("INSERT INTO black_book_entries (person_id, phone) VALUES (" + std::to_string(source_person) + ", '555')");
    addMention(target, 10);
    addMention(source, 10);
    addMention(source, 11);

    MergeExecutor executor(db_, schema_, audit_);
    auto outcome = executor.execute(candidate(source, target));
    ASSERT_TRUE(outcome) << outcome.error().message;

    EXPECT_EQ(outcome.value().person_action, PersonAction::MERGED);
    EXPECT_EQ(outcome.value().mentions_transferred, 5);
    EXPECT_EQ(outcome.value().source_name, "jeffrey epstein");
    EXPECT_EQ(outcome.value().target_name, "Jeffrey Epstein");

    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entities"), 1);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM people"), 1);
    EXPECT_EQ(scalar("SELECT entity_id FROM people"), target);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entity_documents WHERE entity_id = " + std::to_string(target_person)), 2);
    EXPECT_EQ(scalar("SELECT person_id FROM black_book_entries"), target_person);
    EXPECT_EQ(scalar("SELECT mentions FROM entities WHERE id = " + std::to_string(target)), 17);
}

TEST_F(MergeExecutorTest, NoOrphanReferencesRemain) {
    EntityId target = addEntity("Ghislaine Maxwell", 9);
    EntityId source = addEntity("Ghislaine Maxwel", 2);
    addMention(source, 1);
    addMention(source, 2);
    exec("INSERT INTO media_items (entity_id, file_path) VALUES (" + std::to_string(source) + ", 'a.jpg')");
    exec("INSERT INTO timeline_events (entity_id, event_description) VALUES (" + std::to_string(source) + ", 'x')");
    exec("INSERT INTO entity_evidence_types VALUES (" + std::to_string(source) + ", 4)");

    MergeExecutor executor(db_, schema_, audit_);
    ASSERT_TRUE(executor.execute(candidate(source, target)));

    for (const char* table : {"entity_mentions", "media_items", "timeline_events", "entity_evidence_types"}) {
        EXPECT_EQ(scalar(std::string("SELECT COUNT(*) FROM ") + table +
                         " WHERE entity_id NOT IN (SELECT id FROM entities)"), 0) << table;
        EXPECT_EQ(scalar(std::string("SELECT COUNT(*) FROM ") + table +
                         " WHERE entity_id = " + std::to_string(target)), table == std::string("entity_mentions") ? 2 : 1)
            << table;
    }
}

TEST_F(MergeExecutorTest, SharedMentionRowsAreDeduplicated) {
    EntityId target = addEntity("Bill Clinton", 3);
    EntityId source = addEntity("Bill Clintn", 2);
    addMention(target, 1);
    addMention(source, 1);
    addMention(source, 2);

    MergeExecutor executor(db_, schema_, audit_);
    auto outcome = executor.execute(candidate(source, target));
    ASSERT_TRUE(outcome);

    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entity_mentions"), 2);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entity_mentions WHERE entity_id = " + std::to_string(target)), 2);
    EXPECT_GE(outcome.value().rows_dropped, 1);
}

TEST_F(MergeExecutorTest, MentionCountIsAdditive) {
    EntityId target = addEntity("Bill Clinton", 40);
    EntityId source = addEntity("bill clinton", 7);

    MergeExecutor executor(db_, schema_, audit_);
    ASSERT_TRUE(executor.execute(candidate(source, target)));

    EXPECT_EQ(scalar("SELECT mentions FROM entities WHERE id = " + std::to_string(target)), 47);
}

TEST_F(MergeExecutorTest, SourcePersonMovesWhenTargetHasNone) {
    EntityId target = addEntity("Jean Luc Brunel", 8);
    EntityId source = addEntity("Jean-Luc Brunel", 1);
    auto source_person = addPerson(source);

    MergeExecutor executor(db_, schema_, audit_);
    auto outcome = executor.execute(candidate(source, target));
    ASSERT_TRUE(outcome);

    EXPECT_EQ(outcome.value().person_action, PersonAction::MOVED);
    EXPECT_EQ(scalar("SELECT entity_id FROM people WHERE id = " + std::to_string(source_person)), target);
}

TEST_F(MergeExecutorTest, UniqueOrganizationRowOfTargetWins) {
    EntityId target = addEntity("Acme Holdings", 5, "Organization");
    EntityId source = addEntity("ACME Holdings", 1, "Organization");
    exec("INSERT INTO organizations (entity_id, name) VALUES (" + std::to_string(target) + ", 'target')");
    exec("INSERT INTO organizations (entity_id, name) VALUES (" + std::to_string(source) + ", 'source')");

    MergeExecutor executor(db_, schema_, audit_);
    auto outcome = executor.execute(candidate(source, target));
    ASSERT_TRUE(outcome) << outcome.error().message;

    EXPECT_EQ(scalar("SELECT COUNT(*) FROM organizations"), 1);
    EXPECT_EQ(text("SELECT name FROM organizations"), "target");
    EXPECT_EQ(outcome.value().rows_dropped, 1);
}

TEST_F(MergeExecutorTest, RelationshipsCollapseWithoutSelfLoops) {
    EntityId target = addEntity("Leslie Wexner", 6);
    EntityId source = addEntity("Les Wexner", 1);
    EntityId other = addEntity("Ohio State", 2);
    auto rel = [this](EntityId a, EntityId b) {
        exec("INSERT INTO entity_relationships (source_entity_id, target_entity_id) VALUES (" +
             std::to_string(a) + ", " + std::to_string(b) + ")");
    };
    rel(target, other);
    rel(source, other);
    rel(source, target);
    rel(other, source);

    MergeExecutor executor(db_, schema_, audit_);
    ASSERT_TRUE(executor.execute(candidate(source, target)));

    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entity_relationships"), 2);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entity_relationships WHERE source_entity_id = target_entity_id"), 0);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entity_relationships WHERE source_entity_id = " +
                     std::to_string(source) + " OR target_entity_id = " + std::to_string(source)), 0);
}

TEST_F(MergeExecutorTest, AliasesAreUnited) {
    EntityId target = addEntity("Jeffrey Epstein", 10, "Person", "[\"J. Epstein\"]");
    EntityId source = addEntity("Jeffrey E. Epstein", 3, "Person", "[\"JE\", \"j epstein\"]");

    MergeExecutor executor(db_, schema_, audit_);
    ASSERT_TRUE(executor.execute(candidate(source, target)));

    auto aliases = parseAliases(text("SELECT aliases FROM entities WHERE id = " + std::to_string(target)));
    EXPECT_THAT(aliases, ElementsAre("J. Epstein", "Jeffrey E. Epstein", "JE"));
}

TEST_F(MergeExecutorTest, MissingSourceRollsBackAndIsNotAudited) {
    EntityId target = addEntity("Jeffrey Epstein", 10);
    addMention(target, 1);
    const std::string before = snapshot();

    MergeExecutor executor(db_, schema_, audit_);
    auto outcome = executor.execute(candidate(999, target));

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, MergeError::NOT_FOUND);
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(audit_.size(), 0u);
}

TEST_F(MergeExecutorTest, FailureAfterRepointingRollsBackEverything) {
    EntityId target = addEntity("Jeffrey Epstein", 10);
    EntityId source = addEntity("jeffrey epstein", 2);
    addPerson(source);
    addMention(source, 1);
    exec("INSERT INTO media_items (entity_id, file_path) VALUES (" + std::to_string(source) + ", 'a.jpg')");
    exec("CREATE TRIGGER block_entity_delete BEFORE DELETE ON entities "
         "BEGIN SELECT RAISE(ABORT, 'deletion blocked'); END");
    const std::string before = snapshot();

    MergeExecutor executor(db_, schema_, audit_);
    auto outcome = executor.execute(candidate(source, target));

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, MergeError::OTHER);
    EXPECT_THAT(outcome.error().message, HasSubstr("deletion blocked"));
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(audit_.size(), 0u);
}

TEST_F(MergeExecutorTest, SelfMergeIsRefused) {
    EntityId only = addEntity("Jeffrey Epstein", 10);

    MergeExecutor executor(db_, schema_, audit_);
    auto outcome = executor.execute(candidate(only, only));

    ASSERT_FALSE(outcome);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entities"), 1);
}

TEST_F(MergeExecutorTest, CommittedMergeIsAudited) {
    EntityId target = addEntity("Bill Clinton", 40);
    EntityId source = addEntity("Bill Clintn", 2);
    MergeCandidate typo = candidate(source, target);
    typo.method = FuzzyTypo{1};
    typo.confidence = 97.5;

    MergeExecutor executor(db_, schema_, audit_);
    ASSERT_TRUE(executor.execute(typo));

    ASSERT_EQ(audit_.size(), 1u);
    const AuditEntry& entry = audit_.entries().front();
    EXPECT_EQ(entry.source_id, source);
    EXPECT_EQ(entry.source_name, "Bill Clintn");
    EXPECT_EQ(entry.target_id, target);
    EXPECT_EQ(entry.target_name, "Bill Clinton");
    EXPECT_EQ(entry.mentions_transferred, 2);
    EXPECT_DOUBLE_EQ(entry.confidence, 97.5);
    EXPECT_EQ(entry.method, "typo_correction");
}

TEST_F(MergeExecutorTest, AbsentDependentTablesAreSkipped) {
    exec("DROP TABLE media_items");
    exec("DROP TABLE black_book_entries");
    auto resolved = SchemaContract::archiveDefault().resolveAgainst(db_);
    ASSERT_TRUE(resolved);
    schema_ = std::move(resolved).value();

    EntityId target = addEntity("Jeffrey Epstein", 10);
    EntityId source = addEntity("jeffrey epstein", 2);

    MergeExecutor executor(db_, schema_, audit_);
    EXPECT_TRUE(executor.execute(candidate(source, target)));
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entities"), 1);
}
