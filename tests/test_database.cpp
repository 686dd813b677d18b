#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <fstream>
#include "test_archive_fixture.hpp"
#include "storage/entity_repository.hpp"
#include "storage/schema_contract.hpp"

using namespace ACE;
using namespace ACE::Storage;
using namespace testing;

// Tests for the SQLite wrapper
// Tests pour le wrapper SQLite
class DatabaseTest : public ACE::Testing::ArchiveFixture {};

TEST_F(DatabaseTest, OpenNeverCreatesFiles) {
    Database other;
    auto opened = other.open((test_dir_ / "missing.db").string(), Database::Options{});
    EXPECT_FALSE(opened);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "missing.db"));
    EXPECT_FALSE(other.isOpen());
}

TEST_F(DatabaseTest, OpenRejectsNonDatabaseFile) {
    const auto path = test_dir_ / "not_a_db.db";
    {
        std::ofstream file(path);
        file << "this is plain text, not an SQLite archive, padded to look like a file header.........";
    }
    Database other;
    auto opened = other.open(path.string(), Database::Options{});
    ASSERT_FALSE(opened);
    EXPECT_FALSE(other.isOpen());
}

TEST_F(DatabaseTest, ReadOnlyRejectsWrites) {
    addEntity("Jeffrey Epstein", 3);
    reopen(Database::OpenMode::READ_ONLY);
    EXPECT_TRUE(db_.isReadOnly());

    auto written = db_.execute("UPDATE entities SET mentions = 0");
    EXPECT_FALSE(written);
    EXPECT_EQ(scalar("SELECT mentions FROM entities"), 3);
}

TEST_F(DatabaseTest, BindsAndReadsColumns) {
    auto stmtR = db_.prepare("SELECT ?, ?, ?, ?");
    ASSERT_TRUE(stmtR);
    auto stmt = std::move(stmtR).value();
    ASSERT_TRUE(stmt.bind(1, std::int64_t{42}));
    ASSERT_TRUE(stmt.bind(2, 97.5));
    ASSERT_TRUE(stmt.bind(3, std::string_view("Maxwell")));
    ASSERT_TRUE(stmt.bind(4, nullptr));

    auto step = stmt.step();
    ASSERT_TRUE(step);
    ASSERT_TRUE(step.value());
    EXPECT_EQ(stmt.columnCount(), 4);
    EXPECT_EQ(stmt.getInt64(0), 42);
    EXPECT_DOUBLE_EQ(stmt.getDouble(1), 97.5);
    EXPECT_EQ(stmt.getText(2), "Maxwell");
    EXPECT_TRUE(stmt.isNull(3));
}

TEST_F(DatabaseTest, UniqueViolationIsClassified) {
    EntityId id = addEntity("Acme", 1, "Organization");
    exec("INSERT INTO organizations (entity_id) VALUES (" + std::to_string(id) + ")");

    auto duplicate = db_.execute("INSERT INTO organizations (entity_id) VALUES (" + std::to_string(id) + ")");
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().kind, MergeError::CONSTRAINT_VIOLATION);
}

TEST_F(DatabaseTest, ForeignKeyViolationIsNotAConstraintConflict) {
    auto orphan = db_.execute("INSERT INTO entity_mentions (entity_id, document_id) VALUES (12345, 1)");
    ASSERT_FALSE(orphan);
    EXPECT_EQ(orphan.error().kind, MergeError::OTHER);
}

TEST_F(DatabaseTest, TransactionCommitsOnSuccess) {
    auto result = db_.transaction([&]() -> DbResult<void> {
        return db_.execute("INSERT INTO entities (full_name, mentions) VALUES ('A B', 1)");
    });
    ASSERT_TRUE(result);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entities"), 1);
}

TEST_F(DatabaseTest, TransactionRollsBackOnError) {
    auto result = db_.transaction([&]() -> DbResult<void> {
        auto first = db_.execute("INSERT INTO entities (full_name, mentions) VALUES ('A B', 1)");
        if (!first) return first;
        return StorageError::other("stop here");
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "stop here");
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM entities"), 0);
}

TEST_F(DatabaseTest, TableAndColumnLookup) {
    EXPECT_TRUE(db_.tableExists("entities").value());
    EXPECT_FALSE(db_.tableExists("nope").value());
    EXPECT_TRUE(db_.columnExists("entities", "aliases").value());
    EXPECT_FALSE(db_.columnExists("entities", "nope").value());
}

TEST_F(DatabaseTest, BackupIsACompleteCopy) {
    addEntity("Jeffrey Epstein", 3);
    const std::string copy = (test_dir_ / "backups" / "archive_copy.db").string();
    ASSERT_TRUE(db_.backupTo(copy));

    Database restored;
    ASSERT_TRUE(restored.open(copy, Database::Options{}));
    auto stmt = std::move(restored.prepare("SELECT full_name FROM entities")).value();
    ASSERT_TRUE(stmt.step().value());
    EXPECT_EQ(stmt.getText(0), "Jeffrey Epstein");
}

// Tests for schema contract resolution
// Tests pour la résolution du contrat de schéma
class SchemaContractTest : public ACE::Testing::ArchiveFixture {};

TEST_F(SchemaContractTest, DefaultContractResolvesFully) {
    auto resolved = SchemaContract::archiveDefault().resolveAgainst(db_);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved.value().references.size(), 6u);
    ASSERT_TRUE(resolved.value().person.has_value());
    EXPECT_EQ(resolved.value().person->dependents.size(), 2u);
}

TEST_F(SchemaContractTest, MissingTablesAreDropped) {
    exec("DROP TABLE timeline_events");
    exec("DROP TABLE black_book_entries");
    auto resolved = SchemaContract::archiveDefault().resolveAgainst(db_);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved.value().references.size(), 5u);
    EXPECT_EQ(resolved.value().person->dependents.size(), 1u);
}

TEST_F(SchemaContractTest, MissingEntityTableFails) {
    Database empty;
    ASSERT_TRUE(empty.create((test_dir_ / "empty.db").string()));
    auto resolved = SchemaContract::archiveDefault().resolveAgainst(empty);
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().kind, MergeError::NOT_FOUND);
}

TEST_F(SchemaContractTest, ReferenceParsing) {
    auto ref = TableReference::parse(ReferenceKind::COMPOSITE, "entity_mentions.entity_id+document_id");
    EXPECT_EQ(ref.table, "entity_mentions");
    EXPECT_EQ(ref.column, "entity_id");
    EXPECT_EQ(ref.secondary, "document_id");

    EXPECT_THROW(TableReference::parse(ReferenceKind::SIMPLE, "no_dot"), std::invalid_argument);
    EXPECT_THROW(TableReference::parse(ReferenceKind::PAIR, "rel.a"), std::invalid_argument);
    EXPECT_THROW(TableReference::parse(ReferenceKind::SIMPLE, "t.c+extra"), std::invalid_argument);
    EXPECT_THROW(TableReference::parse(ReferenceKind::SIMPLE, "t;drop.c"), std::invalid_argument);
}

TEST_F(SchemaContractTest, IdentifierValidation) {
    EXPECT_TRUE(isValidIdentifier("entity_mentions"));
    EXPECT_FALSE(isValidIdentifier("1table"));
    EXPECT_FALSE(isValidIdentifier("a b"));

    SchemaContract contract = SchemaContract::archiveDefault();
    EXPECT_NO_THROW(contract.validateIdentifiers());
    contract.entity_table = "entities; DROP TABLE x";
    EXPECT_THROW(contract.validateIdentifiers(), std::invalid_argument);
}

// Tests for the entity repository
// Tests pour le dépôt d'entités
class EntityRepositoryTest : public ACE::Testing::ArchiveFixture {
protected:
    void SetUp() override {
        ArchiveFixture::SetUp();
        schema_ = SchemaContract::archiveDefault().resolveAgainst(db_).value();
    }

    SchemaContract schema_;
};

TEST_F(EntityRepositoryTest, LoadFiltersByTypeAndOrdersById) {
    addEntity("Bill Clinton", 5);
    addEntity("Acme", 2, "Organization");
    addEntity("Ghislaine Maxwell", 9, "Person", "[\"G. Maxwell\"]");

    EntityRepository repository(db_, schema_);
    auto people = repository.loadEntities(EntityType::PERSON);
    ASSERT_TRUE(people);
    ASSERT_EQ(people.value().size(), 2u);
    EXPECT_EQ(people.value()[0].full_name, "Bill Clinton");
    EXPECT_EQ(people.value()[1].mentions, 9);
    EXPECT_THAT(people.value()[1].aliases, ElementsAre("G. Maxwell"));

    EXPECT_EQ(repository.countEntities(EntityType::ORGANIZATION).value(), 1);
}

TEST_F(EntityRepositoryTest, FindByIdMissingIsEmpty) {
    EntityRepository repository(db_, schema_);
    auto found = repository.findById(404);
    ASSERT_TRUE(found);
    EXPECT_FALSE(found.value().has_value());
}

TEST_F(EntityRepositoryTest, RecountMentionsFromMentionRows) {
    EntityId a = addEntity("Bill Clinton", 50);
    EntityId b = addEntity("Acme", 7, "Organization");
    addMention(a, 1);
    addMention(a, 2);

    EntityRepository repository(db_, schema_);
    auto updated = repository.recountMentions(EntityType::PERSON);
    ASSERT_TRUE(updated);
    EXPECT_EQ(updated.value(), 1);
    EXPECT_EQ(scalar("SELECT mentions FROM entities WHERE id = " + std::to_string(a)), 2);
    EXPECT_EQ(scalar("SELECT mentions FROM entities WHERE id = " + std::to_string(b)), 7);
}

TEST_F(EntityRepositoryTest, AliasCodec) {
    EXPECT_THAT(parseAliases("[\"A\", \"B\"]"), ElementsAre("A", "B"));
    EXPECT_THAT(parseAliases("legacy name"), ElementsAre("legacy name"));
    EXPECT_TRUE(parseAliases("").empty());
    EXPECT_EQ(serializeAliases({"J. Epstein"}), "[\"J. Epstein\"]");
}

// OCR aliases with Latin-1 bytes serialize instead of throwing mid-merge
// Les alias OCR contenant des octets Latin-1 sont sérialisés sans exception
TEST_F(EntityRepositoryTest, AliasCodecReplacesInvalidUtf8) {
    std::string stored;
    ASSERT_NO_THROW(stored = serializeAliases({"Jos\xe9 Garcia"}));
    EXPECT_EQ(stored, "[\"Jos\xef\xbf\xbd Garcia\"]");
    EXPECT_THAT(parseAliases(stored), ElementsAre("Jos\xef\xbf\xbd Garcia"));
}
