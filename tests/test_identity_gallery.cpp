#include <gtest/gtest.h>

#include <sqlite3.h>

#include <filesystem>

#include "identity_gallery.hpp"

using namespace spex;

namespace {
std::string fresh_db(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "spex_tests";
    std::filesystem::create_directories(dir);
    auto p = dir / name;
    std::filesystem::remove(p);
    return p.string();
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    ASSERT_EQ(sqlite3_exec(db, sql, nullptr, nullptr, &err), SQLITE_OK) << (err ? err : "");
}

void insert_embedding(sqlite3* db, int person_id, const std::vector<float>& vec) {
    sqlite3_stmt* stmt = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(db, "INSERT INTO embeddings(person_id, vec) VALUES(?, ?)", -1, &stmt, nullptr),
              SQLITE_OK);
    sqlite3_bind_int(stmt, 1, person_id);
    sqlite3_bind_blob(stmt, 2, vec.data(), static_cast<int>(vec.size() * sizeof(float)), SQLITE_TRANSIENT);
    EXPECT_EQ(sqlite3_step(stmt), SQLITE_DONE);
    sqlite3_finalize(stmt);
}
}  // namespace

TEST(IdentityGallery, LoadsNamesRelationsAndEmbeddings) {
    const std::string path = fresh_db("gallery.db");
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    exec(db, "CREATE TABLE people(person_id INTEGER PRIMARY KEY, name TEXT, relation TEXT)");
    exec(db, "CREATE TABLE embeddings(person_id INTEGER, vec BLOB)");
    exec(db, "INSERT INTO people VALUES(1, 'Asha', 'sister'), (2, 'Ravi', NULL)");
    insert_embedding(db, 1, {0.1f, 0.2f, 0.3f});
    insert_embedding(db, 2, {0.4f, 0.5f, 0.6f});
    insert_embedding(db, 1, {0.11f, 0.21f, 0.31f});
    exec(db, "INSERT INTO embeddings VALUES(2, x'0102')");
    sqlite3_close(db);

    IdentityGallery gallery;
    EXPECT_EQ(gallery.load(path), 3u);
    ASSERT_EQ(gallery.size(), 3u);
    EXPECT_EQ(gallery.entries()[0].name, "Asha");
    EXPECT_EQ(gallery.entries()[0].relation, "sister");
    EXPECT_EQ(gallery.entries()[0].embedding, (std::vector<float>{0.1f, 0.2f, 0.3f}));
    EXPECT_EQ(gallery.entries()[1].name, "Ravi");
    EXPECT_EQ(gallery.entries()[1].relation, "");
    EXPECT_EQ(gallery.entries()[2].name, "Asha");
    EXPECT_EQ(gallery.path(), path);
}

TEST(IdentityGallery, MissingFileIsEmpty) {
    IdentityGallery gallery;
    EXPECT_EQ(gallery.load(fresh_db("does_not_exist.db")), 0u);
    EXPECT_TRUE(gallery.empty());
}

TEST(IdentityGallery, FileWithoutTablesIsEmpty) {
    const std::string path = fresh_db("empty.db");
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    exec(db, "CREATE TABLE unrelated(x INTEGER)");
    sqlite3_close(db);

    IdentityGallery gallery(path);
    EXPECT_TRUE(gallery.empty());
}

TEST(IdentityGallery, ReloadReplacesEntries) {
    IdentityGallery gallery;
    gallery.add(KnownIdentity{"Temp", "", {1.0f}});
    EXPECT_EQ(gallery.reload(), 0u);
    EXPECT_TRUE(gallery.empty());
}
