#include "identity_gallery.hpp"

#include <sqlite3.h>

#include <cstring>
#include <filesystem>
#include <iostream>

namespace spex {

IdentityGallery::IdentityGallery(const std::string& path) {
    load(path);
}

size_t IdentityGallery::load(const std::string& path) {
    path_ = path;
    entries_.clear();

    if (path.empty() || !std::filesystem::exists(path)) {
        std::cerr << "[WARN] No face gallery found at '" << path
                  << "'; every face will be reported as unknown." << std::endl;
        return 0;
    }

    sqlite3* db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::cerr << "[WARN] Cannot open face gallery: " << sqlite3_errmsg(db) << std::endl;
        sqlite3_close(db);
        return 0;
    }

    const char* sql = R"SQL(
        SELECT people.name, people.relation, embeddings.vec
        FROM embeddings
        JOIN people ON embeddings.person_id = people.person_id
        ORDER BY embeddings.rowid
        )SQL";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[WARN] Face gallery has no usable tables: " << sqlite3_errmsg(db) << std::endl;
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return 0;
    }

    int skipped = 0;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const char* relation_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const void* blob = sqlite3_column_blob(stmt, 2);
        const int blob_size = sqlite3_column_bytes(stmt, 2);

        if (!name_text || !blob || blob_size <= 0 || blob_size % static_cast<int>(sizeof(float)) != 0) {
            ++skipped;
            continue;
        }

        KnownIdentity identity;
        identity.name = name_text;
        identity.relation = relation_text ? relation_text : "";
        identity.embedding.resize(blob_size / sizeof(float));
        std::memcpy(identity.embedding.data(), blob, blob_size);
        entries_.push_back(std::move(identity));
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);

    if (skipped > 0) {
        std::cerr << "[WARN] Skipped " << skipped << " unreadable gallery rows" << std::endl;
    }
    std::cout << "[INFO] Loaded " << entries_.size() << " face embeddings from " << path << std::endl;
    return entries_.size();
}

size_t IdentityGallery::reload() {
    return load(path_);
}

void IdentityGallery::add(KnownIdentity identity) {
    entries_.push_back(std::move(identity));
}

void IdentityGallery::clear() {
    entries_.clear();
}

}  // namespace spex
