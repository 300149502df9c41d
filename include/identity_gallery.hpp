#pragma once

#include <string>
#include <vector>

namespace spex {

struct KnownIdentity {
    std::string name;
    std::string relation;          // empty when untagged
    std::vector<float> embedding;
};

// The set of known identities, one entry per training embedding. Loaded from
// the SQLite database the trainer writes:
//   people(person_id, name, relation)
//   embeddings(person_id, vec BLOB of float32)
// Loading never fails hard: a missing file or table leaves the gallery empty.
class IdentityGallery {
public:
    IdentityGallery() = default;
    explicit IdentityGallery(const std::string& path);

    // Returns the number of identities loaded (0 on any failure).
    size_t load(const std::string& path);
    size_t reload();

    void add(KnownIdentity identity);
    void clear();

    const std::vector<KnownIdentity>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::vector<KnownIdentity> entries_;
};

}  // namespace spex
