#pragma once

#include "error.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace voxpipe {

enum class EntryStatus {
    Active,  // used for substitution
    Draft    // kept but ignored
};

const char* entry_status_name(EntryStatus status);

struct WordEntry {
    std::string surface;      // form as it appears in transcribed text
    std::string replacement;  // what it becomes
    uint32_t hit = 0;         // times it has been applied
    EntryStatus status = EntryStatus::Active;
};

// Single left-to-right pass. At each position the longest active surface
// that matches exactly (case-sensitive, byte-wise) is replaced and scanning
// resumes after it; replaced text is never rescanned. Each applied
// replacement bumps the entry's hit count.
std::string apply_replacements(const std::string& text, std::vector<WordEntry>& entries);

// Storage for dictionary entries. Persistence lives outside this library.
class DictRepository {
public:
    virtual ~DictRepository() = default;

    virtual Status load(std::vector<WordEntry>& entries) = 0;
    virtual Status save(const std::vector<WordEntry>& entries) = 0;

    // Insert, or replace the entry with the same surface
    virtual Status upsert(const WordEntry& entry);

    // Delete by surface; removed reports whether anything matched
    virtual Status remove(const std::string& surface, bool& removed);
};

class InMemoryDictRepository : public DictRepository {
public:
    InMemoryDictRepository() = default;
    explicit InMemoryDictRepository(std::vector<WordEntry> entries);

    Status load(std::vector<WordEntry>& entries) override;
    Status save(const std::vector<WordEntry>& entries) override;

    std::vector<WordEntry> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::vector<WordEntry> entries_;
};

} // namespace voxpipe
