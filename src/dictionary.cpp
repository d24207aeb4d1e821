#include "dictionary.hpp"

#include <algorithm>
#include <utility>

namespace voxpipe {

const char* entry_status_name(EntryStatus status) {
    switch (status) {
        case EntryStatus::Active: return "active";
        case EntryStatus::Draft: return "draft";
        default: return "unknown";
    }
}

std::string apply_replacements(const std::string& text, std::vector<WordEntry>& entries) {
    // Active entries with a non-empty surface, longest first
    std::vector<WordEntry*> active;
    for (auto& entry : entries) {
        if (entry.status == EntryStatus::Active && !entry.surface.empty()) {
            active.push_back(&entry);
        }
    }
    if (active.empty()) return text;

    std::stable_sort(active.begin(), active.end(), [](const WordEntry* a, const WordEntry* b) {
        return a->surface.size() > b->surface.size();
    });

    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        WordEntry* match = nullptr;
        for (WordEntry* entry : active) {
            if (text.compare(i, entry->surface.size(), entry->surface) == 0) {
                match = entry;
                break;
            }
        }

        if (match) {
            out += match->replacement;
            i += match->surface.size();
            ++match->hit;
        } else {
            out.push_back(text[i]);
            ++i;
        }
    }

    return out;
}

Status DictRepository::upsert(const WordEntry& entry) {
    std::vector<WordEntry> list;
    Status status = load(list);
    if (!status.success) return status;

    auto it = std::find_if(list.begin(), list.end(),
                           [&entry](const WordEntry& e) { return e.surface == entry.surface; });
    if (it != list.end()) {
        *it = entry;
    } else {
        list.push_back(entry);
    }
    return save(list);
}

Status DictRepository::remove(const std::string& surface, bool& removed) {
    removed = false;
    std::vector<WordEntry> list;
    Status status = load(list);
    if (!status.success) return status;

    const size_t before = list.size();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&surface](const WordEntry& e) { return e.surface == surface; }),
               list.end());
    removed = list.size() != before;

    return removed ? save(list) : Status::ok();
}

InMemoryDictRepository::InMemoryDictRepository(std::vector<WordEntry> entries)
    : entries_(std::move(entries)) {
}

Status InMemoryDictRepository::load(std::vector<WordEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries = entries_;
    return Status::ok();
}

Status InMemoryDictRepository::save(const std::vector<WordEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = entries;
    return Status::ok();
}

std::vector<WordEntry> InMemoryDictRepository::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

} // namespace voxpipe
