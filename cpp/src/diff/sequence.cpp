// ==============================================================================
// sequence.cpp - Порядок записей по строкам исходных документов
// ==============================================================================

#include <jsondiff/diff.hpp>

#include <algorithm>
#include <limits>

namespace jsondiff::diff {

namespace {

// Ключ сортировки: min(left_line, right_line), отсутствие строки = +inf
std::size_t sort_key(const DiffEntry& entry) {
    std::size_t key = std::numeric_limits<std::size_t>::max();
    if (entry.left_line.has_value()) {
        key = std::min(key, *entry.left_line);
    }
    if (entry.right_line.has_value()) {
        key = std::min(key, *entry.right_line);
    }
    return key;
}

}  // namespace

std::vector<DiffEntry> sequence(std::vector<DiffEntry> entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const DiffEntry& a, const DiffEntry& b) {
        return sort_key(a) < sort_key(b);
    });
    return entries;
}

}  // namespace jsondiff::diff
