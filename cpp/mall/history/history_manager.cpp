#include "mall/history/history_manager.h"
#include "mall/core/logging.h"

#include <stdexcept>
#include <utility>

namespace mall {

namespace {
    const std::string kEmptyLabel;
}

HistoryManager::HistoryManager(std::size_t maxEntries)
    : maxEntries_(maxEntries) {
    if (maxEntries_ == 0) {
        throw std::invalid_argument("HistoryManager: maxEntries must be positive");
    }
}

void HistoryManager::clear() {
    history_.clear();
    cursor_ = 0;
    transaction_.active = false;
    transaction_.entry = HistoryEntry{};
}

bool HistoryManager::canUndo() const noexcept {
    return cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return cursor_ < history_.size();
}

bool HistoryManager::beginEntry(const std::string& label, const MallProject& before) {
    if (transaction_.active) return false;
    transaction_.active = true;
    transaction_.entry = HistoryEntry{};
    transaction_.entry.label = label;
    transaction_.entry.before = before;
    return true;
}

void HistoryManager::discardEntry() {
    transaction_.active = false;
    transaction_.entry = HistoryEntry{};
}

bool HistoryManager::commitEntry(const MallProject& after) {
    if (!transaction_.active) return false;
    HistoryEntry entry = std::move(transaction_.entry);
    transaction_.active = false;
    transaction_.entry = HistoryEntry{};

    if (entry.before == after) {
        return false;
    }

    entry.after = after;
    pushHistoryEntry(std::move(entry));
    return true;
}

void HistoryManager::pushHistoryEntry(HistoryEntry&& entry) {
    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    history_.push_back(std::move(entry));
    trimToCapacity();
    cursor_ = history_.size();
}

void HistoryManager::trimToCapacity() {
    if (history_.size() <= maxEntries_) return;
    const std::size_t excess = history_.size() - maxEntries_;
    MALL_LOG_DEBUG("history: dropping %zu oldest entr%s (limit %zu)",
        excess, excess == 1 ? "y" : "ies", maxEntries_);
    history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(excess));
}

bool HistoryManager::undo(MallProject& project) {
    if (cursor_ == 0) return false;
    cursor_--;
    project = history_[cursor_].before;
    return true;
}

bool HistoryManager::redo(MallProject& project) {
    if (cursor_ >= history_.size()) return false;
    project = history_[cursor_].after;
    cursor_++;
    return true;
}

const std::string& HistoryManager::undoLabel() const {
    if (cursor_ == 0) return kEmptyLabel;
    return history_[cursor_ - 1].label;
}

const std::string& HistoryManager::redoLabel() const {
    if (cursor_ >= history_.size()) return kEmptyLabel;
    return history_[cursor_].label;
}

} // namespace mall
