#pragma once

#include "mall/history/history_types.h"
#include "mall/core/constants.h"

#include <cstddef>
#include <string>
#include <vector>

namespace mall {

class HistoryManager {
public:
    // Throws std::invalid_argument when maxEntries is 0.
    explicit HistoryManager(std::size_t maxEntries = kDefaultHistoryLength);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Restore the "before" (undo) or "after" (redo) snapshot into project.
    // Returns false when there is nothing to apply.
    bool undo(MallProject& project);
    bool redo(MallProject& project);

    // Transaction management. Only one transaction is open at a time;
    // beginEntry returns false while one is active.
    bool beginEntry(const std::string& label, const MallProject& before);
    void discardEntry();
    // Returns false (and records nothing) when after equals the captured state.
    bool commitEntry(const MallProject& after);

    void clear();
    bool isTransactionActive() const { return transaction_.active; }
    std::size_t getHistorySize() const noexcept { return history_.size(); }

    // Label of the entry undo() would revert, empty when none.
    const std::string& undoLabel() const;
    const std::string& redoLabel() const;

private:
    void pushHistoryEntry(HistoryEntry&& entry);
    void trimToCapacity();

    std::vector<HistoryEntry> history_;
    std::size_t cursor_ = 0;
    std::size_t maxEntries_;
    HistoryTransaction transaction_;
};

} // namespace mall
