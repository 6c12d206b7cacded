#pragma once

#include "rhythmlink/edit/EditHistory.hpp"

#include <string>
#include <utility>

namespace rhythmlink::edit {

/// RAII wrapper for batch grouping
/// Usage:
///   EditTransaction txn(history, "Paste");
///   // ... record several batches ...
///   txn.commit();
class EditTransaction {
public:
    EditTransaction(EditHistory& history, std::string description) : history_(history), active_(true) {
        history_.beginGroup(std::move(description));
    }

    ~EditTransaction() {
        if (active_) {
            history_.endGroup();
        }
    }

    EditTransaction(const EditTransaction&) = delete;
    EditTransaction& operator=(const EditTransaction&) = delete;
    EditTransaction(EditTransaction&&) = delete;
    EditTransaction& operator=(EditTransaction&&) = delete;

    void commit() {
        if (active_) {
            history_.endGroup();
            active_ = false;
        }
    }

private:
    EditHistory& history_;
    bool active_;
};

}  // namespace rhythmlink::edit
