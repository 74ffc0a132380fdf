#pragma once

#include <optional>
#include "persistence/ledger_store.hpp"

namespace crossarb {

class InMemoryLedgerStore : public LedgerStore {
public:
    std::optional<Ledger> load() override { return stored_; }

    bool save(const Ledger& ledger) override {
        save_calls_++;
        if (failures_remaining_ > 0) {
            failures_remaining_--;
            return false;
        }
        stored_ = ledger;
        return true;
    }

    void fail_next_saves(int n) { failures_remaining_ = n; }

    int save_calls() const { return save_calls_; }
    const std::optional<Ledger>& stored() const { return stored_; }

private:
    std::optional<Ledger> stored_;
    int failures_remaining_{0};
    int save_calls_{0};
};

} // namespace crossarb
