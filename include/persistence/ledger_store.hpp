#pragma once

#include <string>
#include <vector>
#include <optional>
#include "persistence/ledger.hpp"

namespace crossarb {

/**
 * Persistence port for the Ledger. The whole ledger is read at startup and
 * rewritten on every mutation.
 */
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    // nullopt when no ledger has been persisted yet.
    // Throws std::runtime_error if persisted state exists but is unreadable.
    virtual std::optional<Ledger> load() = 0;

    // Returns false on failure; never throws
    virtual bool save(const Ledger& ledger) = 0;
};

/**
 * JSON file store.
 *
 * - Writes via temp file + rename
 * - Keeps a rotating set of backups of the previous primary file
 * - Loads the primary, falling back to the newest valid backup
 */
class JsonFileLedgerStore : public LedgerStore {
public:
    struct Config {
        std::string path{"./data/ledger.json"};
        int max_backups{5};
    };

    explicit JsonFileLedgerStore(const Config& config);

    std::optional<Ledger> load() override;
    bool save(const Ledger& ledger) override;

    std::vector<std::string> list_backups() const;
    const std::string& path() const { return config_.path; }

private:
    Config config_;

    std::string backup_path(int index) const;
    bool write_atomic(const std::string& path, const Ledger& ledger);
    std::optional<Ledger> read_file(const std::string& path) const;
    void rotate_backups();
};

} // namespace crossarb
