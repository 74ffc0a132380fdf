#include "persistence/ledger_store.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

namespace crossarb {

JsonFileLedgerStore::JsonFileLedgerStore(const Config& config)
    : config_(config)
{
    auto dir = std::filesystem::path(config_.path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            spdlog::warn("Could not create ledger directory {}: {}", dir.string(), ec.message());
        }
    }
    spdlog::info("JsonFileLedgerStore initialized: path={}, max_backups={}",
                 config_.path, config_.max_backups);
}

std::optional<Ledger> JsonFileLedgerStore::load() {
    bool primary_exists = std::filesystem::exists(config_.path);

    auto ledger = read_file(config_.path);
    if (!ledger) {
        for (const auto& backup : list_backups()) {
            ledger = read_file(backup);
            if (ledger) {
                spdlog::warn("Loaded ledger from backup: {}", backup);
                break;
            }
        }
    } else {
        spdlog::info("Loaded ledger from {}", config_.path);
    }

    if (!ledger) {
        if (primary_exists) {
            throw std::runtime_error("Ledger file " + config_.path +
                                     " is corrupt and no valid backup exists");
        }
        return std::nullopt;
    }

    // Older files lack daily counters
    if (ledger->daily.reset_date.empty()) {
        ledger->daily.reset_date = time_utils::utc_date(wall_now());
    }
    return ledger;
}

bool JsonFileLedgerStore::save(const Ledger& ledger) {
    if (std::filesystem::exists(config_.path) && config_.max_backups > 0) {
        rotate_backups();
        std::error_code ec;
        std::filesystem::copy_file(config_.path, backup_path(0),
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::warn("Ledger backup failed: {}", ec.message());
        }
    }

    return write_atomic(config_.path, ledger);
}

std::vector<std::string> JsonFileLedgerStore::list_backups() const {
    std::vector<std::string> backups;

    for (int i = 0; i < config_.max_backups; ++i) {
        std::string path = backup_path(i);
        if (std::filesystem::exists(path)) {
            backups.push_back(path);
        }
    }

    // Index 0 is always the newest
    return backups;
}

std::string JsonFileLedgerStore::backup_path(int index) const {
    return config_.path + ".bak" + std::to_string(index);
}

bool JsonFileLedgerStore::write_atomic(const std::string& path, const Ledger& ledger) {
    try {
        std::string temp = path + ".tmp";

        std::ofstream file(temp);
        if (!file) {
            spdlog::error("Failed to open temp file: {}", temp);
            return false;
        }

        nlohmann::json j = ledger;
        file << std::setw(2) << j;
        file.close();

        if (!file) {
            spdlog::error("Failed to write to temp file: {}", temp);
            return false;
        }

        std::filesystem::rename(temp, path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Ledger write failed: {}", e.what());
        return false;
    }
}

std::optional<Ledger> JsonFileLedgerStore::read_file(const std::string& path) const {
    try {
        if (!std::filesystem::exists(path)) {
            return std::nullopt;
        }

        std::ifstream file(path);
        if (!file) {
            spdlog::error("Failed to open ledger file: {}", path);
            return std::nullopt;
        }

        nlohmann::json j;
        file >> j;

        Ledger ledger = j.get<Ledger>();
        if (!ledger.is_valid()) {
            spdlog::warn("Invalid ledger file {}: {}", path, ledger.validation_error());
            return std::nullopt;
        }
        return ledger;

    } catch (const std::exception& e) {
        spdlog::error("Failed to read ledger file {}: {}", path, e.what());
        return std::nullopt;
    }
}

void JsonFileLedgerStore::rotate_backups() {
    for (int i = config_.max_backups - 1; i > 0; --i) {
        std::string from = backup_path(i - 1);
        std::string to = backup_path(i);

        std::error_code ec;
        if (std::filesystem::exists(from)) {
            std::filesystem::rename(from, to, ec);
            if (ec) {
                spdlog::warn("Backup rotation {} -> {} failed: {}", from, to, ec.message());
            }
        }
    }
}

} // namespace crossarb
