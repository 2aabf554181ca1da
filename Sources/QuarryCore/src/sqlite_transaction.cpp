#include "quarry/sqlite_transaction.hpp"
#include "quarry/log.hpp"

namespace quarry {

sqlite_transaction::sqlite_transaction(std::string database_path, bool auto_commit, std::optional<int> timeout)
    : path_(std::move(database_path)), auto_commit_(auto_commit), timeout_(timeout) {}

sqlite_transaction::sqlite_transaction(std::unique_ptr<database> db, bool auto_commit, std::optional<int> timeout)
    : path_(db ? db->path() : std::string()), db_(std::move(db)), auto_commit_(auto_commit), timeout_(timeout) {}

sqlite_transaction::~sqlite_transaction() {
    try {
        close();
    } catch (const db_error& e) {
        LOG_WARN("tx", "Failed to close connection to %s: %s", path_.c_str(), e.what());
    }
}

database& sqlite_transaction::connection() {
    if (!db_) {
        LOG_DEBUG("tx", "Opening connection to %s", path_.c_str());
        db_ = std::make_unique<database>(path_);
    }
    if (!auto_commit_ && !db_->is_in_transaction()) {
        db_->begin_transaction();
    }
    return *db_;
}

void sqlite_transaction::commit() {
    if (db_ && !auto_commit_ && db_->is_in_transaction()) {
        LOG_DEBUG("tx", "Committing %s", path_.c_str());
        db_->commit();
    }
}

void sqlite_transaction::rollback() {
    if (db_ && !auto_commit_ && db_->is_in_transaction()) {
        LOG_DEBUG("tx", "Rolling back %s", path_.c_str());
        db_->rollback();
    }
}

void sqlite_transaction::close() {
    if (!db_) {
        return;
    }
    // Release the connection even if the dangling transaction cannot be rolled back.
    std::unique_ptr<database> db = std::move(db_);
    if (db->is_in_transaction()) {
        db->rollback();
    }
}

std::unique_ptr<transaction> sqlite_transaction_factory::new_transaction(const std::string& database_path,
                                                                         bool auto_commit) {
    return std::make_unique<sqlite_transaction>(database_path, auto_commit, timeout_);
}

} // namespace quarry
