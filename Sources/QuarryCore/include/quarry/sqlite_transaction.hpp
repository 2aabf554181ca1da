#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "transaction.hpp"
#include <memory>
#include <optional>
#include <string>

namespace quarry {

/// Transaction over one SQLite connection. The connection is opened on first
/// use; outside auto-commit mode a transaction is begun lazily as well.
class sqlite_transaction : public transaction {
public:
    sqlite_transaction(std::string database_path, bool auto_commit, std::optional<int> timeout = std::nullopt);

    /// Adopts an open connection.
    sqlite_transaction(std::unique_ptr<database> db, bool auto_commit, std::optional<int> timeout = std::nullopt);

    ~sqlite_transaction() override;

    /// The connection, opened (and a transaction begun) if needed.
    database& connection();

    void commit() override;
    void rollback() override;
    void close() override;
    std::optional<int> timeout() const override { return timeout_; }

    bool is_auto_commit() const { return auto_commit_; }
    bool is_connected() const { return db_ != nullptr; }

private:
    std::string path_;
    std::unique_ptr<database> db_;
    bool auto_commit_;
    std::optional<int> timeout_;
};

class sqlite_transaction_factory : public transaction_factory {
public:
    explicit sqlite_transaction_factory(std::optional<int> timeout = std::nullopt) : timeout_(timeout) {}

    std::unique_ptr<transaction> new_transaction(const std::string& database_path, bool auto_commit) override;

private:
    std::optional<int> timeout_;
};

} // namespace quarry

#endif // __cplusplus
