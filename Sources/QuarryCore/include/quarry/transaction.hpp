#pragma once

#ifdef __cplusplus

#include <memory>
#include <optional>
#include <string>

namespace quarry {

/// Transaction handle of one session. Implementations report store failures as db_error.
class transaction {
public:
    virtual ~transaction() = default;

    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual void close() = 0;

    /// Seconds left for statements run inside this transaction, if bounded.
    virtual std::optional<int> timeout() const = 0;
};

class transaction_factory {
public:
    virtual ~transaction_factory() = default;

    virtual std::unique_ptr<transaction> new_transaction(const std::string& database_path, bool auto_commit) = 0;
};

} // namespace quarry

#endif // __cplusplus
