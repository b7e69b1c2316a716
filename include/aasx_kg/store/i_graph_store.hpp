#pragma once

#include <aasx_kg/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// CypherStatement — one statement plus its parameters.
// ---------------------------------------------------------------------------
struct CypherStatement {
    std::string text;
    nlohmann::json parameters = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// QueryStats — update counters the store reports per statement.
// ---------------------------------------------------------------------------
struct QueryStats {
    bool contains_updates = false;
    int nodes_created = 0;
    int nodes_deleted = 0;
    int relationships_created = 0;
    int relationships_deleted = 0;
    int properties_set = 0;
    int labels_added = 0;
    int indexes_added = 0;
    int constraints_added = 0;
};

// ---------------------------------------------------------------------------
// QueryResult — tabular result of one statement.
// ---------------------------------------------------------------------------
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;
    QueryStats stats;
};

// ---------------------------------------------------------------------------
// IGraphStore — abstract property-graph store.
//
// The importer and the analytics layer depend on this interface rather than
// on a concrete HTTP client, so both can be tested offline with
// MockGraphStore.
//
// Each Execute* call is one transaction: all statements commit together or
// none do. Results come back one per statement, in order.
// ---------------------------------------------------------------------------
class IGraphStore {
public:
    virtual ~IGraphStore() = default;

    IGraphStore(const IGraphStore&) = delete;
    IGraphStore& operator=(const IGraphStore&) = delete;
    IGraphStore(IGraphStore&&) = delete;
    IGraphStore& operator=(IGraphStore&&) = delete;

    /// Succeeds when the store accepts an authenticated, empty transaction.
    [[nodiscard]] virtual Result<void, Error> Ping() = 0;

    [[nodiscard]] virtual Result<std::vector<QueryResult>, Error> ExecuteWrite(
        const std::vector<CypherStatement>& statements) = 0;

    /// Read-only transaction; the store rejects statements that write.
    [[nodiscard]] virtual Result<std::vector<QueryResult>, Error> ExecuteRead(
        const std::vector<CypherStatement>& statements) = 0;

    /// Human-readable endpoint for logs and error targets.
    [[nodiscard]] virtual std::string Endpoint() const = 0;

protected:
    IGraphStore() = default;
};

} // namespace aasx_kg
