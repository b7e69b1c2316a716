#pragma once

#include <aasx_kg/core/types.hpp>
#include <aasx_kg/store/i_graph_store.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// Neo4jStoreOptions — transport settings for the HTTP store.
// ---------------------------------------------------------------------------
struct Neo4jStoreOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
};

// ---------------------------------------------------------------------------
// Neo4jHttpStore — IGraphStore over the Neo4j HTTP transactional API.
//
// Every call posts to /db/<database>/tx/commit with Basic auth, so each
// Execute* is a single auto-committed transaction. Read calls add the
// `access-mode: READ` header. An `errors[]` entry in the response means the
// store rolled the transaction back.
//
// Uses pimpl to keep httplib out of the public header.
// ---------------------------------------------------------------------------
class Neo4jHttpStore : public IGraphStore {
public:
    Neo4jHttpStore(const StoreUri& uri,
                   const DatabaseName& database,
                   const std::string& user,
                   const std::string& password,
                   const Neo4jStoreOptions& options = {});

    ~Neo4jHttpStore() override;

    Neo4jHttpStore(const Neo4jHttpStore&) = delete;
    Neo4jHttpStore& operator=(const Neo4jHttpStore&) = delete;
    Neo4jHttpStore(Neo4jHttpStore&&) = delete;
    Neo4jHttpStore& operator=(Neo4jHttpStore&&) = delete;

    [[nodiscard]] Result<void, Error> Ping() override;

    [[nodiscard]] Result<std::vector<QueryResult>, Error> ExecuteWrite(
        const std::vector<CypherStatement>& statements) override;

    [[nodiscard]] Result<std::vector<QueryResult>, Error> ExecuteRead(
        const std::vector<CypherStatement>& statements) override;

    [[nodiscard]] std::string Endpoint() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aasx_kg
