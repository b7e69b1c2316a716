#include <aasx_kg/store/neo4j_store.hpp>

#include <aasx_kg/core/log.hpp>

#include <httplib.h>

namespace aasx_kg {

namespace {

using json = nlohmann::json;

constexpr const char* kComponent = "store";

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Success:
            return ErrorCategory::Internal;
        default:
            // Refused connections, DNS failures and timeouts all mean the
            // store is not reachable right now.
            return ErrorCategory::ConnectionFailure;
    }
}

json BuildRequestBody(const std::vector<CypherStatement>& statements) {
    json list = json::array();
    for (const auto& s : statements) {
        list.push_back({{"statement", s.text},
                        {"parameters", s.parameters},
                        {"includeStats", true}});
    }
    return json{{"statements", list}};
}

QueryStats ParseStats(const json& stats) {
    QueryStats out;
    if (!stats.is_object()) {
        return out;
    }
    out.contains_updates = stats.value("contains_updates", false);
    out.nodes_created = stats.value("nodes_created", 0);
    out.nodes_deleted = stats.value("nodes_deleted", 0);
    out.relationships_created = stats.value("relationships_created", 0);
    out.relationships_deleted = stats.value("relationship_deleted", 0);
    out.properties_set = stats.value("properties_set", 0);
    out.labels_added = stats.value("labels_added", 0);
    out.indexes_added = stats.value("indexes_added", 0);
    out.constraints_added = stats.value("constraints_added", 0);
    return out;
}

QueryResult ParseResult(const json& result) {
    QueryResult out;
    if (auto cols = result.find("columns"); cols != result.end() && cols->is_array()) {
        for (const auto& c : *cols) {
            out.columns.push_back(c.is_string() ? c.get<std::string>() : c.dump());
        }
    }
    if (auto data = result.find("data"); data != result.end() && data->is_array()) {
        for (const auto& record : *data) {
            auto row = record.find("row");
            if (row == record.end() || !row->is_array()) {
                continue;
            }
            out.rows.emplace_back(row->begin(), row->end());
        }
    }
    if (auto stats = result.find("stats"); stats != result.end()) {
        out.stats = ParseStats(*stats);
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct Neo4jHttpStore::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string base_url;
    std::string commit_path;

    Impl(const StoreUri& uri,
         const DatabaseName& database,
         const std::string& user,
         const std::string& password,
         const Neo4jStoreOptions& options)
        : base_url(uri.BaseUrl()),
          commit_path("/db/" + database.Value() + "/tx/commit") {
        client = std::make_unique<httplib::Client>(base_url);
        client->set_basic_auth(user, password);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
    }

    Result<std::vector<QueryResult>, Error> Commit(
        const std::string& operation,
        const std::vector<CypherStatement>& statements,
        bool read_only) {
        using CommitResult = Result<std::vector<QueryResult>, Error>;

        httplib::Headers hdrs{{"Accept", "application/json;charset=UTF-8"}};
        if (read_only) {
            hdrs.emplace("access-mode", "READ");
        }
        for (const auto& s : statements) {
            LogDebug(kComponent, "  > " + s.text);
        }

        LogInfo(kComponent, "POST " + commit_path + " (" +
                                std::to_string(statements.size()) + " statements)");
        auto res = client->Post(commit_path, hdrs, BuildRequestBody(statements).dump(),
                                "application/json");
        if (!res) {
            const auto http_error = res.error();
            return CommitResult::Err(Error{
                operation, base_url + commit_path, std::nullopt,
                "HTTP request failed: " + httplib::to_string(http_error),
                std::nullopt, CategoryFromHttpTransportError(http_error)});
        }
        LogInfo(kComponent, "  < " + std::to_string(res->status));
        if (res->status != 200 && res->status != 201) {
            auto error = Error::FromHttpStatus(operation, base_url + commit_path,
                                               res->status, res->body);
            if (res->status == 400 && !statements.empty()) {
                error.query = statements.front().text;
            }
            return CommitResult::Err(std::move(error));
        }

        json body;
        try {
            body = json::parse(res->body);
        } catch (const json::parse_error& e) {
            return CommitResult::Err(Error{
                operation, base_url + commit_path, res->status,
                std::string("Malformed store response: ") + e.what(),
                std::nullopt, ErrorCategory::Internal});
        }

        const auto& results = body.contains("results") && body["results"].is_array()
            ? body["results"]
            : json::array();

        if (auto errors = body.find("errors");
            errors != body.end() && errors->is_array() && !errors->empty()) {
            const auto& first = (*errors)[0];
            const auto code = first.value("code", std::string{});
            const auto message = first.value("message", std::string{"unknown store error"});
            LogDebug(kComponent, "  < error: " + code + ": " + message);

            ErrorCategory category = read_only ? ErrorCategory::QueryExecutionFailure
                                               : ErrorCategory::Internal;
            if (code.find(".Security.") != std::string::npos) {
                category = ErrorCategory::Authentication;
            }
            Error error{operation, base_url + commit_path, res->status, message,
                        code.empty() ? std::nullopt : std::optional<std::string>(code),
                        category};
            // The store stops at the failing statement, so its index is the
            // number of results that came back.
            const size_t failed = results.size();
            if (failed < statements.size()) {
                error.query = statements[failed].text;
            }
            return CommitResult::Err(std::move(error));
        }

        std::vector<QueryResult> out;
        out.reserve(results.size());
        for (const auto& r : results) {
            out.push_back(ParseResult(r));
        }
        return CommitResult::Ok(std::move(out));
    }
};

Neo4jHttpStore::Neo4jHttpStore(const StoreUri& uri,
                               const DatabaseName& database,
                               const std::string& user,
                               const std::string& password,
                               const Neo4jStoreOptions& options)
    : impl_(std::make_unique<Impl>(uri, database, user, password, options)) {}

Neo4jHttpStore::~Neo4jHttpStore() = default;

Result<void, Error> Neo4jHttpStore::Ping() {
    auto result = impl_->Commit("Ping", {}, true);
    if (result.IsErr()) {
        return Result<void, Error>::Err(std::move(result).Error());
    }
    return Result<void, Error>::Ok();
}

Result<std::vector<QueryResult>, Error> Neo4jHttpStore::ExecuteWrite(
    const std::vector<CypherStatement>& statements) {
    return impl_->Commit("ExecuteWrite", statements, false);
}

Result<std::vector<QueryResult>, Error> Neo4jHttpStore::ExecuteRead(
    const std::vector<CypherStatement>& statements) {
    return impl_->Commit("ExecuteRead", statements, true);
}

std::string Neo4jHttpStore::Endpoint() const {
    return impl_->base_url + impl_->commit_path;
}

} // namespace aasx_kg
