#include <catch2/catch_test_macros.hpp>

#include <aasx_kg/store/neo4j_store.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace aasx_kg;
using json = nlohmann::json;

// ===========================================================================
// A local httplib::Server standing in for the store's HTTP endpoint.
// ===========================================================================
namespace {

class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] int Port() const noexcept { return port_; }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

// What the server saw on its last request.
struct Captured {
    std::mutex mutex;
    std::string path;
    std::string authorization;
    std::string access_mode;
    json body;
};

std::unique_ptr<Neo4jHttpStore> MakeStore(int port) {
    auto uri = StoreUri::Create("http://127.0.0.1:" + std::to_string(port));
    REQUIRE(uri.IsOk());
    auto db = DatabaseName::Create("neo4j");
    REQUIRE(db.IsOk());
    Neo4jStoreOptions options;
    options.connect_timeout = std::chrono::seconds{2};
    options.read_timeout = std::chrono::seconds{2};
    return std::make_unique<Neo4jHttpStore>(uri.Value(), db.Value(), "neo4j", "secret",
                                            options);
}

void Serve(httplib::Server& svr, Captured& captured, int status, std::string response) {
    svr.Post("/db/neo4j/tx/commit", [&captured, status, response](
                                        const httplib::Request& req, httplib::Response& res) {
        {
            std::lock_guard<std::mutex> lock(captured.mutex);
            captured.path = req.path;
            captured.authorization = req.get_header_value("Authorization");
            captured.access_mode = req.get_header_value("access-mode");
            captured.body = json::parse(req.body, nullptr, false);
        }
        res.status = status;
        res.set_content(response, "application/json");
    });
}

} // anonymous namespace

// ===========================================================================
// Successful transactions
// ===========================================================================

TEST_CASE("Neo4jHttpStore: write posts statements and parses results", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 200, R"({
        "results": [{
            "columns": ["merged"],
            "data": [{"row": [2], "meta": [null]}],
            "stats": {"contains_updates": true, "nodes_created": 1, "properties_set": 6}
        }],
        "errors": []
    })");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    auto result = store->ExecuteWrite(
        {CypherStatement{"UNWIND $rows AS row RETURN count(row) AS merged",
                         json{{"rows", json::array({1, 2})}}}});
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().size() == 1);
    const auto& table = result.Value()[0];
    CHECK(table.columns == std::vector<std::string>{"merged"});
    REQUIRE(table.rows.size() == 1);
    CHECK(table.rows[0][0] == 2);
    CHECK(table.stats.contains_updates);
    CHECK(table.stats.nodes_created == 1);
    CHECK(table.stats.properties_set == 6);

    std::lock_guard<std::mutex> lock(captured.mutex);
    CHECK(captured.path == "/db/neo4j/tx/commit");
    // "neo4j:secret" in Base64.
    CHECK(captured.authorization == "Basic bmVvNGo6c2VjcmV0");
    CHECK(captured.access_mode.empty());
    REQUIRE(captured.body["statements"].size() == 1);
    CHECK(captured.body["statements"][0]["parameters"]["rows"].size() == 2);
    CHECK(captured.body["statements"][0]["includeStats"] == true);
}

TEST_CASE("Neo4jHttpStore: read transactions are marked read-only", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 200, R"({"results": [{"columns": ["n"], "data": []}], "errors": []})");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    auto result = store->ExecuteRead({CypherStatement{"MATCH (n) RETURN n"}});
    REQUIRE(result.IsOk());
    CHECK(result.Value()[0].rows.empty());

    std::lock_guard<std::mutex> lock(captured.mutex);
    CHECK(captured.access_mode == "READ");
}

TEST_CASE("Neo4jHttpStore: ping sends an empty transaction", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 200, R"({"results": [], "errors": []})");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    CHECK(store->Ping().IsOk());
    std::lock_guard<std::mutex> lock(captured.mutex);
    CHECK(captured.body["statements"].empty());
}

// ===========================================================================
// Failures
// ===========================================================================

TEST_CASE("Neo4jHttpStore: errors[] in a read is a query failure", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 200, R"({
        "results": [{"columns": ["a"], "data": []}],
        "errors": [{"code": "Neo.ClientError.Statement.SyntaxError",
                    "message": "Invalid input 'RETRN'"}]
    })");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    auto result = store->ExecuteRead(
        {CypherStatement{"MATCH (a) RETURN a"}, CypherStatement{"MATCH (b) RETRN b"}});
    REQUIRE(result.IsErr());
    const auto& error = result.Error();
    CHECK(error.category == ErrorCategory::QueryExecutionFailure);
    CHECK(error.store_error == "Neo.ClientError.Statement.SyntaxError");
    CHECK(error.message == "Invalid input 'RETRN'");
    // The second statement is the one that failed.
    CHECK(error.query == "MATCH (b) RETRN b");
    CHECK(error.ExitCode() == 5);
}

TEST_CASE("Neo4jHttpStore: errors[] in a write is internal", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 200, R"({
        "results": [],
        "errors": [{"code": "Neo.ClientError.Schema.ConstraintValidationFailed",
                    "message": "already exists"}]
    })");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    auto result = store->ExecuteWrite({CypherStatement{"CREATE (n:AasElement {id: 'x'})"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Internal);
    CHECK(result.Error().query == "CREATE (n:AasElement {id: 'x'})");
}

TEST_CASE("Neo4jHttpStore: security error code is an authentication failure", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 200, R"({
        "results": [],
        "errors": [{"code": "Neo.ClientError.Security.Forbidden", "message": "denied"}]
    })");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    auto result = store->ExecuteWrite({CypherStatement{"MATCH (n) DELETE n"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Authentication);
}

TEST_CASE("Neo4jHttpStore: HTTP 401 is an authentication failure", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 401, R"({"errors": [{"code": "Neo.ClientError.Security.Unauthorized",
                                             "message": "Invalid username or password."}]})");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    auto result = store->Ping();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Authentication);
    CHECK(result.Error().http_status == 401);
    CHECK(result.Error().operation == "Ping");
}

TEST_CASE("Neo4jHttpStore: HTTP 503 is a connection failure", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 503, "Service Unavailable");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    auto result = store->Ping();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ConnectionFailure);
}

TEST_CASE("Neo4jHttpStore: malformed response body", "[store][neo4j]") {
    httplib::Server svr;
    Captured captured;
    Serve(svr, captured, 200, "<html>proxy error</html>");
    LocalServer server(svr);
    auto store = MakeStore(server.Port());

    auto result = store->ExecuteRead({CypherStatement{"RETURN 1"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Internal);
    CHECK(result.Error().message.find("Malformed store response") != std::string::npos);
}

TEST_CASE("Neo4jHttpStore: refused connection", "[store][neo4j]") {
    int port = 0;
    {
        // Grab a free port, then release it so nothing listens there.
        httplib::Server svr;
        port = svr.bind_to_any_port("127.0.0.1");
    }
    auto store = MakeStore(port);
    auto result = store->Ping();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ConnectionFailure);
    CHECK(result.Error().ExitCode() == 1);
}

TEST_CASE("Neo4jHttpStore: endpoint names the commit URL", "[store][neo4j]") {
    auto store = MakeStore(7474);
    CHECK(store->Endpoint() == "http://127.0.0.1:7474/db/neo4j/tx/commit");
}
