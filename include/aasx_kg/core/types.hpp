#pragma once

#include <aasx_kg/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// GraphIdentifier — a node label or relationship type that is safe to splice
// into a Cypher statement. Cypher cannot parametrise labels, so every label
// reaching a query template goes through this type first.
//
// Rules:
//   - 1 to 64 characters
//   - ASCII letter or underscore first, then letters, digits, underscores
// ---------------------------------------------------------------------------
class GraphIdentifier {
public:
    static Result<GraphIdentifier, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    /// Backtick-quoted form for use inside a statement.
    [[nodiscard]] std::string Quoted() const { return "`" + value_ + "`"; }

    bool operator==(const GraphIdentifier& other) const { return value_ == other.value_; }
    bool operator!=(const GraphIdentifier& other) const { return value_ != other.value_; }
    bool operator<(const GraphIdentifier& other) const { return value_ < other.value_; }

private:
    explicit GraphIdentifier(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// StoreUri — graph-store HTTP endpoint, e.g. "http://localhost:7474".
// Scheme must be http or https; a missing port defaults to 7474 / 7473.
// ---------------------------------------------------------------------------
class StoreUri {
public:
    static Result<StoreUri, std::string> Create(std::string_view uri);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    [[nodiscard]] bool UseHttps() const noexcept { return scheme_ == "https"; }

    /// "scheme://host:port" without trailing path.
    [[nodiscard]] std::string BaseUrl() const;

    bool operator==(const StoreUri& other) const { return value_ == other.value_; }
    bool operator!=(const StoreUri& other) const { return value_ != other.value_; }

private:
    StoreUri(std::string value, std::string scheme, std::string host, uint16_t port)
        : value_(std::move(value)), scheme_(std::move(scheme)),
          host_(std::move(host)), port_(port) {}
    std::string value_;
    std::string scheme_;
    std::string host_;
    uint16_t port_ = 0;
};

// ---------------------------------------------------------------------------
// DatabaseName — Neo4j database name: 3-63 chars, starts with a letter,
// then ASCII letters, digits, dots and dashes.
// ---------------------------------------------------------------------------
class DatabaseName {
public:
    static Result<DatabaseName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const DatabaseName& other) const { return value_ == other.value_; }
    bool operator!=(const DatabaseName& other) const { return value_ != other.value_; }

private:
    explicit DatabaseName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// HopCount — path length bound for neighbourhood queries (1..kMax).
// Inlined into the statement text, hence the tight range.
// ---------------------------------------------------------------------------
class HopCount {
public:
    static constexpr int kMax = 10;

    static Result<HopCount, std::string> Create(int hops);

    [[nodiscard]] int Value() const noexcept { return value_; }

private:
    explicit HopCount(int value) : value_(value) {}
    int value_;
};

} // namespace aasx_kg
