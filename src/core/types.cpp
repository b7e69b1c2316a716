#include <aasx_kg/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace aasx_kg {

namespace {

bool IsAsciiLetter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool IsAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// GraphIdentifier
// ---------------------------------------------------------------------------
Result<GraphIdentifier, std::string> GraphIdentifier::Create(std::string_view name) {
    if (name.empty()) {
        return Result<GraphIdentifier, std::string>::Err(
            "Graph identifier must not be empty");
    }
    if (name.size() > 64) {
        return Result<GraphIdentifier, std::string>::Err(
            "Graph identifier must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!IsAsciiLetter(name[0]) && name[0] != '_') {
        return Result<GraphIdentifier, std::string>::Err(
            "Graph identifier must start with a letter or underscore: " +
            std::string(name));
    }
    const bool valid = std::all_of(name.begin(), name.end(), [](char c) {
        return IsAsciiLetter(c) || IsAsciiDigit(c) || c == '_';
    });
    if (!valid) {
        return Result<GraphIdentifier, std::string>::Err(
            "Graph identifier may contain only letters, digits and underscores: " +
            std::string(name));
    }
    return Result<GraphIdentifier, std::string>::Ok(GraphIdentifier(std::string(name)));
}

// ---------------------------------------------------------------------------
// StoreUri
// ---------------------------------------------------------------------------
Result<StoreUri, std::string> StoreUri::Create(std::string_view uri) {
    if (uri.empty()) {
        return Result<StoreUri, std::string>::Err("Store URI must not be empty");
    }

    auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<StoreUri, std::string>::Err(
            "Store URI must start with http:// or https://");
    }
    auto scheme = ToLower(uri.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return Result<StoreUri, std::string>::Err(
            "Unsupported store URI scheme '" + scheme + "', expected http or https");
    }

    auto rest = uri.substr(scheme_end + 3);
    auto slash = rest.find('/');
    if (slash != std::string_view::npos) {
        if (rest.substr(slash) != "/") {
            return Result<StoreUri, std::string>::Err(
                "Store URI must not contain a path");
        }
        rest = rest.substr(0, slash);
    }
    if (rest.empty()) {
        return Result<StoreUri, std::string>::Err("Store URI host must not be empty");
    }

    std::string host(rest);
    uint16_t port = scheme == "https" ? 7473 : 7474;
    auto colon = rest.rfind(':');
    if (colon != std::string_view::npos) {
        host = std::string(rest.substr(0, colon));
        auto port_str = rest.substr(colon + 1);
        if (port_str.empty() ||
            !std::all_of(port_str.begin(), port_str.end(), IsAsciiDigit) ||
            port_str.size() > 5) {
            return Result<StoreUri, std::string>::Err(
                "Invalid port in store URI: " + std::string(port_str));
        }
        const auto value = std::stoul(std::string(port_str));
        if (value == 0 || value > std::numeric_limits<uint16_t>::max()) {
            return Result<StoreUri, std::string>::Err(
                "Port out of range in store URI: " + std::string(port_str));
        }
        port = static_cast<uint16_t>(value);
    }
    if (host.empty()) {
        return Result<StoreUri, std::string>::Err("Store URI host must not be empty");
    }

    return Result<StoreUri, std::string>::Ok(
        StoreUri(std::string(uri), std::move(scheme), std::move(host), port));
}

std::string StoreUri::BaseUrl() const {
    return scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

// ---------------------------------------------------------------------------
// DatabaseName
// ---------------------------------------------------------------------------
Result<DatabaseName, std::string> DatabaseName::Create(std::string_view name) {
    if (name.size() < 3 || name.size() > 63) {
        return Result<DatabaseName, std::string>::Err(
            "Database name must be 3 to 63 characters, got " +
            std::to_string(name.size()));
    }
    if (!IsAsciiLetter(name[0])) {
        return Result<DatabaseName, std::string>::Err(
            "Database name must start with a letter");
    }
    const bool valid = std::all_of(name.begin(), name.end(), [](char c) {
        return IsAsciiLetter(c) || IsAsciiDigit(c) || c == '.' || c == '-';
    });
    if (!valid) {
        return Result<DatabaseName, std::string>::Err(
            "Database name may contain only letters, digits, '.' and '-'");
    }
    return Result<DatabaseName, std::string>::Ok(DatabaseName(ToLower(name)));
}

// ---------------------------------------------------------------------------
// HopCount
// ---------------------------------------------------------------------------
Result<HopCount, std::string> HopCount::Create(int hops) {
    if (hops < 1 || hops > kMax) {
        return Result<HopCount, std::string>::Err(
            "Hop count must be between 1 and " + std::to_string(kMax) +
            ", got " + std::to_string(hops));
    }
    return Result<HopCount, std::string>::Ok(HopCount(hops));
}

} // namespace aasx_kg
