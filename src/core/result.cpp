#include <aasx_kg/core/result.hpp>

#include <iomanip>
#include <sstream>

namespace aasx_kg {

namespace {

// Read the JSON string value that follows `"key":` starting at `from`.
// core/ stays free of the JSON library, so this is a small scanner that
// understands the escapes a store error message can carry.
std::optional<std::string> ScanJsonString(const std::string& body,
                                          const std::string& key,
                                          size_t from = 0) {
    const std::string needle = "\"" + key + "\"";
    auto pos = body.find(needle, from);
    if (pos == std::string::npos) return std::nullopt;
    pos = body.find(':', pos + needle.size());
    if (pos == std::string::npos) return std::nullopt;
    pos = body.find('"', pos + 1);
    if (pos == std::string::npos) return std::nullopt;

    std::string value;
    for (size_t i = pos + 1; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '"') {
            return value;
        }
        if (c == '\\' && i + 1 < body.size()) {
            const char next = body[++i];
            switch (next) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                default:  value += next; break;
            }
            continue;
        }
        value += c;
    }
    return std::nullopt;
}

// Neo4j reports failures as {"errors":[{"code":"Neo...","message":"..."}]}.
std::optional<std::string> ExtractStoreError(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto errors_pos = body.find("\"errors\"");
    if (errors_pos == std::string::npos) return std::nullopt;

    auto message = ScanJsonString(body, "message", errors_pos);
    if (!message.has_value() || message->empty()) return std::nullopt;
    auto code = ScanJsonString(body, "code", errors_pos);
    if (code.has_value() && !code->empty()) {
        return *code + ": " + *message;
    }
    return message;
}

std::string JsonEscape(const std::string& s) {
    std::ostringstream out;
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}

} // anonymous namespace

std::string CategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NotFound:                return "not_found";
        case ErrorCategory::InvalidContainerFormat:  return "invalid_container_format";
        case ErrorCategory::EntryParseFailure:       return "entry_parse_failure";
        case ErrorCategory::SchemaMismatch:          return "schema_mismatch";
        case ErrorCategory::ImportValidationFailure: return "import_validation_failure";
        case ErrorCategory::ConnectionFailure:       return "connection_failure";
        case ErrorCategory::Authentication:          return "authentication";
        case ErrorCategory::QueryExecutionFailure:   return "query_execution_failure";
        case ErrorCategory::Configuration:           return "configuration";
        case ErrorCategory::Internal:                return "internal";
    }
    return "internal";
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::ConnectionFailure:       return 1;
        case ErrorCategory::Authentication:          return 1;
        case ErrorCategory::NotFound:                return 2;
        case ErrorCategory::InvalidContainerFormat:  return 3;
        case ErrorCategory::EntryParseFailure:       return 3;
        case ErrorCategory::SchemaMismatch:          return 3;
        case ErrorCategory::ImportValidationFailure: return 4;
        case ErrorCategory::QueryExecutionFailure:   return 5;
        case ErrorCategory::Configuration:           return 6;
        case ErrorCategory::Internal:                return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    return aasx_kg::CategoryName(category);
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (store_error.has_value() && !store_error->empty()) {
        oss << " (store: " << *store_error << ")";
    }
    if (query.has_value() && !query->empty()) {
        oss << "\n  query: " << *query;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":")" << CategoryName() << R"(",)";
    oss << R"("operation":")" << JsonEscape(operation) << R"(",)";
    if (!target.empty()) {
        oss << R"("target":")" << JsonEscape(target) << R"(",)";
    }
    if (http_status.has_value()) {
        oss << R"("http_status":)" << *http_status << ",";
    }
    oss << R"("message":")" << JsonEscape(message) << R"(",)";
    if (store_error.has_value() && !store_error->empty()) {
        oss << R"("store_error":")" << JsonEscape(*store_error) << R"(",)";
    }
    if (query.has_value()) {
        oss << R"("query":")" << JsonEscape(*query) << R"(",)";
    }
    oss << R"("exit_code":)" << ExitCode();
    oss << "}}";
    return oss.str();
}

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto store_error = ExtractStoreError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::QueryExecutionFailure;
            message = store_error.has_value()
                ? "Statement rejected: " + *store_error
                : "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed, check the store user and password";
            break;
        case 403:
            category = ErrorCategory::Authentication;
            message = "Forbidden, the store user lacks the required privileges";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found, check the database name";
            break;
        case 408:
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::ConnectionFailure;
            message = "Graph store unavailable";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, store_error, category};
}

} // namespace aasx_kg
