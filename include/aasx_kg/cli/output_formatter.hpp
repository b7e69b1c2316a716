#pragma once

#include <aasx_kg/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// DetailSection — a titled group of key/value pairs for PrintDetail.
// An empty title puts the entries at the root of the tree.
// ---------------------------------------------------------------------------
struct DetailSection {
    std::string title;
    std::vector<std::pair<std::string, std::string>> entries;
};

// ---------------------------------------------------------------------------
// OutputFormatter — human-readable and JSON output for CLI commands.
//
// When color_mode is true and json_mode is false, tables are rendered with
// FTXUI and messages carry ANSI escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // In JSON mode, outputs a JSON array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Key/value tree (database info, statistics, run summaries).
    void PrintDetail(const std::string& title,
                     const std::vector<DetailSection>& sections) const;

    void PrintJson(const nlohmann::json& value) const;

    void PrintError(const Error& error) const;

    // Recovered failures, one per line on stderr. Nothing in JSON mode:
    // there they are part of the command's JSON document.
    void PrintDiagnostics(const std::vector<Diagnostic>& diagnostics) const;

    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

/// Render a result cell for a plain table: strings unquoted, null empty,
/// everything else as compact JSON.
std::string CellToString(const nlohmann::json& cell);

} // namespace aasx_kg
