#include <aasx_kg/cli/output_formatter.hpp>
#include <aasx_kg/core/terminal.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace aasx_kg {

namespace {

using namespace aasx_kg::ansi;

} // anonymous namespace

std::string CellToString(const nlohmann::json& cell) {
    if (cell.is_null()) {
        return "";
    }
    if (cell.is_string()) {
        return cell.get<std::string>();
    }
    if (cell.is_number_float()) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << cell.get<double>();
        return ss.str();
    }
    return cell.dump();
}

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << array.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            auto padded = row;
            padded.resize(headers.size());
            table_data.push_back(std::move(padded));
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    // Plain table: compute column widths.
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c]))
             << headers[c];
    }
    out_ << "\n";

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c]))
                 << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<DetailSection>& sections) const {

    if (json_mode_) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& sec : sections) {
            auto& target = sec.title.empty() ? obj : obj[sec.title];
            if (!target.is_object()) {
                target = nlohmann::json::object();
            }
            for (const auto& [key, value] : sec.entries) {
                target[key] = value;
            }
        }
        out_ << obj.dump() << "\n";
        return;
    }

    const char* branch = color_mode_ ? "├── " : "|-- ";
    const char* last_branch = color_mode_ ? "└── " : "+-- ";

    // Root-level entries first, then one sub-tree per titled section.
    std::vector<std::pair<std::string, std::string>> root;
    std::vector<const DetailSection*> titled;
    for (const auto& sec : sections) {
        if (sec.title.empty()) {
            root.insert(root.end(), sec.entries.begin(), sec.entries.end());
        } else if (!sec.entries.empty()) {
            titled.push_back(&sec);
        }
    }

    auto dim = [&](const char* text) {
        if (color_mode_) {
            out_ << kDim << text << kReset;
        } else {
            out_ << text;
        }
    };

    out_ << (color_mode_ ? kBold : "") << title << (color_mode_ ? kReset : "") << "\n";
    const size_t total = root.size() + titled.size();
    size_t index = 0;
    for (const auto& [key, value] : root) {
        dim(++index == total ? last_branch : branch);
        out_ << key << ": " << value << "\n";
    }
    for (const auto* sec : titled) {
        const bool last_section = ++index == total;
        dim(last_section ? last_branch : branch);
        out_ << (color_mode_ ? kBold : "") << sec->title
             << (color_mode_ ? kReset : "") << "\n";
        for (size_t i = 0; i < sec->entries.size(); ++i) {
            out_ << (last_section ? "    " : (color_mode_ ? "│   " : "|   "));
            dim(i + 1 == sec->entries.size() ? last_branch : branch);
            out_ << sec->entries[i].first << ": " << sec->entries[i].second << "\n";
        }
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& value) const {
    out_ << value.dump(2) << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        err_ << kDim << " [" << error.CategoryName() << "]" << kReset;
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        if (!error.target.empty()) {
            err_ << "  " << kDim << "Target: " << kReset << error.target << "\n";
        }
        err_ << "  " << error.message << "\n";
        if (error.store_error.has_value() && !error.store_error->empty()) {
            err_ << "  " << kDim << "Store: " << kReset
                 << error.store_error.value() << "\n";
        }
        if (error.query.has_value() && !error.query->empty()) {
            err_ << "  " << kYellow << "Query: " << kReset
                 << error.query.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation << " [" << error.CategoryName() << "]";
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    if (!error.target.empty()) {
        err_ << "  Target: " << error.target << "\n";
    }
    err_ << "  " << error.message << "\n";
    if (error.store_error.has_value() && !error.store_error->empty()) {
        err_ << "  Store: " << error.store_error.value() << "\n";
    }
    if (error.query.has_value() && !error.query->empty()) {
        err_ << "  Query: " << error.query.value() << "\n";
    }
}

void OutputFormatter::PrintDiagnostics(const std::vector<Diagnostic>& diagnostics) const {
    if (json_mode_) {
        return;
    }
    for (const auto& d : diagnostics) {
        if (color_mode_) {
            err_ << kYellow << "warning" << kReset << kDim << " [" << CategoryName(d.category)
                 << "] " << kReset << d.target << ": " << d.message << "\n";
        } else {
            err_ << "warning [" << CategoryName(d.category) << "] " << d.target << ": "
                 << d.message << "\n";
        }
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace aasx_kg
