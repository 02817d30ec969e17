#include <catalog_graph/cli/output_formatter.hpp>
#include <catalog_graph/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace catalog_graph {

namespace {

using namespace catalog_graph::ansi;

std::string Dump(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

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
        out_ << Dump(array) << "\n";
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

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < headers.size() && c < cells.size(); ++c) {
            if (c > 0) out_ << "  ";
            // No trailing padding on the last column.
            if (c + 1 == headers.size()) {
                out_ << cells[c];
            } else {
                out_ << std::left << std::setw(static_cast<int>(widths[c])) << cells[c];
            }
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintDetail(const std::string& title,
                                  const std::vector<DetailSection>& sections) const {
    const char* dim = color_mode_ ? kDim : "";
    const char* bold = color_mode_ ? kBold : "";
    const char* reset = color_mode_ ? kReset : "";
    const char* branch = color_mode_ ? "├── " : "|-- ";
    const char* last_branch = color_mode_ ? "└── " : "+-- ";

    out_ << bold << title << reset << "\n";

    std::vector<const DetailSection*> visible;
    for (const auto& sec : sections) {
        if (!sec.entries.empty()) visible.push_back(&sec);
    }
    for (size_t si = 0; si < visible.size(); ++si) {
        const auto& sec = *visible[si];
        const bool last_section = si + 1 == visible.size();
        if (sec.title.empty()) {
            for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
                const bool last = last_section && ei + 1 == sec.entries.size();
                out_ << dim << (last ? last_branch : branch) << reset
                     << sec.entries[ei].first << ": " << sec.entries[ei].second << "\n";
            }
            continue;
        }
        out_ << dim << (last_section ? last_branch : branch) << reset
             << bold << sec.title << reset << "\n";
        for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
            const bool last = ei + 1 == sec.entries.size();
            out_ << dim << "    " << (last ? last_branch : branch) << reset
                 << sec.entries[ei].first << ": " << sec.entries[ei].second << "\n";
        }
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& json) const {
    out_ << Dump(json) << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    const char* red = color_mode_ ? kRed : "";
    const char* bold = color_mode_ ? kBold : "";
    const char* dim = color_mode_ ? kDim : "";
    const char* reset = color_mode_ ? kReset : "";

    err_ << red << "Error: " << reset << bold << error.operation << reset;
    err_ << dim << " [" << error.CategoryName() << "]" << reset;
    if (error.http_status.has_value()) {
        err_ << dim << " (HTTP " << error.http_status.value() << ")" << reset;
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (!error.subject.empty()) {
        err_ << "  " << dim << "Subject: " << reset << error.subject << "\n";
    }
    if (error.batch_index.has_value()) {
        err_ << "  " << dim << "Batch: " << reset << error.batch_index.value() << "\n";
    }
    if (error.store_error.has_value() && !error.store_error->empty()) {
        err_ << "  " << dim << "Store: " << reset << error.store_error.value() << "\n";
    }
    for (const auto& d : error.details) {
        err_ << "  - " << d << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << Dump({{"success", true}, {"message", message}}) << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace catalog_graph
