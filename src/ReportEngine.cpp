#include "ReportEngine.h"
#include "FlarejoinExceptions.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
// Pipes would split the cell; line breaks would end the table row.
std::string tableCell(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '|': out += "\\|"; break;
            case '\n': out += ' '; break;
            case '\r': break;
            default: out.push_back(ch); break;
        }
    }
    return out.empty() ? " " : out;
}

void writeRow(std::ostringstream& os, const std::vector<std::string>& cells, size_t width) {
    os << '|';
    for (size_t i = 0; i < width; ++i) {
        os << ' ' << tableCell(i < cells.size() ? cells[i] : std::string()) << " |";
    }
    os << '\n';
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addSection(const std::string& heading) {
    body_ += "## " + heading + "\n\n";
}

void ReportEngine::addKeyValues(const std::vector<std::pair<std::string, std::string>>& items) {
    std::ostringstream os;
    for (const auto& [key, value] : items) {
        os << "- **" << key << "**: " << value << '\n';
    }
    body_ += os.str() + "\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    std::ostringstream os;
    os << "### " << title << "\n\n";
    if (headers.empty()) {
        os << "_No columns._\n\n";
        body_ += os.str();
        return;
    }

    writeRow(os, headers, headers.size());
    os << '|';
    for (size_t i = 0; i < headers.size(); ++i) os << " --- |";
    os << '\n';
    for (const auto& row : rows) writeRow(os, row, headers.size());
    os << '\n';
    body_ += os.str();
}

void ReportEngine::addColumnIndex(const std::string& title, const std::vector<std::string>& columns) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) {
        rows.push_back({std::to_string(i), columns[i]});
    }
    addTable(title, {"Index", "Column"}, rows);
}

void ReportEngine::save(const std::string& filePath) const {
    const std::filesystem::path target(filePath);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw Flarejoin::IOException("Could not create report directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(filePath, std::ios::trunc);
    if (!out) {
        throw Flarejoin::IOException("Could not open report file: " + filePath);
    }
    out << body_;
    out.flush();
    if (!out) {
        throw Flarejoin::IOException("Failed while writing report file: " + filePath);
    }
}
