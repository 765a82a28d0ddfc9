#pragma once
#include <string>
#include <utility>
#include <vector>

// Accumulates a Markdown document and writes it in one go.
class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addSection(const std::string& heading);
    void addKeyValues(const std::vector<std::pair<std::string, std::string>>& items);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);

    /**
     * @brief Lists `columns` as a two-column (index, name) table so 0-based
     *        column settings can be read off the report.
     */
    void addColumnIndex(const std::string& title, const std::vector<std::string>& columns);

    const std::string& markdown() const noexcept { return body_; }

    /**
     * @throws Flarejoin::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

private:
    std::string body_;
};
