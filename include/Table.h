#pragma once
#include <string>
#include <utility>
#include <vector>

using Row = std::vector<std::string>;

/**
 * Rectangular-ish table of string cells. Row 0 is the header; data rows may be
 * shorter than the header, and cells past a row's end are treated as absent.
 */
class Table {
public:
    Table() = default;
    explicit Table(std::vector<Row> rows) : rows_(std::move(rows)) {}

    bool hasHeader() const noexcept { return !rows_.empty(); }

    /**
     * @throws Flarejoin::DatasetException when the table has no rows at all.
     */
    const Row& header() const;

    size_t dataRowCount() const noexcept { return rows_.empty() ? 0 : rows_.size() - 1; }

    /**
     * @brief Data row i, counting from the first row after the header.
     * @pre i < dataRowCount().
     */
    const Row& dataRow(size_t i) const { return rows_[i + 1]; }

    const std::vector<Row>& rows() const noexcept { return rows_; }

    void appendRow(Row row) { rows_.push_back(std::move(row)); }

    /**
     * @brief Pointer to the cell or nullptr when the row is too short.
     */
    static const std::string* cell(const Row& row, size_t col) noexcept {
        return col < row.size() ? &row[col] : nullptr;
    }

private:
    std::vector<Row> rows_;
};
