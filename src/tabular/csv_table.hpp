#ifndef SAFEINTAKE_TABULAR_CSV_TABLE_HPP
#define SAFEINTAKE_TABULAR_CSV_TABLE_HPP

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file csv_table.hpp
 * @brief Comma-separated tables as a grid of string cells.
 *
 * Parsing follows RFC 4180: fields are separated by ',', records by LF or
 * CRLF, a field may be wrapped in double quotes and then contain commas, line
 * breaks and doubled quotes. A quote that does not start a field is an
 * ordinary character (6" tall). The first record is the header. Empty lines
 * are skipped. Rows keep the number of cells they were written with.
 *
 * Serialization quotes only fields that need it and ends every record with
 * '\n'.
 */

namespace safeintake {
namespace tabular {

struct CsvTable
{
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    std::size_t ColumnCount() const { return header.size(); }
    std::size_t RowCount() const { return rows.size(); }
    bool Empty() const { return header.empty() && rows.empty(); }
};

/**
 * @brief Split CSV text into records of fields.
 * @throw std::runtime_error if a quoted field is never closed.
 */
inline std::vector<std::vector<std::string>> ParseCsvRecords(const std::string &content)
{
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;   // current record has at least one character
    bool atFieldStart = true;    // nothing read yet for the current field
    std::size_t line = 1;
    std::size_t quoteLine = 0;

    auto endRecord = [&]() {
        if (fieldStarted) {
            record.push_back(field);
            records.push_back(record);
        }
        record.clear();
        field.clear();
        fieldStarted = false;
        atFieldStart = true;
    };

    for (std::size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (atFieldStart) {
                    inQuotes = true;
                    quoteLine = line;
                } else {
                    field.push_back(c);
                }
                fieldStarted = true;
                atFieldStart = false;
                break;
            case ',':
                record.push_back(field);
                field.clear();
                fieldStarted = true;
                atFieldStart = true;
                break;
            case '\r':
                if (i + 1 < content.size() && content[i + 1] == '\n') {
                    break;
                }
                endRecord();
                ++line;
                break;
            case '\n':
                endRecord();
                ++line;
                break;
            default:
                field.push_back(c);
                fieldStarted = true;
                atFieldStart = false;
        }
    }

    if (inQuotes) {
        throw std::runtime_error("CsvTable: unterminated quoted field starting on line " +
                                 std::to_string(quoteLine));
    }
    endRecord();
    return records;
}

/**
 * @brief Parse CSV text; the first record becomes the header.
 * @throw std::runtime_error on malformed quoting.
 */
inline CsvTable ParseCsv(const std::string &content)
{
    CsvTable table;
    auto records = ParseCsvRecords(content);
    if (records.empty()) {
        return table;
    }
    table.header = std::move(records.front());
    table.rows.reserve(records.size() - 1);
    for (std::size_t i = 1; i < records.size(); ++i) {
        table.rows.push_back(std::move(records[i]));
    }
    return table;
}

inline bool CsvFieldNeedsQuotes(const std::string &field)
{
    return field.find_first_of(",\"\r\n") != std::string::npos;
}

inline std::string QuoteCsvField(const std::string &field)
{
    if (!CsvFieldNeedsQuotes(field)) {
        return field;
    }
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char c : field) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

inline std::string SerializeCsv(const CsvTable &table)
{
    if (table.Empty()) {
        return std::string();
    }

    std::ostringstream out;
    auto writeRecord = [&out](const std::vector<std::string> &record) {
        for (std::size_t i = 0; i < record.size(); ++i) {
            if (i > 0) {
                out << ',';
            }
            out << QuoteCsvField(record[i]);
        }
        out << '\n';
    };

    writeRecord(table.header);
    for (const auto &row : table.rows) {
        writeRecord(row);
    }
    return out.str();
}

} // namespace tabular
} // namespace safeintake

#endif // SAFEINTAKE_TABULAR_CSV_TABLE_HPP
