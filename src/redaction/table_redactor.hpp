#ifndef SAFEINTAKE_REDACTION_TABLE_REDACTOR_HPP
#define SAFEINTAKE_REDACTION_TABLE_REDACTOR_HPP

#include <algorithm>
#include <cstddef>
#include <future>
#include <map>
#include <string>
#include <vector>
#include "redaction/redactor.hpp"
#include "tabular/csv_table.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

/**
 * @file table_redactor.hpp
 * @brief Applies a Redactor to every data cell of a CsvTable in place.
 *
 * Header names, row order, column order and row widths are left untouched;
 * empty cells are skipped. With a ThreadPool and enough rows the table is cut
 * into contiguous row ranges, one task per range. Tasks write disjoint rows,
 * so no locking is needed.
 */

namespace safeintake {
namespace redaction {

struct TableRedactionStats
{
    std::size_t cellsScanned = 0;
    std::size_t cellsChanged = 0;
    std::map<PatternCategory, std::size_t> replacements;
    std::map<PatternCategory, std::size_t> detections;

    void Merge(const TableRedactionStats &other)
    {
        cellsScanned += other.cellsScanned;
        cellsChanged += other.cellsChanged;
        for (const auto &e : other.replacements) {
            replacements[e.first] += e.second;
        }
        for (const auto &e : other.detections) {
            detections[e.first] += e.second;
        }
    }
};

class TableRedactor
{
public:
    /**
     * @param redactor Scanner to apply; must outlive this object.
     * @param pool Optional worker pool; null redacts on the calling thread.
     * @param parallelThreshold Minimum data rows before the pool is used.
     */
    explicit TableRedactor(const Redactor &redactor,
                           util::ThreadPool *pool = nullptr,
                           std::size_t parallelThreshold = 512)
        : m_redactor(redactor), m_pool(pool), m_parallelThreshold(parallelThreshold)
    {
    }

    TableRedactionStats RedactTable(tabular::CsvTable &table) const
    {
        TableRedactionStats stats;
        const std::size_t rowCount = table.rows.size();
        if (rowCount == 0) {
            return stats;
        }

        if (!m_pool || m_pool->size() < 2 || rowCount < m_parallelThreshold) {
            stats = redactRows(table, 0, rowCount);
        } else {
            // a few chunks per worker keeps uneven rows from idling threads
            const std::size_t chunks = m_pool->size() * 4;
            const std::size_t chunkSize = std::max<std::size_t>(1, (rowCount + chunks - 1) / chunks);

            std::vector<std::future<TableRedactionStats>> pending;
            for (std::size_t begin = 0; begin < rowCount; begin += chunkSize) {
                const std::size_t end = std::min(rowCount, begin + chunkSize);
                pending.push_back(m_pool->enqueue([this, &table, begin, end] {
                    return redactRows(table, begin, end);
                }));
            }
            for (auto &f : pending) {
                stats.Merge(f.get());
            }
        }

        util::logger::debug("[TableRedactor] " + std::to_string(stats.cellsScanned) +
                            " cell(s) scanned, " + std::to_string(stats.cellsChanged) + " changed");
        return stats;
    }

private:
    TableRedactionStats redactRows(tabular::CsvTable &table, std::size_t begin, std::size_t end) const
    {
        TableRedactionStats stats;
        for (std::size_t r = begin; r < end; ++r) {
            for (auto &cell : table.rows[r]) {
                if (cell.empty()) {
                    continue;
                }
                ++stats.cellsScanned;
                RedactionResult result = m_redactor.RedactWithStats(cell);
                for (const auto &e : result.detections) {
                    stats.detections[e.first] += e.second;
                }
                if (result.replacements.empty()) {
                    continue;
                }
                for (const auto &e : result.replacements) {
                    stats.replacements[e.first] += e.second;
                }
                ++stats.cellsChanged;
                cell = std::move(result.text);
            }
        }
        return stats;
    }

    const Redactor &m_redactor;
    util::ThreadPool *m_pool;
    std::size_t m_parallelThreshold;
};

} // namespace redaction
} // namespace safeintake

#endif // SAFEINTAKE_REDACTION_TABLE_REDACTOR_HPP
