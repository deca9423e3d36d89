#pragma once
#include "CSVUtils.h"

#include <optional>
#include <vector>

namespace ColumnDetector {

constexpr size_t kDefaultSampleRows = 100;

// Per-column count of sampled rows whose cell passed the classifier.
using ColumnScores = std::vector<size_t>;

/**
 * @brief Scores every column over the first sampleLimit rows.
 * @param minColumns Lower bound on the returned size (typically header width).
 */
ColumnScores scoreColumns(const std::vector<CSVUtils::CSVRow>& rows,
                          size_t sampleLimit = kDefaultSampleRows,
                          size_t minColumns = 0);

/**
 * @brief Picks the column most likely to hold grid references.
 * @return Lowest index among the top scorers, or nullopt when there are no
 *         rows or no column scored at all.
 */
std::optional<size_t> detectColumn(const std::vector<CSVUtils::CSVRow>& rows,
                                   size_t sampleLimit = kDefaultSampleRows);

std::optional<size_t> selectColumn(const ColumnScores& scores);

} // namespace ColumnDetector
