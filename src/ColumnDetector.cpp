#include "ColumnDetector.h"

#include "CommonUtils.h"
#include "MgrsClassifier.h"

#include <algorithm>
#include <iterator>

namespace ColumnDetector {

ColumnScores scoreColumns(const std::vector<CSVUtils::CSVRow>& rows, size_t sampleLimit, size_t minColumns) {
    const size_t sampled = std::min(rows.size(), sampleLimit);

    size_t width = minColumns;
    for (size_t r = 0; r < sampled; ++r) width = std::max(width, rows[r].size());

    ColumnScores scores(width, 0);
    for (size_t r = 0; r < sampled; ++r) {
        const auto& row = rows[r];
        for (size_t c = 0; c < row.size(); ++c) {
            if (MgrsClassifier::looksLikeCoordinate(CommonUtils::trim(row[c]))) {
                ++scores[c];
            }
        }
    }
    return scores;
}

std::optional<size_t> selectColumn(const ColumnScores& scores) {
    if (scores.empty()) return std::nullopt;
    // max_element returns the first maximum, which fixes the tie-break.
    const auto best = std::max_element(scores.begin(), scores.end());
    if (*best == 0) return std::nullopt;
    return static_cast<size_t>(std::distance(scores.begin(), best));
}

std::optional<size_t> detectColumn(const std::vector<CSVUtils::CSVRow>& rows, size_t sampleLimit) {
    if (rows.empty()) return std::nullopt;
    return selectColumn(scoreColumns(rows, sampleLimit));
}

} // namespace ColumnDetector
