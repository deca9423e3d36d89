#include "MgrsClassifier.h"

#include "CommonUtils.h"

#include <regex>

namespace MgrsClassifier {

bool looksLikeCoordinate(const std::string& value) {
    if (CommonUtils::trim(value).size() < kMinCoordinateLength) return false;

    static const std::regex re(R"(\b\d{1,2}\s*[C-HJ-NP-X]\s*[A-Z]{2}\s*\d{2,10}\b)", std::regex::icase);
    return std::regex_search(value, re);
}

} // namespace MgrsClassifier
