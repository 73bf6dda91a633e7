// EN: DuplicateDetector implementation
// FR: Implémentation de DuplicateDetector

#include "validation/duplicate_detector.hpp"
#include "validation/validation_report.hpp"
#include "infrastructure/io/text_utils.hpp"

#include <zlib.h>

#include <algorithm>
#include <functional>
#include <sstream>

namespace FP {
namespace Validation {

ContentDigest DuplicateDetector::digest(std::string_view content) {
    ContentDigest result;
    result.primary = static_cast<uint64_t>(std::hash<std::string_view>{}(content));

    // EN: crc32 takes uInt lengths, feed large rows in slices
    // FR: crc32 prend des longueurs uInt, les grandes lignes sont traitées par tranches
    uLong crc = crc32(0L, Z_NULL, 0);
    const auto* data = reinterpret_cast<const Bytef*>(content.data());
    size_t remaining = content.size();
    while (remaining > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(remaining, 1u << 30));
        crc = crc32(crc, data, chunk);
        data += chunk;
        remaining -= chunk;
    }

    result.checksum = static_cast<uint32_t>(crc);
    result.length = content.size();
    return result;
}

void DuplicateDetector::record(size_t row, std::string_view content) {
    auto& bucket = buckets_[digest(content)];
    bucket.rows.push_back(row);
    if (bucket.rows.size() == 2) {
        bucket.content_preview = IO::TextUtils::utf8Prefix(content, ValidationReport::kStoredPreviewLength);
    }
    ++recorded_rows_;
}

std::vector<DuplicateGroup> DuplicateDetector::duplicateGroups() const {
    std::vector<DuplicateGroup> groups;
    for (const auto& [key, bucket] : buckets_) {
        if (bucket.rows.size() >= 2) {
            groups.push_back(DuplicateGroup{key, bucket.rows, bucket.content_preview});
        }
    }

    std::sort(groups.begin(), groups.end(), [](const DuplicateGroup& a, const DuplicateGroup& b) {
        return a.rows.front() < b.rows.front();
    });
    return groups;
}

std::string DuplicateDetector::describeSiblings(const std::vector<size_t>& group_rows, size_t row) {
    std::ostringstream oss;
    oss << "Exact duplicate of row(s): ";

    size_t listed = 0;
    size_t siblings = 0;
    for (size_t other : group_rows) {
        if (other == row) {
            continue;
        }
        ++siblings;
        if (listed < kMaxListedSiblings) {
            if (listed > 0) {
                oss << ", ";
            }
            oss << other;
            ++listed;
        }
    }

    if (siblings > listed) {
        oss << " and " << (siblings - listed) << " more";
    }
    return oss.str();
}

void DuplicateDetector::clear() {
    buckets_.clear();
    recorded_rows_ = 0;
}

} // namespace Validation
} // namespace FP
