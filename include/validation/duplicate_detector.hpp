// EN: Exact-duplicate row grouping keyed by a content digest - pure data structure, no I/O
// FR: Regroupement des lignes strictement dupliquées par empreinte de contenu - structure pure, sans I/O

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace FP {
namespace Validation {

// EN: 64-bit hash + CRC-32 + byte length. Two rows are duplicates only when all three agree.
// FR: Hash 64 bits + CRC-32 + longueur en octets. Deux lignes sont dupliquées seulement si les trois concordent.
struct ContentDigest {
    uint64_t primary{0};
    uint32_t checksum{0};
    size_t length{0};

    bool operator==(const ContentDigest& other) const {
        return primary == other.primary && checksum == other.checksum && length == other.length;
    }
    bool operator!=(const ContentDigest& other) const { return !(*this == other); }
};

struct ContentDigestHash {
    size_t operator()(const ContentDigest& digest) const noexcept {
        return static_cast<size_t>(digest.primary ^ (static_cast<uint64_t>(digest.checksum) << 17));
    }
};

// EN: A set of >= 2 rows sharing the same digest, rows in file order
// FR: Ensemble de >= 2 lignes partageant la même empreinte, lignes dans l'ordre du fichier
struct DuplicateGroup {
    ContentDigest digest;
    std::vector<size_t> rows;
    std::string content_preview;
};

class DuplicateDetector {
public:
    // EN: Maximum sibling rows named in one description
    // FR: Nombre maximum de lignes sœurs citées dans une description
    static constexpr size_t kMaxListedSiblings = 10;

    DuplicateDetector() = default;

    static ContentDigest digest(std::string_view content);

    // EN: Record the trimmed content of a row. The preview is kept only once a second occurrence shows up.
    // FR: Enregistre le contenu trimé d'une ligne. L'aperçu n'est conservé qu'à partir de la deuxième occurrence.
    void record(size_t row, std::string_view content);

    // EN: Groups with at least two rows, ordered by their first row
    // FR: Groupes d'au moins deux lignes, triés par leur première ligne
    std::vector<DuplicateGroup> duplicateGroups() const;

    // EN: "Exact duplicate of row(s): 5, 9" for `row`, listing every other member of its group
    // FR: "Exact duplicate of row(s): 5, 9" pour `row`, citant chaque autre membre de son groupe
    static std::string describeSiblings(const std::vector<size_t>& group_rows, size_t row);

    size_t recordedRows() const { return recorded_rows_; }
    size_t distinctContents() const { return buckets_.size(); }
    void clear();

private:
    struct Bucket {
        std::vector<size_t> rows;
        std::string content_preview;
    };

    std::unordered_map<ContentDigest, Bucket, ContentDigestHash> buckets_;
    size_t recorded_rows_{0};
};

} // namespace Validation
} // namespace FP
