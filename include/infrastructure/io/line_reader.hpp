// EN: Buffered line reader over zlib's gzFile API - reads plain and gzip-compressed files alike
// FR: Lecteur de lignes bufferisé sur l'API gzFile de zlib - lit indifféremment fichiers bruts et compressés gzip

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// EN: Forward declaration of zlib's opaque file handle
// FR: Déclaration anticipée du handle opaque de zlib
struct gzFile_s;

namespace FP {
namespace IO {

// EN: Sequential reader yielding physical lines (terminator included) with raw-byte progress tracking.
//     LF, CR and CRLF all end a line. A CRLF split across two buffer fills is returned as "...\r".
// FR: Lecteur séquentiel produisant les lignes physiques (terminateur inclus) avec suivi de progression en octets bruts.
//     LF, CR et CRLF terminent tous une ligne. Un CRLF coupé entre deux remplissages est rendu sous la forme "...\r".
class LineReader {
public:
    // EN: Opens the file; throws std::runtime_error when it cannot be opened
    // FR: Ouvre le fichier ; lance std::runtime_error s'il ne peut pas être ouvert
    explicit LineReader(const std::string& file_path, size_t buffer_size = 64 * 1024);

    // EN: Closes the underlying handle on every exit path
    // FR: Ferme le handle sous-jacent sur tous les chemins de sortie
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;
    LineReader(LineReader&&) = delete;
    LineReader& operator=(LineReader&&) = delete;

    // EN: Read the next physical line into `line`; returns false at end of file. Throws on read errors.
    // FR: Lit la prochaine ligne physique dans `line` ; retourne false en fin de fichier. Lance en cas d'erreur.
    bool readLine(std::string& line);

    // EN: Read the remainder of the file in one piece
    // FR: Lit le reste du fichier d'un seul bloc
    std::string readAll();

    // EN: Reset the read position to the start of the file
    // FR: Remet la position de lecture au début du fichier
    void rewind();

    // EN: Bytes of the on-disk file consumed so far (compressed bytes for gzip input)
    // FR: Octets du fichier sur disque consommés jusqu'ici (octets compressés pour une entrée gzip)
    uint64_t bytesConsumed() const;

    // EN: True when the input is a gzip stream rather than a plain file
    // FR: Vrai quand l'entrée est un flux gzip plutôt qu'un fichier brut
    bool isCompressed() const;

    const std::string& getFilePath() const { return file_path_; }

    // EN: On-disk size of a file; throws std::runtime_error when it cannot be stat'ed
    // FR: Taille sur disque d'un fichier ; lance std::runtime_error s'il ne peut pas être lu
    static uint64_t getFileSize(const std::string& file_path);

private:
    std::string file_path_;                 // EN: Path being read / FR: Chemin en cours de lecture
    gzFile_s* file_{nullptr};               // EN: zlib handle / FR: Handle zlib
    std::unique_ptr<char[]> buffer_;        // EN: Read-ahead buffer / FR: Buffer de lecture anticipée
    size_t buffer_capacity_{0};             // EN: Buffer capacity / FR: Capacité du buffer
    size_t buffer_pos_{0};                  // EN: Current position in buffer / FR: Position actuelle dans le buffer
    size_t buffer_size_{0};                 // EN: Valid bytes in buffer / FR: Octets valides dans le buffer
    uint64_t decoded_consumed_{0};          // EN: Decompressed bytes handed out / FR: Octets décompressés délivrés
    bool eof_{false};                       // EN: Underlying stream exhausted / FR: Flux sous-jacent épuisé
    bool pending_lf_{false};                // EN: Last line ended on a CR at the buffer edge / FR: Dernière ligne terminée par un CR en bord de buffer

    // EN: Refill the buffer; returns false when no more data is available
    // FR: Remplit le buffer ; retourne false quand plus aucune donnée n'est disponible
    bool fillBuffer();

    // EN: Build an exception message from zlib's last error
    // FR: Construit un message d'exception depuis la dernière erreur zlib
    std::string describeError(const std::string& operation) const;
};

} // namespace IO
} // namespace FP
