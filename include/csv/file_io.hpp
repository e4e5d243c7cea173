// EN: Scoped file access for the serializer, with transparent gzip compression
// FR: Accès fichier à portée limitée pour le sérialiseur, avec compression gzip transparente

#pragma once

#include <fstream>
#include <string>
#include <zlib.h>

namespace CSVS {
namespace CSV {

// EN: Compression types supported for path input and output
// FR: Types de compression supportés pour l'entrée et la sortie par chemin
enum class CompressionType {
    NONE,           // EN: Plain text / FR: Texte brut
    GZIP,           // EN: GZIP compression / FR: Compression GZIP
    AUTO            // EN: GZIP for .gz and .gzip files, plain otherwise / FR: GZIP pour les fichiers .gz et .gzip, brut sinon
};

CompressionType detectCompressionFromFilename(const std::string& filename);

// EN: AUTO resolved against the filename
// FR: AUTO résolu selon le nom de fichier
CompressionType resolveCompression(CompressionType requested, const std::string& filename);

std::string compressionTypeToString(CompressionType type);

// EN: Parse "none", "gzip" or "auto" (case-insensitive). Throws std::invalid_argument otherwise.
// FR: Parse "none", "gzip" ou "auto" (insensible à la casse). Lève std::invalid_argument sinon.
CompressionType compressionTypeFromString(const std::string& text);

// EN: Read a whole file as text. Throws std::invalid_argument when the path is empty or missing,
//     std::runtime_error when reading fails.
// FR: Lit un fichier entier comme texte. Lève std::invalid_argument si le chemin est vide ou absent,
//     std::runtime_error si la lecture échoue.
std::string readTextFile(const std::string& path, CompressionType compression);

// EN: Output file owned for the duration of one serialize call, closed on every exit path
// FR: Fichier de sortie possédé le temps d'un appel de sérialisation, fermé sur tous les chemins de sortie
class OutputFile {
public:
    // EN: Truncates the target. Throws std::runtime_error when it cannot be opened.
    // FR: Tronque la cible. Lève std::runtime_error si elle ne peut être ouverte.
    OutputFile(const std::string& path, CompressionType compression);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    // EN: Throws std::runtime_error on write failure
    // FR: Lève std::runtime_error en cas d'échec d'écriture
    void write(const std::string& data);
    void flush();
    void close();

    bool isCompressed() const { return gz_file_ != nullptr; }
    size_t bytesWritten() const { return bytes_written_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream plain_file_;
    gzFile gz_file_{nullptr};
    size_t bytes_written_{0};
};

} // namespace CSV
} // namespace CSVS
