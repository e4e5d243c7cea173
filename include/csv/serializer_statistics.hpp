// EN: Cumulative counters and timings of the decode and encode runs of one serializer instance
// FR: Compteurs et durées cumulés des décodages et encodages d'une instance de sérialiseur

#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace CSVS {
namespace CSV {

class SerializerStatistics {
public:
    SerializerStatistics();

    // EN: Reset all statistics
    // FR: Remet à zéro toutes les statistiques
    void reset();

    // EN: Update statistics, safe to call from decode workers
    // FR: Met à jour les statistiques, appelable depuis les workers de décodage
    void addLinesRead(size_t count) { lines_read_ += count; }
    void addLinesFilteredOut(size_t count) { lines_filtered_out_ += count; }
    void incrementRowsDecoded() { rows_decoded_++; }
    void incrementBlankLinesSkipped() { blank_lines_skipped_++; }
    void incrementEofRowsSkipped() { eof_rows_skipped_++; }
    void incrementShortRows() { short_rows_++; }
    void addRowsWritten(size_t count) { rows_written_ += count; }
    void incrementFlushCount() { flush_count_++; }
    void addBytesWritten(size_t bytes) { bytes_written_ += bytes; }
    void addDecodeDuration(std::chrono::nanoseconds duration) { decode_nanoseconds_ += duration.count(); }
    void addEncodeDuration(std::chrono::nanoseconds duration) { encode_nanoseconds_ += duration.count(); }

    // EN: Getters
    // FR: Accesseurs
    size_t getLinesRead() const { return lines_read_; }
    size_t getLinesFilteredOut() const { return lines_filtered_out_; }
    size_t getRowsDecoded() const { return rows_decoded_; }
    size_t getBlankLinesSkipped() const { return blank_lines_skipped_; }
    size_t getEofRowsSkipped() const { return eof_rows_skipped_; }
    size_t getShortRows() const { return short_rows_; }
    size_t getRowsWritten() const { return rows_written_; }
    size_t getFlushCount() const { return flush_count_; }
    size_t getBytesWritten() const { return bytes_written_; }
    std::chrono::duration<double> getDecodeDuration() const;
    std::chrono::duration<double> getEncodeDuration() const;
    double getDecodeRowsPerSecond() const;
    double getEncodeRowsPerSecond() const;

    // EN: Generate report
    // FR: Génère un rapport
    std::string generateReport() const;

private:
    std::atomic<size_t> lines_read_{0};             // EN: Data lines read after the header / FR: Lignes de données lues après l'en-tête
    std::atomic<size_t> lines_filtered_out_{0};     // EN: Lines dropped by the keyword filter / FR: Lignes écartées par le filtre de mots-clés
    std::atomic<size_t> rows_decoded_{0};           // EN: Records produced / FR: Enregistrements produits
    std::atomic<size_t> blank_lines_skipped_{0};    // EN: Blank lines skipped / FR: Lignes vides ignorées
    std::atomic<size_t> eof_rows_skipped_{0};       // EN: EOF sentinel rows skipped / FR: Lignes sentinelles EOF ignorées
    std::atomic<size_t> short_rows_{0};             // EN: Rows with fewer parts than columns / FR: Lignes avec moins de parties que de colonnes
    std::atomic<size_t> rows_written_{0};           // EN: Records written / FR: Enregistrements écrits
    std::atomic<size_t> flush_count_{0};            // EN: Output flushes / FR: Vidages de sortie
    std::atomic<size_t> bytes_written_{0};          // EN: Bytes handed to the output / FR: Octets transmis à la sortie
    std::atomic<long long> decode_nanoseconds_{0};
    std::atomic<long long> encode_nanoseconds_{0};
};

} // namespace CSV
} // namespace CSVS
