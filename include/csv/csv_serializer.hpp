// EN: CSV serializer mapping CSV documents to collections of typed records and back.
//     Decoding validates the header, filters lines by keywords and decodes lines concurrently on a worker pool.
//     Encoding writes the header, one line per record in batched flushes and an optional EOF sentinel.
// FR: Sérialiseur CSV associant documents CSV et collections d'enregistrements typés, dans les deux sens.
//     Le décodage valide l'en-tête, filtre les lignes par mots-clés et décode les lignes en parallèle sur un pool de workers.
//     L'encodage écrit l'en-tête, une ligne par enregistrement par lots vidés périodiquement et une sentinelle EOF optionnelle.

#pragma once

#include "csv/csv_errors.hpp"
#include "csv/field_resolver.hpp"
#include "csv/file_io.hpp"
#include "csv/header_codec.hpp"
#include "csv/line_codec.hpp"
#include "csv/record_schema.hpp"
#include "csv/serializer_options.hpp"
#include "csv/serializer_statistics.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include <chrono>
#include <filesystem>
#include <future>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace CSVS {
namespace CSV {

namespace detail {

// EN: Split text into lines on '\n', dropping one trailing '\r' per line and the empty piece after a final '\n'
// FR: Découpe le texte en lignes sur '\n', en retirant un '\r' final par ligne et le morceau vide après un '\n' final
std::vector<std::string> splitLines(const std::string& content);

// EN: Indices of the lines containing at least one keyword (case-insensitive), identical lines kept once
// FR: Indices des lignes contenant au moins un mot-clé (insensible à la casse), les lignes identiques gardées une fois
std::vector<size_t> selectLinesByKeywords(const std::vector<std::string>& lines,
                                          const std::vector<std::string>& keywords);

// EN: Records per flush: a tenth of the collection, the whole collection when that rounds to zero
// FR: Enregistrements par vidage : un dixième de la collection, la collection entière si cela arrondit à zéro
size_t computeFlushInterval(size_t record_count);

// EN: Split [0, count) into at most `parts` contiguous ranges of near-equal size
// FR: Découpe [0, count) en au plus `parts` plages contiguës de tailles proches
std::vector<std::pair<size_t, size_t>> partitionRanges(size_t count, size_t parts);

// EN: First line of a stream without its trailing '\r', nullopt when the stream is empty
// FR: Première ligne d'un flux sans son '\r' final, nullopt si le flux est vide
std::optional<std::string> readFirstLine(std::istream& stream);

} // namespace detail

template<typename T>
class CsvSerializer {
public:
    // EN: Field mapping taken from RecordMapping<T>::describe()
    // FR: Mapping des champs pris dans RecordMapping<T>::describe()
    explicit CsvSerializer(const SerializerOptions& options = SerializerOptions{})
        : CsvSerializer(describeRecord(), options) {}

    CsvSerializer(const RecordSchema<T>& schema, const SerializerOptions& options = SerializerOptions{});

    CsvSerializer(const CsvSerializer&) = delete;
    CsvSerializer& operator=(const CsvSerializer&) = delete;

    const SerializerOptions& getOptions() const { return options_; }

    // EN: Replace the options. ignore_reference_fields only applies at construction.
    // FR: Remplace les options. ignore_reference_fields ne s'applique qu'à la construction.
    void setOptions(const SerializerOptions& options);

    // EN: Declared names of the active fields, in column order
    // FR: Noms déclarés des champs actifs, dans l'ordre des colonnes
    std::vector<std::string> headers() const { return active_.names(); }

    // EN: Canonical header written by serialize()
    // FR: En-tête canonique écrit par serialize()
    std::string typeHeader() const;

    // EN: Columns of the expected header missing or misplaced in the file header, empty when it matches
    // FR: Colonnes de l'en-tête attendu absentes ou mal placées dans l'en-tête du fichier, vide s'il correspond
    std::string fileHeaderDiff(std::istream& stream) const;
    std::string fileHeaderDiff(const std::string& path) const;

    bool checkFileHeader(std::istream& stream) const { return fileHeaderDiff(stream).empty(); }
    bool checkFileHeader(const std::string& path) const { return fileHeaderDiff(path).empty(); }

    // EN: Decode a whole document. Throws FormatError on header mismatch, UnsupportedValueError on bad values.
    // FR: Décode un document entier. Lève FormatError si l'en-tête diffère, UnsupportedValueError sur valeur invalide.
    std::vector<T> deserialize(std::istream& stream, const std::vector<std::string>& keywords = {});
    std::vector<T> deserialize(const std::string& path, const std::vector<std::string>& keywords = {});

    // EN: Write a whole document. The path overload replaces any existing file.
    // FR: Écrit un document entier. La surcharge par chemin remplace tout fichier existant.
    void serialize(const std::string& path, const std::vector<T>& records);
    void serialize(std::ostream& stream, const std::vector<T>& records);

    const ActiveFieldSet& activeFields() const { return active_; }
    const std::string& typeName() const { return type_name_; }

    const SerializerStatistics& getStatistics() const { return statistics_; }
    void resetStatistics() { statistics_.reset(); }

private:
    static RecordSchema<T> describeRecord() {
        RecordSchema<T> schema;
        RecordMapping<T>::describe(schema);
        return schema;
    }

    static const SerializerOptions& checkedOptions(const SerializerOptions& options);

    HeaderCodec makeHeaderCodec() const {
        return HeaderCodec(options_.separator, options_.row_number_title,
                           options_.use_line_numbers, active_.explicit_ordering);
    }

    std::string expectedHeader() const {
        return options_.expected_header ? *options_.expected_header : typeHeader();
    }

    std::string headerDiff(const std::optional<std::string>& file_first_line) const;
    std::vector<T> deserializeContent(const std::string& content, const std::vector<std::string>& keywords);
    void decodeLines(const LineCodec& codec, const std::vector<std::string>& lines,
                     const std::vector<size_t>& selected, size_t first_line_number, const ColumnLayout& layout, std::vector<std::optional<T>>& slots);
    void decodeRange(const LineCodec& codec, const std::vector<std::string>& lines,
                     const std::vector<size_t>& selected, size_t first_line_number,
                     const ColumnLayout& layout, std::vector<std::optional<T>>& slots,
                     size_t begin, size_t end);

    template<typename Write, typename Flush>
    void writeRecords(const std::vector<T>& records, Write&& write, Flush&& flush);

    ThreadPool& pool();

    SerializerOptions options_;
    std::string type_name_;
    std::vector<FieldDescriptor<T>> fields_;
    ActiveFieldSet active_;
    bool reference_fields_ignored_;
    SerializerStatistics statistics_;
    std::unique_ptr<ThreadPool> pool_;
};

template<typename T>
CsvSerializer<T>::CsvSerializer(const RecordSchema<T>& schema, const SerializerOptions& options)
    : options_(checkedOptions(options)),
      type_name_(schema.typeName()),
      fields_(schema.fields()),
      active_(FieldResolver::resolve(schema.typeName(), schema.infos(), options.ignore_reference_fields)),
      reference_fields_ignored_(options.ignore_reference_fields) {
    LOG_DEBUG("csv_serializer", "Serializer ready for " + type_name_ + " with header: " + typeHeader());
}

template<typename T>
const SerializerOptions& CsvSerializer<T>::checkedOptions(const SerializerOptions& options) {
    try {
        options.validate();
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("csv_serializer", "Invalid serializer options: " + std::string(e.what()));
        throw;
    }
    return options;
}

template<typename T>
void CsvSerializer<T>::setOptions(const SerializerOptions& options) {
    checkedOptions(options);

    if (options.ignore_reference_fields != reference_fields_ignored_) {
        LOG_WARN("csv_serializer", "ignore_reference_fields is fixed at construction, new value ignored");
    }
    if (options.worker_threads != options_.worker_threads) {
        pool_.reset();
    }
    options_ = options;
}

template<typename T>
std::string CsvSerializer<T>::typeHeader() const {
    return makeHeaderCodec().render(active_.titles());
}

template<typename T>
std::string CsvSerializer<T>::headerDiff(const std::optional<std::string>& file_first_line) const {
    std::optional<std::string> header_line = options_.file_header ? options_.file_header : file_first_line;
    if (!header_line) {
        std::string message = "Invalid CSV found. The input has no header line.";
        LOG_ERROR("csv_serializer", message);
        throw FormatError(message);
    }
    return makeHeaderCodec().diff(*header_line, expectedHeader());
}

template<typename T>
std::string CsvSerializer<T>::fileHeaderDiff(std::istream& stream) const {
    const std::istream::pos_type start = stream.tellg();
    std::optional<std::string> first_line = detail::readFirstLine(stream);

    // EN: Put the stream back where it was so the same stream can be deserialized next
    // FR: Remet le flux à sa position initiale pour pouvoir le désérialiser ensuite
    if (start != std::istream::pos_type(-1)) {
        stream.clear(stream.rdstate() & std::ios::badbit);
        stream.seekg(start);
    }
    return headerDiff(first_line);
}

template<typename T>
std::string CsvSerializer<T>::fileHeaderDiff(const std::string& path) const {
    std::vector<std::string> lines = detail::splitLines(readTextFile(path, options_.compression));
    return headerDiff(lines.empty() ? std::nullopt : std::optional<std::string>(lines.front()));
}

template<typename T>
std::vector<T> CsvSerializer<T>::deserialize(std::istream& stream, const std::vector<std::string>& keywords) {
    // EN: The whole input is read, even after a header check moved the position
    // FR: L'entrée entière est lue, même si une vérification d'en-tête a déplacé la position
    stream.clear(stream.rdstate() & std::ios::badbit);
    if (stream.tellg() != std::istream::pos_type(-1)) {
        stream.seekg(0, std::ios::beg);
    }

    std::ostringstream content;
    content << stream.rdbuf();
    if (stream.bad()) {
        std::string message = "Failed to read CSV input stream";
        LOG_ERROR("csv_serializer", message);
        throw std::runtime_error(message);
    }
    return deserializeContent(content.str(), keywords);
}

template<typename T>
std::vector<T> CsvSerializer<T>::deserialize(const std::string& path, const std::vector<std::string>& keywords) {
    std::string content;
    try {
        content = readTextFile(path, options_.compression);
    } catch (const std::exception& e) {
        LOG_ERROR("csv_serializer", "Cannot read CSV input: " + std::string(e.what()));
        throw;
    }
    LOG_DEBUG("csv_serializer", "Deserializing " + type_name_ + " from " + path);
    return deserializeContent(content, keywords);
}

template<typename T>
std::vector<T> CsvSerializer<T>::deserializeContent(const std::string& content,
                                                    const std::vector<std::string>& keywords) {
    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::string> lines = detail::splitLines(content);
    std::optional<std::string> first_line = lines.empty() ? std::nullopt : std::optional<std::string>(lines.front());

    std::string difference = headerDiff(first_line);
    if (!difference.empty()) {
        std::string message = "Invalid CSV found. The following columns are missing or misplaced: " + difference;
        LOG_ERROR("csv_serializer", message);
        throw FormatError(message);
    }

    // EN: A header supplied through the options means the input has none to drop
    // FR: Un en-tête fourni par les options signifie que l'entrée n'en a aucun à retirer
    const bool header_from_input = !options_.file_header.has_value();
    const std::string header_line = header_from_input ? *first_line : *options_.file_header;
    if (header_from_input) {
        lines.erase(lines.begin());
    }
    const size_t first_line_number = header_from_input ? 2 : 1;
    statistics_.addLinesRead(lines.size());

    std::vector<size_t> selected;
    if (keywords.empty()) {
        selected.resize(lines.size());
        for (size_t i = 0; i < lines.size(); ++i) {
            selected[i] = i;
        }
    } else {
        selected = detail::selectLinesByKeywords(lines, keywords);
        statistics_.addLinesFilteredOut(lines.size() - selected.size());
    }

    LineCodec codec(options_);
    ColumnLayout layout = codec.bind(makeHeaderCodec().normalizeColumns(header_line), active_);

    std::vector<std::optional<T>> slots(selected.size());
    try {
        decodeLines(codec, lines, selected, first_line_number, layout, slots);
    } catch (const UnsupportedValueError& e) {
        LOG_ERROR("csv_serializer", "Failed to decode " + type_name_ + ": " + std::string(e.what()));
        throw;
    }

    std::vector<T> records;
    records.reserve(slots.size());
    for (auto& slot : slots) {
        if (slot) {
            records.push_back(std::move(*slot));
        }
    }

    auto duration = std::chrono::steady_clock::now() - start_time;
    statistics_.addDecodeDuration(std::chrono::duration_cast<std::chrono::nanoseconds>(duration));

    std::unordered_map<std::string, std::string> metadata = {
        {"type", type_name_},
        {"lines", std::to_string(lines.size())},
        {"selected_lines", std::to_string(selected.size())},
        {"records", std::to_string(records.size())},
        {"duration_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count())}
    };
    LOG_INFO_META("csv_serializer", "Deserialization completed", metadata);
    return records;
}

// EN: Each task owns a contiguous range of slots, results need no lock and keep the input order
// FR: Chaque tâche possède une plage contiguë de slots, les résultats n'ont pas besoin de verrou et gardent l'ordre d'entrée
template<typename T>
void CsvSerializer<T>::decodeLines(const LineCodec& codec, const std::vector<std::string>& lines,
                                   const std::vector<size_t>& selected,
                                   size_t first_line_number, const ColumnLayout& layout,
                                   std::vector<std::optional<T>>& slots) {
    if (options_.force_sequential || selected.size() <= 1) {
        decodeRange(codec, lines, selected, first_line_number, layout, slots, 0, selected.size());
        return;
    }

    ThreadPool& workers = pool();
    auto ranges = detail::partitionRanges(selected.size(), workers.size() * 4);

    std::vector<std::future<void>> futures;
    futures.reserve(ranges.size());
    for (const auto& [begin, end] : ranges) {
        futures.push_back(workers.submitNamed("decode_lines", [&, begin = begin, end = end]() {
            decodeRange(codec, lines, selected, first_line_number, layout, slots, begin, end);
        }));
    }

    // EN: Every task must finish before the first failure propagates, they all reference this frame
    // FR: Toutes les tâches doivent finir avant que le premier échec ne se propage, elles référencent toutes ce cadre
    for (auto& future : futures) {
        future.wait();
    }
    for (auto& future : futures) {
        future.get();
    }

    LOG_DEBUG("csv_serializer", "Decoded " + std::to_string(selected.size()) + " lines in " +
              std::to_string(ranges.size()) + " tasks on " + std::to_string(workers.size()) + " threads");
}

template<typename T>
void CsvSerializer<T>::decodeRange(const LineCodec& codec, const std::vector<std::string>& lines,
                                   const std::vector<size_t>& selected, size_t first_line_number,
                                   const ColumnLayout& layout, std::vector<std::optional<T>>& slots,
                                   size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        const size_t line_index = selected[i];
        const size_t line_number = first_line_number + line_index;

        switch (codec.decode(lines[line_index], line_number, layout, fields_, slots[i])) {
            case DecodeStatus::DECODED:
                statistics_.incrementRowsDecoded();
                break;
            case DecodeStatus::SHORT_ROW:
                statistics_.incrementRowsDecoded();
                statistics_.incrementShortRows();
                LOG_DEBUG("csv_serializer", "Line " + std::to_string(line_number) +
                          " has fewer values than header columns");
                break;
            case DecodeStatus::BLANK:
                statistics_.incrementBlankLinesSkipped();
                break;
            case DecodeStatus::END_OF_FILE:
                statistics_.incrementEofRowsSkipped();
                break;
        }
    }
}

template<typename T>
ThreadPool& CsvSerializer<T>::pool() {
    if (!pool_) {
        ThreadPoolConfig config;
        config.thread_count = options_.worker_threads;
        pool_ = std::make_unique<ThreadPool>(config);
    }
    return *pool_;
}

template<typename T>
void CsvSerializer<T>::serialize(const std::string& path, const std::vector<T>& records) {
    if (path.empty()) {
        std::string message = "Output path is empty";
        LOG_ERROR("csv_serializer", message);
        throw std::invalid_argument(message);
    }

    std::error_code remove_error;
    std::filesystem::remove(path, remove_error);
    if (remove_error) {
        std::string message = "Cannot replace " + path + ": " + remove_error.message();
        LOG_ERROR("csv_serializer", message);
        throw std::runtime_error(message);
    }

    try {
        OutputFile output(path, options_.compression);
        writeRecords(records,
                     [&output](const std::string& chunk) { output.write(chunk); },
                     [&output]() { output.flush(); });
        output.close();
    } catch (const std::runtime_error& e) {
        LOG_ERROR("csv_serializer", "Failed to serialize " + type_name_ + " to " + path + ": " + e.what());
        throw;
    }
}

template<typename T>
void CsvSerializer<T>::serialize(std::ostream& stream, const std::vector<T>& records) {
    auto check = [&stream]() {
        if (!stream.good()) {
            std::string message = "Failed to write CSV output stream";
            LOG_ERROR("csv_serializer", message);
            throw std::runtime_error(message);
        }
    };
    writeRecords(records,
                 [&stream, &check](const std::string& chunk) { stream << chunk; check(); },
                 [&stream, &check]() { stream.flush(); check(); });
}

template<typename T>
template<typename Write, typename Flush>
void CsvSerializer<T>::writeRecords(const std::vector<T>& records, Write&& write, Flush&& flush) {
    auto start_time = std::chrono::steady_clock::now();

    LineCodec codec(options_);
    const size_t flush_interval = detail::computeFlushInterval(records.size());

    auto emit = [&](std::string& buffer) {
        write(buffer);
        flush();
        statistics_.addBytesWritten(buffer.size());
        statistics_.incrementFlushCount();
        buffer.clear();
    };

    std::string buffer = typeHeader() + "\n";
    size_t pending = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        buffer += codec.encode(records[i], i + 1, active_, fields_);
        buffer += '\n';
        if (++pending >= flush_interval) {
            emit(buffer);
            pending = 0;
        }
    }

    if (options_.use_eof_literal) {
        buffer += codec.endOfFileLine(records.size() + 1);
        buffer += '\n';
    }
    if (!buffer.empty()) {
        emit(buffer);
    }

    statistics_.addRowsWritten(records.size());
    auto duration = std::chrono::steady_clock::now() - start_time;
    statistics_.addEncodeDuration(std::chrono::duration_cast<std::chrono::nanoseconds>(duration));

    std::unordered_map<std::string, std::string> metadata = {
        {"type", type_name_},
        {"records", std::to_string(records.size())},
        {"flush_interval", std::to_string(flush_interval)},
        {"duration_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count())}
    };
    LOG_INFO_META("csv_serializer", "Serialization completed", metadata);
}

} // namespace CSV
} // namespace CSVS
