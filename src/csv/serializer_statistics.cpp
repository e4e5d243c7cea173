// EN: Implementation of SerializerStatistics
// FR: Implémentation de SerializerStatistics

#include "csv/serializer_statistics.hpp"
#include <iomanip>
#include <sstream>

namespace CSVS {
namespace CSV {

SerializerStatistics::SerializerStatistics() {
    reset();
}

void SerializerStatistics::reset() {
    lines_read_ = 0;
    lines_filtered_out_ = 0;
    rows_decoded_ = 0;
    blank_lines_skipped_ = 0;
    eof_rows_skipped_ = 0;
    short_rows_ = 0;
    rows_written_ = 0;
    flush_count_ = 0;
    bytes_written_ = 0;
    decode_nanoseconds_ = 0;
    encode_nanoseconds_ = 0;
}

std::chrono::duration<double> SerializerStatistics::getDecodeDuration() const {
    return std::chrono::nanoseconds(decode_nanoseconds_.load());
}

std::chrono::duration<double> SerializerStatistics::getEncodeDuration() const {
    return std::chrono::nanoseconds(encode_nanoseconds_.load());
}

double SerializerStatistics::getDecodeRowsPerSecond() const {
    double duration_seconds = getDecodeDuration().count();
    if (duration_seconds <= 0.0) return 0.0;
    return static_cast<double>(rows_decoded_) / duration_seconds;
}

double SerializerStatistics::getEncodeRowsPerSecond() const {
    double duration_seconds = getEncodeDuration().count();
    if (duration_seconds <= 0.0) return 0.0;
    return static_cast<double>(rows_written_) / duration_seconds;
}

std::string SerializerStatistics::generateReport() const {
    std::ostringstream report;
    report << std::fixed << std::setprecision(2);

    report << "=== CSV Serializer Statistics ===\n";
    report << "Decoding:\n";
    report << "  - Duration: " << getDecodeDuration().count() << " seconds\n";
    report << "  - Lines read: " << lines_read_ << "\n";
    report << "  - Filtered out by keywords: " << lines_filtered_out_ << "\n";
    report << "  - Rows decoded: " << rows_decoded_ << "\n";
    report << "  - Short rows: " << short_rows_ << "\n";
    report << "  - Blank lines skipped: " << blank_lines_skipped_ << "\n";
    report << "  - EOF rows skipped: " << eof_rows_skipped_ << "\n";
    report << "  - Rows/second: " << getDecodeRowsPerSecond() << "\n";

    report << "Encoding:\n";
    report << "  - Duration: " << getEncodeDuration().count() << " seconds\n";
    report << "  - Rows written: " << rows_written_ << "\n";
    report << "  - Flushes: " << flush_count_ << "\n";
    report << "  - Bytes written: " << bytes_written_ << " bytes\n";
    report << "  - Rows/second: " << getEncodeRowsPerSecond() << "\n";

    return report.str();
}

} // namespace CSV
} // namespace CSVS
