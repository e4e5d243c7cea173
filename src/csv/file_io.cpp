// EN: Implementation of the serializer file access helpers
// FR: Implémentation des utilitaires d'accès fichier du sérialiseur

#include "csv/file_io.hpp"
#include "csv/text_utils.hpp"
#include "infrastructure/logging/logger.hpp"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace CSVS {
namespace CSV {

CompressionType detectCompressionFromFilename(const std::string& filename) {
    std::string lower_filename = Text::toLower(filename);
    if (lower_filename.ends_with(".gz") || lower_filename.ends_with(".gzip")) {
        return CompressionType::GZIP;
    }
    return CompressionType::NONE;
}

CompressionType resolveCompression(CompressionType requested, const std::string& filename) {
    return requested == CompressionType::AUTO ? detectCompressionFromFilename(filename) : requested;
}

std::string compressionTypeToString(CompressionType type) {
    switch (type) {
        case CompressionType::NONE: return "none";
        case CompressionType::GZIP: return "gzip";
        case CompressionType::AUTO: return "auto";
        default:                    return "unknown";
    }
}

CompressionType compressionTypeFromString(const std::string& text) {
    std::string lowered = Text::toLower(Text::trim(text));
    if (lowered == "none") return CompressionType::NONE;
    if (lowered == "gzip") return CompressionType::GZIP;
    if (lowered == "auto") return CompressionType::AUTO;
    throw std::invalid_argument("Unknown compression type: " + text);
}

std::string readTextFile(const std::string& path, CompressionType compression) {
    if (path.empty()) {
        throw std::invalid_argument("Input path is empty");
    }
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument("Input file not found: " + path);
    }

    if (resolveCompression(compression, path) == CompressionType::GZIP) {
        gzFile file = gzopen(path.c_str(), "rb");
        if (file == nullptr) {
            throw std::runtime_error("Cannot open compressed file: " + path);
        }

        std::string content;
        char buffer[16384];
        int read_count;
        while ((read_count = gzread(file, buffer, sizeof(buffer))) > 0) {
            content.append(buffer, static_cast<size_t>(read_count));
        }

        int error_code = Z_OK;
        std::string error_message = read_count < 0 ? gzerror(file, &error_code) : "";
        gzclose(file);
        if (read_count < 0) {
            throw std::runtime_error("Failed to decompress " + path + ": " + error_message);
        }
        return content;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + path);
    }
    return content.str();
}

OutputFile::OutputFile(const std::string& path, CompressionType compression) : path_(path) {
    if (resolveCompression(compression, path) == CompressionType::GZIP) {
        gz_file_ = gzopen(path.c_str(), "wb");
        if (gz_file_ == nullptr) {
            throw std::runtime_error("Cannot open compressed file for writing: " + path);
        }
    } else {
        plain_file_.open(path, std::ios::binary | std::ios::trunc);
        if (!plain_file_.is_open()) {
            throw std::runtime_error("Cannot open file for writing: " + path);
        }
    }
}

OutputFile::~OutputFile() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("file_io", "Failed to close " + path_ + ": " + std::string(e.what()));
    }
}

void OutputFile::write(const std::string& data) {
    if (data.empty()) {
        return;
    }

    if (gz_file_ != nullptr) {
        int written = gzwrite(gz_file_, data.data(), static_cast<unsigned>(data.size()));
        if (written <= 0 || static_cast<size_t>(written) != data.size()) {
            int error_code = Z_OK;
            throw std::runtime_error("Failed to write compressed data to " + path_ + ": " +
                                     gzerror(gz_file_, &error_code));
        }
    } else {
        plain_file_.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!plain_file_.good()) {
            throw std::runtime_error("Failed to write to " + path_);
        }
    }
    bytes_written_ += data.size();
}

void OutputFile::flush() {
    if (gz_file_ != nullptr) {
        if (gzflush(gz_file_, Z_SYNC_FLUSH) != Z_OK) {
            throw std::runtime_error("Failed to flush " + path_);
        }
    } else if (plain_file_.is_open()) {
        plain_file_.flush();
        if (!plain_file_.good()) {
            throw std::runtime_error("Failed to flush " + path_);
        }
    }
}

void OutputFile::close() {
    if (gz_file_ != nullptr) {
        gzFile file = gz_file_;
        gz_file_ = nullptr;
        if (gzclose(file) != Z_OK) {
            throw std::runtime_error("Failed to finalize compressed file " + path_);
        }
    } else if (plain_file_.is_open()) {
        plain_file_.close();
        if (plain_file_.fail()) {
            throw std::runtime_error("Failed to close " + path_);
        }
    }
}

} // namespace CSV
} // namespace CSVS
