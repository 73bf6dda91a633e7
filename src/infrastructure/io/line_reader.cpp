// EN: LineReader implementation - zlib-backed buffered reading with constant memory usage
// FR: Implémentation de LineReader - lecture bufferisée via zlib avec usage mémoire constant

#include "infrastructure/io/line_reader.hpp"
#include "infrastructure/logging/logger.hpp"

#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace FP {
namespace IO {

LineReader::LineReader(const std::string& file_path, size_t buffer_size)
    : file_path_(file_path), buffer_capacity_(buffer_size) {
    if (buffer_capacity_ == 0) {
        throw std::invalid_argument("LineReader buffer size must be greater than zero");
    }

    errno = 0;
    file_ = gzopen(file_path_.c_str(), "rb");
    if (file_ == nullptr) {
        std::string reason = errno != 0 ? std::strerror(errno) : "insufficient memory";
        throw std::runtime_error("Cannot open file '" + file_path_ + "': " + reason);
    }

    // EN: Let zlib read large chunks from disk as well
    // FR: Laisse zlib lire de gros blocs sur le disque également
    gzbuffer(file_, static_cast<unsigned>(buffer_capacity_));
    buffer_ = std::make_unique<char[]>(buffer_capacity_);

    LOG_DEBUG("line_reader", "Opened " + file_path_ + (isCompressed() ? " (gzip)" : " (plain)"));
}

LineReader::~LineReader() {
    if (file_ != nullptr) {
        gzclose(file_);
        file_ = nullptr;
    }
}

bool LineReader::readLine(std::string& line) {
    line.clear();

    while (true) {
        if (buffer_pos_ >= buffer_size_ && !fillBuffer()) {
            return !line.empty();
        }

        const char* start = buffer_.get() + buffer_pos_;
        size_t available = buffer_size_ - buffer_pos_;

        // EN: The LF of a CRLF pair split across two fills still belongs to the previous line
        // FR: Le LF d'une paire CRLF coupée entre deux remplissages appartient encore à la ligne précédente
        if (pending_lf_) {
            pending_lf_ = false;
            if (*start == '\n') {
                ++buffer_pos_;
                ++decoded_consumed_;
                continue;
            }
        }

        const char* end = start + available;
        const char* terminator = std::find_if(start, end, [](char c) { return c == '\n' || c == '\r'; });

        if (terminator != end) {
            size_t length = static_cast<size_t>(terminator - start) + 1;
            if (*terminator == '\r') {
                if (terminator + 1 == end) {
                    pending_lf_ = true;
                } else if (terminator[1] == '\n') {
                    ++length;
                }
            }
            line.append(start, length);
            buffer_pos_ += length;
            decoded_consumed_ += length;
            return true;
        }

        // EN: No terminator in the buffer yet, keep the partial line and refill
        // FR: Pas encore de terminateur dans le buffer, garde la ligne partielle et recharge
        line.append(start, available);
        buffer_pos_ += available;
        decoded_consumed_ += available;
    }
}

std::string LineReader::readAll() {
    std::string content;
    if (pending_lf_) {
        pending_lf_ = false;
        if ((buffer_pos_ < buffer_size_ || fillBuffer()) && buffer_[buffer_pos_] == '\n') {
            ++buffer_pos_;
            ++decoded_consumed_;
        }
    }
    if (buffer_pos_ < buffer_size_) {
        content.append(buffer_.get() + buffer_pos_, buffer_size_ - buffer_pos_);
        decoded_consumed_ += buffer_size_ - buffer_pos_;
        buffer_pos_ = buffer_size_;
    }

    while (fillBuffer()) {
        content.append(buffer_.get(), buffer_size_);
        decoded_consumed_ += buffer_size_;
        buffer_pos_ = buffer_size_;
    }

    return content;
}

void LineReader::rewind() {
    if (gzrewind(file_) != 0) {
        throw std::runtime_error(describeError("rewind"));
    }
    buffer_pos_ = 0;
    buffer_size_ = 0;
    decoded_consumed_ = 0;
    eof_ = false;
    pending_lf_ = false;
}

uint64_t LineReader::bytesConsumed() const {
    if (!isCompressed()) {
        return decoded_consumed_;
    }
    z_off_t offset = gzoffset(file_);
    return offset < 0 ? 0 : static_cast<uint64_t>(offset);
}

bool LineReader::isCompressed() const {
    return gzdirect(file_) == 0;
}

uint64_t LineReader::getFileSize(const std::string& file_path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        throw std::runtime_error("Cannot determine size of '" + file_path + "': " + ec.message());
    }
    return static_cast<uint64_t>(size);
}

bool LineReader::fillBuffer() {
    if (eof_) {
        return false;
    }

    int bytes_read = gzread(file_, buffer_.get(), static_cast<unsigned>(buffer_capacity_));
    if (bytes_read < 0) {
        throw std::runtime_error(describeError("read"));
    }

    if (bytes_read == 0) {
        // EN: A truncated gzip member surfaces as Z_BUF_ERROR once input runs out
        // FR: Un membre gzip tronqué se manifeste par Z_BUF_ERROR à la fin de l'entrée
        int errnum = Z_OK;
        gzerror(file_, &errnum);
        if (errnum != Z_OK) {
            throw std::runtime_error(describeError("read"));
        }
        eof_ = true;
        buffer_pos_ = 0;
        buffer_size_ = 0;
        return false;
    }

    buffer_pos_ = 0;
    buffer_size_ = static_cast<size_t>(bytes_read);
    return true;
}

std::string LineReader::describeError(const std::string& operation) const {
    int errnum = Z_OK;
    const char* message = gzerror(file_, &errnum);
    std::string detail;
    if (errnum == Z_ERRNO) {
        detail = std::strerror(errno);
    } else if (errnum == Z_BUF_ERROR) {
        detail = "unexpected end of compressed data";
    } else if (message != nullptr && *message != '\0') {
        detail = message;
    } else {
        detail = "unknown error";
    }
    return "Failed to " + operation + " '" + file_path_ + "': " + detail;
}

} // namespace IO
} // namespace FP
