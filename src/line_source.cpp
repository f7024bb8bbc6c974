#include "line_source.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <unistd.h>

namespace execrelay {

static void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

std::optional<std::string> IstreamLineSource::next_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    strip_cr(line);
    return line;
}

std::optional<std::string> FdLineSource::next_line() {
    std::array<char, 4096> chunk;
    while (true) {
        size_t newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            strip_cr(line);
            return line;
        }
        if (eof_) {
            if (buffer_.empty()) return std::nullopt;
            // Incomplete last line
            std::string line = std::move(buffer_);
            buffer_.clear();
            strip_cr(line);
            return line;
        }

        ssize_t n = read(fd_, chunk.data(), chunk.size());
        if (n > 0) {
            buffer_.append(chunk.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR) {
            // Read errors end the stream like a close
            std::cerr << "[stream] read failed: " << std::strerror(errno) << "\n";
            eof_ = true;
        }
    }
}

} // namespace execrelay
