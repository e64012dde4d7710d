#include "stream/line_buffer.hpp"

#include <cctype>
#include <utility>

namespace agentcli::stream {

namespace {

bool is_blank(const std::string& line) {
    for (const char c : line) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

LineBuffer::LineBuffer(LineCallback on_line) : on_line_(std::move(on_line)) {}

void LineBuffer::add(const std::string& chunk) {
    // What was already pending holds no newline; only the new bytes are scanned.
    std::size_t search_from = pending_.size();
    pending_ += chunk;

    std::size_t start = 0;
    while (true) {
        const auto newline = pending_.find('\n', search_from);
        if (newline == std::string::npos) {
            break;
        }
        emit(pending_.substr(start, newline - start));
        start = newline + 1;
        search_from = start;
    }
    pending_.erase(0, start);
}

void LineBuffer::flush() {
    if (pending_.empty()) {
        return;
    }
    std::string tail;
    tail.swap(pending_);
    emit(std::move(tail));
}

void LineBuffer::emit(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (is_blank(line) || !on_line_) {
        return;
    }
    on_line_(line);
}

}  // namespace agentcli::stream
