#pragma once

#include <functional>
#include <string>

namespace agentcli::stream {

// Reassembles newline-delimited records from arbitrarily split chunks.
// Blank and whitespace-only lines are never emitted.
class LineBuffer {
public:
    using LineCallback = std::function<void(const std::string&)>;

    explicit LineBuffer(LineCallback on_line);

    // Emits every record completed by this chunk, in arrival order.
    void add(const std::string& chunk);

    // Emits the unterminated tail once, then clears it.
    void flush();

    bool has_pending() const { return !pending_.empty(); }

private:
    void emit(std::string line);

    LineCallback on_line_;
    std::string pending_;
};

}  // namespace agentcli::stream
