#pragma once

#include <string>
#include <string_view>
#include <vector>

struct SseMessage {
    std::string event = "message";
    std::string data;
    std::string id;
};

// Incremental text/event-stream decoder. Chunks may split lines anywhere.
class SseParser {
public:
    std::vector<SseMessage> feed(std::string_view chunk);
    void reset();

private:
    void process_line(std::string_view line, std::vector<SseMessage>& out);

    std::string buffer_;
    SseMessage current_;
    bool has_data_ = false;
};
