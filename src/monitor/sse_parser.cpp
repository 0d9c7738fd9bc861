#include "sse_parser.hpp"

std::vector<SseMessage> SseParser::feed(std::string_view chunk) {
    std::vector<SseMessage> out;
    buffer_.append(chunk);

    size_t start = 0;
    size_t pos;
    while ((pos = buffer_.find('\n', start)) != std::string::npos) {
        std::string_view line(buffer_.data() + start, pos - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        process_line(line, out);
        start = pos + 1;
    }
    buffer_.erase(0, start);
    return out;
}

void SseParser::reset() {
    buffer_.clear();
    current_ = {};
    has_data_ = false;
}

void SseParser::process_line(std::string_view line, std::vector<SseMessage>& out) {
    if (line.empty()) {
        if (has_data_) {
            if (!current_.data.empty() && current_.data.back() == '\n') current_.data.pop_back();
            out.push_back(std::move(current_));
        }
        current_ = {};
        has_data_ = false;
        return;
    }

    // Comment
    if (line.front() == ':') return;

    std::string_view field = line;
    std::string_view value;
    if (auto colon = line.find(':'); colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    }

    if (field == "event") {
        current_.event = value.empty() ? "message" : std::string(value);
    } else if (field == "data") {
        current_.data.append(value);
        current_.data += '\n';
        has_data_ = true;
    } else if (field == "id") {
        current_.id = std::string(value);
    }
}
