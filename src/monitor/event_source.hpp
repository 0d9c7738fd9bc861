#pragma once

#include "sse_parser.hpp"

#include <functional>
#include <string>

// One streaming connection at a time. Handlers run on the scheduler thread
// and never fire for a connection that has been closed or replaced.
class EventSource {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const SseMessage&)> on_message;
        // Fires once per connection when it fails or the server closes it.
        std::function<void(const std::string&)> on_error;
    };

    virtual ~EventSource() = default;

    virtual void open(const std::string& url, Handlers handlers) = 0;
    virtual void close() = 0;
};
