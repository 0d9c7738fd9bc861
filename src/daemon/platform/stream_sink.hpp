#pragma once

#include <cstdint>
#include <string>

enum class SinkResult { Queued, Dropped, Closed };

// One streaming connection. send() is non-blocking and thread-safe.
class StreamSink {
public:
    virtual ~StreamSink() = default;

    virtual SinkResult send(const std::string& event_name, const std::string& payload) = 0;

    // Number of events actually written to the peer so far.
    virtual uint64_t delivered() const = 0;

    virtual bool closed() const = 0;
    virtual void close() = 0;
};
