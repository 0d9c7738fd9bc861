#pragma once

#include "sse_parser.hpp"

#include <string>

// One terminal line per stream event.
std::string format_event(const SseMessage& msg);
