//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseEventParser.h
// Purpose: Incremental decoder for text/event-stream bodies
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

namespace toolhost {
namespace web {

struct SseEvent {
    std::string event{"message"};
    std::string data;
    std::string id;
};

//==========================================================================================================
// SseEventParser
// Purpose: Accepts arbitrary chunks of an event stream and returns the events completed by each chunk.
//          Handles LF, CRLF and CR line endings (also split across chunks), comment lines, multi-line data
//          and the optional space after the field colon.
//==========================================================================================================
class SseEventParser {
public:
    std::vector<SseEvent> Feed(const std::string& chunk);

    // Dispatches an event left pending when the stream ends without a blank line.
    std::vector<SseEvent> Finish();

    const std::string& LastEventId() const { return lastEventId; }

private:
    void processLine(const std::string& line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    std::string line;
    bool lastWasCR{false};
    std::string eventType;
    std::string data;
    bool haveData{false};
    std::string lastEventId;
};

} // namespace web
} // namespace toolhost
