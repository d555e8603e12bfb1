//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseEventParser.cpp
// Purpose: text/event-stream field handling
//==========================================================================================================

#include "toolhost/web/SseEventParser.h"

namespace toolhost {
namespace web {

std::vector<SseEvent> SseEventParser::Feed(const std::string& chunk) {
    std::vector<SseEvent> out;
    for (char c : chunk) {
        if (c == '\n' && lastWasCR) {
            // second half of CRLF
            lastWasCR = false;
            continue;
        }
        lastWasCR = false;
        if (c == '\r' || c == '\n') {
            lastWasCR = c == '\r';
            processLine(line, out);
            line.clear();
            continue;
        }
        line.push_back(c);
    }
    return out;
}

std::vector<SseEvent> SseEventParser::Finish() {
    std::vector<SseEvent> out;
    if (!line.empty()) {
        processLine(line, out);
        line.clear();
    }
    dispatch(out);
    return out;
}

void SseEventParser::processLine(const std::string& l, std::vector<SseEvent>& out) {
    if (l.empty()) {
        dispatch(out);
        return;
    }
    if (l.front() == ':') {
        return;
    }
    std::string field;
    std::string value;
    std::size_t colon = l.find(':');
    if (colon == std::string::npos) {
        field = l;
    } else {
        field = l.substr(0, colon);
        value = l.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
    }
    if (field == "event") {
        eventType = value;
    } else if (field == "data") {
        if (haveData) {
            data.push_back('\n');
        }
        data += value;
        haveData = true;
    } else if (field == "id") {
        if (value.find('\0') == std::string::npos) {
            lastEventId = value;
        }
    }
    // "retry" and unknown fields are ignored
}

void SseEventParser::dispatch(std::vector<SseEvent>& out) {
    if (haveData) {
        SseEvent ev;
        if (!eventType.empty()) {
            ev.event = eventType;
        }
        ev.data = data;
        ev.id = lastEventId;
        out.push_back(std::move(ev));
    }
    eventType.clear();
    data.clear();
    haveData = false;
}

} // namespace web
} // namespace toolhost
