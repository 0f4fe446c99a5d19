#include <tessera/platform/log.hpp>

#include <cstdarg>
#include <cstdio>
#include <sstream>

namespace tessera {

namespace {

std::unique_ptr<Log::Observer> currentObserver;

}

const char* EventSeverityName(EventSeverity severity) {
    switch (severity) {
    case EventSeverity::Debug:   return "DEBUG";
    case EventSeverity::Info:    return "INFO";
    case EventSeverity::Warning: return "WARNING";
    case EventSeverity::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

const char* EventName(Event event) {
    switch (event) {
    case Event::General:   return "General";
    case Event::TileLoad:  return "TileLoad";
    case Event::TileCache: return "TileCache";
    case Event::TileGrid:  return "TileGrid";
    case Event::RunLoop:   return "RunLoop";
    }
    return "Unknown";
}

void Log::setObserver(std::unique_ptr<Observer> observer) {
    currentObserver = std::move(observer);
}

std::unique_ptr<Log::Observer> Log::removeObserver() {
    std::unique_ptr<Observer> observer;
    std::swap(observer, currentObserver);
    return observer;
}

void Log::record(EventSeverity severity, Event event, const std::string &msg) {
    record(severity, event, -1, msg);
}

void Log::record(EventSeverity severity, Event event, const char* format, ...) {
    va_list args;
    va_start(args, format);
    char msg[4096];
    vsnprintf(msg, sizeof(msg), format, args);
    va_end(args);

    record(severity, event, -1, std::string{ msg });
}

void Log::record(EventSeverity severity, Event event, int64_t code) {
    record(severity, event, code, std::string{});
}

void Log::record(EventSeverity severity, Event event, int64_t code, const std::string &msg) {
    if (currentObserver && severity != EventSeverity::Debug &&
        currentObserver->onRecord(severity, event, code, msg)) {
        return;
    }

    std::stringstream logStream;

    logStream << "{" << EventName(event) << "}";

    if (code >= 0) {
        logStream << "(" << code << ")";
    }

    if (!msg.empty()) {
        logStream << ": " << msg;
    }

    platformRecord(severity, logStream.str());
}

}
