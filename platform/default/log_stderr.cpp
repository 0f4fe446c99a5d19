#include <tessera/platform/log.hpp>

#include <iostream>

namespace tessera {

void Log::platformRecord(EventSeverity severity, const std::string &msg) {
    std::cerr << "[" << EventSeverityName(severity) << "] " << msg << std::endl;
}

}
