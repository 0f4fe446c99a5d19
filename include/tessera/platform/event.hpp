#ifndef TESSERA_PLATFORM_EVENT
#define TESSERA_PLATFORM_EVENT

#include <cstdint>

namespace tessera {

enum class EventSeverity : uint8_t {
    Debug,
    Info,
    Warning,
    Error,
};

const char* EventSeverityName(EventSeverity);

enum class Event : uint8_t {
    General,
    TileLoad,
    TileCache,
    TileGrid,
    RunLoop,
};

const char* EventName(Event);

}

#endif
