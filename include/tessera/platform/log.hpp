#ifndef TESSERA_PLATFORM_LOG
#define TESSERA_PLATFORM_LOG

#include <tessera/platform/event.hpp>

#include <memory>
#include <string>
#include <utility>

namespace tessera {

class Log {
public:
    class Observer {
    public:
        virtual ~Observer() = default;

        // When an observer is set, this function will be called for every log
        // message. Returning true will consume the message.
        virtual bool onRecord(EventSeverity severity, Event event, int64_t code, const std::string &msg) = 0;
    };

    static void setObserver(std::unique_ptr<Observer> Observer);
    static std::unique_ptr<Observer> removeObserver();

    template <typename ...Args>
    static inline void Debug(Event event, Args&& ...args) {
        Record(EventSeverity::Debug, event, ::std::forward<Args>(args)...);
    }

    template <typename ...Args>
    static inline void Info(Event event, Args&& ...args) {
        Record(EventSeverity::Info, event, ::std::forward<Args>(args)...);
    }

    template <typename ...Args>
    static inline void Warning(Event event, Args&& ...args) {
        Record(EventSeverity::Warning, event, ::std::forward<Args>(args)...);
    }

    template <typename ...Args>
    static inline void Error(Event event, Args&& ...args) {
        Record(EventSeverity::Error, event, ::std::forward<Args>(args)...);
    }

    template <typename ...Args>
    static inline void Record(EventSeverity severity, Event event, Args&& ...args) {
#ifdef NDEBUG
        if (severity == EventSeverity::Debug) {
            return;
        }
#endif
        record(severity, event, ::std::forward<Args>(args)...);
    }

private:
    static void record(EventSeverity severity, Event event, const std::string &msg);
    static void record(EventSeverity severity, Event event, const char* format, ...);
    static void record(EventSeverity severity, Event event, int64_t code);
    static void record(EventSeverity severity, Event event, int64_t code, const std::string &msg);

    // This method is the data sink that must be implemented by each platform we
    // support. It should ideally output the error message in a human readable
    // format to the developer.
    static void platformRecord(EventSeverity severity, const std::string &msg);
};

}

#endif
