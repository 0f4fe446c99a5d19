#ifndef TESSERA_TEST_FIXTURE_LOG_OBSERVER
#define TESSERA_TEST_FIXTURE_LOG_OBSERVER

#include <tessera/platform/log.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace tessera {

class FixtureLog {
public:
    struct Message {
        Message(EventSeverity severity_, Event event_, int64_t code_, const std::string& msg_);
        Message();

        bool operator==(const Message& rhs) const;

        const EventSeverity severity;
        const Event event;
        const int64_t code;
        const std::string msg;

        mutable bool checked = false;
    };

    class Observer : public Log::Observer {
    public:
        using LogMessage = Message;

        Observer(FixtureLog* log = nullptr);
        ~Observer() override;

        // Log::Observer implementation
        bool onRecord(EventSeverity severity, Event event, int64_t code, const std::string& msg) override;

        bool empty() const;
        size_t count(const Message& message, bool substring = false) const;
        std::vector<Message> unchecked() const;

    private:
        FixtureLog* log;
        std::vector<Message> messages;
        mutable std::mutex messagesMutex;
    };

    FixtureLog();

    bool empty() const;
    size_t count(const Message& message, bool substring = false) const;

    ~FixtureLog();

private:
    Observer* observer;
};

::std::ostream& operator<<(::std::ostream& os, const std::vector<FixtureLog::Observer::LogMessage>& messages);
::std::ostream& operator<<(::std::ostream& os, const FixtureLog::Observer::LogMessage& message);

using FixtureLogObserver = FixtureLog::Observer;

} // namespace tessera

#endif
