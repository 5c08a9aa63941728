#pragma once
#include <ostream>
#include <string>

enum class EventKind
{
    Delivered,   // reply reached the original sender
    Lost,        // dropped in transit
    Unroutable   // no route from the current router
};

const char* toString(EventKind kind);

struct Event
{
    int tick = 0;
    EventKind kind = EventKind::Delivered;
    std::string connection;
    int node = 0;          // router where it happened (next hop for Lost)
    int source = 0;
    int destination = 0;
    int lifetime = 0;
    bool isReply = false;
};

// i=.. conn=.. node=.. src=.. dest=.. status=..
std::ostream& operator<<(std::ostream& os, const Event& ev);

class EventListener
{
public:
    virtual ~EventListener() = default;
    virtual void onEvent(const Event& ev) = 0;
};

class StatusPrinter : public EventListener
{
public:
    explicit StatusPrinter(std::ostream& os)
        : os_(os) {}

    void onEvent(const Event& ev) override
    {
        os_ << ev << std::endl;
    }

private:
    std::ostream& os_;
};
