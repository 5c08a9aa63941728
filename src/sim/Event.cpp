#include "Event.hpp"

const char* toString(EventKind kind)
{
    switch (kind) {
    case EventKind::Delivered:  return "delivered";
    case EventKind::Lost:       return "lost";
    case EventKind::Unroutable: return "unroutable";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Event& ev)
{
    return os << "i=" << ev.tick
              << " conn=" << ev.connection
              << " node=" << ev.node
              << " src=" << ev.source
              << " dest=" << ev.destination
              << " status=" << toString(ev.kind);
}
