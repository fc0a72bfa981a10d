#pragma once

#include <treepatch/dom/Node.hpp>
#include <treepatch/protocol/Opcode.hpp>

#include <string>

namespace TP::Runtime {

/**
 * ListenerSink receives listener bookkeeping from the interpreter.
 *
 * attachListener() returns the native callback the interpreter installs on
 * the node for (handle, event name); the interpreter owns that callback's
 * lifetime on the node and detaches it before attaching a replacement.
 * detachListener()/detachAll() mirror removal so the sink can forget its
 * handler ids.
 */
struct ListenerSink {
    virtual ~ListenerSink() = default;

    virtual auto attachListener(Protocol::ElementId handle, std::string const& eventName, Protocol::HandlerId handlerId)
        -> Dom::EventListener = 0;
    virtual void detachListener(Protocol::ElementId handle, std::string const& eventName) = 0;
    virtual void detachAll(Protocol::ElementId handle) = 0;
};

} // namespace TP::Runtime
