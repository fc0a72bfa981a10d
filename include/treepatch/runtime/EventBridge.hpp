#pragma once

#include <treepatch/dom/Node.hpp>
#include <treepatch/protocol/Opcode.hpp>
#include <treepatch/runtime/EventType.hpp>
#include <treepatch/runtime/HandleTable.hpp>
#include <treepatch/runtime/ListenerSink.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TP::Runtime {

using Protocol::HandlerId;

using DispatchFn          = std::function<bool(HandlerId, EventType)>;
using DispatchWithValueFn = std::function<bool(HandlerId, EventType, std::int32_t)>;
using AfterDispatchFn     = std::function<void()>;

/**
 * Routes native events back to producer handler ids.
 *
 * The interpreter reports (handle, event name, handler id) through the
 * ListenerSink interface; the bridge keeps that as a nested map. Two routing
 * modes exist:
 *  - per-node: the listener attached to each node reports its own handle;
 *  - delegated (after install()): one capture listener per event name on the
 *    mount root resolves the originating handle from the event target, and
 *    the per-node listeners stand down.
 * Exactly one path reports any given native event. Dispatch is synchronous;
 * the after-dispatch hook runs after every dispatch call.
 */
class EventBridge final : public ListenerSink {
public:
    EventBridge(Dom::Node::Ptr root, HandleTable const& handles);
    ~EventBridge() override;

    EventBridge(EventBridge const&)            = delete;
    EventBridge& operator=(EventBridge const&) = delete;

    void setDispatch(DispatchFn dispatch, DispatchWithValueFn dispatchWithValue = {});
    void onAfterDispatch(AfterDispatchFn callback) { this->afterDispatch = std::move(callback); }

    void install(std::span<std::string const> eventNames);
    void install();
    void uninstall();
    [[nodiscard]] auto installed() const -> bool { return !this->rootListeners.empty(); }

    // Handler map
    void addHandler(ElementId handle, std::string const& eventName, HandlerId handlerId);
    auto removeHandler(ElementId handle, std::string const& eventName) -> bool;
    void removeAllHandlers(ElementId handle);
    [[nodiscard]] auto getHandlerId(ElementId handle, std::string const& eventName) const -> std::optional<HandlerId>;
    [[nodiscard]] auto handlerCount() const -> std::size_t;
    void clear();

    // ListenerSink
    auto attachListener(ElementId handle, std::string const& eventName, HandlerId handlerId)
        -> Dom::EventListener override;
    void detachListener(ElementId handle, std::string const& eventName) override;
    void detachAll(ElementId handle) override;

    // Routes one native event observed on node `handle`. Returns true when a handler was dispatched.
    auto handleEvent(ElementId handle, std::string const& eventName, Dom::Event const& event) -> bool;

    [[nodiscard]] auto dispatchCount() const -> std::size_t { return this->dispatches; }
    // Dispatches the producer reported as handled.
    [[nodiscard]] auto handledCount() const -> std::size_t { return this->handled; }

private:
    struct RootListener {
        std::string     eventName;
        Dom::ListenerId id = 0;
    };

    auto originatingHandle(Dom::Node const* target) const -> std::optional<ElementId>;
    void handleDelegated(std::string const& eventName, Dom::Event const& event);

    Dom::Node::Ptr                                                            root;
    HandleTable const&                                                        handles;
    phmap::flat_hash_map<ElementId, phmap::flat_hash_map<std::string, HandlerId>> handlers;
    DispatchFn                                                                dispatch;
    DispatchWithValueFn                                                       dispatchWithValue;
    AfterDispatchFn                                                           afterDispatch;
    std::vector<RootListener>                                                 rootListeners;
    std::size_t                                                               dispatches = 0;
    std::size_t                                                               handled    = 0;
    // Listeners handed to nodes hold a weak reference; they go inert once the bridge is gone.
    std::shared_ptr<EventBridge*>                                             alive;
};

// Leading base-10 integer of text (optional whitespace and sign), if any.
[[nodiscard]] auto parseLeadingInt(std::string_view text) -> std::optional<std::int32_t>;

} // namespace TP::Runtime
