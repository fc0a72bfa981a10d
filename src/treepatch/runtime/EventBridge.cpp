#include <treepatch/runtime/EventBridge.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <format>
#include <limits>
#include <utility>

namespace TP::Runtime {

namespace {

struct EventNameEntry {
    std::string_view name;
    EventType        type;
};

constexpr EventNameEntry kEventNames[] = {
    {"click", EventType::Click},
    {"input", EventType::Input},
    {"keydown", EventType::KeyDown},
    {"keyup", EventType::KeyUp},
    {"mousemove", EventType::MouseMove},
    {"focus", EventType::Focus},
    {"blur", EventType::Blur},
    {"submit", EventType::Submit},
    {"change", EventType::Change},
    {"mousedown", EventType::MouseDown},
    {"mouseup", EventType::MouseUp},
    {"mouseenter", EventType::MouseEnter},
    {"mouseleave", EventType::MouseLeave},
};

auto carriesValue(std::string_view eventName) -> bool {
    return eventName == "input" || eventName == "change";
}

} // namespace

auto eventTypeForName(std::string_view name) -> EventType {
    for (auto const& entry : kEventNames) {
        if (entry.name == name) {
            return entry.type;
        }
    }
    return EventType::Custom;
}

auto eventTypeName(EventType type) -> std::string_view {
    for (auto const& entry : kEventNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "custom";
}

auto parseLeadingInt(std::string_view text) -> std::optional<std::int32_t> {
    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        ++pos;
    }
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    auto const digitsStart = pos;
    std::int64_t value     = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
        value = value * 10 + (text[pos] - '0');
        if (value > static_cast<std::int64_t>(std::numeric_limits<std::int32_t>::max()) + 1) {
            return std::nullopt;
        }
        ++pos;
    }
    if (pos == digitsStart) {
        return std::nullopt;
    }
    if (negative) {
        value = -value;
    }
    if (value > std::numeric_limits<std::int32_t>::max() || value < std::numeric_limits<std::int32_t>::min()) {
        return std::nullopt;
    }
    return static_cast<std::int32_t>(value);
}

EventBridge::EventBridge(Dom::Node::Ptr root, HandleTable const& handles)
    : root(std::move(root)), handles(handles), alive(std::make_shared<EventBridge*>(this)) {}

EventBridge::~EventBridge() {
    this->uninstall();
}

void EventBridge::setDispatch(DispatchFn dispatch, DispatchWithValueFn dispatchWithValue) {
    this->dispatch          = std::move(dispatch);
    this->dispatchWithValue = std::move(dispatchWithValue);
}

void EventBridge::install() {
    std::vector<std::string> names(kDefaultDelegatedEvents.begin(), kDefaultDelegatedEvents.end());
    this->install(names);
}

void EventBridge::install(std::span<std::string const> eventNames) {
    if (this->installed()) {
        this->uninstall();
    }
    std::weak_ptr<EventBridge*> token = this->alive;
    for (auto const& name : eventNames) {
        auto id = this->root->addEventListener(
            name,
            [token, name](Dom::Event& event) {
                if (auto self = token.lock()) {
                    (*self)->handleDelegated(name, event);
                }
            },
            true);
        this->rootListeners.push_back(RootListener{name, id});
    }
    tp_log(std::format("delegation installed for {} events", eventNames.size()), LogTag::Runtime, LogTag::Bridge);
}

void EventBridge::uninstall() {
    for (auto const& listener : this->rootListeners) {
        this->root->removeEventListener(listener.eventName, listener.id);
    }
    this->rootListeners.clear();
}

void EventBridge::addHandler(ElementId handle, std::string const& eventName, HandlerId handlerId) {
    this->handlers[handle].insert_or_assign(eventName, handlerId);
}

auto EventBridge::removeHandler(ElementId handle, std::string const& eventName) -> bool {
    auto it = this->handlers.find(handle);
    if (it == this->handlers.end()) {
        return false;
    }
    auto const erased = it->second.erase(eventName) > 0;
    if (it->second.empty()) {
        this->handlers.erase(it);
    }
    return erased;
}

void EventBridge::removeAllHandlers(ElementId handle) {
    this->handlers.erase(handle);
}

auto EventBridge::getHandlerId(ElementId handle, std::string const& eventName) const -> std::optional<HandlerId> {
    auto it = this->handlers.find(handle);
    if (it == this->handlers.end()) {
        return std::nullopt;
    }
    auto hit = it->second.find(eventName);
    if (hit == it->second.end()) {
        return std::nullopt;
    }
    return hit->second;
}

auto EventBridge::handlerCount() const -> std::size_t {
    std::size_t count = 0;
    for (auto const& [handle, byName] : this->handlers) {
        count += byName.size();
    }
    return count;
}

void EventBridge::clear() {
    this->handlers.clear();
}

auto EventBridge::attachListener(ElementId handle, std::string const& eventName, HandlerId handlerId)
    -> Dom::EventListener {
    this->addHandler(handle, eventName, handlerId);
    std::weak_ptr<EventBridge*> token = this->alive;
    return [token, handle, eventName](Dom::Event& event) {
        auto self = token.lock();
        if (!self) {
            return;
        }
        // Delegation owns routing while installed.
        if ((*self)->installed()) {
            return;
        }
        (*self)->handleEvent(handle, eventName, event);
    };
}

void EventBridge::detachListener(ElementId handle, std::string const& eventName) {
    this->removeHandler(handle, eventName);
}

void EventBridge::detachAll(ElementId handle) {
    this->removeAllHandlers(handle);
}

auto EventBridge::originatingHandle(Dom::Node const* target) const -> std::optional<ElementId> {
    for (auto const* node = target; node != nullptr && node != this->root.get(); node = node->parent()) {
        if (auto handle = this->handles.handleOf(node)) {
            return handle;
        }
    }
    return std::nullopt;
}

void EventBridge::handleDelegated(std::string const& eventName, Dom::Event const& event) {
    auto handle = this->originatingHandle(event.target);
    if (!handle) {
        return;
    }
    this->handleEvent(*handle, eventName, event);
}

auto EventBridge::handleEvent(ElementId handle, std::string const& eventName, Dom::Event const& event) -> bool {
    if (!this->dispatch) {
        return false;
    }
    auto handlerId = this->getHandlerId(handle, eventName);
    if (!handlerId) {
        return false;
    }
    auto const type = eventTypeForName(eventName);

    bool dispatched = false;
    if (carriesValue(eventName) && this->dispatchWithValue) {
        std::optional<std::string> raw;
        if (!event.value.empty()) {
            raw = event.value;
        } else if (event.target != nullptr) {
            raw = event.target->getAttribute("value");
        }
        if (raw) {
            if (auto value = parseLeadingInt(*raw)) {
                tp_log(std::format("dispatch {} '{}' -> handler {} value {}", handle, eventName, *handlerId, *value),
                       LogTag::Runtime, LogTag::Bridge);
                if (this->dispatchWithValue(*handlerId, type, *value)) {
                    ++this->handled;
                }
                dispatched = true;
            }
        }
    }
    if (!dispatched) {
        tp_log(std::format("dispatch {} '{}' -> handler {}", handle, eventName, *handlerId), LogTag::Runtime, LogTag::Bridge);
        if (this->dispatch(*handlerId, type)) {
            ++this->handled;
        }
    }
    ++this->dispatches;

    if (this->afterDispatch) {
        this->afterDispatch();
    }
    return true;
}

} // namespace TP::Runtime
