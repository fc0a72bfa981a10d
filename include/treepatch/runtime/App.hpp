#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/dom/Node.hpp>
#include <treepatch/runtime/EventBridge.hpp>
#include <treepatch/runtime/Interpreter.hpp>
#include <treepatch/runtime/Producer.hpp>
#include <treepatch/runtime/RuntimeOptions.hpp>
#include <treepatch/templates/TemplateRegistry.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace TP::Runtime {

/**
 * One mounted producer: a template registry, an interpreter, an event bridge
 * and the shared mutation buffer, all bound to one mount root.
 *
 * The event bridge's after-dispatch hook is wired to flushAndApply(), so a
 * native event runs the whole cycle: dispatch, flush, apply. Errors raised
 * inside that hook have no caller to return to and are kept in lastError().
 */
class App {
public:
    explicit App(Producer& producer, RuntimeOptions options = {});
    App(Producer& producer, Dom::Node::Ptr root, RuntimeOptions options = {});

    App(App const&)            = delete;
    App& operator=(App const&) = delete;

    // Rebuilds into the buffer, applies it, then installs delegation if configured.
    auto mount() -> Expected<ApplyStats>;
    // Flushes into the buffer and applies a non-empty result.
    auto flushAndApply() -> Expected<ApplyStats>;
    auto dispatchAndFlush(HandlerId handlerId, EventType type, std::optional<std::int32_t> value = std::nullopt)
        -> Expected<ApplyStats>;

    [[nodiscard]] auto mounted() const -> bool { return this->isMounted; }
    [[nodiscard]] auto lastError() const -> std::optional<Error> const& { return this->lastFailure; }
    void               clearLastError() { this->lastFailure.reset(); }

    [[nodiscard]] auto root() const -> Dom::Node::Ptr const& { return this->rootNode; }
    [[nodiscard]] auto templates() -> Templates::TemplateRegistry& { return this->registry; }
    [[nodiscard]] auto interpreter() -> Interpreter& { return this->interp; }
    [[nodiscard]] auto bridge() -> EventBridge& { return this->events; }
    [[nodiscard]] auto buffer() const -> std::span<std::uint8_t const> { return this->mutationBuffer; }
    [[nodiscard]] auto options() const -> RuntimeOptions const& { return this->runtimeOptions; }

private:
    auto apply(std::size_t length, char const* phase) -> Expected<ApplyStats>;

    RuntimeOptions              runtimeOptions;
    Producer&                   producer;
    Dom::Node::Ptr              rootNode;
    Templates::TemplateRegistry registry;
    Interpreter                 interp;
    EventBridge                 events;
    std::vector<std::uint8_t>   mutationBuffer;
    std::optional<Error>        lastFailure;
    bool                        isMounted = false;
};

} // namespace TP::Runtime
