#include <treepatch/runtime/App.hpp>

#include "log/TaggedLogger.hpp"

#include <format>
#include <utility>

namespace TP::Runtime {

App::App(Producer& producer, RuntimeOptions options)
    : App(producer, Dom::Node::createElement("div"), std::move(options)) {}

App::App(Producer& producer, Dom::Node::Ptr root, RuntimeOptions options)
    : runtimeOptions(std::move(options)),
      producer(producer),
      rootNode(std::move(root)),
      interp(this->rootNode, this->registry),
      events(this->rootNode, this->interp.handleTable()),
      mutationBuffer(this->runtimeOptions.buffer_capacity, 0) {
    if (this->runtimeOptions.logging_enabled) {
        set_logging_enabled(true);
    }
    this->interp.setListenerSink(&this->events);
    this->events.setDispatch(
        [this](HandlerId handlerId, EventType type) {
            return this->producer.dispatch(handlerId, type, std::nullopt);
        },
        [this](HandlerId handlerId, EventType type, std::int32_t value) {
            return this->producer.dispatch(handlerId, type, value);
        });
    this->events.onAfterDispatch([this]() {
        auto applied = this->flushAndApply();
        if (!applied) {
            tp_log("flush after dispatch failed: " + describeError(applied.error()), LogTag::Runtime, LogTag::Error);
            this->lastFailure = applied.error();
        }
    });
}

auto App::apply(std::size_t length, char const* phase) -> Expected<ApplyStats> {
    if (length > this->mutationBuffer.size()) {
        Error error{Error::Code::CapacityExceeded,
                    std::format("{} reported {} bytes but the buffer holds {}", phase, length, this->mutationBuffer.size())};
        this->lastFailure = error;
        return std::unexpected(std::move(error));
    }
    auto stats = this->interp.applyMutations(this->mutationBuffer, 0, length);
    if (!stats) {
        this->lastFailure = stats.error();
        return stats;
    }
    tp_log(std::format("{} applied {} mutations", phase, stats->mutations), LogTag::Runtime);
    return stats;
}

auto App::mount() -> Expected<ApplyStats> {
    if (auto problem = ValidateRuntimeOptions(this->runtimeOptions)) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, *problem});
    }
    auto const written = this->producer.rebuild(this->mutationBuffer);
    auto       stats   = this->apply(written, "rebuild");
    if (!stats) {
        return stats;
    }
    if (this->runtimeOptions.install_delegation) {
        this->events.install(this->runtimeOptions.delegated_events);
    }
    this->isMounted = true;
    return stats;
}

auto App::flushAndApply() -> Expected<ApplyStats> {
    auto const written = this->producer.flush(this->mutationBuffer);
    if (written == 0) {
        return ApplyStats{};
    }
    return this->apply(written, "flush");
}

auto App::dispatchAndFlush(HandlerId handlerId, EventType type, std::optional<std::int32_t> value)
    -> Expected<ApplyStats> {
    if (!this->producer.dispatch(handlerId, type, value)) {
        tp_log(std::format("handler {} not handled by producer", handlerId), LogTag::Runtime);
    }
    return this->flushAndApply();
}

} // namespace TP::Runtime
