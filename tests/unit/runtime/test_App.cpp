#include <treepatch/dom/Markup.hpp>
#include <treepatch/protocol/MutationWriter.hpp>
#include <treepatch/runtime/App.hpp>

#include <doctest/doctest.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>

using namespace TP;
using namespace TP::Runtime;
using TP::Protocol::MutationWriter;

namespace {

constexpr Protocol::TemplateId kCounterTemplate = 1;
constexpr HandlerId            kIncrement       = 1;
constexpr HandlerId            kSetValue        = 2;

// Counter producer: a button that increments, a span with the count and an
// input that sets it.
struct CounterProducer final : Producer {
    std::int32_t count         = 0;
    bool         dirty         = false;
    int          rebuilds      = 0;
    int          dispatches    = 0;
    bool         corruptFlush  = false;
    bool         overrunFlush  = false;

    auto rebuild(std::span<std::uint8_t> buffer) -> std::size_t override {
        ++this->rebuilds;
        MutationWriter writer{buffer};
        writer.loadTemplate(kCounterTemplate, 0, 1)
            .newEventListener(1, "click", kIncrement)
            .loadTemplate(kCounterTemplate, 1, 2)
            .createTextNode(3, std::to_string(this->count))
            .appendChildren(2, 1)
            .loadTemplate(kCounterTemplate, 2, 4)
            .newEventListener(4, "input", kSetValue)
            .appendChildren(0, 3)
            .end();
        return writer.offset();
    }

    auto flush(std::span<std::uint8_t> buffer) -> std::size_t override {
        if (this->overrunFlush) {
            return buffer.size() + 1;
        }
        if (this->corruptFlush) {
            buffer[0] = 0x42;
            return 1;
        }
        if (!this->dirty) {
            return 0;
        }
        this->dirty = false;
        MutationWriter writer{buffer};
        writer.setText(3, std::to_string(this->count)).end();
        return writer.offset();
    }

    auto dispatch(HandlerId handlerId, EventType type, std::optional<std::int32_t> value) -> bool override {
        ++this->dispatches;
        if (handlerId == kIncrement && type == EventType::Click) {
            ++this->count;
            this->dirty = true;
            return true;
        }
        if (handlerId == kSetValue && value) {
            this->count = *value;
            this->dirty = true;
            return true;
        }
        return false;
    }
};

void registerCounterTemplate(App& app) {
    REQUIRE(app.templates().registerFromMarkup(kCounterTemplate, "<button>+</button><span></span><input>").has_value());
}

void fire(Dom::Node::Ptr const& node, std::string type, std::string value = {}) {
    Dom::Event event{.type = std::move(type), .value = std::move(value)};
    node->dispatchEvent(event);
}

auto countText(App& app) -> std::string {
    return app.interpreter().getNode(2)->textContent();
}

} // namespace

TEST_SUITE("runtime.app") {
    TEST_CASE("Mount builds the initial tree") {
        CounterProducer producer;
        App             app{producer};
        registerCounterTemplate(app);

        CHECK_FALSE(app.mounted());
        CHECK(app.root()->tagName() == "div");
        CHECK(app.buffer().size() == kDefaultBufferCapacity);

        auto stats = app.mount();
        REQUIRE(stats.has_value());
        CHECK(stats->mutations == 8);
        CHECK(stats->reachedEnd);
        CHECK(app.mounted());
        CHECK(producer.rebuilds == 1);
        CHECK(Dom::innerMarkup(*app.root()) == "<button>+</button><span>0</span><input>");
        CHECK_FALSE(app.bridge().installed());
        CHECK_FALSE(app.lastError().has_value());

        SUBCASE("An empty flush applies nothing") {
            auto flushed = app.flushAndApply();
            REQUIRE(flushed.has_value());
            CHECK(flushed->mutations == 0);
            CHECK(countText(app) == "0");
        }

        SUBCASE("dispatchAndFlush") {
            auto applied = app.dispatchAndFlush(kIncrement, EventType::Click);
            REQUIRE(applied.has_value());
            CHECK(applied->mutations == 1);
            CHECK(countText(app) == "1");

            REQUIRE(app.dispatchAndFlush(kSetValue, EventType::Input, 40).has_value());
            CHECK(countText(app) == "40");

            // Unknown handler: the producer declines and nothing is flushed.
            auto ignored = app.dispatchAndFlush(99, EventType::Click);
            REQUIRE(ignored.has_value());
            CHECK(ignored->mutations == 0);
            CHECK(countText(app) == "40");
        }

        SUBCASE("A native click runs the whole cycle") {
            fire(app.interpreter().getNode(1), "click");
            CHECK(producer.dispatches == 1);
            CHECK(countText(app) == "1");
            CHECK(app.bridge().dispatchCount() == 1);
            CHECK(app.bridge().handledCount() == 1);
        }

        SUBCASE("A native input event carries its value") {
            fire(app.interpreter().getNode(4), "input", "17");
            CHECK(countText(app) == "17");
        }

        SUBCASE("A failing flush inside the hook is kept as the last error") {
            producer.corruptFlush = true;
            fire(app.interpreter().getNode(1), "click");
            REQUIRE(app.lastError().has_value());
            CHECK(app.lastError()->code == Error::Code::ProtocolViolation);
            CHECK(countText(app) == "0");

            app.clearLastError();
            CHECK_FALSE(app.lastError().has_value());
        }

        SUBCASE("A flush longer than the buffer") {
            producer.overrunFlush = true;
            auto flushed          = app.flushAndApply();
            REQUIRE_FALSE(flushed.has_value());
            CHECK(flushed.error().code == Error::Code::CapacityExceeded);
            REQUIRE(app.lastError().has_value());
            CHECK(app.lastError()->code == Error::Code::CapacityExceeded);
        }
    }

    TEST_CASE("Delegated mount") {
        CounterProducer producer;
        RuntimeOptions  options;
        options.install_delegation = true;
        options.delegated_events   = {"click", "input"};
        App app{producer, options};
        registerCounterTemplate(app);

        REQUIRE(app.mount().has_value());
        CHECK(app.bridge().installed());
        CHECK(app.root()->listenerCount() == 2);

        fire(app.interpreter().getNode(1), "click");
        CHECK(producer.dispatches == 1);
        CHECK(countText(app) == "1");

        fire(app.interpreter().getNode(4), "input", "5");
        CHECK(producer.dispatches == 2);
        CHECK(countText(app) == "5");
    }

    TEST_CASE("Caller-supplied mount root") {
        CounterProducer producer;
        auto            root = Dom::Node::createElement("section");
        App             app{producer, root, RuntimeOptions{.buffer_capacity = 256}};
        registerCounterTemplate(app);
        CHECK(app.buffer().size() == 256);
        REQUIRE(app.mount().has_value());
        CHECK(app.root() == root);
        CHECK(root->childCount() == 3);
    }

    TEST_CASE("Invalid configuration refuses to mount") {
        CounterProducer producer;
        RuntimeOptions  options;

        SUBCASE("Zero capacity") {
            options.buffer_capacity = 0;
        }
        SUBCASE("Delegation without events") {
            options.install_delegation = true;
            options.delegated_events.clear();
        }
        SUBCASE("Bad event name") {
            options.delegated_events = {"click", "no spaces"};
        }

        App  app{producer, options};
        auto stats = app.mount();
        REQUIRE_FALSE(stats.has_value());
        CHECK(stats.error().code == Error::Code::InvalidConfiguration);
        CHECK_FALSE(app.mounted());
        CHECK(producer.rebuilds == 0);
    }

    TEST_CASE("A rebuild that fails to apply leaves the app unmounted") {
        CounterProducer producer;
        App             app{producer};
        // The counter template is never registered.
        auto stats = app.mount();
        REQUIRE_FALSE(stats.has_value());
        CHECK(stats.error().code == Error::Code::UnknownTemplate);
        CHECK_FALSE(app.mounted());
        REQUIRE(app.lastError().has_value());
        CHECK(app.lastError()->code == Error::Code::UnknownTemplate);
    }
}
