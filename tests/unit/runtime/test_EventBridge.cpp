#include <treepatch/protocol/MutationWriter.hpp>
#include <treepatch/runtime/EventBridge.hpp>
#include <treepatch/runtime/Interpreter.hpp>

#include <doctest/doctest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace TP;
using namespace TP::Runtime;
using TP::Dom::Node;
using TP::Protocol::MutationWriter;

namespace {

struct BridgeFixture {
    Node::Ptr                   root = Node::createElement("div");
    Templates::TemplateRegistry templates;
    Interpreter                 interpreter{root, templates};
    EventBridge                 bridge{root, interpreter.handleTable()};

    std::vector<std::pair<HandlerId, EventType>>               calls;
    std::vector<std::tuple<HandlerId, EventType, std::int32_t>> valueCalls;
    bool                                                       reportHandled = true;

    BridgeFixture() {
        this->interpreter.setListenerSink(&this->bridge);
        this->bridge.setDispatch([this](HandlerId id, EventType type) {
            this->calls.emplace_back(id, type);
            return this->reportHandled;
        });
        REQUIRE(this->templates.registerFromMarkup(1, "<button><span>+</span></button><input value=\"12\">").has_value());
        REQUIRE(this->run([](MutationWriter& w) {
                        w.loadTemplate(1, 0, 3)
                            .newEventListener(3, "click", 7)
                            .loadTemplate(1, 1, 4)
                            .newEventListener(4, "input", 8)
                            .newEventListener(4, "change", 9)
                            .appendChildren(0, 2);
                    }).has_value());
    }

    template <typename Build>
    auto run(Build&& build) -> Expected<ApplyStats> {
        std::vector<std::uint8_t> buffer(1024);
        MutationWriter            writer{buffer};
        build(writer);
        REQUIRE(writer.ok());
        return this->interpreter.applyMutations(buffer, 0, writer.offset());
    }

    void enableValues() {
        this->bridge.setDispatch(
            [this](HandlerId id, EventType type) {
                this->calls.emplace_back(id, type);
                return true;
            },
            [this](HandlerId id, EventType type, std::int32_t value) {
                this->valueCalls.emplace_back(id, type, value);
                return true;
            });
    }

    [[nodiscard]] auto button() const -> Node::Ptr { return this->interpreter.getNode(3); }
    [[nodiscard]] auto input() const -> Node::Ptr { return this->interpreter.getNode(4); }
};

void fire(Node::Ptr const& node, std::string type, std::string value = {}) {
    Dom::Event event{.type = std::move(type), .value = std::move(value)};
    node->dispatchEvent(event);
}

using Calls = std::vector<std::pair<HandlerId, EventType>>;

} // namespace

TEST_SUITE("runtime.eventbridge") {
    TEST_CASE("Event names") {
        for (std::size_t i = 0; i < kDefaultDelegatedEvents.size(); ++i) {
            auto const name = kDefaultDelegatedEvents[i];
            CAPTURE(name);
            auto const type = eventTypeForName(name);
            CHECK(static_cast<std::size_t>(type) == i);
            CHECK(eventTypeName(type) == name);
        }
        CHECK(eventTypeForName("dblclick") == EventType::Custom);
        CHECK(eventTypeForName("") == EventType::Custom);
        CHECK(eventTypeName(EventType::Custom) == "custom");
    }

    TEST_CASE("parseLeadingInt") {
        CHECK(parseLeadingInt("42") == 42);
        CHECK(parseLeadingInt("42abc") == 42);
        CHECK(parseLeadingInt("-7") == -7);
        CHECK(parseLeadingInt("+5") == 5);
        CHECK(parseLeadingInt("  19 apples") == 19);
        CHECK(parseLeadingInt("2147483647") == 2147483647);
        CHECK(parseLeadingInt("-2147483648") == std::numeric_limits<std::int32_t>::min());
        CHECK_FALSE(parseLeadingInt("2147483648").has_value());
        CHECK_FALSE(parseLeadingInt("99999999999999999999").has_value());
        CHECK_FALSE(parseLeadingInt("").has_value());
        CHECK_FALSE(parseLeadingInt("abc").has_value());
        CHECK_FALSE(parseLeadingInt("-").has_value());
        CHECK_FALSE(parseLeadingInt(" - 3").has_value());
    }

    TEST_CASE_FIXTURE(BridgeFixture, "Per-node routing") {
        CHECK_FALSE(bridge.installed());
        CHECK(bridge.getHandlerId(3, "click") == 7u);
        CHECK(bridge.handlerCount() == 3);

        fire(button(), "click");
        CHECK(calls == Calls{{7, EventType::Click}});
        CHECK(bridge.dispatchCount() == 1);
        CHECK(bridge.handledCount() == 1);

        SUBCASE("Events on descendants bubble to the bound node once") {
            fire(button()->childAt(0), "click");
            CHECK(calls.size() == 2);
            CHECK(calls.back() == std::pair{HandlerId{7}, EventType::Click});
        }

        SUBCASE("Events without a handler are ignored") {
            fire(input(), "click");
            fire(button(), "keydown");
            CHECK(calls.size() == 1);
            CHECK(bridge.dispatchCount() == 1);
        }

        SUBCASE("Unhandled dispatches are counted apart") {
            reportHandled = false;
            fire(button(), "click");
            CHECK(bridge.dispatchCount() == 2);
            CHECK(bridge.handledCount() == 1);
        }

        SUBCASE("RemoveEventListener silences the node") {
            REQUIRE(run([](MutationWriter& w) { w.removeEventListener(3, "click"); }).has_value());
            fire(button(), "click");
            CHECK(calls.size() == 1);
            CHECK(bridge.dispatchCount() == 1);
        }

        SUBCASE("Custom event names") {
            REQUIRE(run([](MutationWriter& w) { w.newEventListener(3, "dblclick", 11); }).has_value());
            fire(button(), "dblclick");
            CHECK(calls.back() == std::pair{HandlerId{11}, EventType::Custom});
        }
    }

    TEST_CASE_FIXTURE(BridgeFixture, "Delegated routing") {
        bridge.install();
        CHECK(bridge.installed());
        CHECK(root->listenerCount("click") == 1);

        fire(button(), "click");
        CHECK(calls == Calls{{7, EventType::Click}});

        SUBCASE("The nearest bound ancestor reports") {
            fire(button()->childAt(0), "click");
            CHECK(calls.size() == 2);
            CHECK(calls.back().first == 7);
        }

        SUBCASE("Events on the mount point or unbound nodes report nothing") {
            fire(root, "click");
            auto stray = Node::createElement("p");
            REQUIRE(root->appendChild(stray).has_value());
            fire(stray, "click");
            CHECK(calls.size() == 1);
        }

        SUBCASE("Reinstalling does not duplicate root listeners") {
            std::vector<std::string> names{"click", "input"};
            bridge.install(names);
            CHECK(root->listenerCount("click") == 1);
            CHECK(root->listenerCount("keydown") == 0);
            fire(button(), "click");
            CHECK(calls.size() == 2);
        }

        SUBCASE("Uninstall hands routing back to the nodes") {
            bridge.uninstall();
            CHECK_FALSE(bridge.installed());
            CHECK(root->listenerCount() == 0);
            fire(button(), "click");
            CHECK(calls.size() == 2);
        }

        SUBCASE("Events outside the installed set go unreported") {
            std::vector<std::string> names{"input"};
            bridge.install(names);
            fire(button(), "click");
            CHECK(calls.size() == 1);
        }
    }

    TEST_CASE_FIXTURE(BridgeFixture, "Value-carrying events") {
        enableValues();

        SUBCASE("Payload on the event") {
            fire(input(), "input", "42abc");
            CHECK(valueCalls == std::vector<std::tuple<HandlerId, EventType, std::int32_t>>{{8, EventType::Input, 42}});
            CHECK(calls.empty());
        }

        SUBCASE("Falls back to the value attribute") {
            fire(input(), "change");
            CHECK(valueCalls == std::vector<std::tuple<HandlerId, EventType, std::int32_t>>{{9, EventType::Change, 12}});
        }

        SUBCASE("Non-numeric values dispatch without a value") {
            input()->setAttribute("value", "abc");
            fire(input(), "input");
            CHECK(valueCalls.empty());
            CHECK(calls == Calls{{8, EventType::Input}});
        }

        SUBCASE("Delegated mode reads the same payload") {
            bridge.install();
            fire(input(), "input", "-3");
            REQUIRE(valueCalls.size() == 1);
            CHECK(std::get<2>(valueCalls[0]) == -3);
        }

        SUBCASE("Clicks never carry a value") {
            fire(button(), "click", "5");
            CHECK(valueCalls.empty());
            CHECK(calls.size() == 1);
        }

        CHECK(bridge.dispatchCount() == valueCalls.size() + calls.size());
    }

    TEST_CASE_FIXTURE(BridgeFixture, "Without a value callback input events dispatch plainly") {
        fire(input(), "input", "7");
        CHECK(calls == Calls{{8, EventType::Input}});
    }

    TEST_CASE_FIXTURE(BridgeFixture, "After-dispatch hook") {
        int after = 0;
        bridge.onAfterDispatch([&after] { ++after; });
        fire(button(), "click");
        fire(input(), "focus");
        fire(input(), "change");
        CHECK(after == 2);
    }

    TEST_CASE_FIXTURE(BridgeFixture, "Handler map follows the interpreter") {
        SUBCASE("RemoveEventListener") {
            REQUIRE(run([](MutationWriter& w) { w.removeEventListener(4, "input"); }).has_value());
            CHECK_FALSE(bridge.getHandlerId(4, "input").has_value());
            CHECK(bridge.getHandlerId(4, "change") == 9u);
            CHECK(bridge.handlerCount() == 2);
        }

        SUBCASE("Replacing a listener updates the handler id") {
            REQUIRE(run([](MutationWriter& w) { w.newEventListener(3, "click", 70); }).has_value());
            fire(button(), "click");
            CHECK(calls == Calls{{70, EventType::Click}});
        }

        SUBCASE("Remove forgets every handler of the node") {
            auto field = this->input();
            REQUIRE(run([](MutationWriter& w) { w.remove(4); }).has_value());
            CHECK_FALSE(bridge.getHandlerId(4, "change").has_value());
            CHECK(bridge.handlerCount() == 1);
            fire(field, "change");
            CHECK(calls.empty());
        }
    }

    TEST_CASE_FIXTURE(BridgeFixture, "A handle reused below a removed ancestor carries no handler") {
        SUBCASE("Per-node routing") {}
        SUBCASE("Delegated routing") {
            bridge.install();
        }

        REQUIRE(run([](MutationWriter& w) {
                    w.loadTemplate(1, 0, 5).assignId({0}, 6).newEventListener(6, "click", 11).appendChildren(0, 1);
                }).has_value());
        CHECK(bridge.handlerCount() == 4);
        CHECK(interpreter.listenerCount() == 4);

        REQUIRE(run([](MutationWriter& w) { w.remove(5); }).has_value());
        CHECK(interpreter.getNode(6) == nullptr);
        CHECK_FALSE(bridge.getHandlerId(6, "click").has_value());
        CHECK(bridge.handlerCount() == 3);
        CHECK(interpreter.listenerCount() == 3);

        REQUIRE(run([](MutationWriter& w) { w.loadTemplate(1, 0, 6).appendChildren(0, 1); }).has_value());
        auto fresh = interpreter.getNode(6);
        REQUIRE(fresh != nullptr);
        fire(fresh, "click");
        fire(fresh->childAt(0), "click");
        CHECK(calls.empty());

        fire(button(), "click");
        CHECK(calls == Calls{{7, EventType::Click}});
    }

    TEST_CASE_FIXTURE(BridgeFixture, "Rebinding a live handle forgets its handlers") {
        SUBCASE("Per-node routing") {}
        SUBCASE("Delegated routing") {
            bridge.install();
        }

        auto previous = button();
        REQUIRE(run([](MutationWriter& w) { w.loadTemplate(1, 0, 3).appendChildren(0, 1); }).has_value());
        REQUIRE(button() != previous);
        CHECK(root->childCount() == 3);
        CHECK_FALSE(bridge.getHandlerId(3, "click").has_value());
        CHECK(bridge.handlerCount() == 2);
        CHECK(interpreter.listenerCount(3) == 0);
        CHECK(previous->listenerCount() == 0);

        fire(previous, "click");
        fire(button(), "click");
        CHECK(calls.empty());

        fire(input(), "change");
        CHECK(calls == Calls{{9, EventType::Change}});
    }

    TEST_CASE("Direct handler map operations") {
        auto        root = Node::createElement("div");
        HandleTable handles{root};
        EventBridge bridge{root, handles};

        bridge.addHandler(5, "click", 1);
        bridge.addHandler(5, "input", 2);
        bridge.addHandler(6, "click", 3);
        CHECK(bridge.handlerCount() == 3);
        bridge.addHandler(5, "click", 4);
        CHECK(bridge.getHandlerId(5, "click") == 4u);
        CHECK(bridge.handlerCount() == 3);

        CHECK(bridge.removeHandler(5, "input"));
        CHECK_FALSE(bridge.removeHandler(5, "input"));
        CHECK_FALSE(bridge.removeHandler(9, "click"));

        bridge.removeAllHandlers(5);
        CHECK_FALSE(bridge.getHandlerId(5, "click").has_value());
        CHECK(bridge.handlerCount() == 1);

        bridge.clear();
        CHECK(bridge.handlerCount() == 0);

        SUBCASE("handleEvent needs a dispatch callback and a handler") {
            bridge.addHandler(6, "click", 3);
            Dom::Event event{.type = "click"};
            CHECK_FALSE(bridge.handleEvent(6, "click", event));

            int count = 0;
            bridge.setDispatch([&count](HandlerId, EventType) {
                ++count;
                return true;
            });
            CHECK_FALSE(bridge.handleEvent(7, "click", event));
            CHECK(bridge.handleEvent(6, "click", event));
            CHECK(count == 1);
        }
    }

    TEST_CASE("Listeners go inert once the bridge is gone") {
        auto               root = Node::createElement("div");
        HandleTable        handles{root};
        Dom::EventListener listener;
        int                count = 0;
        {
            EventBridge bridge{root, handles};
            bridge.setDispatch([&count](HandlerId, EventType) {
                ++count;
                return true;
            });
            bridge.install();
            CHECK(root->listenerCount() == kDefaultDelegatedEvents.size());
            bridge.uninstall();

            listener = bridge.attachListener(1, "click", 5);
            Dom::Event event{.type = "click"};
            listener(event);
            CHECK(count == 1);

            bridge.install();
        }
        CHECK(root->listenerCount() == 0);
        Dom::Event event{.type = "click"};
        listener(event);
        CHECK(count == 1);
    }
}
