#include "log/TaggedLogger.hpp"

#include <treepatch/protocol/MutationWriter.hpp>
#include <treepatch/runtime/App.hpp>
#include <treepatch/runtime/Interpreter.hpp>

#include <doctest/doctest.h>

#include <cstdint>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

using namespace TP;

namespace {

// Captures logger output and puts the process-wide logger back the way tests expect it.
struct CapturedLog {
    std::ostringstream stream;

    CapturedLog() {
        logger().setOutput(&this->stream);
        logger().setEnabledTags({});
        logger().setSkipTags({LogTag::Trace});
        set_logging_enabled(true);
    }

    ~CapturedLog() {
        set_logging_enabled(false);
        logger().setOutput(nullptr);
        logger().setEnabledTags({});
        logger().setSkipTags({LogTag::Trace});
    }

    auto text() -> std::string {
        logger().flush();
        return this->stream.str();
    }
};

struct IdleProducer final : Runtime::Producer {
    auto rebuild(std::span<std::uint8_t>) -> std::size_t override { return 0; }
    auto flush(std::span<std::uint8_t>) -> std::size_t override { return 0; }
    auto dispatch(Protocol::HandlerId, Runtime::EventType, std::optional<std::int32_t>) -> bool override {
        return false;
    }
};

auto contains(std::string const& text, std::string const& needle) -> bool {
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST_SUITE("log.taggedlogger") {
    TEST_CASE("Disabled logging writes nothing and skips the message expression") {
        CapturedLog log;
        set_logging_enabled(false);

        int evaluated = 0;
        tp_log((++evaluated, std::string{"quiet"}), LogTag::Runtime);
        CHECK(evaluated == 0);
        CHECK(log.text().empty());
    }

    TEST_CASE("A message carries its tags, thread and call site") {
        CapturedLog log;
        set_thread_name("LoggerTest");
        tp_log("decoder stopped", LogTag::Protocol, LogTag::Error);
        set_thread_name("TestMain");

        auto const text = log.text();
        CHECK(contains(text, "[Error][Protocol]"));
        CHECK(contains(text, "[LoggerTest]"));
        CHECK(contains(text, "log/test_TaggedLogger.cpp:"));
        CHECK(contains(text, "decoder stopped\n"));
    }

    TEST_CASE("Enabled tags") {
        CapturedLog log;
        logger().setEnabledTags({LogTag::Runtime});

        tp_log("runtime only", LogTag::Runtime);
        tp_log("runtime error", LogTag::Runtime, LogTag::Error);
        tp_log("protocol", LogTag::Protocol);

        auto const text = log.text();
        CHECK(contains(text, "runtime only"));
        CHECK_FALSE(contains(text, "runtime error"));
        CHECK_FALSE(contains(text, "protocol"));
    }

    TEST_CASE("Trace lines are skipped until the skip set is cleared") {
        CapturedLog log;
        tp_log("first trace", LogTag::Runtime, LogTag::Trace);
        CHECK(log.text().empty());

        logger().setSkipTags({});
        tp_log("second trace", LogTag::Runtime, LogTag::Trace);
        auto const text = log.text();
        CHECK_FALSE(contains(text, "first trace"));
        CHECK(contains(text, "[Runtime][Trace]"));
        CHECK(contains(text, "second trace"));
    }

    TEST_CASE("The interpreter logs applied buffers and failures") {
        CapturedLog                 log;
        auto                        root = Dom::Node::createElement("div");
        Templates::TemplateRegistry templates;
        Runtime::Interpreter        interpreter{root, templates};

        std::vector<std::uint8_t> buffer(64);
        Protocol::MutationWriter  writer{buffer};
        writer.createTextNode(1, "a").appendChildren(0, 1);
        REQUIRE(writer.ok());

        SUBCASE("Applied") {
            REQUIRE(interpreter.applyMutations(buffer, 0, writer.offset()).has_value());
            auto const text = log.text();
            CHECK(contains(text, "[Runtime]"));
            CHECK(contains(text, "applied 2 mutations"));
            CHECK_FALSE(contains(text, "CreateTextNode"));
        }

        SUBCASE("Per-record trace") {
            logger().setSkipTags({});
            REQUIRE(interpreter.applyMutations(buffer, 0, writer.offset()).has_value());
            auto const text = log.text();
            CHECK(contains(text, "#0 CreateTextNode"));
            CHECK(contains(text, "#1 AppendChildren"));
        }

        SUBCASE("Decode failure") {
            std::vector<std::uint8_t> corrupt{0x42};
            REQUIRE_FALSE(interpreter.applyMutations(corrupt).has_value());
            auto const text = log.text();
            CHECK(contains(text, "[Error][Protocol]"));
            CHECK(contains(text, "[Error][Runtime]"));
            CHECK(contains(text, "applyMutations aborted"));
        }
    }

    TEST_CASE("RuntimeOptions switch logging on") {
        set_logging_enabled(false);
        {
            IdleProducer producer;
            Runtime::App quiet{producer};
            CHECK_FALSE(logger().enabled());
        }

        CapturedLog log;
        set_logging_enabled(false);
        IdleProducer           producer;
        Runtime::RuntimeOptions options;
        options.logging_enabled = true;
        Runtime::App app{producer, options};
        CHECK(logger().enabled());

        auto stats = app.dispatchAndFlush(3, Runtime::EventType::Click);
        REQUIRE(stats.has_value());
        CHECK(contains(log.text(), "handler 3 not handled by producer"));
    }
}
