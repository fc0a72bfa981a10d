#include <treepatch/runtime/HandleTable.hpp>

#include <doctest/doctest.h>

using namespace TP;
using namespace TP::Runtime;
using TP::Dom::Node;

TEST_SUITE("runtime.handles") {
    TEST_CASE("Handle 0 is the mount point") {
        auto        root = Node::createElement("div");
        HandleTable table{root};

        CHECK(table.size() == 1);
        CHECK(table.contains(kRootHandle));
        CHECK(table.root() == root);
        auto resolved = table.resolve(kRootHandle);
        REQUIRE(resolved.has_value());
        CHECK(*resolved == root);
        CHECK(table.handleOf(root.get()) == kRootHandle);

        auto rebind = table.bind(kRootHandle, Node::createElement("p"));
        REQUIRE_FALSE(rebind.has_value());
        CHECK(rebind.error().code == Error::Code::ReservedHandle);

        auto unbind = table.unbind(kRootHandle);
        REQUIRE_FALSE(unbind.has_value());
        CHECK(unbind.error().code == Error::Code::ReservedHandle);
        CHECK(table.find(kRootHandle) == root);
    }

    TEST_CASE("Bind, rebind and unbind") {
        auto        root = Node::createElement("div");
        HandleTable table{root};
        auto        a    = Node::createElement("span");
        auto        b    = Node::createText("b");

        auto first = table.bind(10, a);
        REQUIRE(first.has_value());
        CHECK_FALSE(*first);
        CHECK(table.find(10) == a);
        CHECK(table.handleOf(a.get()) == 10u);

        SUBCASE("Rebinding a handle replaces its node") {
            auto rebound = table.bind(10, b);
            REQUIRE(rebound.has_value());
            CHECK(*rebound);
            CHECK(table.find(10) == b);
            CHECK_FALSE(table.handleOf(a.get()).has_value());
            CHECK(table.handleOf(b.get()) == 10u);
            CHECK(table.size() == 2);
        }

        SUBCASE("Binding the same node again displaces nothing") {
            auto same = table.bind(10, a);
            REQUIRE(same.has_value());
            CHECK_FALSE(*same);
        }

        SUBCASE("A node can carry a second handle") {
            REQUIRE(table.bind(11, a).has_value());
            CHECK(table.find(10) == a);
            CHECK(table.find(11) == a);
            CHECK(table.handleOf(a.get()) == 11u);
        }

        SUBCASE("Unbind") {
            auto removed = table.unbind(10);
            REQUIRE(removed.has_value());
            CHECK(*removed);
            CHECK_FALSE(table.contains(10));
            CHECK_FALSE(table.handleOf(a.get()).has_value());

            auto again = table.unbind(10);
            REQUIRE(again.has_value());
            CHECK_FALSE(*again);

            auto missing = table.resolve(10);
            REQUIRE_FALSE(missing.has_value());
            CHECK(missing.error().code == Error::Code::UnknownHandle);
        }

        SUBCASE("Null nodes are rejected") {
            auto status = table.bind(12, nullptr);
            REQUIRE_FALSE(status.has_value());
            CHECK(status.error().code == Error::Code::InvalidError);
        }
    }

    TEST_CASE("Entries do not keep nodes alive") {
        auto        root = Node::createElement("div");
        HandleTable table{root};
        {
            auto transient = Node::createText("gone soon");
            REQUIRE(table.bind(3, transient).has_value());
            CHECK(table.contains(3));
        }
        CHECK_FALSE(table.contains(3));
        CHECK(table.find(3) == nullptr);
        auto resolved = table.resolve(3);
        REQUIRE_FALSE(resolved.has_value());
        CHECK(resolved.error().code == Error::Code::UnknownHandle);

        // Rebinding a handle whose node died reports the stale entry it displaced.
        auto fresh   = Node::createElement("p");
        auto rebound = table.bind(3, fresh);
        REQUIRE(rebound.has_value());
        CHECK(*rebound);
        CHECK(table.find(3) == fresh);
        CHECK(table.handleOf(fresh.get()) == 3u);
    }

    TEST_CASE("Unknown and null lookups") {
        auto        root = Node::createElement("div");
        HandleTable table{root};
        CHECK(table.find(99) == nullptr);
        CHECK_FALSE(table.handleOf(nullptr).has_value());
        auto stranger = Node::createElement("p");
        CHECK_FALSE(table.handleOf(stranger.get()).has_value());
    }
}
