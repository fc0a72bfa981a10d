#include <treepatch/dom/Markup.hpp>
#include <treepatch/templates/Tags.hpp>
#include <treepatch/templates/TemplateRegistry.hpp>

#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace TP;
using namespace TP::Templates;
using TP::Dom::Node;

namespace {

auto counterBlueprint(TemplateId id) -> Protocol::RegisterTemplate {
    using namespace TP::Protocol;
    RegisterTemplate blueprint;
    blueprint.templateId = id;
    blueprint.name       = "counter";
    blueprint.nodes      = {
        TemplateElementNode{.tag = static_cast<std::uint8_t>(Tag::Div), .children = {1, 4}, .attrFirst = 0, .attrCount = 2},
        TemplateElementNode{.tag = static_cast<std::uint8_t>(Tag::Span), .children = {2, 3}, .attrFirst = 2, .attrCount = 0},
        TemplateTextNode{"Count: "},
        TemplateDynamicTextNode{0},
        TemplateDynamicNode{1},
    };
    blueprint.attrs       = {TemplateStaticAttr{"class", "counter"}, TemplateDynamicAttr{0}};
    blueprint.rootIndices = {0};
    return blueprint;
}

// A single chain of depth levels: nested divs ending in a text node.
auto chainBlueprint(TemplateId id, std::size_t depth) -> Protocol::RegisterTemplate {
    using namespace TP::Protocol;
    RegisterTemplate blueprint;
    blueprint.templateId = id;
    for (std::size_t i = 0; i + 1 < depth; ++i) {
        blueprint.nodes.emplace_back(TemplateElementNode{.tag      = static_cast<std::uint8_t>(Tag::Div),
                                                         .children = {static_cast<std::uint16_t>(i + 1)}});
    }
    blueprint.nodes.emplace_back(TemplateTextNode{"leaf"});
    blueprint.rootIndices = {0};
    return blueprint;
}

} // namespace

TEST_SUITE("templates.tags") {
    TEST_CASE("Tag ids map to names") {
        CHECK(tagName(Tag::Div) == "div");
        CHECK(tagName(Tag::Button) == "button");
        CHECK(tagName(Tag::Code) == "code");
        CHECK(tagName(std::uint8_t{0}) == "div");
        CHECK(tagName(std::uint8_t{kTagCount}) == kUnknownTagName);
        CHECK(tagName(Tag::Unknown) == kUnknownTagName);

        CHECK(tagIdForName("li") == static_cast<std::uint8_t>(Tag::Li));
        CHECK_FALSE(tagIdForName("blink").has_value());

        for (std::uint8_t id = 0; id < kTagCount; ++id) {
            CAPTURE(id);
            auto name = tagName(id);
            CHECK(tagIdForName(name) == id);
        }
    }
}

TEST_SUITE("templates.registry") {
    TEST_CASE("Registration from live nodes clones the input") {
        TemplateRegistry registry;
        auto             li = Node::createElement("li");
        REQUIRE(li->appendChild(Node::createText("item")).has_value());
        std::vector<Node::Ptr> roots{li, Node::createComment("tail")};

        REQUIRE(registry.registerNodes(1, roots, "row").has_value());
        CHECK(registry.has(1));
        CHECK(registry.rootCount(1) == 2u);
        CHECK(registry.name(1) == "row");
        CHECK(registry.findByName("row") == 1u);

        // Later edits to the caller's nodes do not reach the stored blueprint.
        li->setTextContent("edited");
        auto instance = registry.instantiate(1, 0);
        REQUIRE(instance.has_value());
        CHECK((*instance)->textContent() == "item");
        CHECK(*instance != li);

        std::vector<Node::Ptr> withNull{nullptr};
        auto                   rejected = registry.registerNodes(2, withNull);
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error().code == Error::Code::InvalidTemplate);
        CHECK_FALSE(registry.has(2));
    }

    TEST_CASE("Registration from markup") {
        TemplateRegistry registry;
        REQUIRE(registry.registerFromMarkup(3, "<button class=\"inc\">+</button><span><!--placeholder--></span>").has_value());
        CHECK(registry.rootCount(3) == 2u);

        auto second = registry.instantiate(3, 1);
        REQUIRE(second.has_value());
        CHECK(Dom::serializeMarkup(**second) == "<span><!--placeholder--></span>");

        auto bad = registry.registerFromMarkup(4, "<div>");
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::MalformedInput);
        CHECK_FALSE(registry.has(4));
    }

    TEST_CASE("Registration from a blueprint record") {
        TemplateRegistry registry;
        REQUIRE(registry.registerFromBlueprint(counterBlueprint(7)).has_value());
        CHECK(registry.name(7) == "counter");

        auto instance = registry.instantiate(7, 0);
        REQUIRE(instance.has_value());
        auto const& div = *instance;
        CHECK(div->tagName() == "div");
        CHECK(div->getAttribute("class") == "counter");
        CHECK(div->attributes().size() == 1);
        REQUIRE(div->childCount() == 2);

        auto span = div->childAt(0);
        CHECK(span->tagName() == "span");
        REQUIRE(span->childCount() == 2);
        CHECK(span->childAt(0)->data() == "Count: ");
        CHECK(span->childAt(1)->isText());
        CHECK(span->childAt(1)->data().empty());

        auto slot = div->childAt(1);
        CHECK(slot->isComment());
        CHECK(slot->data() == TemplateRegistry::kPlaceholderText);
    }

    TEST_CASE("Invalid blueprints register nothing") {
        TemplateRegistry registry;
        auto             blueprint = counterBlueprint(9);

        SUBCASE("Root index outside the node table") {
            blueprint.rootIndices = {5};
        }
        SUBCASE("Child index outside the node table") {
            std::get<Protocol::TemplateElementNode>(blueprint.nodes[1]).children.push_back(40);
        }
        SUBCASE("Attribute range outside the attribute table") {
            std::get<Protocol::TemplateElementNode>(blueprint.nodes[0]).attrCount = 3;
        }
        SUBCASE("Cycle") {
            std::get<Protocol::TemplateElementNode>(blueprint.nodes[1]).children.push_back(0);
        }

        auto result = registry.registerFromBlueprint(blueprint);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::InvalidTemplate);
        CHECK_FALSE(registry.has(9));
    }

    TEST_CASE("Shared subtrees are not cycles") {
        TemplateRegistry registry;
        auto             blueprint = counterBlueprint(10);
        // Both the div and the span reference the text node at index 2.
        std::get<Protocol::TemplateElementNode>(blueprint.nodes[0]).children.push_back(2);
        REQUIRE(registry.registerFromBlueprint(blueprint).has_value());
        auto instance = registry.instantiate(10, 0);
        REQUIRE(instance.has_value());
        CHECK((*instance)->childCount() == 3);
        CHECK((*instance)->childAt(2)->data() == "Count: ");
    }

    TEST_CASE("Blueprint depth and size limits") {
        TemplateRegistry registry;

        SUBCASE("A chain at the depth limit") {
            REQUIRE(registry.registerFromBlueprint(chainBlueprint(11, TemplateRegistry::kMaxDepth)).has_value());
            auto instance = registry.instantiate(11, 0);
            REQUIRE(instance.has_value());
            std::size_t levels = 1;
            auto        node   = *instance;
            while (node->childCount() > 0) {
                node = node->childAt(0);
                ++levels;
            }
            CHECK(levels == TemplateRegistry::kMaxDepth);
            CHECK(node->data() == "leaf");
        }

        SUBCASE("One level deeper") {
            auto result = registry.registerFromBlueprint(chainBlueprint(12, TemplateRegistry::kMaxDepth + 1));
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidTemplate);
            REQUIRE(result.error().message.has_value());
            CHECK(result.error().message->find("deeper than 1024") != std::string::npos);
            CHECK_FALSE(registry.has(12));
        }

        SUBCASE("Shared subtrees that expand too far") {
            // Every level references the next one twice, doubling the instance size.
            Protocol::RegisterTemplate blueprint;
            blueprint.templateId = 13;
            for (std::uint16_t i = 0; i < 20; ++i) {
                auto const next = static_cast<std::uint16_t>(i + 1);
                blueprint.nodes.emplace_back(
                    Protocol::TemplateElementNode{.tag = static_cast<std::uint8_t>(Tag::Div), .children = {next, next}});
            }
            blueprint.nodes.emplace_back(Protocol::TemplateTextNode{"x"});
            blueprint.rootIndices = {0};

            auto result = registry.registerFromBlueprint(blueprint);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidTemplate);
            REQUIRE(result.error().message.has_value());
            CHECK(result.error().message->find("more than 65536 nodes") != std::string::npos);
            CHECK_FALSE(registry.has(13));
        }
    }

    TEST_CASE("Instances never alias each other") {
        TemplateRegistry registry;
        REQUIRE(registry.registerFromBlueprint(counterBlueprint(1)).has_value());

        auto first  = registry.instantiate(1, 0);
        auto second = registry.instantiate(1, 0);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(*first != *second);
        CHECK((*first)->isEqualNode(**second));

        (*first)->childAt(0)->childAt(1)->setData("5");
        (*first)->setAttribute("class", "changed");
        auto third = registry.instantiate(1, 0);
        REQUIRE(third.has_value());
        CHECK((*third)->isEqualNode(**second));
        CHECK((*third)->getAttribute("class") == "counter");
    }

    TEST_CASE("Lookup errors") {
        TemplateRegistry registry;
        REQUIRE(registry.registerFromMarkup(1, "<p></p>").has_value());

        auto unknown = registry.instantiate(2, 0);
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::UnknownTemplate);

        auto range = registry.instantiate(1, 1);
        REQUIRE_FALSE(range.has_value());
        CHECK(range.error().code == Error::Code::TemplateRootRange);

        CHECK_FALSE(registry.rootCount(2).has_value());
        CHECK_FALSE(registry.name(2).has_value());
        CHECK_FALSE(registry.findByName("").has_value());
    }

    TEST_CASE("Re-registering an id replaces it") {
        TemplateRegistry registry;
        REQUIRE(registry.registerFromMarkup(5, "<p>old</p>", "first").has_value());
        REQUIRE(registry.registerFromMarkup(5, "<em>new</em><em>two</em>", "second").has_value());
        CHECK(registry.size() == 1);
        CHECK(registry.rootCount(5) == 2u);
        CHECK(registry.name(5) == "second");
        CHECK_FALSE(registry.findByName("first").has_value());

        REQUIRE(registry.registerFromMarkup(2, "<p></p>").has_value());
        CHECK(registry.ids() == std::vector<TemplateId>{2, 5});

        registry.clear();
        CHECK(registry.size() == 0);
        CHECK_FALSE(registry.has(5));
    }
}
