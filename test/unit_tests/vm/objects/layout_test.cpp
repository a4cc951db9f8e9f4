#include <catch2/catch.hpp>

#include "common/error.hpp"
#include "vm/objects/layout.hpp"

#include <string>
#include <vector>

using namespace mica;
using namespace mica::vm;

TEST_CASE("The empty layout should not contain any slots", "[layout]") {
    LayoutTable table;
    const Layout& empty = table.empty();
    REQUIRE(empty.empty());
    REQUIRE(empty.size() == 0);
    REQUIRE(empty.parent() == nullptr);
    REQUIRE_FALSE(empty.slot_of("x").has_value());
    REQUIRE(table.layout_count() == 1);
}

TEST_CASE("Extending a layout should append the name at the next free slot", "[layout]") {
    LayoutTable table;
    const Layout& x = table.extend(table.empty(), "x");
    const Layout& xy = table.extend(x, "y");

    REQUIRE(x.size() == 1);
    REQUIRE(x.slot_of("x") == 0u);
    REQUIRE(x.parent() == &table.empty());

    REQUIRE(xy.size() == 2);
    REQUIRE(xy.slot_of("x") == 0u);
    REQUIRE(xy.slot_of("y") == 1u);
    REQUIRE(xy.parent() == &x);
    REQUIRE(xy.names() == std::vector<std::string>{"x", "y"});

    // Published layouts are not modified by extensions.
    REQUIRE_FALSE(x.slot_of("y").has_value());
    REQUIRE(table.empty().size() == 0);
}

TEST_CASE("Extending the same layout with the same name should return the same layout", "[layout]") {
    LayoutTable table;
    const Layout& first = table.extend(table.empty(), "x");
    const Layout& second = table.extend(table.empty(), "x");
    REQUIRE(&first == &second);
    REQUIRE(table.empty().transition_count() == 1);
    REQUIRE(table.empty().find_transition("x") == &first);
    REQUIRE(table.layout_count() == 2);
}

TEST_CASE("Layouts should depend on the order in which names were added", "[layout]") {
    LayoutTable table;
    const Layout& xy = table.extend(table.extend(table.empty(), "x"), "y");
    const Layout& yx = table.extend(table.extend(table.empty(), "y"), "x");

    REQUIRE(&xy != &yx);
    REQUIRE(xy.slot_of("x") == 0u);
    REQUIRE(yx.slot_of("x") == 1u);
    REQUIRE(table.layout_count() == 5);
}

TEST_CASE("Extending a layout with an existing name should fail", "[layout]") {
    LayoutTable table;
    const Layout& x = table.extend(table.empty(), "x");

    REQUIRE_THROWS_AS(table.extend(x, "x"), InternalError);
    REQUIRE(x.transition_count() == 0);
}

TEST_CASE("The transition callback should observe new layouts only", "[layout]") {
    LayoutTable table;
    std::vector<std::string> added;
    table.on_transition(
        [&](const Layout& from, const Layout& to) {
            REQUIRE(to.parent() == &from);
            added.push_back(to.names().back());
        });

    const Layout& a = table.extend(table.empty(), "a");
    table.extend(table.empty(), "a");
    table.extend(a, "b");
    REQUIRE(added == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Layouts should be describable", "[layout]") {
    LayoutTable table;
    REQUIRE(describe(table.empty()) == "{}");
    const Layout& xz = table.extend(table.extend(table.empty(), "x"), "z");
    REQUIRE(describe(xz) == "{x: 0, z: 1}");
}

TEST_CASE("Layouts should only be extended by the table that created them", "[layout]") {
    LayoutTable first;
    LayoutTable second;
    const Layout& x = first.extend(first.empty(), "x");
    REQUIRE(&x.table() == &first);

    REQUIRE_THROWS_AS(second.extend(x, "y"), InternalError);
    REQUIRE_THROWS_AS(second.extend(first.empty(), "y"), InternalError);
    REQUIRE(x.transition_count() == 0);
    REQUIRE(second.layout_count() == 1);
}
