#include <catch2/catch.hpp>

#include "bindings.hpp"
#include "test_support.hpp"

#include <stdexcept>

TEST_CASE("Mapping table set, get and clear", "[bindings]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);

    CHECK(table.empty());
    CHECK_FALSE(table.get("Horn"));

    table.set("Horn", button_at(0, 3));
    auto horn = table.get("Horn");
    REQUIRE(horn);
    CHECK(horn->locator == button_at(0, 3));
    CHECK_FALSE(horn->reverse_axis);

    // A function holds at most one locator
    table.set("Horn", button_at(1, 0));
    CHECK(table.get("Horn")->locator == button_at(1, 0));
    CHECK(table.all().size() == 1);

    CHECK(table.clear("Horn"));
    CHECK_FALSE(table.clear("Horn"));
    CHECK(table.empty());
}

TEST_CASE("Mapping table rejects unknown functions", "[bindings]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);

    CHECK_THROWS_AS(table.set("Warp Drive", button_at(0, 0)), std::logic_error);
    CHECK_THROWS_AS(table.get("Warp Drive"), std::logic_error);
}

TEST_CASE("Locator lookups", "[bindings]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);

    table.set("Horn", button_at(0, 1));
    table.set("Bell", button_at(0, 1));
    table.set("Wiper Switch", hat_at(0, 0));
    table.set("Sander", hat_at(0, 0, HatDirection::Up));

    CHECK(table.find_all_by_locator(button_at(0, 1)).size() == 2);
    CHECK(table.find_by_locator(button_at(0, 2)) == std::nullopt);
    CHECK(table.find_by_locator(button_at(0, 1)).has_value());

    // Whole hat and one direction are different locators on the same source
    CHECK(table.find_all_by_locator(hat_at(0, 0)) == std::vector<std::string>{"Wiper Switch"});
    CHECK(table.find_by_source(0, InputKind::Hat, 0).size() == 2);
}

TEST_CASE("Reverse flag", "[bindings]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);

    CHECK_FALSE(table.set_reverse(FN_TRAIN_BRAKE, true));

    table.set(FN_TRAIN_BRAKE, axis_at(0, 2));
    CHECK(table.set_reverse(FN_TRAIN_BRAKE, true));
    CHECK(table.get(FN_TRAIN_BRAKE)->reverse_axis);

    // Re-capturing starts unreversed
    table.set(FN_TRAIN_BRAKE, axis_at(0, 3));
    CHECK_FALSE(table.get(FN_TRAIN_BRAKE)->reverse_axis);
}

TEST_CASE("Reverser positions and modes", "[bindings]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);

    CHECK(table.reverser_mode() == ReverserMode::Axis);
    CHECK(table.throttle_mode() == ThrottleMode::Separate);

    table.set_reverser_position(ReverserPosition::Forward, button_at(0, 4));
    table.set_reverser_position(ReverserPosition::Reverse, button_at(0, 5));
    CHECK(table.reverser_position(ReverserPosition::Forward) == button_at(0, 4));
    CHECK_FALSE(table.reverser_position(ReverserPosition::Neutral));
    CHECK(table.find_positions_by_locator(button_at(0, 5)) ==
          std::vector<ReverserPosition>{ReverserPosition::Reverse});
    CHECK_FALSE(table.empty());

    CHECK(table.clear_reverser_position(ReverserPosition::Forward));
    CHECK_FALSE(table.clear_reverser_position(ReverserPosition::Forward));

    table.clear_all();
    CHECK(table.empty());
}

TEST_CASE("Listeners hear every change", "[bindings]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);

    std::vector<std::pair<TableChange, std::string>> heard;
    table.add_listener([&](TableChange change, const std::string& function) { heard.emplace_back(change, function); });

    table.set("Horn", button_at(0, 0));
    table.set_reverser_mode(ReverserMode::ThreeWay);
    table.set_reverser_mode(ReverserMode::ThreeWay);
    table.set_throttle_mode(ThrottleMode::Split);

    REQUIRE(heard.size() == 3);
    CHECK(heard[0] == std::make_pair(TableChange::Mapping, std::string("Horn")));
    CHECK(heard[1].first == TableChange::ReverserMode);
    CHECK(heard[2].first == TableChange::ThrottleMode);
}

TEST_CASE("Text forms of kinds, directions and modes", "[bindings]") {
    CHECK(parse_kind("Button") == InputKind::Button);
    CHECK(parse_kind("AXIS") == InputKind::Axis);
    CHECK(parse_kind("hat") == InputKind::Hat);
    CHECK_FALSE(parse_kind("slider"));

    CHECK(parse_direction("Left") == HatDirection::Left);
    CHECK_FALSE(parse_direction("north"));

    CHECK(parse_reverser_mode("2way") == ReverserMode::TwoWay);
    CHECK(parse_reverser_mode("3WAY") == ReverserMode::ThreeWay);
    CHECK(std::string(reverser_mode_name(ReverserMode::Axis)) == "axis");

    CHECK(parse_throttle_mode("split") == ThrottleMode::Split);
    CHECK(std::string(throttle_mode_name(ThrottleMode::Toggle)) == "toggle");

    CHECK(parse_position("neutral") == ReverserPosition::Neutral);

    CHECK(describe_locator(hat_at(0, 0, HatDirection::Up)) == "Dev 0 Hat 0 Up");
    CHECK(describe_locator(button_at(1, 7)) == "Dev 1 Button 7");
    CHECK(describe_locator(axis_at(2, 1)) == "Dev 2 Axis 1");
}

TEST_CASE("Hat directions", "[bindings]") {
    CHECK(cardinal_direction(HatValue{0, 1}) == HatDirection::Up);
    CHECK(cardinal_direction(HatValue{0, -1}) == HatDirection::Down);
    CHECK(cardinal_direction(HatValue{-1, 0}) == HatDirection::Left);
    CHECK(cardinal_direction(HatValue{1, 0}) == HatDirection::Right);
    CHECK_FALSE(cardinal_direction(HatValue{1, 1}));
    CHECK_FALSE(cardinal_direction(HatValue{0, 0}));

    // Diagonals count for both of their components
    CHECK(hat_points(HatValue{1, 1}, HatDirection::Up));
    CHECK(hat_points(HatValue{1, 1}, HatDirection::Right));
    CHECK_FALSE(hat_points(HatValue{1, 1}, HatDirection::Left));
    CHECK_FALSE(hat_points(HatValue{0, 0}, HatDirection::Down));
}
