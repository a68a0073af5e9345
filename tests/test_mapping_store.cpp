#include <catch2/catch.hpp>

#include "mapping_store.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <fstream>
#include <unistd.h>

TEST_CASE("Mappings, modes and reverser positions survive a save and load", "[store]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);
    table.set(FN_THROTTLE, axis_at(0, 2), true);
    table.set("Horn", button_at(1, 4));
    table.set("Wiper Switch", hat_at(0, 0));
    table.set("Sander", hat_at(0, 0, HatDirection::Left));
    table.set_reverser_mode(ReverserMode::TwoWay);
    table.set_throttle_mode(ThrottleMode::Split);
    table.set_reverser_position(ReverserPosition::Forward, hat_at(0, 1, HatDirection::Up));
    table.set_reverser_position(ReverserPosition::Reverse, button_at(0, 9));

    std::string csv = MappingStore::save_to_string(table);

    MappingTable loaded(catalog);
    REQUIRE(MappingStore::load_from_string(csv, loaded));

    CHECK(loaded.all().size() == 4);
    CHECK(loaded.get(FN_THROTTLE)->locator == axis_at(0, 2));
    CHECK(loaded.get(FN_THROTTLE)->reverse_axis);
    CHECK(loaded.get("Horn")->locator == button_at(1, 4));
    CHECK(loaded.get("Wiper Switch")->locator == hat_at(0, 0));
    CHECK(loaded.get("Sander")->locator == hat_at(0, 0, HatDirection::Left));
    CHECK(loaded.reverser_mode() == ReverserMode::TwoWay);
    CHECK(loaded.throttle_mode() == ThrottleMode::Split);
    CHECK(loaded.reverser_position(ReverserPosition::Forward) == hat_at(0, 1, HatDirection::Up));
    CHECK(loaded.reverser_position(ReverserPosition::Reverse) == button_at(0, 9));
    CHECK_FALSE(loaded.reverser_position(ReverserPosition::Neutral));
}

TEST_CASE("Saved file layout", "[store]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);
    table.set("Horn", button_at(0, 3));
    table.set(FN_TRAIN_BRAKE, axis_at(0, 1));
    table.set("Sander", hat_at(0, 0, HatDirection::Up));

    std::string csv = MappingStore::save_to_string(table);

    // Catalog order, not insertion order
    CHECK(csv == std::string(MAPPING_CSV_HEADER) + "\n"
                 "Train Brake Lever,0,Axis,1,False,\n"
                 "Sander,0,Hat,0,False,Up\n"
                 "Horn,0,Button,3,False,\n"
                 "__reverser_mode__,axis,,,,\n"
                 "__throttle_mode__,separate,,,,\n");
}

TEST_CASE("Loading tolerates bad rows", "[store]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);
    table.set("Bell", button_at(0, 0));

    std::string csv =
        "Function,Device,Type,Index,Reverse,Direction\n"
        "Horn,0,Button,2,False,\n"
        "Warp Drive,0,button,1,False,\n"
        "Sander,zero,button,1,False,\n"
        "Alerter,0,slider,1,False,\n"
        "\n"
        "Headlight Front,1,hat,0,False,sideways\n"
        "Park-Brake Set\n"
        "Independent Brake Lever,0,axis,5,true,\n";

    REQUIRE(MappingStore::load_from_string(csv, table));

    // Loading replaces what was there
    CHECK_FALSE(table.get("Bell"));
    CHECK(table.get("Horn")->locator == button_at(0, 2));
    CHECK(table.get(FN_INDEPENDENT_BRAKE)->reverse_axis);
    CHECK(table.all().size() == 2);
}

TEST_CASE("Files without a Direction column still load", "[store]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);

    std::string csv =
        "Function,Device,Type,Index,Reverse\n"
        "Horn,0,button,2,False\n"
        "Wiper Switch,0,hat,0,False\n";

    REQUIRE(MappingStore::load_from_string(csv, table));
    CHECK(table.get("Horn")->locator == button_at(0, 2));
    CHECK(table.get("Wiper Switch")->locator == hat_at(0, 0));
    CHECK(table.reverser_mode() == ReverserMode::Axis);
}

TEST_CASE("Legacy reverser switch flag", "[store]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);

    SECTION("true selects three-way") {
        REQUIRE(MappingStore::load_from_string(
            "Function,Device,Type,Index,Reverse,Direction\n__reverser_switch_mode__,True,,,,\n", table));
        CHECK(table.reverser_mode() == ReverserMode::ThreeWay);
    }
    SECTION("the newer mode row wins") {
        REQUIRE(MappingStore::load_from_string(
            "Function,Device,Type,Index,Reverse,Direction\n"
            "__reverser_switch_mode__,True,,,,\n"
            "__reverser_mode__,2way,,,,\n", table));
        CHECK(table.reverser_mode() == ReverserMode::TwoWay);
    }
}

TEST_CASE("Header without Function column is rejected", "[store]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);
    CHECK_FALSE(MappingStore::load_from_string("Name,Dev\nHorn,0\n", table));
}

TEST_CASE("Save and load through a file", "[store]") {
    FunctionCatalog catalog;
    MappingTable table(catalog);
    table.set("Bell", button_at(2, 1));

    char dir_template[] = "/tmp/conductor_store_XXXXXX";
    REQUIRE(mkdtemp(dir_template) != nullptr);
    std::string path = std::string(dir_template) + "/nested/input_mappings.csv";

    REQUIRE(MappingStore::save(path, table));

    MappingTable loaded(catalog);
    REQUIRE(MappingStore::load(path, loaded));
    CHECK(loaded.get("Bell")->locator == button_at(2, 1));

    CHECK_FALSE(MappingStore::load(std::string(dir_template) + "/missing.csv", loaded));

    std::remove(path.c_str());
    rmdir((std::string(dir_template) + "/nested").c_str());
    rmdir(dir_template);
}
