#include <catch2/catch.hpp>

#include "value_engine.hpp"
#include "test_support.hpp"
#include <set>

namespace {

struct EngineFixture {
    FunctionCatalog catalog;
    MappingTable table{catalog};
    ValueEngine engine{catalog, table};
    CommandQueue queue;

    uint16_t id(const std::string& name) const { return catalog.by_name(name).id; }

    // Runs one tick and returns what it queued for one function
    std::optional<uint8_t> tick(const std::vector<RawSample>& samples, const std::string& function) {
        queue.clear();
        engine.run_tick(samples, queue);
        return queue.peek(id(function));
    }
};

} // namespace

TEST_CASE("Lever laws", "[engine]") {
    SECTION("throttle notch") {
        CHECK(throttle_notch_for(-1.0f) == 0);
        CHECK(throttle_notch_for(0.0f) == 4);
        CHECK(throttle_notch_for(1.0f) == 8);
        CHECK(throttle_notch_for(0.26f) == 5);
    }
    SECTION("reverser axis") {
        CHECK(reverser_axis_value_for(-1.0f) == 0);
        CHECK(reverser_axis_value_for(-0.8f) == 127);
        CHECK(reverser_axis_value_for(0.0f) == 127);
        CHECK(reverser_axis_value_for(0.81f) == 255);
    }
    SECTION("dynamic brake") {
        CHECK(dyn_brake_value_for(-1.0f) == 0);
        CHECK(dyn_brake_value_for(-0.95f) == 0);
        CHECK(dyn_brake_value_for(-0.94f) == 2);
        CHECK(dyn_brake_value_for(1.0f) == 255);
    }
    SECTION("air brakes") {
        CHECK(brake_value_for(-1.0f) == 0);
        CHECK(brake_value_for(0.0f) == 128);
        CHECK(brake_value_for(1.0f) == 255);
    }
}

TEST_CASE("Reverser axis thresholds are exclusive", "[engine][reverser]") {
    CHECK(reverser_axis_value_for(0.8f) == 127);
    CHECK(reverser_axis_value_for(-0.8f) == 127);
    CHECK(reverser_axis_value_for(0.81f) == 255);
    CHECK(reverser_axis_value_for(-0.81f) == 0);
}

TEST_CASE("Lever laws never decrease over the axis range", "[engine]") {
    int last_brake = -1;
    int last_dyn = -1;
    std::set<int> notches;
    for (int i = 0; i <= 2000; i++) {
        float v = -1.0f + i / 1000.0f;
        int brake = brake_value_for(v);
        int dyn = dyn_brake_value_for(v);
        CHECK(brake >= last_brake);
        CHECK(dyn >= last_dyn);
        last_brake = brake;
        last_dyn = dyn;
        notches.insert(throttle_notch_for(v));
    }
    CHECK(last_brake == 255);
    CHECK(notches == std::set<int>{0, 1, 2, 3, 4, 5, 6, 7, 8});
}

TEST_CASE("Lever laws round halves to even", "[engine]") {
    // (v + 1) / 2 * 8 lands exactly on .5 here
    CHECK(throttle_notch_for(-0.875f) == 0);
    CHECK(throttle_notch_for(-0.625f) == 2);
    CHECK(throttle_notch_for(0.125f) == 4);
    CHECK(brake_value_for(0.0f) == 128);
}

TEST_CASE_METHOD(EngineFixture, "Reverser switch modes override the lever axis", "[engine][reverser]") {
    table.set(FN_REVERSER, axis_at(0, 2));
    InputLocator lever = axis_at(0, 2);

    SECTION("two-way") {
        table.set_reverser_mode(ReverserMode::TwoWay);
    }
    SECTION("three-way") {
        table.set_reverser_mode(ReverserMode::ThreeWay);
    }

    // Every call reports the switch position, whatever the axis says
    for (float v : {1.0f, 1.0f, -1.0f}) {
        ProcessResult result = engine.process(FN_REVERSER, lever, axis_sample(0, 2, v));
        CHECK(result.changed);
        CHECK(result.value == REVERSER_NEUTRAL_VALUE);
    }
}

TEST_CASE_METHOD(EngineFixture, "Throttle lever follows the axis in notches", "[engine]") {
    table.set(FN_THROTTLE, axis_at(0, 0));

    CHECK(tick({axis_sample(0, 0, -1.0f)}, FN_THROTTLE) == 0);
    CHECK(tick({axis_sample(0, 0, 0.0f)}, FN_THROTTLE) == 4);
    CHECK(tick({axis_sample(0, 0, 1.0f)}, FN_THROTTLE) == 8);

    // Movement inside one notch sends nothing
    CHECK_FALSE(tick({axis_sample(0, 0, 0.98f)}, FN_THROTTLE));
}

TEST_CASE_METHOD(EngineFixture, "Reversed lever inverts the axis", "[engine]") {
    table.set(FN_TRAIN_BRAKE, axis_at(0, 1), true);

    CHECK(tick({axis_sample(0, 1, -1.0f)}, FN_TRAIN_BRAKE) == 255);
    CHECK(tick({axis_sample(0, 1, 1.0f)}, FN_TRAIN_BRAKE) == 0);
}

TEST_CASE_METHOD(EngineFixture, "Out of range axis values are clamped", "[engine]") {
    table.set(FN_INDEPENDENT_BRAKE, axis_at(0, 0));

    CHECK(tick({axis_sample(0, 0, 1.5f)}, FN_INDEPENDENT_BRAKE) == 255);
    CHECK(tick({axis_sample(0, 0, -3.0f)}, FN_INDEPENDENT_BRAKE) == 0);
}

TEST_CASE_METHOD(EngineFixture, "Momentary sends both edges", "[engine]") {
    table.set("Horn", button_at(0, 2));

    CHECK(tick({button_sample(0, 2, true)}, "Horn") == 1);
    CHECK_FALSE(tick({button_sample(0, 2, true)}, "Horn"));
    CHECK(tick({button_sample(0, 2, false)}, "Horn") == 0);
}

TEST_CASE_METHOD(EngineFixture, "Toggle sends one pulse per press", "[engine]") {
    table.set("HEP Switch", button_at(0, 0));

    std::vector<uint8_t> sent;
    for (bool pressed : {false, true, true, false, true}) {
        auto value = tick({button_sample(0, 0, pressed)}, "HEP Switch");
        if (value) sent.push_back(*value);
    }
    CHECK(sent == std::vector<uint8_t>{1, 1});
}

TEST_CASE_METHOD(EngineFixture, "Button behavior acts like a toggle pulse", "[engine]") {
    RawSample pressed = button_sample(0, 0, true);
    RawSample released = button_sample(0, 0, false);
    InputLocator loc = button_at(0, 0);

    CHECK(engine.process(FN_THROTTLE_DYN_TOGGLE, loc, pressed).changed);
    CHECK_FALSE(engine.process(FN_THROTTLE_DYN_TOGGLE, loc, pressed).changed);
    CHECK_FALSE(engine.process(FN_THROTTLE_DYN_TOGGLE, loc, released).changed);
    CHECK(engine.process(FN_THROTTLE_DYN_TOGGLE, loc, pressed).value == 1);
}

TEST_CASE_METHOD(EngineFixture, "Multi-way switches cycle on a button", "[engine]") {
    table.set("Headlight Front", button_at(0, 5));

    CHECK(engine.counter("Headlight Front") == 0);
    CHECK(tick({button_sample(0, 5, true)}, "Headlight Front") == 1);
    tick({button_sample(0, 5, false)}, "Headlight Front");
    CHECK(tick({button_sample(0, 5, true)}, "Headlight Front") == 2);
    tick({button_sample(0, 5, false)}, "Headlight Front");
    CHECK(tick({button_sample(0, 5, true)}, "Headlight Front") == 0);
}

TEST_CASE_METHOD(EngineFixture, "Multi-way switch on one hat direction cycles", "[engine]") {
    table.set("Wiper Switch", hat_at(0, 0, HatDirection::Right));

    CHECK_FALSE(tick({hat_sample(0, 0, 0, 1)}, "Wiper Switch"));
    CHECK(tick({hat_sample(0, 0, 1, 0)}, "Wiper Switch") == 1);
    tick({hat_sample(0, 0, 0, 0)}, "Wiper Switch");
    CHECK(tick({hat_sample(0, 0, 1, 1)}, "Wiper Switch") == 2);
}

TEST_CASE_METHOD(EngineFixture, "Three-way switch on a whole hat reads the vertical", "[engine]") {
    table.set("Headlight Rear", hat_at(0, 0));

    CHECK(tick({hat_sample(0, 0, 0, 1)}, "Headlight Rear") == 2);
    CHECK(tick({hat_sample(0, 0, 0, 0)}, "Headlight Rear") == 1);
    CHECK(tick({hat_sample(0, 0, 0, -1)}, "Headlight Rear") == 0);
    CHECK(tick({hat_sample(0, 0, -1, -1)}, "Headlight Rear") == std::nullopt);
    CHECK(tick({hat_sample(0, 0, 1, 1)}, "Headlight Rear") == 2);
    // Horizontal only is the middle position
    CHECK(tick({hat_sample(0, 0, 1, 0)}, "Headlight Rear") == 1);
}

TEST_CASE_METHOD(EngineFixture, "Four-way switch on a whole hat picks a position per direction", "[engine]") {
    table.set("Wiper Switch", hat_at(0, 0));

    CHECK(tick({hat_sample(0, 0, -1, 0)}, "Wiper Switch") == 1);
    CHECK(tick({hat_sample(0, 0, 0, 1)}, "Wiper Switch") == 2);
    CHECK(tick({hat_sample(0, 0, 1, 0)}, "Wiper Switch") == 3);
    CHECK(tick({hat_sample(0, 0, 0, -1)}, "Wiper Switch") == 0);
    CHECK_FALSE(tick({hat_sample(0, 0, 0, 0)}, "Wiper Switch"));
}

TEST_CASE_METHOD(EngineFixture, "Axis mapped to a digital function uses the deadzone", "[engine]") {
    InputLocator loc = axis_at(0, 3);

    CHECK_FALSE(engine.process("Sander", loc, axis_sample(0, 3, 0.5f)).changed);
    auto pressed = engine.process("Sander", loc, axis_sample(0, 3, -0.9f));
    CHECK(pressed.changed);
    CHECK(pressed.value == 1);
    auto released = engine.process("Sander", loc, axis_sample(0, 3, 0.1f));
    CHECK(released.changed);
    CHECK(released.value == 0);
}

TEST_CASE_METHOD(EngineFixture, "One input can drive several functions", "[engine]") {
    table.set("Horn", button_at(0, 1));
    table.set("Bell", button_at(0, 1));

    engine.run_tick({button_sample(0, 1, true)}, queue);
    CHECK(queue.peek(id("Horn")) == 1);
    CHECK(queue.peek(id("Bell")) == 1);
}

TEST_CASE_METHOD(EngineFixture, "Unmapped inputs send nothing", "[engine]") {
    table.set("Horn", button_at(0, 1));

    engine.run_tick({button_sample(0, 2, true), axis_sample(1, 0, 1.0f)}, queue);
    CHECK(queue.empty());
}

TEST_CASE_METHOD(EngineFixture, "Remapping forgets the previous value", "[engine]") {
    table.set(FN_THROTTLE, axis_at(0, 0));
    CHECK(tick({axis_sample(0, 0, 1.0f)}, FN_THROTTLE) == 8);

    table.set(FN_THROTTLE, axis_at(0, 0));
    CHECK(tick({axis_sample(0, 0, 1.0f)}, FN_THROTTLE) == 8);
}

TEST_CASE_METHOD(EngineFixture, "Three-way reverser switch latches", "[engine][reverser]") {
    table.set_reverser_mode(ReverserMode::ThreeWay);
    table.set_reverser_position(ReverserPosition::Forward, button_at(0, 0));
    table.set_reverser_position(ReverserPosition::Neutral, button_at(0, 1));
    table.set_reverser_position(ReverserPosition::Reverse, button_at(0, 2));

    CHECK(engine.reverser_value() == 127);
    CHECK(tick({button_sample(0, 0, true)}, FN_REVERSER) == 255);
    // Letting go keeps the latched position
    CHECK_FALSE(tick({button_sample(0, 0, false)}, FN_REVERSER));
    CHECK(engine.reverser_value() == 255);

    CHECK(tick({button_sample(0, 2, true)}, FN_REVERSER) == 0);
    CHECK(tick({button_sample(0, 1, true), button_sample(0, 2, false)}, FN_REVERSER) == 127);
}

TEST_CASE_METHOD(EngineFixture, "Two-way reverser switch falls back to neutral", "[engine][reverser]") {
    table.set_reverser_mode(ReverserMode::TwoWay);
    table.set_reverser_position(ReverserPosition::Forward, hat_at(0, 0, HatDirection::Up));
    table.set_reverser_position(ReverserPosition::Reverse, hat_at(0, 0, HatDirection::Down));

    CHECK(tick({hat_sample(0, 0, 0, 1)}, FN_REVERSER) == 255);
    CHECK(tick({hat_sample(0, 0, 0, 0)}, FN_REVERSER) == 127);
    CHECK(tick({hat_sample(0, 0, 0, -1)}, FN_REVERSER) == 0);

    // Inputs that are not reverser positions leave it alone
    CHECK_FALSE(tick({button_sample(0, 4, true)}, FN_REVERSER));
    CHECK(engine.reverser_value() == 0);
}

TEST_CASE_METHOD(EngineFixture, "Changing reverser mode resets the switch", "[engine][reverser]") {
    table.set_reverser_mode(ReverserMode::ThreeWay);
    table.set_reverser_position(ReverserPosition::Forward, button_at(0, 0));
    tick({button_sample(0, 0, true)}, FN_REVERSER);
    CHECK(engine.reverser_value() == 255);

    table.set_reverser_mode(ReverserMode::TwoWay);
    CHECK(engine.reverser_value() == 127);
}

TEST_CASE_METHOD(EngineFixture, "Reverser lever axis in axis mode", "[engine][reverser]") {
    table.set(FN_REVERSER, axis_at(0, 2));

    CHECK(tick({axis_sample(0, 2, 0.0f)}, FN_REVERSER) == 127);
    CHECK(tick({axis_sample(0, 2, 0.95f)}, FN_REVERSER) == 255);
    CHECK(tick({axis_sample(0, 2, -0.95f)}, FN_REVERSER) == 0);
}

TEST_CASE_METHOD(EngineFixture, "Split lever drives throttle and dynamic brake", "[engine][lever]") {
    table.set_throttle_mode(ThrottleMode::Split);
    table.set(FN_THROTTLE, axis_at(0, 0));
    table.set(FN_DYN_BRAKE, axis_at(0, 1));

    engine.run_tick({axis_sample(0, 0, 0.5f)}, queue);
    CHECK(queue.peek(id(FN_THROTTLE)) == 4);
    CHECK(queue.peek(id(FN_DYN_BRAKE)) == 0);

    queue.clear();
    engine.run_tick({axis_sample(0, 0, -0.5f)}, queue);
    CHECK(queue.peek(id(FN_THROTTLE)) == 0);
    CHECK(queue.peek(id(FN_DYN_BRAKE)) == 128);

    queue.clear();
    engine.run_tick({axis_sample(0, 0, 0.03f)}, queue);
    CHECK(queue.peek(id(FN_THROTTLE)) == 0);
    CHECK(queue.peek(id(FN_DYN_BRAKE)) == 0);

    // The separate dyn brake mapping is ignored while combined
    queue.clear();
    engine.run_tick({axis_sample(0, 1, 1.0f)}, queue);
    CHECK(queue.empty());
}

TEST_CASE_METHOD(EngineFixture, "Toggle lever switches between throttle and dynamic brake", "[engine][lever]") {
    table.set_throttle_mode(ThrottleMode::Toggle);
    table.set(FN_THROTTLE, axis_at(0, 0));
    table.set(FN_THROTTLE_DYN_TOGGLE, button_at(0, 3));

    engine.run_tick({axis_sample(0, 0, 0.0f)}, queue);
    CHECK(queue.peek(id(FN_THROTTLE)) == 4);
    CHECK(queue.peek(id(FN_DYN_BRAKE)) == 0);

    queue.clear();
    engine.run_tick({button_sample(0, 3, true)}, queue);
    CHECK(engine.lever().dyn_selected());
    CHECK(queue.peek(id(FN_THROTTLE)) == 0);
    CHECK(queue.peek(id(FN_DYN_BRAKE)) == 128);
    CHECK_FALSE(queue.peek(id(FN_THROTTLE_DYN_TOGGLE)));

    queue.clear();
    engine.run_tick({button_sample(0, 3, false)}, queue);
    CHECK(queue.empty());
}

TEST_CASE_METHOD(EngineFixture, "Toggle button is ignored outside toggle mode", "[engine][lever]") {
    table.set(FN_THROTTLE_DYN_TOGGLE, button_at(0, 3));

    engine.run_tick({button_sample(0, 3, true)}, queue);
    CHECK(queue.empty());
}
