#include "test_harness.h"

#include "ColorTable.hpp"

using namespace CurveTrace;

TEST_SUITE("color table");

// --- Color specs ---

TEST(default_specs_cover_nine_classes) {
    auto specs = ColorTable::defaultColorSpecs();
    ASSERT(specs.size() == 9, "expected 9 color specs, got " << specs.size());
    ASSERT(specs[0].name == "red" && specs[0].baseColor == "red", "first spec should be red");
    ASSERT(specs[1].name == "red2" && specs[1].baseColor == "red", "red2 should fold into red");
    for (const auto& spec : specs) {
        ASSERT(spec.lower[1] == 100 && spec.lower[2] == 100, spec.name << " lower S/V should be 100");
        ASSERT(spec.upper[1] == 255 && spec.upper[2] == 255, spec.name << " upper S/V should be 255");
        ASSERT(spec.lower[0] <= spec.upper[0], spec.name << " hue range inverted");
    }
    PASS("default_specs_cover_nine_classes");
}

TEST(base_colors_in_first_appearance_order) {
    auto bases = ColorTable::baseColors(ColorTable::defaultColorSpecs());
    const char* expected[] = {"red", "blue", "green", "yellow", "cyan", "magenta", "orange", "purple"};
    ASSERT(bases.size() == 8, "expected 8 base colors, got " << bases.size());
    for (size_t i = 0; i < bases.size(); i++) {
        ASSERT(bases[i] == expected[i], "base color " << i << " should be " << expected[i] << ", got " << bases[i]);
    }
    PASS("base_colors_in_first_appearance_order");
}

// --- Selection ---

TEST(select_by_base_color_keeps_both_reds) {
    auto specs = ColorTable::defaultColorSpecs();
    auto selected = ColorTable::selectColors(specs, {"red"});
    ASSERT(selected.size() == 2, "red should select red and red2, got " << selected.size());
    ASSERT(selected[0].name == "red" && selected[1].name == "red2", "table order should be kept");

    auto onlyRed2 = ColorTable::selectColors(specs, {"red2"});
    ASSERT(onlyRed2.size() == 1 && onlyRed2[0].name == "red2", "a spec name selects just that spec");
    PASS("select_by_base_color_keeps_both_reds");
}

TEST(select_ignores_unknown_names) {
    auto specs = ColorTable::defaultColorSpecs();
    auto selected = ColorTable::selectColors(specs, {"blue", "teal"});
    ASSERT(selected.size() == 1 && selected[0].name == "blue", "unknown teal should be skipped");

    ASSERT(ColorTable::selectColors(specs, {}).size() == 9, "empty selection keeps every spec");
    ASSERT_THROWS(ColorTable::selectColors(specs, {"teal"}), std::invalid_argument,
                  "selection with no known color should throw");
    PASS("select_ignores_unknown_names");
}

// --- Tuning ---

TEST(default_tuning_values) {
    TuningTable tuning = ColorTable::defaultTuning();
    ASSERT(tuning.lookup("red").smoothingWindow == 20, "red window should be 20");
    ASSERT(tuning.lookup("blue").smoothingWindow == 17, "blue window should be 17");
    ASSERT(tuning.lookup("green").smoothingWindow == 11, "green falls back to default window 11");
    ASSERT(tuning.lookup("magenta").minComponentArea == 1400, "default min area should be 1400");
    ASSERT(tuning.lookup("red").minComponentArea == 1400, "red min area should be 1400");
    PASS("default_tuning_values");
}

TEST(tuning_entry_seeds_from_defaults) {
    TuningTable tuning = ColorTable::defaultTuning();
    tuning.defaults.minComponentArea = 900;

    BaseColorTuning& green = tuning.entry("green");
    ASSERT(green.minComponentArea == 900, "new entry should copy the default area");
    ASSERT(green.smoothingWindow == 11, "new entry should copy the default window");

    green.smoothingWindow = 31;
    ASSERT(tuning.lookup("green").smoothingWindow == 31, "entry should be writable in place");
    ASSERT(tuning.lookup("cyan").smoothingWindow == 11, "other colors keep the default");

    BaseColorTuning& red = tuning.entry("red");
    ASSERT(red.smoothingWindow == 20, "existing override should be returned unchanged");
    PASS("tuning_entry_seeds_from_defaults");
}

// --- Presets ---

TEST(presets_are_listed) {
    auto presets = ColorTable::graphPresets();
    ASSERT(presets.size() == 5, "expected 5 presets, got " << presets.size());
    ASSERT(presets.back().name == "custom", "custom preset should come last");
    PASS("presets_are_listed");
}

TEST(find_transfer_preset) {
    GraphPreset transfer = ColorTable::findPreset("transfer");
    ASSERT(transfer.xAxisName == "Vgs" && transfer.yAxisName == "Id", "transfer axes should be Vgs/Id");
    ASSERT(transfer.labels.at("red") == "25", "red trace is the 25 degree curve");
    ASSERT(transfer.labels.at("blue") == "125", "blue trace is the 125 degree curve");
    ASSERT(transfer.yScale == 10.0, "transfer current is exported times 10");
    ASSERT(transfer.calibration.xMax > transfer.calibration.xMin, "preset calibration should be valid");
    PASS("find_transfer_preset");
}

TEST(unknown_preset_throws) {
    ASSERT_THROWS(ColorTable::findPreset("bode"), std::invalid_argument, "unknown preset should throw");
    PASS("unknown_preset_throws");
}

TEST_MAIN()
