// Command-line and environment parsing for the client config.
#include <cstdlib>
#include <string>

#include "TestCheck.h"
#include "core/Config.h"
#include "core/Logging.h"

int main() {
    bool success = true;

    // Log level names
    {
        CHECK(core::parse_log_level("debug") == spdlog::level::debug, "debug should parse");
        CHECK(core::parse_log_level(" warning ") == spdlog::level::warn, "Aliases and padding are accepted");
        CHECK(core::parse_log_level("nonsense", spdlog::level::err) == spdlog::level::err,
              "Unknown level falls back");
    }

    // Defaults with no arguments
    {
        char arg0[] = "wavesys";
        char* argv[] = {arg0};
        auto cfg = core::determine_client_config(1, argv);
        CHECK(cfg.transferMode == core::TransferMode::Route, "Default transfer view is route");
        CHECK(test::approx(cfg.proximityRadius, 50.0f), "Default proximity radius is 50");
        CHECK(test::approx(cfg.phraseDisplayTime, 2.0f), "Default phrase time is 2s");
        CHECK(!cfg.window, "Headless by default");
    }

    // Flags override, both "--flag value" and "--flag=value"
    {
        char a0[] = "wavesys";
        char a1[] = "--frames";
        char a2[] = "30";
        char a3[] = "--transfer-mode=legs";
        char a4[] = "--proximity-radius";
        char a5[] = "75.5";
        char a6[] = "--camera-smoothing";
        char a7[] = "--window";
        char* argv[] = {a0, a1, a2, a3, a4, a5, a6, a7};
        auto cfg = core::determine_client_config(8, argv);
        CHECK(cfg.frames == 30, "frames should be 30 (got %d)", cfg.frames);
        CHECK(cfg.transferMode == core::TransferMode::Legs, "transfer mode should be legs");
        CHECK(test::approx(cfg.proximityRadius, 75.5f), "proximity radius (got %g)", cfg.proximityRadius);
        CHECK(cfg.cameraSmoothing, "--camera-smoothing sets smoothing");
        CHECK(cfg.window, "--window requests a window");
    }

    // Bad values are ignored, keeping the defaults
    {
        char a0[] = "wavesys";
        char a1[] = "--transfer-speed";
        char a2[] = "-3";
        char a3[] = "--transfer-mode";
        char a4[] = "teleport";
        char a5[] = "--dt";
        char a6[] = "abc";
        char* argv[] = {a0, a1, a2, a3, a4, a5, a6};
        auto cfg = core::determine_client_config(7, argv);
        CHECK(test::approx(cfg.transferSpeed, 5.0f), "Negative speed ignored (got %g)", cfg.transferSpeed);
        CHECK(cfg.transferMode == core::TransferMode::Route, "Unknown mode ignored");
        CHECK(test::approx(cfg.frameDt, 1.0f / 60.0f), "Unparseable dt ignored");
    }

    // Non-finite numbers are ignored like any other bad value
    {
        char a0[] = "wavesys";
        char a1[] = "--dt";
        char a2[] = "inf";
        char a3[] = "--camera-pitch";
        char a4[] = "nan";
        char a5[] = "--proximity-radius";
        char a6[] = "1e300";
        char* argv[] = {a0, a1, a2, a3, a4, a5, a6};
        auto cfg = core::determine_client_config(7, argv);
        CHECK(test::approx(cfg.frameDt, 1.0f / 60.0f), "Infinite dt ignored (got %g)", cfg.frameDt);
        CHECK(test::approx(cfg.cameraPitch, 0.0f), "NaN pitch ignored (got %g)", cfg.cameraPitch);
        CHECK(test::approx(cfg.proximityRadius, 50.0f), "Radius overflowing float ignored (got %g)",
              cfg.proximityRadius);
    }

    // Environment is applied before flags
    {
        setenv("WAVESYS_PHRASE_TIME", "4", 1);
        setenv("WAVESYS_TRANSFER_MODE", "legs", 1);
        char a0[] = "wavesys";
        char a1[] = "--transfer-mode";
        char a2[] = "route";
        char* argv[] = {a0, a1, a2};
        auto cfg = core::determine_client_config(3, argv);
        CHECK(test::approx(cfg.phraseDisplayTime, 4.0f), "Env phrase time (got %g)", cfg.phraseDisplayTime);
        CHECK(cfg.transferMode == core::TransferMode::Route, "Flag should beat env");
        unsetenv("WAVESYS_PHRASE_TIME");
        unsetenv("WAVESYS_TRANSFER_MODE");
    }

    // Helpers
    {
        CHECK(core::trim_view("  x \t") == "x", "trim_view strips whitespace");
        CHECK(core::parse_transfer_mode(" legs ").has_value(), "parse_transfer_mode trims");
        CHECK(std::string(core::transfer_mode_name(core::TransferMode::Legs)) == "legs", "mode name");
    }

    return success ? 0 : 1;
}
