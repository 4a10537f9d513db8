#include "Config.h"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace core {

namespace {

template <typename T>
bool parseNumber(std::string_view text, T& out) {
    text = trim_view(text);
    if (text.empty()) return false;
    if constexpr (std::is_floating_point_v<T>) {
        std::string copy(text);
        char* end = nullptr;
        double v = std::strtod(copy.c_str(), &end);
        if (end != copy.c_str() + copy.size()) return false;
        // inf, nan and values beyond the field's range are rejected.
        if (!std::isfinite(v) || !std::isfinite(static_cast<T>(v))) return false;
        out = static_cast<T>(v);
        return true;
    } else {
        auto res = std::from_chars(text.data(), text.data() + text.size(), out);
        return res.ec == std::errc() && res.ptr == text.data() + text.size();
    }
}

template <typename T>
void applyNumber(std::string_view source, std::optional<std::string_view> text, T& field, bool positive) {
    if (!text) return;
    T value{};
    if (!parseNumber(*text, value) || (positive && !(value > T(0)))) {
        spdlog::warn("[config] ignoring {}='{}'", source, *text);
        return;
    }
    field = value;
}

void applyBool(std::string_view source, std::optional<std::string_view> text, bool& field) {
    if (!text) return;
    std::string_view v = trim_view(*text);
    if (v == "1" || v == "true" || v == "on" || v == "yes") { field = true; return; }
    if (v == "0" || v == "false" || v == "off" || v == "no") { field = false; return; }
    spdlog::warn("[config] ignoring {}='{}'", source, *text);
}

std::optional<std::string_view> envView(const char* name, std::optional<std::string>& storage) {
    storage = env_value(name);
    if (!storage) return std::nullopt;
    return std::string_view(*storage);
}

} // namespace

std::string_view trim_view(std::string_view s) {
    auto is_space = [](unsigned char c){ return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    size_t b = 0, e = s.size();
    while (b < e && is_space(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && is_space(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v || v[0] == '\0') return std::nullopt;
    return std::string(v);
}

std::optional<std::string_view> flag_value(int argc, char** argv, std::string_view name) {
    std::optional<std::string_view> found;
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i] ? argv[i] : "";
        if (a == name && i + 1 < argc) {
            found = std::string_view(argv[i + 1] ? argv[i + 1] : "");
            ++i;
        } else if (a.size() > name.size() && a.substr(0, name.size()) == name && a[name.size()] == '=') {
            found = a.substr(name.size() + 1);
        }
    }
    return found;
}

bool has_flag(int argc, char** argv, std::string_view name) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] && name == argv[i]) return true;
    }
    return false;
}

const char* transfer_mode_name(TransferMode mode) {
    switch (mode) {
        case TransferMode::Route: return "route";
        case TransferMode::Legs: return "legs";
    }
    return "unknown";
}

std::optional<TransferMode> parse_transfer_mode(std::string_view s) {
    s = trim_view(s);
    if (s == "route") return TransferMode::Route;
    if (s == "legs") return TransferMode::Legs;
    return std::nullopt;
}

ClientConfig determine_client_config(int argc, char** argv) {
    ClientConfig cfg{};
    std::optional<std::string> env;

    applyNumber("WAVESYS_FRAMES", envView("WAVESYS_FRAMES", env), cfg.frames, false);
    applyNumber("WAVESYS_PROXIMITY_RADIUS", envView("WAVESYS_PROXIMITY_RADIUS", env), cfg.proximityRadius, true);
    applyNumber("WAVESYS_PHRASE_TIME", envView("WAVESYS_PHRASE_TIME", env), cfg.phraseDisplayTime, true);
    applyNumber("WAVESYS_TRANSFER_SPEED", envView("WAVESYS_TRANSFER_SPEED", env), cfg.transferSpeed, true);
    applyBool("WAVESYS_CAMERA_SMOOTHING", envView("WAVESYS_CAMERA_SMOOTHING", env), cfg.cameraSmoothing);
    applyBool("WAVESYS_CAMERA_OCCLUSION", envView("WAVESYS_CAMERA_OCCLUSION", env), cfg.cameraOcclusion);
    if (auto mode = envView("WAVESYS_TRANSFER_MODE", env)) {
        if (auto parsed = parse_transfer_mode(*mode)) cfg.transferMode = *parsed;
        else spdlog::warn("[config] ignoring WAVESYS_TRANSFER_MODE='{}'", *mode);
    }

    applyNumber("--frames", flag_value(argc, argv, "--frames"), cfg.frames, false);
    applyNumber("--dt", flag_value(argc, argv, "--dt"), cfg.frameDt, true);
    applyNumber("--proximity-radius", flag_value(argc, argv, "--proximity-radius"), cfg.proximityRadius, true);
    applyNumber("--proximity-interval", flag_value(argc, argv, "--proximity-interval"), cfg.proximityInterval, true);
    applyNumber("--phrase-time", flag_value(argc, argv, "--phrase-time"), cfg.phraseDisplayTime, true);
    applyNumber("--transfer-speed", flag_value(argc, argv, "--transfer-speed"), cfg.transferSpeed, true);
    applyNumber("--camera-pitch", flag_value(argc, argv, "--camera-pitch"), cfg.cameraPitch, false);
    if (auto mode = flag_value(argc, argv, "--transfer-mode")) {
        if (auto parsed = parse_transfer_mode(*mode)) cfg.transferMode = *parsed;
        else spdlog::warn("[config] ignoring --transfer-mode='{}'", *mode);
    }
    if (has_flag(argc, argv, "--camera-smoothing")) cfg.cameraSmoothing = true;
    if (has_flag(argc, argv, "--camera-occlusion")) cfg.cameraOcclusion = true;
    if (has_flag(argc, argv, "--window")) cfg.window = true;

    spdlog::info("[config] frames={} dt={:.4f} proximity={}m/{}s phrase={}s transfer={}@{} camera(smooth={}, occlusion={})",
                 cfg.frames, cfg.frameDt, cfg.proximityRadius, cfg.proximityInterval,
                 cfg.phraseDisplayTime, transfer_mode_name(cfg.transferMode), cfg.transferSpeed,
                 cfg.cameraSmoothing, cfg.cameraOcclusion);
    return cfg;
}

} // namespace core
