#include "ConfigLoader.h"
#include "DebugLog.h"
#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <stdlib.h>
#include <string>

namespace {
    // Document capacity for MAX_FILE_BYTES of input
    constexpr size_t JSON_CAPACITY = 16384;

    Result wrongType(const char* section, const char* key, const char* expected) {
        char buf[160];
        if (section) {
            snprintf(buf, sizeof(buf), "%s.%s must be %s", section, key, expected);
        } else {
            snprintf(buf, sizeof(buf), "%s must be %s", key, expected);
        }
        return Result::fail(ErrorKind::CONFIGURATION, buf);
    }

    void warnUnknown(const char* section, const char* key) {
        if (section) {
            DEBUG_WARN_F("Ignoring unknown config key: %s.%s\n", section, key);
        } else {
            DEBUG_WARN_F("Ignoring unknown config key: %s\n", key);
        }
    }

    bool readFloat(JsonVariantConst v, float& out) {
        if (!v.is<float>()) return false;
        out = v.as<float>();
        return true;
    }

    bool readInt(JsonVariantConst v, int& out) {
        if (!v.is<int>()) return false;
        out = v.as<int>();
        return true;
    }

    bool readUint32(JsonVariantConst v, uint32_t& out) {
        if (!v.is<long>()) return false;
        long value = v.as<long>();
        if (value < 0) return false;
        out = (uint32_t)value;
        return true;
    }

    bool readBool(JsonVariantConst v, bool& out) {
        if (!v.is<bool>()) return false;
        out = v.as<bool>();
        return true;
    }

    bool readString(JsonVariantConst v, std::string& out) {
        if (!v.is<const char*>()) return false;
        out = v.as<const char*>();
        return true;
    }

    Result loadLayout(JsonObjectConst obj, LightsConfig& cfg) {
        for (JsonPairConst kv : obj) {
            const char* key = kv.key().c_str();
            Zone zone;
            if (!LightLayout::zoneFromName(key, zone)) {
                warnUnknown("layout", key);
                continue;
            }
            if (!readInt(kv.value(), cfg.zoneCounts[ZoneInfo::toIndex(zone)])) {
                return wrongType("layout", key, "an integer");
            }
        }
        return Result::ok();
    }

    Result loadCenter(JsonObjectConst obj, LightsConfig& cfg) {
        for (JsonPairConst kv : obj) {
            const char* key = kv.key().c_str();
            float* target = nullptr;
            if (strcmp(key, "x") == 0) target = &cfg.geometry.center.x;
            else if (strcmp(key, "y") == 0) target = &cfg.geometry.center.y;
            else if (strcmp(key, "z") == 0) target = &cfg.geometry.center.z;

            if (!target) {
                warnUnknown("center", key);
                continue;
            }
            if (!readFloat(kv.value(), *target)) return wrongType("center", key, "a number");
        }
        return Result::ok();
    }

    Result loadAudio(JsonObjectConst obj, LightsConfig& cfg) {
        AnalyzerParams& a = cfg.analyzer;
        AudioSourceConfig& src = cfg.audio;

        for (JsonPairConst kv : obj) {
            const char* key = kv.key().c_str();
            JsonVariantConst v = kv.value();
            bool ok = true;
            const char* expected = "a number";

            if (strcmp(key, "source") == 0) {
                std::string name;
                expected = "one of none, file, pipe, tone";
                ok = readString(v, name) && LightsConfig::audioSourceFromName(name.c_str(), src.kind);
            } else if (strcmp(key, "path") == 0) {
                expected = "a string";
                ok = readString(v, src.path);
            } else if (strcmp(key, "command") == 0) {
                expected = "a string";
                ok = readString(v, src.command);
            } else if (strcmp(key, "tone_bpm") == 0) {
                ok = readFloat(v, src.toneBpm);
            } else if (strcmp(key, "sample_rate") == 0) {
                ok = readFloat(v, a.sampleRate);
            } else if (strcmp(key, "window") == 0) {
                expected = "an integer";
                ok = readInt(v, a.windowSize);
            } else if (strcmp(key, "hop") == 0) {
                expected = "an integer";
                ok = readInt(v, a.hopSize);
            } else if (strcmp(key, "min_hz") == 0) {
                ok = readFloat(v, a.minHz);
            } else if (strcmp(key, "low_hz") == 0) {
                ok = readFloat(v, a.lowHz);
            } else if (strcmp(key, "mid_hz") == 0) {
                ok = readFloat(v, a.midHz);
            } else if (strcmp(key, "max_hz") == 0) {
                ok = readFloat(v, a.maxHz);
            } else if (strcmp(key, "norm_decay") == 0) {
                ok = readFloat(v, a.normDecayTau);
            } else if (strcmp(key, "attack") == 0) {
                ok = readFloat(v, a.attackTau);
            } else if (strcmp(key, "release") == 0) {
                ok = readFloat(v, a.releaseTau);
            } else if (strcmp(key, "beat_threshold") == 0) {
                ok = readFloat(v, a.beatThreshold);
            } else if (strcmp(key, "beat_window") == 0) {
                ok = readFloat(v, a.beatWindow);
            } else if (strcmp(key, "beat_min_energy") == 0) {
                ok = readFloat(v, a.beatMinEnergy);
            } else if (strcmp(key, "beat_refractory_ms") == 0) {
                expected = "a non-negative integer";
                ok = readUint32(v, a.beatRefractoryMs);
            } else if (strcmp(key, "silence_timeout_ms") == 0) {
                expected = "a non-negative integer";
                ok = readUint32(v, a.silenceTimeoutMs);
            } else {
                warnUnknown("audio", key);
                continue;
            }

            if (!ok) return wrongType("audio", key, expected);
        }
        return Result::ok();
    }

    Result loadTransport(JsonObjectConst obj, LightsConfig& cfg) {
        TransportConfig& t = cfg.transport;

        for (JsonPairConst kv : obj) {
            const char* key = kv.key().c_str();
            JsonVariantConst v = kv.value();
            bool ok = true;
            const char* expected = "a number";

            if (strcmp(key, "output") == 0) {
                expected = "a string";
                ok = readString(v, t.output);
            } else if (strcmp(key, "parent_slot_id") == 0) {
                expected = "a string";
                ok = readString(v, t.parentSlotId);
            } else if (strcmp(key, "intensity_scale") == 0) {
                ok = readFloat(v, t.intensityScale);
            } else if (strcmp(key, "light_range") == 0) {
                ok = readFloat(v, t.lightRange);
            } else {
                warnUnknown("transport", key);
                continue;
            }

            if (!ok) return wrongType("transport", key, expected);
        }
        return Result::ok();
    }

    Result loadRoot(JsonObjectConst root, LightsConfig& cfg) {
        LayoutGeometry& g = cfg.geometry;
        PatternParams& p = cfg.patterns;
        SchedulerParams& s = cfg.scheduler;

        for (JsonPairConst kv : root) {
            const char* key = kv.key().c_str();
            JsonVariantConst v = kv.value();
            bool ok = true;
            const char* expected = "a number";

            if (strcmp(key, "layout") == 0 || strcmp(key, "center") == 0 ||
                strcmp(key, "audio") == 0 || strcmp(key, "transport") == 0) {
                if (!v.is<JsonObjectConst>()) return wrongType(nullptr, key, "an object");
                JsonObjectConst obj = v.as<JsonObjectConst>();
                Result r;
                if (key[0] == 'l') r = loadLayout(obj, cfg);
                else if (key[0] == 'c') r = loadCenter(obj, cfg);
                else if (key[0] == 'a') r = loadAudio(obj, cfg);
                else r = loadTransport(obj, cfg);
                if (!r) return r;
                continue;
            }

            if (strcmp(key, "update_rate") == 0) {
                ok = readFloat(v, s.updateRate);
            } else if (strcmp(key, "spacing") == 0) {
                ok = readFloat(v, g.spacing);
            } else if (strcmp(key, "radius") == 0) {
                ok = readFloat(v, g.radius);
            } else if (strcmp(key, "height") == 0) {
                ok = readFloat(v, g.height);
            } else if (strcmp(key, "top_height") == 0) {
                ok = readFloat(v, g.topHeight);
            } else if (strcmp(key, "bottom_height") == 0) {
                ok = readFloat(v, g.bottomHeight);
            } else if (strcmp(key, "chase_tail") == 0) {
                expected = "an integer";
                ok = readInt(v, p.chaseTail);
            } else if (strcmp(key, "chase_step") == 0) {
                ok = readFloat(v, p.chaseStep);
            } else if (strcmp(key, "swirl_rate") == 0) {
                ok = readFloat(v, p.swirlRate);
            } else if (strcmp(key, "sweep_rate") == 0) {
                ok = readFloat(v, p.sweepRate);
            } else if (strcmp(key, "breath_period") == 0) {
                ok = readFloat(v, p.breathPeriod);
            } else if (strcmp(key, "zone_mix_cycle") == 0) {
                ok = readFloat(v, p.zoneMixCycle);
            } else if (strcmp(key, "idle_intensity") == 0) {
                ok = readFloat(v, p.idleIntensity);
            } else if (strcmp(key, "default_pattern") == 0) {
                expected = "a string";
                ok = readString(v, cfg.defaultPattern);
            } else if (strcmp(key, "rotation_enabled") == 0) {
                expected = "true or false";
                ok = readBool(v, s.rotationEnabled);
            } else if (strcmp(key, "rotation_speed") == 0) {
                ok = readFloat(v, s.rotationSpeed);
            } else if (strcmp(key, "rotation_audio_boost") == 0) {
                expected = "true or false";
                ok = readBool(v, s.rotationAudioBoost);
            } else if (strcmp(key, "teardown_timeout_ms") == 0) {
                expected = "a non-negative integer";
                ok = readUint32(v, s.teardownTimeoutMs);
            } else if (strcmp(key, "create_retries") == 0) {
                expected = "an integer";
                ok = readInt(v, s.createRetries);
            } else if (strcmp(key, "remove_retries") == 0) {
                expected = "an integer";
                ok = readInt(v, s.removeRetries);
            } else {
                warnUnknown(nullptr, key);
                continue;
            }

            if (!ok) return wrongType(nullptr, key, expected);
        }
        return Result::ok();
    }
}

Result ConfigLoader::loadString(const char* json, LightsConfig& cfg) {
    if (!json) {
        return Result::fail(ErrorKind::CONFIGURATION, "no config document");
    }

    DynamicJsonDocument doc(JSON_CAPACITY);
    auto error = deserializeJson(doc, json);
    if (error) {
        return Result::fail(ErrorKind::CONFIGURATION,
                            std::string("config parse failed: ") + error.c_str());
    }

    if (!doc.is<JsonObject>()) {
        return Result::fail(ErrorKind::CONFIGURATION, "config root must be an object");
    }

    return loadRoot(doc.as<JsonObjectConst>(), cfg);
}

Result ConfigLoader::loadFile(const char* path, LightsConfig& cfg) {
    FILE* f = fopen(path, "rb");
    if (!f) {
        return Result::fail(ErrorKind::CONFIGURATION, std::string("cannot open config file: ") + path);
    }

    std::string text;
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        text.append(buf, n);
        if (text.size() > MAX_FILE_BYTES) {
            fclose(f);
            return Result::fail(ErrorKind::CONFIGURATION, std::string("config file too large: ") + path);
        }
    }
    bool readError = ferror(f) != 0;
    fclose(f);
    if (readError) {
        return Result::fail(ErrorKind::CONFIGURATION, std::string("cannot read config file: ") + path);
    }

    Result r = loadString(text.c_str(), cfg);
    if (r) {
        DEBUG_INFO_F("Loaded config from %s\n", path);
    } else {
        r.message = std::string(path) + ": " + r.message;
    }
    return r;
}

Result ConfigLoader::applyLayoutSpec(const char* spec, LightsConfig& cfg) {
    if (!spec || spec[0] == '\0') {
        return Result::fail(ErrorKind::CONFIGURATION, "empty layout");
    }

    std::string text(spec);
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        if (comma == std::string::npos) comma = text.size();
        std::string item = text.substr(pos, comma - pos);
        pos = comma + 1;
        if (item.empty()) continue;

        size_t eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result::fail(ErrorKind::CONFIGURATION, "layout entry must be zone=count: " + item);
        }
        std::string name = item.substr(0, eq);
        std::string value = item.substr(eq + 1);

        Zone zone;
        if (!LightLayout::zoneFromName(name.c_str(), zone)) {
            return Result::fail(ErrorKind::CONFIGURATION, "unknown zone in layout: " + name);
        }
        char* end;
        long count = strtol(value.c_str(), &end, 10);
        if (value.empty() || *end != '\0') {
            return Result::fail(ErrorKind::CONFIGURATION, "layout count is not an integer: " + item);
        }
        cfg.zoneCounts[ZoneInfo::toIndex(zone)] = (int)count;
    }
    return Result::ok();
}

bool ConfigLoader::registerSettings(SettingsRegistry& settings, LightsConfig& cfg) {
    bool ok = true;

    // Layout
    ok &= settings.registerInt("left", &cfg.zoneCounts[0], "layout", "Lights on the left wall", 0, 512);
    ok &= settings.registerInt("right", &cfg.zoneCounts[1], "layout", "Lights on the right wall", 0, 512);
    ok &= settings.registerInt("front", &cfg.zoneCounts[2], "layout", "Lights on the front wall", 0, 512);
    ok &= settings.registerInt("back", &cfg.zoneCounts[3], "layout", "Lights on the back wall", 0, 512);
    ok &= settings.registerInt("top", &cfg.zoneCounts[4], "layout", "Lights on the ceiling", 0, 512);
    ok &= settings.registerInt("bottom", &cfg.zoneCounts[5], "layout", "Lights on the floor", 0, 512);
    ok &= settings.registerFloat("spacing", &cfg.geometry.spacing, "layout", "Distance between neighbours", 0.0f, 100.0f);
    ok &= settings.registerFloat("radius", &cfg.geometry.radius, "layout", "Wall distance from center", 0.0f, 1000.0f);
    ok &= settings.registerFloat("height", &cfg.geometry.height, "layout", "Wall light height", -1000.0f, 1000.0f);
    ok &= settings.registerFloat("top_height", &cfg.geometry.topHeight, "layout", "Ceiling light height", -1000.0f, 1000.0f);
    ok &= settings.registerFloat("bottom_height", &cfg.geometry.bottomHeight, "layout", "Floor light height", -1000.0f, 1000.0f);

    // Patterns
    ok &= settings.registerInt("chase_tail", &cfg.patterns.chaseTail, "pattern", "Chase lit length", 1, 64);
    ok &= settings.registerFloat("chase_step", &cfg.patterns.chaseStep, "pattern", "Seconds per chase step", 0.01f, 10.0f);
    ok &= settings.registerFloat("swirl_rate", &cfg.patterns.swirlRate, "pattern", "Swirl revolutions per second", 0.01f, 10.0f);
    ok &= settings.registerFloat("sweep_rate", &cfg.patterns.sweepRate, "pattern", "Wave cycles per second", 0.01f, 10.0f);
    ok &= settings.registerFloat("breath_period", &cfg.patterns.breathPeriod, "pattern", "Seconds per breath", 0.1f, 60.0f);
    ok &= settings.registerFloat("zone_mix_cycle", &cfg.patterns.zoneMixCycle, "pattern", "Seconds per zone mix config", 0.5f, 600.0f);
    ok &= settings.registerFloat("idle_intensity", &cfg.patterns.idleIntensity, "pattern", "Audio pattern level in silence", 0.0f, 1.0f);

    // Scheduler
    ok &= settings.registerFloat("update_rate", &cfg.scheduler.updateRate, "scheduler", "Ticks per second", 1.0f, 240.0f);
    ok &= settings.registerInt("create_retries", &cfg.scheduler.createRetries, "scheduler", "Attempts per light", 1, 10);
    ok &= settings.registerInt("remove_retries", &cfg.scheduler.removeRetries, "scheduler", "Extra removal passes", 0, 10);
    ok &= settings.registerUint32("teardown_timeout_ms", &cfg.scheduler.teardownTimeoutMs, "scheduler", "Shutdown bound (ms)", 1, 60000);
    ok &= settings.registerBool("rotation_enabled", &cfg.scheduler.rotationEnabled, "scheduler", "Global yaw rotation");
    ok &= settings.registerFloat("rotation_speed", &cfg.scheduler.rotationSpeed, "scheduler", "Degrees per second", -720.0f, 720.0f);
    ok &= settings.registerBool("rotation_audio_boost", &cfg.scheduler.rotationAudioBoost, "scheduler", "Scale rotation by bass");

    // Audio
    ok &= settings.registerFloat("tone_bpm", &cfg.audio.toneBpm, "audio", "Test tone tempo", 1.0f, 400.0f);
    ok &= settings.registerFloat("sample_rate", &cfg.analyzer.sampleRate, "audio", "Analysis sample rate", 8000.0f, 192000.0f);
    ok &= settings.registerInt("window", &cfg.analyzer.windowSize, "audio", "FFT window (power of two)", 64, 8192);
    ok &= settings.registerInt("hop", &cfg.analyzer.hopSize, "audio", "Samples between frames", 1, 8192);
    ok &= settings.registerFloat("low_hz", &cfg.analyzer.lowHz, "audio", "Low/mid split", 20.0f, 20000.0f);
    ok &= settings.registerFloat("mid_hz", &cfg.analyzer.midHz, "audio", "Mid/high split", 20.0f, 20000.0f);
    ok &= settings.registerFloat("norm_decay", &cfg.analyzer.normDecayTau, "audio", "Normalizer decay (s)", 0.1f, 120.0f);
    ok &= settings.registerFloat("attack", &cfg.analyzer.attackTau, "audio", "Smoothing attack (s)", 0.001f, 5.0f);
    ok &= settings.registerFloat("release", &cfg.analyzer.releaseTau, "audio", "Smoothing release (s)", 0.001f, 5.0f);
    ok &= settings.registerFloat("beat_threshold", &cfg.analyzer.beatThreshold, "audio", "Beat ratio over average", 1.0f, 10.0f);
    ok &= settings.registerFloat("beat_window", &cfg.analyzer.beatWindow, "audio", "Beat average length (s)", 0.05f, 10.0f);
    ok &= settings.registerFloat("beat_min_energy", &cfg.analyzer.beatMinEnergy, "audio", "Beat energy floor", 0.0f, 1.0f);
    ok &= settings.registerUint32("beat_refractory_ms", &cfg.analyzer.beatRefractoryMs, "audio", "Min time between beats", 0, 5000);
    ok &= settings.registerUint32("silence_timeout_ms", &cfg.analyzer.silenceTimeoutMs, "audio", "Silence after no input", 1, 60000);

    // Transport
    ok &= settings.registerFloat("intensity_scale", &cfg.transport.intensityScale, "transport", "Host intensity multiplier", 0.0f, 100.0f);
    ok &= settings.registerFloat("light_range", &cfg.transport.lightRange, "transport", "Point light range", 0.0f, 1000.0f);

    return ok;
}
