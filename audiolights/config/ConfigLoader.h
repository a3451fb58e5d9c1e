#pragma once

#include "LightsConfig.h"
#include "SettingsRegistry.h"
#include "../types/Result.h"

/**
 * ConfigLoader - Fills a LightsConfig from JSON and exposes it as settings
 *
 * All keys are optional; anything missing keeps its default. Unknown keys
 * are logged and ignored. A key with the wrong JSON type is a
 * configuration error. Range checks are left to LightsConfig::validate().
 *
 * Usage:
 *   LightsConfig cfg;
 *   Result r = ConfigLoader::loadFile("audiolights.json", cfg);
 *   if (r) r = cfg.validate();
 */
class ConfigLoader {
public:
    /**
     * Load a JSON file into cfg
     *
     * @param path File to read
     * @param cfg Output config; untouched keys keep their current values
     * @return CONFIGURATION failure if the file is unreadable or malformed
     */
    static Result loadFile(const char* path, LightsConfig& cfg);

    // Same as loadFile() for an in-memory document
    static Result loadString(const char* json, LightsConfig& cfg);

    /**
     * Parse a layout override of the form "left=5,right=5,top=4".
     * Zones not named keep their counts.
     */
    static Result applyLayoutSpec(const char* spec, LightsConfig& cfg);

    /**
     * Register the numeric tunables of cfg so --set and the console
     * "show" command can reach them. Pointers into cfg are kept, so cfg
     * must outlive the registry.
     */
    static bool registerSettings(SettingsRegistry& settings, LightsConfig& cfg);

    // Largest accepted config document
    static constexpr size_t MAX_FILE_BYTES = 64 * 1024;

private:
    // Static utility class - no instantiation
    ConfigLoader() = delete;
};
