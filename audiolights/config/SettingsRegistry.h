#pragma once

#include <stdint.h>
#include <stdio.h>

/**
 * SettingsRegistry - Named, bounded access to numeric configuration
 *
 * Register a setting once, and it automatically gets:
 * - Assignment from the command line (--set name=value)
 * - Console display (get <name>, show, show <category>)
 * - Help text generation
 * - Bounds clamping
 * - Optional change callbacks
 *
 * Values can only change until lock() is called. The session locks the
 * registry before any worker thread starts, so running threads never see
 * a setting change underneath them.
 *
 * Usage:
 *   SettingsRegistry settings;
 *   settings.registerFloat("update_rate", &cfg.scheduler.updateRate, "scheduler", "Ticks per second", 1, 240);
 *   settings.applyAssignment("update_rate=60");
 *   settings.lock();
 *   settings.handleCommand("show scheduler");
 */

// Maximum number of settings (adjust based on needs)
#define MAX_SETTINGS 64

// Setting value types
enum class SettingType : uint8_t {
    INT32,
    UINT32,
    FLOAT,
    BOOL
};

// Setting definition
struct Setting {
    const char* name;           // Key (e.g., "chase_tail")
    const char* category;       // Category for grouping (e.g., "pattern", "audio")
    const char* description;    // Help text
    SettingType type;
    void* valuePtr;             // Pointer to the actual value
    float minVal;               // Minimum allowed value
    float maxVal;               // Maximum allowed value
};

class SettingsRegistry {
public:
    explicit SettingsRegistry(FILE* out = stderr);

    // Registration methods - return true if successful
    bool registerInt(const char* name, int* value, const char* category,
                     const char* desc, int minVal, int maxVal);

    bool registerUint32(const char* name, uint32_t* value, const char* category,
                        const char* desc, uint32_t minVal = 0, uint32_t maxVal = 0xFFFFFFFF);

    bool registerFloat(const char* name, float* value, const char* category,
                       const char* desc, float minVal = 0.0f, float maxVal = 1.0f);

    bool registerBool(const char* name, bool* value, const char* category,
                      const char* desc);

    /**
     * Apply "name=value". Out-of-range numbers are clamped.
     * @return false for an unknown name, an unparsable value or a locked registry
     */
    bool applyAssignment(const char* assignment);
    bool set(const char* name, const char* value);

    // Freeze values; "set" is refused afterwards
    void lock() { locked_ = true; }
    bool isLocked() const { return locked_; }

    // Command handling - returns true if command was handled
    bool handleCommand(const char* cmd);

    // Display methods
    void printAll();                           // Print all settings
    void printCategory(const char* category);  // Print settings in category
    void printHelp();                          // Print help with all commands
    void printValue(const char* name);         // Print single value
    void printCategories();

    // Utility
    Setting* findSetting(const char* name);
    uint8_t getSettingCount() const { return numSettings_; }

private:
    Setting settings_[MAX_SETTINGS];
    uint8_t numSettings_;
    bool locked_;
    FILE* out_;

    bool registerSetting(const Setting& setting);
    bool setValue(Setting* s, const char* valueStr);
    void printSettingValue(const Setting& s);
    void printSettingHelp(const Setting& s);

    // Parse helpers
    static bool parseFloat(const char* str, float& out);
    static bool parseInt(const char* str, int32_t& out);
    static bool parseUint32(const char* str, uint32_t& out);
    static bool parseBool(const char* str, bool& out);
};
