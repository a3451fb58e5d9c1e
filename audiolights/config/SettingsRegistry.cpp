#include "SettingsRegistry.h"
#include "DebugLog.h"
#include <string.h>
#include <strings.h>
#include <stdlib.h>

namespace {
    template <typename T>
    T constrain(T v, T lo, T hi) {
        return v < lo ? lo : (v > hi ? hi : v);
    }
}

SettingsRegistry::SettingsRegistry(FILE* out) : numSettings_(0), locked_(false), out_(out) {
    memset(settings_, 0, sizeof(settings_));
}

bool SettingsRegistry::registerSetting(const Setting& setting) {
    if (numSettings_ >= MAX_SETTINGS) {
        DEBUG_ERROR("Settings registry full");
        return false;
    }
    if (findSetting(setting.name)) {
        DEBUG_ERROR_F("Duplicate setting: %s\n", setting.name);
        return false;
    }
    settings_[numSettings_++] = setting;
    return true;
}

bool SettingsRegistry::registerInt(const char* name, int* value, const char* category,
                                   const char* desc, int minVal, int maxVal) {
    Setting s = {name, category, desc, SettingType::INT32, value,
                 (float)minVal, (float)maxVal};
    return registerSetting(s);
}

bool SettingsRegistry::registerUint32(const char* name, uint32_t* value, const char* category,
                                      const char* desc, uint32_t minVal, uint32_t maxVal) {
    Setting s = {name, category, desc, SettingType::UINT32, value,
                 (float)minVal, (float)maxVal};
    return registerSetting(s);
}

bool SettingsRegistry::registerFloat(const char* name, float* value, const char* category,
                                     const char* desc, float minVal, float maxVal) {
    Setting s = {name, category, desc, SettingType::FLOAT, value,
                 minVal, maxVal};
    return registerSetting(s);
}

bool SettingsRegistry::registerBool(const char* name, bool* value, const char* category,
                                    const char* desc) {
    Setting s = {name, category, desc, SettingType::BOOL, value,
                 0.0f, 1.0f};
    return registerSetting(s);
}

Setting* SettingsRegistry::findSetting(const char* name) {
    if (!name) return nullptr;
    for (uint8_t i = 0; i < numSettings_; i++) {
        if (strcasecmp(settings_[i].name, name) == 0) {
            return &settings_[i];
        }
    }
    return nullptr;
}

bool SettingsRegistry::parseFloat(const char* str, float& out) {
    char* end;
    float val = strtof(str, &end);
    if (end == str || *end != '\0') return false;
    if (!(val == val)) return false;
    out = val;
    return true;
}

bool SettingsRegistry::parseInt(const char* str, int32_t& out) {
    char* end;
    long val = strtol(str, &end, 10);
    if (end == str || *end != '\0') return false;
    out = (int32_t)val;
    return true;
}

bool SettingsRegistry::parseUint32(const char* str, uint32_t& out) {
    if (str[0] == '-') return false;
    char* end;
    unsigned long val = strtoul(str, &end, 10);
    if (end == str || *end != '\0') return false;
    out = (uint32_t)val;
    return true;
}

bool SettingsRegistry::parseBool(const char* str, bool& out) {
    if (strcasecmp(str, "true") == 0 || strcasecmp(str, "on") == 0 ||
        strcasecmp(str, "yes") == 0 || strcmp(str, "1") == 0) {
        out = true;
        return true;
    }
    if (strcasecmp(str, "false") == 0 || strcasecmp(str, "off") == 0 ||
        strcasecmp(str, "no") == 0 || strcmp(str, "0") == 0) {
        out = false;
        return true;
    }
    return false;
}

bool SettingsRegistry::setValue(Setting* s, const char* valueStr) {
    float floatVal;
    int32_t intVal;
    bool boolVal;

    switch (s->type) {
        case SettingType::INT32:
            if (!parseInt(valueStr, intVal)) return false;
            intVal = constrain(intVal, (int32_t)s->minVal, (int32_t)s->maxVal);
            *((int*)s->valuePtr) = (int)intVal;
            break;

        case SettingType::UINT32: {
            uint32_t uintVal;
            if (!parseUint32(valueStr, uintVal)) return false;
            // Use manual min/max to avoid signed/unsigned issues
            uint32_t minU = (uint32_t)s->minVal;
            uint32_t maxU = (uint32_t)s->maxVal;
            if (uintVal < minU) uintVal = minU;
            if (uintVal > maxU) uintVal = maxU;
            *((uint32_t*)s->valuePtr) = uintVal;
            break;
        }

        case SettingType::FLOAT:
            if (!parseFloat(valueStr, floatVal)) return false;
            floatVal = constrain(floatVal, s->minVal, s->maxVal);
            *((float*)s->valuePtr) = floatVal;
            break;

        case SettingType::BOOL:
            if (!parseBool(valueStr, boolVal)) return false;
            *((bool*)s->valuePtr) = boolVal;
            break;

        default:
            return false;
    }

    return true;
}

bool SettingsRegistry::set(const char* name, const char* value) {
    if (locked_) {
        DEBUG_WARN("Settings are fixed once the session is running; use --set at startup");
        return false;
    }
    Setting* s = findSetting(name);
    if (!s) {
        DEBUG_WARN_F("Unknown setting: %s\n", name);
        return false;
    }
    if (!setValue(s, value)) {
        DEBUG_WARN_F("Invalid value for %s: %s\n", name, value);
        return false;
    }
    return true;
}

bool SettingsRegistry::applyAssignment(const char* assignment) {
    if (!assignment) return false;
    const char* eq = strchr(assignment, '=');
    if (!eq || eq == assignment) {
        DEBUG_WARN_F("Expected name=value, got: %s\n", assignment);
        return false;
    }

    char nameBuf[48];
    size_t nameLen = eq - assignment;
    if (nameLen >= sizeof(nameBuf)) nameLen = sizeof(nameBuf) - 1;
    strncpy(nameBuf, assignment, nameLen);
    nameBuf[nameLen] = '\0';

    return set(nameBuf, eq + 1);
}

void SettingsRegistry::printSettingValue(const Setting& s) {
    fprintf(out_, "%s = ", s.name);

    switch (s.type) {
        case SettingType::INT32:
            fprintf(out_, "%d", *((int*)s.valuePtr));
            break;
        case SettingType::UINT32:
            fprintf(out_, "%u", *((uint32_t*)s.valuePtr));
            break;
        case SettingType::FLOAT:
            fprintf(out_, "%.3f", *((float*)s.valuePtr));
            break;
        case SettingType::BOOL:
            fprintf(out_, "%s", *((bool*)s.valuePtr) ? "on" : "off");
            break;
    }

    fprintf(out_, "  [%s]\n", s.category);
}

void SettingsRegistry::printSettingHelp(const Setting& s) {
    // Pad name to align descriptions
    fprintf(out_, "  %-22s%s", s.name, s.description);

    // Show range for numeric types
    if (s.type == SettingType::FLOAT) {
        fprintf(out_, " (%.2f-%.2f)\n", s.minVal, s.maxVal);
    } else if (s.type == SettingType::BOOL) {
        fprintf(out_, " (on/off)\n");
    } else {
        fprintf(out_, " (%ld-%ld)\n", (long)s.minVal, (long)s.maxVal);
    }
}

bool SettingsRegistry::handleCommand(const char* cmd) {
    // Skip empty commands
    if (!cmd || cmd[0] == '\0') return false;

    // Handle "set <name> <value>"
    if (strncmp(cmd, "set ", 4) == 0) {
        char nameBuf[48];
        const char* nameStart = cmd + 4;
        while (*nameStart == ' ') nameStart++;

        const char* valueStart = strchr(nameStart, ' ');
        if (!valueStart) {
            fprintf(out_, "Usage: set <name> <value>\n");
            return true;
        }

        size_t nameLen = valueStart - nameStart;
        if (nameLen >= sizeof(nameBuf)) nameLen = sizeof(nameBuf) - 1;
        strncpy(nameBuf, nameStart, nameLen);
        nameBuf[nameLen] = '\0';
        while (*valueStart == ' ') valueStart++;

        if (set(nameBuf, valueStart)) {
            printSettingValue(*findSetting(nameBuf));
        }
        return true;
    }

    // Handle "get <name>"
    if (strncmp(cmd, "get ", 4) == 0) {
        const char* name = cmd + 4;
        while (*name == ' ') name++;

        Setting* s = findSetting(name);
        if (!s) {
            fprintf(out_, "Unknown setting: %s\n", name);
        } else {
            printSettingValue(*s);
        }
        return true;
    }

    // Handle "show" or "show <category>"
    if (strcmp(cmd, "show") == 0) {
        printAll();
        return true;
    }

    if (strncmp(cmd, "show ", 5) == 0) {
        const char* category = cmd + 5;
        while (*category == ' ') category++;
        printCategory(category);
        return true;
    }

    if (strcmp(cmd, "categories") == 0) {
        printCategories();
        return true;
    }

    if (strcmp(cmd, "settings") == 0 || strcmp(cmd, "settings help") == 0) {
        printHelp();
        return true;
    }

    return false;  // Command not handled
}

void SettingsRegistry::printValue(const char* name) {
    Setting* s = findSetting(name);
    if (s) {
        printSettingValue(*s);
    }
}

void SettingsRegistry::printAll() {
    fprintf(out_, "=== ALL SETTINGS ===\n");

    // Collect unique categories
    const char* categories[16];
    uint8_t numCategories = 0;

    for (uint8_t i = 0; i < numSettings_; i++) {
        const char* cat = settings_[i].category;
        bool found = false;
        for (uint8_t j = 0; j < numCategories; j++) {
            if (strcmp(categories[j], cat) == 0) {
                found = true;
                break;
            }
        }
        if (!found && numCategories < 16) {
            categories[numCategories++] = cat;
        }
    }

    // Print by category
    for (uint8_t c = 0; c < numCategories; c++) {
        fprintf(out_, "\n[%s]\n", categories[c]);
        for (uint8_t i = 0; i < numSettings_; i++) {
            if (strcmp(settings_[i].category, categories[c]) == 0) {
                fprintf(out_, "  ");
                printSettingValue(settings_[i]);
            }
        }
    }
}

void SettingsRegistry::printCategory(const char* category) {
    fprintf(out_, "=== %s SETTINGS ===\n", category);

    bool found = false;
    for (uint8_t i = 0; i < numSettings_; i++) {
        if (strcasecmp(settings_[i].category, category) == 0) {
            printSettingValue(settings_[i]);
            found = true;
        }
    }

    if (!found) {
        fprintf(out_, "No settings in category: %s\n", category);
    }
}

void SettingsRegistry::printCategories() {
    fprintf(out_, "Categories:");
    const char* seen[16];
    uint8_t numSeen = 0;
    for (uint8_t i = 0; i < numSettings_; i++) {
        bool found = false;
        for (uint8_t j = 0; j < numSeen; j++) {
            if (strcmp(seen[j], settings_[i].category) == 0) {
                found = true;
                break;
            }
        }
        if (!found && numSeen < 16) {
            seen[numSeen++] = settings_[i].category;
            fprintf(out_, " %s", settings_[i].category);
        }
    }
    fprintf(out_, "\n");
}

void SettingsRegistry::printHelp() {
    fprintf(out_, "=== SETTINGS COMMANDS ===\n");
    fprintf(out_, "  get <name>            Show one value\n");
    fprintf(out_, "  show [category]       Show all values, or one category\n");
    fprintf(out_, "  categories            List categories\n");
    if (!locked_) {
        fprintf(out_, "  set <name> <value>    Change a value\n");
    }
    fprintf(out_, "\n=== SETTINGS ===\n");
    for (uint8_t i = 0; i < numSettings_; i++) {
        printSettingHelp(settings_[i]);
    }
}
