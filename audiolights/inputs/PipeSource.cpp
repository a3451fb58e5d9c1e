#include "PipeSource.h"
#include "../config/DebugLog.h"
#include <stdint.h>

PipeSource::PipeSource(const std::string& command, float sampleRate)
    : command_(command)
    , description_("pipe:" + command)
    , sampleRate_(sampleRate)
    , pipe_(nullptr)
{
}

PipeSource::~PipeSource() {
    end();
}

bool PipeSource::begin() {
    if (command_.empty()) {
        DEBUG_ERROR("Pipe source has no capture command");
        return false;
    }
    pipe_ = popen(command_.c_str(), "r");
    if (!pipe_) {
        DEBUG_ERROR_F("Failed to start capture command: %s\n", command_.c_str());
        return false;
    }
    return true;
}

void PipeSource::end() {
    if (pipe_) {
        int status = pclose(pipe_);
        pipe_ = nullptr;
        if (status != 0) {
            DEBUG_VERBOSE_F("Capture command exited with status %d\n", status);
        }
    }
}

int PipeSource::read(float* buffer, int maxSamples) {
    if (!pipe_ || !buffer || maxSamples <= 0) return -1;

    if ((int)raw_.size() < maxSamples) {
        raw_.resize(maxSamples);
    }
    size_t got = fread(raw_.data(), sizeof(int16_t), (size_t)maxSamples, pipe_);
    if (got == 0) {
        if (feof(pipe_)) {
            DEBUG_WARN("Capture command ended");
        }
        return -1;
    }

    for (size_t i = 0; i < got; i++) {
        // Wire format is little endian regardless of host order
        const uint8_t* b = reinterpret_cast<const uint8_t*>(&raw_[i]);
        int16_t v = (int16_t)(b[0] | (b[1] << 8));
        buffer[i] = v / 32768.0f;
    }
    return (int)got;
}
