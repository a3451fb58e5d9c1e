#include "WavFileSource.h"
#include "../config/DebugLog.h"
#include <fstream>
#include <iterator>
#include <string.h>

namespace {
    constexpr uint16_t FORMAT_PCM = 1;
    constexpr uint16_t FORMAT_FLOAT = 3;
    constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

    // Cap on one read when pacing falls far behind (e.g. after a stall)
    constexpr uint64_t MAX_CATCHUP_MS = 200;
}

WavFileSource::WavFileSource(const std::string& path, float targetRate, ISystemTime& time, bool paced)
    : path_(path)
    , description_("wav:" + path)
    , time_(time)
    , paced_(paced)
    , targetRate_(targetRate)
    , outputRate_(targetRate)
    , fileRate_(0.0f)
    , channels_(0)
    , position_(0)
    , loops_(0)
    , startMs_(0)
    , delivered_(0)
    , open_(false)
{
}

bool WavFileSource::begin() {
    std::ifstream file(path_.c_str(), std::ios::binary);
    if (!file) {
        DEBUG_ERROR_F("Cannot open audio file: %s\n", path_.c_str());
        return false;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (!parse(bytes)) {
        DEBUG_ERROR_F("Unsupported or corrupt WAV file: %s\n", path_.c_str());
        return false;
    }

    DEBUG_INFO_F("Loaded %s: %.0f Hz, %d ch, %.1f s\n", path_.c_str(), fileRate_, channels_,
                 outputRate_ > 0.0f ? samples_.size() / outputRate_ : 0.0f);

    position_ = 0;
    loops_ = 0;
    delivered_ = 0;
    startMs_ = time_.millis();
    open_ = true;
    return true;
}

void WavFileSource::end() {
    open_ = false;
}

bool WavFileSource::parse(const std::vector<uint8_t>& bytes) {
    samples_.clear();
    if (bytes.size() < 12) return false;
    const uint8_t* data = bytes.data();
    if (memcmp(data, "RIFF", 4) != 0 || memcmp(data + 8, "WAVE", 4) != 0) {
        return false;
    }

    uint16_t format = 0;
    uint16_t bits = 0;
    uint32_t rate = 0;
    const uint8_t* pcm = nullptr;
    uint32_t pcmBytes = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = data + pos;
        uint32_t size = readU32(chunk + 4);
        size_t body = pos + 8;
        size_t available = bytes.size() - body;
        if (size > available) size = (uint32_t)available;  // Truncated files still play

        if (memcmp(chunk, "fmt ", 4) == 0 && size >= 16) {
            format = readU16(data + body);
            channels_ = readU16(data + body + 2);
            rate = readU32(data + body + 4);
            bits = readU16(data + body + 14);
            if (format == FORMAT_EXTENSIBLE && size >= 26) {
                format = readU16(data + body + 24);
            }
        } else if (memcmp(chunk, "data", 4) == 0) {
            pcm = data + body;
            pcmBytes = size;
        }
        // Chunks are word aligned
        pos = body + size + (size & 1);
    }

    if (!pcm || channels_ <= 0 || rate == 0) return false;
    bool isPcm16 = (format == FORMAT_PCM && bits == 16);
    bool isFloat32 = (format == FORMAT_FLOAT && bits == 32);
    if (!isPcm16 && !isFloat32) return false;

    int bytesPerSample = bits / 8;
    size_t frameBytes = (size_t)bytesPerSample * channels_;
    size_t frames = pcmBytes / frameBytes;
    if (frames == 0) return false;

    samples_.resize(frames);
    for (size_t f = 0; f < frames; f++) {
        const uint8_t* frame = pcm + f * frameBytes;
        float sum = 0.0f;
        for (int c = 0; c < channels_; c++) {
            const uint8_t* s = frame + c * bytesPerSample;
            if (isPcm16) {
                sum += (int16_t)readU16(s) / 32768.0f;
            } else {
                uint32_t raw = readU32(s);
                float v;
                memcpy(&v, &raw, sizeof(v));
                // NaN and inf samples decode as silence
                sum += safeIsFinite(v) ? v : 0.0f;
            }
        }
        samples_[f] = sum / channels_;
    }

    fileRate_ = (float)rate;
    outputRate_ = fileRate_;
    if (targetRate_ > 0.0f && targetRate_ != fileRate_) {
        resampleTo(targetRate_);
    }
    return !samples_.empty();
}

void WavFileSource::resampleTo(float rate) {
    double ratio = (double)fileRate_ / rate;
    size_t outCount = (size_t)(samples_.size() / ratio);
    if (outCount == 0) outCount = 1;

    std::vector<float> out(outCount);
    for (size_t i = 0; i < outCount; i++) {
        double src = i * ratio;
        size_t i0 = (size_t)src;
        size_t i1 = i0 + 1 < samples_.size() ? i0 + 1 : i0;
        float frac = (float)(src - i0);
        out[i] = samples_[i0] + (samples_[i1] - samples_[i0]) * frac;
    }
    samples_.swap(out);
    outputRate_ = rate;
}

int WavFileSource::read(float* buffer, int maxSamples) {
    if (!open_ || !buffer || maxSamples <= 0) return -1;
    if (samples_.empty()) return -1;

    int wanted = maxSamples;
    if (paced_) {
        uint64_t elapsedMs = time_.millis() - startMs_;
        uint64_t due = (uint64_t)(elapsedMs * (double)outputRate_ / 1000.0);
        if (due <= delivered_) return 0;
        uint64_t backlog = due - delivered_;
        uint64_t cap = (uint64_t)(MAX_CATCHUP_MS * outputRate_ / 1000.0);
        if (backlog > cap) {
            // Skip ahead instead of bursting a long backlog
            delivered_ = due - cap;
            backlog = cap;
        }
        if (backlog < (uint64_t)wanted) wanted = (int)backlog;
    }

    for (int i = 0; i < wanted; i++) {
        buffer[i] = samples_[position_];
        position_++;
        if (position_ >= samples_.size()) {
            position_ = 0;
            loops_++;
        }
    }
    delivered_ += wanted;
    return wanted;
}
