#include "speech_guard/audio/wav_reader.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include <sndfile.h>

#include "speech_guard/errors.hpp"

namespace speech_guard {
namespace audio {

namespace {

struct MemoryFile {
    const char* data;
    sf_count_t size;
    sf_count_t pos;
};

sf_count_t memory_length(void* user) {
    return static_cast<MemoryFile*>(user)->size;
}

sf_count_t memory_seek(sf_count_t offset, int whence, void* user) {
    auto* file = static_cast<MemoryFile*>(user);
    sf_count_t position = offset;
    if (whence == SEEK_CUR) {
        position = file->pos + offset;
    } else if (whence == SEEK_END) {
        position = file->size + offset;
    }
    file->pos = std::clamp<sf_count_t>(position, 0, file->size);
    return file->pos;
}

sf_count_t memory_read(void* ptr, sf_count_t count, void* user) {
    auto* file = static_cast<MemoryFile*>(user);
    const sf_count_t available = std::min(count, file->size - file->pos);
    if (available <= 0) {
        return 0;
    }
    std::memcpy(ptr, file->data + file->pos, static_cast<std::size_t>(available));
    file->pos += available;
    return available;
}

sf_count_t memory_write(const void*, sf_count_t, void*) {
    return 0;
}

sf_count_t memory_tell(void* user) {
    return static_cast<MemoryFile*>(user)->pos;
}

struct SndfileDeleter {
    void operator()(SNDFILE* file) const {
        sf_close(file);
    }
};

uint32_t read_u32(const std::string& bytes, std::size_t offset) {
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | static_cast<unsigned char>(bytes[offset + static_cast<std::size_t>(i)]);
    }
    return value;
}

void check_riff_header(const std::string& bytes) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 || bytes.compare(8, 4, "WAVE") != 0) {
        throw DecodeError("payload is not RIFF/WAVE");
    }
    const uint32_t declared = read_u32(bytes, 4);
    if (declared != 0 && declared != 0xFFFFFFFFu &&
        static_cast<uint64_t>(declared) + 8 > bytes.size()) {
        throw DecodeError("WAV payload truncated: header declares " + std::to_string(declared + 8ull) +
                          " bytes, got " + std::to_string(bytes.size()));
    }
    std::size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const uint32_t size = read_u32(bytes, offset + 4);
        if (bytes.compare(offset, 4, "data") == 0) {
            if (size == 0) {
                throw DecodeError("WAV data chunk is empty");
            }
            return;
        }
        // Chunks are padded to an even length.
        offset += 8 + static_cast<std::size_t>(size) + (size & 1u);
    }
}

double full_scale(int subtype) {
    switch (subtype) {
    case SF_FORMAT_PCM_U8:
    case SF_FORMAT_PCM_S8:
        return 127.0;
    case SF_FORMAT_PCM_16:
        return 32767.0;
    case SF_FORMAT_PCM_24:
        return 8388607.0;
    case SF_FORMAT_PCM_32:
        return 2147483647.0;
    case SF_FORMAT_FLOAT:
    case SF_FORMAT_DOUBLE:
        return 1.0;
    default:
        throw DecodeError("unsupported WAV encoding");
    }
}

}

PcmBuffer read_wav(const std::string& bytes, double max_seconds) {
    check_riff_header(bytes);

    MemoryFile memory{bytes.data(), static_cast<sf_count_t>(bytes.size()), 0};
    SF_VIRTUAL_IO io{memory_length, memory_seek, memory_read, memory_write, memory_tell};
    SF_INFO info{};
    std::unique_ptr<SNDFILE, SndfileDeleter> file(sf_open_virtual(&io, SFM_READ, &info, &memory));
    if (!file) {
        throw DecodeError(std::string("failed to open WAV payload: ") + sf_strerror(nullptr));
    }

    const int major = info.format & SF_FORMAT_TYPEMASK;
    if (major != SF_FORMAT_WAV && major != SF_FORMAT_WAVEX) {
        throw DecodeError("payload is not RIFF/WAVE");
    }
    const double scale = full_scale(info.format & SF_FORMAT_SUBMASK);
    if (info.channels <= 0 || info.samplerate <= 0) {
        throw DecodeError("WAV header has no channels or sample rate");
    }
    if (info.frames <= 0) {
        throw DecodeError("WAV contains no audio frames");
    }
    if (static_cast<double>(info.frames) / info.samplerate > max_seconds) {
        throw DecodeError("WAV clip longer than " + std::to_string(max_seconds) + " s");
    }

    sf_command(file.get(), SFC_SET_NORM_FLOAT, nullptr, SF_FALSE);

    PcmBuffer pcm;
    pcm.sample_rate = info.samplerate;
    pcm.channels = info.channels;
    pcm.interleaved.resize(static_cast<std::size_t>(info.frames) *
                           static_cast<std::size_t>(info.channels));
    const sf_count_t read = sf_readf_float(file.get(), pcm.interleaved.data(), info.frames);
    if (read != info.frames) {
        throw DecodeError("WAV data truncated: read " + std::to_string(read) + " of " +
                          std::to_string(info.frames) + " frames");
    }

    const auto inverse = static_cast<float>(1.0 / scale);
    for (auto& sample : pcm.interleaved) {
        if (!std::isfinite(sample)) {
            throw DecodeError("WAV contains non-finite samples");
        }
        sample = std::clamp(sample * inverse, -1.0f, 1.0f);
    }
    return pcm;
}

}
}
