#include "iq_convert.hpp"
#include <cstring>

size_t iq_to_complex(const uint8_t* raw, size_t n_bytes, const HWConfig& hw,
                     std::vector<std::complex<float>>& out){
    const int bps = hw.bytes_per_sample > 0 ? hw.bytes_per_sample : 2;
    const size_t n = n_bytes / (size_t)bps;
    out.resize(n);
    const float inv = 1.0f / hw.iq_scale;
    const float off = hw.iq_offset;

    switch(hw.format){
    case SampleFormat::CU8:
        // RTL-SDR: uint8, centre 127.5
        for(size_t i=0;i<n;i++)
            out[i] = {((float)raw[i*2] - off) * inv, ((float)raw[i*2+1] - off) * inv};
        break;
    case SampleFormat::CS8: {
        // HackRF: int8
        const int8_t* s = reinterpret_cast<const int8_t*>(raw);
        for(size_t i=0;i<n;i++)
            out[i] = {((float)s[i*2] - off) * inv, ((float)s[i*2+1] - off) * inv};
        break;
    }
    case SampleFormat::CS16_Q11:
        // BladeRF SC16 Q11, little endian, 4 bytes per sample
        for(size_t i=0;i<n;i++){
            int16_t iv, qv;
            memcpy(&iv, raw + i*4,     2);
            memcpy(&qv, raw + i*4 + 2, 2);
            out[i] = {((float)iv - off) * inv, ((float)qv - off) * inv};
        }
        break;
    }
    return n;
}
