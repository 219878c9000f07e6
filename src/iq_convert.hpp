#pragma once
#include "hw_config.hpp"
#include <complex>
#include <vector>
#include <cstdint>
#include <cstddef>

// Raw interleaved IQ window → normalised complex float.
// Trailing bytes that do not form a whole sample are ignored.
// Returns the number of complex samples written into out.
size_t iq_to_complex(const uint8_t* raw, size_t n_bytes, const HWConfig& hw,
                     std::vector<std::complex<float>>& out);
