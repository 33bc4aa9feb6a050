// Copyright 2021 The Caustic Authors. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef caustic_Conversion_hpp
#define caustic_Conversion_hpp

#include "DataFormat.hpp"
#include "System/Types.hpp"

#include <cstddef>
#include <cstdint>

namespace caustic {

// Normalization ranges. A normalized signed value is (v - MIN) / RANGE.
constexpr float BYTE_RANGE = 255.0f;
constexpr float SHORT_RANGE = 65535.0f;
constexpr float INT_RANGE = static_cast<float>(INT32_MAX) - static_cast<float>(INT32_MIN);

// Raw component access into a tightly packed array of 'type' components.
// Signed types are sign-extended, unsigned types are zero-extended, and
// floating-point types return their bit pattern.
int32_t read(const uint8_t *data, DataType type, size_t index);
void write(uint8_t *data, DataType type, int32_t value, size_t index);

// Converts a raw value returned by read() to float. FLOAT and HALF_FLOAT
// decode their bit pattern and ignore 'normalize'.
float toFloat(DataType type, int32_t value, bool normalize);

// Inverse of toFloat(), rounding to nearest and saturating to the type's range.
int32_t fromFloat(DataType type, float value, bool normalize);

// Same as toFloat(type, read(data, type, index), true).
float readAsFloat(const uint8_t *data, DataType type, size_t index);

// Copies one component. Components of different types are converted through
// their normalized float value.
void copy(const uint8_t *source, DataType sourceType, size_t sourceIndex,
          uint8_t *destination, DataType destinationType, size_t destinationIndex);

// Packs a color into a 32-bit ARGB word, clamping each channel to [0, 1].
uint32_t pack(float r, float g, float b, float a);
uint32_t pack(const float4 &color);
float4 unpack(uint32_t argb);

// Quantizes a [0, 1] depth to the signed 16-bit depth buffer range.
int16_t denormalizeToShort(float f);

float baryLerp(float a, float b, float c, float r, float s, float t);

}  // namespace caustic

#endif  // caustic_Conversion_hpp
