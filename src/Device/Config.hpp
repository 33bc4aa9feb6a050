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

#ifndef caustic_Config_hpp
#define caustic_Config_hpp

namespace caustic {

constexpr int MaxClusterCount = 16;
constexpr int MAX_TEXTURE_UNITS = 32;
constexpr int MAX_FRAMEBUFFER_DIM = 8192;
constexpr int MAX_CLIPPED_VERTICES = 3 + 6;  // Each clip plane adds at most one vertex.

// Rasterization works in 28.4 fixed point over square blocks of pixels.
// Clusters own bands of BLOCK_SIZE rows, assigned round-robin.
constexpr int SUBPIXEL_BITS = 4;
constexpr int SUBPIXEL_SCALE = 1 << SUBPIXEL_BITS;
constexpr int BLOCK_SIZE = 8;

// Maximum depth value, the value the depth buffer is cleared to.
constexpr short DEPTH_CLEAR = 0x7FFF;

}  // namespace caustic

#endif  // caustic_Config_hpp
