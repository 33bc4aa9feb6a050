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

#ifndef caustic_ShaderBuffer_hpp
#define caustic_ShaderBuffer_hpp

#include "DataFormat.hpp"
#include "System/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace caustic {

// Read side of a shader record. Each read consumes one slot and converts
// between the INT and FLOAT slot types as needed.
class InBuffer
{
public:
	virtual ~InBuffer() = default;

	virtual int readInt() = 0;
	virtual int2 readVector2i() = 0;
	virtual int3 readVector3i() = 0;
	virtual int4 readVector4i() = 0;

	virtual float readFloat() = 0;
	virtual float2 readVector2f() = 0;
	virtual float3 readVector3f() = 0;
	virtual float4 readVector4f() = 0;

	// Moves to the next slot without reading the rest of this one.
	virtual void skip() = 0;
};

// Write side of a shader record.
class OutBuffer
{
public:
	virtual ~OutBuffer() = default;

	virtual void writeInt(int value) = 0;
	virtual void writeVector2i(const int2 &value) = 0;
	virtual void writeVector3i(const int3 &value) = 0;
	virtual void writeVector4i(const int4 &value) = 0;

	virtual void writeFloat(float value) = 0;
	virtual void writeVector2f(const float2 &value) = 0;
	virtual void writeVector3f(const float3 &value) = 0;
	virtual void writeVector4f(const float4 &value) = 0;

	// Moves to the next slot, leaving the unwritten words of this one as they were.
	virtual void skip() = 0;
};

// A vertex or fragment record: 32-bit words laid out as a sequence of slots,
// one per DataFormat. INT slots hold integers, FLOAT slots hold float bit
// patterns. Reading or writing more components than a slot declares is
// ignored (reads return 0); the cursor moves to the next slot once the
// current one has been read or written.
class ShaderBuffer final : public InBuffer, public OutBuffer
{
public:
	explicit ShaderBuffer(const std::vector<DataFormat> &formats);

	const std::vector<DataFormat> &getFormats() const { return formats; }

	int readInt() override;
	int2 readVector2i() override;
	int3 readVector3i() override;
	int4 readVector4i() override;

	float readFloat() override;
	float2 readVector2f() override;
	float3 readVector3f() override;
	float4 readVector4f() override;

	void writeInt(int value) override;
	void writeVector2i(const int2 &value) override;
	void writeVector3i(const int3 &value) override;
	void writeVector4i(const int4 &value) override;

	void writeFloat(float value) override;
	void writeVector2f(const float2 &value) override;
	void writeVector3f(const float3 &value) override;
	void writeVector4f(const float4 &value) override;

	void skip() override;

	// Raw word access, ignoring slots.
	int32_t readRaw();
	void writeRaw(int32_t word);
	// Copies the unread remainder of 'other' word for word.
	void writeRaw(ShaderBuffer &other);
	// Word at an absolute position, without moving the cursor.
	int32_t getRaw(size_t position) const { return static_cast<int32_t>(words[position]); }

	size_t position() const { return index; }
	void position(size_t newPosition);
	size_t remaining() const { return limit - index; }
	size_t capacity() const { return words.size(); }

	// Resets both the word cursor and the slot cursor.
	void clear();   // limit = capacity
	void flip();    // limit = current position
	void rewind();  // limit unchanged

private:
	int readIntComponent();
	float readFloatComponent();
	void writeIntComponent(int value);
	void writeFloatComponent(float value);
	void advance();

	std::vector<DataFormat> formats;
	std::vector<uint32_t> words;

	size_t index = 0;
	size_t limit = 0;
	size_t slot = 0;   // Slot being read or written
	int consumed = 0;  // Components of the current slot read or written so far
};

// Component-wise interpolation of every slot from 'startSlot' on, reading
// 'a', 'b' (and 'c') from their current word positions. INT slots truncate
// toward zero. 'out' ends up positioned at its capacity.
void lerp(ShaderBuffer &a, ShaderBuffer &b, float t, int startSlot, ShaderBuffer &out);
void baryLerp(ShaderBuffer &a, ShaderBuffer &b, ShaderBuffer &c, float r, float s, float t, int startSlot, ShaderBuffer &out);

}  // namespace caustic

#endif  // caustic_ShaderBuffer_hpp
