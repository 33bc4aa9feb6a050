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

#ifndef caustic_Rectangle_hpp
#define caustic_Rectangle_hpp

namespace caustic {

struct Rectangle
{
	Rectangle() = default;

	Rectangle(int x, int y, int width, int height)
	    : x(x)
	    , y(y)
	    , width(width)
	    , height(height)
	{
	}

	int getArea() const { return width * height; }

	bool operator==(const Rectangle &other) const
	{
		return x == other.x && y == other.y && width == other.width && height == other.height;
	}

	bool operator!=(const Rectangle &other) const
	{
		return !(*this == other);
	}

	int x = 0;
	int y = 0;
	int width = 0;
	int height = 0;
};

}  // namespace caustic

#endif  // caustic_Rectangle_hpp
