// Copyright 2018 The SwiftShader Authors. All Rights Reserved.
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

#include "Debug.hpp"

#include <cstdarg>
#include <cstdio>

#ifndef CAUSTIC_LOGGING_LEVEL
#	define CAUSTIC_LOGGING_LEVEL Info
#endif

namespace {

void logv(caustic::Level level, const char *format, va_list args)
{
	if(!caustic::isLogged(level))
	{
		return;
	}

	char buffer[2048];
	vsnprintf(buffer, sizeof(buffer), format, args);

	switch(level)
	{
	case caustic::Level::Verbose:
	case caustic::Level::Debug:
	case caustic::Level::Info:
		fprintf(stdout, "%s", buffer);
		break;
	case caustic::Level::Warn:
	case caustic::Level::Error:
	case caustic::Level::Fatal:
		fprintf(stderr, "%s", buffer);
		fflush(stderr);
		break;
	default:
		break;
	}
}

}  // anonymous namespace

namespace caustic {

bool isLogged(Level level)
{
	return static_cast<int>(level) >= static_cast<int>(Level::CAUSTIC_LOGGING_LEVEL);
}

void trace(const char *format, ...)
{
	va_list vararg;
	va_start(vararg, format);
	logv(Level::Debug, format, vararg);
	va_end(vararg);
}

void warn(const char *format, ...)
{
	va_list vararg;
	va_start(vararg, format);
	logv(Level::Warn, format, vararg);
	va_end(vararg);
}

void abort(const char *format, ...)
{
	va_list vararg;

	va_start(vararg, format);
	logv(Level::Fatal, format, vararg);
	va_end(vararg);

	::abort();
}

}  // namespace caustic
