// Copyright 2016 The SwiftShader Authors. All Rights Reserved.
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

#ifndef caustic_Debug_hpp
#define caustic_Debug_hpp

#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#	define CHECK_PRINTF_ARGS __attribute__((format(printf, 1, 2)))
#else
#	define CHECK_PRINTF_ARGS
#endif

namespace caustic {

enum class Level
{
	Verbose,
	Debug,
	Info,
	Warn,
	Error,
	Fatal,
	Disabled,
};

// Outputs text to the log at the Debug level.
void trace(const char *format, ...) CHECK_PRINTF_ARGS;
inline void trace() {}

// Outputs text to the log at the Warn level, which goes to stderr.
void warn(const char *format, ...) CHECK_PRINTF_ARGS;
inline void warn() {}

// Outputs the message at the Fatal level and calls ::abort().
[[noreturn]] void abort(const char *format, ...) CHECK_PRINTF_ARGS;

// Returns true if messages of the given level reach the log.
bool isLogged(Level level);

}  // namespace caustic

// Traces a function call and its arguments. Compiled out unless
// CAUSTIC_TRACE is defined.
#if defined(CAUSTIC_TRACE)
#	define TRACE(message, ...) caustic::trace("%s:%d TRACE: " message "\n", __FILE__, __LINE__, ##__VA_ARGS__)
#else
#	define TRACE(message, ...) (void(0))
#endif

// Prints a warning message to the log and stderr.
#define WARN(message, ...) caustic::warn("%s:%d WARNING: " message "\n", __FILE__, __LINE__, ##__VA_ARGS__)

// Prints the message to the log and stderr and terminates the application.
// This happens regardless of build flags.
#undef ABORT
#define ABORT(message, ...) caustic::abort("%s:%d ABORT: " message "\n", __FILE__, __LINE__, ##__VA_ARGS__)

// ABORT() in debug builds (!NDEBUG || DCHECK_ALWAYS_ON), WARN() otherwise.
#undef DABORT
#if !defined(NDEBUG) || defined(DCHECK_ALWAYS_ON)
#	define DABORT(message, ...) ABORT(message, ##__VA_ARGS__)
#else
#	define DABORT(message, ...) WARN(message, ##__VA_ARGS__)
#endif

// Asserts a condition. On failure the condition and message go to DABORT().
#undef ASSERT_MSG
#define ASSERT_MSG(expression, format, ...)                                 \
	do                                                                      \
	{                                                                       \
		if(!(expression))                                                   \
		{                                                                   \
			DABORT("ASSERT(%s): " format "\n", #expression, ##__VA_ARGS__); \
		}                                                                   \
	} while(0)

#undef ASSERT
#define ASSERT(expression)                       \
	do                                           \
	{                                            \
		if(!(expression))                        \
		{                                        \
			DABORT("ASSERT(%s)\n", #expression); \
		}                                        \
	} while(0)

// Functionality that is part of the API but not implemented by the
// software renderer yet.
#undef UNIMPLEMENTED
#define UNIMPLEMENTED(format, ...) DABORT("UNIMPLEMENTED: " format, ##__VA_ARGS__)

// Functionality the software renderer does not provide. A well-behaved
// application does not reach these.
#undef UNSUPPORTED
#define UNSUPPORTED(format, ...) DABORT("UNSUPPORTED: " format, ##__VA_ARGS__)

// Code which should never be reached, even with misbehaving applications.
#undef UNREACHABLE
#define UNREACHABLE(format, ...) DABORT("UNREACHABLE: " format, ##__VA_ARGS__)

#endif  // caustic_Debug_hpp
