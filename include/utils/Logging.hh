/*
 * Copyright 2023-2026 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <atomic>
#include <sstream>
#include <string>
#include <typeinfo>

namespace bridgesim {

/**
 * @brief Select Graphic Rendition escape sequences used to color log prefixes.
 */
class ANSI_SGR {
public:
	enum class PARAMETER : int {
		RESET     = 0,
		FG_RED    = 31,
		FG_GREEN  = 32,
		FG_YELLOW = 33,
		FG_BLUE   = 34
	};

	explicit ANSI_SGR(PARAMETER _param) : param(_param) {}

	std::string getCode() const { return "\033[" + std::to_string(static_cast<int>(this->param)) + "m"; }

private:
	PARAMETER param;
};

enum class LoggingSeverity { L_STATISTICS, L_INFO, L_WARNING, L_ERROR };

/**
 * @brief Demangle a type name returned by `typeid(...).name()`.
 */
std::string demangleTypeName(const char* _mangled);

/**
 * @class LogOStream
 * @brief One-shot log line builder.
 *
 * @details A LogOStream collects everything streamed into it and emits a single line when it is
 * destroyed at the end of the full expression. Every line is prefixed with the current global tick
 * and a colored severity tag. A message of severity `L_ERROR` is printed and then thrown as a
 * `std::runtime_error`, so that `CLASS_ERROR << ...` never returns to the caller.
 *
 * @code{.cpp}
 * CLASS_INFO << "queue " << name << " drained";
 * LABELED_ERROR("SimTop") << "max_tick " << maxTick << " exceeded";   // throws
 * @endcode
 */
class LogOStream {
public:
	LogOStream(LoggingSeverity _level, const char* _file, int _line, const std::string& _label = "");

	// Throws std::runtime_error for L_ERROR unless the stack is already unwinding.
	~LogOStream() noexcept(false);

	LogOStream(const LogOStream&)            = delete;
	LogOStream& operator=(const LogOStream&) = delete;

	template <typename T>
	LogOStream& operator<<(const T& _value) {
		this->ss << _value;
		return *this;
	}

	/**
	 * @brief Terminate handler printing the message of the uncaught exception before aborting.
	 * @note Installed with `std::set_terminate()` by SimTopBase.
	 */
	static void handleTerminate();

private:
	void setPrefix();

	std::stringstream       ss;
	const LoggingSeverity   level;
	const char*             file;
	const int               line;
	const int               uncaughtAtConstruction;
	static std::atomic<bool> hasCalledTerminate;
};

}  // namespace bridgesim

#define BRIDGESIM_LOG(level, label) ::bridgesim::LogOStream(::bridgesim::LoggingSeverity::level, __FILE__, __LINE__, label)

#define CLASS_LOG(level) BRIDGESIM_LOG(level, ::bridgesim::demangleTypeName(typeid(*this).name()))

#define CLASS_INFO       CLASS_LOG(L_INFO)
#define CLASS_WARNING    CLASS_LOG(L_WARNING)
#define CLASS_ERROR      CLASS_LOG(L_ERROR)

#define LABELED_INFO(label)       BRIDGESIM_LOG(L_INFO, label)
#define LABELED_WARNING(label)    BRIDGESIM_LOG(L_WARNING, label)
#define LABELED_ERROR(label)      BRIDGESIM_LOG(L_ERROR, label)
#define LABELED_STATISTICS(label) BRIDGESIM_LOG(L_STATISTICS, label)

#define LOG_ERROR BRIDGESIM_LOG(L_ERROR, "")

#ifdef BRIDGESIM_VERBOSE
#define VERBOSE_CLASS_INFO          CLASS_INFO
#define VERBOSE_LABELED_INFO(label) LABELED_INFO(label)
#else
#define VERBOSE_CLASS_INFO \
	if (true) {            \
	} else                 \
		CLASS_INFO
#define VERBOSE_LABELED_INFO(label) \
	if (true) {                     \
	} else                          \
		LABELED_INFO(label)
#endif

#define ASSERT_MSG(cond, msg)                                                   \
	do {                                                                        \
		if (!(cond)) { LOG_ERROR << "Assertion `" #cond "` failed. " << msg; } \
	} while (0)

#define CLASS_ASSERT_MSG(cond, msg)                                               \
	do {                                                                          \
		if (!(cond)) { CLASS_ERROR << "Assertion `" #cond "` failed. " << msg; } \
	} while (0)

#define LABELED_ASSERT_MSG(cond, label, msg)                                             \
	do {                                                                                 \
		if (!(cond)) { LABELED_ERROR(label) << "Assertion `" #cond "` failed. " << msg; } \
	} while (0)

#define ASSERT(cond)                LABELED_ASSERT_MSG(cond, "", "")
#define CLASS_ASSERT(cond)          CLASS_ASSERT_MSG(cond, "")
#define LABELED_ASSERT(cond, label) LABELED_ASSERT_MSG(cond, label, "")
