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

#include "utils/Logging.hh"

#include <cxxabi.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <syncstream>

#include "sim/SimTop.hh"

namespace bridgesim {

std::atomic<bool> LogOStream::hasCalledTerminate = false;

std::string demangleTypeName(const char* _mangled) {
	int status = 0;

	std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(_mangled, nullptr, nullptr, &status),
	                                                 std::free);

	std::string name = (status == 0 && demangled) ? std::string(demangled.get()) : std::string(_mangled);

	// Drop the namespace qualifier and any template arguments.
	if (auto pos = name.find('<'); pos != std::string::npos) name.erase(pos);
	if (auto pos = name.rfind("::"); pos != std::string::npos) name.erase(0, pos + 2);
	return name;
}

LogOStream::LogOStream(LoggingSeverity _level, const char* _file, int _line, const std::string& _label)
    : level(_level), file(_file), line(_line), uncaughtAtConstruction(std::uncaught_exceptions()) {
	this->setPrefix();
	if (!_label.empty()) { this->ss << "[" << _label << "] "; }
}

LogOStream::~LogOStream() noexcept(false) {
	if (this->level == LoggingSeverity::L_ERROR) {
		this->ss << " (" << this->file << ":" << this->line << ")";
		std::osyncstream(std::cerr) << this->ss.str() << std::endl;

		if (std::uncaught_exceptions() == this->uncaughtAtConstruction) { throw std::runtime_error(this->ss.str()); }
		return;
	}

	std::osyncstream(std::cout) << this->ss.str() << std::endl;
}

void LogOStream::setPrefix() {
	if (top) {
		this->ss << "Tick=" << top->getGlobalTick() << " ";
	} else {
		this->ss << "Tick=N/A ";
	}

	switch (this->level) {
		case LoggingSeverity::L_STATISTICS:
			this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_GREEN).getCode() + "Stats: ";
			break;
		case LoggingSeverity::L_INFO: this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_BLUE).getCode() + "Info: "; break;
		case LoggingSeverity::L_WARNING:
			this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_YELLOW).getCode() + "Warning: ";
			break;
		case LoggingSeverity::L_ERROR: this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_RED).getCode() + "Error: "; break;
	}

	this->ss << ANSI_SGR(ANSI_SGR::PARAMETER::RESET).getCode();
}

void LogOStream::handleTerminate() {
	bool expected_false = false;

	if (LogOStream::hasCalledTerminate.compare_exchange_strong(expected_false, true)) {
		if (auto eptr = std::current_exception()) {
			try {
				std::rethrow_exception(eptr);
			} catch (const std::exception& e) {
				std::osyncstream(std::cerr) << "Terminated by an uncaught exception: " << e.what() << std::endl;
			} catch (...) {
				std::stringstream ss;
				ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_RED).getCode();
				ss << "An uncaught unknown exception happened.";
				ss << ANSI_SGR(ANSI_SGR::PARAMETER::RESET).getCode();
				std::osyncstream(std::cerr) << ss.str() << std::endl;
			}
		}
	}

	std::abort();
}

}  // namespace bridgesim
