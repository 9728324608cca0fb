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

#include <string>

// Third-Party Library
#include <CLI/CLI.hpp>

#include "config/CLIManager.hh"

namespace bridgesim {

template <typename T>
inline CLI::Option* CLIManager::addCLIOption(const std::string& _optionName, const std::string& _optionDescription,
                                             const std::string& _configName, const std::string& _paramName,
                                             const bool& _defaultValue) {
	std::function<void(const T&)> callback = [this, _configName, _paramName](const T& value) {
		auto updateFunc = [this, _configName, _paramName, value]() {
			this->updateParameter<T>(_configName, _paramName, value);
		};
		this->addCLIParameter(_configName, _paramName, updateFunc);
	};

	auto option = this->app.add_option_function(_optionName, callback, _optionDescription);

	// shown by --help
	if (_defaultValue) { option->default_val(this->getParameter<T>(_configName, _paramName)); }

	return option;
}

}  // namespace bridgesim
