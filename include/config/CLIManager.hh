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

#include <functional>
#include <string>
#include <vector>

// Third-Party Library
#include <CLI/CLI.hpp>

#include "config/SimConfigManager.hh"

namespace bridgesim {

/**
 * @file CLIManager.hh
 * @brief Command-line front end of SimConfigManager
 *
 * @details
 * CLIManager parses the command line with CLI11 and applies parameter overrides on top of the
 * values read from configuration files. The resulting priority is:
 *
 * ```
 * parameter defaults  <  files given to the constructor  <  files given with -c/--config  <  CLI options
 * ```
 *
 * Options bound to a SimConfig parameter are registered with addCLIOption(). CLI11 invokes the
 * option callback while parsing, before the configuration files are read, so each callback only
 * records an update closure; setCLIParametersToSimConfig() replays them after the files were parsed.
 *
 * @code{.cpp}
 * void MyTop::registerCLIArguments() {
 *     this->addCLIOption<int>("--wait_states", "PREADY latency of the peripheral", "Peripheral", "wait_states");
 * }
 * @endcode
 */
class CLIManager : public SimConfigManager {
	struct CLIParameter {
		std::string           configName;
		std::string           paramName;
		std::function<void()> updateFunc;
	};

public:
	CLIManager(const std::string& _name, const std::vector<std::string>& _configFilePaths = {})
	    : SimConfigManager(_name + "ConfigManager"), configFilePaths(_configFilePaths), gTestMode(false) {}

	virtual ~CLIManager() = default;

	bool isGTestMode() const { return this->gTestMode; }

protected:
	/// @brief Options every BridgeSim executable understands.
	void registerBridgeSimCLIArguments();

	/// @brief Hook for user tops to add their own options.
	virtual void registerCLIArguments() {}

	void parseCLIArguments(int argc, char** argv) {
		argv = this->app.ensure_utf8(argv);
		try {
			this->app.parse(argc, argv);
		} catch (const CLI::ParseError& e) { exit(this->app.exit(e)); }
	}

	template <typename T>
	inline CLI::Option* addCLIOption(const std::string& _optionName, const std::string& _optionDescription,
	                                 const std::string& _configName, const std::string& _paramName,
	                                 const bool& _defaultValue = true);

	void setCLIParametersToSimConfig();

	CLI::App* getCLIApp() { return &this->app; }

	/// @brief Config files given to the constructor.
	std::vector<std::string> configFilePaths = {};

	/// @brief Config files given with -c/--config.
	std::vector<std::string> configFilePathsFromCLI = {};

	bool gTestMode;

private:
	void addCLIParameter(const std::string& _configName, const std::string& _paramName,
	                     std::function<void()> _updateFunc);

	std::vector<CLIParameter> cliParameters;

	CLI::App app{"BridgeSim: AXI4-Lite to APB clock-domain-crossing bridge model"};
};

}  // namespace bridgesim

#include "config/CLIManager.inl"
