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

#include "config/CLIManager.hh"

#include "config/BridgeConfig.hh"

namespace bridgesim {

void CLIManager::setCLIParametersToSimConfig() {
	for (auto& cli_param : this->cliParameters) { cli_param.updateFunc(); }
}

void CLIManager::addCLIParameter(const std::string& _configName, const std::string& _paramName,
                                 std::function<void()> _updateFunc) {
	this->cliParameters.push_back(CLIParameter{_configName, _paramName, _updateFunc});
}

void CLIManager::registerBridgeSimCLIArguments() {
	this->getCLIApp()
	    ->add_flag("-g,--googletest", this->gTestMode, "Enable or disable Google Test Framework")
	    ->default_val(this->gTestMode);
	this->getCLIApp()
	    ->add_option("-c,--config", this->configFilePathsFromCLI, "Specifies the path(s) to configuration file(s).")
	    ->expected(0, -1);

	this->addCLIOption<int>("--address_width", "Address width of both buses in bits (1-64).", "Bridge",
	                        "address_width");
	this->addCLIOption<int>("--data_width", "Data width of both buses in bits (8-64, multiple of 8).", "Bridge",
	                        "data_width");
	this->addCLIOption<int>("--queue_depth", "Depth of each clock-crossing queue (power of two, at least 2).",
	                        "Bridge", "queue_depth");
	this->addCLIOption<int>("--num_targets", "Number of APB completers sharing the address space.", "Bridge",
	                        "num_targets");
	this->addCLIOption<Tick>("--fast_clock_period", "Period of the AXI4-Lite clock in ticks.", "Bridge",
	                         "fast_clock_period");
	this->addCLIOption<Tick>("--slow_clock_period", "Period of the APB clock in ticks.", "Bridge",
	                         "slow_clock_period");
	this->addCLIOption<Tick>("--slow_clock_phase", "Offset of the first APB clock edge in ticks.", "Bridge",
	                         "slow_clock_phase");
	this->addCLIOption<Tick>("--max_tick", "Watchdog limit of the simulation, 0 disables it.", "Bridge",
	                         "max_tick");
}

}  // namespace bridgesim
