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

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/SimConfig.hh"
#include "utils/Logging.hh"

namespace bridgesim {

/**
 * @brief Registry of named SimConfig objects and the JSON files that fill them.
 *
 * @details
 * Every top-level key of a configuration file names a registered SimConfig. A key may appear in
 * only one file; repeating it is an error. Keys that name no registered config are reported and
 * ignored. The manager owns the registered configs.
 */
class SimConfigManager {
public:
	explicit SimConfigManager(const std::string& _name) : name(_name) {}

	virtual ~SimConfigManager() = default;

	template <typename T>
	T getParameter(const std::string& _configName, const std::string& _paramName) const {
		return this->getConfig(_configName)->getParameter<T>(_paramName);
	}

	SimConfig* getConfig(const std::string& _configName) const;

	bool hasConfig(const std::string& _configName) const { return this->configs.contains(_configName); }

protected:
	/// @brief Hook for user tops to register their own SimConfig objects with addConfig().
	virtual void registerConfigs() {}

	/// @brief Register `_config` under `_name` and take ownership of it.
	void addConfig(const std::string& _name, SimConfig* _config);

	/**
	 * @brief Merge the sections of `_configFilePaths` into the registered configs, in order.
	 * @throws std::runtime_error on a missing or malformed file, or on a section that appears in
	 *         more than one of the given files.
	 */
	void parseConfigFiles(const std::vector<std::string>& _configFilePaths);

	template <typename T>
	void updateParameter(const std::string& _configName, const std::string& _paramName, const T& _value) {
		this->getConfig(_configName)->setParameter<T>(_paramName, _value);
		VERBOSE_CLASS_INFO << "Parameter \'" + _configName + "::" + _paramName + "\' is updated";
	}

private:
	std::unordered_map<std::string, std::unique_ptr<SimConfig>> configs;

	const std::string name;
};

}  // namespace bridgesim
