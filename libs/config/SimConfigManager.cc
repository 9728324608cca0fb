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


#include "config/SimConfigManager.hh"

#include <filesystem>
#include <fstream>
#include <unordered_map>

// Third-Party Library
#include <nlohmann/json.hpp>

namespace bridgesim {

namespace {

nlohmann::json readConfigFile(const std::string& _label, const std::string& _path) {
	LABELED_ASSERT_MSG(std::filesystem::is_regular_file(_path), _label, "Config file " << _path << " not found.");

	std::ifstream in(_path);
	LABELED_ASSERT_MSG(in.is_open(), _label, "Config file " << _path << " cannot be opened.");

	try {
		return nlohmann::json::parse(in);
	} catch (const nlohmann::json::parse_error& e) {
		LABELED_ERROR(_label) << "Config file " << _path << " is not valid JSON: " << e.what();
	}
	return {};
}

}  // namespace

void SimConfigManager::addConfig(const std::string& _name, SimConfig* _config) {
	std::unique_ptr<SimConfig> owned(_config);
	CLASS_ASSERT_MSG(!this->hasConfig(_name), "Config section `" + _name + "` is registered twice.");
	VERBOSE_CLASS_INFO << "Registered config section `" << _name << "`.";
	this->configs.emplace(_name, std::move(owned));
}

void SimConfigManager::parseConfigFiles(const std::vector<std::string>& _configFilePaths) {
	// section name -> file that provided it
	std::unordered_map<std::string, std::string> sources;

	for (const auto& path : _configFilePaths) {
		const nlohmann::json root = readConfigFile(this->name, path);
		LABELED_ASSERT_MSG(root.is_object(), this->name, "Config file " << path << " must hold a JSON object.");

		for (const auto& [section, params] : root.items()) {
			if (auto seen = sources.find(section); seen != sources.end()) {
				LABELED_ERROR(this->name) << "Section `" << section << "` of " << path << " was already given by "
				                          << seen->second << ".";
			}
			sources.emplace(section, path);

			if (!this->hasConfig(section)) {
				LABELED_WARNING(this->name) << "Skipping unknown section `" << section << "` of " << path << ".";
				continue;
			}
			this->configs.at(section)->parseParameters(params);
		}
	}
}

SimConfig* SimConfigManager::getConfig(const std::string& _configName) const {
	auto iter = this->configs.find(_configName);
	CLASS_ASSERT_MSG(iter != this->configs.end(), "No config section named `" + _configName + "`.");
	return iter->second.get();
}

}  // namespace bridgesim
