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

#include "config/SimConfig.hh"
#include "utils/Logging.hh"

namespace bridgesim {

template <typename T>
void SimConfig::addParameter(const std::string& _name, const T& _value, ParamType _type) {
	LABELED_ASSERT_MSG(!this->hasParameter(_name), this->name,
	                   "Parameter \'" + _name + "\' is declared twice in `" + this->name + "`.");
	VERBOSE_LABELED_INFO(this->name) << "Declaring \'" << _name << "\'.";
	this->parameters.emplace(_name, std::make_unique<Parameter<T>>(_name, _value, _type));
}

template <typename T>
void SimConfig::setParameter(const std::string& _name, const T& _value) {
	VERBOSE_LABELED_INFO(this->name) << "\'" << _name << "\' overridden.";
	this->getParameterPtr<T>(_name)->template setValue<T>(_value);
}

template <typename T>
T SimConfig::getParameter(const std::string& _name) const {
	return this->getParameterPtr<T>(_name)->template getValue<T>();
}

template <typename T>
Parameter<T>* SimConfig::getParameterPtr(const std::string& _name) const {
	auto iter = this->parameters.find(_name);
	LABELED_ASSERT_MSG(iter != this->parameters.end(), this->name,
	                   "`" + this->name + "` has no parameter \'" + _name + "\'.");

	// INT is read back as int, FLOAT as float and TICK as Tick.
	auto param = dynamic_cast<Parameter<T>*>(iter->second.get());
	LABELED_ASSERT_MSG(param, this->name,
	                   "\'" + _name + "\' is not a " + std::string(typeid(T).name()) + " parameter of `" + this->name +
	                       "`.");
	return param;
}

}  // namespace bridgesim
