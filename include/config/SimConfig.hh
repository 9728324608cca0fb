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
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>

// Third-Party Library
#include <nlohmann/json.hpp>

#include "utils/Logging.hh"
#include "utils/TypeDef.hh"

namespace bridgesim {

class SimConfigManager;

/**
 * @brief JSON decoding rule of a parameter.
 */
enum class ParamType {
	INT,    ///< int
	FLOAT,  ///< float
	TICK    ///< Tick (uint64_t)
};

class ParameterBase {
public:
	ParameterBase(std::string _name, ParamType _type) : name(_name), type(_type) {}
	virtual ~ParameterBase() = default;

	std::string getName() const { return this->name; }
	ParamType   getType() const { return this->type; }

private:
	std::string name;
	ParamType   type;
};

/**
 * @brief Typed parameter value.
 *
 * setValue()/getValue() reject any type other than `T` with a `std::runtime_error`.
 */
template <typename T>
class Parameter : public ParameterBase {
public:
	Parameter(const std::string& _name, const T& _value, ParamType _type)
	    : ParameterBase(_name, _type), value(_value) {}

	template <typename TParam>
	void setValue(const TParam& _value) {
		if constexpr (std::is_same_v<TParam, T>) {
			this->value = _value;
		} else {
			throw std::runtime_error("Type mismatch for parameter '" + this->getName() + "'! Expected " +
			                         std::string(typeid(T).name()) + " but got " + std::string(typeid(TParam).name()) +
			                         ".");
		}
	}

	template <typename TParam>
	TParam getValue() const {
		if constexpr (std::is_same_v<T, TParam>) {
			return this->value;
		} else {
			throw std::runtime_error("Type mismatch for parameter '" + this->getName() + "'! Expected " +
			                         std::string(typeid(T).name()) + " but got " + std::string(typeid(TParam).name()) +
			                         ".");
		}
	}

private:
	T value;
};

/**
 * @file SimConfig.hh
 * @brief Named group of typed parameters loaded from a JSON section
 *
 * @details
 * A SimConfig subclass declares its parameters and their defaults in the constructor with
 * addParameter(). SimConfigManager hands it the JSON object stored under its name, and
 * parseParameters() overwrites the defaults. Keys that are not declared are reported and skipped.
 *
 * ```json
 * {
 *     "Bridge": { "queue_depth": 8, "slow_clock_period": 25 }
 * }
 * ```
 *
 * @code{.cpp}
 * class CounterConfig : public SimConfig {
 * public:
 *     CounterConfig() : SimConfig("Counter") { this->addParameter<int>("width", 8, ParamType::INT); }
 * };
 * @endcode
 */
class SimConfig {
	friend class SimConfigManager;

public:
	explicit SimConfig(const std::string& _name) : name(_name) {}

	virtual ~SimConfig() = default;

	SimConfig(const SimConfig&)            = delete;
	SimConfig& operator=(const SimConfig&) = delete;

	std::string getName() const { return this->name; }

	bool hasParameter(const std::string& _name) const { return this->parameters.contains(_name); }

	template <typename T>
	T getParameter(const std::string& _name) const;

	template <typename T>
	void setParameter(const std::string& _name, const T& _value);

protected:
	template <typename T>
	void addParameter(const std::string& _name, const T& _value, ParamType _type);

	void parseParameters(const nlohmann::json& _params);

private:
	template <typename T>
	Parameter<T>* getParameterPtr(const std::string& _name) const;

	std::unordered_map<std::string, std::unique_ptr<ParameterBase>> parameters;

	const std::string name;
};

}  // namespace bridgesim

#include "config/SimConfig.inl"
