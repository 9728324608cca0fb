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

/**
 * @file SimConfig.cc
 * @brief JSON decoding of SimConfig parameters
 *
 * | ParamType | JSON type      | C++ type        | Example                   |
 * |-----------|----------------|-----------------|---------------------------|
 * | INT       | integer        | int             | "queue_depth": 4          |
 * | FLOAT     | number         | float           | "read_ratio": 0.5         |
 * | TICK      | integer (>= 0) | Tick (uint64_t) | "slow_clock_period": 37   |
 *
 * A JSON value of the wrong kind surfaces as `nlohmann::json::type_error`, which is reported with
 * the offending key and rethrown as an error.
 */

#include "config/SimConfig.hh"

namespace bridgesim {

void SimConfig::parseParameters(const nlohmann::json& _params) {
	for (const auto& [param_name, param_value] : _params.items()) {
		if (!this->hasParameter(param_name)) {
			LABELED_WARNING(this->name) << "The parameter \'" << param_name << "\' is not defined in \'" << this->name
			                            << "\'. It will be skipped during the config file parsing.";
			continue;
		}

		try {
			switch (this->parameters.at(param_name)->getType()) {
				case ParamType::INT: {
					auto i = param_value.get<int>();
					this->setParameter<int>(param_name, i);
					VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << i;
					break;
				}
				case ParamType::FLOAT: {
					auto f = param_value.get<float>();
					this->setParameter<float>(param_name, f);
					VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << f;
					break;
				}
				case ParamType::TICK: {
					LABELED_ASSERT_MSG(param_value.is_number_unsigned(), this->name,
					                   "The parameter \'" << param_name << "\' must be a non-negative integer.");
					auto t = param_value.get<Tick>();
					this->setParameter<Tick>(param_name, t);
					VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << t;
					break;
				}
				default: LABELED_ERROR(this->name) << "Undefined ParamType !"; break;
			}
		} catch (const nlohmann::json::type_error& e) {
			LABELED_ERROR(this->name) << "Invalid value for \'" << param_name << "\': " << e.what();
		}
	}
}

}  // namespace bridgesim
