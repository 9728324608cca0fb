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

#include "BridgeSim.hh"
using namespace bridgesim;

/**
 * @brief The "Traffic" section: random mixed workload of the demo.
 */
class TrafficConfig : public SimConfig {
public:
	TrafficConfig() : SimConfig("Traffic") {
		this->addParameter<int>("num_writes", 32, ParamType::INT);
		this->addParameter<int>("num_reads", 32, ParamType::INT);
		this->addParameter<int>("seed", 1, ParamType::INT);
		// probability that a B or R handshake is refused in a given fast cycle
		this->addParameter<float>("backpressure", 0.25f, ParamType::FLOAT);
	}
};
