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

#include "config/BridgeConfig.hh"

#include <string>

#include "common/GrayCode.hh"
#include "config/ConfigurationError.hh"

namespace bridgesim {

void BridgeParams::validate() const {
	if (this->addressWidth < 1 || this->addressWidth > 64) {
		throw ConfigurationError("address_width must be within 1..64, got " + std::to_string(this->addressWidth) +
		                         ".");
	}
	if (this->dataWidth < 8 || this->dataWidth > 64 || this->dataWidth % 8 != 0) {
		throw ConfigurationError("data_width must be a multiple of 8 within 8..64, got " +
		                         std::to_string(this->dataWidth) + ".");
	}
	if (this->queueDepth < 2 || !isPowerOfTwo(static_cast<uint64_t>(this->queueDepth))) {
		throw ConfigurationError("queue_depth must be a power of two of at least 2, got " +
		                         std::to_string(this->queueDepth) + ".");
	}
	if (this->numTargets < 1 || this->numTargets > 32) {
		throw ConfigurationError("num_targets must be within 1..32, got " + std::to_string(this->numTargets) + ".");
	}
	if (this->addressWidth < 6 && this->numTargets > (1 << this->addressWidth)) {
		throw ConfigurationError("num_targets " + std::to_string(this->numTargets) + " exceeds the " +
		                         std::to_string(1 << this->addressWidth) + " addresses of a " +
		                         std::to_string(this->addressWidth) + "-bit space.");
	}
}

Addr BridgeParams::getAddressMask() const {
	return this->addressWidth >= 64 ? ~Addr{0} : ((Addr{1} << this->addressWidth) - 1);
}

uint64_t BridgeParams::getDataMask() const {
	return this->dataWidth >= 64 ? ~uint64_t{0} : ((uint64_t{1} << this->dataWidth) - 1);
}

uint8_t BridgeParams::getStrobeMask() const { return static_cast<uint8_t>((1u << this->getBytesPerWord()) - 1); }

void ClockParams::validate() const {
	if (this->fastPeriod == 0) throw ConfigurationError("fast_clock_period must be greater than 0.");
	if (this->slowPeriod == 0) throw ConfigurationError("slow_clock_period must be greater than 0.");
}

BridgeParams BridgeConfig::getBridgeParams() const {
	BridgeParams params;
	params.addressWidth = this->getParameter<int>("address_width");
	params.dataWidth    = this->getParameter<int>("data_width");
	params.queueDepth   = this->getParameter<int>("queue_depth");
	params.numTargets   = this->getParameter<int>("num_targets");
	return params;
}

ClockParams BridgeConfig::getClockParams() const {
	ClockParams params;
	params.fastPeriod = this->getParameter<Tick>("fast_clock_period");
	params.slowPeriod = this->getParameter<Tick>("slow_clock_period");
	params.slowPhase  = this->getParameter<Tick>("slow_clock_phase");
	params.maxTick    = this->getParameter<Tick>("max_tick");
	return params;
}

void BridgeConfig::validate() const {
	this->getBridgeParams().validate();
	this->getClockParams().validate();
}

}  // namespace bridgesim
