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

#include "sim/ClockDomain.hh"

#include "sim/SimModule.hh"
#include "utils/Logging.hh"

namespace bridgesim {

ClockDomain::ClockDomain(const std::string& _name, Tick _period, Tick _phase)
    : name(_name), period(_period), phase(_phase), nextEdge(_phase), registers(_name) {
	CLASS_ASSERT_MSG(_period > 0, "Clock domain `" << _name << "` needs a non-zero period.");
}

void ClockDomain::addModule(SimModule* _module) {
	CLASS_ASSERT_MSG(_module->getClockDomain() == nullptr,
	                 "Module `" << _module->getName() << "` is already clocked by `"
	                             << _module->getClockDomain()->getName() << "`.");
	_module->setClockDomain(this);
	this->modules.push_back(_module);
}

void ClockDomain::step() {
	this->currentTick = this->nextEdge;
	for (auto module : this->modules) { module->step(); }
}

void ClockDomain::sync() {
	this->registers.runSyncRegisters();
	this->cycle++;
	this->nextEdge += this->period;
}

void ClockDomain::reset() {
	this->registers.resetRegisters();
	for (auto module : this->modules) { module->reset(); }
	this->nextEdge    = this->phase;
	this->currentTick = 0;
	this->cycle       = 0;
}

}  // namespace bridgesim
