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

#include "hw/SimRegister.hh"

#include "sim/ClockDomain.hh"
#include "utils/Logging.hh"

namespace bridgesim {

SimRegisterBase::SimRegisterBase(ClockDomain* _domain, const std::string& _name) : domain(_domain), name(_name) {
	LABELED_ASSERT_MSG(_domain, "SimRegister", "Register `" << _name << "` has no clock domain.");
	this->domain->addRegister(this);
}

SimRegisterBase::~SimRegisterBase() { this->domain->removeRegister(this); }

}  // namespace bridgesim
