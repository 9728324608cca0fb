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

#include "sim/RegisterManager.hh"

#include "hw/SimRegister.hh"
#include "utils/Logging.hh"

namespace bridgesim {

void RegisterManager::addRegister(SimRegisterBase* _reg) {
	auto name = _reg->getName();

	auto existing = this->registers.contains(name);
	CLASS_ASSERT_MSG(!existing, "Register `" + name + "` already exists in `" + this->name + "`.");
	this->registers.insert(std::make_pair(name, _reg));
}

void RegisterManager::removeRegister(SimRegisterBase* _reg) {
	auto iter = this->registers.find(_reg->getName());
	if (iter != this->registers.end() && iter->second == _reg) { this->registers.erase(iter); }
}

void RegisterManager::runSyncRegisters() {
	for (auto& [_, reg] : this->registers) { reg->sync(); }
}

void RegisterManager::resetRegisters() {
	for (auto& [_, reg] : this->registers) { reg->reset(); }
}

}  // namespace bridgesim
