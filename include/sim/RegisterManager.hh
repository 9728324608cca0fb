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

#include <string>
#include <unordered_map>

namespace bridgesim {

class SimRegisterBase;

/**
 * @brief Name-indexed set of the registers clocked by one ClockDomain.
 *
 * The manager does not own the registers. runSyncRegisters() commits every register; the order is
 * irrelevant because a commit only copies the staged value of the register itself.
 */
class RegisterManager {
public:
	explicit RegisterManager(const std::string& _name) : name(_name) {}

	void addRegister(SimRegisterBase* _reg);
	void removeRegister(SimRegisterBase* _reg);

	void runSyncRegisters();
	void resetRegisters();

	const std::string& getName() const { return this->name; }

private:
	const std::string                                 name;
	std::unordered_map<std::string, SimRegisterBase*> registers;
};

}  // namespace bridgesim
