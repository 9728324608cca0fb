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

namespace bridgesim {

class ClockDomain;

/**
 * @file SimRegister.hh
 * @brief Clocked state element with a committed value and a staged next value
 *
 * @details
 * Every piece of state that must survive a clock edge lives in a SimRegister. During phase 1 of a
 * tick, modules read the committed value with get() and stage the value for the next cycle with
 * set(). During phase 2 the owning ClockDomain commits every register at once, so no module ever
 * observes state that another module produced in the same tick.
 *
 * **Two-phase update:**
 * ```
 *            phase 1 (step)                 phase 2 (sync)
 *   q ----> [ module logic ] ----> d   ==>   q = d
 *   ^                                         |
 *   +-----------------------------------------+
 * ```
 *
 * A register holds its value unless set() is called: the staged value is initialized from the
 * committed one after every commit.
 *
 * Registers register themselves with their ClockDomain on construction and unregister on
 * destruction. Register names must be unique within a domain.
 *
 * @code{.cpp}
 * class Counter : public SimModule {
 * public:
 *     Counter(ClockDomain* _domain) : SimModule("Counter"), count(_domain, "Counter.count", 0) {}
 *     void step() override { this->count.set(this->count.get() + 1); }
 * private:
 *     SimRegister<uint32_t> count;
 * };
 * @endcode
 */
class SimRegisterBase {
public:
	SimRegisterBase(ClockDomain* _domain, const std::string& _name);
	virtual ~SimRegisterBase();

	SimRegisterBase(const SimRegisterBase&)            = delete;
	SimRegisterBase& operator=(const SimRegisterBase&) = delete;

	const std::string& getName() const { return this->name; }
	ClockDomain*       getClockDomain() const { return this->domain; }

	/// @brief Commit the staged value. Called by the owning ClockDomain in phase 2.
	virtual void sync() = 0;

	/// @brief Force both committed and staged values back to the reset value.
	virtual void reset() = 0;

private:
	ClockDomain*      domain;
	const std::string name;
};

template <typename T>
class SimRegister : public SimRegisterBase {
public:
	SimRegister(ClockDomain* _domain, const std::string& _name, const T& _resetValue = T())
	    : SimRegisterBase(_domain, _name), resetValue(_resetValue), current(_resetValue), next(_resetValue) {}

	/// @brief Committed value, stable for the whole tick.
	const T& get() const { return this->current; }

	/// @brief Stage the value that becomes visible after the next commit.
	void set(const T& _value) { this->next = _value; }

	/// @brief Value staged so far in the current tick.
	const T& getNext() const { return this->next; }

	void sync() override { this->current = this->next; }

	void reset() override {
		this->current = this->resetValue;
		this->next    = this->resetValue;
	}

private:
	const T resetValue;
	T       current;
	T       next;
};

}  // namespace bridgesim
