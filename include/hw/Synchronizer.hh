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

#include "hw/SimRegister.hh"
#include "sim/SimModule.hh"

namespace bridgesim {

/**
 * @brief Two-stage synchronizer sampling a register of another clock domain.
 *
 * @details
 * The synchronizer is clocked by the destination domain. On every destination edge the first stage
 * samples the committed value of the source register and the second stage takes the first stage.
 * get() returns the second stage, so a source value becomes visible two destination edges after the
 * edge that sampled it, and there is no path from the input to the output within a tick.
 *
 * Only Gray-coded pointers are carried across domains in this project, but the template does not
 * depend on that.
 *
 * ```
 *  source reg ---> [stage1] ---> [stage2] ---> get()
 *                      destination domain
 * ```
 */
template <typename T>
class Synchronizer : public SimModule {
public:
	Synchronizer(const std::string& _name, ClockDomain* _dstDomain, const SimRegister<T>* _source)
	    : SimModule(_name),
	      source(_source),
	      stage1(_dstDomain, _name + ".stage1", T()),
	      stage2(_dstDomain, _name + ".stage2", T()) {}

	void step() override {
		this->stage1.set(this->source->get());
		this->stage2.set(this->stage1.get());
	}

	const T& get() const { return this->stage2.get(); }

private:
	const SimRegister<T>* source;
	SimRegister<T>        stage1;
	SimRegister<T>        stage2;
};

}  // namespace bridgesim
