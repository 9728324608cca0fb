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

#include "bridge/CommandArbiter.hh"

#include "utils/Logging.hh"

namespace bridgesim {

CommandArbiter::CommandArbiter(AsyncFifo<WriteCommand>* _wcmd, AsyncFifo<ReadCommand>* _rcmd)
    : policy(2), wcmd(_wcmd), rcmd(_rcmd) {}

std::optional<GrantedCommand> CommandArbiter::peek() {
	switch (this->policy.select({!this->wcmd->isEmpty(), !this->rcmd->isEmpty()})) {
		case WRITE: {
			const auto& cmd = this->wcmd->front();
			return GrantedCommand{true, cmd.addr, cmd.data, cmd.strb};
		}
		case READ: return GrantedCommand{false, this->rcmd->front().addr, 0, 0};
		default: return std::nullopt;
	}
}

void CommandArbiter::accept() {
	bool popped = false;
	switch (this->policy.getCurIndex()) {
		case WRITE: popped = this->wcmd->tryPop(); break;
		case READ: popped = this->rcmd->tryPop(); break;
		default: break;
	}
	CLASS_ASSERT_MSG(popped, "accept() without a granted command.");
	// a grant is consumed once
	this->policy.reset();
}

}  // namespace bridgesim
