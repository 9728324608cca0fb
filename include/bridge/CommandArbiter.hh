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

#include <optional>

#include "bridge/BridgeTypes.hh"
#include "common/Arbiter.hh"
#include "common/AsyncFifo.hh"

namespace bridgesim {

/// Command granted to the back end.
struct GrantedCommand {
	bool     isWrite = false;
	Addr     addr    = 0;
	uint64_t data    = 0;
	uint8_t  strb    = 0;
};

/**
 * @brief Write-over-read selection between the two command queues, evaluated in the slow domain.
 *
 * peek() is a pure function of the committed queue state: the write queue wins whenever it holds a
 * command. The granted queue is popped only when the back end calls accept() in the same edge, so
 * a request the back end cannot take stays at the head of its queue.
 */
class CommandArbiter {
public:
	enum Source : size_t { WRITE = 0, READ = 1 };

	CommandArbiter(AsyncFifo<WriteCommand>* _wcmd, AsyncFifo<ReadCommand>* _rcmd);

	std::optional<GrantedCommand> peek();

	/// Pop the queue granted by peek() in this edge. The grant is used up.
	void accept();

private:
	FixedPriority            policy;
	AsyncFifo<WriteCommand>* wcmd;
	AsyncFifo<ReadCommand>*  rcmd;
};

}  // namespace bridgesim
