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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "hw/SimRegister.hh"
#include "hw/Synchronizer.hh"
#include "sim/SimModule.hh"

namespace bridgesim {

class ClockDomain;

/**
 * @file AsyncFifo.hh
 * @brief Dual-clock FIFO with Gray-coded pointers and registered full/empty flags
 *
 * @details
 * AsyncFifo moves payloads from a write clock domain to a read clock domain. Each side owns a
 * binary pointer, its Gray code and one registered status flag. The only values that cross the
 * boundary are the two Gray pointers, each through a two-stage Synchronizer clocked by the
 * receiving side. Storage is written by the write side only; the read side reads committed slots.
 *
 * Pointers are one bit wider than the slot index, so a depth of D uses pointers modulo 2D.
 *
 * **Flags:**
 * - full  (write domain): next write Gray pointer equals the synchronized read Gray pointer with
 *   its two most significant bits inverted.
 * - empty (read domain):  next read Gray pointer equals the synchronized write Gray pointer.
 *
 * Both flags are conservative. The writer may see the queue as full for a while after the reader
 * drained it, and the reader may see it as empty for a while after the writer filled it. Neither
 * flag ever lets the writer overwrite an unread slot or the reader consume an unwritten one.
 *
 * **Timing:**
 * ```
 * write edge T    : tryPush() accepted, wptr committed
 * read edge  +1   : stage1 samples wptr
 * read edge  +2   : stage2 holds wptr, empty computed
 * read edge  +3   : empty committed low, front() valid
 * ```
 *
 * **Usage:**
 * Each side is evaluated by a port module that must be added to its ClockDomain after every
 * module calling tryPush() or tryPop() in that domain. A producer and a consumer may each issue at
 * most one request per edge.
 *
 * @code{.cpp}
 * AsyncFifo<Command> cmdQueue("cmd", 4, &fast, &slow);
 * fast.addModule(&producer);
 * fast.addModule(cmdQueue.getWritePort());
 * slow.addModule(&consumer);
 * slow.addModule(cmdQueue.getReadPort());
 *
 * // producer step()
 * if (!cmdQueue.isFull()) cmdQueue.tryPush(cmd);
 * // consumer step()
 * if (!cmdQueue.isEmpty()) { process(cmdQueue.front()); cmdQueue.tryPop(); }
 * @endcode
 *
 * @tparam T payload type, copyable and default-constructible
 */
template <typename T>
class AsyncFifo {
public:
	/**
	 * @throws ConfigurationError if `_depth` is not a power of two of at least 2.
	 */
	AsyncFifo(const std::string& _name, size_t _depth, ClockDomain* _writeDomain, ClockDomain* _readDomain);

	AsyncFifo(const AsyncFifo&)            = delete;
	AsyncFifo& operator=(const AsyncFifo&) = delete;

	/*----------------------- write side -----------------------*/

	/// @brief Registered full flag.
	bool isFull() const { return this->wfull.get(); }

	/**
	 * @brief Request a write in the current write edge.
	 * @return true if the queue accepted the payload, false if it is full.
	 */
	bool tryPush(const T& _data);

	/// @brief Entries written minus the last read pointer the writer has observed.
	size_t getWriterOccupancy() const;

	/*----------------------- read side ------------------------*/

	/// @brief Registered empty flag.
	bool isEmpty() const { return this->rempty.get(); }

	/// @brief Head payload. Valid whenever isEmpty() is false.
	const T& front() const;

	/**
	 * @brief Request the head to be removed in the current read edge.
	 * @return true if an entry was removed, false if the queue is empty.
	 */
	bool tryPop();

	/// @brief Last write pointer the reader has observed minus entries read.
	size_t getReaderOccupancy() const;

	/*------------------------- misc ---------------------------*/

	const std::string& getName() const { return this->name; }
	size_t             getDepth() const { return this->depth; }

	SimModule* getWritePort() { return &this->writePort; }
	SimModule* getReadPort() { return &this->readPort; }

	/// @brief Accepted pushes and pops since reset.
	uint64_t getNumPushed() const { return this->numPushed; }
	uint64_t getNumPopped() const { return this->numPopped; }

private:
	class WritePort : public SimModule {
	public:
		WritePort(const std::string& _name, AsyncFifo* _fifo) : SimModule(_name), fifo(_fifo) {}
		void step() override { this->fifo->stepWriteSide(); }
		void reset() override { this->fifo->resetWriteSide(); }

	private:
		AsyncFifo* fifo;
	};

	class ReadPort : public SimModule {
	public:
		ReadPort(const std::string& _name, AsyncFifo* _fifo) : SimModule(_name), fifo(_fifo) {}
		void step() override { this->fifo->stepReadSide(); }
		void reset() override { this->fifo->resetReadSide(); }

	private:
		AsyncFifo* fifo;
	};

	static size_t checkDepth(const std::string& _name, size_t _depth);

	void stepWriteSide();
	void stepReadSide();
	void resetWriteSide();
	void resetReadSide();

	const std::string name;
	const size_t      depth;
	const uint32_t    ptrMask;   // 2D - 1
	const uint32_t    addrMask;  // D - 1
	const uint32_t    msbMask;   // two most significant pointer bits

	ClockDomain* writeDomain;
	ClockDomain* readDomain;

	std::vector<std::unique_ptr<SimRegister<T>>> storage;

	SimRegister<uint32_t> wbin;
	SimRegister<uint32_t> wgray;
	SimRegister<bool>     wfull;
	SimRegister<uint32_t> rbin;
	SimRegister<uint32_t> rgray;
	SimRegister<bool>     rempty;

	Synchronizer<uint32_t> rgraySync;  // write domain
	Synchronizer<uint32_t> wgraySync;  // read domain

	WritePort writePort;
	ReadPort  readPort;

	bool     pushRequested = false;
	T        pushData{};
	bool     popRequested  = false;
	uint64_t writeStepped  = UINT64_MAX;
	uint64_t readStepped   = UINT64_MAX;
	uint64_t numPushed     = 0;
	uint64_t numPopped     = 0;
};

}  // namespace bridgesim

#include "common/AsyncFifo.inl"
