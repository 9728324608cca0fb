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

#include "common/AsyncFifo.hh"
#include "common/GrayCode.hh"
#include "config/ConfigurationError.hh"
#include "sim/ClockDomain.hh"
#include "utils/Logging.hh"

namespace bridgesim {

template <typename T>
size_t AsyncFifo<T>::checkDepth(const std::string& _name, size_t _depth) {
	if (_depth < 2 || !isPowerOfTwo(_depth) || _depth > (size_t{1} << 30)) {
		throw ConfigurationError("AsyncFifo `" + _name + "`: depth " + std::to_string(_depth) +
		                         " is not a power of two of at least 2.");
	}
	return _depth;
}

template <typename T>
AsyncFifo<T>::AsyncFifo(const std::string& _name, size_t _depth, ClockDomain* _writeDomain, ClockDomain* _readDomain)
    : name(_name),
      depth(checkDepth(_name, _depth)),
      ptrMask(static_cast<uint32_t>(2 * _depth - 1)),
      addrMask(static_cast<uint32_t>(_depth - 1)),
      msbMask(static_cast<uint32_t>(_depth | (_depth >> 1))),
      writeDomain(_writeDomain),
      readDomain(_readDomain),
      wbin(_writeDomain, _name + ".wbin", 0),
      wgray(_writeDomain, _name + ".wgray", 0),
      wfull(_writeDomain, _name + ".wfull", false),
      rbin(_readDomain, _name + ".rbin", 0),
      rgray(_readDomain, _name + ".rgray", 0),
      rempty(_readDomain, _name + ".rempty", true),
      rgraySync(_name + ".rgraySync", _writeDomain, &this->rgray),
      wgraySync(_name + ".wgraySync", _readDomain, &this->wgray),
      writePort(_name + ".writePort", this),
      readPort(_name + ".readPort", this) {
	this->storage.reserve(this->depth);
	for (size_t i = 0; i < this->depth; ++i) {
		this->storage.push_back(
		    std::make_unique<SimRegister<T>>(_writeDomain, _name + ".mem[" + std::to_string(i) + "]", T()));
	}
}

template <typename T>
bool AsyncFifo<T>::tryPush(const T& _data) {
	CLASS_ASSERT_MSG(this->writeStepped != this->writeDomain->getCycle(),
	                 "`" << this->name << "`: push requested after the write port was evaluated.");
	CLASS_ASSERT_MSG(!this->pushRequested, "`" << this->name << "`: more than one push in one write edge.");

	if (this->wfull.get()) return false;

	this->pushRequested = true;
	this->pushData      = _data;
	this->numPushed++;
	return true;
}

template <typename T>
const T& AsyncFifo<T>::front() const {
	CLASS_ASSERT_MSG(!this->rempty.get(), "`" << this->name << "`: front() on an empty queue.");
	return this->storage[this->rbin.get() & this->addrMask]->get();
}

template <typename T>
bool AsyncFifo<T>::tryPop() {
	CLASS_ASSERT_MSG(this->readStepped != this->readDomain->getCycle(),
	                 "`" << this->name << "`: pop requested after the read port was evaluated.");
	CLASS_ASSERT_MSG(!this->popRequested, "`" << this->name << "`: more than one pop in one read edge.");

	if (this->rempty.get()) return false;

	this->popRequested = true;
	this->numPopped++;
	return true;
}

template <typename T>
size_t AsyncFifo<T>::getWriterOccupancy() const {
	return (this->wbin.get() - grayToBin(this->rgraySync.get())) & this->ptrMask;
}

template <typename T>
size_t AsyncFifo<T>::getReaderOccupancy() const {
	return (grayToBin(this->wgraySync.get()) - this->rbin.get()) & this->ptrMask;
}

template <typename T>
void AsyncFifo<T>::stepWriteSide() {
	const uint32_t bin      = this->wbin.get();
	const uint32_t binNext  = (bin + (this->pushRequested ? 1 : 0)) & this->ptrMask;
	const uint32_t grayNext = binToGray(binNext);

	if (this->pushRequested) { this->storage[bin & this->addrMask]->set(this->pushData); }

	this->wbin.set(binNext);
	this->wgray.set(grayNext);
	this->wfull.set(grayNext == (this->rgraySync.get() ^ this->msbMask));
	this->rgraySync.step();

	this->pushRequested = false;
	this->writeStepped  = this->writeDomain->getCycle();
}

template <typename T>
void AsyncFifo<T>::stepReadSide() {
	const uint32_t binNext  = (this->rbin.get() + (this->popRequested ? 1 : 0)) & this->ptrMask;
	const uint32_t grayNext = binToGray(binNext);

	this->rbin.set(binNext);
	this->rgray.set(grayNext);
	this->rempty.set(grayNext == this->wgraySync.get());
	this->wgraySync.step();

	this->popRequested = false;
	this->readStepped  = this->readDomain->getCycle();
}

template <typename T>
void AsyncFifo<T>::resetWriteSide() {
	this->pushRequested = false;
	this->pushData      = T();
	this->writeStepped  = UINT64_MAX;
	this->numPushed     = 0;
}

template <typename T>
void AsyncFifo<T>::resetReadSide() {
	this->popRequested = false;
	this->readStepped  = UINT64_MAX;
	this->numPopped    = 0;
}

}  // namespace bridgesim
