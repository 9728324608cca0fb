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

#include <memory>
#include <string>
#include <vector>

#include "utils/TypeDef.hh"

namespace bridgesim {

/**
 * @brief One decoded address range, `[startAddr, lastAddr]` inclusive.
 */
struct AddrRegionStruct {
	std::string name;
	int         deviceID;
	Addr        startAddr;
	Addr        lastAddr;

	AddrRegionStruct(const std::string& _name, int _deviceID, Addr _startAddr, Addr _lastAddr)
	    : name(_name), deviceID(_deviceID), startAddr(_startAddr), lastAddr(_lastAddr) {}

	bool contains(Addr _addr) const { return _addr >= this->startAddr && _addr <= this->lastAddr; }
};

/**
 * @brief Address decoder mapping an address to the index of the device that owns it.
 *
 * Regions must not overlap. Decoding an address that no region covers is an error.
 */
class SimAddressMap {
public:
	explicit SimAddressMap(const std::string& _name) : name(_name) {}

	/**
	 * @brief Split the whole `_addressWidth`-bit space into `_numDevices` contiguous regions.
	 *
	 * Region `id` starts at `floor(2^_addressWidth * id / _numDevices)`, so region sizes differ by at
	 * most one and every address decodes to exactly one device. The space must hold at least
	 * `_numDevices` addresses.
	 */
	void registerEvenSplit(int _addressWidth, int _numDevices);

	void registerAddrRegion(const std::string& _name, int _deviceID, Addr _startAddr, Addr _lastAddr);

	int                     getDeviceID(Addr _addr) const;
	const AddrRegionStruct& getRegion(int _deviceID) const;

private:
	std::string name;

	std::vector<std::shared_ptr<AddrRegionStruct>> addrMapRegions;
};

}  // namespace bridgesim
