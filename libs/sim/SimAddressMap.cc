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

#include "sim/SimAddressMap.hh"

#include <sstream>

#include "utils/Logging.hh"

namespace bridgesim {

void SimAddressMap::registerEvenSplit(int _addressWidth, int _numDevices) {
	CLASS_ASSERT_MSG(_addressWidth >= 1 && _addressWidth <= 64 && _numDevices >= 1,
	                 "Cannot split a " << _addressWidth << "-bit space into " << _numDevices << " regions.");

	const Addr last = _addressWidth >= 64 ? ~Addr{0} : ((Addr{1} << _addressWidth) - 1);
	const Addr n    = static_cast<Addr>(_numDevices);
	CLASS_ASSERT_MSG(_addressWidth >= 64 || n - 1 <= last,
	                 "A " << _addressWidth << "-bit space holds fewer than " << _numDevices << " addresses.");

	// size = last + 1 = q * n + r, without forming 2^64
	Addr q = last / n;
	Addr r = last % n + 1;
	if (r == n) {
		q++;
		r = 0;
	}
	// start(id) = floor(size * id / n)
	auto start = [q, r, n](Addr _id) { return q * _id + (r * _id) / n; };

	for (int id = 0; id < _numDevices; ++id) {
		Addr first = start(static_cast<Addr>(id));
		Addr end   = (id == _numDevices - 1) ? last : start(static_cast<Addr>(id) + 1) - 1;
		this->registerAddrRegion(this->name + ".target" + std::to_string(id), id, first, end);
	}
}

void SimAddressMap::registerAddrRegion(const std::string& _name, int _deviceID, Addr _startAddr, Addr _lastAddr) {
	CLASS_ASSERT_MSG(_startAddr <= _lastAddr, "Region `" + _name + "` is empty.");
	for (auto& region : this->addrMapRegions) {
		CLASS_ASSERT_MSG(region->name != _name, "Device :`" + _name + "` Already Exist !");
		CLASS_ASSERT_MSG(_lastAddr < region->startAddr || _startAddr > region->lastAddr,
		                 "Region `" + _name + "` overlaps `" + region->name + "`.");
	}
	this->addrMapRegions.push_back(std::make_shared<AddrRegionStruct>(_name, _deviceID, _startAddr, _lastAddr));
}

int SimAddressMap::getDeviceID(Addr _addr) const {
	for (auto& region : this->addrMapRegions) {
		if (region->contains(_addr)) return region->deviceID;
	}

	std::stringstream ss;
	ss << std::hex << "0x" << _addr;
	CLASS_ERROR << "Addr :" + ss.str() + " is out of bound !";
	return -1;
}

const AddrRegionStruct& SimAddressMap::getRegion(int _deviceID) const {
	for (auto& region : this->addrMapRegions) {
		if (region->deviceID == _deviceID) return *region;
	}
	CLASS_ERROR << "Device " << _deviceID << " has no address region.";
	return *this->addrMapRegions.front();
}

}  // namespace bridgesim
