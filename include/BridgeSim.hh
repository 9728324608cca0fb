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

// Main - Simulation kernel
#include "sim/ClockDomain.hh"
#include "sim/RegisterManager.hh"
#include "sim/SimAddressMap.hh"
#include "sim/SimModule.hh"
#include "sim/SimTop.hh"

// Common - General building blocks
#include "common/Arbiter.hh"
#include "common/AsyncFifo.hh"
#include "common/GrayCode.hh"

// Config - Hardware parameter management
#include "config/BridgeConfig.hh"
#include "config/CLIManager.hh"
#include "config/ConfigurationError.hh"
#include "config/SimConfig.hh"
#include "config/SimConfigManager.hh"

// Hardware
#include "hw/SimRegister.hh"
#include "hw/Synchronizer.hh"

// Bridge
#include "bridge/BackEnd.hh"
#include "bridge/Bridge.hh"
#include "bridge/BridgeTypes.hh"
#include "bridge/CommandArbiter.hh"
#include "bridge/FrontEnd.hh"

// Models - Testbench components
#include "models/ApbRegisterFile.hh"
#include "models/TrafficGenerator.hh"

// Profiling
#include "profiling/Statistics.hh"

// Utils
#include "utils/Arguments.hh"
#include "utils/Logging.hh"
#include "utils/TypeDef.hh"
