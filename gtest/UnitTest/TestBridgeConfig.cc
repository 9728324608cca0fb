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


/**
 * @file TestBridgeConfig.cc
 * @brief Parameter validation and the defaults < JSON < --config < CLI priority chain
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "BridgeSim.hh"

namespace unit_test {

using namespace bridgesim;

namespace {

std::string writeTempConfig(const std::string& _fileName, const std::string& _content) {
	auto path = std::filesystem::temp_directory_path() / _fileName;
	std::ofstream(path) << _content;
	return path.string();
}

class BridgeConfigManager : public SimConfigManager {
public:
	BridgeConfigManager() : SimConfigManager("BridgeConfigManager") { this->addConfig("Bridge", new BridgeConfig()); }

	using SimConfigManager::parseConfigFiles;
};

class ConfigOnlyTop : public SimTop {
public:
	explicit ConfigOnlyTop(const std::vector<std::string>& _configFilePaths = {}) : SimTop(_configFilePaths) {}

	void initWith(std::vector<std::string> _args) {
		_args.insert(_args.begin(), "UnitTest");
		std::vector<char*> argv;
		for (auto& arg : _args) argv.push_back(arg.data());
		argv.push_back(nullptr);
		this->init(static_cast<int>(_args.size()), argv.data());
	}
};

}  // namespace

TEST(BridgeParamsTest, DefaultsAreValid) {
	BridgeParams params;
	EXPECT_NO_THROW(params.validate());
	EXPECT_EQ(params.addressWidth, 32);
	EXPECT_EQ(params.dataWidth, 32);
	EXPECT_EQ(params.queueDepth, 4);
	EXPECT_EQ(params.numTargets, 1);

	ClockParams clocks;
	EXPECT_NO_THROW(clocks.validate());
}

TEST(BridgeParamsTest, OutOfRangeValuesAreRejected) {
	auto expectRejected = [](auto _mutate, const char* _what) {
		BridgeParams params;
		_mutate(params);
		EXPECT_THROW(params.validate(), ConfigurationError) << _what;
	};

	expectRejected([](BridgeParams& p) { p.addressWidth = 0; }, "address_width 0");
	expectRejected([](BridgeParams& p) { p.addressWidth = 65; }, "address_width 65");
	expectRejected([](BridgeParams& p) { p.dataWidth = 12; }, "data_width 12");
	expectRejected([](BridgeParams& p) { p.dataWidth = 0; }, "data_width 0");
	expectRejected([](BridgeParams& p) { p.dataWidth = 72; }, "data_width 72");
	expectRejected([](BridgeParams& p) { p.queueDepth = 3; }, "queue_depth 3");
	expectRejected([](BridgeParams& p) { p.queueDepth = 1; }, "queue_depth 1");
	expectRejected([](BridgeParams& p) { p.queueDepth = 0; }, "queue_depth 0");
	expectRejected([](BridgeParams& p) { p.numTargets = 0; }, "num_targets 0");
	expectRejected([](BridgeParams& p) { p.numTargets = 33; }, "num_targets 33");
	expectRejected(
	    [](BridgeParams& p) {
		    p.addressWidth = 1;
		    p.numTargets   = 3;
	    },
	    "3 targets in a 1-bit space");
	expectRejected(
	    [](BridgeParams& p) {
		    p.addressWidth = 4;
		    p.numTargets   = 17;
	    },
	    "17 targets in a 4-bit space");

	ClockParams clocks;
	clocks.slowPeriod = 0;
	EXPECT_THROW(clocks.validate(), ConfigurationError);
	clocks            = ClockParams{};
	clocks.fastPeriod = 0;
	EXPECT_THROW(clocks.validate(), ConfigurationError);
}

TEST(BridgeParamsTest, EveryTargetCountThatFitsTheSpaceBuilds) {
	for (const auto& [width, targets] : std::vector<std::pair<int, int>>{{4, 5}, {4, 16}, {2, 3}, {5, 32}, {8, 17}}) {
		BridgeParams params;
		params.addressWidth = width;
		params.numTargets   = targets;
		ASSERT_NO_THROW(params.validate()) << width << " bits, " << targets << " targets";

		ClockDomain fast("fast", 10), slow("slow", 37);
		std::unique_ptr<Bridge> bridge;
		ASSERT_NO_THROW(bridge = std::make_unique<Bridge>("bridge", params, &fast, &slow))
		    << width << " bits, " << targets << " targets";
		EXPECT_EQ(bridge->getAddressMap().getRegion(targets - 1).lastAddr, params.getAddressMask());
	}
}

TEST(BridgeParamsTest, BridgeRejectsMoreTargetsThanAddresses) {
	BridgeParams params;
	params.addressWidth = 1;
	params.numTargets   = 3;

	ClockDomain fast("fast", 10), slow("slow", 37);
	EXPECT_THROW(Bridge("bridge", params, &fast, &slow), ConfigurationError);
}

TEST(BridgeParamsTest, Masks) {
	BridgeParams params;
	params.addressWidth = 12;
	params.dataWidth    = 16;
	EXPECT_EQ(params.getAddressMask(), 0xfffu);
	EXPECT_EQ(params.getDataMask(), 0xffffu);
	EXPECT_EQ(params.getStrobeMask(), 0x3);
	EXPECT_EQ(params.getBytesPerWord(), 2);

	params.addressWidth = 64;
	params.dataWidth    = 64;
	EXPECT_EQ(params.getAddressMask(), ~Addr{0});
	EXPECT_EQ(params.getDataMask(), ~uint64_t{0});
	EXPECT_EQ(params.getStrobeMask(), 0xff);
}

TEST(BridgeConfigTest, JsonOverridesDefaults) {
	auto path = writeTempConfig("bridgesim_json_override.json",
	                            R"({ "Bridge": { "queue_depth": 8, "slow_clock_period": 25 } })");

	BridgeConfigManager manager;
	manager.parseConfigFiles({path});

	EXPECT_EQ(manager.getParameter<int>("Bridge", "queue_depth"), 8);
	EXPECT_EQ(manager.getParameter<Tick>("Bridge", "slow_clock_period"), 25u);
	EXPECT_EQ(manager.getParameter<int>("Bridge", "data_width"), 32) << "Keys absent from the file keep defaults.";

	auto config = dynamic_cast<BridgeConfig*>(manager.getConfig("Bridge"));
	ASSERT_NE(config, nullptr);
	EXPECT_EQ(config->getBridgeParams().queueDepth, 8);
	EXPECT_EQ(config->getClockParams().slowPeriod, 25u);
}

TEST(BridgeConfigTest, MalformedFilesAreReported) {
	BridgeConfigManager manager;

	auto syntax = writeTempConfig("bridgesim_bad_syntax.json", R"({ "Bridge": { "queue_depth": 8, } )");
	EXPECT_THROW(manager.parseConfigFiles({syntax}), std::runtime_error);

	auto kind = writeTempConfig("bridgesim_bad_kind.json", R"({ "Bridge": { "queue_depth": "eight" } })");
	EXPECT_THROW(manager.parseConfigFiles({kind}), std::runtime_error);

	auto negative = writeTempConfig("bridgesim_bad_tick.json", R"({ "Bridge": { "slow_clock_phase": -1 } })");
	EXPECT_THROW(manager.parseConfigFiles({negative}), std::runtime_error);

	EXPECT_THROW(manager.parseConfigFiles({"/nonexistent/bridgesim.json"}), std::runtime_error);
}

TEST(BridgeConfigTest, DuplicateSectionAcrossFilesIsAnError) {
	auto a = writeTempConfig("bridgesim_dup_a.json", R"({ "Bridge": { "queue_depth": 8 } })");
	auto b = writeTempConfig("bridgesim_dup_b.json", R"({ "Bridge": { "queue_depth": 16 } })");

	BridgeConfigManager manager;
	EXPECT_THROW(manager.parseConfigFiles({a, b}), std::runtime_error);
}

TEST(BridgeConfigTest, UnknownSectionsAndKeysAreSkipped) {
	auto path = writeTempConfig("bridgesim_unknown.json",
	                            R"({ "Elsewhere": { "x": 1 }, "Bridge": { "num_targets": 4, "colour": "red" } })");

	BridgeConfigManager manager;
	EXPECT_NO_THROW(manager.parseConfigFiles({path}));
	EXPECT_EQ(manager.getParameter<int>("Bridge", "num_targets"), 4);
	EXPECT_FALSE(manager.hasConfig("Elsewhere"));
}

TEST(BridgeConfigTest, CommandLineHasTheLastWord) {
	auto ctorFile = writeTempConfig("bridgesim_ctor.json", R"({ "Bridge": { "queue_depth": 8, "num_targets": 2 } })");
	auto cliFile  = writeTempConfig("bridgesim_cli.json", R"({ "Bridge": { "queue_depth": 16, "data_width": 16 } })");

	{
		ConfigOnlyTop simTop({ctorFile});
		simTop.initWith({});
		EXPECT_EQ(simTop.getBridgeParams().queueDepth, 8);
		EXPECT_EQ(simTop.getBridgeParams().numTargets, 2);
	}
	{
		ConfigOnlyTop simTop({ctorFile});
		simTop.initWith({"--config", cliFile});
		EXPECT_EQ(simTop.getBridgeParams().queueDepth, 16) << "--config files override constructor files.";
		EXPECT_EQ(simTop.getBridgeParams().numTargets, 2);
		EXPECT_EQ(simTop.getBridgeParams().dataWidth, 16);
	}
	{
		ConfigOnlyTop simTop({ctorFile});
		simTop.initWith({"--config", cliFile, "--queue_depth", "32", "--slow_clock_phase", "7"});
		EXPECT_EQ(simTop.getBridgeParams().queueDepth, 32) << "CLI options override every file.";
		EXPECT_EQ(simTop.getClockParams().slowPhase, 7u);
		EXPECT_EQ(simTop.getSlowDomain()->getNextEdge(), 7u);
		EXPECT_EQ(simTop.getSlowDomain()->getPeriod(), 37u);
	}
}

TEST(BridgeConfigTest, InvalidCommandLineValueStopsInit) {
	ConfigOnlyTop simTop;
	EXPECT_THROW(simTop.initWith({"--queue_depth", "3"}), ConfigurationError);
}

}  // namespace unit_test
