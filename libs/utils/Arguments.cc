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

#include "utils/Arguments.hh"

namespace bridgesim {

std::vector<char*> getGoogleTestArguments(int argc, char** argv) { return getArguments(argc, argv, "--gtest", true); }

std::vector<char*> getBridgeSimArguments(int argc, char** argv) { return getArguments(argc, argv, "--gtest", false); }

std::vector<char*> getArguments(int argc, char** argv, const char* prefix, const bool inclusive) {
	std::vector<char*> args;
	args.push_back(argv[0]);

	int i = 1;
	while (i < argc) {
		// a positional argument without a preceding option is kept on both sides
		if (!isOption(argv[i])) {
			args.push_back(argv[i++]);
			continue;
		}

		const bool keep = (std::strncmp(argv[i], prefix, std::strlen(prefix)) == 0) == inclusive;
		if (keep) args.push_back(argv[i]);

		for (i++; i < argc && !isOption(argv[i]); ++i) {
			if (keep) args.push_back(argv[i]);
		}
	}
	return args;
}

}  // namespace bridgesim
