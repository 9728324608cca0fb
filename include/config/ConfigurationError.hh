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

#include <stdexcept>
#include <string>

namespace bridgesim {

/**
 * @brief Invalid construction-time parameter.
 *
 * Thrown while a component is being built, never while the simulation runs.
 */
class ConfigurationError : public std::runtime_error {
public:
	explicit ConfigurationError(const std::string& _what) : std::runtime_error(_what) {}
};

}  // namespace bridgesim
