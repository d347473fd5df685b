/*
 * Copyright (c) 2024 Aurora Poller Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef AURORA_POLLER__BACKEND_FACTORY_HPP_
#define AURORA_POLLER__BACKEND_FACTORY_HPP_

#pragma once

#include <memory>

#include "aurora_utils/config/config.hpp"
#include "aurora_utils/serial/serial_backend.hpp"
#include "aurora_poller/energy_voltage_poller.hpp"

namespace aurora_poller
{

// Create and open the backend named by cfg.transport. Throws AuroraError(IO_FAILURE).
std::unique_ptr<aurora::serial::SerialBackend> makeBackend(const aurora::config::Config & cfg);

PollerOptions makePollerOptions(const aurora::config::Config & cfg);

} // namespace aurora_poller
#endif  // AURORA_POLLER__BACKEND_FACTORY_HPP_
