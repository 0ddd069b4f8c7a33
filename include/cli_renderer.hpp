/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include "librespeed_server.hpp"
#include "speed_test.hpp"
#include <span>
#include <string>
#include <string_view>

namespace CliRenderer {
SpinnerCallback make_spinner_callback();

std::string format_server_line(const ServerEntry& entry);
void render_server_list(std::span<const ServerEntry> servers);
}  // namespace CliRenderer
