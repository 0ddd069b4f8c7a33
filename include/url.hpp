/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>
#include <string_view>

// URL editing on top of libcurl's URL API.
namespace Url {

// Parses and re-serializes `url`. Protocol-relative input ("//host/x") gets https.
std::expected<std::string, std::string> normalize(std::string_view url);

std::expected<std::string, std::string> host(std::string_view url);

// Appends `suffix` to the path of `base` with exactly one separating slash.
std::expected<std::string, std::string> join_path(std::string_view base, std::string_view suffix);

// Drops every `key` parameter from the query and appends key=value (value percent-encoded).
std::expected<std::string, std::string> set_query_param(std::string_view url,
                                                        std::string_view key,
                                                        std::string_view value);

}  // namespace Url
