/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string_view>

namespace fileguard::core {

// True for entry names that would escape an extraction root: empty or blank,
// rooted at '/' or '\', drive-qualified ("C:"), or containing a ".." segment.
// Purely lexical; never consults the filesystem.
[[nodiscard]] bool is_suspicious_entry_name(std::string_view name);

}  // namespace fileguard::core
