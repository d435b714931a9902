// Copyright 2023 Matt Rudary

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//     http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <string>
#include <string_view>

namespace elmgen {

std::u8string to_u8string(std::string_view s);
void to_std_string(std::u8string_view s, std::string& out);

bool is_valid_utf8(std::u8string_view s);

/**
 * True if `s` is a module-path segment: an uppercase letter followed by
 * zero or more identifier characters (Unicode XID_Continue).
 *
 * `s` must be valid utf-8.
 */
bool is_module_segment(std::u8string_view s);

}  // namespace elmgen
