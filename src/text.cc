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

#include "elmgen/text.h"

#include <unicode/uchar.h>
#include <utf8.h>

#include <string>
#include <string_view>

namespace elmgen {

std::u8string to_u8string(std::string_view s) {
  return std::u8string(s.begin(), s.end());
}

// std::string is assumed to hold utf-8.
void to_std_string(std::u8string_view s, std::string& out) {
  out.append(begin(s), end(s));
}

bool is_valid_utf8(std::u8string_view s) {
  return utf8::is_valid(begin(s), end(s));
}

bool is_module_segment(std::u8string_view s) {
  auto it = begin(s);
  const auto e = end(s);
  if (it == e) return false;
  if (!u_isupper(utf8::next(it, e))) return false;
  while (it != e) {
    if (!u_hasBinaryProperty(utf8::next(it, e), UCHAR_XID_CONTINUE))
      return false;
  }
  return true;
}

}  // namespace elmgen
