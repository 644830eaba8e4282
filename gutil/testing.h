// Copyright 2026 The NetSAT authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef NETSAT_GUTIL_TESTING_H_
#define NETSAT_GUTIL_TESTING_H_

#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "gutil/proto.h"

namespace netsat {

// Parses a query or program from its text format, crashing on malformed
// input. Only use in tests.
template <typename T>
T ParseProtoOrDie(absl::string_view text) {
  T message;
  CHECK_OK(gutil::ReadProtoFromString(text, &message));  // Crash OK
  return message;
}

}  // namespace netsat

#endif  // NETSAT_GUTIL_TESTING_H_
