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

#include "netsat/solver.h"

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "gutil/status.h"
#include "z3++.h"

namespace netsat {

absl::StatusOr<bool> Z3Solver::IsSatisfiable(
    absl::string_view smt_lib_program) {
  z3::context context;
  std::string output;
  try {
    output = Z3_eval_smtlib2_string(context,
                                    std::string(smt_lib_program).c_str());
    context.check_error();
  } catch (const z3::exception& e) {
    return gutil::InvalidArgumentErrorBuilder()
           << "Z3 rejected the program: " << e.msg();
  }

  // Z3 reports script errors inline, as `(error "...")` responses.
  if (absl::StrContains(output, "(error")) {
    return gutil::InvalidArgumentErrorBuilder()
           << "Z3 rejected the program: " << absl::StripAsciiWhitespace(output);
  }

  std::vector<absl::string_view> responses =
      absl::StrSplit(output, '\n', absl::SkipWhitespace());
  if (responses.size() != 1) {
    return gutil::InternalErrorBuilder()
           << "expected exactly one response from Z3, got "
           << responses.size() << ": " << output;
  }
  absl::string_view response = absl::StripAsciiWhitespace(responses[0]);
  if (response == "sat") return true;
  if (response == "unsat") return false;
  if (response == "unknown") {
    return gutil::UnknownErrorBuilder() << "Z3 could not decide the program";
  }
  return gutil::InternalErrorBuilder()
         << "Invalid Z3 check-sat response: " << response;
}

}  // namespace netsat
