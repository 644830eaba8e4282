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

// Command line front end: runs a single reachability query read from a text
// proto file.
//
// Usage:
//   netsat_main --query_file=path/to/query.textproto [--dump_directory=/tmp]
//               [--annotate=false]
//
// Exits with status 0 if the query passes (or, without an expected verdict,
// once the verdict is printed), 1 if the verdict contradicts the expected one,
// and 2 on errors.

#include <iostream>
#include <memory>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "google/protobuf/stubs/common.h"
#include "gutil/proto.h"
#include "gutil/status.h"
#include "netsat/netsat.pb.h"
#include "netsat/reachability_checker.h"
#include "netsat/solver.h"

ABSL_FLAG(std::string, query_file, "",
          "The path to a text proto file containing a "
          "netsat.ReachabilityQueryProto (required).");
ABSL_FLAG(std::string, dump_directory, "/tmp",
          "The directory where SMT-LIB2 programs are written when the verdict "
          "contradicts the expected one.");
ABSL_FLAG(bool, annotate, true,
          "Whether emitted SMT-LIB2 programs carry comments.");

namespace {

// Returns whether the query passed.
absl::StatusOr<bool> RunQuery() {
  const std::string query_path = absl::GetFlag(FLAGS_query_file);
  RET_CHECK(!query_path.empty()) << "--query_file is missing.";

  netsat::ReachabilityQueryProto query;
  RETURN_IF_ERROR(gutil::ReadProtoFromFile(query_path, &query));

  netsat::ReachabilityCheckerOptions options;
  options.dump_directory = absl::GetFlag(FLAGS_dump_directory);
  options.annotate = absl::GetFlag(FLAGS_annotate);
  netsat::ReachabilityChecker checker(std::make_unique<netsat::Z3Solver>(),
                                      std::move(options));

  ASSIGN_OR_RETURN(bool result, checker.CheckQuery(query));
  if (!query.has_expected_reachable()) {
    std::cout << (result ? "reachable" : "unreachable") << std::endl;
    return true;
  }
  std::cout << (result ? "PASSED" : "FAILED") << std::endl;
  return result;
}

}  // namespace

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(absl::StrFormat(
      "usage: %s %s", argv[0],
      "--query_file=path/to/query.textproto [--dump_directory=path/to/dir] "
      "[--annotate=false]"));
  absl::ParseCommandLine(argc, argv);

  absl::StatusOr<bool> passed = RunQuery();

  google::protobuf::ShutdownProtobufLibrary();

  if (!passed.ok()) {
    LOG(ERROR) << passed.status();
    std::cerr << "Error: " << passed.status() << std::endl;
    return 2;
  }
  return *passed ? 0 : 1;
}
