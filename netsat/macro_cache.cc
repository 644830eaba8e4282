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

#include "netsat/macro_cache.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "netsat/formula.h"
#include "netsat/packet_field.h"

namespace netsat {
namespace {

absl::string_view SortName(Sort sort) {
  switch (sort) {
    case Sort::kPacket:
      return "Packet";
    case Sort::kInt:
      return "Int";
  }
  LOG(DFATAL) << "Unhandled sort: " << static_cast<int>(sort);
  return "";
}

}  // namespace

std::string MacroName(const MacroKey& key) {
  std::string field = FieldName(key.field);
  switch (key.family) {
    case MacroFamily::kEquals:
      return absl::StrCat(field, "-equals");
    case MacroFamily::kNotEquals:
      return absl::StrCat(field, "-not-equals");
    case MacroFamily::kPacketEqualsExcept:
      return absl::StrCat("packet-equals-except-", field);
    case MacroFamily::kModify:
      return absl::StrCat("mod-", field);
  }
  LOG(DFATAL) << "Unhandled macro family: " << static_cast<int>(key.family);
  return field;
}

std::string ToSmtLibDefinition(const Macro& macro, bool with_comments) {
  std::string parameters;
  for (const MacroParameter& parameter : macro.parameters) {
    if (!parameters.empty()) parameters.push_back(' ');
    absl::StrAppend(&parameters, "(", parameter.name, " ",
                    SortName(parameter.sort), ")");
  }
  return absl::StrCat("(define-fun ", macro.name, " (", parameters, ") Bool ",
                      macro.body.ToSmtLib(with_comments), ")");
}

MacroHandle MacroCache::GetOrCreate(const MacroKey& key,
                                    absl::FunctionRef<Macro()> builder) {
  if (auto it = handle_by_key_.find(key); it != handle_by_key_.end()) {
    return it->second;
  }
  CHECK(under_construction_.insert(key).second)  // Crash OK
      << "cyclic macro definition: " << MacroName(key);
  Macro macro = builder();
  under_construction_.erase(key);

  // The builder may have created other macros, so the index is taken only now.
  CHECK(names_.insert(macro.name).second)  // Crash OK
      << "duplicate macro name: " << macro.name;
  MacroHandle handle(macros_.size());
  macros_.push_back(std::move(macro));
  handle_by_key_.try_emplace(key, handle);
  return handle;
}

std::optional<MacroHandle> MacroCache::Find(const MacroKey& key) const {
  if (auto it = handle_by_key_.find(key); it != handle_by_key_.end()) {
    return it->second;
  }
  return std::nullopt;
}

const Macro& MacroCache::GetMacro(MacroHandle handle) const {
  CHECK_LT(handle.index_, macros_.size())  // Crash OK
      << "handle does not belong to this cache";
  return macros_[handle.index_];
}

Formula MacroCache::Apply(MacroHandle handle,
                          std::vector<Term> arguments) const {
  const Macro& macro = GetMacro(handle);
  CHECK_EQ(arguments.size(), macro.parameters.size())  // Crash OK
      << "wrong number of arguments to " << macro.name;
  return Formula::Apply(macro.name, std::move(arguments));
}

}  // namespace netsat
