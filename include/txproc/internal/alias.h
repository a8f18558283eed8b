// Copyright 2025 The txproc Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <spdlog/spdlog.h>
#include <stdexec/execution.hpp>

namespace txproc {
// NOLINTNEXTLINE(misc-unused-alias-decls)
namespace ex = stdexec;
// NOLINTNEXTLINE(misc-unused-alias-decls)
namespace fmt_lib = spdlog::fmt_lib;
}  // namespace txproc
