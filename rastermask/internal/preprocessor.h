// Copyright 2026 The RasterMask Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef RASTERMASK_INTERNAL_PREPROCESSOR_H_
#define RASTERMASK_INTERNAL_PREPROCESSOR_H_

/// Expands to its arguments.  Forces an extra rescan, which works around MSVC
/// treating `__VA_ARGS__` as a single argument.
#define RASTERMASK_PP_EXPAND(...) __VA_ARGS__

/// Concatenates two tokens after macro-expanding them.
#define RASTERMASK_PP_CAT(a, b) RASTERMASK_INTERNAL_PP_CAT(a, b)
#define RASTERMASK_INTERNAL_PP_CAT(a, b) a##b

#endif  // RASTERMASK_INTERNAL_PREPROCESSOR_H_
