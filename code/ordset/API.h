// Copyright (c) Borislav Stanimirov
// SPDX-License-Identifier: MIT
//
#pragma once
#include <splat/symbol_export.h>

#if ORDSET_SHARED
#   if BUILDING_ORDSET
#       define ORDSET_API SYMBOL_EXPORT
#   else
#       define ORDSET_API SYMBOL_IMPORT
#   endif
#else
#   define ORDSET_API
#endif
