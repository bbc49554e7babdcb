/*
 * Copyright 2009-2016 Amazon.com, Inc. or its affiliates. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License").
 * You may not use this file except in compliance with the License.
 * A copy of the License is located at:
 *
 *     http://aws.amazon.com/apache2.0/
 *
 * or in the "license" file accompanying this file. This file is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific
 * language governing permissions and limitations under the License.
 */

#ifndef IONRAW_HELPERS_H_
#define IONRAW_HELPERS_H_

#include <ionraw/ion_types.h>
#include <ionraw/ion_debug.h>
#include <ionraw/ion_platform_config.h>

namespace ionraw {

// helper functions in ion_helpers.cpp
/** Maps a binary type code to its IonType. Both int type codes map to Int.
 *  @return IERR_INVALID_BINARY for the annotation wrapper and reserved codes.
 */
IONRAW_API_EXPORT iERR    ion_helper_get_iontype_from_tid(int tid, IonType *p_type);

// utf8 helpers
IONRAW_API_EXPORT BOOL    ion_isSurrogate(int32_t c);

/** Checks that bytes hold well-formed UTF-8: no overlong forms, no
 *  surrogates, nothing above U+10FFFF and no truncated sequences.
 *  @return IERR_INVALID_UTF8 otherwise.
 */
IONRAW_API_EXPORT iERR    ion_utf8_validate(const BYTE *bytes, SIZE len);

/** Get the absolute value of the given integer.
 *
 */
uint64_t abs_int64(int64_t value);

/** Cast unsigned value with sign to signed value.
 *  NUMERIC_OVERFLOW if the uint value does not fit into a int
 */
iERR cast_to_int64(uint64_t unsignedInt64Value, BOOL is_negative, int64_t* int64Ptr);

} // namespace ionraw

#endif /* IONRAW_HELPERS_H_ */
