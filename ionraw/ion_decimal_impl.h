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

#ifndef IONRAW_DECIMAL_IMPL_H
#define IONRAW_DECIMAL_IMPL_H

#include "ionraw/ion_decimal.h"

#define ION_DECNUMBER_UNITS_SIZE(decimal_digits) \
    (sizeof(decNumberUnit) * ((((decimal_digits) / DECDPUN) + (((decimal_digits) % DECDPUN) ? 1 : 0))))

// NOTE: each decNumber has DECNUMUNITS preallocated units in its lsu array. These provide space for (DECNUMUNITS * DECDPUN)
// decimal digits. Therefore, space for an additional (decimal_digits - (DECNUMUNITS * DECDPUN)) digits is needed.
#define ION_DECNUMBER_SIZE(decimal_digits) \
    (sizeof(decNumber) + ((decimal_digits > (DECNUMUNITS * DECDPUN)) ? ION_DECNUMBER_UNITS_SIZE(decimal_digits - (DECNUMUNITS * DECDPUN)) : 0))

// upper bound on the decimal digits needed for a magnitude of n bytes (log10(256) < 2.41)
#define ION_DECIMAL_DIGITS_FOR_BYTES(n) ((SIZE)((n) * 3 + 1))

namespace ionraw {

iERR _ion_decimal_number_alloc(SIZE decimal_digits, decNumber **p_number);

/** Copies context, widening its precision to at least digits. */
void _ion_decimal_widen_context(const decContext *context, SIZE digits, decContext *p_widened);

} // namespace ionraw

#endif //IONRAW_DECIMAL_IMPL_H
