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

#ifndef IONRAW_TIMESTAMP_IMPL_H_
#define IONRAW_TIMESTAMP_IMPL_H_

#include "ionraw/ion_timestamp.h"

#define ION_TS_PRECISION_MASK (ION_TS_FRAC)

#define HAS_TZ_OFFSET(pt) (((pt)->precision & ION_TT_BIT_TZ) != 0)

namespace ionraw {

/** Range checks every field present at the timestamp's precision.
 *  @return IERR_INVALID_TIMESTAMP
 */
iERR _ion_timestamp_validate(const IonTimestamp *ptime, decContext *context);

/** A fraction must lie in [0, 1) with an exponent inside the context's range.
 *  A NULL context selects the default decimal context.
 */
iERR _ion_timestamp_validate_fraction(const IonDecimal *fraction, decContext *context);

/** Shifts the calendar fields by offset_minutes, carrying through hours,
 *  days, months and years.
 *  @return IERR_INVALID_TIMESTAMP if the year leaves 1..9999.
 */
iERR _ion_timestamp_shift_minutes(IonTimestamp *ptime, int offset_minutes);

} // namespace ionraw

#endif /* IONRAW_TIMESTAMP_IMPL_H_ */
