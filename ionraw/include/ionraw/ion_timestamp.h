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

/**@file */

//
// ion timestamp support routines
//
// text rendering follows the ion text form:
//
//      2007T                            // year precision
//      2007-02T                         // month precision
//      2007-02-23                       // day precision
//      2007-02-23T12:14Z                // minute precision, UTC
//      2007-02-23T12:14:33.079-08:00    // fractional seconds, PST local time
//      2007-02-23T20:14:33-00:00        // unknown local offset
//

#ifndef IONRAW_TIMESTAMP_H_
#define IONRAW_TIMESTAMP_H_

#include <string>
#include "ion_types.h"
#include "ion_decimal.h"
#include "ion_platform_config.h"

#define ION_TT_BIT_YEAR  0x01
#define ION_TT_BIT_MONTH 0x02
#define ION_TT_BIT_DAY   0x04
#define ION_TT_BIT_MIN   0x10
#define ION_TT_BIT_SEC   0x20 /* with secs must have time & date */
#define ION_TT_BIT_FRAC  0x40 /* must have all */
#define ION_TT_BIT_TZ    0x80 /* set when the local offset is known */

#define ION_TS_NULL      0x00
#define ION_TS_YEAR      (0x0         | ION_TT_BIT_YEAR)
#define ION_TS_MONTH     (ION_TS_YEAR | ION_TT_BIT_MONTH)
#define ION_TS_DAY       (ION_TS_MONTH  | ION_TT_BIT_DAY)
#define ION_TS_MIN       (ION_TS_DAY  | ION_TT_BIT_MIN)
#define ION_TS_SEC       (ION_TS_MIN  | ION_TT_BIT_SEC)
#define ION_TS_FRAC      (ION_TS_SEC | ION_TT_BIT_FRAC)

#define ION_TIMESTAMP_NULL_OFFSET_IMAGE  "-00:00"

namespace ionraw {

/** Structure to store time information.
 * Calendar fields are in local time; tz_offset (minutes east of UTC) is only
 * meaningful when ION_TT_BIT_TZ is set in precision.
 */
struct IonTimestamp {
    /** Defined as ION_TS_YEAR, ION_TS_MONTH, ION_TS_DAY, ION_TS_MIN, ION_TS_SEC, ION_TS_FRAC,
     *  optionally combined with ION_TT_BIT_TZ.
     */
    uint8_t     precision;

    /** Time zone offset (+/- 24 hours), in term of minutes.
     *
     */
    int16_t     tz_offset;
    uint16_t    year, month, day;
    uint16_t    hours, minutes, seconds;

    /** Fraction of a second, e.g: 0.5, 0.01, etc
     *
     */
    IonDecimal  fraction;

    IonTimestamp()
        : precision(ION_TS_NULL), tz_offset(0), year(0), month(0), day(0)
        , hours(0), minutes(0), seconds(0) {}
};

/** Get the time precision for the given timestamp object, without the offset bit.
 *
 */
IONRAW_API_EXPORT iERR ion_timestamp_get_precision(const IonTimestamp *ptime, int *precision);

/** TRUE if the timestamp carries a known local offset. An unknown offset
 *  (-00:00) and timestamps of day precision or less report FALSE.
 */
IONRAW_API_EXPORT iERR ion_timestamp_has_local_offset(const IonTimestamp *ptime, BOOL *p_has_local_offset);

/** The local offset in minutes.
 *  @return IERR_INVALID_STATE if the timestamp has no known local offset.
 */
IONRAW_API_EXPORT iERR ion_timestamp_get_local_offset(const IonTimestamp *ptime, int *p_offset_minutes);

/** Get the text form of a timestamp.
 *
 */
IONRAW_API_EXPORT iERR ion_timestamp_to_string(const IonTimestamp *ptime, std::string *p_str);

/** TRUE if both timestamps have the same precision, fields, offset and fraction.
 *  Two timestamps of different precision are never equal.
 */
IONRAW_API_EXPORT iERR ion_timestamp_equals(const IonTimestamp *ptime1, const IonTimestamp *ptime2, BOOL *is_equal);

IONRAW_API_EXPORT BOOL ion_timestamp_is_leap_year(int year);

/** Number of days in the month (1..12) of the given year, 0 for an invalid month.
 *
 */
IONRAW_API_EXPORT int ion_timestamp_days_in_month(int year, int month);

} // namespace ionraw

#endif /* IONRAW_TIMESTAMP_H_ */
