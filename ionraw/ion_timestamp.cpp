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

#include <stdio.h>
#include <stdlib.h>

#include "ionraw/ion_timestamp.h"
#include "ionraw/ion_debug.h"
#include "ion_const.h"
#include "ion_helpers.h"
#include "ion_timestamp_impl.h"

namespace ionraw {

static const int JULIAN_DAY_PER_MONTH[2][12] = {
// jan, feb, mar, apr, may, jun, jul, aug, sep, oct, nov, dec
    {   31,  28,  31,  30,  31,  30,  31,  31,  30,  31,  30,  31 },
    {   31,  29,  31,  30,  31,  30,  31,  31,  30,  31,  30,  31 },
};

BOOL ion_timestamp_is_leap_year(int year)
{
    return ((year % 4 == 0) && (year % 100 != 0)) || (year % 400 == 0);
}

int ion_timestamp_days_in_month(int year, int month)
{
    if (month < 1 || month > 12) return 0;
    return JULIAN_DAY_PER_MONTH[ion_timestamp_is_leap_year(year) ? 1 : 0][month - 1];
}

iERR ion_timestamp_get_precision(const IonTimestamp *ptime, int *precision)
{
    iENTER;

    if (!ptime || !precision) FAILWITH(IERR_INVALID_ARG);
    *precision = ptime->precision & ION_TS_PRECISION_MASK;

    iRETURN;
}

iERR ion_timestamp_has_local_offset(const IonTimestamp *ptime, BOOL *p_has_local_offset)
{
    iENTER;

    if (!ptime || !p_has_local_offset) FAILWITH(IERR_INVALID_ARG);
    *p_has_local_offset = HAS_TZ_OFFSET(ptime) ? TRUE : FALSE;

    iRETURN;
}

iERR ion_timestamp_get_local_offset(const IonTimestamp *ptime, int *p_offset_minutes)
{
    iENTER;

    if (!ptime || !p_offset_minutes) FAILWITH(IERR_INVALID_ARG);
    if (!HAS_TZ_OFFSET(ptime)) FAILWITHMSG(IERR_INVALID_STATE, "timestamp has no local offset");
    *p_offset_minutes = ptime->tz_offset;

    iRETURN;
}

static void _ion_timestamp_append_int(std::string *p_str, int value, int width)
{
    char image[16];
    snprintf(image, sizeof(image), "%0*d", width, value);
    p_str->append(image);
}

iERR ion_timestamp_to_string(const IonTimestamp *ptime, std::string *p_str)
{
    iENTER;
    std::string text, coefficient;
    IonDecimal  digits;
    int         precision, offset;
    uint64_t    places;

    if (!ptime || !p_str) FAILWITH(IERR_INVALID_ARG);
    precision = ptime->precision & ION_TS_PRECISION_MASK;
    if (precision == ION_TS_NULL) FAILWITHMSG(IERR_INVALID_STATE, "timestamp has no fields");

    _ion_timestamp_append_int(&text, ptime->year, 4);
    if (precision == ION_TS_YEAR) {
        text.append("T");
        goto done;
    }
    text.append("-");
    _ion_timestamp_append_int(&text, ptime->month, 2);
    if (precision == ION_TS_MONTH) {
        text.append("T");
        goto done;
    }
    text.append("-");
    _ion_timestamp_append_int(&text, ptime->day, 2);
    if (precision == ION_TS_DAY) {
        goto done;
    }

    text.append("T");
    _ion_timestamp_append_int(&text, ptime->hours, 2);
    text.append(":");
    _ion_timestamp_append_int(&text, ptime->minutes, 2);
    if (precision & ION_TT_BIT_SEC) {
        text.append(":");
        _ion_timestamp_append_int(&text, ptime->seconds, 2);
    }
    if (precision & ION_TT_BIT_FRAC) {
        // the fraction is coefficient * 10^exponent with -exponent >= digits,
        // so it prints as the zero padded coefficient
        IONCHECK(_ion_timestamp_validate_fraction(&ptime->fraction, NULL));
        places = (ptime->fraction.exponent() < 0) ? abs_int64(ptime->fraction.exponent()) : 0;
        digits = IonDecimal::from_magnitude(ptime->fraction.coefficient_bytes().data(),
                                            (SIZE)ptime->fraction.coefficient_bytes().size(), false, 0);
        IONCHECK(digits.to_string(&coefficient, NULL));
        text.append(".");
        if (places > (uint64_t)coefficient.size()) {
            text.append((size_t)(places - (uint64_t)coefficient.size()), '0');
        }
        text.append(coefficient);
    }

    if (!HAS_TZ_OFFSET(ptime)) {
        text.append(ION_TIMESTAMP_NULL_OFFSET_IMAGE);
    }
    else if (ptime->tz_offset == 0) {
        text.append("Z");
    }
    else {
        offset = ptime->tz_offset;
        text.append(offset < 0 ? "-" : "+");
        offset = abs(offset);
        _ion_timestamp_append_int(&text, offset / 60, 2);
        text.append(":");
        _ion_timestamp_append_int(&text, offset % 60, 2);
    }

done:
    p_str->swap(text);

    iRETURN;
}

iERR ion_timestamp_equals(const IonTimestamp *ptime1, const IonTimestamp *ptime2, BOOL *is_equal)
{
    iENTER;
    int precision;

    if (!ptime1 || !ptime2 || !is_equal) FAILWITH(IERR_INVALID_ARG);

    *is_equal = FALSE;
    if (ptime1->precision != ptime2->precision) SUCCEED();
    precision = ptime1->precision;

    if (ptime1->year != ptime2->year) SUCCEED();
    if ((precision & ION_TT_BIT_MONTH) && ptime1->month != ptime2->month) SUCCEED();
    if ((precision & ION_TT_BIT_DAY) && ptime1->day != ptime2->day) SUCCEED();
    if ((precision & ION_TT_BIT_MIN)
        && (ptime1->hours != ptime2->hours || ptime1->minutes != ptime2->minutes)) SUCCEED();
    if ((precision & ION_TT_BIT_SEC) && ptime1->seconds != ptime2->seconds) SUCCEED();
    if ((precision & ION_TT_BIT_FRAC) && ptime1->fraction != ptime2->fraction) SUCCEED();
    if ((precision & ION_TT_BIT_TZ) && ptime1->tz_offset != ptime2->tz_offset) SUCCEED();
    *is_equal = TRUE;

    iRETURN;
}

iERR _ion_timestamp_validate_fraction(const IonDecimal *fraction, decContext *context)
{
    iENTER;
    IonDecNumberPtr number;

    // bounds the exponent before anything computes with it
    err = fraction->to_number(context, &number);
    if (err == IERR_NUMERIC_OVERFLOW) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "fraction is outside of the decimal context's range");
    }
    IONCHECK(err);
    if (fraction->is_zero()) SUCCEED();

    if (fraction->is_negative()) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "fraction is negative");
    }
    if (fraction->exponent() >= 0
        || (uint64_t)number->digits > abs_int64(fraction->exponent())) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "fraction is not less than one");
    }

    iRETURN;
}

iERR _ion_timestamp_validate(const IonTimestamp *ptime, decContext *context)
{
    iENTER;
    int precision = ptime->precision & ION_TS_PRECISION_MASK;

    if (ptime->year < 1 || ptime->year > 9999) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "year is out of range");
    }
    if ((precision & ION_TT_BIT_MONTH) && (ptime->month < 1 || ptime->month > 12)) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "month is out of range");
    }
    if ((precision & ION_TT_BIT_DAY)
        && (ptime->day < 1 || ptime->day > ion_timestamp_days_in_month(ptime->year, ptime->month))) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "day is out of range");
    }
    if ((precision & ION_TT_BIT_MIN) && (ptime->hours > 23 || ptime->minutes > 59)) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "time of day is out of range");
    }
    if ((precision & ION_TT_BIT_SEC) && ptime->seconds > 59) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "seconds are out of range");
    }
    if (precision & ION_TT_BIT_FRAC) {
        IONCHECK(_ion_timestamp_validate_fraction(&ptime->fraction, context));
    }
    if (HAS_TZ_OFFSET(ptime) && abs(ptime->tz_offset) >= ION_TIMESTAMP_MAX_OFFSET) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "local offset is out of range");
    }

    iRETURN;
}

iERR _ion_timestamp_shift_minutes(IonTimestamp *ptime, int offset_minutes)
{
    iENTER;
    int minutes = ptime->hours * 60 + ptime->minutes + offset_minutes;
    int day_delta = 0;
    int year  = ptime->year;
    int month = ptime->month;
    int day   = ptime->day;

    while (minutes < 0) {
        minutes += 24 * 60;
        day_delta--;
    }
    while (minutes >= 24 * 60) {
        minutes -= 24 * 60;
        day_delta++;
    }

    day += day_delta;
    if (day < 1) {
        if (--month < 1) {
            month = 12;
            year--;
        }
        day = ion_timestamp_days_in_month(year, month);
    }
    else if (day > ion_timestamp_days_in_month(year, month)) {
        day = 1;
        if (++month > 12) {
            month = 1;
            year++;
        }
    }
    if (year < 1 || year > 9999) {
        FAILWITHMSG(IERR_INVALID_TIMESTAMP, "local time is outside of the supported years");
    }

    ptime->year    = (uint16_t)year;
    ptime->month   = (uint16_t)month;
    ptime->day     = (uint16_t)day;
    ptime->hours   = (uint16_t)(minutes / 60);
    ptime->minutes = (uint16_t)(minutes % 60);

    iRETURN;
}

} // namespace ionraw
