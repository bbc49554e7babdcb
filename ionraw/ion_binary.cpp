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

#include <string.h>

#include "ion_const.h"
#include "ion_binary.h"
#include "ion_helpers.h"
#include "ion_timestamp_impl.h"

namespace ionraw {

iERR ion_binary_read_var_uint_64(IonStream *pstream, uint64_t *p_value)
{
    iENTER;
    uint64_t value = 0;
    SIZE     image_length = 0;
    int      b;

    for (;;) {
        IONCHECK(pstream->read_byte(&b));
        if (b == ION_STREAM_EOF) FAILWITH(IERR_UNEXPECTED_EOF);
        if (++image_length > VAR_UINT_64_IMAGE_LENGTH || value > (UINT64_MAX >> 7)) {
            FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "VarUInt does not fit in 64 bits");
        }
        value = (value << 7) | (uint64_t)(b & 0x7f);
        if (b & 0x80) break;
    }
    *p_value = value;

    iRETURN;
}

iERR ion_binary_read_var_int_64(IonStream *pstream, int64_t *p_value, BOOL *p_is_negative_zero)
{
    iENTER;
    uint64_t value;
    BOOL     is_negative;
    SIZE     image_length = 1;
    int      b;

    IONCHECK(pstream->read_byte(&b));
    if (b == ION_STREAM_EOF) FAILWITH(IERR_UNEXPECTED_EOF);
    is_negative = (b & 0x40) != 0;
    value = (uint64_t)(b & 0x3f);

    while ((b & 0x80) == 0) {
        IONCHECK(pstream->read_byte(&b));
        if (b == ION_STREAM_EOF) FAILWITH(IERR_UNEXPECTED_EOF);
        if (++image_length > VAR_INT_64_IMAGE_LENGTH || value > (UINT64_MAX >> 7)) {
            FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "VarInt does not fit in 64 bits");
        }
        value = (value << 7) | (uint64_t)(b & 0x7f);
    }

    IONCHECK(cast_to_int64(value, is_negative, p_value));
    if (p_is_negative_zero) {
        *p_is_negative_zero = (is_negative && value == 0);
    }

    iRETURN;
}

iERR ion_binary_read_uint_64(IonStream *pstream, SIZE len, uint64_t *p_value)
{
    iENTER;
    uint64_t value = 0;
    int      b;

    for (; len > 0; len--) {
        IONCHECK(pstream->read_byte(&b));
        if (b == ION_STREAM_EOF) FAILWITH(IERR_UNEXPECTED_EOF);
        if (value > (UINT64_MAX >> 8)) {
            FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "UInt does not fit in 64 bits");
        }
        value = (value << 8) | (uint64_t)b;
    }
    *p_value = value;

    iRETURN;
}

iERR ion_binary_decode_var_uint_64(const BYTE **pp_curr, const BYTE *limit, uint64_t *p_value)
{
    iENTER;
    const BYTE *cp = *pp_curr;
    uint64_t    value = 0;
    SIZE        image_length = 0;
    int         b;

    for (;;) {
        if (cp >= limit) FAILWITHMSG(IERR_INVALID_BINARY, "VarUInt runs past the end of the value");
        b = *cp++;
        if (++image_length > VAR_UINT_64_IMAGE_LENGTH || value > (UINT64_MAX >> 7)) {
            FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "VarUInt does not fit in 64 bits");
        }
        value = (value << 7) | (uint64_t)(b & 0x7f);
        if (b & 0x80) break;
    }
    *p_value = value;
    *pp_curr = cp;

    iRETURN;
}

iERR ion_binary_decode_var_int_64(const BYTE **pp_curr, const BYTE *limit, int64_t *p_value, BOOL *p_is_negative_zero)
{
    iENTER;
    const BYTE *cp = *pp_curr;
    uint64_t    value;
    BOOL        is_negative;
    SIZE        image_length = 1;
    int         b;

    if (cp >= limit) FAILWITHMSG(IERR_INVALID_BINARY, "VarInt runs past the end of the value");
    b = *cp++;
    is_negative = (b & 0x40) != 0;
    value = (uint64_t)(b & 0x3f);

    while ((b & 0x80) == 0) {
        if (cp >= limit) FAILWITHMSG(IERR_INVALID_BINARY, "VarInt runs past the end of the value");
        b = *cp++;
        if (++image_length > VAR_INT_64_IMAGE_LENGTH || value > (UINT64_MAX >> 7)) {
            FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "VarInt does not fit in 64 bits");
        }
        value = (value << 7) | (uint64_t)(b & 0x7f);
    }

    IONCHECK(cast_to_int64(value, is_negative, p_value));
    if (p_is_negative_zero) {
        *p_is_negative_zero = (is_negative && value == 0);
    }
    *pp_curr = cp;

    iRETURN;
}

iERR ion_binary_decode_uint_64(const BYTE *bytes, SIZE len, uint64_t *p_value)
{
    iENTER;
    uint64_t value = 0;
    SIZE     i;

    for (i = 0; i < len; i++) {
        if (value > (UINT64_MAX >> 8)) {
            FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "UInt does not fit in 64 bits");
        }
        value = (value << 8) | bytes[i];
    }
    *p_value = value;

    iRETURN;
}

iERR ion_binary_decode_int_magnitude(const BYTE *bytes, SIZE len, BOOL *p_is_negative, std::vector<BYTE> *p_magnitude)
{
    iENTER;
    SIZE start = 0;

    p_magnitude->clear();
    *p_is_negative = FALSE;
    if (len <= 0) SUCCEED();

    *p_is_negative = (bytes[0] & 0x80) != 0;
    if ((bytes[0] & 0x7f) == 0) {
        start = 1;
        while (start < len && bytes[start] == 0) start++;
        p_magnitude->assign(bytes + start, bytes + len);
    }
    else {
        p_magnitude->assign(bytes, bytes + len);
        (*p_magnitude)[0] &= 0x7f;
    }

    iRETURN;
}

iERR ion_binary_decode_double(const BYTE *bytes, SIZE len, double *p_value)
{
    iENTER;
    uint64_t image;
    uint32_t image32;
    float    value32;
    double   value64;

    switch (len) {
    case 0:
        *p_value = 0.0;
        break;
    case 4:
        IONCHECK(ion_binary_decode_uint_64(bytes, len, &image));
        image32 = (uint32_t)image;
        memcpy(&value32, &image32, sizeof(value32));
        *p_value = (double)value32;
        break;
    case 8:
        IONCHECK(ion_binary_decode_uint_64(bytes, len, &image));
        memcpy(&value64, &image, sizeof(value64));
        *p_value = value64;
        break;
    default:
        FAILWITHMSG(IERR_INVALID_BINARY, "float length must be 0, 4 or 8");
    }

    iRETURN;
}

iERR ion_binary_decode_decimal(const BYTE *bytes, SIZE len, IonDecimal *p_value)
{
    iENTER;
    const BYTE       *cp = bytes;
    const BYTE       *limit = bytes + len;
    int64_t           exponent;
    BOOL              is_negative;
    std::vector<BYTE> magnitude;

    if (len <= 0) {
        *p_value = IonDecimal();
        SUCCEED();
    }

    // a negative zero exponent is just zero
    IONCHECK(ion_binary_decode_var_int_64(&cp, limit, &exponent, NULL));
    IONCHECK(ion_binary_decode_int_magnitude(cp, (SIZE)(limit - cp), &is_negative, &magnitude));
    *p_value = IonDecimal::from_magnitude(magnitude.data(), (SIZE)magnitude.size(), is_negative, exponent);

    iRETURN;
}

// reads one VarUInt calendar field and range checks it against the uint16 fields
static iERR _ion_binary_decode_timestamp_field(const BYTE **pp_curr, const BYTE *limit, uint16_t *p_field)
{
    iENTER;
    uint64_t value;

    IONCHECK(ion_binary_decode_var_uint_64(pp_curr, limit, &value));
    if (value > 0xffff) FAILWITHMSG(IERR_INVALID_TIMESTAMP, "timestamp field is out of range");
    *p_field = (uint16_t)value;

    iRETURN;
}

iERR ion_binary_decode_timestamp(const BYTE *bytes, SIZE len, decContext *context, IonTimestamp *p_value)
{
    iENTER;
    const BYTE       *cp = bytes;
    const BYTE       *limit = bytes + len;
    IonTimestamp      ts;
    int64_t           offset = 0, fraction_exponent = 0;
    BOOL              offset_unknown = FALSE, is_negative = FALSE;
    std::vector<BYTE> magnitude;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);

    IONCHECK(ion_binary_decode_var_int_64(&cp, limit, &offset, &offset_unknown));
    if (cp >= limit) FAILWITHMSG(IERR_INVALID_TIMESTAMP, "timestamp has no year");
    IONCHECK(_ion_binary_decode_timestamp_field(&cp, limit, &ts.year));
    ts.precision = ION_TS_YEAR;

    if (cp < limit) {
        IONCHECK(_ion_binary_decode_timestamp_field(&cp, limit, &ts.month));
        ts.precision = ION_TS_MONTH;
    }
    if (cp < limit) {
        IONCHECK(_ion_binary_decode_timestamp_field(&cp, limit, &ts.day));
        ts.precision = ION_TS_DAY;
    }
    if (cp < limit) {
        IONCHECK(_ion_binary_decode_timestamp_field(&cp, limit, &ts.hours));
        if (cp >= limit) FAILWITHMSG(IERR_INVALID_TIMESTAMP, "timestamp has hours but no minutes");
        IONCHECK(_ion_binary_decode_timestamp_field(&cp, limit, &ts.minutes));
        ts.precision = ION_TS_MIN;
    }
    if (cp < limit) {
        IONCHECK(_ion_binary_decode_timestamp_field(&cp, limit, &ts.seconds));
        ts.precision = ION_TS_SEC;
    }
    if (cp < limit) {
        IONCHECK(ion_binary_decode_var_int_64(&cp, limit, &fraction_exponent, NULL));
        IONCHECK(ion_binary_decode_int_magnitude(cp, (SIZE)(limit - cp), &is_negative, &magnitude));
        cp = limit;
        if (magnitude.empty()) {
            // -0 is 0 as far as fractions go
            is_negative = FALSE;
        }
        ts.fraction = IonDecimal::from_magnitude(magnitude.data(), (SIZE)magnitude.size(), is_negative, fraction_exponent);
        // 0d0, 0d1 ... carry no more precision than the seconds
        if (!magnitude.empty() || fraction_exponent < 0) {
            ts.precision = ION_TS_FRAC;
        }
        else {
            ts.fraction = IonDecimal();
        }
    }

    // offsets only apply to timestamps with a time of day
    if ((ts.precision & ION_TT_BIT_MIN) && !offset_unknown) {
        if (offset <= -ION_TIMESTAMP_MAX_OFFSET || offset >= ION_TIMESTAMP_MAX_OFFSET) {
            FAILWITHMSG(IERR_INVALID_TIMESTAMP, "local offset is out of range");
        }
        ts.precision |= ION_TT_BIT_TZ;
        ts.tz_offset = (int16_t)offset;
    }

    // the encoded fields are UTC
    IONCHECK(_ion_timestamp_validate(&ts, context));
    if (HAS_TZ_OFFSET(&ts) && ts.tz_offset != 0) {
        IONCHECK(_ion_timestamp_shift_minutes(&ts, ts.tz_offset));
    }
    *p_value = ts;

    iRETURN;
}

iERR ion_binary_read_timestamp(IonStream *pstream, SIZE len, decContext *context, IonTimestamp *p_value)
{
    iENTER;
    const BYTE *bytes;

    IONCHECK(pstream->fetch(len, &bytes));
    IONCHECK(ion_binary_decode_timestamp(bytes, len, context, p_value));
    IONCHECK(pstream->skip(len));

    iRETURN;
}

} // namespace ionraw
