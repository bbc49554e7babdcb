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

#include <stdlib.h>
#include <string.h>

#include "ionraw/ion_decimal.h"
#include "ionraw/ion_debug.h"
#include "ion_decimal_impl.h"
#include "ion_helpers.h"

namespace ionraw {

void ion_decimal_default_context(decContext *context)
{
    decContextDefault(context, DEC_INIT_DECQUAD);
    // errors are reported through iERR, never through SIGFPE
    context->traps = 0;
}

void ion_decimal_free_number(decNumber *number)
{
    free(number);
}

iERR _ion_decimal_number_alloc(SIZE decimal_digits, decNumber **p_number)
{
    iENTER;
    decNumber *number;

    if (!p_number || decimal_digits <= 0) FAILWITH(IERR_INVALID_ARG);

    number = (decNumber *)malloc(ION_DECNUMBER_SIZE(decimal_digits));
    if (!number) FAILWITH(IERR_NO_MEMORY);
    decNumberZero(number);
    *p_number = number;

    iRETURN;
}

void _ion_decimal_widen_context(const decContext *context, SIZE digits, decContext *p_widened)
{
    *p_widened = *context;
    if (p_widened->digits < digits) {
        p_widened->digits = (digits > DEC_MAX_DIGITS) ? DEC_MAX_DIGITS : digits;
    }
    p_widened->traps = 0;
    p_widened->status = 0;
}

// coefficient magnitude as an unsigned decNumber with exponent 0
static iERR _ion_decimal_coefficient(const std::vector<BYTE> &magnitude, const decContext *context,
                                     decContext *p_widened, IonDecNumberPtr *p_number)
{
    iENTER;
    decContext      defaults;
    decNumber       radix, digit;
    decNumber      *raw = NULL;
    IonDecNumberPtr number;
    SIZE            max_digits = ION_DECIMAL_DIGITS_FOR_BYTES((SIZE)magnitude.size());

    if (!context) {
        ion_decimal_default_context(&defaults);
        context = &defaults;
    }
    _ion_decimal_widen_context(context, max_digits, p_widened);

    IONCHECK(_ion_decimal_number_alloc(max_digits, &raw));
    number.reset(raw);

    decNumberFromUInt32(&radix, 256);
    for (size_t i = 0; i < magnitude.size(); i++) {
        decNumberFromUInt32(&digit, magnitude[i]);
        decNumberMultiply(number.get(), number.get(), &radix, p_widened);
        decNumberAdd(number.get(), number.get(), &digit, p_widened);
    }
    if (decContextTestStatus(p_widened, DEC_Inexact | DEC_Rounded)) {
        FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "coefficient exceeds the maximum decimal precision");
    }
    *p_number = std::move(number);

    iRETURN;
}

IonDecimal::IonDecimal()
    : _is_negative(false)
    , _exponent(0)
{
}

IonDecimal IonDecimal::from_int64(int64_t coefficient, int64_t exponent)
{
    BYTE     image[sizeof(uint64_t)];
    uint64_t magnitude = abs_int64(coefficient);
    int      i;

    for (i = (int)sizeof(image) - 1; i >= 0; i--) {
        image[i] = (BYTE)(magnitude & 0xff);
        magnitude >>= 8;
    }
    return from_magnitude(image, (SIZE)sizeof(image), coefficient < 0, exponent);
}

IonDecimal IonDecimal::from_magnitude(const BYTE *magnitude, SIZE length, bool is_negative, int64_t exponent)
{
    IonDecimal decimal;
    SIZE       start = 0;

    while (start < length && magnitude[start] == 0) {
        start++;
    }
    decimal._is_negative = is_negative;
    decimal._magnitude.assign(magnitude + start, magnitude + length);
    decimal._exponent = exponent;
    return decimal;
}

iERR IonDecimal::coefficient_to_int64(int64_t *p_value) const
{
    iENTER;
    uint64_t value = 0;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    if (_magnitude.size() > sizeof(uint64_t)) {
        FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "coefficient is too large to fit in an int64");
    }
    for (size_t i = 0; i < _magnitude.size(); i++) {
        value = (value << 8) | _magnitude[i];
    }
    IONCHECK(cast_to_int64(value, _is_negative, p_value));

    iRETURN;
}

iERR IonDecimal::to_number(decContext *context, decNumber **p_number) const
{
    iENTER;
    decContext      widened;
    IonDecNumberPtr number;
    int64_t         adjusted;

    if (!p_number) FAILWITH(IERR_INVALID_ARG);

    IONCHECK(_ion_decimal_coefficient(_magnitude, context, &widened, &number));

    if (_exponent > INT32_MAX || _exponent < INT32_MIN) {
        FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "exponent is out of range");
    }
    adjusted = _exponent + number->digits - 1;
    if (adjusted > widened.emax || _exponent < (int64_t)widened.emin - (widened.digits - 1)) {
        FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "exponent is outside of the decimal context's range");
    }
    number->exponent = (int32_t)_exponent;
    if (_is_negative) {
        number->bits |= DECNEG;
    }
    *p_number = number.release();

    iRETURN;
}

iERR IonDecimal::to_number(decContext *context, IonDecNumberPtr *p_number) const
{
    iENTER;
    decNumber *number = NULL;

    if (!p_number) FAILWITH(IERR_INVALID_ARG);
    IONCHECK(to_number(context, &number));
    p_number->reset(number);

    iRETURN;
}

iERR IonDecimal::digits(decContext *context, SIZE *p_digits) const
{
    iENTER;
    decContext      widened;
    IonDecNumberPtr number;

    if (!p_digits) FAILWITH(IERR_INVALID_ARG);
    IONCHECK(_ion_decimal_coefficient(_magnitude, context, &widened, &number));
    // decNumber reports 1 digit for zero
    *p_digits = (SIZE)number->digits;

    iRETURN;
}

iERR IonDecimal::to_string(std::string *p_str, decContext *context) const
{
    iENTER;
    IonDecNumberPtr   number;
    std::vector<char> image;

    if (!p_str) FAILWITH(IERR_INVALID_ARG);
    IONCHECK(to_number(context, &number));

    image.resize((size_t)number->digits + 14);
    decNumberToString(number.get(), image.data());
    p_str->assign(image.data());

    iRETURN;
}

bool IonDecimal::operator==(const IonDecimal &other) const
{
    return _is_negative == other._is_negative
        && _exponent == other._exponent
        && _magnitude == other._magnitude;
}

} // namespace ionraw
