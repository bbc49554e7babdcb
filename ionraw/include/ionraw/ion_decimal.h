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

/**
 * Arbitrary-precision decimal values as defined by the Ion data model: a
 * signed coefficient of any length (including a distinguished negative zero)
 * and a signed exponent. Arithmetic and string conversion are delegated to the
 * decNumber library.
 */

/**@file */

#ifndef IONRAW_DECIMAL_H_
#define IONRAW_DECIMAL_H_

#include <memory>
#include <string>
#include <vector>

#include "ion_types.h"
#include "ion_platform_config.h"

extern "C" {
#include <decNumber/decNumber.h>
}

#ifndef DECNUMDIGITS
    #error DECNUMDIGITS must be defined to be >= 34
#elif DECNUMDIGITS < 34
    #error DECNUMDIGITS must be defined to be >= 34
#endif

namespace ionraw {

/**
 * Releases a decNumber allocated by IonDecimal::to_number.
 */
IONRAW_API_EXPORT void ion_decimal_free_number(decNumber *number);

struct IonDecNumberDeleter {
    void operator()(decNumber *number) const {
        ion_decimal_free_number(number);
    }
};

/**
 * A heap allocated decNumber sized for the number of digits it holds.
 */
typedef std::unique_ptr<decNumber, IonDecNumberDeleter> IonDecNumberPtr;

class IONRAW_API_EXPORT IonDecimal {
public:
    /** 0d0 */
    IonDecimal();

    static IonDecimal from_int64(int64_t coefficient, int64_t exponent);

    /**
     * Builds a decimal from a big-endian coefficient magnitude. Leading zero
     * bytes are dropped. A zero magnitude with is_negative set is negative zero.
     */
    static IonDecimal from_magnitude(const BYTE *magnitude, SIZE length, bool is_negative, int64_t exponent);

    bool is_zero() const { return _magnitude.empty(); }
    bool is_negative() const { return _is_negative; }
    bool is_negative_zero() const { return _is_negative && _magnitude.empty(); }
    int64_t exponent() const { return _exponent; }

    /** The coefficient magnitude, big-endian with no leading zero bytes. Empty for zero. */
    const std::vector<BYTE> &coefficient_bytes() const { return _magnitude; }

    /**
     * The signed coefficient as an int64.
     * @return IERR_NUMERIC_OVERFLOW if the coefficient does not fit.
     */
    iERR coefficient_to_int64(int64_t *p_value) const;

    /**
     * Converts to a decNumber. The precision used is widened as needed to
     * hold every digit of the coefficient; the exponent range of the context
     * is enforced.
     * The result is heap allocated and must be released with
     * ion_decimal_free_number.
     * @param context - may be NULL, in which case a decQuad context is used.
     * @return IERR_NUMERIC_OVERFLOW if the exponent lies outside of the context's range.
     */
    iERR to_number(decContext *context, decNumber **p_number) const;

    /** Same as above, with the result owned by the returned pointer. */
    iERR to_number(decContext *context, IonDecNumberPtr *p_number) const;

    /**
     * The number of decimal digits in the coefficient (1 for zero).
     */
    iERR digits(decContext *context, SIZE *p_digits) const;

    /**
     * Converts to decNumber's scientific string form, e.g. "123.45", "5E+3", "-0".
     */
    iERR to_string(std::string *p_str, decContext *context) const;

    /**
     * Data model equality: same sign, coefficient and exponent. 1.0 and 1.00
     * are not equal; 0d0 and -0d0 are not equal.
     */
    bool operator==(const IonDecimal &other) const;
    bool operator!=(const IonDecimal &other) const { return !(*this == other); }

private:
    bool              _is_negative;
    std::vector<BYTE> _magnitude;
    int64_t           _exponent;
};

/**
 * Initializes the context used when callers do not supply one.
 */
IONRAW_API_EXPORT void ion_decimal_default_context(decContext *context);

} // namespace ionraw

#endif /* IONRAW_DECIMAL_H_ */
