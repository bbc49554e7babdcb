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

#include "ion_assert.h"
#include "ion_test_util.h"

#define ION_DECIMAL_ASSERT_STRING(expected, decimal) { \
    std::string actual_text; \
    ION_ASSERT_OK((decimal).to_string(&actual_text, NULL)); \
    ASSERT_EQ(std::string(expected), actual_text); \
}

TEST(IonDecimal, ToString) {
    ION_DECIMAL_ASSERT_STRING("123.45", IonDecimal::from_int64(12345, -2));
    ION_DECIMAL_ASSERT_STRING("-7E+3", IonDecimal::from_int64(-7, 3));
    ION_DECIMAL_ASSERT_STRING("0.001", IonDecimal::from_int64(1, -3));
    ION_DECIMAL_ASSERT_STRING("0", IonDecimal());
    ION_DECIMAL_ASSERT_STRING("-0", IonDecimal::from_magnitude(NULL, 0, true, 0));
}

TEST(IonDecimal, StripsLeadingZeroBytes) {
    IonDecimal decimal = IonDecimal::from_magnitude((const BYTE *)"\x00\x00\x05", 3, false, 0);
    assertBytesEqual("\x05", 1, decimal.coefficient_bytes().data(), (SIZE)decimal.coefficient_bytes().size());
    ASSERT_FALSE(decimal.is_zero());

    decimal = IonDecimal::from_magnitude((const BYTE *)"\x00\x00", 2, true, -1);
    ASSERT_TRUE(decimal.is_zero());
    ASSERT_TRUE(decimal.is_negative_zero());
    ASSERT_EQ(-1, decimal.exponent());
}

TEST(IonDecimal, CoefficientToInt64) {
    int64_t value;

    ION_ASSERT_OK(IonDecimal::from_int64(12345, -2).coefficient_to_int64(&value));
    ASSERT_EQ(12345, value);
    ION_ASSERT_OK(IonDecimal::from_int64(MIN_INT64, 0).coefficient_to_int64(&value));
    ASSERT_EQ(MIN_INT64, value);
    ION_ASSERT_OK(IonDecimal::from_int64(MAX_INT64, 0).coefficient_to_int64(&value));
    ASSERT_EQ(MAX_INT64, value);

    // 2 ** 64
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, IonDecimal::from_magnitude((const BYTE *)"\x01\x00\x00\x00\x00\x00\x00\x00\x00", 9, false, 0).coefficient_to_int64(&value));
    // 2 ** 63
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, IonDecimal::from_magnitude((const BYTE *)"\x80\x00\x00\x00\x00\x00\x00\x00", 8, false, 0).coefficient_to_int64(&value));
}

TEST(IonDecimal, EqualityIsDataModelEquality) {
    ASSERT_EQ(IonDecimal::from_int64(10, -1), IonDecimal::from_int64(10, -1));
    // 1.0 and 1.00
    ASSERT_NE(IonDecimal::from_int64(10, -1), IonDecimal::from_int64(100, -2));
    // 0d0 and -0d0
    ASSERT_NE(IonDecimal(), IonDecimal::from_magnitude(NULL, 0, true, 0));
    ASSERT_EQ(IonDecimal(), IonDecimal::from_int64(0, 0));
    ASSERT_NE(IonDecimal::from_int64(5, 0), IonDecimal::from_int64(-5, 0));
}

TEST(IonDecimal, Digits) {
    SIZE digits;

    ION_ASSERT_OK(IonDecimal().digits(NULL, &digits));
    ASSERT_EQ(1, digits);
    ION_ASSERT_OK(IonDecimal::from_int64(99999, 0).digits(NULL, &digits));
    ASSERT_EQ(5, digits);
    ION_ASSERT_OK(IonDecimal::from_int64(MAX_INT64, 0).digits(NULL, &digits));
    ASSERT_EQ(19, digits);
}

TEST(IonDecimal, ToNumber) {
    decNumber *number = NULL;
    decContext context;
    char text[64];

    ion_decimal_default_context(&context);
    ION_ASSERT_OK(IonDecimal::from_int64(-12345, -2).to_number(&context, &number));
    ASSERT_TRUE(decNumberIsNegative(number));
    ASSERT_EQ(-2, number->exponent);
    ASSERT_EQ(5, number->digits);
    decNumberToString(number, text);
    ASSERT_STREQ("-123.45", text);
    ion_decimal_free_number(number);
}

TEST(IonDecimal, ToNumberWidensPrecision) {
    IonDecNumberPtr number;
    decContext context;
    char text[64];

    // a context that holds 3 digits still receives every digit
    decContextDefault(&context, DEC_INIT_BASE);
    context.digits = 3;
    ION_ASSERT_OK(IonDecimal::from_int64(1234567, -3).to_number(&context, &number));
    decNumberToString(number.get(), text);
    ASSERT_STREQ("1234.567", text);
}

TEST(IonDecimal, ToNumberEnforcesExponentRange) {
    IonDecNumberPtr number;
    decContext context;

    ion_decimal_default_context(&context);
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, IonDecimal::from_int64(1, 7000).to_number(&context, &number));
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, IonDecimal::from_int64(1, -7000).to_number(&context, &number));
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, IonDecimal::from_int64(1, MAX_INT64).to_number(&context, &number));
    ASSERT_TRUE(number == nullptr);

    ION_ASSERT_OK(IonDecimal::from_int64(1, 6144).to_number(&context, &number));
    ASSERT_TRUE(number != nullptr);
}

TEST(IonDecimal, ToNumberUsesDefaultsWithoutContext) {
    IonDecNumberPtr number;

    ION_ASSERT_OK(IonDecimal::from_int64(42, 0).to_number(NULL, &number));
    ASSERT_EQ(2, number->digits);
    ASSERT_EQ(IERR_INVALID_ARG, IonDecimal().to_number(NULL, (decNumber **)NULL));
}
