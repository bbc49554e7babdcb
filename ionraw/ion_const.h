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

//
// defines constants, such as binary type values and reader limits for Ion
//

#ifndef IONRAW_CONST_H_
#define IONRAW_CONST_H_

#include "ionraw/ion_types.h"
#include "ionraw/ion_debug.h"

#define DEFAULT_ANNOTATION_LIMIT         10
#define DEFAULT_READER_STACK_DEPTH       10
#define DEFAULT_USER_ALLOC_THRESHOLD     (16*1024*1024)
#define DEFAULT_PAGE_SIZE                (64*1024)

#define MIN_ANNOTATION_LIMIT              1
#define MIN_READER_STACK_DEPTH            1
#define MIN_USER_ALLOC_THRESHOLD         32
#define MIN_PAGE_SIZE                    32

#define TID_NONE      -2
#define TID_NULL       0
#define TID_BOOL       1
#define TID_POS_INT    2
#define TID_NEG_INT    3
#define TID_FLOAT      4
#define TID_DECIMAL    5
#define TID_TIMESTAMP  6
#define TID_SYMBOL     7
#define TID_STRING     8
#define TID_CLOB       9
#define TID_BLOB      10 /* 0xa */
#define TID_LIST      11 /* 0xb */
#define TID_SEXP      12 /* 0xc */
#define TID_STRUCT    13 /* 0xd */
#define TID_UTA       14 /* 0xe USER TYPE ANNOTATION */

#define ION_lnIsNull           0x0f
#define ION_lnBooleanTrue      0x01
#define ION_lnBooleanFalse     0x00
#define ION_lnNumericZero      0x00
#define ION_lnIsOrderedStruct  0x01
#define ION_lnIsVarLen         0x0e

#define ION_IVM_TD             0xe0
#define ION_IVM_END            0xea

#define ION_ANNOTATION_MIN_LEN 3

/**
 * Extract the type code (high nibble) from a type descriptor.
 *
 * @param td must be a positive int between 0x00 and 0xFF.
 *
 * @return the high nibble of the input byte, between 0x00 and 0x0F.
 */
#define getTypeCode(td)   (((td) >> 4) & 0xf)
#define getLowNibble(td)  ((td) & 0xf)

namespace ionraw {

inline constexpr BYTE ION_VERSION_MARKER[ION_VERSION_MARKER_LENGTH] = { 0xe0, 0x01, 0x00, 0xea };

}

// UTF-8 constants
#define ION_high_surrogate_value    0xD800
#define ION_low_surrogate_end       0xDFFF
#define ION_max_unicode_scalar      0x10FFFF

#define ION_utf8_1byte_max  0x7F
#define ION_utf8_2byte_max  0x7FF
#define ION_utf8_3byte_max  0xFFFF

#define ION_utf8_1byte_header       0
#define ION_utf8_1byte_mask         (ION_utf8_1byte_header | 0x80)
#define ION_utf8_2byte_header       0xc0
#define ION_utf8_2byte_mask         (ION_utf8_2byte_header | 0x20)
#define ION_utf8_3byte_header       0xe0
#define ION_utf8_3byte_mask         (ION_utf8_3byte_header | 0x10)
#define ION_utf8_4byte_header       0xf0
#define ION_utf8_4byte_mask         (ION_utf8_4byte_header | 0x08)

#define ION_utf8_trailing_header    0x80
#define ION_utf8_trailing_MASK      (ION_utf8_trailing_header | 0x40 )
#define ION_utf8_trailing_bits_mask 0x3f

#define ION_is_utf8_1byte_header(c) (((c) & ION_utf8_1byte_mask) == ION_utf8_1byte_header)
#define ION_is_utf8_2byte_header(c) (((c) & ION_utf8_2byte_mask) == ION_utf8_2byte_header)
#define ION_is_utf8_3byte_header(c) (((c) & ION_utf8_3byte_mask) == ION_utf8_3byte_header)
#define ION_is_utf8_4byte_header(c) (((c) & ION_utf8_4byte_mask) == ION_utf8_4byte_header)
#define ION_is_utf8_trailing_char_header(c) (((c) & ION_utf8_trailing_MASK) == ION_utf8_trailing_header)

#define ION_TIMESTAMP_MAX_OFFSET   1440 /* minutes in a day, exclusive */

#endif /* IONRAW_CONST_H_ */
