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

#include "ion_const.h"
#include "ion_helpers.h"

namespace ionraw {

iERR ion_helper_get_iontype_from_tid(int tid, IonType *p_type)
{
    iENTER;

    switch (tid) {
    case TID_NULL:      *p_type = IonType::Null;      break;
    case TID_BOOL:      *p_type = IonType::Bool;      break;
    case TID_POS_INT:
    case TID_NEG_INT:   *p_type = IonType::Int;       break;
    case TID_FLOAT:     *p_type = IonType::Float;     break;
    case TID_DECIMAL:   *p_type = IonType::Decimal;   break;
    case TID_TIMESTAMP: *p_type = IonType::Timestamp; break;
    case TID_SYMBOL:    *p_type = IonType::Symbol;    break;
    case TID_STRING:    *p_type = IonType::String;    break;
    case TID_CLOB:      *p_type = IonType::Clob;      break;
    case TID_BLOB:      *p_type = IonType::Blob;      break;
    case TID_LIST:      *p_type = IonType::List;      break;
    case TID_SEXP:      *p_type = IonType::SExp;      break;
    case TID_STRUCT:    *p_type = IonType::Struct;    break;
    default:
        FAILWITHMSG(IERR_INVALID_BINARY, "type code is not a value type");
    }

    iRETURN;
}

const char *ion_type_to_str(IonType t)
{
    switch (t) {
    case IonType::Null:      return "null";
    case IonType::Bool:      return "bool";
    case IonType::Int:       return "int";
    case IonType::Float:     return "float";
    case IonType::Decimal:   return "decimal";
    case IonType::Timestamp: return "timestamp";
    case IonType::Symbol:    return "symbol";
    case IonType::String:    return "string";
    case IonType::Clob:      return "clob";
    case IonType::Blob:      return "blob";
    case IonType::List:      return "list";
    case IonType::SExp:      return "sexp";
    case IonType::Struct:    return "struct";
    default:                 return "unrecognized type";
    }
}

BOOL ion_isSurrogate(int32_t c)
{
    return (c >= ION_high_surrogate_value && c <= ION_low_surrogate_end);
}

iERR ion_utf8_validate(const BYTE *bytes, SIZE len)
{
    iENTER;
    const BYTE *cp    = bytes;
    const BYTE *limit = bytes + len;
    int32_t     c, min;
    int         trailing, b;

    while (cp < limit) {
        b = *cp++;
        if (ION_is_utf8_1byte_header(b)) {
            continue;
        }
        if (ION_is_utf8_2byte_header(b)) {
            c = b & 0x1f;
            trailing = 1;
            min = ION_utf8_1byte_max + 1;
        }
        else if (ION_is_utf8_3byte_header(b)) {
            c = b & 0x0f;
            trailing = 2;
            min = ION_utf8_2byte_max + 1;
        }
        else if (ION_is_utf8_4byte_header(b)) {
            c = b & 0x07;
            trailing = 3;
            min = ION_utf8_3byte_max + 1;
        }
        else {
            FAILWITHMSG(IERR_INVALID_UTF8, "invalid UTF-8 lead byte");
        }
        if (limit - cp < trailing) {
            FAILWITHMSG(IERR_INVALID_UTF8, "truncated UTF-8 sequence");
        }
        for (; trailing > 0; trailing--) {
            b = *cp++;
            if (!ION_is_utf8_trailing_char_header(b)) {
                FAILWITHMSG(IERR_INVALID_UTF8, "invalid UTF-8 continuation byte");
            }
            c = (c << 6) | (b & ION_utf8_trailing_bits_mask);
        }
        if (c < min) {
            FAILWITHMSG(IERR_INVALID_UTF8, "overlong UTF-8 sequence");
        }
        if (c > ION_max_unicode_scalar || ion_isSurrogate(c)) {
            FAILWITHMSG(IERR_INVALID_UTF8, "UTF-8 sequence is not a unicode scalar value");
        }
    }

    iRETURN;
}

uint64_t abs_int64(int64_t value)
{
    // unsigned negation also covers MIN_INT64
    return (value < 0) ? (0 - (uint64_t)value) : (uint64_t)value;
}

iERR cast_to_int64(uint64_t unsignedInt64Value, BOOL is_negative, int64_t* int64Ptr)
{
    iENTER;

    if (is_negative) {
        if (unsignedInt64Value > HIGH_BIT_INT64) {
            FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "value is too small to fit in an int64");
        }
        *int64Ptr = (unsignedInt64Value == HIGH_BIT_INT64) ? MIN_INT64 : -(int64_t)unsignedInt64Value;
    }
    else {
        if (unsignedInt64Value > MAX_INT64) {
            FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "value is too large to fit in an int64");
        }
        *int64Ptr = (int64_t)unsignedInt64Value;
    }

    iRETURN;
}

} // namespace ionraw
