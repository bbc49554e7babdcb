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

/** @file */

/**
 * Public shared types for the ionraw implementation.
 * This includes typedef's for int sizes, the Ion type enumeration and
 * the items a cursor yields.
 */

#ifndef IONRAW_TYPES_H_
#define IONRAW_TYPES_H_

#include <stdint.h>
#include "ion_errors.h"
#include "ion_platform_config.h"

#ifndef TRUE
#define TRUE  1
#define FALSE 0
#endif

#ifndef MAX_INT64
#define MAX_INT64  0x7FFFFFFFFFFFFFFFLL
#define MIN_INT64  -0x7FFFFFFFFFFFFFFFLL-1
#define HIGH_BIT_INT64 (((uint64_t)(1)) << 63)
#endif

namespace ionraw {

typedef uint64_t            SID;
typedef int32_t             SIZE;
typedef uint8_t             BYTE;
typedef int                 BOOL;
typedef int64_t             POSITION;
#define MAX_SIZE            INT32_MAX

/**
 * The Ion data model types. The values line up with the ion-c tid_* constants
 * so that a type can be shifted down to its binary type code.
 * A value's nullness is reported separately.
 */
enum class IonType : int {
    Null      = 0x000,
    Bool      = 0x100,
    Int       = 0x200,
    Float     = 0x400,
    Decimal   = 0x500,
    Timestamp = 0x600,
    Symbol    = 0x700,
    String    = 0x800,
    Clob      = 0x900,
    Blob      = 0xA00,
    List      = 0xB00,
    SExp      = 0xC00,
    Struct    = 0xD00,
};

inline bool ion_type_is_container(IonType t) {
    return t == IonType::List || t == IonType::SExp || t == IonType::Struct;
}

IONRAW_API_EXPORT const char *ion_type_to_str(IonType t);

/**
 * The (major, minor) version declared by the most recent Ion version marker.
 */
struct IonVersion {
    uint8_t major;
    uint8_t minor;

    bool operator==(const IonVersion &other) const {
        return major == other.major && minor == other.minor;
    }
    bool operator!=(const IonVersion &other) const { return !(*this == other); }
};

/**
 * Raw stream components that a cursor may encounter: either an Ion version
 * marker or a value. Values that represent system constructs (e.g. a struct
 * annotated with $ion_symbol_table) are still values at this level.
 */
struct StreamItem {
    enum Kind {
        VERSION_MARKER,
        VALUE
    };

    Kind       kind;
    IonVersion version;   // VERSION_MARKER only
    IonType    type;      // VALUE only
    bool       is_null;   // VALUE only

    static StreamItem version_marker(uint8_t major, uint8_t minor) {
        return StreamItem { VERSION_MARKER, { major, minor }, IonType::Null, false };
    }

    static StreamItem value(IonType type, bool is_null) {
        return StreamItem { VALUE, { 0, 0 }, type, is_null };
    }

    bool is_version_marker() const { return kind == VERSION_MARKER; }
    bool is_value() const { return kind == VALUE; }

    bool operator==(const StreamItem &other) const {
        if (kind != other.kind) return false;
        if (kind == VERSION_MARKER) return version == other.version;
        return type == other.type && is_null == other.is_null;
    }
    bool operator!=(const StreamItem &other) const { return !(*this == other); }
};

} // namespace ionraw

#endif
