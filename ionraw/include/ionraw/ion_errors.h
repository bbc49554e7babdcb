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

#ifndef IONRAW_ERRORS_H_
#define IONRAW_ERRORS_H_

#include "ion_platform_config.h"

namespace ionraw {

/** define the ionraw error code enumeration.
 *
 */
enum ion_error_code {
    IERR_NOT_IMPL = -1,

    #define ERROR_CODE(name, val)  name = val,
    #include "ion_error_codes.h"

    IERR_MAX_ERROR_CODE
};
// included in ion_error_codes.h: #undef ERROR_CODE

typedef enum ion_error_code iERR;

/**
 * Broad classes of failure. A cursor that reports a DECODING or SOURCE error
 * must be discarded.
 */
typedef enum {
    ION_ERROR_KIND_NONE     = 0,
    /** Malformed input. */
    ION_ERROR_KIND_DECODING = 1,
    /** The call is not valid in the cursor's current state. */
    ION_ERROR_KIND_STATE    = 2,
    /** The byte source failed or ended in the middle of a value. */
    ION_ERROR_KIND_SOURCE   = 3,
    /** Bad arguments or resource exhaustion. */
    ION_ERROR_KIND_USAGE    = 4
} ION_ERROR_KIND;

/**
 * Gets a static string representation of an error code.
 */
IONRAW_API_EXPORT const char *ion_error_to_str(iERR err);

/**
 * Classifies an error code.
 */
IONRAW_API_EXPORT ION_ERROR_KIND ion_error_kind(iERR err);

/**
 * TRUE if the error leaves a cursor unusable.
 */
IONRAW_API_EXPORT bool ion_error_is_fatal(iERR err);

} // namespace ionraw

#endif // IONRAW_ERRORS_H_
