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

#include "ionraw/ion_errors.h"

namespace ionraw {

const char *ion_error_to_str(iERR err)
{
    switch (err) {
    case IERR_NOT_IMPL: return "IERR_NOT_IMPL";

    #define ERROR_CODE(name, val)  case name: return #name;
    #include "ionraw/ion_error_codes.h"

    default:
        return "unrecognized error code";
    }
}

ION_ERROR_KIND ion_error_kind(iERR err)
{
    switch (err) {
    case IERR_OK:
        return ION_ERROR_KIND_NONE;
    case IERR_INVALID_BINARY:
    case IERR_NUMERIC_OVERFLOW:
    case IERR_INVALID_UTF8:
    case IERR_INVALID_TIMESTAMP:
    case IERR_INVALID_ION_VERSION:
    case IERR_TOO_MANY_ANNOTATIONS:
    case IERR_CONTAINER_TOO_DEEP:
    case IERR_BUFFER_TOO_SMALL:
        return ION_ERROR_KIND_DECODING;
    case IERR_INVALID_STATE:
    case IERR_STACK_UNDERFLOW:
    case IERR_VALUE_CONSUMED:
        return ION_ERROR_KIND_STATE;
    case IERR_UNEXPECTED_EOF:
    case IERR_READ_ERROR:
        return ION_ERROR_KIND_SOURCE;
    default:
        return ION_ERROR_KIND_USAGE;
    }
}

bool ion_error_is_fatal(iERR err)
{
    ION_ERROR_KIND kind = ion_error_kind(err);
    return kind == ION_ERROR_KIND_DECODING || kind == ION_ERROR_KIND_SOURCE;
}

} // namespace ionraw
