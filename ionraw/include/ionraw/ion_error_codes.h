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


#ifdef ERROR_CODE

    ERROR_CODE( IERR_OK,                         0 )
    ERROR_CODE( IERR_INVALID_ARG,                2 )
    ERROR_CODE( IERR_NO_MEMORY,                  3 )

    /** Usually caused by invalid application calling sequence.
     * E.g. step_in when the current value is not a container.
     */
    ERROR_CODE( IERR_INVALID_STATE,              5 )
    ERROR_CODE( IERR_TOO_MANY_ANNOTATIONS,       6 )

    /** A value is larger than the reader's user_value_threshold.
     */
    ERROR_CODE( IERR_BUFFER_TOO_SMALL,           9 )
    ERROR_CODE( IERR_INVALID_TIMESTAMP,         10 )
    ERROR_CODE( IERR_INVALID_UTF8,              15 )

    /** The input ended inside a value (or inside a container).
     * A clean end of input between top level values is not an error.
     */
    ERROR_CODE( IERR_UNEXPECTED_EOF,            20 )

    /** step_out was called at the top level.
     */
    ERROR_CODE( IERR_STACK_UNDERFLOW,           25 )

    /** Corrupted binary data (does not conform to the Ion binary encoding). */
    ERROR_CODE( IERR_INVALID_BINARY,            34 )
    ERROR_CODE( IERR_NUMERIC_OVERFLOW,          36 )
    ERROR_CODE( IERR_INVALID_ION_VERSION,       37 )
    ERROR_CODE( IERR_READ_ERROR,                49 )
    ERROR_CODE( IERR_INTERNAL_ERROR,            50 )

    /** The current value has already been materialized by a read_* call.
     */
    ERROR_CODE( IERR_VALUE_CONSUMED,            54 )
    ERROR_CODE( IERR_CONTAINER_TOO_DEEP,        55 )


// if it was defined we undefine it now
#undef ERROR_CODE

#endif
