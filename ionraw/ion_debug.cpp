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

#include "ionraw/ion_debug.h"

namespace ionraw {

static BOOL g_ion_debug_tracing = FALSE;

BOOL ion_debug_has_tracing()
{
    return g_ion_debug_tracing;
}

void ion_debug_set_tracing(BOOL state)
{
    g_ion_debug_tracing = state;
}

// a place to set a debugger breakpoint on every FAILWITH
void ion_helper_breakpoint(void)
{
    return;
}

long ion_helper_enter(const char *filename, int line_number, long count)
{
    if (g_ion_debug_tracing) {
        fprintf(stderr, "[ionraw] ENTER %s:%d #%ld\n", filename, line_number, count);
    }
    return count;
}

iERR ion_helper_return(const char *filename, int line_number, long count, iERR err)
{
    if (g_ion_debug_tracing && err != IERR_OK) {
        fprintf(stderr, "[ionraw] RETURN %s:%d #%ld %s\n", filename, line_number, count, ion_error_to_str(err));
    }
    return err;
}

} // namespace ionraw
