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

#ifndef IONRAW_DEBUG_H_
#define IONRAW_DEBUG_H_

#include <stdio.h>
#include "ion_types.h"
#include "ion_platform_config.h"

//
// support routines for error handling
//

#ifdef DEBUG

    #define DEBUG_ERR(x)      fprintf(stderr,"\nERROR %d [%s] AT LINE %d IN %s\n" \
                                            , (int)(x), ::ionraw::ion_error_to_str(x) \
                                            , (int)__LINE__, __location_display_name__)
    #define DEBUG_ERRMSG(x,m) fprintf(stderr,"\nERROR %d [%s] WITH MESSAGE '%s' AT LINE %d IN %s\n" \
                                            , (int)(x), ::ionraw::ion_error_to_str(x) \
                                            , (const char *)(m) \
                                            , (int)__LINE__, __location_display_name__)
    #define BREAK             ::ionraw::ion_helper_breakpoint()
    #define ENTER(f,l,c)      ::ionraw::ion_helper_enter(f, l, c)
    #define RETURN(f,l,c,e)   return ::ionraw::ion_helper_return(f, l, c, e)
    #define __location_name__ __func__
    #define __location_display_name__ __func__
    #define FN_DEF            static long __count__ = 0; \
                              static const char *__file__ = __func__; \
                              int __line__ = __LINE__; \
                              long __temp__ = ENTER(__file__, __line__, __count__); \
                              (void)__temp__;
#else
    #define DEBUG_ERR(x)      /* nothing */
    #define DEBUG_ERRMSG(x,m) /* nothing */
    #define BREAK             /* nothing */
    #define ENTER(f,l,c)      /* nothing */
    #define RETURN(f,l,c,e)   return e
    #define FN_DEF            /* nothing */
#endif

#define iENTER             FN_DEF ::ionraw::iERR err = ::ionraw::IERR_OK
#define DONTFAILWITH(x)  { err = x; goto fail; }
#define FAILWITH(x)      { BREAK; DEBUG_ERR(x); err = x; goto fail; }
#define FAILWITHMSG(x,s) { BREAK; DEBUG_ERRMSG(x,s); err = x; goto fail; }
#define IONCHECK(x)      { err = x; if (err) goto fail; }
#define SUCCEED()        { err = ::ionraw::IERR_OK; goto fail; }
#define iRETURN            fail: RETURN(__location_name__, __line__, __count__++, err)

#define ION_VERSION_MARKER_LENGTH 4

namespace ionraw {

IONRAW_API_EXPORT BOOL ion_debug_has_tracing();
IONRAW_API_EXPORT void ion_debug_set_tracing(BOOL state);

IONRAW_API_EXPORT void ion_helper_breakpoint(void);
IONRAW_API_EXPORT long ion_helper_enter(const char *filename, int line_number, long count);
IONRAW_API_EXPORT iERR ion_helper_return(const char *filename, int line_number, long count, iERR err);

} // namespace ionraw

/**
 * Writes a trace line to stderr when tracing is switched on.
 */
#define ION_TRACE(...)   { if (::ionraw::ion_debug_has_tracing()) { fprintf(stderr, "[ionraw] " __VA_ARGS__); fputc('\n', stderr); } }

#endif /* IONRAW_DEBUG_H_ */
