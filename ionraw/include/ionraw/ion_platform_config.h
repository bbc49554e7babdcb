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

//
// ionraw internal header for platform configurations
//

#ifndef IONRAW_PLATFORM_CONFIG_H_
#define IONRAW_PLATFORM_CONFIG_H_

// OS Macros

#ifdef	_WIN32
#define IONRAW_PLATFORM_WINDOWS
#endif

#ifdef __CYGWIN__
#define IONRAW_PLATFORM_CYGWIN
#endif

// ionraw Public API Export
// NB - for gcc/clang -fvisibility=hidden should be used, otherwise, all symbols are exported
#if (defined(IONRAW_PLATFORM_WINDOWS) || defined(IONRAW_PLATFORM_CYGWIN)) && defined(_WINDLL)
#define IONRAW_API_EXPORT __declspec(dllexport)
#elif __GNUC__ >= 4
#define IONRAW_API_EXPORT __attribute__ ((visibility("default")))
#else
#define IONRAW_API_EXPORT
#endif

#endif
