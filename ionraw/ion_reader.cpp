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

#include <string.h>

#include "ionraw/ion_reader.h"
#include "ion_const.h"
#include "ion_reader_impl.h"

namespace ionraw {

iERR ion_reader_options_resolve(const IonReaderOptions *p_options, IonReaderOptions *p_resolved)
{
    iENTER;
    IonReaderOptions options;

    if (!p_resolved) FAILWITH(IERR_INVALID_ARG);

    memset(&options, 0, sizeof(options));
    if (p_options) {
        options = *p_options;
    }

    if (options.max_container_depth == 0) {
        options.max_container_depth = DEFAULT_READER_STACK_DEPTH;
    }
    else if (options.max_container_depth < MIN_READER_STACK_DEPTH) {
        FAILWITHMSG(IERR_INVALID_ARG, "max_container_depth must be at least 1");
    }

    if (options.max_annotation_count == 0) {
        options.max_annotation_count = DEFAULT_ANNOTATION_LIMIT;
    }
    else if (options.max_annotation_count < MIN_ANNOTATION_LIMIT) {
        FAILWITHMSG(IERR_INVALID_ARG, "max_annotation_count must be at least 1");
    }

    if (options.user_value_threshold == 0) {
        options.user_value_threshold = DEFAULT_USER_ALLOC_THRESHOLD;
    }
    else if (options.user_value_threshold < MIN_USER_ALLOC_THRESHOLD) {
        FAILWITHMSG(IERR_INVALID_ARG, "user_value_threshold must be at least 32");
    }

    if (options.page_size == 0) {
        options.page_size = DEFAULT_PAGE_SIZE;
    }
    else if (options.page_size < MIN_PAGE_SIZE) {
        FAILWITHMSG(IERR_INVALID_ARG, "page_size must be at least 32");
    }

    *p_resolved = options;

    iRETURN;
}

iERR ion_raw_reader_open_buffer(std::unique_ptr<IonRawReader> *p_reader,
        const BYTE *buffer, SIZE buffer_length, const IonReaderOptions *p_options)
{
    return IonRawBinaryReader::open_buffer(p_reader, buffer, buffer_length, p_options);
}

iERR ion_raw_reader_open_stream(std::unique_ptr<IonRawReader> *p_reader,
        std::unique_ptr<IonStream> stream, const IonReaderOptions *p_options)
{
    return IonRawBinaryReader::open_stream(p_reader, std::move(stream), p_options);
}

iERR ion_raw_reader_open_file(std::unique_ptr<IonRawReader> *p_reader,
        FILE *fp, const IonReaderOptions *p_options)
{
    iENTER;
    IonReaderOptions           options;
    std::unique_ptr<IonStream> stream;

    if (!p_reader || !fp) FAILWITH(IERR_INVALID_ARG);
    IONCHECK(ion_reader_options_resolve(p_options, &options));
    IONCHECK(IonStream::open_file_in(fp, options.page_size, &stream));
    IONCHECK(IonRawBinaryReader::open_stream(p_reader, std::move(stream), &options));

    iRETURN;
}

} // namespace ionraw
