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
#include "ion_test_util.h"

void ion_test_initialize_reader_options(IonReaderOptions *options) {
    memset(options, 0, sizeof(IonReaderOptions));
    options->max_container_depth = 100;
    options->max_annotation_count = 100;
}

iERR ion_test_new_reader(const BYTE *ion_data, SIZE buffer_length, std::unique_ptr<IonRawReader> *reader) {
    iENTER;
    IonReaderOptions options;

    ion_test_initialize_reader_options(&options);
    IONCHECK(ion_raw_reader_open_buffer(reader, ion_data, buffer_length, &options));

    iRETURN;
}

iERR ion_test_new_reader_after_ivm(const BYTE *ion_data, SIZE buffer_length, std::unique_ptr<IonRawReader> *reader) {
    iENTER;
    std::optional<StreamItem> item;

    IONCHECK(ion_test_new_reader(ion_data, buffer_length, reader));
    IONCHECK((*reader)->next(&item));
    if (!item || !item->is_version_marker()) FAILWITH(IERR_INVALID_STATE);

    iRETURN;
}

iERR ion_test_next_value(IonRawReader *reader, IonType expected_type) {
    iENTER;
    std::optional<StreamItem> item;

    IONCHECK(reader->next(&item));
    if (!item || !item->is_value() || item->type != expected_type) FAILWITH(IERR_INVALID_STATE);

    iRETURN;
}

static iERR _ion_test_read_scalar(IonRawReader *reader, IonType type) {
    iENTER;
    std::optional<bool>              bool_value;
    std::optional<int64_t>           int_value;
    std::optional<double>            double_value;
    std::optional<IonDecimal>        decimal_value;
    std::optional<IonTimestamp>      timestamp_value;
    std::optional<RawSymbolToken>    symbol_value;
    std::optional<std::string>       string_value;
    std::optional<std::vector<BYTE> > lob_value;

    switch (type) {
    case IonType::Bool:
        IONCHECK(reader->read_bool(&bool_value));
        break;
    case IonType::Int:
        err = reader->read_int64(&int_value);
        // big ints are well formed, just not representable here
        if (err == IERR_NUMERIC_OVERFLOW) err = IERR_OK;
        IONCHECK(err);
        break;
    case IonType::Float:
        IONCHECK(reader->read_double(&double_value));
        break;
    case IonType::Decimal:
        IONCHECK(reader->read_decimal(&decimal_value));
        break;
    case IonType::Timestamp:
        IONCHECK(reader->read_timestamp(&timestamp_value));
        break;
    case IonType::Symbol:
        IONCHECK(reader->read_symbol(&symbol_value));
        break;
    case IonType::String:
        IONCHECK(reader->read_string(&string_value));
        break;
    case IonType::Clob:
        IONCHECK(reader->read_clob(&lob_value));
        break;
    case IonType::Blob:
        IONCHECK(reader->read_blob(&lob_value));
        break;
    default:
        FAILWITH(IERR_INVALID_STATE);
    }

    iRETURN;
}

static iERR _ion_test_read_values(IonRawReader *reader, SIZE *p_count) {
    iENTER;
    std::optional<StreamItem> item;
    std::optional<IonType>    null_type;

    for (;;) {
        IONCHECK(reader->next(&item));
        if (!item) break;
        if (item->is_version_marker()) continue;

        (*p_count)++;
        if (item->is_null) {
            IONCHECK(reader->read_null(&null_type));
        }
        else if (ion_type_is_container(item->type)) {
            IONCHECK(reader->step_in());
            IONCHECK(_ion_test_read_values(reader, p_count));
            IONCHECK(reader->step_out());
        }
        else {
            IONCHECK(_ion_test_read_scalar(reader, item->type));
        }
    }

    iRETURN;
}

iERR ion_test_read_all_values(IonRawReader *reader, SIZE *p_count) {
    iENTER;
    SIZE count = 0;

    if (!reader || !p_count) FAILWITH(IERR_INVALID_ARG);
    err = _ion_test_read_values(reader, &count);
    *p_count = count;

    iRETURN;
}

iERR ion_test_input_stream_handler(IonUserStream *stream) {
    iENTER;
    _test_in_memory_paged_stream_context *context = (_test_in_memory_paged_stream_context *)stream->handler_state;
    context->number_of_handler_invocations++;
    if (!stream->curr) {
        stream->curr = context->data;
    }
    int32_t remaining = (int32_t)((context->data + context->data_len) - stream->curr);
    if (context->page_size < remaining) {
        stream->limit = stream->curr + context->page_size;
    }
    else {
        stream->limit = stream->curr + remaining;
    }
    iRETURN;
}

iERR ion_test_new_paged_input_stream(std::unique_ptr<IonStream> *p_stream, _test_in_memory_paged_stream_context *context) {
    iENTER;

    if (!p_stream || !context) FAILWITH(IERR_INVALID_ARG);
    IONCHECK(IonStream::open_handler_in(&ion_test_input_stream_handler, context, p_stream));

    iRETURN;
}
