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

#ifndef IONRAW_READER_IMPL_H_
#define IONRAW_READER_IMPL_H_

#include <memory>
#include <optional>
#include <vector>

#include "ionraw/ion_reader.h"
#include "ionraw/ion_stream.h"

namespace ionraw {

typedef enum _ion_reader_binary_state
{
    S_BEFORE_TID       =  0,   // ready to classify the next item at this depth
    S_ON_VALUE         =  1,   // positioned on a value, body not yet consumed
    S_AFTER_END        =  2    // the current container (or the input) is exhausted
} BINARY_STATE;

#define ION_BINARY_NO_END  (-1)

/** One open container. _local_end is fixed when the container is stepped into.
 *
 */
typedef struct _ion_reader_binary_parent_state
{
    IonType  _type;
    POSITION _start;
    POSITION _local_end;
} BINARY_PARENT_STATE;

/**
 * Cursor over the Ion 1.0 binary encoding. The container stack is an explicit
 * array of frames bounded by max_container_depth.
 */
class IonRawBinaryReader : public IonRawReader {
public:
    static iERR open_buffer(std::unique_ptr<IonRawReader> *p_reader, const BYTE *buffer, SIZE buffer_length,
                            const IonReaderOptions *p_options);
    static iERR open_stream(std::unique_ptr<IonRawReader> *p_reader, std::unique_ptr<IonStream> stream,
                            const IonReaderOptions *p_options);

    IonVersion ion_version() const override { return _version; }
    iERR next(std::optional<StreamItem> *p_item) override;

    std::optional<IonType> ion_type() const override;
    bool is_null() const override;
    const std::vector<RawSymbolToken> &annotations() const override { return _annotations; }
    const RawSymbolToken *field_name() const override;
    SIZE depth() const override { return (SIZE)_parent_stack.size(); }

    iERR read_null(std::optional<IonType> *p_value) override;
    iERR read_bool(std::optional<bool> *p_value) override;
    iERR read_int64(std::optional<int64_t> *p_value) override;
    iERR read_float(std::optional<float> *p_value) override;
    iERR read_double(std::optional<double> *p_value) override;
    iERR read_decimal(std::optional<IonDecimal> *p_value) override;
    iERR read_timestamp(std::optional<IonTimestamp> *p_value) override;
    iERR read_symbol(std::optional<RawSymbolToken> *p_value) override;
    iERR read_string(std::optional<std::string> *p_value) override;
    iERR read_blob(std::optional<std::vector<BYTE> > *p_value) override;
    iERR read_clob(std::optional<std::vector<BYTE> > *p_value) override;

    iERR step_in() override;
    iERR step_out() override;

    /** Byte offset of the cursor in the input. */
    POSITION position() const { return _stream->position(); }

protected:
    iERR _view_bytes(IonType type, BOOL validate_utf8, BOOL *p_present, const BYTE **p_bytes, SIZE *p_length) override;

private:
    IonRawBinaryReader(std::unique_ptr<IonStream> stream, const IonReaderOptions &options);

    iERR _track(iERR err);
    iERR _next(std::optional<StreamItem> *p_item);
    iERR _read_field_name(POSITION local_end);
    iERR _read_type_desc(int td, POSITION local_end, BOOL in_wrapper);
    iERR _read_annotations(int td, POSITION local_end);
    iERR _read_version_marker(std::optional<StreamItem> *p_item);
    iERR _skip_nop_pad(int td, POSITION local_end);
    iERR _read_length(int ln, uint64_t *p_length);
    iERR _set_value_end(uint64_t length, POSITION local_end);
    iERR _skip_to(POSITION target);
    void _clear_value();

    /** Common entry to every typed read: *p_matches is TRUE when positioned on
     *  an unconsumed, non-null value of the given type.
     */
    iERR _begin_read(IonType type, BOOL *p_matches);
    iERR _fetch_value(const BYTE **p_bytes, SIZE *p_length);
    iERR _read_double_helper(double *p_value);

    POSITION _local_end() const {
        return _parent_stack.empty() ? ION_BINARY_NO_END : _parent_stack.back()._local_end;
    }
    bool _in_struct() const {
        return !_parent_stack.empty() && _parent_stack.back()._type == IonType::Struct;
    }

    std::unique_ptr<IonStream>        _stream;
    IonReaderOptions                  _options;
    decContext                        _decimal_context;

    iERR                              _fatal_error;
    BINARY_STATE                      _state;
    IonVersion                        _version;
    std::vector<BINARY_PARENT_STATE>  _parent_stack;

    // the current value
    int                               _value_tid;
    IonType                           _value_type;
    BOOL                              _value_is_null;
    BOOL                              _value_consumed;
    int                               _value_ln;
    POSITION                          _value_start;   // first byte of the body
    POSITION                          _value_end;     // first byte after the body
    RawSymbolToken                    _value_field_name;
    std::vector<RawSymbolToken>       _annotations;
};

} // namespace ionraw

#endif /* IONRAW_READER_IMPL_H_ */
