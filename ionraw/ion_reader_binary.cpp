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

#include <new>

#include "ion_const.h"
#include "ion_binary.h"
#include "ion_helpers.h"
#include "ion_reader_impl.h"

// like iRETURN, records fatal errors on the reader before returning them
#define iRETURN_TRACKED      fail: RETURN(__location_name__, __line__, __count__++, _track(err))

// typed reads: a well formed value that does not fit the requested
// representation (IERR_NUMERIC_OVERFLOW) leaves the reader usable
#define iRETURN_TRACKED_READ fail: RETURN(__location_name__, __line__, __count__++, \
                                          (err == IERR_NUMERIC_OVERFLOW) ? err : _track(err))

namespace ionraw {

IonRawBinaryReader::IonRawBinaryReader(std::unique_ptr<IonStream> stream, const IonReaderOptions &options)
    : _stream(std::move(stream))
    , _options(options)
    , _fatal_error(IERR_OK)
    , _state(S_BEFORE_TID)
    , _version({ 1, 0 })
{
    if (_options.decimal_context) {
        _decimal_context = *_options.decimal_context;
        _decimal_context.traps = 0;
    }
    else {
        ion_decimal_default_context(&_decimal_context);
    }
    _parent_stack.reserve((size_t)((_options.max_container_depth < DEFAULT_READER_STACK_DEPTH)
                                   ? _options.max_container_depth : DEFAULT_READER_STACK_DEPTH));
    _clear_value();
}

iERR IonRawBinaryReader::open_buffer(std::unique_ptr<IonRawReader> *p_reader, const BYTE *buffer, SIZE buffer_length,
                                     const IonReaderOptions *p_options)
{
    iENTER;
    std::unique_ptr<IonStream> stream;

    if (!p_reader) FAILWITH(IERR_INVALID_ARG);
    IONCHECK(IonStream::open_buffer(buffer, buffer_length, &stream));
    IONCHECK(open_stream(p_reader, std::move(stream), p_options));

    iRETURN;
}

iERR IonRawBinaryReader::open_stream(std::unique_ptr<IonRawReader> *p_reader, std::unique_ptr<IonStream> stream,
                                     const IonReaderOptions *p_options)
{
    iENTER;
    IonReaderOptions    options;
    IonRawBinaryReader *reader;

    if (!p_reader || !stream) FAILWITH(IERR_INVALID_ARG);
    IONCHECK(ion_reader_options_resolve(p_options, &options));

    reader = new (std::nothrow) IonRawBinaryReader(std::move(stream), options);
    if (!reader) FAILWITH(IERR_NO_MEMORY);
    p_reader->reset(reader);

    iRETURN;
}

iERR IonRawBinaryReader::_track(iERR err)
{
    if (err != IERR_OK && _fatal_error == IERR_OK && ion_error_is_fatal(err)) {
        ION_TRACE("fatal %s at position %lld depth %d", ion_error_to_str(err),
                  (long long)_stream->position(), (int)_parent_stack.size());
        _fatal_error = err;
        _clear_value();
        _state = S_AFTER_END;
    }
    return err;
}

void IonRawBinaryReader::_clear_value()
{
    _value_tid        = TID_NONE;
    _value_type       = IonType::Null;
    _value_is_null    = FALSE;
    _value_consumed   = FALSE;
    _value_ln         = 0;
    _value_start      = -1;
    _value_end        = -1;
    _value_field_name = RawSymbolToken();
    _annotations.clear();
}

std::optional<IonType> IonRawBinaryReader::ion_type() const
{
    if (_state != S_ON_VALUE) return std::nullopt;
    return _value_type;
}

bool IonRawBinaryReader::is_null() const
{
    return _state == S_ON_VALUE && _value_is_null;
}

const RawSymbolToken *IonRawBinaryReader::field_name() const
{
    if (_state != S_ON_VALUE || !_in_struct()) return NULL;
    return &_value_field_name;
}

iERR IonRawBinaryReader::next(std::optional<StreamItem> *p_item)
{
    iENTER;
    POSITION local_end;
    BOOL     is_eof;
    int      td;

    if (!p_item) FAILWITH(IERR_INVALID_ARG);
    p_item->reset();
    if (_fatal_error) DONTFAILWITH(_fatal_error);

    // the unread remainder of the current value
    if (_state == S_ON_VALUE) {
        IONCHECK(_skip_to(_value_end));
    }
    _clear_value();
    if (_state == S_AFTER_END && !_parent_stack.empty()) SUCCEED();

    local_end = _local_end();
    for (;;) {
        _state = S_BEFORE_TID;
        if (local_end != ION_BINARY_NO_END) {
            if (_stream->position() >= local_end) {
                _state = S_AFTER_END;
                SUCCEED();
            }
        }
        else {
            IONCHECK(_stream->is_eof(&is_eof));
            if (is_eof) {
                _state = S_AFTER_END;
                SUCCEED();
            }
        }

        if (_in_struct()) {
            IONCHECK(_read_field_name(local_end));
        }

        IONCHECK(_stream->read_byte(&td));
        if (td == ION_STREAM_EOF) FAILWITH(IERR_UNEXPECTED_EOF);

        if (td == ION_IVM_TD && _parent_stack.empty()) {
            IONCHECK(_read_version_marker(p_item));
            ION_TRACE("next: version marker %d.%d at %lld", _version.major, _version.minor,
                      (long long)_stream->position() - ION_VERSION_MARKER_LENGTH);
            break;
        }
        if (getTypeCode(td) == TID_NULL && getLowNibble(td) != ION_lnIsNull) {
            IONCHECK(_skip_nop_pad(td, local_end));
            continue;
        }
        if (getTypeCode(td) == TID_UTA) {
            IONCHECK(_read_annotations(td, local_end));
        }
        else {
            IONCHECK(_read_type_desc(td, local_end, FALSE));
        }

        _state = S_ON_VALUE;
        p_item->emplace(StreamItem::value(_value_type, _value_is_null != FALSE));
        ION_TRACE("next: %s%s length %lld at %lld depth %d", _value_is_null ? "null." : "",
                  ion_type_to_str(_value_type), (long long)(_value_end - _value_start),
                  (long long)_value_start, (int)_parent_stack.size());
        break;
    }

    iRETURN_TRACKED;
}

iERR IonRawBinaryReader::_read_field_name(POSITION local_end)
{
    iENTER;
    uint64_t field_sid;

    IONCHECK(ion_binary_read_var_uint_64(_stream.get(), &field_sid));
    if (_stream->position() >= local_end) {
        FAILWITHMSG(IERR_INVALID_BINARY, "field name is not followed by a value within its struct");
    }
    _value_field_name = RawSymbolToken::from_sid(field_sid);

    iRETURN;
}

iERR IonRawBinaryReader::_read_version_marker(std::optional<StreamItem> *p_item)
{
    iENTER;
    const BYTE *bytes;
    BYTE        major, minor;

    // the type descriptor has been read, the rest is major, minor, 0xEA
    IONCHECK(_stream->fetch(ION_VERSION_MARKER_LENGTH - 1, &bytes));
    if (bytes[2] != ION_IVM_END) {
        FAILWITHMSG(IERR_INVALID_BINARY, "0xE0 at the top level must start a version marker");
    }
    major = bytes[0];
    minor = bytes[1];
    IONCHECK(_stream->skip(ION_VERSION_MARKER_LENGTH - 1));

    if (major != ION_VERSION_MARKER[1] || minor != ION_VERSION_MARKER[2]) {
        FAILWITHMSG(IERR_INVALID_ION_VERSION, "only Ion 1.0 is supported");
    }
    _version.major = major;
    _version.minor = minor;
    p_item->emplace(StreamItem::version_marker(major, minor));

    iRETURN;
}

iERR IonRawBinaryReader::_read_length(int ln, uint64_t *p_length)
{
    iENTER;

    if (ln == ION_lnIsVarLen) {
        IONCHECK(ion_binary_read_var_uint_64(_stream.get(), p_length));
    }
    else {
        *p_length = (uint64_t)ln;
    }

    iRETURN;
}

iERR IonRawBinaryReader::_set_value_end(uint64_t length, POSITION local_end)
{
    iENTER;

    _value_start = _stream->position();
    if (length > (uint64_t)(MAX_INT64 - _value_start)) {
        FAILWITHMSG(IERR_NUMERIC_OVERFLOW, "value length does not fit in a stream position");
    }
    _value_end = _value_start + (POSITION)length;
    if (local_end != ION_BINARY_NO_END && _value_end > local_end) {
        FAILWITHMSG(IERR_INVALID_BINARY, "value extends past the end of its container");
    }

    iRETURN;
}

iERR IonRawBinaryReader::_skip_nop_pad(int td, POSITION local_end)
{
    iENTER;
    uint64_t length;

    IONCHECK(_read_length(getLowNibble(td), &length));
    IONCHECK(_set_value_end(length, local_end));
    IONCHECK(_skip_to(_value_end));
    _clear_value();

    iRETURN;
}

iERR IonRawBinaryReader::_read_type_desc(int td, POSITION local_end, BOOL in_wrapper)
{
    iENTER;
    int      tid = getTypeCode(td);
    int      ln  = getLowNibble(td);
    uint64_t length = 0;

    if (tid == TID_UTA && in_wrapper) {
        FAILWITHMSG(IERR_INVALID_BINARY, "an annotation wrapper may not wrap another annotation wrapper");
    }
    if (tid == TID_NULL && ln != ION_lnIsNull) {
        FAILWITHMSG(IERR_INVALID_BINARY, "an annotation wrapper may not wrap padding");
    }
    IONCHECK(ion_helper_get_iontype_from_tid(tid, &_value_type));
    _value_tid     = tid;
    _value_ln      = ln;
    _value_is_null = (ln == ION_lnIsNull);

    if (!_value_is_null) {
        switch (tid) {
        case TID_BOOL:
            if (ln != ION_lnBooleanTrue && ln != ION_lnBooleanFalse) {
                FAILWITHMSG(IERR_INVALID_BINARY, "invalid bool length");
            }
            break;
        case TID_NEG_INT:
            if (ln == ION_lnNumericZero) {
                FAILWITHMSG(IERR_INVALID_BINARY, "negative zero int");
            }
            IONCHECK(_read_length(ln, &length));
            break;
        case TID_FLOAT:
            if (ln != 0 && ln != 4 && ln != 8) {
                FAILWITHMSG(IERR_INVALID_BINARY, "float length must be 0, 4 or 8");
            }
            length = (uint64_t)ln;
            break;
        case TID_STRUCT:
            if (ln == ION_lnIsOrderedStruct) {
                IONCHECK(ion_binary_read_var_uint_64(_stream.get(), &length));
                if (length == 0) {
                    FAILWITHMSG(IERR_INVALID_BINARY, "sorted struct must not be empty");
                }
                break;
            }
            IONCHECK(_read_length(ln, &length));
            break;
        default:
            IONCHECK(_read_length(ln, &length));
            break;
        }
    }
    IONCHECK(_set_value_end(length, local_end));

    iRETURN;
}

iERR IonRawBinaryReader::_read_annotations(int td, POSITION local_end)
{
    iENTER;
    uint64_t length, annotation_length, sid;
    POSITION wrapper_end, annotations_end, position;
    int      ln = getLowNibble(td);
    int      inner_td;

    if (ln < ION_ANNOTATION_MIN_LEN || ln == ION_lnIsNull) {
        FAILWITHMSG(IERR_INVALID_BINARY, "invalid annotation wrapper length");
    }
    IONCHECK(_read_length(ln, &length));
    IONCHECK(_set_value_end(length, local_end));
    wrapper_end = _value_end;

    IONCHECK(ion_binary_read_var_uint_64(_stream.get(), &annotation_length));
    if (annotation_length == 0) {
        FAILWITHMSG(IERR_INVALID_BINARY, "annotation wrapper has no annotations");
    }
    position = _stream->position();
    if (position >= wrapper_end || annotation_length >= (uint64_t)(wrapper_end - position)) {
        FAILWITHMSG(IERR_INVALID_BINARY, "annotations leave no room for the annotated value");
    }
    annotations_end = position + (POSITION)annotation_length;

    while (_stream->position() < annotations_end) {
        IONCHECK(ion_binary_read_var_uint_64(_stream.get(), &sid));
        if ((SIZE)_annotations.size() >= _options.max_annotation_count) {
            FAILWITH(IERR_TOO_MANY_ANNOTATIONS);
        }
        _annotations.push_back(RawSymbolToken::from_sid(sid));
    }
    if (_stream->position() != annotations_end) {
        FAILWITHMSG(IERR_INVALID_BINARY, "annotation symbol runs past the annotation list");
    }

    IONCHECK(_stream->read_byte(&inner_td));
    if (inner_td == ION_STREAM_EOF) FAILWITH(IERR_UNEXPECTED_EOF);
    IONCHECK(_read_type_desc(inner_td, wrapper_end, TRUE));
    if (_value_end != wrapper_end) {
        FAILWITHMSG(IERR_INVALID_BINARY, "annotated value does not fill its annotation wrapper");
    }

    iRETURN;
}

iERR IonRawBinaryReader::_skip_to(POSITION target)
{
    iENTER;
    POSITION position = _stream->position();

    if (target > position) {
        IONCHECK(_stream->skip(target - position));
    }

    iRETURN;
}

iERR IonRawBinaryReader::step_in()
{
    iENTER;
    BINARY_PARENT_STATE frame;

    if (_fatal_error) DONTFAILWITH(_fatal_error);
    if (_state != S_ON_VALUE || !ion_type_is_container(_value_type) || _value_is_null) {
        FAILWITHMSG(IERR_INVALID_STATE, "step_in requires a non-null container");
    }
    if ((SIZE)_parent_stack.size() >= _options.max_container_depth) {
        FAILWITH(IERR_CONTAINER_TOO_DEEP);
    }

    frame._type      = _value_type;
    frame._start     = _value_start;
    frame._local_end = _value_end;
    _parent_stack.push_back(frame);

    _clear_value();
    _state = S_BEFORE_TID;
    ION_TRACE("step_in: %s to depth %d", ion_type_to_str(frame._type), (int)_parent_stack.size());

    iRETURN_TRACKED;
}

iERR IonRawBinaryReader::step_out()
{
    iENTER;
    BINARY_PARENT_STATE frame;

    if (_fatal_error) DONTFAILWITH(_fatal_error);
    if (_parent_stack.empty()) {
        FAILWITHMSG(IERR_STACK_UNDERFLOW, "step_out at the top level");
    }

    frame = _parent_stack.back();
    _parent_stack.pop_back();
    _clear_value();
    _state = S_BEFORE_TID;
    IONCHECK(_skip_to(frame._local_end));
    ION_TRACE("step_out: %s to depth %d", ion_type_to_str(frame._type), (int)_parent_stack.size());

    iRETURN_TRACKED;
}

iERR IonRawBinaryReader::_begin_read(IonType type, BOOL *p_matches)
{
    iENTER;

    *p_matches = FALSE;
    if (_fatal_error) DONTFAILWITH(_fatal_error);
    if (_state != S_ON_VALUE) {
        FAILWITHMSG(IERR_INVALID_STATE, "not positioned on a value");
    }
    if (_value_type != type || _value_is_null) SUCCEED();
    if (_value_consumed) {
        FAILWITH(IERR_VALUE_CONSUMED);
    }
    *p_matches = TRUE;

    iRETURN;
}

iERR IonRawBinaryReader::_fetch_value(const BYTE **p_bytes, SIZE *p_length)
{
    iENTER;
    POSITION length = _value_end - _value_start;

    if (length > _options.user_value_threshold) {
        FAILWITHMSG(IERR_BUFFER_TOO_SMALL, "value is larger than user_value_threshold");
    }
    IONCHECK(_stream->fetch((SIZE)length, p_bytes));
    *p_length = (SIZE)length;

    iRETURN;
}

iERR IonRawBinaryReader::read_null(std::optional<IonType> *p_value)
{
    iENTER;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    if (_fatal_error) DONTFAILWITH(_fatal_error);
    if (_state != S_ON_VALUE) {
        FAILWITHMSG(IERR_INVALID_STATE, "not positioned on a value");
    }
    if (_value_is_null) {
        p_value->emplace(_value_type);
    }

    iRETURN;
}

iERR IonRawBinaryReader::read_bool(std::optional<bool> *p_value)
{
    iENTER;
    BOOL matches;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_begin_read(IonType::Bool, &matches));
    if (!matches) SUCCEED();

    p_value->emplace(_value_ln == ION_lnBooleanTrue);
    _value_consumed = TRUE;

    iRETURN_TRACKED_READ;
}

iERR IonRawBinaryReader::read_int64(std::optional<int64_t> *p_value)
{
    iENTER;
    BOOL        matches;
    const BYTE *bytes;
    SIZE        length;
    uint64_t    magnitude;
    int64_t     value;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_begin_read(IonType::Int, &matches));
    if (!matches) SUCCEED();

    IONCHECK(_fetch_value(&bytes, &length));
    IONCHECK(ion_binary_decode_uint_64(bytes, length, &magnitude));
    if (magnitude == 0 && _value_tid == TID_NEG_INT) {
        FAILWITHMSG(IERR_INVALID_BINARY, "negative zero int");
    }
    IONCHECK(cast_to_int64(magnitude, _value_tid == TID_NEG_INT, &value));

    p_value->emplace(value);
    _value_consumed = TRUE;

    iRETURN_TRACKED_READ;
}

iERR IonRawBinaryReader::_read_double_helper(double *p_value)
{
    iENTER;
    const BYTE *bytes;
    SIZE        length;

    IONCHECK(_fetch_value(&bytes, &length));
    IONCHECK(ion_binary_decode_double(bytes, length, p_value));

    iRETURN;
}

iERR IonRawBinaryReader::read_float(std::optional<float> *p_value)
{
    iENTER;
    BOOL   matches;
    double value;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_begin_read(IonType::Float, &matches));
    if (!matches) SUCCEED();

    IONCHECK(_read_double_helper(&value));
    p_value->emplace((float)value);
    _value_consumed = TRUE;

    iRETURN_TRACKED_READ;
}

iERR IonRawBinaryReader::read_double(std::optional<double> *p_value)
{
    iENTER;
    BOOL   matches;
    double value;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_begin_read(IonType::Float, &matches));
    if (!matches) SUCCEED();

    IONCHECK(_read_double_helper(&value));
    p_value->emplace(value);
    _value_consumed = TRUE;

    iRETURN_TRACKED_READ;
}

iERR IonRawBinaryReader::read_decimal(std::optional<IonDecimal> *p_value)
{
    iENTER;
    BOOL            matches;
    const BYTE     *bytes;
    SIZE            length;
    IonDecimal      value;
    IonDecNumberPtr number;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_begin_read(IonType::Decimal, &matches));
    if (!matches) SUCCEED();

    IONCHECK(_fetch_value(&bytes, &length));
    IONCHECK(ion_binary_decode_decimal(bytes, length, &value));
    // must be representable under the reader's decimal context
    IONCHECK(value.to_number(&_decimal_context, &number));

    p_value->emplace(value);
    _value_consumed = TRUE;

    iRETURN_TRACKED_READ;
}

iERR IonRawBinaryReader::read_timestamp(std::optional<IonTimestamp> *p_value)
{
    iENTER;
    BOOL         matches;
    POSITION     length;
    IonTimestamp value;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_begin_read(IonType::Timestamp, &matches));
    if (!matches) SUCCEED();

    length = _value_end - _value_start;
    if (length > _options.user_value_threshold) {
        FAILWITHMSG(IERR_BUFFER_TOO_SMALL, "value is larger than user_value_threshold");
    }
    IONCHECK(ion_binary_read_timestamp(_stream.get(), (SIZE)length, &_decimal_context, &value));

    p_value->emplace(value);
    _value_consumed = TRUE;

    iRETURN_TRACKED_READ;
}

iERR IonRawBinaryReader::read_symbol(std::optional<RawSymbolToken> *p_value)
{
    iENTER;
    BOOL        matches;
    const BYTE *bytes;
    SIZE        length;
    uint64_t    sid;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_begin_read(IonType::Symbol, &matches));
    if (!matches) SUCCEED();

    IONCHECK(_fetch_value(&bytes, &length));
    IONCHECK(ion_binary_decode_uint_64(bytes, length, &sid));

    p_value->emplace(RawSymbolToken::from_sid(sid));
    _value_consumed = TRUE;

    iRETURN_TRACKED_READ;
}

iERR IonRawBinaryReader::_view_bytes(IonType type, BOOL validate_utf8, BOOL *p_present,
                                     const BYTE **p_bytes, SIZE *p_length)
{
    iENTER;
    BOOL matches;

    *p_present = FALSE;
    IONCHECK(_begin_read(type, &matches));
    if (!matches) SUCCEED();

    IONCHECK(_fetch_value(p_bytes, p_length));
    if (validate_utf8 && !_options.skip_character_validation) {
        IONCHECK(ion_utf8_validate(*p_bytes, *p_length));
    }
    _value_consumed = TRUE;
    *p_present = TRUE;

    iRETURN_TRACKED_READ;
}

iERR IonRawBinaryReader::read_string(std::optional<std::string> *p_value)
{
    iENTER;
    BOOL        present;
    const BYTE *bytes;
    SIZE        length;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_view_bytes(IonType::String, TRUE, &present, &bytes, &length));
    if (present) {
        p_value->emplace((const char *)bytes, (size_t)length);
    }

    iRETURN;
}

iERR IonRawBinaryReader::read_blob(std::optional<std::vector<BYTE> > *p_value)
{
    iENTER;
    BOOL        present;
    const BYTE *bytes;
    SIZE        length;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_view_bytes(IonType::Blob, FALSE, &present, &bytes, &length));
    if (present) {
        p_value->emplace(bytes, bytes + length);
    }

    iRETURN;
}

iERR IonRawBinaryReader::read_clob(std::optional<std::vector<BYTE> > *p_value)
{
    iENTER;
    BOOL        present;
    const BYTE *bytes;
    SIZE        length;

    if (!p_value) FAILWITH(IERR_INVALID_ARG);
    p_value->reset();
    IONCHECK(_view_bytes(IonType::Clob, FALSE, &present, &bytes, &length));
    if (present) {
        p_value->emplace(bytes, bytes + length);
    }

    iRETURN;
}

} // namespace ionraw
