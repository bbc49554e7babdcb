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

#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <new>

#include "ionraw/ion_stream.h"
#include "ionraw/ion_debug.h"

namespace ionraw {

IonStream::IonStream(Source source, SIZE page_size)
    : _source(source)
    , _page_size(page_size)
    , _fp(NULL)
    , _fd(-1)
    , _data(NULL)
    , _curr(NULL)
    , _limit(NULL)
    , _offset(0)
    , _at_eof(false)
{
    _user_stream.curr = NULL;
    _user_stream.limit = NULL;
    _user_stream.handler_state = NULL;
    _user_stream.handler = NULL;
}

iERR IonStream::open_buffer(const BYTE *buffer, SIZE length, std::unique_ptr<IonStream> *p_stream)
{
    iENTER;
    IonStream *stream;

    if (!p_stream || length < 0 || (!buffer && length > 0)) FAILWITH(IERR_INVALID_ARG);

    stream = new (std::nothrow) IonStream(SOURCE_BUFFER, 0);
    if (!stream) FAILWITH(IERR_NO_MEMORY);
    stream->_data  = buffer;
    stream->_curr  = buffer;
    stream->_limit = buffer + length;
    // a buffer is never refilled
    stream->_at_eof = true;
    p_stream->reset(stream);

    iRETURN;
}

iERR IonStream::open_file_in(FILE *fp, SIZE page_size, std::unique_ptr<IonStream> *p_stream)
{
    iENTER;
    IonStream *stream;

    if (!p_stream || !fp || page_size <= 0) FAILWITH(IERR_INVALID_ARG);

    stream = new (std::nothrow) IonStream(SOURCE_FILE, page_size);
    if (!stream) FAILWITH(IERR_NO_MEMORY);
    stream->_fp = fp;
    p_stream->reset(stream);

    iRETURN;
}

iERR IonStream::open_fd_in(int fd, SIZE page_size, std::unique_ptr<IonStream> *p_stream)
{
    iENTER;
    IonStream *stream;

    if (!p_stream || fd < 0 || page_size <= 0) FAILWITH(IERR_INVALID_ARG);

    stream = new (std::nothrow) IonStream(SOURCE_FD, page_size);
    if (!stream) FAILWITH(IERR_NO_MEMORY);
    stream->_fd = fd;
    p_stream->reset(stream);

    iRETURN;
}

iERR IonStream::open_handler_in(ION_STREAM_HANDLER handler, void *handler_state, std::unique_ptr<IonStream> *p_stream)
{
    iENTER;
    IonStream *stream;

    if (!p_stream || !handler) FAILWITH(IERR_INVALID_ARG);

    stream = new (std::nothrow) IonStream(SOURCE_HANDLER, ION_STREAM_DEFAULT_PAGE_SIZE);
    if (!stream) FAILWITH(IERR_NO_MEMORY);
    stream->_user_stream.handler = handler;
    stream->_user_stream.handler_state = handler_state;
    p_stream->reset(stream);

    iRETURN;
}

iERR IonStream::read_byte(int *p_byte)
{
    iENTER;

    if (!p_byte) FAILWITH(IERR_INVALID_ARG);
    if (_curr >= _limit) {
        IONCHECK(_fill(1));
        if (_curr >= _limit) {
            *p_byte = ION_STREAM_EOF;
            SUCCEED();
        }
    }
    *p_byte = *_curr++;

    iRETURN;
}

iERR IonStream::peek_byte(int *p_byte)
{
    iENTER;

    if (!p_byte) FAILWITH(IERR_INVALID_ARG);
    if (_curr >= _limit) {
        IONCHECK(_fill(1));
        if (_curr >= _limit) {
            *p_byte = ION_STREAM_EOF;
            SUCCEED();
        }
    }
    *p_byte = *_curr;

    iRETURN;
}

iERR IonStream::read(BYTE *dst, SIZE length, SIZE *p_bytes_read)
{
    iENTER;
    SIZE copied = 0, available;

    if (!p_bytes_read || length < 0 || (!dst && length > 0)) FAILWITH(IERR_INVALID_ARG);

    while (copied < length) {
        if (_curr >= _limit) {
            IONCHECK(_fill(1));
            if (_curr >= _limit) break;
        }
        available = (SIZE)(_limit - _curr);
        if (available > length - copied) available = length - copied;
        memcpy(dst + copied, _curr, available);
        _curr  += available;
        copied += available;
    }
    *p_bytes_read = copied;

    iRETURN;
}

iERR IonStream::skip(POSITION distance)
{
    iENTER;
    POSITION available;

    if (distance < 0) FAILWITH(IERR_INVALID_ARG);

    while (distance > 0) {
        if (_curr >= _limit) {
            IONCHECK(_fill(1));
            if (_curr >= _limit) FAILWITH(IERR_UNEXPECTED_EOF);
        }
        available = _limit - _curr;
        if (available > distance) available = distance;
        _curr    += available;
        distance -= available;
    }

    iRETURN;
}

iERR IonStream::fetch(SIZE length, const BYTE **p_bytes)
{
    iENTER;

    if (!p_bytes || length < 0) FAILWITH(IERR_INVALID_ARG);

    if (_limit - _curr < length) {
        IONCHECK(_fill(length));
        if (_limit - _curr < length) FAILWITH(IERR_UNEXPECTED_EOF);
    }
    *p_bytes = _curr;

    iRETURN;
}

iERR IonStream::is_eof(BOOL *p_is_eof)
{
    iENTER;

    if (!p_is_eof) FAILWITH(IERR_INVALID_ARG);
    if (_curr >= _limit) {
        IONCHECK(_fill(1));
    }
    *p_is_eof = (_curr >= _limit);

    iRETURN;
}

// moves the unread bytes to the front of the page buffer, then reads pages
// until wanted bytes are buffered or the source is exhausted
iERR IonStream::_fill(SIZE wanted)
{
    iENTER;
    SIZE    available, bytes_read;
    int64_t needed;

    if (_source == SOURCE_BUFFER) SUCCEED();

    available = (SIZE)(_limit - _curr);
    if (_curr != _data) {
        if (available > 0) memmove(_buffer.data(), _curr, available);
        _offset += (_curr - _data);
        _data  = _buffer.data();
        _curr  = _data;
        _limit = _data + available;
    }

    while (available < wanted && !_at_eof) {
        needed = (int64_t)available + ((wanted - available > _page_size) ? (wanted - available) : _page_size);
        if (needed > MAX_SIZE) needed = MAX_SIZE;
        if ((int64_t)_buffer.size() < needed) {
            _buffer.resize((size_t)needed);
            _data  = _buffer.data();
            _curr  = _data;
            _limit = _data + available;
        }
        IONCHECK(_read_page(_buffer.data() + available, (SIZE)_buffer.size() - available, &bytes_read));
        if (bytes_read == 0) {
            _at_eof = true;
        }
        available += bytes_read;
        _limit = _data + available;
    }

    iRETURN;
}

iERR IonStream::_read_page(BYTE *dst, SIZE capacity, SIZE *p_bytes_read)
{
    iENTER;
    size_t  file_read;
    ssize_t fd_read;
    SIZE    user_available;

    *p_bytes_read = 0;

    switch (_source) {
    case SOURCE_FILE:
        file_read = fread(dst, 1, (size_t)capacity, _fp);
        if (file_read == 0 && ferror(_fp)) {
            FAILWITHMSG(IERR_READ_ERROR, "fread failed");
        }
        *p_bytes_read = (SIZE)file_read;
        break;
    case SOURCE_FD:
        do {
            fd_read = ::read(_fd, dst, (size_t)capacity);
        } while (fd_read < 0 && errno == EINTR);
        if (fd_read < 0) {
            FAILWITHMSG(IERR_READ_ERROR, strerror(errno));
        }
        *p_bytes_read = (SIZE)fd_read;
        break;
    case SOURCE_HANDLER:
        if (_user_stream.curr == NULL || _user_stream.curr >= _user_stream.limit) {
            IONCHECK((*_user_stream.handler)(&_user_stream));
            if (_user_stream.curr == NULL || _user_stream.curr >= _user_stream.limit) {
                // an empty page is the end of the input
                break;
            }
        }
        user_available = (SIZE)(_user_stream.limit - _user_stream.curr);
        if (user_available > capacity) user_available = capacity;
        memcpy(dst, _user_stream.curr, user_available);
        _user_stream.curr += user_available;
        *p_bytes_read = user_available;
        break;
    default:
        FAILWITH(IERR_INTERNAL_ERROR);
    }

    iRETURN;
}

} // namespace ionraw
