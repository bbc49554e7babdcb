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

/*
 * forward-only byte sources for the ionraw readers.
 *
 *  buffer  - a view of caller memory, no copying. The caller keeps the
 *            memory alive for the life of the stream.
 *  FILE*   - buffered reads of page_size bytes. The FILE is not closed.
 *  fd      - same as FILE*, over a file descriptor. The fd is not closed.
 *  handler - a user callback that moves curr/limit to the next page of data.
 *            A handler that leaves curr == limit signals end of input.
 *
 * The paged sources keep only the bytes the reader has not consumed yet, so
 * memory stays bounded by the largest contiguous window requested through
 * fetch() (plus one page), however long the input is.
 */

#ifndef IONRAW_STREAM_H_
#define IONRAW_STREAM_H_

#include <stdio.h>
#include <memory>
#include <vector>

#include "ion_types.h"
#include "ion_platform_config.h"
#include "ion_errors.h"

#define ION_STREAM_EOF              (-1)
#define ION_STREAM_DEFAULT_PAGE_SIZE (64*1024)

namespace ionraw {

// decl's for user managed stream
struct IonUserStream;
typedef iERR (*ION_STREAM_HANDLER)(IonUserStream *pstream);

struct IonUserStream
{
    BYTE *curr;
    BYTE *limit;
    void *handler_state;
    ION_STREAM_HANDLER handler;
};

class IONRAW_API_EXPORT IonStream {
public:
    static iERR open_buffer(const BYTE *buffer, SIZE length, std::unique_ptr<IonStream> *p_stream);
    static iERR open_file_in(FILE *fp, SIZE page_size, std::unique_ptr<IonStream> *p_stream);
    static iERR open_fd_in(int fd, SIZE page_size, std::unique_ptr<IonStream> *p_stream);
    static iERR open_handler_in(ION_STREAM_HANDLER handler, void *handler_state, std::unique_ptr<IonStream> *p_stream);

    /** Returns ION_STREAM_EOF in *p_byte at end of input. */
    iERR read_byte(int *p_byte);
    iERR peek_byte(int *p_byte);

    /** Reads up to length bytes; *p_bytes_read is short only at end of input. */
    iERR read(BYTE *dst, SIZE length, SIZE *p_bytes_read);

    /** Moves forward distance bytes.
     *  @return IERR_UNEXPECTED_EOF if the input ends first.
     */
    iERR skip(POSITION distance);

    /** Makes length bytes starting at the current position contiguous and
     *  returns a pointer to them. The position does not move. The pointer is
     *  valid until the next call that moves or fills the stream.
     *  @return IERR_UNEXPECTED_EOF if fewer than length bytes remain.
     */
    iERR fetch(SIZE length, const BYTE **p_bytes);

    /** Number of bytes consumed since the stream was opened. */
    POSITION position() const { return _offset + (_curr - _data); }

    iERR is_eof(BOOL *p_is_eof);

private:
    enum Source {
        SOURCE_BUFFER,
        SOURCE_FILE,
        SOURCE_FD,
        SOURCE_HANDLER
    };

    IonStream(Source source, SIZE page_size);

    iERR _fill(SIZE wanted);
    iERR _read_page(BYTE *dst, SIZE capacity, SIZE *p_bytes_read);

    Source            _source;
    SIZE              _page_size;
    FILE             *_fp;
    int               _fd;
    IonUserStream     _user_stream;
    std::vector<BYTE> _buffer;   // paged sources only
    const BYTE       *_data;     // first buffered byte
    const BYTE       *_curr;
    const BYTE       *_limit;
    POSITION          _offset;   // stream position of _data
    bool              _at_eof;
};

} // namespace ionraw

#endif /* IONRAW_STREAM_H_ */
