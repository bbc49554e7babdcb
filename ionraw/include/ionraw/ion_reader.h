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

#ifndef IONRAW_READER_H_
#define IONRAW_READER_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <memory>

#include "ion_types.h"
#include "ion_debug.h"
#include "ion_decimal.h"
#include "ion_timestamp.h"
#include "ion_symbol_token.h"
#include "ion_stream.h"
#include "ion_platform_config.h"

namespace ionraw {

/**
 * Reader configuration. A zero-initialized structure selects every default.
 */
struct IonReaderOptions
{
    /** The max container depth defaults to 10
     *
     */
    SIZE max_container_depth;

    /** The max number of annotations on 1 value, defaults to 10
     *
     */
    SIZE max_annotation_count;

    /** user value allocation threshold, max size of any value materialized for
     *  the user (string, clob, blob, decimal, timestamp and int bodies), and of
     *  any window borrowed through the *_ref_map accessors. Defaults to 16 MiB.
     *  Larger values can still be skipped.
     *
     */
    SIZE user_value_threshold;

    /** Size of the pages read from FILE* and file descriptor inputs, defaults to 64 KiB.
     *
     */
    SIZE page_size;

    /** If true this will disable validation of string content which verifies the
     *  string returned is in fact a valid UTF-8 sequence.  This defaults to false.
     */
    BOOL skip_character_validation;

    /** Handle to the decNumber context for the reader to use for decimals and
     * timestamp fractions. If NULL, the reader will initialize its decimal
     * context by calling decContextDefault with the DEC_INIT_DECQUAD option.
     *
     * The precision is always widened to hold every digit of a coefficient; the
     * exponent range is enforced.
     */
    decContext *decimal_context;
};

#define ION_READER_DEFAULT_MAX_CONTAINER_DEPTH   10
#define ION_READER_DEFAULT_MAX_ANNOTATION_COUNT  10
#define ION_READER_DEFAULT_USER_VALUE_THRESHOLD  (16*1024*1024)
#define ION_READER_MIN_USER_VALUE_THRESHOLD      32
#define ION_READER_MIN_PAGE_SIZE                 32

/**
 * A forward-only cursor over raw Ion values. Symbols, field names and
 * annotations are reported as RawSymbolTokens; resolving them is left to the
 * caller.
 *
 * Typed reads return IERR_OK with an empty optional when the current value is
 * null or is of a different type; use ion_type() and is_null() to tell the two
 * apart. A successful typed read of a non-null scalar consumes it, and reading
 * it again fails with IERR_VALUE_CONSUMED.
 *
 * After a DECODING or SOURCE error (see ion_error_kind) every later
 * positional or read call returns the same error.
 */
class IONRAW_API_EXPORT IonRawReader {
public:
    virtual ~IonRawReader() {}

    /** The version declared by the last version marker, (1, 0) before any. */
    virtual IonVersion ion_version() const = 0;

    /**
     * Moves to the next item at the current depth. *p_item is empty at the end
     * of the current container, or at a clean end of input at depth 0.
     */
    virtual iERR next(std::optional<StreamItem> *p_item) = 0;

    /** The type of the current value, empty when not positioned on a value. */
    virtual std::optional<IonType> ion_type() const = 0;
    virtual bool is_null() const = 0;
    virtual const std::vector<RawSymbolToken> &annotations() const = 0;

    /** The current value's field name, NULL outside of a struct. */
    virtual const RawSymbolToken *field_name() const = 0;
    virtual SIZE depth() const = 0;

    /** Yields the declared type of a null value. */
    virtual iERR read_null(std::optional<IonType> *p_value) = 0;
    virtual iERR read_bool(std::optional<bool> *p_value) = 0;

    /** @return IERR_NUMERIC_OVERFLOW if the value does not fit in an int64. */
    virtual iERR read_int64(std::optional<int64_t> *p_value) = 0;

    /** Narrows 64-bit floats to single precision. */
    virtual iERR read_float(std::optional<float> *p_value) = 0;
    virtual iERR read_double(std::optional<double> *p_value) = 0;
    virtual iERR read_decimal(std::optional<IonDecimal> *p_value) = 0;
    virtual iERR read_timestamp(std::optional<IonTimestamp> *p_value) = 0;
    virtual iERR read_symbol(std::optional<RawSymbolToken> *p_value) = 0;
    virtual iERR read_string(std::optional<std::string> *p_value) = 0;
    virtual iERR read_blob(std::optional<std::vector<BYTE> > *p_value) = 0;
    virtual iERR read_clob(std::optional<std::vector<BYTE> > *p_value) = 0;

    /**
     * Zero-copy accessors. f is handed a view of the current value's bytes
     * that is only valid for the duration of the call; only f's result is
     * stored in *p_result.
     */

    /** f(std::string_view) over validated UTF-8 text. */
    template <typename R, typename F>
    iERR string_ref_map(F f, std::optional<R> *p_result);

    /** f(const BYTE *, SIZE) over the string's bytes, unvalidated. */
    template <typename R, typename F>
    iERR string_bytes_map(F f, std::optional<R> *p_result);

    /** f(const BYTE *, SIZE) */
    template <typename R, typename F>
    iERR blob_ref_map(F f, std::optional<R> *p_result);

    /** f(const BYTE *, SIZE) */
    template <typename R, typename F>
    iERR clob_ref_map(F f, std::optional<R> *p_result);

    /** Descends into the current non-null container. */
    virtual iERR step_in() = 0;

    /** Returns to the parent container, positioned before the next sibling of
     *  the container that was stepped into.
     */
    virtual iERR step_out() = 0;

protected:
    /**
     * Borrows the body of the current value when it is a non-null value of
     * the given type (String, Clob or Blob) and marks it consumed. *p_present
     * is false on a null or mismatched value.
     */
    virtual iERR _view_bytes(IonType type, BOOL validate_utf8, BOOL *p_present, const BYTE **p_bytes, SIZE *p_length) = 0;

private:
    template <typename R, typename F>
    iERR _bytes_map(IonType type, BOOL validate_utf8, F &f, std::optional<R> *p_result);
};

template <typename R, typename F>
iERR IonRawReader::_bytes_map(IonType type, BOOL validate_utf8, F &f, std::optional<R> *p_result)
{
    iENTER;
    BOOL        present = FALSE;
    const BYTE *bytes = NULL;
    SIZE        length = 0;

    if (!p_result) FAILWITH(IERR_INVALID_ARG);
    p_result->reset();

    IONCHECK(_view_bytes(type, validate_utf8, &present, &bytes, &length));
    if (present) {
        p_result->emplace(f(bytes, length));
    }

    iRETURN;
}

template <typename R, typename F>
iERR IonRawReader::string_ref_map(F f, std::optional<R> *p_result)
{
    auto as_text = [&f](const BYTE *bytes, SIZE length) {
        return f(std::string_view((const char *)bytes, (size_t)length));
    };
    return _bytes_map(IonType::String, TRUE, as_text, p_result);
}

template <typename R, typename F>
iERR IonRawReader::string_bytes_map(F f, std::optional<R> *p_result)
{
    return _bytes_map(IonType::String, FALSE, f, p_result);
}

template <typename R, typename F>
iERR IonRawReader::blob_ref_map(F f, std::optional<R> *p_result)
{
    return _bytes_map(IonType::Blob, FALSE, f, p_result);
}

template <typename R, typename F>
iERR IonRawReader::clob_ref_map(F f, std::optional<R> *p_result)
{
    return _bytes_map(IonType::Clob, FALSE, f, p_result);
}

/**
 * Opens a binary reader over caller memory. The buffer must outlive the reader.
 *
 * @param p_options - may be NULL for defaults.
 * @return IERR_INVALID_ARG if an option is below its minimum.
 */
IONRAW_API_EXPORT iERR ion_raw_reader_open_buffer(std::unique_ptr<IonRawReader> *p_reader,
        const BYTE *buffer, SIZE buffer_length, const IonReaderOptions *p_options);

/**
 * Opens a binary reader that takes ownership of a stream.
 */
IONRAW_API_EXPORT iERR ion_raw_reader_open_stream(std::unique_ptr<IonRawReader> *p_reader,
        std::unique_ptr<IonStream> stream, const IonReaderOptions *p_options);

/**
 * Opens a binary reader over a FILE, read in pages of the configured page_size.
 * The FILE is not closed by the reader.
 */
IONRAW_API_EXPORT iERR ion_raw_reader_open_file(std::unique_ptr<IonRawReader> *p_reader,
        FILE *fp, const IonReaderOptions *p_options);

/**
 * Fills in the defaults for every zero field and validates the rest.
 */
IONRAW_API_EXPORT iERR ion_reader_options_resolve(const IonReaderOptions *p_options, IonReaderOptions *p_resolved);

} // namespace ionraw

#endif /* IONRAW_READER_H_ */
