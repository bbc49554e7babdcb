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

//
// decoders for the binary Ion primitives: VarUInt, VarInt, UInt, Int and the
// composite decimal and timestamp bodies.
//
// The stream variants read from an IonStream and fail with IERR_UNEXPECTED_EOF
// when the input ends early. The buffer variants decode from a window of a
// value body whose length was already declared; running past the window is
// IERR_INVALID_BINARY.
//

#ifndef IONRAW_BINARY_H_INCLUDED
#define IONRAW_BINARY_H_INCLUDED

#include <vector>

#include "ionraw/ion_types.h"
#include "ionraw/ion_stream.h"
#include "ionraw/ion_decimal.h"
#include "ionraw/ion_timestamp.h"


#define VAR_UINT_64_IMAGE_LENGTH                ((SIZE)(((sizeof(uint64_t)*8) / 7) + 1))
#define VAR_INT_64_IMAGE_LENGTH                 ((SIZE)(((sizeof(int64_t)*8) / 7) + 1)) /* same as var_uint */

namespace ionraw {

iERR ion_binary_read_var_uint_64(IonStream *pstream, uint64_t *p_value);
iERR ion_binary_read_var_int_64 (IonStream *pstream, int64_t *p_value, BOOL *p_is_negative_zero);
iERR ion_binary_read_uint_64    (IonStream *pstream, SIZE len, uint64_t *p_value);

/** Buffer variants. *pp_curr is advanced past the decoded bytes.
 *
 */
iERR ion_binary_decode_var_uint_64(const BYTE **pp_curr, const BYTE *limit, uint64_t *p_value);
iERR ion_binary_decode_var_int_64 (const BYTE **pp_curr, const BYTE *limit, int64_t *p_value, BOOL *p_is_negative_zero);
iERR ion_binary_decode_uint_64    (const BYTE *bytes, SIZE len, uint64_t *p_value);

/** Signed-magnitude Int: the high bit of the first byte is the sign, the rest
 *  is a big-endian magnitude, collected with leading zero bytes removed.
 *  An empty Int is positive zero.
 */
iERR ion_binary_decode_int_magnitude(const BYTE *bytes, SIZE len, BOOL *p_is_negative, std::vector<BYTE> *p_magnitude);

/** Binary32 or binary64, big-endian. A zero length is 0e0.
 *
 */
iERR ion_binary_decode_double(const BYTE *bytes, SIZE len, double *p_value);

/** VarInt exponent followed by an Int coefficient. An empty body is 0d0.
 *
 */
iERR ion_binary_decode_decimal(const BYTE *bytes, SIZE len, IonDecimal *p_value);

/** Offset, year, then month, day, hour and minute, second, fraction exponent
 *  and fraction coefficient for as long as the body lasts. The fields are UTC
 *  on the wire and are returned in local time.
 *
 *  @return IERR_INVALID_TIMESTAMP for out of range fields.
 */
iERR ion_binary_decode_timestamp(const BYTE *bytes, SIZE len, decContext *context, IonTimestamp *p_value);

/** Reads and decodes a timestamp body of len bytes from the stream.
 *
 */
iERR ion_binary_read_timestamp(IonStream *pstream, SIZE len, decContext *context, IonTimestamp *p_value);

} // namespace ionraw

#endif /* IONRAW_BINARY_H_INCLUDED */
