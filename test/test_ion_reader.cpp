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

#include "ion_assert.h"
#include "ion_test_util.h"

#define READER_FROM(data, len) \
    std::unique_ptr<IonRawReader> reader; \
    std::optional<StreamItem> item; \
    ION_ASSERT_OK(ion_test_new_reader((const BYTE *)(data), (len), &reader))

#define ASSERT_NEXT_VALUE(type, is_null) \
    ION_ASSERT_OK(reader->next(&item)); \
    ASSERT_TRUE(item.has_value()); \
    ASSERT_EQ(StreamItem::value((type), (is_null)), *item)

#define ASSERT_NEXT_END \
    ION_ASSERT_OK(reader->next(&item)); \
    ASSERT_FALSE(item.has_value())

TEST(IonReaderScenario, VersionMarkerIntAndString) {
    std::optional<int64_t> int_value;
    std::optional<std::string> string_value;
    READER_FROM(ION_TEST_IVM "\x21\x05\x82hi", 9);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(StreamItem::version_marker(1, 0), *item);
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ION_ASSERT_OK(reader->read_int64(&int_value));
    ASSERT_EQ(5, *int_value);
    ASSERT_NEXT_VALUE(IonType::String, false);
    ION_ASSERT_OK(reader->read_string(&string_value));
    ASSERT_EQ("hi", *string_value);
    ASSERT_NEXT_END;
}

TEST(IonReaderScenario, EmptyStruct) {
    READER_FROM(ION_TEST_IVM "\xD0", 5);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Struct, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_EQ(1, reader->depth());
    ASSERT_NEXT_END;
    ION_ASSERT_OK(reader->step_out());
    ASSERT_EQ(0, reader->depth());
    ASSERT_NEXT_END;
}

TEST(IonReaderScenario, NullTimestamp) {
    std::optional<IonTimestamp> ts;
    std::optional<std::string> str;
    std::optional<IonType> null_type;
    READER_FROM(ION_TEST_IVM "\x6F", 5);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Timestamp, true);
    ASSERT_TRUE(reader->is_null());
    ION_ASSERT_OK(reader->read_timestamp(&ts));
    ASSERT_FALSE(ts.has_value());
    ION_ASSERT_OK(reader->read_string(&str));
    ASSERT_FALSE(str.has_value());
    ION_ASSERT_OK(reader->read_null(&null_type));
    ASSERT_EQ(IonType::Timestamp, *null_type);
}

TEST(IonReaderScenario, NonTerminatingLengthIsFatal) {
    std::optional<std::string> str;
    // a string whose VarUInt length never sets its end bit
    READER_FROM(ION_TEST_IVM "\x8E\x00\x00\x00\x00\x00\x00\x00\x00\x00\x00\x00\x00", 17);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, reader->next(&item));
    ASSERT_FALSE(item.has_value());
    ASSERT_FALSE(reader->ion_type().has_value());
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, reader->next(&item));
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, reader->read_string(&str));
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, reader->step_in());
    ASSERT_EQ(IERR_NUMERIC_OVERFLOW, reader->step_out());
}

TEST(IonReaderCursor, StartsAtVersionOneZero) {
    READER_FROM("\x20", 1);

    ASSERT_EQ(1, reader->ion_version().major);
    ASSERT_EQ(0, reader->ion_version().minor);
    ASSERT_EQ(0, reader->depth());
    // a stream is not required to start with a version marker
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, StepsInAndOutOfNestedContainers) {
    // [[[0]]]
    READER_FROM(ION_TEST_IVM "\xB3\xB2\xB1\x20", 8);

    ION_ASSERT_OK(reader->next(&item));
    for (SIZE depth = 0; depth < 3; depth++) {
        ASSERT_EQ(depth, reader->depth());
        ASSERT_NEXT_VALUE(IonType::List, false);
        ION_ASSERT_OK(reader->step_in());
    }
    ASSERT_EQ(3, reader->depth());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_NEXT_END;
    for (SIZE depth = 3; depth > 0; depth--) {
        ION_ASSERT_OK(reader->step_out());
        ASSERT_EQ(depth - 1, reader->depth());
    }
    ASSERT_NEXT_END;
    ASSERT_EQ(IERR_STACK_UNDERFLOW, reader->step_out());
    ASSERT_EQ(0, reader->depth());
    // underflow is a usage error, the cursor remains usable
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, StepOutSkipsToNextSibling) {
    std::optional<int64_t> value;
    // [1, 2, 3] 4
    READER_FROM(ION_TEST_IVM "\xB6\x21\x01\x21\x02\x21\x03\x21\x04", 13);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::List, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ION_ASSERT_OK(reader->read_int64(&value));
    ASSERT_EQ(1, *value);
    ION_ASSERT_OK(reader->step_out());

    ASSERT_NEXT_VALUE(IonType::Int, false);
    ION_ASSERT_OK(reader->read_int64(&value));
    ASSERT_EQ(4, *value);
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, StepOutWithoutReadingChildren) {
    std::optional<std::string> value;
    // ({10: "xyz"}) "end"
    READER_FROM(ION_TEST_IVM "\xC6\xD5\x8A\x83xyz\x83" "end", 15);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::SExp, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_NEXT_VALUE(IonType::Struct, false);
    ION_ASSERT_OK(reader->step_in());
    ION_ASSERT_OK(reader->step_out());
    ION_ASSERT_OK(reader->step_out());
    ASSERT_NEXT_VALUE(IonType::String, false);
    ION_ASSERT_OK(reader->read_string(&value));
    ASSERT_EQ("end", *value);
}

TEST(IonReaderCursor, EndOfContainerIsSticky) {
    READER_FROM(ION_TEST_IVM "\xB1\x20\x20", 7);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::List, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_NEXT_END;
    ASSERT_NEXT_END;
    ION_ASSERT_OK(reader->step_out());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_NEXT_END;
    ASSERT_NEXT_END;
    ASSERT_EQ(0, reader->depth());
}

TEST(IonReaderCursor, CountsValuesWithoutReadingThem) {
    // 1, "abc", [1, 2], {4: 0}, null.blob, 2012T, 1.5e0
    READER_FROM(ION_TEST_IVM "\x21\x01\x83" "abc" "\xB4\x21\x01\x21\x02\xD2\x84\x20\xAF\x63\x80\x0F\xDC\x44\x3F\xC0\x00\x00", 28);
    SIZE count = 0;

    for (;;) {
        ION_ASSERT_OK(reader->next(&item));
        if (!item) break;
        if (item->is_value()) count++;
    }
    ASSERT_EQ(7, count);
    ASSERT_EQ(0, reader->depth());
}

TEST(IonReaderCursor, ReadAllValuesVisitsEveryDepth) {
    READER_FROM(ION_TEST_IVM "\x21\x01\x83" "abc" "\xB4\x21\x01\x21\x02\xD2\x84\x20\xAF\x63\x80\x0F\xDC\x44\x3F\xC0\x00\x00", 28);
    SIZE count;

    ION_ASSERT_OK(ion_test_read_all_values(reader.get(), &count));
    // 7 top level values, 2 list children and 1 struct field
    ASSERT_EQ(10, count);
}

TEST(IonReaderCursor, RepeatedVersionMarkers) {
    READER_FROM(ION_TEST_IVM "\x20" ION_TEST_IVM "\x20", 10);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_TRUE(item->is_version_marker());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(StreamItem::version_marker(1, 0), *item);
    ASSERT_FALSE(reader->ion_type().has_value());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, RejectsOtherVersions) {
    READER_FROM("\xE0\x02\x00\xEA", 4);

    ASSERT_EQ(IERR_INVALID_ION_VERSION, reader->next(&item));
    ASSERT_EQ(IERR_INVALID_ION_VERSION, reader->next(&item));
}

TEST(IonReaderCursor, RejectsMalformedVersionMarker) {
    READER_FROM("\xE0\x01\x00\xEB", 4);

    ASSERT_EQ(IERR_INVALID_BINARY, reader->next(&item));
}

TEST(IonReaderCursor, RejectsTruncatedVersionMarker) {
    READER_FROM("\xE0\x01", 2);

    ASSERT_EQ(IERR_UNEXPECTED_EOF, reader->next(&item));
}

TEST(IonReaderCursor, RejectsTypeCode15) {
    READER_FROM(ION_TEST_IVM "\xF0", 5);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_INVALID_BINARY, reader->next(&item));
}

TEST(IonReaderCursor, RejectsInvalidBoolLength) {
    READER_FROM(ION_TEST_IVM "\x12", 5);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_INVALID_BINARY, reader->next(&item));
}

TEST(IonReaderCursor, RejectsTruncatedValue) {
    std::optional<std::string> str;
    READER_FROM(ION_TEST_IVM "\x85" "ab", 7);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::String, false);
    ASSERT_EQ(IERR_UNEXPECTED_EOF, reader->read_string(&str));
    ASSERT_EQ(IERR_UNEXPECTED_EOF, reader->next(&item));
}

TEST(IonReaderCursor, RejectsSkippingPastTheEnd) {
    READER_FROM(ION_TEST_IVM "\x85" "ab", 7);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::String, false);
    ASSERT_EQ(IERR_UNEXPECTED_EOF, reader->next(&item));
}

TEST(IonReaderCursor, RejectsChildLongerThanContainer) {
    READER_FROM(ION_TEST_IVM "\xB2\x83" "abc", 9);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::List, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_EQ(IERR_INVALID_BINARY, reader->next(&item));
    ASSERT_EQ(IERR_INVALID_BINARY, reader->step_out());
}

TEST(IonReaderCursor, RejectsFieldNameAtEndOfStruct) {
    READER_FROM(ION_TEST_IVM "\xD3\x84\x20\x85", 8);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Struct, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_EQ(IERR_INVALID_BINARY, reader->next(&item));
}

TEST(IonReaderCursor, ReadsFieldNames) {
    std::optional<int64_t> int_value;
    std::optional<std::string> string_value;
    // {4: 1, 5: "x"}
    READER_FROM(ION_TEST_IVM "\xD6\x84\x21\x01\x85\x81x", 11);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Struct, false);
    ASSERT_TRUE(reader->field_name() == NULL);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_EQ(RawSymbolToken::from_sid(4), *reader->field_name());
    ION_ASSERT_OK(reader->read_int64(&int_value));
    ASSERT_EQ(1, *int_value);
    ASSERT_NEXT_VALUE(IonType::String, false);
    ASSERT_TRUE(reader->field_name()->matches_sid(5));
    ION_ASSERT_OK(reader->read_string(&string_value));
    ASSERT_EQ("x", *string_value);
    ASSERT_NEXT_END;
    ASSERT_TRUE(reader->field_name() == NULL);
    ION_ASSERT_OK(reader->step_out());
}

TEST(IonReaderCursor, ReadsSortedStruct) {
    READER_FROM(ION_TEST_IVM "\xD1\x82\x84\x20\x21\x07", 10);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Struct, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_TRUE(reader->field_name()->matches_sid(4));
    ASSERT_NEXT_END;
    ION_ASSERT_OK(reader->step_out());
    ASSERT_NEXT_VALUE(IonType::Int, false);
}

TEST(IonReaderCursor, RejectsEmptySortedStruct) {
    READER_FROM(ION_TEST_IVM "\xD1\x80", 6);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_INVALID_BINARY, reader->next(&item));
}

TEST(IonReaderCursor, ReadsAnnotations) {
    std::optional<int64_t> value;
    // 4::5::7 8
    READER_FROM(ION_TEST_IVM "\xE5\x82\x84\x85\x21\x07\x21\x08", 12);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_EQ(2, reader->annotations().size());
    ASSERT_EQ(RawSymbolToken::from_sid(4), reader->annotations()[0]);
    ASSERT_EQ(RawSymbolToken::from_sid(5), reader->annotations()[1]);
    ION_ASSERT_OK(reader->read_int64(&value));
    ASSERT_EQ(7, *value);
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_TRUE(reader->annotations().empty());
}

TEST(IonReaderCursor, ReadsAnnotatedContainer) {
    // 4::[0]
    READER_FROM(ION_TEST_IVM "\xE4\x81\x84\xB1\x20", 9);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::List, false);
    ASSERT_EQ(1, reader->annotations().size());
    ION_ASSERT_OK(reader->step_in());
    ASSERT_TRUE(reader->annotations().empty());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_TRUE(reader->annotations().empty());
    ASSERT_NEXT_END;
    ION_ASSERT_OK(reader->step_out());
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, LimitsAnnotationCount) {
    std::unique_ptr<IonRawReader> reader;
    std::optional<StreamItem> item;
    IonReaderOptions options;
    memset(&options, 0, sizeof(options));
    options.max_annotation_count = 1;

    ION_ASSERT_OK(ion_raw_reader_open_buffer(&reader, (const BYTE *)ION_TEST_IVM "\xE5\x82\x84\x85\x21\x07", 10, &options));
    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_TOO_MANY_ANNOTATIONS, reader->next(&item));
    ASSERT_EQ(IERR_TOO_MANY_ANNOTATIONS, reader->next(&item));
}

void test_ion_reader_rejects_annotation_wrapper(const char *data, SIZE len) {
    std::unique_ptr<IonRawReader> reader;
    std::optional<StreamItem> item;

    ION_ASSERT_OK(ion_test_new_reader_after_ivm((const BYTE *)data, len, &reader));
    ASSERT_EQ(IERR_INVALID_BINARY, reader->next(&item));
}

TEST(IonReaderCursor, RejectsMalformedAnnotationWrappers) {
    // too short to hold an annotation and a value
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xE2\x81\x84", 7);
    // no annotations
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xE3\x80\x21\x01", 8);
    // the annotations fill the wrapper
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xE4\x83\x84\x85\x86", 9);
    // the last annotation runs past the annotation list
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xE5\x81\x04\x85\x21\x01", 10);
    // a wrapper around a wrapper
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xE7\x81\x84\xE4\x81\x84\x21\x01", 12);
    // a wrapper around padding
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xE4\x81\x84\x01\x00", 9);
    // the value does not fill the wrapper
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xE5\x81\x84\x21\x01\x00", 10);
    // the value runs past the wrapper
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xE4\x81\x84\x22\x01\x02", 10);
    // null annotation wrapper
    test_ion_reader_rejects_annotation_wrapper(ION_TEST_IVM "\xEF", 5);
}

TEST(IonReaderCursor, SkipsPadding) {
    std::optional<int64_t> value;
    // one byte pad, three byte pad, pad with a VarUInt length, then 9
    READER_FROM(ION_TEST_IVM "\x00\x02\xFF\xFF\x0E\x82\xAA\xAA\x21\x09", 14);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ION_ASSERT_OK(reader->read_int64(&value));
    ASSERT_EQ(9, *value);
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, SkipsPaddingInStruct) {
    // {4: <pad>, 5: 1}
    READER_FROM(ION_TEST_IVM "\xD6\x84\x01\x00\x85\x21\x01", 11);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Struct, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_TRUE(reader->field_name()->matches_sid(5));
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, PaddingOnlyStreamIsEmpty) {
    READER_FROM(ION_TEST_IVM "\x00\x00\x00", 7);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, RejectsTruncatedPadding) {
    READER_FROM(ION_TEST_IVM "\x03\x00", 6);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_UNEXPECTED_EOF, reader->next(&item));
}

TEST(IonReaderCursor, ReadsNullNull) {
    std::optional<IonType> null_type;
    READER_FROM(ION_TEST_IVM "\x0F", 5);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Null, true);
    ION_ASSERT_OK(reader->read_null(&null_type));
    ASSERT_EQ(IonType::Null, *null_type);
}

TEST(IonReaderCursor, LimitsContainerDepth) {
    std::unique_ptr<IonRawReader> reader;
    std::optional<StreamItem> item;
    IonReaderOptions options;
    memset(&options, 0, sizeof(options));
    options.max_container_depth = 2;

    ION_ASSERT_OK(ion_raw_reader_open_buffer(&reader, (const BYTE *)ION_TEST_IVM "\xB3\xB2\xB1\x20", 8, &options));
    ION_ASSERT_OK(reader->next(&item));
    ION_ASSERT_OK(reader->next(&item));
    ION_ASSERT_OK(reader->step_in());
    ION_ASSERT_OK(reader->next(&item));
    ION_ASSERT_OK(reader->step_in());
    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_CONTAINER_TOO_DEEP, reader->step_in());
    ASSERT_EQ(IERR_CONTAINER_TOO_DEEP, reader->next(&item));
}

TEST(IonReaderCursor, StepInRequiresNonNullContainer) {
    READER_FROM(ION_TEST_IVM "\x20\xBF\xB0", 7);

    ASSERT_EQ(IERR_INVALID_STATE, reader->step_in());
    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_INVALID_STATE, reader->step_in());
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ASSERT_EQ(IERR_INVALID_STATE, reader->step_in());
    ASSERT_NEXT_VALUE(IonType::List, true);
    ASSERT_EQ(IERR_INVALID_STATE, reader->step_in());
    ASSERT_NEXT_VALUE(IonType::List, false);
    ION_ASSERT_OK(reader->step_in());
    ASSERT_NEXT_END;
}

TEST(IonReaderCursor, ReadsRequireAPositionedReader) {
    std::optional<int64_t> value;
    std::optional<IonType> null_type;
    READER_FROM(ION_TEST_IVM "\x21\x01", 6);

    ASSERT_EQ(IERR_INVALID_STATE, reader->read_int64(&value));
    ION_ASSERT_OK(reader->next(&item));
    ASSERT_EQ(IERR_INVALID_STATE, reader->read_int64(&value));
    ASSERT_EQ(IERR_INVALID_STATE, reader->read_null(&null_type));
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ION_ASSERT_OK(reader->read_int64(&value));
    ASSERT_EQ(1, *value);
    ASSERT_NEXT_END;
    ASSERT_EQ(IERR_INVALID_STATE, reader->read_int64(&value));
}

TEST(IonReaderCursor, ValueIsConsumedByARead) {
    std::optional<int64_t> value;
    std::optional<std::string> str;
    std::optional<IonType> null_type;
    READER_FROM(ION_TEST_IVM "\x21\x01\x21\x02", 8);

    ION_ASSERT_OK(reader->next(&item));
    ASSERT_NEXT_VALUE(IonType::Int, false);
    // mismatched and null reads leave the value readable
    ION_ASSERT_OK(reader->read_string(&str));
    ASSERT_FALSE(str.has_value());
    ION_ASSERT_OK(reader->read_null(&null_type));
    ASSERT_FALSE(null_type.has_value());
    ION_ASSERT_OK(reader->read_int64(&value));
    ASSERT_EQ(1, *value);
    ASSERT_EQ(IERR_VALUE_CONSUMED, reader->read_int64(&value));
    ASSERT_FALSE(value.has_value());

    // the cursor is still usable
    ASSERT_NEXT_VALUE(IonType::Int, false);
    ION_ASSERT_OK(reader->read_int64(&value));
    ASSERT_EQ(2, *value);
}

TEST(IonReaderCursor, TracingDoesNotChangeResults) {
    SIZE count;
    READER_FROM(ION_TEST_IVM "\xB6\x21\x01\xE3\x81\x84\x20", 11);

    ion_debug_set_tracing(TRUE);
    ASSERT_TRUE(ion_debug_has_tracing());
    ION_ASSERT_OK(ion_test_read_all_values(reader.get(), &count));
    ion_debug_set_tracing(FALSE);
    ASSERT_EQ(3, count);
}

TEST(IonReaderFile, ReadsFromFile) {
    std::unique_ptr<IonRawReader> reader;
    std::optional<StreamItem> item;
    std::optional<std::string> value;
    IonReaderOptions options;
    std::string text(100, 'x');
    FILE *fp = tmpfile();
    ASSERT_TRUE(fp != NULL);
    fwrite(ION_TEST_IVM "\x8E\xE4", 1, 6, fp);
    fwrite(text.data(), 1, text.size(), fp);
    rewind(fp);
    memset(&options, 0, sizeof(options));
    options.page_size = 32;

    // the string is larger than a page
    ION_ASSERT_OK(ion_raw_reader_open_file(&reader, fp, &options));
    ION_ASSERT_OK(reader->next(&item));
    ION_ASSERT_OK(ion_test_next_value(reader.get(), IonType::String));
    ION_ASSERT_OK(reader->read_string(&value));
    ASSERT_EQ(text, *value);
    ION_ASSERT_OK(reader->next(&item));
    ASSERT_FALSE(item.has_value());
    reader.reset();
    fclose(fp);
}

TEST(IonReaderOptions, ZeroSelectsDefaults) {
    IonReaderOptions options, resolved;
    memset(&options, 0, sizeof(options));

    ION_ASSERT_OK(ion_reader_options_resolve(&options, &resolved));
    ASSERT_EQ(ION_READER_DEFAULT_MAX_CONTAINER_DEPTH, resolved.max_container_depth);
    ASSERT_EQ(ION_READER_DEFAULT_MAX_ANNOTATION_COUNT, resolved.max_annotation_count);
    ASSERT_EQ(ION_READER_DEFAULT_USER_VALUE_THRESHOLD, resolved.user_value_threshold);
    ASSERT_EQ(ION_STREAM_DEFAULT_PAGE_SIZE, resolved.page_size);
    ASSERT_FALSE(resolved.skip_character_validation);
    ASSERT_TRUE(resolved.decimal_context == NULL);

    ION_ASSERT_OK(ion_reader_options_resolve(NULL, &resolved));
    ASSERT_EQ(ION_READER_DEFAULT_MAX_CONTAINER_DEPTH, resolved.max_container_depth);
}

TEST(IonReaderOptions, RejectsValuesBelowMinimum) {
    std::unique_ptr<IonRawReader> reader;
    IonReaderOptions options, resolved;

    memset(&options, 0, sizeof(options));
    options.max_container_depth = -1;
    ASSERT_EQ(IERR_INVALID_ARG, ion_reader_options_resolve(&options, &resolved));

    memset(&options, 0, sizeof(options));
    options.max_annotation_count = -1;
    ASSERT_EQ(IERR_INVALID_ARG, ion_reader_options_resolve(&options, &resolved));

    memset(&options, 0, sizeof(options));
    options.user_value_threshold = ION_READER_MIN_USER_VALUE_THRESHOLD - 1;
    ASSERT_EQ(IERR_INVALID_ARG, ion_reader_options_resolve(&options, &resolved));

    memset(&options, 0, sizeof(options));
    options.page_size = ION_READER_MIN_PAGE_SIZE - 1;
    ASSERT_EQ(IERR_INVALID_ARG, ion_raw_reader_open_buffer(&reader, (const BYTE *)ION_TEST_IVM, 4, &options));
    ASSERT_TRUE(reader == nullptr);
}

TEST(IonReaderOptions, KeepsExplicitValues) {
    IonReaderOptions options, resolved;
    memset(&options, 0, sizeof(options));
    options.max_container_depth = 1;
    options.max_annotation_count = 1;
    options.user_value_threshold = 32;
    options.page_size = 32;
    options.skip_character_validation = TRUE;

    ION_ASSERT_OK(ion_reader_options_resolve(&options, &resolved));
    ASSERT_EQ(1, resolved.max_container_depth);
    ASSERT_EQ(1, resolved.max_annotation_count);
    ASSERT_EQ(32, resolved.user_value_threshold);
    ASSERT_EQ(32, resolved.page_size);
    ASSERT_TRUE(resolved.skip_character_validation);
}
