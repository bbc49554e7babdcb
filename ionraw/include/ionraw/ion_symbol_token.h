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

#ifndef IONRAW_SYMBOL_TOKEN_H_
#define IONRAW_SYMBOL_TOKEN_H_

#include <string>
#include "ion_types.h"

namespace ionraw {

/**
 * A reference to symbol text as it appears in the raw stream: either a symbol
 * id, which must be resolved against a symbol table by a higher layer, or
 * text carried inline. Used for field names, annotations and symbol values.
 * The binary encoding only ever produces symbol ids.
 */
class IONRAW_API_EXPORT RawSymbolToken {
public:
    RawSymbolToken() : _is_sid(true), _sid(0) {}

    static RawSymbolToken from_sid(SID sid);
    static RawSymbolToken from_text(const std::string &text);

    bool is_sid() const { return _is_sid; }
    bool is_text() const { return !_is_sid; }

    /** The symbol id. Only meaningful when is_sid(). */
    SID sid() const { return _sid; }

    /** The inline text. Empty unless is_text(). */
    const std::string &text() const { return _text; }

    bool matches_sid(SID sid) const { return _is_sid && _sid == sid; }
    bool matches_text(const std::string &text) const { return !_is_sid && _text == text; }

    bool operator==(const RawSymbolToken &other) const;
    bool operator!=(const RawSymbolToken &other) const { return !(*this == other); }

    std::string to_string() const;

private:
    bool        _is_sid;
    SID         _sid;
    std::string _text;
};

} // namespace ionraw

#endif /* IONRAW_SYMBOL_TOKEN_H_ */
