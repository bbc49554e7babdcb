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

#include "ionraw/ion_symbol_token.h"

namespace ionraw {

RawSymbolToken RawSymbolToken::from_sid(SID sid)
{
    RawSymbolToken token;
    token._is_sid = true;
    token._sid = sid;
    return token;
}

RawSymbolToken RawSymbolToken::from_text(const std::string &text)
{
    RawSymbolToken token;
    token._is_sid = false;
    token._sid = 0;
    token._text = text;
    return token;
}

bool RawSymbolToken::operator==(const RawSymbolToken &other) const
{
    if (_is_sid != other._is_sid) return false;
    return _is_sid ? (_sid == other._sid) : (_text == other._text);
}

std::string RawSymbolToken::to_string() const
{
    if (_is_sid) {
        return "$" + std::to_string(_sid);
    }
    return _text;
}

} // namespace ionraw
