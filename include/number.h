/**
 *    Copyright (C) 2025 EloqData Inc.
 *
 *    This program is free software: you can redistribute it and/or  modify
 *    it under either of the following two licenses:
 *    1. GNU Affero General Public License, version 3, as published by the Free
 *    Software Foundation.
 *    2. GNU General Public License as published by the Free Software
 *    Foundation; version 2 of the License.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU Affero General Public License or GNU General Public License for more
 *    details.
 *
 *    You should have received a copy of the GNU Affero General Public License
 *    and GNU General Public License V2 along with this program.  If not, see
 *    <http://www.gnu.org/licenses/>.
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

/**
 * In this file, it will realize the conversion between the store's decimal
 * number strings and native numbers.
 */

#define LONG_STR_SIZE 21

namespace EloqDM
{
/* Convert a string into a int64_t. Returns true if the string could be parsed
 * into a (non-overflowing) int64_t, false otherwise. The value will be set to
 * the parsed value when appropriate.
 *
 * The string must strictly represent an integer: no spaces, no sign other
 * than a leading '-', no leading zeroes except for "0" itself. */
bool string2ll(const char *s, size_t slen, int64_t &value);

/**
 * @brief Native value of a Number attribute: an exact integer, a finite
 * double, or decimal text read from the store that does not fit an int64.
 *
 * Comparison is exact on the decimal value. A double compares as its shortest
 * round-trip decimal text, so mixed comparisons stay transitive.
 */
class Number
{
public:
    Number() : val_(int64_t{0})
    {
    }

    Number(int64_t val) : val_(val)
    {
    }

    Number(int val) : val_(static_cast<int64_t>(val))
    {
    }

    Number(double val) : val_(val)
    {
    }

    /**
     * @brief Parse a store decimal string. Integer syntax within int64 range
     * yields an integer. Anything else keeps the text, so it is written back
     * unchanged.
     * @throws UnmarshalError on malformed text.
     */
    static Number Parse(std::string_view text);

    bool IsInteger() const
    {
        return std::holds_alternative<int64_t>(val_);
    }

    bool IsFinite() const;

    int64_t AsInt() const;

    double AsDouble() const;

    // Shortest decimal text that parses back to the same value. Decimal text
    // from the store is returned as read.
    std::string ToString() const;

    bool operator==(const Number &rhs) const;
    bool operator!=(const Number &rhs) const
    {
        return !(*this == rhs);
    }
    bool operator<(const Number &rhs) const;

private:
    int Compare(const Number &rhs) const;

    // The std::string alternative holds validated decimal text.
    std::variant<int64_t, double, std::string> val_;
};

}  // namespace EloqDM
