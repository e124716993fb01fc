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
#include "number.h"

#include <glog/logging.h>
#include <limits.h>

#include <charconv>
#include <cmath>
#include <cstdlib>

#include "model_errors.h"

namespace EloqDM
{
bool string2ll(const char *s, size_t slen, int64_t &value)
{
    const char *p = s;
    size_t plen = 0;
    bool negative = false;
    uint64_t v;

    /* A string of zero length or excessive length is not a valid number. */
    if (plen == slen || slen >= LONG_STR_SIZE)
        return false;

    /* Special case: first and only digit is 0. */
    if (slen == 1 && p[0] == '0')
    {
        value = 0;
        return true;
    }

    if (p[0] == '-')
    {
        negative = true;
        p++;
        plen++;

        /* Abort on only a negative sign. */
        if (plen == slen)
            return false;
    }

    /* First digit should be 1-9, otherwise the string should just be 0. */
    if (p[0] >= '1' && p[0] <= '9')
    {
        v = p[0] - '0';
        p++;
        plen++;
    }
    else
    {
        return false;
    }

    while (plen < slen && p[0] >= '0' && p[0] <= '9')
    {
        if (v > (ULLONG_MAX / 10)) /* Overflow. */
            return false;
        v *= 10;

        if (v > (ULLONG_MAX - (p[0] - '0'))) /* Overflow. */
            return false;
        v += p[0] - '0';

        p++;
        plen++;
    }

    /* Return if not all bytes were used. */
    if (plen < slen)
        return false;

    if (negative)
    {
        if (v > ((unsigned long long) (-(LLONG_MIN + 1)) + 1)) /* Overflow. */
            return false;
        value = -v;
    }
    else
    {
        if (v > LLONG_MAX) /* Overflow. */
            return false;

        value = v;
    }
    return true;
}

namespace
{
// value = 0.digits_ * 10^exponent_, digits_ without leading or trailing
// zeroes. Zero has empty digits_.
struct DecimalParts
{
    bool negative_{false};
    std::string digits_;
    int64_t exponent_{0};
};

constexpr int64_t kMaxExponent = 1000000000;

/* Strict decimal syntax: [+-]digits[.digits][(e|E)[+-]digits]. At least one
 * mantissa digit is required. No spaces, "inf", "nan" or hex forms. */
bool ParseDecimal(std::string_view s, DecimalParts &parts)
{
    size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '-' || s[i] == '+'))
    {
        negative = s[i] == '-';
        i++;
    }

    std::string digits;
    int64_t int_digits = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9')
    {
        digits.push_back(s[i++]);
        int_digits++;
    }
    if (i < s.size() && s[i] == '.')
    {
        i++;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9')
        {
            digits.push_back(s[i++]);
        }
    }
    if (digits.empty())
    {
        return false;
    }

    int64_t exponent = 0;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E'))
    {
        i++;
        bool exp_negative = false;
        if (i < s.size() && (s[i] == '-' || s[i] == '+'))
        {
            exp_negative = s[i] == '-';
            i++;
        }
        if (i == s.size())
        {
            return false;
        }
        while (i < s.size() && s[i] >= '0' && s[i] <= '9')
        {
            exponent = exponent * 10 + (s[i++] - '0');
            if (exponent > kMaxExponent)
            {
                return false;
            }
        }
        if (exp_negative)
        {
            exponent = -exponent;
        }
    }
    if (i != s.size())
    {
        return false;
    }

    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos)
    {
        parts = DecimalParts{};
        return true;
    }
    size_t last = digits.find_last_not_of('0');
    parts.negative_ = negative;
    parts.digits_ = digits.substr(first, last - first + 1);
    parts.exponent_ = int_digits - static_cast<int64_t>(first) + exponent;
    return true;
}

int CompareMagnitude(const DecimalParts &a, const DecimalParts &b)
{
    if (a.exponent_ != b.exponent_)
    {
        return a.exponent_ < b.exponent_ ? -1 : 1;
    }
    int cmp = a.digits_.compare(b.digits_);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

int CompareDecimal(const DecimalParts &a, const DecimalParts &b)
{
    int a_sign = a.digits_.empty() ? 0 : (a.negative_ ? -1 : 1);
    int b_sign = b.digits_.empty() ? 0 : (b.negative_ ? -1 : 1);
    if (a_sign != b_sign)
    {
        return a_sign < b_sign ? -1 : 1;
    }
    if (a_sign == 0)
    {
        return 0;
    }
    int mag = CompareMagnitude(a, b);
    return a_sign > 0 ? mag : -mag;
}

DecimalParts ToParts(const std::string &text)
{
    DecimalParts parts;
    bool parsed = ParseDecimal(text, parts);
    DCHECK(parsed) << "not a decimal: " << text;
    return parts;
}
}  // namespace

Number Number::Parse(std::string_view text)
{
    int64_t ival = 0;
    if (string2ll(text.data(), text.size(), ival))
    {
        return Number(ival);
    }

    DecimalParts parts;
    if (!ParseDecimal(text, parts))
    {
        throw UnmarshalError("invalid number literal '" + std::string(text) +
                             "'");
    }
    Number n;
    n.val_ = std::string(text);
    return n;
}

bool Number::IsFinite() const
{
    if (std::holds_alternative<double>(val_))
    {
        return std::isfinite(std::get<double>(val_));
    }
    return true;
}

int64_t Number::AsInt() const
{
    if (IsInteger())
    {
        return std::get<int64_t>(val_);
    }
    return static_cast<int64_t>(AsDouble());
}

double Number::AsDouble() const
{
    if (IsInteger())
    {
        return static_cast<double>(std::get<int64_t>(val_));
    }
    if (std::holds_alternative<double>(val_))
    {
        return std::get<double>(val_);
    }
    return std::strtod(std::get<std::string>(val_).c_str(), nullptr);
}

std::string Number::ToString() const
{
    if (IsInteger())
    {
        return std::to_string(std::get<int64_t>(val_));
    }
    if (std::holds_alternative<std::string>(val_))
    {
        return std::get<std::string>(val_);
    }

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), std::get<double>(val_));
    return std::string(buf, res.ptr);
}

int Number::Compare(const Number &rhs) const
{
    if (IsInteger() && rhs.IsInteger())
    {
        int64_t l = std::get<int64_t>(val_);
        int64_t r = std::get<int64_t>(rhs.val_);
        return l < r ? -1 : (l > r ? 1 : 0);
    }
    if (!IsFinite() || !rhs.IsFinite())
    {
        double l = AsDouble();
        double r = rhs.AsDouble();
        return l < r ? -1 : (l > r ? 1 : 0);
    }
    return CompareDecimal(ToParts(ToString()), ToParts(rhs.ToString()));
}

bool Number::operator==(const Number &rhs) const
{
    return Compare(rhs) == 0;
}

bool Number::operator<(const Number &rhs) const
{
    return Compare(rhs) < 0;
}

}  // namespace EloqDM
