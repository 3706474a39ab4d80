/*
 *----------------------------------------------------------------------------
 *
 * adprovutf.cpp
 *
 * (C) 2004-2006 Dan Perry (dperry@pppl.gov)
 * (C) 2006 Brian Elliott Finley (finley@anl.gov)
 * (C) 2009-2010 Doug Engert (deengert@anl.gov)
 * (C) 2010 James Y Knight (foom@fuhm.net)
 * (C) 2010-2013 Ken Dreyer <ktdreyer at ktdreyer.com>
 * (C) 2012-2017 Mark Proehl <mark at mproehl.net>
 * (C) 2012-2017 Olaf Flebbe <of at oflebbe.de>
 * (C) 2013-2017 Daniel Kobras <d.kobras at science-computing.de>
 *
    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 *
 *-----------------------------------------------------------------------------
 */

#include "adprov.h"
#include <string>
#include <stdint.h>

#define RET_ILSEQ      -1
#define RET_TOOFEW     -2
#define RET_ILUNI      -1

static int utf8_mbtowc(uint32_t *pwc, const unsigned char *s, size_t n);
static int utf16le_wctomb(uint32_t wc, std::string &out);

/*
 * The directory takes unicodePwd as the password enclosed in double
 * quotes, encoded UTF-16-LE.
 */
std::string encode_unicode_pwd(const std::string &password)
{
    return transcode_utf8_utf16le("\"" + password + "\"");
}

std::string transcode_utf8_utf16le(const std::string &source)
{
    std::string out = std::string();
    const unsigned char* inptr = (const unsigned char*) source.c_str();
    size_t inleft = source.length();
    int incount;
    while (inleft > 0) {
        uint32_t pwc = 0;
        incount = utf8_mbtowc(&pwc, inptr, inleft);
        if (incount < 0) {
            // An error occurred. Use a replacement character.
            incount = 1;
            pwc = 0xfffd;
        }
        inleft -= incount;
        inptr += incount;

        if (utf16le_wctomb(pwc, out) < 0) {
            throw Exception(sform("Could not encode Unicode CP U+%x in UTF-16",
                                  pwc));
        }
    }
    return out;
}

// Adapted from libiconv
static int utf8_mbtowc(uint32_t *pwc, const unsigned char *s, size_t n)
{
    unsigned char c = s[0];

    if (c < 0x80) {
        *pwc = c;
        return 1;
    } else if (c < 0xc2) {
        return RET_ILSEQ;
    } else if (c < 0xe0) {
        if (n < 2)
            return RET_TOOFEW;
        if (!((s[1] ^ 0x80) < 0x40))
            return RET_ILSEQ;
        *pwc = ((uint32_t) (c & 0x1f) << 6) | (uint32_t) (s[1] ^ 0x80);
        return 2;
    } else if (c < 0xf0) {
        if (n < 3)
            return RET_TOOFEW;
        if (!((s[1] ^ 0x80) < 0x40 && (s[2] ^ 0x80) < 0x40
              && (c >= 0xe1 || s[1] >= 0xa0)
              && (c != 0xed || s[1] < 0xa0)))
            return RET_ILSEQ;
        *pwc = ((uint32_t) (c & 0x0f) << 12)
               | ((uint32_t) (s[1] ^ 0x80) << 6)
               | (uint32_t) (s[2] ^ 0x80);
        return 3;
    } else if (c < 0xf5) {
        if (n < 4)
            return RET_TOOFEW;
        if (!((s[1] ^ 0x80) < 0x40 && (s[2] ^ 0x80) < 0x40
              && (s[3] ^ 0x80) < 0x40
              && (c >= 0xf1 || s[1] >= 0x90)
              && (c < 0xf4 || (c == 0xf4 && s[1] < 0x90))))
            return RET_ILSEQ;
        *pwc = ((uint32_t) (c & 0x07) << 18)
               | ((uint32_t) (s[1] ^ 0x80) << 12)
               | ((uint32_t) (s[2] ^ 0x80) << 6)
               | (uint32_t) (s[3] ^ 0x80);
        return 4;
    }
    return RET_ILSEQ;
}

// Adapted from libiconv
static int utf16le_wctomb(uint32_t wc, std::string &out)
{
    if (!(wc >= 0xd800 && wc < 0xe000)) {
        if (wc < 0x10000) {
            out += (char) (wc & 0xff);
            out += (char) ((wc >> 8) & 0xff);
            return 2;
        } else if (wc < 0x110000) {
            uint32_t wc1 = 0xd800 + ((wc - 0x10000) >> 10);
            uint32_t wc2 = 0xdc00 + ((wc - 0x10000) & 0x3ff);
            out += (char) (wc1 & 0xff);
            out += (char) ((wc1 >> 8) & 0xff);
            out += (char) (wc2 & 0xff);
            out += (char) ((wc2 >> 8) & 0xff);
            return 4;
        }
    }
    return RET_ILUNI;
}
