/*

encoded_word.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <boost/algorithm/string.hpp>


namespace mailview::codec
{


/**
One decoded RFC 2047 word.
**/
struct decoded_word
{
    std::string text;
    std::string charset;
};


/**
Decoder of RFC 2047 encoded words (`=?charset?B?...?=` and `=?charset?Q?...?=`).

Only the transfer encoding is undone; the bytes keep the charset they were written in.
Used for display, so it never throws: malformed words are reported as absent.
**/
class encoded_word
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string BASE64_CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Decoding one word, delimiters included.

    @param word Text such as `=?UTF-8?Q?Caf=C3=A9?=`.
    @return     Decoded text and its upper-cased charset, or nothing if the word is malformed.
    **/
    [[nodiscard]] static std::optional<decoded_word> decode(std::string_view word)
    {
        if (word.size() < 8 || !word.starts_with("=?") || !word.ends_with("?="))
            return std::nullopt;
        auto inner = word.substr(2, word.size() - 4);

        auto method_pos = inner.find(QUESTION_MARK_CHAR);
        if (method_pos == std::string_view::npos || method_pos == 0)
            return std::nullopt;
        auto content_pos = inner.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string_view::npos)
            return std::nullopt;
        if (inner.find(QUESTION_MARK_CHAR, content_pos + 1) != std::string_view::npos)
            return std::nullopt;

        std::string charset = boost::to_upper_copy(std::string(inner.substr(0, method_pos)));
        std::string method(inner.substr(method_pos + 1, content_pos - method_pos - 1));
        auto content = inner.substr(content_pos + 1);

        std::optional<std::string> text;
        if (boost::iequals(method, BASE64_CODEC_STR))
            text = decode_base64(content);
        else if (boost::iequals(method, QP_CODEC_STR))
            text = decode_q(content);
        if (!text)
            return std::nullopt;
        return decoded_word{std::move(*text), std::move(charset)};
    }

    /**
    Decoding every encoded word of a header value.

    Whitespace between two adjacent encoded words is dropped; other text is copied as is.

    @param text Header value.
    @return     Value with the encoded words replaced by their decoded bytes.
    **/
    [[nodiscard]] static std::string decode_all(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        std::string pending_space;
        bool prev_was_word = false;

        std::size_t pos = 0;
        while (pos < text.size())
        {
            auto start = text.find("=?", pos);
            if (start == std::string_view::npos)
            {
                out += pending_space;
                out.append(text.substr(pos));
                return out;
            }

            auto between = text.substr(pos, start - pos);
            auto word_end = find_word_end(text, start);
            std::optional<decoded_word> word;
            if (word_end != std::string_view::npos)
                word = decode(text.substr(start, word_end - start));

            if (!word)
            {
                out += pending_space;
                pending_space.clear();
                out.append(text.substr(pos, start + 2 - pos));
                pos = start + 2;
                prev_was_word = false;
                continue;
            }

            if (!(prev_was_word && is_blank(between)))
            {
                out += pending_space;
                out.append(between);
            }
            pending_space.clear();
            out += word->text;
            pos = word_end;
            prev_was_word = true;

            // Keep the whitespace following a word aside until it is known whether another word comes next.
            auto after = pos;
            while (after < text.size() && (text[after] == ' ' || text[after] == '\t'))
                ++after;
            pending_space.assign(text.substr(pos, after - pos));
            pos = after;
        }
        out += pending_space;
        return out;
    }

    /**
    Decoding base64 text; padding is optional.

    @param text Base64 encoded text.
    @return     Decoded bytes, or nothing on a character outside the alphabet.
    **/
    [[nodiscard]] static std::optional<std::string> decode_base64(std::string_view text)
    {
        std::string dec_text;
        unsigned char sextets[SEXTETS_NO]{};
        int count_4_chars = 0;

        for (char ch : text)
        {
            if (ch == EQUAL_CHAR)
                break;
            auto idx = BASE64_CHARSET.find(ch);
            if (idx == std::string::npos)
                return std::nullopt;

            sextets[count_4_chars++] = static_cast<unsigned char>(idx);
            if (count_4_chars == SEXTETS_NO)
            {
                append_octets(dec_text, sextets, OCTETS_NO);
                count_4_chars = 0;
            }
        }

        if (count_4_chars == 1)
            return std::nullopt;
        if (count_4_chars > 0)
        {
            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            append_octets(dec_text, sextets, count_4_chars - 1);
        }
        return dec_text;
    }

    /**
    Decoding the Q variant of quoted printable: `_` is a space, `=XX` a byte.

    @param text Q encoded text.
    @return     Decoded bytes, or nothing on a bad escape.
    **/
    [[nodiscard]] static std::optional<std::string> decode_q(std::string_view text)
    {
        std::string dec_text;
        dec_text.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            char ch = text[i];
            if (ch == UNDERSCORE_CHAR)
                dec_text += ' ';
            else if (ch == EQUAL_CHAR)
            {
                if (i + 2 >= text.size())
                    return std::nullopt;
                int hi = hex_digit_to_int(text[i + 1]);
                int lo = hex_digit_to_int(text[i + 2]);
                if (hi < 0 || lo < 0)
                    return std::nullopt;
                dec_text += static_cast<char>(hi * 16 + lo);
                i += 2;
            }
            else
                dec_text += ch;
        }
        return dec_text;
    }

private:

    inline static const std::string BASE64_CODEC_STR{"B"};

    inline static const std::string QP_CODEC_STR{"Q"};

    static constexpr char QUESTION_MARK_CHAR = '?';

    static constexpr char EQUAL_CHAR = '=';

    static constexpr char UNDERSCORE_CHAR = '_';

    static constexpr int SEXTETS_NO = 4;

    static constexpr int OCTETS_NO = SEXTETS_NO - 1;

    static void append_octets(std::string& out, const unsigned char* sextets, int count)
    {
        unsigned char octets[OCTETS_NO];
        octets[0] = static_cast<unsigned char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
        octets[1] = static_cast<unsigned char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2));
        octets[2] = static_cast<unsigned char>(((sextets[2] & 0x3) << 6) + sextets[3]);
        for (int i = 0; i < count; i++)
            out += static_cast<char>(octets[i]);
    }

    static constexpr int hex_digit_to_int(char digit) noexcept
    {
        if (digit >= '0' && digit <= '9')
            return digit - '0';
        if (digit >= 'A' && digit <= 'F')
            return digit - 'A' + 10;
        if (digit >= 'a' && digit <= 'f')
            return digit - 'a' + 10;
        return -1;
    }

    static bool is_blank(std::string_view s) noexcept
    {
        for (char c : s)
        {
            if (c != ' ' && c != '\t')
                return false;
        }
        return true;
    }

    /**
    Position just past the `?=` closing the word starting at `start`, or npos.

    The word is `=?charset?method?text?=`, so the closing `?=` comes after the third question mark.
    **/
    static std::size_t find_word_end(std::string_view text, std::size_t start) noexcept
    {
        auto q1 = text.find(QUESTION_MARK_CHAR, start + 2);
        if (q1 == std::string_view::npos)
            return std::string_view::npos;
        auto q2 = text.find(QUESTION_MARK_CHAR, q1 + 1);
        if (q2 == std::string_view::npos)
            return std::string_view::npos;
        auto close = text.find("?=", q2 + 1);
        if (close == std::string_view::npos)
            return std::string_view::npos;
        return close + 2;
    }
};


} // namespace mailview::codec
