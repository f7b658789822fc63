/*

mime.cpp
--------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <utility>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <mailharvest/codec.hpp>
#include <mailharvest/mime.hpp>


using std::move;
using std::string;
using std::vector;
using boost::icontains;
using boost::regex;
using boost::regex_match;
using boost::algorithm::to_lower_copy;
using boost::algorithm::trim_copy;
using boost::algorithm::trim_right_copy;


namespace mailharvest
{


const string mime::CONTENT_TYPE_HEADER{"Content-Type"};
const string mime::CONTENT_TRANSFER_ENCODING_HEADER{"Content-Transfer-Encoding"};
const string mime::CONTENT_DISPOSITION_HEADER{"Content-Disposition"};


namespace
{

const char HEADER_SEPARATOR_CHAR{':'};
const char PARAMETER_SEPARATOR_CHAR{';'};
const string BOUNDARY_DELIMITER{"--"};


/*
Splitting the text into lines, CRLF and LF both end a line. A final line ending does not start a new line.
*/
vector<string> split_lines(const string& text)
{
    vector<string> lines;
    string::size_type start = 0;
    while (start < text.size())
    {
        string::size_type end = text.find('\n', start);
        if (end == string::npos)
            end = text.size();
        string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(move(line));
        start = end + 1;
    }
    return lines;
}


bool is_header_name(const string& name)
{
    if (name.empty())
        return false;
    for (char ch : name)
        if (ch <= ' ' || ch > '~' || ch == HEADER_SEPARATOR_CHAR)
            return false;
    return true;
}


/*
Splitting the header value at the semicolons which are not quoted.
*/
vector<string> split_parameters(const string& value)
{
    vector<string> segments;
    string segment;
    bool quoted = false;
    for (string::size_type i = 0; i < value.size(); i++)
    {
        const char ch = value[i];
        if (quoted && ch == codec::BACKSLASH_CHAR && i + 1 < value.size())
        {
            segment += ch;
            segment += value[++i];
            continue;
        }
        if (ch == codec::QUOTE_CHAR)
            quoted = !quoted;
        if (ch == PARAMETER_SEPARATOR_CHAR && !quoted)
        {
            segments.push_back(trim_copy(segment));
            segment.clear();
        }
        else
            segment += ch;
    }
    segments.push_back(trim_copy(segment));
    return segments;
}


string unquote(const string& value)
{
    if (value.size() < 2 || value.front() != codec::QUOTE_CHAR || value.back() != codec::QUOTE_CHAR)
        return value;
    string unquoted;
    for (string::size_type i = 1; i + 1 < value.size(); i++)
    {
        if (value[i] == codec::BACKSLASH_CHAR && i + 2 < value.size())
            i++;
        unquoted += value[i];
    }
    return unquoted;
}

} // anonymous namespace


string content_type_t::media_type() const
{
    if (type.empty() || subtype.empty())
        return string();
    return type + "/" + subtype;
}


string content_type_t::charset() const
{
    auto it = attributes.find("charset");
    return it == attributes.end() ? string() : it->second;
}


string content_type_t::boundary() const
{
    auto it = attributes.find("boundary");
    return it == attributes.end() ? string() : it->second;
}


mime::mime() : encoding_(content_transfer_encoding_t::NONE)
{
}


void mime::parse(const string& mime_string)
{
    if (mime_string.empty())
        throw mime_error("Parsing failure.", "Empty message.");

    headers_.clear();
    content_type_ = content_type_t();
    encoding_ = content_transfer_encoding_t::NONE;
    content_.clear();
    parts_.clear();
    parse_lines(split_lines(mime_string), 0);
}


const headers_t& mime::headers() const
{
    return headers_;
}


string mime::header(const string& name) const
{
    auto it = headers_.find(name);
    return it == headers_.end() ? string() : it->second;
}


bool mime::has_header(const string& name) const
{
    return headers_.find(name) != headers_.end();
}


const content_type_t& mime::content_type() const
{
    return content_type_;
}


mime::content_transfer_encoding_t mime::encoding() const
{
    return encoding_;
}


string mime::disposition() const
{
    return header(CONTENT_DISPOSITION_HEADER);
}


bool mime::is_attachment() const
{
    return icontains(disposition(), "attachment");
}


bool mime::is_multipart() const
{
    return !parts_.empty();
}


const string& mime::content() const
{
    return content_;
}


string mime::decoded_content() const
{
    if (!parts_.empty())
        return string();

    switch (encoding_)
    {
        case content_transfer_encoding_t::BASE_64:
            return codec::decode_base64(content_);

        case content_transfer_encoding_t::QUOTED_PRINTABLE:
            return codec::decode_quoted_printable(content_);

        default:
            return content_;
    }
}


string mime::text_content() const
{
    return codec::to_utf8(decoded_content(), content_type_.charset());
}


const vector<mime>& mime::parts() const
{
    return parts_;
}


vector<const mime*> mime::walk() const
{
    vector<const mime*> entities;
    walk(entities);
    return entities;
}


void mime::walk(vector<const mime*>& entities) const
{
    entities.push_back(this);
    for (const auto& part : parts_)
        part.walk(entities);
}


/*
Header lines are unfolded first: a line starting with a space or a tab continues the previous header. The header block ends with the first empty line,
or with the first line which is not a header at all; in the latter case that line already belongs to the body.
*/
void mime::parse_lines(const vector<string>& lines, unsigned int level)
{
    vector<string>::size_type body_start = lines.size();
    string folded_header;
    for (vector<string>::size_type i = 0; i < lines.size(); i++)
    {
        const string& line = lines[i];
        if (line.empty())
        {
            body_start = i + 1;
            break;
        }

        if (line.front() == ' ' || line.front() == '\t')
        {
            // A continuation without a header to continue is skipped.
            if (!folded_header.empty())
                folded_header += line;
            continue;
        }

        string::size_type colon_pos = line.find(HEADER_SEPARATOR_CHAR);
        if (colon_pos == string::npos || !is_header_name(trim_right_copy(line.substr(0, colon_pos))))
        {
            body_start = i;
            break;
        }

        if (!folded_header.empty())
            parse_header_line(folded_header);
        folded_header = line;
    }
    if (!folded_header.empty())
        parse_header_line(folded_header);

    content_type_ = parse_content_type(header(CONTENT_TYPE_HEADER));
    encoding_ = parse_content_transfer_encoding(header(CONTENT_TRANSFER_ENCODING_HEADER));

    vector<string> body_lines;
    if (body_start < lines.size())
        body_lines.assign(lines.begin() + body_start, lines.end());
    content_ = boost::algorithm::join(body_lines, "\n");

    if (level >= MAX_NESTING)
        return;

    if (content_type_.type == "multipart" && !content_type_.boundary().empty())
        parse_parts(body_lines, level);
    else if (content_type_.media_type() == "message/rfc822" && !body_lines.empty())
    {
        mime embedded;
        embedded.parse_lines(body_lines, level + 1);
        parts_.push_back(move(embedded));
    }
}


void mime::parse_header_line(const string& header_line)
{
    string::size_type colon_pos = header_line.find(HEADER_SEPARATOR_CHAR);
    string name = trim_copy(header_line.substr(0, colon_pos));
    headers_.emplace(name, trim_copy(header_line.substr(colon_pos + 1)));
}


content_type_t mime::parse_content_type(const string& header_value)
{
    static const regex MEDIA_TYPE_REGEX{"([a-z0-9!#$&^_.+-]+)/([a-z0-9!#$&^_.+-]+)"};

    content_type_t content_type;
    if (trim_copy(header_value).empty())
        return content_type;

    vector<string> segments = split_parameters(header_value);
    boost::smatch match;
    const string media = to_lower_copy(segments.front());
    if (regex_match(media, match, MEDIA_TYPE_REGEX))
    {
        content_type.type = match[1].str();
        content_type.subtype = match[2].str();
    }

    for (auto it = segments.begin() + 1; it != segments.end(); it++)
    {
        string::size_type equal_pos = it->find(codec::EQUAL_CHAR);
        if (equal_pos == string::npos)
            continue;
        string name = to_lower_copy(trim_copy(it->substr(0, equal_pos)));
        if (name.empty())
            continue;
        content_type.attributes[name] = unquote(trim_copy(it->substr(equal_pos + 1)));
    }
    return content_type;
}


auto mime::parse_content_transfer_encoding(const string& header_value) -> content_transfer_encoding_t
{
    const string encoding = to_lower_copy(trim_copy(header_value));
    if (encoding == "base64")
        return content_transfer_encoding_t::BASE_64;
    if (encoding == "quoted-printable")
        return content_transfer_encoding_t::QUOTED_PRINTABLE;
    if (encoding == "7bit")
        return content_transfer_encoding_t::BIT_7;
    if (encoding == "8bit")
        return content_transfer_encoding_t::BIT_8;
    if (encoding == "binary")
        return content_transfer_encoding_t::BINARY;
    return content_transfer_encoding_t::NONE;
}


/*
The preamble before the first delimiter and the epilogue after the closing delimiter are dropped. A missing closing delimiter ends the last part at
the end of the body. If no delimiter is found at all, the entity keeps its body as a single payload.
*/
void mime::parse_parts(const vector<string>& body_lines, unsigned int level)
{
    const string delimiter = BOUNDARY_DELIMITER + content_type_.boundary();
    const string close_delimiter = delimiter + BOUNDARY_DELIMITER;

    bool in_part = false;
    vector<string> part_lines;
    auto add_part = [&]()
    {
        mime part;
        part.parse_lines(part_lines, level + 1);
        parts_.push_back(move(part));
        part_lines.clear();
    };

    for (const auto& line : body_lines)
    {
        const string trimmed = trim_right_copy(line);
        if (trimmed == close_delimiter)
        {
            if (in_part)
                add_part();
            in_part = false;
            break;
        }
        if (trimmed == delimiter)
        {
            if (in_part)
                add_part();
            in_part = true;
            continue;
        }
        if (in_part)
            part_lines.push_back(line);
    }
    if (in_part)
        add_part();
}


mime_error::mime_error(const string& msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


string mime_error::details() const
{
    return details_;
}


} // namespace mailharvest
