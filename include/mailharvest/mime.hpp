/*

mime.hpp
--------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include "export.hpp"


namespace mailharvest
{


/**
Case insensitive ordering of the header names.
**/
struct header_name_less
{
    bool operator()(const std::string& lhs, const std::string& rhs) const
    {
        return boost::ilexicographical_compare(lhs, rhs);
    }
};


/**
Header fields in the order of appearance, names compared case insensitively.
**/
typedef std::multimap<std::string, std::string, header_name_less> headers_t;


/**
Content type of a MIME entity.

The type and subtype are lower case. Both are empty if the header is missing or cannot be parsed.
**/
struct MAILHARVEST_EXPORT content_type_t
{
    /**
    Top level media type, e.g. `text`.
    **/
    std::string type;

    /**
    Media subtype, e.g. `plain`.
    **/
    std::string subtype;

    /**
    Parameters with lower case names and unquoted values.
    **/
    std::map<std::string, std::string> attributes;

    /**
    Media type as `type/subtype`, empty if unknown.
    **/
    std::string media_type() const;

    /**
    Value of the `charset` parameter, empty if missing.
    **/
    std::string charset() const;

    /**
    Value of the `boundary` parameter, empty if missing.
    **/
    std::string boundary() const;
};


/**
Parsed MIME entity: a message or one of its body parts.

The parser is lenient. Malformed headers are skipped, a multipart entity without a usable boundary keeps its body as a single payload,
a missing or garbled content type leaves the media type unknown.
**/
class MAILHARVEST_EXPORT mime
{
public:

    /**
    Content transfer encodings.
    **/
    enum class content_transfer_encoding_t {NONE, BIT_7, BIT_8, BINARY, BASE_64, QUOTED_PRINTABLE};

    /**
    Maximum nesting of parts, deeper entities are kept as unparsed payloads.
    **/
    static const unsigned int MAX_NESTING = 32;

    /**
    Content type header name.
    **/
    static const std::string CONTENT_TYPE_HEADER;

    /**
    Content transfer encoding header name.
    **/
    static const std::string CONTENT_TRANSFER_ENCODING_HEADER;

    /**
    Content disposition header name.
    **/
    static const std::string CONTENT_DISPOSITION_HEADER;

    /**
    Default constructor.
    **/
    mime();

    mime(const mime&) = default;

    mime(mime&&) = default;

    ~mime() = default;

    mime& operator=(const mime&) = default;

    mime& operator=(mime&&) = default;

    /**
    Parsing the raw entity.

    Line endings may be CRLF, LF or mixed.

    @param mime_string Raw entity, headers followed by the body.
    @throw mime_error  Empty message.
    **/
    void parse(const std::string& mime_string);

    /**
    All headers, values unfolded.
    **/
    const headers_t& headers() const;

    /**
    Getting the value of the first header with the given name.

    @param name Header name, case insensitive.
    @return     Header value or empty string if the header does not exist.
    **/
    std::string header(const std::string& name) const;

    /**
    Checking whether the header exists.

    @param name Header name, case insensitive.
    **/
    bool has_header(const std::string& name) const;

    /**
    Content type of the entity.
    **/
    const content_type_t& content_type() const;

    /**
    Content transfer encoding of the entity.
    **/
    content_transfer_encoding_t encoding() const;

    /**
    Raw content disposition header value.
    **/
    std::string disposition() const;

    /**
    Checking whether the disposition marks the entity as an attachment.
    **/
    bool is_attachment() const;

    /**
    Checking whether the entity has child parts.

    True for a multipart entity whose boundary was found and for an embedded `message/rfc822`.
    **/
    bool is_multipart() const;

    /**
    Raw body, still transfer encoded.
    **/
    const std::string& content() const;

    /**
    Body decoded from its transfer encoding, empty for an entity with parts.
    **/
    std::string decoded_content() const;

    /**
    Decoded body converted from its charset to valid UTF-8.
    **/
    std::string text_content() const;

    /**
    Child parts.
    **/
    const std::vector<mime>& parts() const;

    /**
    Getting the entity and all its descendants, depth first, the entity itself first.

    @return Pointers into this entity tree.
    **/
    std::vector<const mime*> walk() const;

protected:

    /**
    Parsing the entity at the given nesting level.

    @param lines Lines of the entity without line endings.
    @param level Nesting level.
    **/
    void parse_lines(const std::vector<std::string>& lines, unsigned int level);

    /**
    Storing a single unfolded header line.

    @param header_line Line of the form `name: value`, with the name already validated.
    **/
    void parse_header_line(const std::string& header_line);

    /**
    Parsing the content type header value.

    @param header_value Header value.
    @return             Parsed content type, type and subtype empty when garbled.
    **/
    static content_type_t parse_content_type(const std::string& header_value);

    /**
    Parsing the content transfer encoding header value.

    @param header_value Header value.
    @return             Encoding, `NONE` when unknown.
    **/
    static content_transfer_encoding_t parse_content_transfer_encoding(const std::string& header_value);

    /**
    Splitting the body of a multipart entity and parsing its parts.

    @param body_lines Body lines.
    @param level      Nesting level of the entity.
    **/
    void parse_parts(const std::vector<std::string>& body_lines, unsigned int level);

    /**
    Collecting the entity and its descendants.

    @param entities Collected entities.
    **/
    void walk(std::vector<const mime*>& entities) const;

    /**
    Headers.
    **/
    headers_t headers_;

    /**
    Content type.
    **/
    content_type_t content_type_;

    /**
    Transfer encoding.
    **/
    content_transfer_encoding_t encoding_;

    /**
    Raw body.
    **/
    std::string content_;

    /**
    Child parts.
    **/
    std::vector<mime> parts_;
};


/**
Error thrown by the MIME parser.
**/
class MAILHARVEST_EXPORT mime_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor and storing the details.

    @param msg     Error message.
    @param details Detailed message.
    **/
    mime_error(const std::string& msg, const std::string& details);

    mime_error(const mime_error&) = default;

    mime_error(mime_error&&) = default;

    ~mime_error() = default;

    mime_error& operator=(const mime_error&) = default;

    mime_error& operator=(mime_error&&) = default;

    /**
    Getting the detailed error message.
    **/
    std::string details() const;

protected:

    /**
    Detailed error message.
    **/
    std::string details_;
};


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
