/*

imap.hpp
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

#include <list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "dialog.hpp"
#include "export.hpp"


namespace mailharvest
{


/**
IMAP client implementation.

Only the commands needed to read a mailbox are supported: `LOGIN`, `SELECT`, `SEARCH`, `FETCH`, `CLOSE` and `LOGOUT`.
**/
class MAILHARVEST_EXPORT imap
{
public:

    /**
    Mailbox statistics structure.
    **/
    struct mailbox_stat_t
    {
        /**
        Number of messages in the mailbox.
        **/
        unsigned long messages_no;

        /**
        Number of recent messages in the mailbox.
        **/
        unsigned long messages_recent;

        /**
        The non-zero message sequence number of the first unseen message in the mailbox.

        Zero indicates the server did not report this and no assumptions can be made about the first unseen message.
        **/
        unsigned long messages_first_unseen;

        /**
        The non-zero next unique identifier value of the mailbox.
        **/
        unsigned long uid_next;

        /**
        The non-zero unique identifier validity value of the mailbox.

        Zero indicates the server did not report this and does not support UIDs.
        **/
        unsigned long uid_validity;

        /**
        Setting the number of messages to zero.
        **/
        mailbox_stat_t() : messages_no(0), messages_recent(0), messages_first_unseen(0), uid_next(0), uid_validity(0)
        {
        }
    };

    /**
    Taking over a connected dialog.

    For the implicit TLS the dialog is expected to be already secured, the server greeting is read by `authenticate()`.

    @param dlg Connected dialog.
    **/
    explicit imap(std::shared_ptr<dialog> dlg);

    /**
    Closing the connection.
    **/
    virtual ~imap();

    imap(const imap&) = delete;

    imap(imap&&) = delete;

    void operator=(const imap&) = delete;

    void operator=(imap&&) = delete;

    /**
    Reading the server greeting and logging in.

    The `LOGIN` command is left out of the protocol trace.

    @param username   Username to authenticate.
    @param password   Password to authenticate.
    @return           The server greeting.
    @throw imap_error Connection to server failure.
    @throw imap_error Authentication failure.
    @throw *          `parse_tag_result(const std::string&)`, `dialog::send(const std::string&, bool)`, `dialog::receive(bool)`.
    **/
    std::string authenticate(const std::string& username, const std::string& password);

    /**
    Setting the label which prefixes the protocol trace lines.

    @param name Session label.
    **/
    void set_session_name(const std::string& name);

    /**
    Getting the label of the protocol trace lines.
    **/
    std::string session_name() const;

    /**
    Selecting a mailbox.

    @param mailbox    Mailbox to select.
    @return           Mailbox statistics.
    @throw imap_error Select mailbox failure.
    @throw imap_error Parsing failure.
    @throw imap_error No number of existing messages.
    @throw *          `parse_tag_result(const std::string&)`, `parse_response(const std::string&)`, `dialog::send(const std::string&, bool)`,
                      `dialog::receive(bool)`.
    **/
    mailbox_stat_t select(const std::string& mailbox);

    /**
    Searching the selected mailbox.

    @param conditions Search criteria as defined by the protocol, e.g. `ALL`.
    @param results    Sequence numbers of the found messages, in the order reported by the server.
    @throw imap_error Search mailbox failure.
    @throw imap_error Incorrect message id.
    @throw *          `parse_tag_result(const std::string&)`, `parse_response(const std::string&)`, `dialog::send(const std::string&, bool)`,
                      `dialog::receive(bool)`.
    **/
    void search(const std::string& conditions, std::list<unsigned long>& results);

    /**
    Fetching the full raw message by its sequence number.

    @param message_no Sequence number of the message.
    @return           Message bytes as sent by the server.
    @throw imap_error Fetching message failure.
    @throw imap_error No message fetched.
    @throw *          `parse_tag_result(const std::string&)`, `parse_response(const std::string&)`, `dialog::send(const std::string&, bool)`,
                      `dialog::receive(bool)`, `dialog::receive_bytes(std::size_t)`.
    **/
    std::string fetch(unsigned long message_no);

    /**
    Closing the selected mailbox.

    @throw imap_error Closing mailbox failure.
    @throw *          `parse_tag_result(const std::string&)`, `dialog::send(const std::string&, bool)`, `dialog::receive(bool)`.
    **/
    void close();

    /**
    Logging out from the server.

    @throw imap_error Logout failure.
    @throw *          `parse_tag_result(const std::string&)`, `dialog::send(const std::string&, bool)`, `dialog::receive(bool)`.
    **/
    void logout();

protected:

    /**
    Untagged response character as defined by the protocol.
    **/
    static const std::string UNTAGGED_RESPONSE;

    /**
    Character used by IMAP to separate tokens.
    **/
    static const char TOKEN_SEPARATOR_CHAR{' '};

    /**
    String representation of the token separator character.
    **/
    static const std::string TOKEN_SEPARATOR_STR;

    /**
    Character which begins the optional section.
    **/
    static const char OPTIONAL_BEGIN{'['};

    /**
    Character which ends the optional section.
    **/
    static const char OPTIONAL_END{']'};

    /**
    Character which begins the list.
    **/
    static const char LIST_BEGIN{'('};

    /**
    Character which ends the list.
    **/
    static const char LIST_END{')'};

    /**
    Character which begins the literal string.
    **/
    static const char STRING_LITERAL_BEGIN{'{'};

    /**
    Character which ends the literal string.
    **/
    static const char STRING_LITERAL_END{'}'};

    /**
    Delimiter of a quoted atom in the protocol.
    **/
    static const char QUOTED_ATOM{'"'};

    /**
    Escaping and quoting the string as an IMAP quoted string.

    @param text String to quote.
    @return     Quoted string.
    **/
    static std::string to_astring(const std::string& text);

    /**
    Reading the server greeting.

    @return           The greeting text.
    @throw imap_error Incorrect tag.
    @throw imap_error Connection to server failure.
    **/
    std::string connect();

    /**
    Sending the `LOGIN` command.

    @param username   Username to authenticate.
    @param password   Password to authenticate.
    @throw imap_error Authentication failure.
    **/
    void auth_login(const std::string& username, const std::string& password);

    /**
    Parsed elements of IMAP response line.
    **/
    struct tag_result_response_t
    {
        /**
        Possible response results.
        **/
        enum result_t {OK, NO, BAD};

        /**
        Tag of the response.
        **/
        std::string tag;

        /**
        Result of the response, if exists.
        **/
        std::optional<result_t> result;

        /**
        Rest of the response line.
        **/
        std::string response;

        tag_result_response_t() = default;

        /**
        Initializing the tag, result and rest of the line with the given values.
        **/
        tag_result_response_t(const std::string& parsed_tag, const std::optional<result_t>& parsed_result, const std::string& parsed_response) :
            tag(parsed_tag), result(parsed_result), response(parsed_response)
        {
        }

        tag_result_response_t(const tag_result_response_t&) = delete;

        tag_result_response_t(tag_result_response_t&&) = delete;

        ~tag_result_response_t() = default;

        tag_result_response_t& operator=(const tag_result_response_t&) = delete;

        tag_result_response_t& operator=(tag_result_response_t&&) = delete;

        /**
        Checking whether the result is present and equal to the given one.
        **/
        bool is(result_t expected) const
        {
            return result.has_value() && result.value() == expected;
        }
    };

    /**
    Parsing a line into tag, result and response which is the rest of the line.

    @param line       Response line to parse.
    @return           Tuple with the tag, result and response.
    @throw imap_error Parsing failure.
    */
    tag_result_response_t parse_tag_result(const std::string& line) const;

    /**
    Parsing a response (without tag and result) into optional and mandatory part.

    This is the main function that deals with the IMAP grammar.

    @param response   Response to parse without tag and result.
    @throw imap_error Parser failure.
    **/
    void parse_response(const std::string& response);

    /**
    Parsing an untagged response, reading the string literals it announces from the dialog.

    @param response Response to parse without tag and result.
    @throw *        `parse_response(const std::string&)`, `dialog::receive_bytes(std::size_t)`, `dialog::receive(bool)`.
    **/
    void parse_untagged(const std::string& response);

    /**
    Resetting the parser state to the initial one.
    **/
    void reset_response_parser();

    /**
    Formatting a tagged command.

    @param command Command to format.
    @return        New tag as string.
    **/
    std::string format(const std::string& command);

    /**
    Reading the responses of a command without data up to its tagged completion, untagged responses are skipped.

    @param failure_message Message of the error thrown when the command is refused.
    @throw imap_error      Tagged result is not `OK`.
    @throw imap_error      Incorrect tag.
    **/
    void receive_completion(const std::string& failure_message);

    /**
    Trimming trailing CR character.

    @param line Line to trim.
    **/
    static void trim_eol(std::string& line);

    /**
    Dialog to use for send/receive operations.
    **/
    std::shared_ptr<dialog> dlg_;

    /**
    Tag used to identify requests and responses.
    **/
    unsigned tag_;

    /**
    Token of the response defined by the grammar.

    Its type is determined by the content, and can be either atom, string literal or parenthesized list. Thus, it can be considered as union of
    those three types.
    **/
    struct response_token_t
    {
        /**
        Token type which can be empty in the case that is not determined yet, atom, string literal or parenthesized list.
        **/
        enum class token_type_t {EMPTY, ATOM, LITERAL, LIST} token_type;

        /**
        Token content in case it is atom.
        **/
        std::string atom;

        /**
        Token content in case it is string literal.
        **/
        std::string literal;

        /**
        String literal is first determined by its size, so it's stored here before reading the literal itself.
        **/
        std::string literal_size;

        /**
        Token content in case it is parenthesized list.

        It can store either of the three types, so the definition is recursive.
        **/
        std::list<std::shared_ptr<response_token_t>> parenthesized_list;

        /**
        Default constructor.
        **/
        response_token_t() : token_type(token_type_t::EMPTY)
        {
        }
    };

    /**
    Optional part of the response, determined by the square brackets.
    **/
    std::list<std::shared_ptr<response_token_t>> optional_part_;

    /**
    Mandatory part of the response, which is any text outside of the square brackets.
    **/
    std::list<std::shared_ptr<response_token_t>> mandatory_part_;

    /**
    Parser state if an optional part is reached.
    **/
    bool optional_part_state_;

    /**
    Parser state if an atom is reached.
    **/
    enum class atom_state_t {NONE, PLAIN, QUOTED} atom_state_;

    /**
    Counting open parenthesis of a parenthized list, thus it also keeps parser state if a parenthesized list is reached.
    **/
    unsigned int parenthesis_list_counter_;

    /**
    Parser state if a string literal is reached.
    **/
    enum class string_literal_state_t {NONE, SIZE, WAITING, READING, DONE} literal_state_;

    /**
    Finding last token of the list at the given depth in terms of parenthesis count.

    When a new token is found, this method enables to find the last current token and append the new one.

    @param token_list Token sequence to traverse.
    @return           Last token of the given sequence at the current depth of parenthesis count.
    **/
    std::list<std::shared_ptr<response_token_t>>* find_last_token_list(std::list<std::shared_ptr<response_token_t>>& token_list);
};


/**
Error thrown by IMAP client.
**/
class MAILHARVEST_EXPORT imap_error : public dialog_error
{
public:

    /**
    Calling parent constructor.

    @param msg  Error message.
    @param details Detailed message.
    **/
    imap_error(const std::string& msg, const std::string& details);

    /**
    Calling parent constructor.

    @param msg  Error message.
    @param details Detailed message.
    **/
    explicit imap_error(const char* msg, const std::string& details);

    imap_error(const imap_error&) = default;

    imap_error(imap_error&&) = default;

    ~imap_error() = default;

    imap_error& operator=(const imap_error&) = default;

    imap_error& operator=(imap_error&&) = default;
};


} // namespace mailharvest


#ifdef _MSC_VER
#pragma warning(pop)
#endif
