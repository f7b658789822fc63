/*

imap.cpp
--------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <algorithm>
#include <cctype>
#include <iterator>
#include <memory>
#include <string>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <mailharvest/codec.hpp>
#include <mailharvest/imap.hpp>


using std::invalid_argument;
using std::list;
using std::make_optional;
using std::make_shared;
using std::move;
using std::optional;
using std::out_of_range;
using std::shared_ptr;
using std::stoul;
using std::string;
using std::to_string;
using boost::iequals;
using boost::trim;


namespace mailharvest
{


const string imap::UNTAGGED_RESPONSE{"*"};
const string imap::TOKEN_SEPARATOR_STR{" "};


namespace
{

bool is_number(const string& atom)
{
    return !atom.empty() && std::all_of(atom.begin(), atom.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
}

} // anonymous namespace


string imap::to_astring(const string& text)
{
    return codec::surround_string(codec::escape_string(text, "\"\\"));
}


imap::imap(shared_ptr<dialog> dlg) : dlg_(move(dlg)), tag_(0), optional_part_state_(false), atom_state_(atom_state_t::NONE),
    parenthesis_list_counter_(0), literal_state_(string_literal_state_t::NONE)
{
}


imap::~imap()
{
    if (dlg_)
        dlg_->close();
}


string imap::authenticate(const string& username, const string& password)
{
    string greeting = connect();
    auth_login(username, password);
    return greeting;
}


void imap::set_session_name(const string& name)
{
    // Stored on the dialog so the low level trace lines carry the label.
    dlg_->set_session_name(name);
}


string imap::session_name() const
{
    return dlg_->session_name();
}


auto imap::select(const string& mailbox) -> mailbox_stat_t
{
    dlg_->send(format("SELECT " + to_astring(mailbox)));

    mailbox_stat_t stat;
    bool exists_found = false;
    bool has_more = true;

    try
    {
        while (has_more)
        {
            reset_response_parser();
            string line = dlg_->receive();
            tag_result_response_t parsed_line = parse_tag_result(line);

            if (parsed_line.tag == UNTAGGED_RESPONSE)
            {
                parse_untagged(parsed_line.response);
                if (parsed_line.is(tag_result_response_t::OK))
                {
                    if (optional_part_.size() != 2)
                        continue;

                    auto key = optional_part_.front();
                    auto value = optional_part_.back();
                    if (key->token_type != response_token_t::token_type_t::ATOM || value->token_type != response_token_t::token_type_t::ATOM)
                        continue;

                    if (iequals(key->atom, "UNSEEN"))
                        stat.messages_first_unseen = stoul(value->atom);
                    else if (iequals(key->atom, "UIDNEXT"))
                        stat.uid_next = stoul(value->atom);
                    else if (iequals(key->atom, "UIDVALIDITY"))
                        stat.uid_validity = stoul(value->atom);
                }
                else if (mandatory_part_.size() == 2 && mandatory_part_.front()->token_type == response_token_t::token_type_t::ATOM &&
                    mandatory_part_.back()->token_type == response_token_t::token_type_t::ATOM)
                {
                    auto value = mandatory_part_.front();
                    auto key = mandatory_part_.back();
                    if (iequals(key->atom, "EXISTS"))
                    {
                        stat.messages_no = stoul(value->atom);
                        exists_found = true;
                    }
                    else if (iequals(key->atom, "RECENT"))
                        stat.messages_recent = stoul(value->atom);
                }
            }
            else if (parsed_line.tag == to_string(tag_))
            {
                if (!parsed_line.is(tag_result_response_t::OK))
                    throw imap_error("Select mailbox failure.", "Response=`" + parsed_line.response + "`.");

                has_more = false;
            }
            else
                throw imap_error("Parsing failure.", "Line=`" + line + "`.");
        }
    }
    catch (const invalid_argument& exc)
    {
        throw imap_error("Integer expected.", exc.what());
    }
    catch (const out_of_range& exc)
    {
        throw imap_error("Integer expected.", exc.what());
    }

    // The RECENT is gone from the newer protocol revision, so only EXISTS is required.
    if (!exists_found)
        throw imap_error("No number of existing messages.", "Mailbox=`" + mailbox + "`.");

    reset_response_parser();
    return stat;
}


void imap::search(const string& conditions, list<unsigned long>& results)
{
    dlg_->send(format("SEARCH " + conditions));

    bool has_more = true;
    try
    {
        while (has_more)
        {
            reset_response_parser();
            string line = dlg_->receive();
            tag_result_response_t parsed_line = parse_tag_result(line);
            if (parsed_line.tag == UNTAGGED_RESPONSE)
            {
                parse_untagged(parsed_line.response);
                if (mandatory_part_.empty())
                    continue;

                auto search_token = mandatory_part_.front();
                // Other untagged responses, e.g. EXISTS, may arrive at any time.
                if (search_token->token_type != response_token_t::token_type_t::ATOM || !iequals(search_token->atom, "SEARCH"))
                    continue;
                mandatory_part_.pop_front();

                for (auto it = mandatory_part_.begin(); it != mandatory_part_.end(); it++)
                    if ((*it)->token_type == response_token_t::token_type_t::ATOM)
                    {
                        const unsigned long idx = stoul((*it)->atom);
                        if (idx == 0)
                            throw imap_error("Incorrect message id.", "Line=`" + line + "`.");
                        results.push_back(idx);
                    }
            }
            else if (parsed_line.tag == to_string(tag_))
            {
                if (!parsed_line.is(tag_result_response_t::OK))
                    throw imap_error("Search mailbox failure.", "Line=`" + line + "`.");

                has_more = false;
            }
            else
                throw imap_error("Incorrect tag parsed.", "Tag=`" + parsed_line.tag + "`.");
        }
    }
    catch (const invalid_argument& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }
    catch (const out_of_range& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }
    reset_response_parser();
}


/*
According to the RFC 3501 section 6.4.5, the untagged response of the fetch command is not mandatory. Thus, some servers return just the tagged response if
no message is found, which is reported as an error here.

The message comes as a string literal announced by `{N}` at the end of the untagged line; `parse_untagged()` reads exactly that many bytes, so the
line endings inside the message are kept as sent.
*/
string imap::fetch(unsigned long message_no)
{
    dlg_->send(format("FETCH " + to_string(message_no) + TOKEN_SEPARATOR_STR + "(RFC822)"));

    optional<string> raw;
    bool has_more = true;
    try
    {
        while (has_more)
        {
            reset_response_parser();
            string line = dlg_->receive();
            tag_result_response_t parsed_line = parse_tag_result(line);

            if (parsed_line.tag == UNTAGGED_RESPONSE)
            {
                parse_untagged(parsed_line.response);

                // Unsolicited untagged responses such as EXISTS or FLAGS updates of other messages are skipped.
                if (mandatory_part_.size() < 3)
                    continue;
                auto token = mandatory_part_.begin();
                if ((*token)->token_type != response_token_t::token_type_t::ATOM || !is_number((*token)->atom) || stoul((*token)->atom) != message_no)
                    continue;
                ++token;
                if ((*token)->token_type != response_token_t::token_type_t::ATOM || !iequals((*token)->atom, "FETCH"))
                    continue;
                ++token;
                if ((*token)->token_type != response_token_t::token_type_t::LIST)
                    continue;

                const auto& fetch_data = (*token)->parenthesized_list;
                for (auto item = fetch_data.begin(); item != fetch_data.end(); item++)
                {
                    if ((*item)->token_type != response_token_t::token_type_t::ATOM || !iequals((*item)->atom, "RFC822"))
                        continue;
                    auto value = std::next(item);
                    if (value == fetch_data.end())
                        throw imap_error("No literal when fetching a message.", "Line=`" + line + "`.");
                    if ((*value)->token_type == response_token_t::token_type_t::LITERAL)
                        raw = make_optional((*value)->literal);
                    else if ((*value)->token_type == response_token_t::token_type_t::ATOM && !iequals((*value)->atom, "NIL"))
                        raw = make_optional((*value)->atom);
                    break;
                }
            }
            else if (parsed_line.tag == to_string(tag_))
            {
                if (!parsed_line.is(tag_result_response_t::OK))
                    throw imap_error("Fetching message failure.", "Response=`" + parsed_line.response + "`.");
                has_more = false;
            }
            else
                throw imap_error("Invalid tag when fetching a message.", "Parsed tag=`" + parsed_line.tag + "`.");
        }
    }
    catch (const invalid_argument& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }
    catch (const out_of_range& exc)
    {
        throw imap_error("Parsing failure.", exc.what());
    }

    reset_response_parser();
    if (!raw.has_value())
        throw imap_error("No message fetched.", "Message=`" + to_string(message_no) + "`.");
    return move(raw.value());
}


void imap::close()
{
    dlg_->send(format("CLOSE"));
    receive_completion("Closing mailbox failure.");
}


void imap::logout()
{
    dlg_->send(format("LOGOUT"));
    // The untagged BYE precedes the tagged completion.
    receive_completion("Logout failure.");
}


string imap::connect()
{
    // read greetings message
    string line = dlg_->receive();
    tag_result_response_t parsed_line = parse_tag_result(line);

    if (parsed_line.tag != UNTAGGED_RESPONSE)
        throw imap_error("Incorrect tag.", "Tag=`" + parsed_line.tag + "`.");
    if (!parsed_line.is(tag_result_response_t::OK))
        throw imap_error("Connection to server failure.", "Line=`" + line + "`.");
    return parsed_line.response;
}


void imap::auth_login(const string& username, const string& password)
{
    auto user_esc = to_astring(username);
    auto pass_esc = to_astring(password);
    auto cmd = format("LOGIN " + user_esc + TOKEN_SEPARATOR_STR + pass_esc);
    dlg_->send(cmd, true);
    receive_completion("Authentication failure.");
}


void imap::receive_completion(const string& failure_message)
{
    bool has_more = true;
    while (has_more)
    {
        string line = dlg_->receive();
        tag_result_response_t parsed_line = parse_tag_result(line);

        if (parsed_line.tag == UNTAGGED_RESPONSE)
            continue;
        if (parsed_line.tag != to_string(tag_))
            throw imap_error("Incorrect tag.", "Tag=`" + parsed_line.tag + "`.");
        if (!parsed_line.is(tag_result_response_t::OK))
            throw imap_error(failure_message, "Line=`" + line + "`.");

        has_more = false;
    }
}


auto imap::parse_tag_result(const string& line) const -> tag_result_response_t
{
    string::size_type tag_pos = line.find(TOKEN_SEPARATOR_STR);
    if (tag_pos == string::npos)
        throw imap_error("Parsing failure.", "Line=`" + line + "`.");
    string tag = line.substr(0, tag_pos);

    string::size_type result_pos = line.find(TOKEN_SEPARATOR_STR, tag_pos + 1);
    string result_s = line.substr(tag_pos + 1, result_pos == string::npos ? string::npos : result_pos - tag_pos - 1);
    optional<tag_result_response_t::result_t> result = std::nullopt;
    if (iequals(result_s, "OK"))
        result = make_optional(tag_result_response_t::OK);
    else if (iequals(result_s, "NO"))
        result = make_optional(tag_result_response_t::NO);
    else if (iequals(result_s, "BAD"))
        result = make_optional(tag_result_response_t::BAD);

    string response;
    if (result.has_value())
        response = result_pos == string::npos ? string() : line.substr(result_pos + 1);
    else
        response = line.substr(tag_pos + 1);
    return tag_result_response_t(tag, result, response);
}


/*
Protocol defines response line as tag (including plus and asterisk chars), result (ok, no, bad) and the response content which consists of optional
and mandatory part. Protocol grammar defines the response as sequence of atoms, string literals and parenthesized list (which itself can contain
atoms, string literal and parenthesized lists). The grammar can be parsed in one pass by counting which token is read: atom, string literal or
parenthesized list:
1. if a square bracket is reached, then an optional part is found, so parse its content as usual
2. if a brace is read, then string literal size is found, so read a number and leave the literal itself to `parse_untagged()`
3. if a parenthesis is found, then a list is being read, so increase the parenthesis counter and proceed
4. for a regular char check the state and determine if an atom or string size is read

Token of the grammar is defined by `response_token_t` and stores one of the three types. Since parenthesized list is recursively defined, it keeps
sequence of tokens. When a character is read, it belongs to the last token of the sequence of tokens at the given parenthesis depth. The last token
of the response expression is found by getting the last token of the token sequence at the given depth (in terms of parenthesis count).
*/
void imap::parse_response(const string& response)
{
    list<shared_ptr<imap::response_token_t>>* token_list = nullptr;
    shared_ptr<response_token_t> cur_token;
    for (auto ch : response)
    {
        switch (ch)
        {
            case OPTIONAL_BEGIN:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (optional_part_state_)
                        throw imap_error("Parser failure.", "Response=`" + response + "`.");

                    optional_part_state_ = true;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case OPTIONAL_END:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (!optional_part_state_)
                        throw imap_error("Parser failure.", "Response=`" + response + "`.");

                    optional_part_state_ = false;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case LIST_BEGIN:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    cur_token = make_shared<response_token_t>();
                    cur_token->token_type = response_token_t::token_type_t::LIST;
                    token_list = optional_part_state_ ? find_last_token_list(optional_part_) : find_last_token_list(mandatory_part_);
                    token_list->push_back(cur_token);
                    parenthesis_list_counter_++;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case LIST_END:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (parenthesis_list_counter_ == 0)
                        throw imap_error("Parser failure.", "Response=`" + response + "`.");

                    parenthesis_list_counter_--;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case STRING_LITERAL_BEGIN:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (literal_state_ == string_literal_state_t::SIZE)
                        throw imap_error("Parser failure.", "Response=`" + response + "`.");

                    cur_token = make_shared<response_token_t>();
                    cur_token->token_type = response_token_t::token_type_t::LITERAL;
                    token_list = optional_part_state_ ? find_last_token_list(optional_part_) : find_last_token_list(mandatory_part_);
                    token_list->push_back(cur_token);
                    literal_state_ = string_literal_state_t::SIZE;
                    atom_state_ = atom_state_t::NONE;
                }
            }
            break;

            case STRING_LITERAL_END:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (literal_state_ != string_literal_state_t::SIZE)
                        throw imap_error("Parser failure.", "Response=`" + response + "`.");

                    literal_state_ = string_literal_state_t::WAITING;
                }
            }
            break;

            case TOKEN_SEPARATOR_CHAR:
            {
                if (atom_state_ == atom_state_t::QUOTED)
                    cur_token->atom += ch;
                else
                {
                    if (cur_token != nullptr)
                    {
                        trim(cur_token->atom);
                        atom_state_ = atom_state_t::NONE;
                    }
                }
            }
            break;

            case QUOTED_ATOM:
            {
                if (atom_state_ == atom_state_t::NONE)
                {
                    cur_token = make_shared<response_token_t>();
                    cur_token->token_type = response_token_t::token_type_t::ATOM;
                    token_list = optional_part_state_ ? find_last_token_list(optional_part_) : find_last_token_list(mandatory_part_);
                    token_list->push_back(cur_token);
                    atom_state_ = atom_state_t::QUOTED;
                }
                else if (atom_state_ == atom_state_t::QUOTED)
                {
                    // The backslash and a double quote within an atom is the double quote only.
                    if (cur_token->atom.empty() || cur_token->atom.back() != codec::BACKSLASH_CHAR)
                        atom_state_ = atom_state_t::NONE;
                    else
                        cur_token->atom.back() = ch;
                }
            }
            break;

            default:
            {
                // Double backslash in an atom is translated to the single backslash.
                if (ch == codec::BACKSLASH_CHAR && atom_state_ == atom_state_t::QUOTED && !cur_token->atom.empty() &&
                    cur_token->atom.back() == codec::BACKSLASH_CHAR)
                    break;

                if (literal_state_ == string_literal_state_t::SIZE)
                {
                    if (!std::isdigit(static_cast<unsigned char>(ch)))
                        throw imap_error("Parser failure.", "Response=`" + response + "`.");

                    cur_token->literal_size += ch;
                }
                else if (literal_state_ == string_literal_state_t::WAITING)
                {
                    // no characters allowed after the right brace, crlf is required
                    throw imap_error("Parser failure.", "Response=`" + response + "`.");
                }
                else
                {
                    if (atom_state_ == atom_state_t::NONE)
                    {
                        cur_token = make_shared<response_token_t>();
                        cur_token->token_type = response_token_t::token_type_t::ATOM;
                        token_list = optional_part_state_ ? find_last_token_list(optional_part_) : find_last_token_list(mandatory_part_);
                        token_list->push_back(cur_token);
                        atom_state_ = atom_state_t::PLAIN;
                    }
                    cur_token->atom += ch;
                }
            }
        }
    }

    if (literal_state_ == string_literal_state_t::WAITING)
        literal_state_ = string_literal_state_t::READING;
}


void imap::parse_untagged(const string& response)
{
    parse_response(response);
    while (literal_state_ == string_literal_state_t::READING)
    {
        auto token_list = optional_part_state_ ? find_last_token_list(optional_part_) : find_last_token_list(mandatory_part_);
        auto literal_token = token_list->back();
        literal_token->literal = dlg_->receive_bytes(stoul(literal_token->literal_size));
        literal_state_ = string_literal_state_t::DONE;

        // The response goes on after the literal, at least with the closing parenthesis.
        string tail = dlg_->receive(true);
        trim_eol(tail);
        parse_response(tail);
    }
}


void imap::reset_response_parser()
{
    optional_part_.clear();
    mandatory_part_.clear();
    optional_part_state_ = false;
    atom_state_ = atom_state_t::NONE;
    parenthesis_list_counter_ = 0;
    literal_state_ = string_literal_state_t::NONE;
}


string imap::format(const string& command)
{
    return to_string(++tag_) + TOKEN_SEPARATOR_STR + command;
}


void imap::trim_eol(string& line)
{
    if (!line.empty() && line.back() == codec::END_OF_LINE[1])
        line.pop_back();
    if (!line.empty() && line.back() == codec::END_OF_LINE[0])
        line.pop_back();
}


list<shared_ptr<imap::response_token_t>>* imap::find_last_token_list(list<shared_ptr<response_token_t>>& token_list)
{
    list<shared_ptr<response_token_t>>* list_ptr = &token_list;
    unsigned int depth = 1;
    while (!list_ptr->empty() && list_ptr->back()->token_type == response_token_t::token_type_t::LIST && depth <= parenthesis_list_counter_)
    {
        list_ptr = &(list_ptr->back()->parenthesized_list);
        depth++;
    }
    return list_ptr;
}


imap_error::imap_error(const string& msg, const string& details) : dialog_error(msg, details)
{
}


imap_error::imap_error(const char* msg, const string& details) : dialog_error(msg, details)
{
}


} // namespace mailharvest
