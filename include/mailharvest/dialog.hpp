/*

dialog.hpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/streambuf.hpp>
#include "export.hpp"


namespace mailharvest
{


/**
Dealing with network in a line oriented fashion.

All operations are synchronous: each call blocks until the server answers or the transport reports an error.
**/
class MAILHARVEST_EXPORT dialog : public std::enable_shared_from_this<dialog>
{
public:

    /**
    Making a connection to the server.

    @param hostname Server hostname.
    @param port     Server port.
    **/
    dialog(const std::string& hostname, unsigned port);

    /**
    Copy constructor, shares the socket and the input buffer with the other dialog.

    @param other Dialog to copy.
    **/
    dialog(const dialog& other);

    /**
    Closing the connection.
    **/
    virtual ~dialog() = default;

    void operator=(const dialog&) = delete;

    /**
    Resolving the hostname and connecting to the server.

    @throw dialog_error Server connecting failed.
    **/
    virtual void connect();

    /**
    Sending a line to the network.

    @param line         Line to send, CRLF is appended.
    @param redact_trace Flag whether the line content must be left out of the protocol trace.
    @throw dialog_error Network sending error.
    **/
    virtual void send(const std::string& line, bool redact_trace = false);

    /**
    Receiving a line from the network.

    @param raw          Flag if the receiving is raw (no CRLF is truncated) or not.
    @return             Line read from the network.
    @throw dialog_error Network receiving error.
    **/
    virtual std::string receive(bool raw = false);

    /**
    Receiving exactly the given number of bytes, used for IMAP literals.

    Bytes already buffered by a previous line read are consumed first.

    @param total_bytes  Number of bytes to read.
    @return             Bytes read from the network.
    @throw dialog_error Network receiving error.
    **/
    virtual std::string receive_bytes(std::size_t total_bytes);

    /**
    Shutting down and closing the socket, errors are ignored.
    **/
    virtual void close();

    /**
    Setting the label used as the prefix of the protocol trace lines.

    @param name Session label, empty clears it.
    **/
    void set_session_name(const std::string& name);

    /**
    Getting the session label.
    **/
    std::string session_name() const;

protected:

    /**
    Sending the line over the given socket.

    @param socket Socket to use for sending.
    @param line   Line to send.
    **/
    template<typename Socket>
    void send_sync(Socket& socket, const std::string& line);

    /**
    Receiving a line over the given socket.

    @param socket Socket to use for receiving.
    @param raw    Flag if the receiving is raw.
    @return       Line read.
    **/
    template<typename Socket>
    std::string receive_sync(Socket& socket, bool raw);

    /**
    Receiving exactly the given number of bytes over the given socket.

    @param socket      Socket to use for receiving.
    @param total_bytes Number of bytes to read.
    @return            Bytes read.
    **/
    template<typename Socket>
    std::string receive_exact_sync(Socket& socket, std::size_t total_bytes);

    /**
    Writing a line of the protocol trace.

    @param direction `SEND` or `RECV`.
    @param line      Traced content.
    @param redact    Flag whether the command arguments are replaced by a placeholder.
    **/
    void trace(const char* direction, const std::string& line, bool redact = false) const;

    /**
    Server hostname.
    **/
    const std::string hostname_;

    /**
    Server port.
    **/
    const unsigned int port_;

    /**
    Asio input/output service.
    **/
    static boost::asio::io_context ios_;

    /**
    Socket connection.
    **/
    std::shared_ptr<boost::asio::ip::tcp::socket> socket_;

    /**
    Stream buffer associated to the socket.
    **/
    std::shared_ptr<boost::asio::streambuf> strmbuf_;

    /**
    Input stream associated to the buffer.
    **/
    std::shared_ptr<std::istream> istrm_;

    /**
    Prefix of the trace lines.
    **/
    std::string session_name_;
};


/**
Secure version of `dialog` class.
**/
class MAILHARVEST_EXPORT dialog_ssl : public dialog
{
public:

    /**
    SSL options to set up the connection.
    **/
    struct ssl_options_t
    {
        ssl_options_t() : method(boost::asio::ssl::context::tls_client), verify_mode(boost::asio::ssl::verify_peer)
        {
        }

        /**
        Protocol method, by default negotiated by the peers.
        **/
        boost::asio::ssl::context::method method;

        /**
        Peer verification mode.
        **/
        boost::asio::ssl::verify_mode verify_mode;
    };

    /**
    Upgrading an existing connected dialog to SSL and performing the handshake.

    @param other   Connected dialog.
    @param options SSL options.
    @throw dialog_error Switching to SSL failed.
    **/
    dialog_ssl(const dialog& other, const ssl_options_t& options);

    dialog_ssl(const dialog_ssl&) = delete;

    void operator=(const dialog_ssl&) = delete;

    /**
    Default destructor.
    **/
    ~dialog_ssl() = default;

    /**
    Sending an encrypted line.

    @throw * `dialog::send_sync(Socket&, const std::string&)`.
    **/
    void send(const std::string& line, bool redact_trace = false) override;

    /**
    Receiving an encrypted line.

    @throw * `dialog::receive_sync(Socket&, bool)`.
    **/
    std::string receive(bool raw = false) override;

    /**
    Receiving the exact number of encrypted bytes.

    @throw * `dialog::receive_exact_sync(Socket&, std::size_t)`.
    **/
    std::string receive_bytes(std::size_t total_bytes) override;

    /**
    Upgrading the dialog to SSL.

    @param dlg     Connected dialog.
    @param options SSL options.
    @return        Secure dialog over the same socket.
    @throw *       `dialog_ssl(const dialog&, const ssl_options_t&)`.
    **/
    static std::shared_ptr<dialog_ssl> to_ssl(const std::shared_ptr<dialog> dlg, const ssl_options_t& options);

    /**
    Connecting to the server and negotiating SSL right away, as implicit TLS ports (993) require.

    @param hostname Server hostname.
    @param port     Server port.
    @param options  SSL options.
    @return         Secure dialog ready for the server greeting.
    @throw *        `dialog::connect()`, `to_ssl(const std::shared_ptr<dialog>, const ssl_options_t&)`.
    **/
    static std::shared_ptr<dialog> open(const std::string& hostname, unsigned port, const ssl_options_t& options = ssl_options_t());

protected:

    /**
    SSL context.
    **/
    std::shared_ptr<boost::asio::ssl::context> context_;

    /**
    SSL socket stream over the plain socket.
    **/
    std::shared_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket&>> ssl_socket_;
};


/**
Error thrown by dialog client.
**/
class MAILHARVEST_EXPORT dialog_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor and storing the details.

    @param msg     Error message.
    @param details Detailed message.
    **/
    dialog_error(const std::string& msg, const std::string& details);

    /**
    Calling parent constructor and storing the details.

    @param msg     Error message.
    @param details Detailed message.
    **/
    dialog_error(const char* msg, const std::string& details);

    dialog_error(const dialog_error&) = default;

    dialog_error(dialog_error&&) = default;

    ~dialog_error() = default;

    dialog_error& operator=(const dialog_error&) = default;

    dialog_error& operator=(dialog_error&&) = default;

    /**
    Getting the detailed error message.

    @return Detailed error message.
    **/
    virtual std::string details() const;

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
