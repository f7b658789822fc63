/*

dialog.cpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <string>
#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#include <mailharvest/dialog.hpp>
#include <mailharvest/log.hpp>


using std::string;
using std::to_string;
using std::istream;
using std::make_shared;
using std::shared_ptr;
using boost::asio::ip::tcp;
using boost::asio::buffer;
using boost::asio::streambuf;
using boost::asio::io_context;
using boost::asio::ssl::context;
using boost::system::system_error;
using boost::system::error_code;
using boost::algorithm::trim_if;
using boost::algorithm::is_any_of;


namespace mailharvest
{


boost::asio::io_context dialog::ios_;


dialog::dialog(const string& hostname, unsigned port) : std::enable_shared_from_this<dialog>(),
    hostname_(hostname), port_(port), socket_(make_shared<tcp::socket>(ios_)), strmbuf_(make_shared<streambuf>()),
    istrm_(make_shared<istream>(strmbuf_.get()))
{
}


dialog::dialog(const dialog& other) : std::enable_shared_from_this<dialog>(),
    hostname_(other.hostname_), port_(other.port_), socket_(other.socket_), strmbuf_(other.strmbuf_), istrm_(other.istrm_),
    session_name_(other.session_name_)
{
}


void dialog::connect()
{
    try
    {
        tcp::resolver res(ios_);
        boost::asio::connect(*socket_, res.resolve(hostname_, to_string(port_)));
    }
    catch (const system_error& exc)
    {
        throw dialog_error("Server connecting failed.", exc.code().message());
    }
}


void dialog::send(const string& line, bool redact_trace)
{
    trace("SEND", line, redact_trace);
    send_sync(*socket_, line);
}


string dialog::receive(bool raw)
{
    string line = receive_sync(*socket_, raw);
    trace("RECV", line);
    return line;
}


string dialog::receive_bytes(std::size_t total_bytes)
{
    string bytes = receive_exact_sync(*socket_, total_bytes);
    trace("RECV", "<" + to_string(bytes.size()) + " bytes>");
    return bytes;
}


void dialog::close()
{
    error_code ec;
    if (socket_ && socket_->is_open())
    {
        socket_->shutdown(tcp::socket::shutdown_both, ec);
        socket_->close(ec);
    }
}


void dialog::set_session_name(const string& name)
{
    session_name_ = name;
}


string dialog::session_name() const
{
    return session_name_;
}


template<typename Socket>
void dialog::send_sync(Socket& socket, const string& line)
{
    try
    {
        string l = line + "\r\n";
        write(socket, buffer(l, l.size()));
    }
    catch (const system_error& exc)
    {
        throw dialog_error("Network sending error.", exc.code().message());
    }
}


template<typename Socket>
string dialog::receive_sync(Socket& socket, bool raw)
{
    try
    {
        read_until(socket, *strmbuf_, "\n");
        string line;
        getline(*istrm_, line, '\n');
        if (!raw)
            trim_if(line, is_any_of("\r\n"));
        return line;
    }
    catch (const system_error& exc)
    {
        throw dialog_error("Network receiving error.", exc.code().message());
    }
}


template<typename Socket>
string dialog::receive_exact_sync(Socket& socket, std::size_t total_bytes)
{
    try
    {
        if (total_bytes == 0)
            return string();
        string out;
        out.resize(total_bytes);
        std::size_t copied = 0;

        // Bytes buffered by a previous `read_until` belong to the literal.
        while (copied < total_bytes && strmbuf_->size() > 0)
        {
            std::size_t to_copy = std::min(total_bytes - copied, strmbuf_->size());
            istrm_->read(&out[copied], static_cast<std::streamsize>(to_copy));
            copied += to_copy;
        }

        while (copied < total_bytes)
        {
            auto n = socket.read_some(buffer(&out[copied], total_bytes - copied));
            if (n == 0)
                throw dialog_error("Network receiving error.", "Unexpected EOF");
            copied += n;
        }
        return out;
    }
    catch (const system_error& exc)
    {
        throw dialog_error("Network receiving error.", exc.code().message());
    }
}


void dialog::trace(const char* direction, const string& line, bool redact) const
{
    auto log = logger();
    if (!log->should_log(spdlog::level::trace))
        return;
    // Keep the tag and the command name only, arguments may carry credentials.
    const string traced = redact ? line.substr(0, line.find(' ', line.find(' ') + 1)) + " <redacted>" : line;
    if (session_name_.empty())
        log->trace("{}: {}", direction, traced);
    else
        log->trace("[{}] {}: {}", session_name_, direction, traced);
}


dialog_ssl::dialog_ssl(const dialog& other, const ssl_options_t& options) : dialog(other), context_(make_shared<context>(options.method)),
    ssl_socket_(make_shared<boost::asio::ssl::stream<tcp::socket&>>(*socket_, *context_))
{
    try
    {
        context_->set_default_verify_paths();
        ssl_socket_->set_verify_mode(options.verify_mode);
        if (options.verify_mode != boost::asio::ssl::verify_none)
            ssl_socket_->set_verify_callback(boost::asio::ssl::host_name_verification(hostname_));
        // Providers serve certificates per host name, so SNI is mandatory.
        if (!SSL_set_tlsext_host_name(ssl_socket_->native_handle(), hostname_.c_str()))
            throw dialog_error("Switching to SSL failed.", "Setting the server name indication failed.");
        ssl_socket_->handshake(boost::asio::ssl::stream_base::client);
    }
    catch (const system_error& exc)
    {
        throw dialog_error("Switching to SSL failed.", exc.code().message());
    }
}


void dialog_ssl::send(const string& line, bool redact_trace)
{
    trace("SEND", line, redact_trace);
    send_sync(*ssl_socket_, line);
}


string dialog_ssl::receive(bool raw)
{
    string line = receive_sync(*ssl_socket_, raw);
    trace("RECV", line);
    return line;
}


string dialog_ssl::receive_bytes(std::size_t total_bytes)
{
    string bytes = receive_exact_sync(*ssl_socket_, total_bytes);
    trace("RECV", "<" + to_string(bytes.size()) + " bytes>");
    return bytes;
}


shared_ptr<dialog_ssl> dialog_ssl::to_ssl(const shared_ptr<dialog> dlg, const dialog_ssl::ssl_options_t& options)
{
    return make_shared<dialog_ssl>(*dlg, options);
}


shared_ptr<dialog> dialog_ssl::open(const string& hostname, unsigned port, const ssl_options_t& options)
{
    auto dlg = make_shared<dialog>(hostname, port);
    dlg->connect();
    return to_ssl(dlg, options);
}


dialog_error::dialog_error(const string& msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


dialog_error::dialog_error(const char* msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


string dialog_error::details() const
{
    return details_;
}


} // namespace mailharvest
