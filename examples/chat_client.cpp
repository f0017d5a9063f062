/**
 * @file chat_client.cpp
 * @brief Minimal terminal client for the linechat server.
 *
 * Every line typed on stdin is sent verbatim, so the raw protocol can be
 * exercised by hand:
 *
 *     REGISTER|alice::secret
 *     LOGIN|alice::secret
 *     MSG|TO::bob|hello
 *     CREATE_GROUP|friends
 *     MSG|GROUP::1|hi all
 *     LOGOUT
 *
 * Usage:
 *     ./chat_client [host] [port]     (defaults: 127.0.0.1 9000)
 */

#include <iostream>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

int main(int argc, char **argv)
{
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    const std::string host = (argc > 1) ? argv[1] : "127.0.0.1";
    const std::string port = (argc > 2) ? argv[2] : "9000";

    try
    {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        tcp::socket socket{ioc};

        net::connect(socket, resolver.resolve(host, port));
        std::cout << "[client] Connected to " << host << ":" << port << std::endl;

        std::thread reader(
            [&socket]
            {
                net::streambuf buf;
                boost::system::error_code ec;
                std::istream in(&buf);

                for (;;)
                {
                    net::read_until(socket, buf, '\n', ec);
                    if (ec)
                        break;

                    std::string line;
                    std::getline(in, line);
                    std::cout << "<< " << line << std::endl;
                }

                std::cout << "[client] Disconnected." << std::endl;
            });

        for (std::string line; std::getline(std::cin, line);)
        {
            line.push_back('\n');
            boost::system::error_code ec;
            net::write(socket, net::buffer(line), ec);
            if (ec)
            {
                std::cerr << "[client] write error: " << ec.message() << std::endl;
                break;
            }

            if (line == "LOGOUT\n")
                break;
        }

        boost::system::error_code ignore;
        socket.shutdown(tcp::socket::shutdown_send, ignore);
        reader.join();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[client] error: " << e.what() << std::endl;
        return 1;
    }
}
