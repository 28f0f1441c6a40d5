// File: src/TennisServerMain.cpp
//
// Allman style. Explicit types. No K&R.
//
// Authoritative match server using WebSocket++ (no TLS) over Asio.
// Every connection gets its own Session and so its own independent match.
// One binary frame in, exactly one binary frame back.

#include <charconv>
#include <exception>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "net/Session.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl = websocketpp::connection_hdl;

    struct CmdLine
    {
        std::uint16_t port{9002};
        tennis::core::net::SessionOptions session{};
    };

    template <typename T>
    bool read_number(int& i, int argc, char** argv, T& dst)
    {
        if (i + 1 >= argc)
        {
            return false;
        }
        std::string_view const text{argv[++i]};
        T value{};
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            std::cerr << "[tennisd] Bad numeric value '" << text << "' for " << argv[i - 1] << "\n";
            return false;
        }
        dst = value;
        return true;
    }

    CmdLine parse_args(int argc, char** argv)
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string_view const key = argv[i];
            if (key == "--port")
            {
                read_number(i, argc, argv, c.port);
            }
            else if (key == "--best-of")
            {
                unsigned best_of = c.session.best_of_sets;
                if (read_number(i, argc, argv, best_of))
                {
                    c.session.best_of_sets = static_cast<std::uint8_t>(best_of);
                }
            }
            else if (key == "--seed")
            {
                std::uint64_t seed{};
                if (read_number(i, argc, argv, seed))
                {
                    c.session.seed = seed;
                }
            }
            else if (key == "--log-dir")
            {
                if (i + 1 < argc)
                {
                    c.session.log_dir = std::string{argv[++i]};
                }
            }
            else if (key == "--advantage-final-set")
            {
                c.session.final_set_tiebreak = false;
            }
            else
            {
                std::cerr << "[tennisd] Ignoring unknown option " << key << "\n";
            }
        }
        if (c.session.best_of_sets != 3 && c.session.best_of_sets != 5)
        {
            std::cerr << "[tennisd] --best-of must be 3 or 5, using 3\n";
            c.session.best_of_sets = 3;
        }
        return c;
    }
} // anon

int main(int argc, char** argv)
{
    CmdLine const cfg = parse_args(argc, argv);

    std::cout << "[tennisd] Listening on port " << cfg.port
              << " | best of " << static_cast<int>(cfg.session.best_of_sets)
              << (cfg.session.final_set_tiebreak ? "" : " | advantage final set") << "\n";

    WsServer server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.set_access_channels(websocketpp::log::alevel::connect |
        websocketpp::log::alevel::disconnect);
    server.init_asio();
    server.set_reuse_addr(true);

    std::mutex sessions_mx;
    std::map<Hdl, std::unique_ptr<tennis::core::net::Session>, std::owner_less<Hdl>> sessions;
    std::uint64_t next_session_id = 1;

    server.set_open_handler([&](Hdl hdl)
    {
        std::lock_guard<std::mutex> lock(sessions_mx);
        std::uint64_t const id = next_session_id++;
        sessions[hdl] = std::make_unique<tennis::core::net::Session>(id, cfg.session);
        std::cout << "[tennisd] Session " << id << " opened (" << sessions.size() << " active)\n";
    });

    server.set_close_handler([&](Hdl hdl)
    {
        std::lock_guard<std::mutex> lock(sessions_mx);
        auto it = sessions.find(hdl);
        if (it != sessions.end())
        {
            std::cout << "[tennisd] Session " << it->second->Id() << " closed\n";
            sessions.erase(it);
        }
    });

    server.set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::cout << "[tennisd] Ignoring non-binary frame\n";
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> const bytes{
            reinterpret_cast<std::byte const*>(payload.data()),
            payload.size()
        };

        flatbuffers::DetachedBuffer reply;
        {
            std::lock_guard<std::mutex> lock(sessions_mx);
            auto it = sessions.find(hdl);
            if (it == sessions.end())
            {
                return;
            }
            try
            {
                reply = it->second->Handle(bytes);
            }
            catch (tennis::core::OmegaException<tennis::core::error::Code> const& e)
            {
                std::cout << "[tennisd] Session " << it->second->Id() << " engine error: " << e.what() << "\n";
                reply = tennis::core::net::BuildError("internal error", 0);
            }
            catch (std::exception const& e)
            {
                std::cout << "[tennisd] Session " << it->second->Id() << " failed: " << e.what() << "\n";
                reply = tennis::core::net::BuildError("internal error", 0);
            }
        }

        websocketpp::lib::error_code ec;
        server.send(hdl, reply.data(), reply.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::cout << "[tennisd] send() failed: " << ec.message() << "\n";
        }
    });

    try
    {
        server.listen(cfg.port);
        server.start_accept();
        server.run();
    }
    catch (websocketpp::exception const& e)
    {
        std::cerr << "[tennisd] Fatal: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
