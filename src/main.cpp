#include <csignal>
#include <exception>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <convo/delivery/App.hpp>
#include <convo/utils/Logger.hpp>

int main(int argc, char **argv)
{
    using Logger = convo::utils::Logger;
    auto &logger = Logger::getInstance();

    const std::string configPath = argc > 1 ? argv[1] : "config/config.json";

    try
    {
        convo::delivery::App app{configPath};

        boost::asio::io_context signalContext;
        boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.async_wait(
            [&](const boost::system::error_code &ec, int signo)
            {
                if (ec)
                    return;
                logger.log(Logger::Level::INFO, "[main] signal {} received, shutting down", signo);
                app.stop();
            });

        app.start();
        signalContext.run();
        return 0;
    }
    catch (const std::exception &e)
    {
        logger.log(Logger::Level::CRITICAL, "[main] fatal: {}", e.what());
        return 1;
    }
}
