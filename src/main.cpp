#include <exception>
#include <string>

#include <vix/config/Config.hpp>
#include <vix/utils/Logger.hpp>

#include <linechat/server.hpp>

int main(int argc, char **argv)
{
    using Logger = vix::utils::Logger;
    auto &logger = Logger::getInstance();

    const std::string configPath = (argc > 1) ? argv[1] : "config/config.json";

    try
    {
        vix::config::Config coreConfig{configPath};

        linechat::Server server(coreConfig);
        server.listen_blocking();

        return 0;
    }
    catch (const std::exception &e)
    {
        logger.log(Logger::Level::ERROR, "[main] Fatal error: {}", e.what());
        return 1;
    }
}
