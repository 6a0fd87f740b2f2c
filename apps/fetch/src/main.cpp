#include "FetchApplication.hpp"

#include <curlmux/core/ConfigLoader.hpp>
#include <curlmux/core/Logger.hpp>
#include <curlmux/core/LoggingConfig.hpp>

#include <iostream>
#include <utility>

int main(int argc, char **argv)
{
    try
    {
        auto cfg = curlmux::core::ConfigLoader::load(argc, argv);
        curlmux::core::applyLoggingConfig(cfg.mux);

        fetch::FetchApplication app(std::move(cfg), std::cout);
        const int rc = app.run();

        curlmux::core::shutdownLogger();
        return rc;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        curlmux::core::shutdownLogger();
        return 1;
    }
}
