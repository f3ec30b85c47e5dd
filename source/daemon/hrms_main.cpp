/**
 * @file hrms_main.cpp
 * @brief Entry point of the HRMS daemon
 * @version 0.1
 * @date 2025-12-02
 */

#include <csignal>
#include <cstdio>
#include <cctype>
#include <cstdlib>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <lap/core/CConfig.hpp>
#include <lap/log/CLog.hpp>

#include "CHrms.hpp"
#include "CHrmsServer.hpp"

using namespace lap;
using namespace lap::hrms;

void printUsage( const char* programName )
{
    printf( "Usage: %s [options]\n", programName );
    printf( "\n" );
    printf( "Options:\n" );
    printf( "  -c, --config <path>          Configuration file (module \"hrms\")\n" );
    printf( "  -p, --port <port>            Listen port, overrides config and PORT\n" );
    printf( "  -h, --help                   Show this help message\n" );
}

bool isPort( const std::string& str )
{
    if ( str.empty() || str.size() > 5 ) return false;

    for ( auto&& c : str ) {
        if ( !std::isdigit( static_cast< unsigned char >( c ) ) ) return false;
    }
    return std::strtoul( str.c_str(), nullptr, 10 ) <= 65535UL;
}

int main( int argc, char* argv[] )
{
    std::string configPath;
    std::string portArg;

    // Parse command line arguments
    for ( int i = 1; i < argc; ++i ) {
        std::string arg = argv[i];
        if ( arg == "-h" || arg == "--help" ) {
            printUsage( argv[0] );
            return 0;
        } else if ( arg == "-c" || arg == "--config" ) {
            if ( i + 1 < argc ) {
                configPath = argv[++i];
            } else {
                fprintf( stderr, "Error: --config requires an argument\n" );
                printUsage( argv[0] );
                return 1;
            }
        } else if ( arg == "-p" || arg == "--port" ) {
            if ( i + 1 < argc && isPort( argv[i + 1] ) ) {
                portArg = argv[++i];
            } else {
                fprintf( stderr, "Error: --port requires a port number (1-65535)\n" );
                printUsage( argv[0] );
                return 1;
            }
        } else {
            fprintf( stderr, "Error: Unknown option %s\n", arg.c_str() );
            printUsage( argv[0] );
            return 1;
        }
    }

    ::lap::log::LogManager::getInstance().initialize();

    if ( !configPath.empty() ) {
        auto configResult = core::ConfigManager::getInstance().initialize( configPath, false );
        if ( !configResult.HasValue() ) {
            LAP_HRMS_LOG_FATAL << "Failed to read configuration file " << configPath;
            return 1;
        }
    }

    auto loadResult = LoadHrmsConfig();
    if ( !loadResult.HasValue() ) {
        LAP_HRMS_LOG_FATAL << "Invalid hrms configuration: " << loadResult.Error().Message();
        return 1;
    }

    HrmsConfig config = loadResult.Value();
    if ( !portArg.empty() ) config.port = static_cast< core::UInt32 >( std::strtoul( portArg.c_str(), nullptr, 10 ) );

    auto validateResult = ValidateConfig( config );
    if ( !validateResult.HasValue() ) {
        LAP_HRMS_LOG_FATAL << "Invalid hrms configuration: " << validateResult.Error().Message();
        return 1;
    }

    SubscriptionRegistry registry;
    auto notifier       = std::make_shared< ChangeNotifier >( registry );
    auto credentials    = std::make_shared< Pbkdf2CredentialService >( config.pbkdf2Iterations );
    auto identities     = std::make_shared< UuidIdentityGenerator >();

    RecordService service( CreateDocumentBackend( config ), notifier, credentials, identities, config );

    auto openResult = service.Open();
    if ( !openResult.HasValue() ) {
        LAP_HRMS_LOG_FATAL << "Cannot open the record store: " << openResult.Error().Message();
        return 1;
    }

    ApiRouter router( service );
    daemon::HrmsServer server( config, router, registry );

    auto startResult = server.start();
    if ( !startResult.HasValue() ) {
        LAP_HRMS_LOG_FATAL << "Cannot start the HRMS server: " << startResult.Error().Message();
        return 1;
    }

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals( signalContext, SIGINT, SIGTERM );
    signals.async_wait( []( const boost::system::error_code& ec, int signalNumber ) {
        if ( !ec ) LAP_HRMS_LOG_WARN << "Received signal " << signalNumber << ", shutting down";
    } );
    signalContext.run();

    server.stop();
    return 0;
}
