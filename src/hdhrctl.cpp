/*
 *  hdhrctl
 *
 *  hdhrctl main
 *
 *  Copyright (C) 2012 André Roth
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <string.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h> // exit, atoi
#include <unistd.h> // getopt

#include "ClientConfig.h"
#include "HDHomerun_Client.h"
#include "HDHR_Control.h"
#include "HDHR_Error.h"
#include "JSONObject.h"
#include "Utils.h"
#include "Log.h"

bool up = true;

void termination_handler( int signum )
{
  if( up )
  {
    Log( "Signal received, terminating ..." );
    up = false;
  }
}

enum CLICommand
{
  CLI_Discover,
  CLI_Info,
  CLI_Status,
  CLI_Channel,
  CLI_Get,
  CLI_Set,
  CLI_Restart,
  CLI_Diag,
  CLI_Monitor,
};

static const struct
{
  const char *name;
  CLICommand command;
  int args;
  const char *usage;
} commands[] = {
  { "discover", CLI_Discover, 0, "discover                  find devices" },
  { "info",     CLI_Info,     1, "info <host>               show device details and lineup" },
  { "status",   CLI_Status,   1, "status <host>             show tuner status" },
  { "channel",  CLI_Channel,  2, "channel <host> <tuner>    show the channel a tuner is on" },
  { "get",      CLI_Get,      2, "get <host> <var>          read a device variable" },
  { "set",      CLI_Set,      3, "set <host> <var> <value>  write a device variable" },
  { "restart",  CLI_Restart,  1, "restart <host>            restart the device" },
  { "diag",     CLI_Diag,     1, "diag <host>               dump diagnostics, ids redacted" },
  { "monitor",  CLI_Monitor,  0, "monitor                   poll devices until interrupted" },
  { NULL,       CLI_Discover, 0, NULL }
};

void usage( char *prog )
{
  printf( "Usage: %s [-c config] [-m auto|http|udp] [-b address] [-i interface] [-d] [-s] command\n", prog );
  printf( "  -c config          config file (default: " CLIENT_CONFIG_FILE ")\n" );
  printf( "  -m mode            discovery mode\n" );
  printf( "  -b address         UDP broadcast or unicast address\n" );
  printf( "  -i interface       bind UDP discovery to this interface\n" );
  printf( "  -d                 debug output\n" );
  printf( "  -s                 log to syslog\n" );
  printf( "Commands:\n" );
  for( int i = 0; commands[i].name; i++ )
    printf( "  %s\n", commands[i].usage );
}

static void print_device( const HDHR_Device &device )
{
  printf( "%s  %-15s  %-12s  %d tuner%s  %s%s\n",
      device.GetDeviceID( ).c_str( ),
      device.GetHost( ).c_str( ),
      device.GetModel( ).empty( ) ? "-" : device.GetModel( ).c_str( ),
      device.GetTunerCount( ), device.GetTunerCount( ) == 1 ? "" : "s",
      HDHR_TransportName( device.GetDiscoveryMethod( )),
      device.IsOnline( ) ? "" : "  offline" );
}

static void print_json( const JSONObject &object )
{
  json_object *j = json_object_new_object( );
  object.json( j );
  printf( "%s\n", json_object_to_pretty_string( j ).c_str( ));
  json_object_put( j );
}

static HDHR_Device *find_device( HDHomerun_Client &client, const std::string &host )
{
  HDHR_Device *device = client.AddDevice( host );
  if( !device )
    throw HDHR_Error( "no HDHomeRun answered at " + host );
  return device;
}

static int run( CLICommand command, char **args, const ClientConfig &config )
{
  HDHomerun_Client client( config );
  switch( command )
  {
    case CLI_Discover:
      {
        client.Discover( );
        std::vector<std::string> ids = client.GetDeviceIDs( );
        for( size_t i = 0; i < ids.size( ); i++ )
          print_device( *client.GetDevice( ids[i] ));
        if( ids.empty( ))
          printf( "no devices found\n" );
      }
      break;

    case CLI_Info:
      print_json( *find_device( client, args[0] ));
      break;

    case CLI_Status:
      {
        HDHR_Device *device = find_device( client, args[0] );
        client.Execute( device->GetDeviceID( ), HDHomerun_Client::Command_RefreshTuners );
        if( !device->HasTunerStatus( ))
        {
          printf( "no tuner status available\n" );
          return device->IsOnline( ) ? 0 : 1;
        }
        const std::vector<HDHR_TunerStatus> &status = device->GetTunerStatus( );
        for( size_t i = 0; i < status.size( ); i++ )
          print_json( status[i] );
      }
      break;

    case CLI_Channel:
      {
        int tuner;
        if( !Utils::ParseInt( args[1], tuner ) || tuner < 0 )
          throw HDHR_Error( std::string( "invalid tuner " ) + args[1] );
        HDHR_Control control( args[0], config.GetControlTimeout( ), config.GetControlPort( ));
        HDHR_TunerStatus status;
        status.resource = std::string( "tuner" ) + args[1];
        control.GetTunerCurrentChannel( tuner, status );
        if( status.vct_number.empty( ) && status.target_ip.empty( ))
          printf( "tuner %d: no channel\n", tuner );
        else
          print_json( status );
      }
      break;

    case CLI_Get:
      {
        HDHR_Control control( args[0], config.GetControlTimeout( ), config.GetControlPort( ));
        printf( "%s\n", control.GetVariable( args[1] ).c_str( ));
      }
      break;

    case CLI_Set:
      {
        HDHR_Control control( args[0], config.GetControlTimeout( ), config.GetControlPort( ));
        control.SetVariable( args[1], args[2] );
      }
      break;

    case CLI_Restart:
      {
        HDHR_Device *device = find_device( client, args[0] );
        client.Execute( device->GetDeviceID( ), HDHomerun_Client::Command_Restart );
      }
      break;

    case CLI_Diag:
      {
        HDHR_Device *device = find_device( client, args[0] );
        client.Execute( device->GetDeviceID( ), HDHomerun_Client::Command_RefreshTuners );
        printf( "%s\n", client.Diagnostics( device->GetDeviceID( )).c_str( ));
      }
      break;

    case CLI_Monitor:
      if( !client.Start( ))
        return 1;
      while( up )
        sleep( 1 );
      client.Stop( );
      break;
  }
  return 0;
}

int main( int argc, char *argv[] )
{
  Logger *logger = NULL;
  struct sigaction action;
  action.sa_handler = termination_handler;
  sigemptyset( &action.sa_mask );
  action.sa_flags = 0;
  sigaction( SIGINT, &action, NULL );
  sigaction( SIGTERM, &action, NULL );

  std::string configfile;
  std::string mode, broadcast, interface;
  bool debug = false;
  bool use_syslog = false;

  int opt;
  while(( opt = getopt( argc, argv, "c:m:b:i:ds" )) != -1 )
  {
    switch( opt )
    {
      case 'c':
        configfile = optarg;
        break;
      case 'm':
        mode = optarg;
        break;
      case 'b':
        broadcast = optarg;
        break;
      case 'i':
        interface = optarg;
        break;
      case 'd':
        debug = true;
        break;
      case 's':
        use_syslog = true;
        break;
      default:
        usage( argv[0] );
        exit( 1 );
    }
  }

  if( optind >= argc )
  {
    usage( argv[0] );
    exit( 1 );
  }

  int c;
  for( c = 0; commands[c].name; c++ )
    if( strcmp( commands[c].name, argv[optind] ) == 0 )
      break;
  if( !commands[c].name || argc - optind - 1 != commands[c].args )
  {
    usage( argv[0] );
    exit( 1 );
  }

  if( use_syslog )
    logger = new LoggerSyslog( "hdhrctl" );
  if( debug )
    Logger::SetLevel( LOG_DEBUG );

  ClientConfig config;
  bool explicit_config = !configfile.empty( );
  if( !explicit_config )
    configfile = CLIENT_CONFIG_FILE;
  if( !config.SetConfigFile( configfile ))
    return 1;
  if( Utils::IsFile( config.GetConfigFile( )))
  {
    if( !config.LoadConfig( ))
    {
      LogError( "Unable to load config %s", config.GetConfigFile( ).c_str( ));
      return 1;
    }
  }
  else if( explicit_config )
  {
    LogError( "Config file %s not found", config.GetConfigFile( ).c_str( ));
    return 1;
  }
  else if( !config.SaveConfig( ))
    LogWarn( "Unable to write default config %s", config.GetConfigFile( ).c_str( ));

  if( !mode.empty( ))
  {
    DiscoverMode m;
    if( !DiscoverModeFromName( mode, m ))
    {
      usage( argv[0] );
      exit( 1 );
    }
    config.SetMode( m );
  }
  if( !broadcast.empty( ))
    config.SetBroadcastAddress( broadcast );
  if( !interface.empty( ))
    config.SetInterface( interface );

  int ret;
  try
  {
    ret = run( commands[c].command, argv + optind + 1, config );
  }
  catch( DeviceError &e )
  {
    LogError( "Device error: %s", e.what( ));
    ret = 2;
  }
  catch( HDHR_Error &e )
  {
    LogError( "%s", e.what( ));
    ret = 1;
  }

  delete logger;
  return ret;
}
