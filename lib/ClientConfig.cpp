/*
 *  hdhrctl
 *
 *  ClientConfig class
 *
 *  Copyright (C) 2014 Lars Schmohl
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

#include "ClientConfig.h"

#include "Discover_UDP.h"
#include "Discover_HTTP.h"
#include "HDHR_Control.h"
#include "Log.h"

#define DEFAULT_POLL_INTERVAL 30 // s

static const char *mode_names[] = { "auto", "http", "udp", NULL };

const char *DiscoverModeName( DiscoverMode mode )
{
  return mode_names[mode];
}

bool DiscoverModeFromName( const std::string &name, DiscoverMode &mode )
{
  for( int i = 0; mode_names[i]; i++ )
    if( name == mode_names[i] )
    {
      mode = (DiscoverMode) i;
      return true;
    }
  return false;
}

ClientConfig::ClientConfig( ) :
  ConfigObject( ),
  mode(DiscoverMode_Auto),
  broadcast(HDHR_BROADCAST_ADDRESS),
  directory_url(HDHR_DIRECTORY_URL),
  udp_timeout(HDHR_UDP_TIMEOUT),
  http_timeout(HDHR_HTTP_TIMEOUT),
  control_timeout(HDHR_CONTROL_TIMEOUT),
  discover_port(HDHR_DISCOVER_UDP_PORT),
  control_port(HDHR_CONTROL_TCP_PORT),
  poll_interval(DEFAULT_POLL_INTERVAL)
{
}

ClientConfig::~ClientConfig( )
{
}

bool ClientConfig::LoadConfig( )
{
  if( !ReadConfigFile( ))
    return false;

  std::string m;
  ReadConfig( "mode", m, DiscoverModeName( DiscoverMode_Auto ));
  if( !DiscoverModeFromName( m, mode ))
  {
    LogWarn( "config: unknown discover mode '%s', using auto", m.c_str( ));
    mode = DiscoverMode_Auto;
  }
  ReadConfig( "broadcast",       broadcast,       HDHR_BROADCAST_ADDRESS );
  ReadConfig( "interface",       interface );
  ReadConfig( "directory_url",   directory_url,   HDHR_DIRECTORY_URL );
  ReadConfig( "udp_timeout",     udp_timeout,     HDHR_UDP_TIMEOUT );
  ReadConfig( "http_timeout",    http_timeout,    HDHR_HTTP_TIMEOUT );
  ReadConfig( "control_timeout", control_timeout, HDHR_CONTROL_TIMEOUT );
  ReadConfig( "discover_port",   discover_port,   HDHR_DISCOVER_UDP_PORT );
  ReadConfig( "control_port",    control_port,    HDHR_CONTROL_TCP_PORT );
  ReadConfig( "poll_interval",   poll_interval,   DEFAULT_POLL_INTERVAL );

  if( poll_interval < 1 )
  {
    LogWarn( "config: poll_interval must be positive, using %d", DEFAULT_POLL_INTERVAL );
    poll_interval = DEFAULT_POLL_INTERVAL;
  }
  return true;
}

bool ClientConfig::SaveConfig( )
{
  WriteConfig( "mode",            std::string( DiscoverModeName( mode )));
  WriteConfig( "broadcast",       broadcast );
  WriteConfig( "interface",       interface );
  WriteConfig( "directory_url",   directory_url );
  WriteConfig( "udp_timeout",     udp_timeout );
  WriteConfig( "http_timeout",    http_timeout );
  WriteConfig( "control_timeout", control_timeout );
  WriteConfig( "discover_port",   discover_port );
  WriteConfig( "control_port",    control_port );
  WriteConfig( "poll_interval",   poll_interval );
  return WriteConfigFile( );
}
