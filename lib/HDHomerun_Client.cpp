/*
 *  hdhrctl
 *
 *  HDHomerun_Client class
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

#include "HDHomerun_Client.h"

#include <unistd.h> // sleep

#include "Discover_HTTP.h"
#include "HDHR_Control.h"
#include "HDHR_Error.h"
#include "JSONObject.h"
#include "Utils.h"
#include "Log.h"

static const char *command_names[] = { "restart", "rediscover", "refresh", NULL };

const char *HDHomerun_Client::CommandName( Command command )
{
  return command_names[command];
}

bool HDHomerun_Client::CommandFromName( const std::string &name, Command &command )
{
  for( int i = 0; command_names[i]; i++ )
    if( name == command_names[i] )
    {
      command = (Command) i;
      return true;
    }
  return false;
}

HDHomerun_Client::HDHomerun_Client( const ClientConfig &config ) :
    Thread( ), config(config), discover(config), up(false)
{
}

HDHomerun_Client::~HDHomerun_Client( )
{
  Stop( );
  for( std::map<std::string, HDHR_Device *>::iterator it = devices.begin( ); it != devices.end( ); it++ )
    delete it->second;
}

HDHR_Device *HDHomerun_Client::Add( HDHR_Device *device )
{
  std::string id = device->GetDeviceID( );
  std::map<std::string, HDHR_Device *>::iterator it = devices.find( id );
  if( it == devices.end( ))
  {
    Log( "HDHomeRun %s found at %s", id.c_str( ), device->GetHost( ).c_str( ));
    devices[id] = device;
    return device;
  }

  HDHR_Device *known = it->second;
  const HDHR_Properties &properties = device->GetProperties( );
  std::string value;
  for( int i = 0; i < HDHR_Properties::Field_Count; i++ )
  {
    HDHR_Properties::Field field = (HDHR_Properties::Field) i;
    if( properties.Get( field, value ))
      known->Set( field, value, device->GetOrigin( field ));
  }
  if( device->GetDiscoveryMethod( ) == Transport_HTTP || known->GetDiscoveryMethod( ) == Transport_None )
    known->SetDiscoveryMethod( device->GetDiscoveryMethod( ));
  if( !device->GetChannels( ).empty( ))
    known->SetChannels( device->GetChannels( ));
  known->SetOnline( true );
  delete device;
  return known;
}

int HDHomerun_Client::Discover( )
{
  std::vector<HDHR_Device *> found = discover.Run( );

  SCOPELOCK( );
  int count = 0;
  for( size_t i = 0; i < found.size( ); i++ )
  {
    if( found[i]->GetDeviceID( ).empty( ))
    {
      LogWarn( "HDHomeRun at %s has no device id, ignoring", found[i]->GetHost( ).c_str( ));
      delete found[i];
      continue;
    }
    Add( found[i] );
    count++;
  }
  return count;
}

HDHR_Device *HDHomerun_Client::AddDevice( const std::string &host )
{
  HDHR_Device *device = new HDHR_Device( host );
  bool found = discover.Rediscover( *device );
  if( Discover_HTTP::Rediscover( *device, config.GetHTTPTimeout( )))
  {
    device->SetOnline( true );
    found = true;
  }
  if( !found || device->GetDeviceID( ).empty( ))
  {
    LogError( "HDHomeRun %s: not found", host.c_str( ));
    delete device;
    return NULL;
  }

  SCOPELOCK( );
  return Add( device );
}

HDHR_Device *HDHomerun_Client::GetDevice( const std::string &id )
{
  SCOPELOCK( );
  std::string upper;
  Utils::ToUpper( id, upper );
  std::map<std::string, HDHR_Device *>::iterator it = devices.find( upper );
  if( it == devices.end( ))
    return NULL;
  return it->second;
}

std::vector<std::string> HDHomerun_Client::GetDeviceIDs( ) const
{
  SCOPELOCK( );
  std::vector<std::string> ids;
  for( std::map<std::string, HDHR_Device *>::const_iterator it = devices.begin( ); it != devices.end( ); it++ )
    ids.push_back( it->first );
  return ids;
}

int HDHomerun_Client::GetDeviceCount( ) const
{
  SCOPELOCK( );
  return devices.size( );
}

void HDHomerun_Client::Dispatch( HDHR_Device &device, Command command )
{
  LogDebug( "HDHomeRun %s: %s", device.GetDeviceID( ).c_str( ), CommandName( command ));
  switch( command )
  {
    case Command_Restart:
      {
        HDHR_Control control( device.GetHost( ), config.GetControlTimeout( ), config.GetControlPort( ));
        control.Restart( );
      }
      break;
    case Command_Rediscover:
      discover.Rediscover( device );
      break;
    case Command_RefreshTuners:
      discover.RefreshTunerStatus( device );
      break;
  }
}

void HDHomerun_Client::Execute( const std::string &id, Command command )
{
  HDHR_Device *device = GetDevice( id );
  if( !device )
    throw HDHR_Error( "unknown device " + id );
  SCOPELOCK( );
  Dispatch( *device, command );
}

std::string HDHomerun_Client::Diagnostics( const std::string &id )
{
  HDHR_Device *device = GetDevice( id );
  if( !device )
    throw HDHR_Error( "unknown device " + id );

  SCOPELOCK( );
  json_object *j = json_object_new_object( );
  json_object *d = json_object_new_object( );
  device->json( d, true );
  json_object_object_add( j, "device", d );
  std::string dump = json_object_to_pretty_string( j );
  json_object_put( j );
  return dump;
}

bool HDHomerun_Client::Start( )
{
  up = true;
  return StartThread( );
}

void HDHomerun_Client::Stop( )
{
  up = false;
  JoinThread( );
}

void HDHomerun_Client::Run( )
{
  while( up )
  {
    Discover( );

    std::vector<std::string> ids = GetDeviceIDs( );
    for( size_t i = 0; i < ids.size( ) && up; i++ )
    {
      try
      {
        Execute( ids[i], Command_RefreshTuners );
      }
      catch( HDHR_Error &e )
      {
        LogError( "HDHomeRun %s: %s", ids[i].c_str( ), e.what( ));
      }
    }

    for( int i = 0; i < config.GetPollInterval( ); i++ )
    {
      sleep( 1 );
      if( !up )
        break;
    }
  }
}
