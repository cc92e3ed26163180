/*
 *  hdhrctl
 *
 *  Discover class
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

#include "Discover.h"

#include <map>

#include "Discover_HTTP.h"
#include "Discover_UDP.h"
#include "HDHR_Control.h"
#include "HDHR_Error.h"
#include "Thread.h"
#include "Log.h"

namespace
{
  class HTTPDiscoverJob : public Job
  {
    public:
      HTTPDiscoverJob( const ClientConfig &config ) : config(config) { }
      std::vector<HDHR_Device *> devices;

    protected:
      virtual void Execute( )
      {
        try
        {
          devices = Discover_HTTP::Discover( config.GetDirectoryURL( ), config.GetHTTPTimeout( ));
        }
        catch( HttpDiscoveryUnavailable &e )
        {
          LogDebug( "HTTP discovery not available: %s", e.what( ));
        }
      }

    private:
      const ClientConfig &config;
  };

  class UDPDiscoverJob : public Job
  {
    public:
      UDPDiscoverJob( const ClientConfig &config ) : config(config) { }
      std::vector<HDHR_Device *> devices;

    protected:
      virtual void Execute( )
      {
        devices = Discover_UDP::Discover( config.GetBroadcastAddress( ), config.GetUDPTimeout( ),
                                          config.GetInterface( ), config.GetDiscoverPort( ));
      }

    private:
      const ClientConfig &config;
  };

  class RediscoverJob : public Job
  {
    public:
      RediscoverJob( HDHR_Device &device, int timeout_ms ) : device(device), timeout_ms(timeout_ms) { }

    protected:
      virtual void Execute( )
      {
        Discover_HTTP::Rediscover( device, timeout_ms );
      }

    private:
      HDHR_Device &device;
      int timeout_ms;
  };
}

Discover::Discover( const ClientConfig &config ) : config(config), state(State_Idle)
{
}

Discover::~Discover( )
{
}

const char *Discover::StateName( State state )
{
  switch( state )
  {
    case State_Idle:      return "idle";
    case State_Running:   return "running";
    case State_Merging:   return "merging";
    case State_Enriching: return "enriching";
    case State_Done:      return "done";
  }
  return "unknown";
}

void Discover::SetState( State state )
{
  LogDebug( "Discover: %s -> %s", StateName( this->state ), StateName( state ));
  this->state = state;
}

std::vector<HDHR_Device *> Discover::Merge( const std::vector<HDHR_Device *> &http, const std::vector<HDHR_Device *> &udp )
{
  std::vector<HDHR_Device *> devices;
  std::map<std::string, HDHR_Device *> by_id;

  for( size_t i = 0; i < http.size( ); i++ )
  {
    std::string id = http[i]->GetDeviceID( );
    if( !id.empty( ))
    {
      std::map<std::string, HDHR_Device *>::iterator it = by_id.find( id );
      if( it != by_id.end( ))
      {
        it->second->Merge( http[i]->GetProperties( ), Transport_HTTP );
        delete http[i];
        continue;
      }
      by_id[id] = http[i];
    }
    devices.push_back( http[i] );
  }

  for( size_t i = 0; i < udp.size( ); i++ )
  {
    std::string id = udp[i]->GetDeviceID( );
    if( !id.empty( ))
    {
      std::map<std::string, HDHR_Device *>::iterator it = by_id.find( id );
      if( it != by_id.end( ))
      {
        it->second->Merge( udp[i]->GetProperties( ), Transport_UDP );
        delete udp[i];
        continue;
      }
      by_id[id] = udp[i];
    }
    devices.push_back( udp[i] );
  }
  return devices;
}

std::vector<HDHR_Device *> Discover::Run( )
{
  DiscoverMode mode = config.GetMode( );
  LogDebug( "Discover: mode %s", DiscoverModeName( mode ));
  SetState( State_Running );

  HTTPDiscoverJob http( config );
  UDPDiscoverJob udp( config );
  std::vector<Job *> jobs;
  if( mode == DiscoverMode_Auto || mode == DiscoverMode_HTTP )
    jobs.push_back( &http );
  if( mode == DiscoverMode_Auto || mode == DiscoverMode_UDP )
    jobs.push_back( &udp );
  Job::RunAll( jobs );
  if( udp.Failed( ))
    LogError( "UDP discovery failed: %s", udp.GetError( ).c_str( ));
  if( http.Failed( ))
    LogError( "HTTP discovery failed: %s", http.GetError( ).c_str( ));

  SetState( State_Merging );
  std::vector<HDHR_Device *> devices = Merge( http.devices, udp.devices );

  SetState( State_Enriching );
  std::vector<RediscoverJob *> rediscover;
  jobs.clear( );
  for( size_t i = 0; i < devices.size( ); i++ )
  {
    RediscoverJob *job = new RediscoverJob( *devices[i], config.GetHTTPTimeout( ));
    rediscover.push_back( job );
    jobs.push_back( job );
  }
  Job::RunAll( jobs );
  for( size_t i = 0; i < rediscover.size( ); i++ )
  {
    if( rediscover[i]->Failed( ))
      LogWarn( "HDHomeRun %s: rediscover failed: %s", devices[i]->GetHost( ).c_str( ), rediscover[i]->GetError( ).c_str( ));
    delete rediscover[i];
  }

  SetState( State_Done );
  LogDebug( "Discover: %zu devices found", devices.size( ));
  return devices;
}

bool Discover::Rediscover( HDHR_Device &device ) const
{
  if( !device.GetDiscoverURL( ).empty( ))
  {
    bool unreachable;
    if( !Discover_HTTP::Rediscover( device, config.GetHTTPTimeout( ), &unreachable ))
    {
      // device level errors leave the online flag alone
      if( unreachable )
      {
        LogWarn( "HDHomeRun %s: no answer", device.GetHost( ).c_str( ));
        device.SetOnline( false );
      }
      return false;
    }
  }
  else
  {
    bool found = false;
    try
    {
      found = Discover_UDP::Rediscover( device, config.GetUDPTimeout( ), config.GetInterface( ), config.GetDiscoverPort( ));
      if( found && device.GetDiscoveryMethod( ) == Transport_None )
        device.SetDiscoveryMethod( Transport_UDP );
    }
    catch( ConnectionError &e )
    {
      LogWarn( "HDHomeRun %s: %s", device.GetHost( ).c_str( ), e.what( ));
    }
    if( !found )
    {
      LogWarn( "HDHomeRun %s: no answer", device.GetHost( ).c_str( ));
      device.SetOnline( false );
      return false;
    }
  }
  device.SetOnline( true );

  if( device.GetDiscoveryMethod( ) == Transport_HTTP )
  {
    Discover_HTTP::GatherDetails( device, config.GetHTTPTimeout( ));
    return true;
  }

  HDHR_Properties info;
  HDHR_Control control( device.GetHost( ), config.GetControlTimeout( ), config.GetControlPort( ));
  control.GetSupplementalInfo( info );
  device.Merge( info, Transport_TCP );

  if( !device.GetLineupURL( ).empty( ))
    Discover_HTTP::FetchLineup( device, config.GetHTTPTimeout( ));
  return true;
}

void Discover::RefreshTunerStatus( HDHR_Device &device ) const
{
  if( !device.GetDiscoverURL( ).empty( ))
  {
    Discover_HTTP::RefreshTunerStatus( device, config.GetHTTPTimeout( ));
    return;
  }
  HDHR_Control control( device.GetHost( ), config.GetControlTimeout( ), config.GetControlPort( ));
  control.RefreshTunerStatus( device );
}
