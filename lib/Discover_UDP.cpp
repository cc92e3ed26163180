/*
 *  hdhrctl
 *
 *  Discover_UDP class
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

#include "Discover_UDP.h"

#include <stdio.h> // snprintf

#include "HDHR_Error.h"
#include "Socket.h"
#include "Log.h"

void Discover_UDP::ParseReply( const HDHR_Packet &reply, HDHR_Properties &properties )
{
  uint32_t u32;
  uint8_t u8;
  std::string s;

  if( reply.GetU32( HDHR_TAG_DEVICE_ID, u32 ))
  {
    char id[16];
    snprintf( id, sizeof( id ), "%08X", u32 );
    properties.Set( HDHR_Properties::Field_DeviceID, id );
  }
  if( reply.GetU32( HDHR_TAG_DEVICE_TYPE, u32 ))
    properties.SetInt( HDHR_Properties::Field_DeviceType, u32 );
  if( reply.GetU8( HDHR_TAG_TUNER_COUNT, u8 ))
    properties.SetInt( HDHR_Properties::Field_TunerCount, u8 );
  if( reply.GetString( HDHR_TAG_BASE_URL, s ))
    properties.Set( HDHR_Properties::Field_BaseURL, s );
  if( reply.GetString( HDHR_TAG_LINEUP_URL, s ))
    properties.Set( HDHR_Properties::Field_LineupURL, s );
  if( reply.GetString( HDHR_TAG_DEVICE_AUTH_STR, s ))
    properties.Set( HDHR_Properties::Field_DeviceAuth, s );
}

std::vector<HDHR_Device *> Discover_UDP::Discover( const std::string &target, int timeout_ms, const std::string &interface, int port )
{
  std::vector<HDHR_Device *> devices;
  LogDebug( "UDP discover: target %s:%d, interface '%s', waiting %d ms", target.c_str( ), port, interface.c_str( ), timeout_ms );

  Socket socket( Socket::UDP );
  socket.EnableBroadcast( );
  socket.BindToDevice( interface );
  socket.SendTo( target, port, HDHR_Packet::DiscoverRequest( HDHR_DEVICE_TYPE_TUNER, HDHR_DEVICE_ID_WILDCARD ).Build( ));

  int64_t deadline = Socket::Now( ) + timeout_ms;
  while( true )
  {
    int64_t left = deadline - Socket::Now( );
    if( left <= 0 )
      break;

    ByteBuffer data;
    std::string from;
    int from_port = 0;
    try
    {
      if( !socket.RecvFrom( data, from, from_port, (int) left ))
        continue;
    }
    catch( ConnectionError & )
    {
      for( size_t i = 0; i < devices.size( ); i++ )
        delete devices[i];
      throw;
    }
    if( data.empty( ))
      continue;

    HDHR_Packet reply;
    try
    {
      reply = HDHR_Packet::Parse( data, HDHR_TYPE_DISCOVER_RPY );
    }
    catch( ProtocolDecodeError &e )
    {
      LogWarn( "UDP discover: ignoring reply from %s: %s", from.c_str( ), e.what( ));
      continue;
    }

    HDHR_Properties properties;
    ParseReply( reply, properties );
    HDHR_Device *device = new HDHR_Device( from );
    device->Merge( properties, Transport_UDP );
    device->SetDiscoveryMethod( Transport_UDP );
    LogDebug( "UDP discover: %s answered as %s", from.c_str( ), device->GetDeviceID( ).c_str( ));
    devices.push_back( device );
  }

  LogDebug( "UDP discover: %zu replies", devices.size( ));
  return devices;
}

bool Discover_UDP::Rediscover( HDHR_Device &device, int timeout_ms, const std::string &interface, int port )
{
  std::vector<HDHR_Device *> found = Discover( device.GetHost( ), timeout_ms, interface, port );
  bool ok = false;
  for( size_t i = 0; i < found.size( ); i++ )
  {
    if( !ok && ( device.GetDeviceID( ).empty( ) || found[i]->GetDeviceID( ) == device.GetDeviceID( )))
    {
      device.Merge( found[i]->GetProperties( ), Transport_UDP );
      ok = true;
    }
    delete found[i];
  }
  return ok;
}
