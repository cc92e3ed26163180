/*
 *  hdhrctl
 *
 *  loopback fake devices for the tests
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

#include "FakeDevice.h"

#include <stdio.h>  // snprintf
#include <stdlib.h> // setenv

#include "HDHR_Error.h"
#include "Log.h"

#define SERVE_TIMEOUT 50 // ms

FakeServer::FakeServer( Socket::Type type ) : Thread( ), socket(type), port(0), up(false)
{
  if( type == Socket::TCP )
    socket.EnableReuseAddr( );
  socket.Bind( FAKE_ADDRESS, 0 );
  if( type == Socket::TCP )
    socket.Listen( );
  port = socket.GetLocalPort( );
}

FakeServer::~FakeServer( )
{
  Stop( );
}

bool FakeServer::Start( )
{
  up = true;
  return StartThread( );
}

void FakeServer::Stop( )
{
  up = false;
  JoinThread( );
}

void FakeServer::Run( )
{
  while( up )
  {
    try
    {
      Serve( );
    }
    catch( HDHR_Error &e )
    {
      LogWarn( "fake device on port %d: %s", port, e.what( ));
    }
  }
}


FakeUDPDevice::FakeUDPDevice( uint32_t device_id, uint8_t tuner_count ) : FakeServer( Socket::UDP ),
  device_id(device_id), tuner_count(tuner_count), send_garbage(false), requests(0)
{
}

int FakeUDPDevice::GetRequests( ) const
{
  SCOPELOCK( );
  return requests;
}

void FakeUDPDevice::Serve( )
{
  ByteBuffer data;
  std::string from;
  int from_port;
  if( !socket.RecvFrom( data, from, from_port, SERVE_TIMEOUT ) || data.empty( ))
    return;

  HDHR_Packet request = HDHR_Packet::Parse( data, HDHR_TYPE_DISCOVER_REQ );
  {
    SCOPELOCK( );
    requests++;
  }

  if( send_garbage )
  {
    ByteBuffer garbage( 12, 0xA5 );
    socket.SendTo( from, from_port, garbage );
  }

  HDHR_Packet reply( HDHR_TYPE_DISCOVER_RPY );
  reply.AddTagU32( HDHR_TAG_DEVICE_TYPE, HDHR_DEVICE_TYPE_TUNER );
  reply.AddTagU32( HDHR_TAG_DEVICE_ID, device_id );
  reply.AddTagU8( HDHR_TAG_TUNER_COUNT, tuner_count );
  if( !base_url.empty( ))
    reply.AddTagString( HDHR_TAG_BASE_URL, base_url );
  socket.SendTo( from, from_port, reply.Build( ));
}


FakeControlDevice::FakeControlDevice( ) : FakeServer( Socket::TCP ), requests(0)
{
}

void FakeControlDevice::SetVariable( const std::string &name, const std::string &value )
{
  SCOPELOCK( );
  variables[name] = value;
}

void FakeControlDevice::SetError( const std::string &name, const std::string &message )
{
  SCOPELOCK( );
  errors[name] = message;
}

std::vector<std::pair<std::string, std::string> > FakeControlDevice::GetSets( ) const
{
  SCOPELOCK( );
  return sets;
}

int FakeControlDevice::GetRequests( ) const
{
  SCOPELOCK( );
  return requests;
}

HDHR_Packet FakeControlDevice::Answer( const HDHR_Packet &request )
{
  SCOPELOCK( );
  requests++;

  std::string name, value;
  request.GetString( HDHR_TAG_GETSET_NAME, name );
  HDHR_Packet reply( HDHR_TYPE_GETSET_RPY );
  reply.AddTagString( HDHR_TAG_GETSET_NAME, name );

  std::map<std::string, std::string>::iterator error = errors.find( name );
  if( request.GetString( HDHR_TAG_GETSET_VALUE, value ))
  {
    sets.push_back( std::make_pair( name, value ));
    if( error == errors.end( ))
      variables[name] = value;
  }
  if( error != errors.end( ))
  {
    reply.AddTagString( HDHR_TAG_ERROR_MESSAGE, error->second );
    return reply;
  }

  std::map<std::string, std::string>::iterator it = variables.find( name );
  if( it == variables.end( ))
    reply.AddTagString( HDHR_TAG_ERROR_MESSAGE, "ERROR: unknown getset variable" );
  else
    reply.AddTagString( HDHR_TAG_GETSET_VALUE, it->second );
  return reply;
}

void FakeControlDevice::Serve( )
{
  Socket *client = socket.Accept( SERVE_TIMEOUT );
  if( !client )
    return;

  try
  {
    ByteBuffer frame( HDHR_FRAME_HEADER_SIZE );
    client->RecvAll( frame.data( ), HDHR_FRAME_HEADER_SIZE, 1000 );
    size_t size = HDHR_Packet::FrameSize( frame.data( ));
    frame.resize( size );
    client->RecvAll( frame.data( ) + HDHR_FRAME_HEADER_SIZE, size - HDHR_FRAME_HEADER_SIZE, 1000 );
    HDHR_Packet request = HDHR_Packet::Parse( frame, HDHR_TYPE_GETSET_REQ );
    client->SendAll( Answer( request ).Build( ));
  }
  catch( HDHR_Error & )
  {
    delete client;
    throw;
  }
  delete client;
}


FakeHTTPServer::FakeHTTPServer( ) : FakeServer( Socket::TCP )
{
  // curl must not route loopback requests through a proxy from the environment
  setenv( "no_proxy", FAKE_ADDRESS, 1 );
  setenv( "NO_PROXY", FAKE_ADDRESS, 1 );
}

void FakeHTTPServer::SetResponse( const std::string &path, const std::string &body, int status )
{
  SCOPELOCK( );
  responses[path] = std::make_pair( status, body );
}

std::string FakeHTTPServer::GetURL( const std::string &path ) const
{
  char url[64];
  snprintf( url, sizeof( url ), "http://%s:%d", FAKE_ADDRESS, port );
  return url + path;
}

int FakeHTTPServer::GetRequests( const std::string &path ) const
{
  SCOPELOCK( );
  std::map<std::string, int>::const_iterator it = requests.find( path );
  return it == requests.end( ) ? 0 : it->second;
}

void FakeHTTPServer::Serve( )
{
  Socket *client = socket.Accept( SERVE_TIMEOUT );
  if( !client )
    return;

  try
  {
    std::string head;
    uint8_t c;
    while( head.length( ) < 8192 )
    {
      client->RecvAll( &c, 1, 1000 );
      head += (char) c;
      if( head.length( ) >= 4 && head.compare( head.length( ) - 4, 4, "\r\n\r\n" ) == 0 )
        break;
    }

    // "GET /path HTTP/1.1"
    std::string path;
    size_t start = head.find( ' ' );
    if( start != std::string::npos )
    {
      size_t end = head.find( ' ', start + 1 );
      if( end != std::string::npos )
        path = head.substr( start + 1, end - start - 1 );
    }

    int status = 404;
    std::string body = "not found";
    {
      SCOPELOCK( );
      requests[path]++;
      std::map<std::string, std::pair<int, std::string> >::iterator it = responses.find( path );
      if( it != responses.end( ))
      {
        status = it->second.first;
        body = it->second.second;
      }
    }

    char header[256];
    snprintf( header, sizeof( header ),
        "HTTP/1.1 %d %s\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: %zu\r\n"
        "Connection: close\r\n"
        "\r\n", status, status == 200 ? "OK" : "Error", body.length( ));
    std::string response = std::string( header ) + body;
    client->SendAll( ByteBuffer( response.begin( ), response.end( )));
  }
  catch( HDHR_Error & )
  {
    delete client;
    throw;
  }
  delete client;
}


int UnusedPort( )
{
  Socket socket( Socket::TCP );
  socket.Bind( FAKE_ADDRESS, 0 );
  return socket.GetLocalPort( );
}
