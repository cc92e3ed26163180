/*
 *  hdhrctl
 *
 *  Socket class
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

#include "Socket.h"

#include <sys/socket.h>
#include <sys/select.h>
#include <arpa/inet.h>  // inet_ntop
#include <netdb.h>      // getaddrinfo
#include <net/if.h>     // IFNAMSIZ
#include <fcntl.h>      // fcntl
#include <unistd.h>     // close
#include <string.h>     // memset, strerror
#include <errno.h>
#include <stdio.h>      // snprintf
#include <time.h>       // clock_gettime

#include "HDHR_Error.h"

static std::string error_string( const char *what, const std::string &detail )
{
  char msg[256];
  snprintf( msg, sizeof( msg ), "%s %s: %s", what, detail.c_str( ), strerror( errno ));
  return msg;
}

Socket::Socket( Type type ) : sd(-1)
{
  sd = ::socket( PF_INET, type == UDP ? SOCK_DGRAM : SOCK_STREAM, 0 );
  if( sd < 0 )
    throw ConnectionError( error_string( "socket creation failed", "" ));
}

Socket::Socket( int sd ) : sd(sd)
{
}

Socket::~Socket( )
{
  Close( );
}

void Socket::Close( )
{
  if( sd >= 0 )
  {
    close( sd );
    sd = -1;
  }
}

int64_t Socket::Now( )
{
  struct timespec ts;
  clock_gettime( CLOCK_MONOTONIC, &ts );
  return (int64_t) ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

void Socket::Resolve( const std::string &host, int port, struct sockaddr_in &addr )
{
  struct addrinfo hints;
  struct addrinfo *result = NULL;
  memset( &addr,  0, sizeof( struct sockaddr_in ));
  memset( &hints, 0, sizeof( struct addrinfo ));
  hints.ai_family = AF_INET;

  int s = getaddrinfo( host.c_str( ), NULL, &hints, &result );
  if( s != 0 || !result )
  {
    char msg[256];
    snprintf( msg, sizeof( msg ), "unable to resolve %s: %s", host.c_str( ), gai_strerror( s ));
    throw ConnectionError( msg );
  }
  addr.sin_addr.s_addr = ((struct sockaddr_in *) result->ai_addr )->sin_addr.s_addr;
  addr.sin_family      = AF_INET;
  addr.sin_port        = htons( port );
  freeaddrinfo( result );
}

void Socket::EnableBroadcast( )
{
  int yes = 1;
  if( setsockopt( sd, SOL_SOCKET, SO_BROADCAST, &yes, sizeof( int )) != 0 )
    throw ConnectionError( error_string( "setsockopt", "SO_BROADCAST" ));
}

void Socket::EnableReuseAddr( )
{
  int yes = 1;
  if( setsockopt( sd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof( int )) != 0 )
    throw ConnectionError( error_string( "setsockopt", "SO_REUSEADDR" ));
}

void Socket::BindToDevice( const std::string &interface )
{
  if( interface.empty( ))
    return;
  if( setsockopt( sd, SOL_SOCKET, SO_BINDTODEVICE, interface.c_str( ), interface.length( ) + 1 ) != 0 )
    throw ConnectionError( error_string( "unable to bind to interface", interface ));
}

void Socket::Bind( const std::string &address, int port )
{
  struct sockaddr_in addr;
  memset( &addr, 0, sizeof( struct sockaddr_in ));
  addr.sin_family = AF_INET;
  addr.sin_port   = htons( port );
  if( address.empty( ))
    addr.sin_addr.s_addr = INADDR_ANY;
  else if( inet_pton( AF_INET, address.c_str( ), &addr.sin_addr ) != 1 )
    throw ConnectionError( "invalid bind address " + address );
  if( bind( sd, (struct sockaddr *) &addr, sizeof( addr )) != 0 )
    throw ConnectionError( error_string( "binding failed on", address ));
}

int Socket::GetLocalPort( ) const
{
  struct sockaddr_in addr;
  socklen_t len = sizeof( addr );
  if( getsockname( sd, (struct sockaddr *) &addr, &len ) != 0 )
    return -1;
  return ntohs( addr.sin_port );
}

void Socket::Listen( int backlog )
{
  if( listen( sd, backlog ) != 0 )
    throw ConnectionError( error_string( "listen", "failed" ));
}

Socket *Socket::Accept( int timeout_ms )
{
  if( !WaitReadable( timeout_ms ))
    return NULL;
  int client = accept( sd, NULL, NULL );
  if( client < 0 )
    throw ConnectionError( error_string( "accept", "failed" ));
  return new Socket( client );
}

bool Socket::WaitReadable( int timeout_ms )
{
  if( timeout_ms < 0 )
    timeout_ms = 0;
  fd_set fds;
  FD_ZERO( &fds );
  FD_SET( sd, &fds );
  struct timeval tv;
  tv.tv_sec  = timeout_ms / 1000;
  tv.tv_usec = ( timeout_ms % 1000 ) * 1000;
  int r = select( sd + 1, &fds, NULL, NULL, &tv );
  if( r < 0 )
  {
    if( errno == EINTR )
      return false;
    throw ConnectionError( error_string( "select", "failed" ));
  }
  return r > 0;
}

void Socket::Connect( const std::string &host, int port, int timeout_ms )
{
  struct sockaddr_in addr;
  Resolve( host, port, addr );

  int flags = fcntl( sd, F_GETFL, 0 );
  fcntl( sd, F_SETFL, flags | O_NONBLOCK );

  if( connect( sd, (struct sockaddr *) &addr, sizeof( addr )) != 0 )
  {
    if( errno != EINPROGRESS )
      throw ConnectionError( error_string( "connect to", host ));

    fd_set fds;
    FD_ZERO( &fds );
    FD_SET( sd, &fds );
    struct timeval tv;
    tv.tv_sec  = timeout_ms / 1000;
    tv.tv_usec = ( timeout_ms % 1000 ) * 1000;
    int r = select( sd + 1, NULL, &fds, NULL, &tv );
    if( r == 0 )
      throw ConnectionError( "connect to " + host + " timed out", true );
    if( r < 0 )
      throw ConnectionError( error_string( "connect to", host ));

    int err = 0;
    socklen_t len = sizeof( err );
    getsockopt( sd, SOL_SOCKET, SO_ERROR, &err, &len );
    if( err != 0 )
    {
      errno = err;
      throw ConnectionError( error_string( "connect to", host ));
    }
  }

  fcntl( sd, F_SETFL, flags );
}

void Socket::SendTo( const std::string &host, int port, const ByteBuffer &data )
{
  struct sockaddr_in addr;
  Resolve( host, port, addr );
  ssize_t r = sendto( sd, data.data( ), data.size( ), 0, (struct sockaddr *) &addr, sizeof( addr ));
  if( r != (ssize_t) data.size( ))
    throw ConnectionError( error_string( "sendto", host ));
}

bool Socket::RecvFrom( ByteBuffer &data, std::string &from, int &from_port, int timeout_ms )
{
  if( !WaitReadable( timeout_ms ))
    return false;

  uint8_t buffer[HDHR_MAX_PACKET_SIZE * 2];
  struct sockaddr_in addr;
  socklen_t len = sizeof( addr );
  ssize_t r = recvfrom( sd, buffer, sizeof( buffer ), 0, (struct sockaddr *) &addr, &len );
  if( r < 0 )
  {
    if( errno == EINTR || errno == EAGAIN )
    {
      data.clear( );
      from.clear( );
      return true;
    }
    throw ConnectionError( error_string( "recvfrom", "failed" ));
  }

  char ip[INET_ADDRSTRLEN];
  inet_ntop( AF_INET, &addr.sin_addr, ip, sizeof( ip ));
  from = ip;
  from_port = ntohs( addr.sin_port );
  data.assign( buffer, buffer + r );
  return true;
}

void Socket::SendAll( const ByteBuffer &data )
{
  size_t sent = 0;
  while( sent < data.size( ))
  {
    ssize_t r = send( sd, data.data( ) + sent, data.size( ) - sent, MSG_NOSIGNAL );
    if( r < 0 )
    {
      if( errno == EINTR )
        continue;
      throw ConnectionError( error_string( "send", "failed" ));
    }
    sent += r;
  }
}

void Socket::RecvAll( uint8_t *buffer, size_t size, int timeout_ms )
{
  int64_t deadline = Now( ) + timeout_ms;
  size_t received = 0;
  while( received < size )
  {
    int64_t left = deadline - Now( );
    if( left <= 0 || !WaitReadable((int) left ))
      throw ConnectionError( "receive timed out", true );
    ssize_t r = recv( sd, buffer + received, size - received, 0 );
    if( r == 0 )
      throw ConnectionError( "connection closed by peer" );
    if( r < 0 )
    {
      if( errno == EINTR || errno == EAGAIN )
        continue;
      throw ConnectionError( error_string( "recv", "failed" ));
    }
    received += r;
  }
}
