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

#ifndef _Socket_
#define _Socket_

#include <netinet/in.h> // sockaddr_in
#include <stdint.h>
#include <string>

#include "HDHR_Packet.h" // ByteBuffer

/*
 * IPv4 socket owning its descriptor, closed on destruction.
 * failures throw ConnectionError
 */
class Socket
{
  public:
    enum Type
    {
      UDP,
      TCP
    };

    Socket( Type type );
    virtual ~Socket( );

    int GetFD( ) const { return sd; }
    void Close( );

    void EnableBroadcast( );
    void EnableReuseAddr( );
    void BindToDevice( const std::string &interface );
    void Bind( const std::string &address, int port );
    int GetLocalPort( ) const;
    void Listen( int backlog = 15 );
    // NULL if no client connected within timeout_ms
    Socket *Accept( int timeout_ms );

    void Connect( const std::string &host, int port, int timeout_ms );

    void SendTo( const std::string &host, int port, const ByteBuffer &data );
    // false on timeout, from is the sender's address
    bool RecvFrom( ByteBuffer &data, std::string &from, int &from_port, int timeout_ms );

    void SendAll( const ByteBuffer &data );
    void RecvAll( uint8_t *buffer, size_t size, int timeout_ms );

    // false on timeout
    bool WaitReadable( int timeout_ms );

    static void Resolve( const std::string &host, int port, struct sockaddr_in &addr );
    static int64_t Now( ); // monotonic milliseconds

  private:
    Socket( int sd );
    Socket( const Socket & );
    Socket &operator=( const Socket & );

    int sd;
};

#endif
