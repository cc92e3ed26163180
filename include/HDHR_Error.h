/*
 *  hdhrctl
 *
 *  HDHomeRun error classes
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

#ifndef _HDHR_Error_
#define _HDHR_Error_

#include <stdexcept>
#include <string>

class HDHR_Error : public std::runtime_error
{
  public:
    HDHR_Error( const std::string &what ) : std::runtime_error( what ) { }
};

/* malformed, truncated or CRC mismatched frame */
class ProtocolDecodeError : public HDHR_Error
{
  public:
    ProtocolDecodeError( const std::string &what ) : HDHR_Error( what ) { }
};

/* transport level failure: resolve, connect, send, receive or timeout */
class ConnectionError : public HDHR_Error
{
  public:
    ConnectionError( const std::string &what, bool timeout = false ) : HDHR_Error( what ), timeout(timeout) { }
    bool IsTimeout( ) const { return timeout; }
  private:
    bool timeout;
};

/* a discovery endpoint was unreachable, answered non-2xx or sent garbage */
class HttpDiscoveryUnavailable : public HDHR_Error
{
  public:
    HttpDiscoveryUnavailable( const std::string &what, bool connection_failure = false ) :
      HDHR_Error( what ), connection_failure(connection_failure) { }
    bool IsConnectionFailure( ) const { return connection_failure; }
  private:
    bool connection_failure;
};

/* the device answered a getset request with an error message */
class DeviceError : public HDHR_Error
{
  public:
    DeviceError( const std::string &what ) : HDHR_Error( what ) { }
};

#endif
