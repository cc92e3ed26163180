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

#ifndef _ClientConfig_
#define _ClientConfig_

#include <string>

#include "ConfigObject.h"

#define CLIENT_CONFIG_FILE "~/.hdhrctl/config"

enum DiscoverMode
{
  DiscoverMode_Auto,
  DiscoverMode_HTTP,
  DiscoverMode_UDP,
};

const char *DiscoverModeName( DiscoverMode mode );
bool DiscoverModeFromName( const std::string &name, DiscoverMode &mode );

class ClientConfig : public ConfigObject
{
  public:
    ClientConfig( );
    virtual ~ClientConfig( );

    virtual bool LoadConfig( );
    virtual bool SaveConfig( );

    DiscoverMode GetMode( ) const { return mode; }
    void SetMode( DiscoverMode mode ) { this->mode = mode; }
    const std::string &GetBroadcastAddress( ) const { return broadcast; }
    void SetBroadcastAddress( const std::string &address ) { broadcast = address; }
    const std::string &GetInterface( ) const { return interface; }
    void SetInterface( const std::string &interface ) { this->interface = interface; }
    const std::string &GetDirectoryURL( ) const { return directory_url; }
    void SetDirectoryURL( const std::string &url ) { directory_url = url; }

    // milliseconds
    int GetUDPTimeout( ) const { return udp_timeout; }
    void SetUDPTimeout( int ms ) { udp_timeout = ms; }
    int GetHTTPTimeout( ) const { return http_timeout; }
    void SetHTTPTimeout( int ms ) { http_timeout = ms; }
    int GetControlTimeout( ) const { return control_timeout; }
    void SetControlTimeout( int ms ) { control_timeout = ms; }

    int GetDiscoverPort( ) const { return discover_port; }
    void SetDiscoverPort( int port ) { discover_port = port; }
    int GetControlPort( ) const { return control_port; }
    void SetControlPort( int port ) { control_port = port; }

    // seconds
    int GetPollInterval( ) const { return poll_interval; }
    void SetPollInterval( int s ) { poll_interval = s; }

  private:
    DiscoverMode mode;
    std::string broadcast;
    std::string interface;
    std::string directory_url;
    int udp_timeout;
    int http_timeout;
    int control_timeout;
    int discover_port;
    int control_port;
    int poll_interval;
};

#endif
