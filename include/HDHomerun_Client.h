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

#ifndef _HDHomerun_Client_
#define _HDHomerun_Client_

#include <string>
#include <vector>
#include <map>

#include "Thread.h"
#include "ClientConfig.h"
#include "Discover.h"
#include "HDHR_Device.h"

/*
 * this class is intended to be used to discover and monitor
 * the hdhomerun devices, it owns every device it knows about.
 * devices are keyed by id and never replaced, a rediscovered
 * device is merged into the known instance
 */
class HDHomerun_Client : public Thread
{
  public:
    enum Command
    {
      Command_Restart,
      Command_Rediscover,
      Command_RefreshTuners,
    };

    static const char *CommandName( Command command );
    static bool CommandFromName( const std::string &name, Command &command );

    HDHomerun_Client( const ClientConfig &config );
    virtual ~HDHomerun_Client( );

    // runs a full discovery, returns the number of devices found
    int Discover( );
    // adds or refreshes a single device by address, NULL if it did not answer
    HDHR_Device *AddDevice( const std::string &host );

    HDHR_Device *GetDevice( const std::string &id );
    std::vector<std::string> GetDeviceIDs( ) const;
    int GetDeviceCount( ) const;

    // restart propagates every failure, the other commands log them.
    // throws HDHR_Error for an unknown id
    void Execute( const std::string &id, Command command );

    // device dump with id and auth token redacted
    std::string Diagnostics( const std::string &id );

    // polls discovery and tuner status every poll_interval seconds
    bool Start( );
    void Stop( );

  private:
    virtual void Run( );

    HDHR_Device *Add( HDHR_Device *device );
    void Dispatch( HDHR_Device &device, Command command );

    const ClientConfig &config;
    ::Discover discover;
    volatile bool up;

    std::map<std::string, HDHR_Device *> devices;
};

#endif
