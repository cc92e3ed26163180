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

#ifndef _Discover_
#define _Discover_

#include <string>
#include <vector>

#include "ClientConfig.h"
#include "HDHR_Device.h"

/*
 * runs HTTP and UDP discovery, merges the results by device id
 * and enriches every device with a targeted HTTP rediscover
 */
class Discover
{
  public:
    enum State
    {
      State_Idle,
      State_Running,
      State_Merging,
      State_Enriching,
      State_Done,
    };

    Discover( const ClientConfig &config );
    virtual ~Discover( );

    // the caller owns the returned devices
    std::vector<HDHR_Device *> Run( );
    State GetState( ) const { return state; }

    /*
     * refreshes a known device in place: HTTP if it has a discover url,
     * else UDP unicast. the device is marked offline if nothing answers
     */
    bool Rediscover( HDHR_Device &device ) const;

    // status.json if the device speaks HTTP, else the control protocol
    void RefreshTunerStatus( HDHR_Device &device ) const;

    static const char *StateName( State state );

    // merges devices by id, HTTP ones first, the result owns all instances
    static std::vector<HDHR_Device *> Merge( const std::vector<HDHR_Device *> &http, const std::vector<HDHR_Device *> &udp );

  private:
    const ClientConfig &config;
    State state;

    void SetState( State state );
};

#endif
