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

#ifndef _Discover_UDP_
#define _Discover_UDP_

#include <string>
#include <vector>

#include "HDHR_Packet.h"
#include "HDHR_Device.h"

#define HDHR_BROADCAST_ADDRESS "255.255.255.255"
#define HDHR_UDP_TIMEOUT 1000 // ms

class Discover_UDP
{
  public:
    /*
     * sends one discover request to target and collects replies
     * for the whole timeout. one device per valid reply, the
     * caller owns the returned devices
     */
    static std::vector<HDHR_Device *> Discover( const std::string &target = HDHR_BROADCAST_ADDRESS,
                                                int timeout_ms = HDHR_UDP_TIMEOUT,
                                                const std::string &interface = "",
                                                int port = HDHR_DISCOVER_UDP_PORT );

    // unicast discover to the device's host, merges the first matching reply.
    // false if the device did not answer
    static bool Rediscover( HDHR_Device &device, int timeout_ms = HDHR_UDP_TIMEOUT,
                            const std::string &interface = "", int port = HDHR_DISCOVER_UDP_PORT );

    static void ParseReply( const HDHR_Packet &reply, HDHR_Properties &properties );
};

#endif
