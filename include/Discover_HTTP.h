/*
 *  hdhrctl
 *
 *  Discover_HTTP class
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

#ifndef _Discover_HTTP_
#define _Discover_HTTP_

#include <string>
#include <vector>

#include "HDHR_Device.h"

#define HDHR_DIRECTORY_URL "https://ipv4-api.hdhomerun.com/discover"
#define HDHR_HTTP_TIMEOUT 2500 // ms

class Discover_HTTP
{
  public:
    /*
     * queries a directory or a device's discover.json, the caller owns
     * the returned devices. throws HttpDiscoveryUnavailable
     */
    static std::vector<HDHR_Device *> Discover( const std::string &url = HDHR_DIRECTORY_URL, int timeout_ms = HDHR_HTTP_TIMEOUT );

    /*
     * refreshes the device in place from the entry of its discover URL with
     * the same DeviceID. false if there is none or the URL is unavailable,
     * connection_failure tells whether the device could not be reached
     */
    static bool Rediscover( HDHR_Device &device, int timeout_ms = HDHR_HTTP_TIMEOUT, bool *connection_failure = NULL );

    static bool FetchLineup( HDHR_Device &device, int timeout_ms = HDHR_HTTP_TIMEOUT );

    // status.json, the previous status is kept if the request fails
    static bool RefreshTunerStatus( HDHR_Device &device, int timeout_ms = HDHR_HTTP_TIMEOUT );

    // discover, lineup and lineup_status at once, nothing is applied unless all succeed
    static bool GatherDetails( HDHR_Device &device, int timeout_ms = HDHR_HTTP_TIMEOUT );

    // parsers throw ProtocolDecodeError on malformed input
    static void ParseDevices( const std::string &body, const std::string &url, std::vector<HDHR_Properties> &devices );
    static void ParseLineup( const std::string &body, std::vector<HDHR_Channel> &channels );
    static void ParseTunerStatus( const std::string &body, std::vector<HDHR_TunerStatus> &status );
    static void ParseLineupStatus( const std::string &body, std::string &source, std::vector<std::string> &sources,
                                   bool &scan_in_progress, bool &scan_possible );

    static std::string DeviceURL( const HDHR_Device &device, const std::string &path );
};

#endif
