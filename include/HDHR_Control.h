/*
 *  hdhrctl
 *
 *  HDHR_Control class
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

#ifndef _HDHR_Control_
#define _HDHR_Control_

#include <string>

#include "HDHR_Packet.h"
#include "HDHR_Device.h"
#include "Thread.h"

#define HDHR_CONTROL_TIMEOUT 2500 // ms

/*
 * getset client for the TCP control port,
 * every request uses its own connection
 */
class HDHR_Control
{
  public:
    HDHR_Control( const std::string &host, int timeout_ms = HDHR_CONTROL_TIMEOUT, int port = HDHR_CONTROL_TCP_PORT );
    virtual ~HDHR_Control( );

    const std::string &GetHost( ) const { return host; }

    std::string GetVariable( const std::string &name ) const;
    void SetVariable( const std::string &name, const std::string &value ) const;

    // status of one tuner, with channel details if it is locked on a program
    HDHR_TunerStatus GetTunerStatus( int tuner ) const;
    void GetTunerCurrentChannel( int tuner, HDHR_TunerStatus &status ) const;

    // /sys/version, /sys/model and /sys/hwmodel, unanswered ones are left out
    void GetSupplementalInfo( HDHR_Properties &properties ) const;

    // queries all tuners of the device and replaces its tuner status
    void RefreshTunerStatus( HDHR_Device &device ) const;

    void Restart( ) const;

    static bool ParseStatus( const std::string &name, const std::string &value, HDHR_TunerStatus &status );
    static bool ParseStreamInfo( const std::string &streaminfo, const std::string &program, std::string &number, std::string &name );

  private:
    std::string host;
    int timeout_ms;
    int port;

    HDHR_Packet Request( const HDHR_Packet &request ) const;
};

/* GetVariable on its own thread */
class GetVariableJob : public Job
{
  public:
    GetVariableJob( const HDHR_Control &control, const std::string &name ) : control(control), name(name), connection_failure(false) { }

    const std::string &GetName( ) const { return name; }
    const std::string &GetValue( ) const { return value; }
    bool IsConnectionFailure( ) const { return connection_failure; }

  protected:
    virtual void Execute( );

  private:
    const HDHR_Control &control;
    std::string name;
    std::string value;
    bool connection_failure;
};

#endif
