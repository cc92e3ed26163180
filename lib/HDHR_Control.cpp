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

#include "HDHR_Control.h"

#include <stdio.h> // snprintf

#include "HDHR_Error.h"
#include "Socket.h"
#include "Utils.h"
#include "Log.h"

static const struct
{
  const char *tag;
  const char *metric;
} status_tags[] = {
  { "ss",  "SignalStrengthPercent" },
  { "snq", "SignalQualityPercent" },
  { "seq", "SymbolQualityPercent" },
  { "bps", "NetworkRate" },
  { NULL, NULL }
};

static std::string tuner_variable( int tuner, const char *name )
{
  char buf[64];
  snprintf( buf, sizeof( buf ), "/tuner%d/%s", tuner, name );
  return buf;
}

namespace
{
  class TunerStatusJob : public Job
  {
    public:
      TunerStatusJob( const HDHR_Control &control, int tuner ) : control(control), tuner(tuner), connection_failure(false) { }

      int GetTuner( ) const { return tuner; }
      const HDHR_TunerStatus &GetStatus( ) const { return status; }
      bool IsConnectionFailure( ) const { return connection_failure; }

    protected:
      virtual void Execute( )
      {
        try
        {
          status = control.GetTunerStatus( tuner );
        }
        catch( ConnectionError & )
        {
          connection_failure = true;
          throw;
        }
      }

    private:
      const HDHR_Control &control;
      int tuner;
      bool connection_failure;
      HDHR_TunerStatus status;
  };
}

void GetVariableJob::Execute( )
{
  try
  {
    value = control.GetVariable( name );
  }
  catch( ConnectionError & )
  {
    connection_failure = true;
    throw;
  }
}

HDHR_Control::HDHR_Control( const std::string &host, int timeout_ms, int port ) : host(host), timeout_ms(timeout_ms), port(port)
{
}

HDHR_Control::~HDHR_Control( )
{
}

HDHR_Packet HDHR_Control::Request( const HDHR_Packet &request ) const
{
  Socket socket( Socket::TCP );
  socket.Connect( host, port, timeout_ms );
  socket.SendAll( request.Build( ));

  ByteBuffer frame( HDHR_FRAME_HEADER_SIZE );
  socket.RecvAll( frame.data( ), HDHR_FRAME_HEADER_SIZE, timeout_ms );
  size_t size = HDHR_Packet::FrameSize( frame.data( ));
  frame.resize( size );
  socket.RecvAll( frame.data( ) + HDHR_FRAME_HEADER_SIZE, size - HDHR_FRAME_HEADER_SIZE, timeout_ms );

  return HDHR_Packet::Parse( frame, HDHR_TYPE_GETSET_RPY );
}

std::string HDHR_Control::GetVariable( const std::string &name ) const
{
  LogDebug( "HDHomeRun %s: get %s", host.c_str( ), name.c_str( ));
  HDHR_Packet reply = Request( HDHR_Packet::GetsetRequest( name ));
  std::string value;
  if( reply.GetString( HDHR_TAG_ERROR_MESSAGE, value ))
    throw DeviceError( host + ": " + name + ": " + value );
  reply.GetString( HDHR_TAG_GETSET_VALUE, value );
  return value;
}

void HDHR_Control::SetVariable( const std::string &name, const std::string &value ) const
{
  LogDebug( "HDHomeRun %s: set %s=%s", host.c_str( ), name.c_str( ), value.c_str( ));
  HDHR_Packet reply = Request( HDHR_Packet::GetsetRequest( name, value ));
  std::string error;
  if( reply.GetString( HDHR_TAG_ERROR_MESSAGE, error ))
    throw DeviceError( host + ": " + name + ": " + error );
}

void HDHR_Control::Restart( ) const
{
  Log( "HDHomeRun %s: restarting", host.c_str( ));
  SetVariable( "/sys/restart", "self" );
}

bool HDHR_Control::ParseStatus( const std::string &name, const std::string &value, HDHR_TunerStatus &status )
{
  std::vector<std::string> path;
  if( Utils::Tokenize( name, "/", path ) < 1 )
    return false;
  status.resource = path[0];
  status.metrics.clear( );

  std::vector<std::string> details;
  Utils::Tokenize( value, " ", details );
  for( size_t i = 0; i < details.size( ); i++ )
  {
    size_t eq = details[i].find( '=' );
    if( eq == std::string::npos )
      continue;
    std::string tag = details[i].substr( 0, eq );
    int v;
    if( !Utils::ParseInt( details[i].substr( eq + 1 ), v ) || v == 0 )
      continue;
    for( int t = 0; status_tags[t].tag; t++ )
      if( tag == status_tags[t].tag )
      {
        status.metrics[status_tags[t].metric] = v;
        break;
      }
  }
  return true;
}

bool HDHR_Control::ParseStreamInfo( const std::string &streaminfo, const std::string &program, std::string &number, std::string &name )
{
  std::string prefix = program + ": ";
  std::vector<std::string> lines;
  Utils::Tokenize( streaminfo, "\r\n", lines );
  for( size_t i = 0; i < lines.size( ); i++ )
  {
    if( !Utils::StartsWith( lines[i], prefix ))
      continue;
    std::vector<std::string> fields;
    if( Utils::Tokenize( lines[i].substr( prefix.length( )), " ", fields, 2 ) < 1 )
      continue;
    number = fields[0];
    name = fields.size( ) > 1 ? fields[1] : "";
    return true;
  }
  return false;
}

void HDHR_Control::GetTunerCurrentChannel( int tuner, HDHR_TunerStatus &status ) const
{
  std::string program = Utils::Trim( GetVariable( tuner_variable( tuner, "program" )));
  int id;
  if( !Utils::ParseInt( program, id ) || id == 0 )
    return;

  GetVariableJob streaminfo( *this, tuner_variable( tuner, "streaminfo" ));
  GetVariableJob target( *this, tuner_variable( tuner, "target" ));
  std::vector<Job *> jobs;
  jobs.push_back( &streaminfo );
  jobs.push_back( &target );
  Job::RunAll( jobs );

  if( streaminfo.Failed( ))
    LogWarn( "HDHomeRun %s: %s failed: %s", host.c_str( ), streaminfo.GetName( ).c_str( ), streaminfo.GetError( ).c_str( ));
  else if( !ParseStreamInfo( streaminfo.GetValue( ), program, status.vct_number, status.vct_name ))
    LogDebug( "HDHomeRun %s: program %s not in stream info of tuner %d", host.c_str( ), program.c_str( ), tuner );

  if( target.Failed( ))
    LogWarn( "HDHomeRun %s: %s failed: %s", host.c_str( ), target.GetName( ).c_str( ), target.GetError( ).c_str( ));
  else
  {
    std::string url = Utils::Trim( target.GetValue( ));
    if( !url.empty( ) && url != "none" )
      status.target_ip = Utils::URLHost( url );
  }
}

HDHR_TunerStatus HDHR_Control::GetTunerStatus( int tuner ) const
{
  std::string name = tuner_variable( tuner, "status" );
  HDHR_TunerStatus status;
  ParseStatus( name, GetVariable( name ), status );
  if( status.HasMetric( "SymbolQualityPercent" ))
    GetTunerCurrentChannel( tuner, status );
  return status;
}

void HDHR_Control::GetSupplementalInfo( HDHR_Properties &properties ) const
{
  GetVariableJob version( *this, "/sys/version" );
  GetVariableJob model( *this, "/sys/model" );
  GetVariableJob hwmodel( *this, "/sys/hwmodel" );
  std::vector<Job *> jobs;
  jobs.push_back( &version );
  jobs.push_back( &model );
  jobs.push_back( &hwmodel );
  Job::RunAll( jobs );

  HDHR_Properties::Field fields[] = {
    HDHR_Properties::Field_InstalledVersion,
    HDHR_Properties::Field_Model,
    HDHR_Properties::Field_HWModel
  };
  for( size_t i = 0; i < jobs.size( ); i++ )
  {
    GetVariableJob *job = (GetVariableJob *) jobs[i];
    if( job->Failed( ))
    {
      LogWarn( "HDHomeRun %s: %s failed: %s", host.c_str( ), job->GetName( ).c_str( ), job->GetError( ).c_str( ));
      continue;
    }
    properties.Set( fields[i], Utils::Trim( job->GetValue( )));
  }
}

void HDHR_Control::RefreshTunerStatus( HDHR_Device &device ) const
{
  int count = device.GetTunerCount( );
  std::vector<TunerStatusJob *> tuners;
  std::vector<Job *> jobs;
  for( int i = 0; i < count; i++ )
  {
    TunerStatusJob *job = new TunerStatusJob( *this, i );
    tuners.push_back( job );
    jobs.push_back( job );
  }
  Job::RunAll( jobs );

  std::vector<HDHR_TunerStatus> status;
  bool answered = false, unreachable = false;
  for( size_t i = 0; i < tuners.size( ); i++ )
  {
    TunerStatusJob *job = tuners[i];
    if( job->Failed( ))
    {
      if( job->IsConnectionFailure( ))
        unreachable = true;
      LogWarn( "HDHomeRun %s: tuner %d: %s", host.c_str( ), job->GetTuner( ), job->GetError( ).c_str( ));
    }
    else
    {
      answered = true;
      status.push_back( job->GetStatus( ));
    }
    delete job;
  }

  device.SetTunerStatus( status );
  if( answered )
    device.SetOnline( true );
  else if( unreachable )
    device.SetOnline( false );
}
