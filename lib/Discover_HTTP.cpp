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

#include "Discover_HTTP.h"

#include <stdio.h> // snprintf

#include "HTTPClient.h"
#include "HDHR_Error.h"
#include "Utils.h"
#include "Log.h"

namespace
{
  // owns a parsed document
  class JSONDocument
  {
    public:
      JSONDocument( const std::string &body, const char *what ) : j(NULL)
      {
        j = json_tokener_parse( body.c_str( ));
        if( !j )
          throw ProtocolDecodeError( std::string( "invalid JSON in " ) + what );
      }
      ~JSONDocument( ) { json_object_put( j ); }

      json_object *Get( ) const { return j; }

    private:
      JSONDocument( const JSONDocument & );
      JSONDocument &operator=( const JSONDocument & );
      json_object *j;
  };

  void check_response( const HTTPResponse &response, const std::string &url )
  {
    if( !response.OK( ))
    {
      char msg[64];
      snprintf( msg, sizeof( msg ), ": HTTP status %ld", response.status );
      throw HttpDiscoveryUnavailable( url + msg );
    }
  }
}

std::string Discover_HTTP::DeviceURL( const HDHR_Device &device, const std::string &path )
{
  std::string base = device.GetDiscoverURL( );
  if( base.empty( ))
    base = device.GetBaseURL( );
  if( base.empty( ))
    base = "http://" + device.GetHost( );
  return Utils::URLWithPath( base, path );
}

void Discover_HTTP::ParseDevices( const std::string &body, const std::string &url, std::vector<HDHR_Properties> &devices )
{
  JSONDocument doc( body, url.c_str( ));
  json_object *j = doc.Get( );

  std::vector<json_object *> entries;
  if( json_object_is_type( j, json_type_array ))
  {
    for( size_t i = 0; i < json_object_array_length( j ); i++ )
      entries.push_back( json_object_array_get_idx( j, i ));
  }
  else if( json_object_is_type( j, json_type_object ))
    entries.push_back( j );
  else
    throw ProtocolDecodeError( "unexpected JSON document in " + url );

  std::string fallback = Utils::URLHost( url );
  for( size_t i = 0; i < entries.size( ); i++ )
  {
    if( !json_object_is_type( entries[i], json_type_object ))
      throw ProtocolDecodeError( "unexpected device entry in " + url );
    // an empty object is an empty result
    if( json_object_object_length( entries[i] ) == 0 )
      continue;

    HDHR_Properties properties;
    struct json_object_iter it;
    json_object_object_foreachC( entries[i], it )
    {
      HDHR_Properties::Field field;
      std::string value;
      if( !HDHR_Properties::FieldFromJSON( it.key, field ))
        continue;
      if( !json_object_scalar_to_string( it.val, value ))
        continue;
      properties.Set( field, value );
    }
    if( !properties.Has( HDHR_Properties::Field_Host ))
      properties.Set( HDHR_Properties::Field_Host, fallback );
    devices.push_back( properties );
  }
}

std::vector<HDHR_Device *> Discover_HTTP::Discover( const std::string &url, int timeout_ms )
{
  LogDebug( "HTTP discover: %s", url.c_str( ));
  HTTPResponse response;
  try
  {
    response = HTTPClient::Get( url, timeout_ms );
  }
  catch( ConnectionError &e )
  {
    throw HttpDiscoveryUnavailable( e.what( ), true );
  }
  check_response( response, url );

  std::vector<HDHR_Properties> found;
  try
  {
    ParseDevices( response.body, url, found );
  }
  catch( ProtocolDecodeError &e )
  {
    throw HttpDiscoveryUnavailable( e.what( ));
  }

  std::vector<HDHR_Device *> devices;
  for( size_t i = 0; i < found.size( ); i++ )
  {
    HDHR_Device *device = new HDHR_Device( found[i].Get( HDHR_Properties::Field_Host ));
    device->Merge( found[i], Transport_HTTP );
    device->SetDiscoveryMethod( Transport_HTTP );
    devices.push_back( device );
  }
  LogDebug( "HTTP discover: %zu devices from %s", devices.size( ), url.c_str( ));
  return devices;
}

bool Discover_HTTP::Rediscover( HDHR_Device &device, int timeout_ms, bool *connection_failure )
{
  if( connection_failure )
    *connection_failure = false;
  std::string url = device.GetDiscoverURL( );
  if( url.empty( ))
    url = DeviceURL( device, "/discover.json" );

  std::vector<HDHR_Device *> found;
  try
  {
    found = Discover( url, timeout_ms );
  }
  catch( HttpDiscoveryUnavailable &e )
  {
    LogDebug( "HTTP rediscover of %s failed: %s", device.GetHost( ).c_str( ), e.what( ));
    if( connection_failure )
      *connection_failure = e.IsConnectionFailure( );
    return false;
  }

  // only an entry describing this device is applied
  const std::string &id = device.GetDeviceID( );
  HDHR_Device *match = NULL;
  for( size_t i = 0; i < found.size( ) && !match; i++ )
    if( id.empty( ) || found[i]->GetDeviceID( ) == id )
      match = found[i];

  if( match )
  {
    device.Merge( match->GetProperties( ), Transport_HTTP );
    device.Set( HDHR_Properties::Field_DiscoverURL, url, Transport_HTTP );
    device.SetDiscoveryMethod( Transport_HTTP );
  }
  else
    LogWarn( "HTTP rediscover of %s: %s lists no device %s", device.GetHost( ).c_str( ), url.c_str( ),
             id.empty( ) ? "at all" : id.c_str( ));

  for( size_t i = 0; i < found.size( ); i++ )
    delete found[i];
  return match != NULL;
}

void Discover_HTTP::ParseLineup( const std::string &body, std::vector<HDHR_Channel> &channels )
{
  JSONDocument doc( body, "lineup" );
  json_object *j = doc.Get( );
  if( !json_object_is_type( j, json_type_array ))
    throw ProtocolDecodeError( "lineup is not an array" );

  channels.clear( );
  for( size_t i = 0; i < json_object_array_length( j ); i++ )
  {
    json_object *entry = json_object_array_get_idx( j, i );
    if( !json_object_is_type( entry, json_type_object ))
      continue;
    HDHR_Channel channel;
    int flag;
    json_object_get_string_value( entry, "GuideNumber", channel.guide_number );
    json_object_get_string_value( entry, "GuideName",   channel.guide_name );
    json_object_get_string_value( entry, "VideoCodec",  channel.video_codec );
    json_object_get_string_value( entry, "AudioCodec",  channel.audio_codec );
    json_object_get_string_value( entry, "URL",         channel.url );
    if( json_object_get_int_value( entry, "HD", flag ))
      channel.hd = flag != 0;
    if( json_object_get_int_value( entry, "Favorite", flag ))
      channel.favorite = flag != 0;
    channels.push_back( channel );
  }
}

void Discover_HTTP::ParseTunerStatus( const std::string &body, std::vector<HDHR_TunerStatus> &status )
{
  JSONDocument doc( body, "status" );
  json_object *j = doc.Get( );
  if( !json_object_is_type( j, json_type_array ))
    throw ProtocolDecodeError( "status is not an array" );

  status.clear( );
  for( size_t i = 0; i < json_object_array_length( j ); i++ )
  {
    json_object *entry = json_object_array_get_idx( j, i );
    if( !json_object_is_type( entry, json_type_object ))
      continue;
    HDHR_TunerStatus tuner;
    struct json_object_iter it;
    json_object_object_foreachC( entry, it )
    {
      std::string key = it.key;
      if( key == "Resource" )
        json_object_scalar_to_string( it.val, tuner.resource );
      else if( key == "VctNumber" )
        json_object_scalar_to_string( it.val, tuner.vct_number );
      else if( key == "VctName" )
        json_object_scalar_to_string( it.val, tuner.vct_name );
      else if( key == "TargetIP" )
        json_object_scalar_to_string( it.val, tuner.target_ip );
      else if( json_object_is_type( it.val, json_type_int ))
        tuner.metrics[key] = json_object_get_int( it.val );
    }
    status.push_back( tuner );
  }
}

void Discover_HTTP::ParseLineupStatus( const std::string &body, std::string &source, std::vector<std::string> &sources,
                                       bool &scan_in_progress, bool &scan_possible )
{
  JSONDocument doc( body, "lineup status" );
  json_object *j = doc.Get( );
  if( !json_object_is_type( j, json_type_object ))
    throw ProtocolDecodeError( "lineup status is not an object" );

  int flag = 0;
  source.clear( );
  json_object_get_string_value( j, "Source", source );
  scan_in_progress = json_object_get_int_value( j, "ScanInProgress", flag ) && flag;
  scan_possible = json_object_get_int_value( j, "ScanPossible", flag ) && flag;

  sources.clear( );
  json_object *list = NULL;
  if( json_object_object_get_ex( j, "SourceList", &list ) && json_object_is_type( list, json_type_array ))
  {
    for( size_t i = 0; i < json_object_array_length( list ); i++ )
    {
      std::string s;
      if( json_object_scalar_to_string( json_object_array_get_idx( list, i ), s ))
        sources.push_back( s );
    }
  }
}

bool Discover_HTTP::FetchLineup( HDHR_Device &device, int timeout_ms )
{
  std::string url = device.GetLineupURL( );
  if( url.empty( ))
    url = DeviceURL( device, "/lineup.json" );

  try
  {
    HTTPResponse response = HTTPClient::Get( url, timeout_ms );
    check_response( response, url );
    std::vector<HDHR_Channel> channels;
    ParseLineup( response.body, channels );
    device.SetChannels( channels );
    device.SetOnline( true );
    return true;
  }
  catch( ConnectionError &e )
  {
    LogError( "HDHomeRun %s: lineup unavailable: %s", device.GetHost( ).c_str( ), e.what( ));
    device.SetOnline( false );
  }
  catch( HDHR_Error &e )
  {
    LogError( "HDHomeRun %s: lineup: %s", device.GetHost( ).c_str( ), e.what( ));
  }
  return false;
}

bool Discover_HTTP::RefreshTunerStatus( HDHR_Device &device, int timeout_ms )
{
  std::string url = DeviceURL( device, "/status.json" );
  try
  {
    HTTPResponse response = HTTPClient::Get( url, timeout_ms );
    check_response( response, url );
    std::vector<HDHR_TunerStatus> status;
    ParseTunerStatus( response.body, status );
    device.SetTunerStatus( status );
    device.SetOnline( true );
    return true;
  }
  catch( ConnectionError &e )
  {
    LogWarn( "HDHomeRun %s: %s", device.GetHost( ).c_str( ), e.what( ));
    device.SetOnline( false );
  }
  catch( HDHR_Error &e )
  {
    LogError( "HDHomeRun %s: tuner status: %s", device.GetHost( ).c_str( ), e.what( ));
  }
  return false;
}

bool Discover_HTTP::GatherDetails( HDHR_Device &device, int timeout_ms )
{
  HTTPFetch discover( DeviceURL( device, "/discover.json" ), timeout_ms );
  HTTPFetch lineup( DeviceURL( device, "/lineup.json" ), timeout_ms );
  HTTPFetch lineup_status( DeviceURL( device, "/lineup_status.json" ), timeout_ms );
  std::vector<Job *> jobs;
  jobs.push_back( &discover );
  jobs.push_back( &lineup );
  jobs.push_back( &lineup_status );

  if( !Job::RunAll( jobs ))
  {
    for( size_t i = 0; i < jobs.size( ); i++ )
      if( jobs[i]->Failed( ))
        LogWarn( "HDHomeRun %s: %s", device.GetHost( ).c_str( ), jobs[i]->GetError( ).c_str( ));
    device.SetOnline( false );
    return false;
  }

  std::vector<HDHR_Properties> found;
  std::vector<HDHR_Channel> channels;
  std::string source;
  std::vector<std::string> sources;
  bool scanning, possible;
  try
  {
    for( size_t i = 0; i < jobs.size( ); i++ )
    {
      HTTPFetch *fetch = (HTTPFetch *) jobs[i];
      check_response( fetch->GetResponse( ), fetch->GetURL( ));
    }
    ParseDevices( discover.GetResponse( ).body, discover.GetURL( ), found );
    ParseLineup( lineup.GetResponse( ).body, channels );
    ParseLineupStatus( lineup_status.GetResponse( ).body, source, sources, scanning, possible );
  }
  catch( HDHR_Error &e )
  {
    LogError( "HDHomeRun %s: details: %s", device.GetHost( ).c_str( ), e.what( ));
    return false;
  }

  const std::string &id = device.GetDeviceID( );
  const HDHR_Properties *match = NULL;
  for( size_t i = 0; i < found.size( ) && !match; i++ )
  {
    std::string found_id;
    Utils::ToUpper( found[i].Get( HDHR_Properties::Field_DeviceID ), found_id );
    if( id.empty( ) || found_id == id )
      match = &found[i];
  }
  if( !found.empty( ) && !match )
  {
    LogError( "HDHomeRun %s: %s describes another device", device.GetHost( ).c_str( ), discover.GetURL( ).c_str( ));
    return false;
  }

  if( match )
    device.Merge( *match, Transport_HTTP );
  device.SetChannels( channels );
  device.SetLineupStatus( source, sources, scanning, possible );
  device.SetOnline( true );
  return true;
}
