/*
 *  hdhrctl
 *
 *  HDHR_Device class
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

#include "HDHR_Device.h"

#include <stdio.h>  // snprintf
#include <stdlib.h> // atoi

#include "Utils.h"
#include "Log.h"

#define REDACTED "**REDACTED**"

static const HDHR_Properties::FieldInfo fields[HDHR_Properties::Field_Count] = {
  { HDHR_Properties::Field_DeviceID,         "DeviceID",         HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_DeviceType,       "DeviceType",       HDHR_Properties::Kind_Int,    false },
  { HDHR_Properties::Field_Host,             "LocalIP",          HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_BaseURL,          "BaseURL",          HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_DiscoverURL,      "DiscoverURL",      HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_LineupURL,        "LineupURL",        HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_FriendlyName,     "FriendlyName",     HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_Model,            "FirmwareName",     HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_HWModel,          "ModelNumber",      HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_InstalledVersion, "FirmwareVersion",  HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_LatestVersion,    "UpgradeAvailable", HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_DeviceAuth,       "DeviceAuth",       HDHR_Properties::Kind_String, true  },
  { HDHR_Properties::Field_TunerCount,       "TunerCount",       HDHR_Properties::Kind_Int,    true  },
};

static int rank( HDHR_Transport transport )
{
  switch( transport )
  {
    case Transport_HTTP:
      return 2;
    case Transport_UDP:
    case Transport_TCP:
      return 1;
    case Transport_None:
      break;
  }
  return 0;
}

const char *HDHR_TransportName( HDHR_Transport transport )
{
  switch( transport )
  {
    case Transport_UDP:  return "UDP";
    case Transport_TCP:  return "TCP";
    case Transport_HTTP: return "HTTP";
    case Transport_None: break;
  }
  return "none";
}

const HDHR_Properties::FieldInfo &HDHR_Properties::GetFieldInfo( Field field )
{
  return fields[field];
}

bool HDHR_Properties::FieldFromJSON( const std::string &key, Field &field )
{
  for( int i = 0; i < Field_Count; i++ )
  {
    if( fields[i].http && key == fields[i].name )
    {
      field = fields[i].field;
      return true;
    }
  }
  return false;
}

bool HDHR_Properties::IsTruthy( Field field, const std::string &value )
{
  if( value.empty( ))
    return false;
  if( fields[field].kind == Kind_Int )
  {
    int i;
    return Utils::ParseInt( value, i ) && i != 0;
  }
  return true;
}

bool HDHR_Properties::Set( Field field, const std::string &value )
{
  if( !IsTruthy( field, value ))
    return false;
  if( field == Field_DeviceID )
    Utils::ToUpper( value, values[field] );
  else
    values[field] = value;
  return true;
}

bool HDHR_Properties::SetInt( Field field, uint32_t value )
{
  char buf[16];
  snprintf( buf, sizeof( buf ), "%u", value );
  return Set( field, buf );
}

void HDHR_Properties::Clear( Field field )
{
  values.erase( field );
}

bool HDHR_Properties::Get( Field field, std::string &value ) const
{
  std::map<Field, std::string>::const_iterator it = values.find( field );
  if( it == values.end( ))
    return false;
  value = it->second;
  return true;
}

std::string HDHR_Properties::Get( Field field ) const
{
  std::string value;
  Get( field, value );
  return value;
}

int HDHR_Properties::GetInt( Field field ) const
{
  std::string value;
  int i = 0;
  if( Get( field, value ))
    Utils::ParseInt( value, i );
  return i;
}

bool HDHR_Properties::Has( Field field ) const
{
  return values.find( field ) != values.end( );
}


void HDHR_Channel::json( json_object *j ) const
{
  json_object_string_add( j, "GuideNumber", guide_number );
  json_object_string_add( j, "GuideName",   guide_name );
  if( !video_codec.empty( ))
    json_object_string_add( j, "VideoCodec", video_codec );
  if( !audio_codec.empty( ))
    json_object_string_add( j, "AudioCodec", audio_codec );
  json_object_object_add( j, "HD",       json_object_new_int( hd ));
  json_object_object_add( j, "Favorite", json_object_new_int( favorite ));
  json_object_string_add( j, "URL", url );
}

int HDHR_TunerStatus::GetMetric( const std::string &name ) const
{
  std::map<std::string, int>::const_iterator it = metrics.find( name );
  return it == metrics.end( ) ? 0 : it->second;
}

void HDHR_TunerStatus::json( json_object *j ) const
{
  json_object_string_add( j, "Resource", resource );
  if( !vct_number.empty( ))
    json_object_string_add( j, "VctNumber", vct_number );
  if( !vct_name.empty( ))
    json_object_string_add( j, "VctName", vct_name );
  if( !target_ip.empty( ))
    json_object_string_add( j, "TargetIP", target_ip );
  for( std::map<std::string, int>::const_iterator it = metrics.begin( ); it != metrics.end( ); it++ )
    json_object_object_add( j, it->first.c_str( ), json_object_new_int( it->second ));
}


HDHR_Device::HDHR_Device( const std::string &host ) :
  discovery_method(Transport_None),
  online(true),
  has_tuner_status(false),
  scan_in_progress(false),
  scan_possible(false)
{
  for( int i = 0; i < HDHR_Properties::Field_Count; i++ )
    origin[i] = Transport_None;
  properties.Set( HDHR_Properties::Field_Host, host );
}

HDHR_Device::~HDHR_Device( )
{
}

HDHR_Device::Type HDHR_Device::GetDeviceType( ) const
{
  switch( properties.GetInt( HDHR_Properties::Field_DeviceType ))
  {
    case Type_Tuner:
      return Type_Tuner;
    case Type_Storage:
      return Type_Storage;
  }
  return Type_Unknown;
}

HDHR_Transport HDHR_Device::GetOrigin( HDHR_Properties::Field field ) const
{
  return origin[field];
}

bool HDHR_Device::Set( HDHR_Properties::Field field, const std::string &value, HDHR_Transport source )
{
  if( !HDHR_Properties::IsTruthy( field, value ))
    return false;

  std::string candidate = value;
  if( field == HDHR_Properties::Field_DeviceID )
    Utils::ToUpper( value, candidate );

  std::string current;
  if( properties.Get( field, current ))
  {
    if( field == HDHR_Properties::Field_DeviceID )
    {
      if( current != candidate )
        LogWarn( "HDHomeRun %s: ignoring device id change to %s", current.c_str( ), candidate.c_str( ));
      if( rank( source ) > rank( origin[field] ))
        origin[field] = source;
      return false;
    }
    if( rank( source ) < rank( origin[field] ))
      return false;
    if( current == candidate )
    {
      origin[field] = source;
      return false;
    }
  }

  properties.Set( field, candidate );
  origin[field] = source;
  return true;
}

int HDHR_Device::Merge( const HDHR_Properties &other, HDHR_Transport source )
{
  int changed = 0;
  std::string value;
  for( int i = 0; i < HDHR_Properties::Field_Count; i++ )
  {
    HDHR_Properties::Field field = (HDHR_Properties::Field) i;
    if( !other.Get( field, value ))
      continue;
    if( Set( field, value, source ))
      changed++;
  }
  return changed;
}

void HDHR_Device::SetTunerStatus( const std::vector<HDHR_TunerStatus> &status )
{
  tuner_status = status;
  has_tuner_status = !status.empty( );
}

void HDHR_Device::ClearTunerStatus( )
{
  tuner_status.clear( );
  has_tuner_status = false;
}

void HDHR_Device::SetLineupStatus( const std::string &source, const std::vector<std::string> &sources, bool scan_in_progress, bool scan_possible )
{
  this->source = source;
  this->channel_sources = sources;
  this->scan_in_progress = scan_in_progress;
  this->scan_possible = scan_possible;
}

void HDHR_Device::json( json_object *j ) const
{
  json( j, false );
}

void HDHR_Device::json( json_object *j, bool redact ) const
{
  std::string value;
  for( int i = 0; i < HDHR_Properties::Field_Count; i++ )
  {
    const HDHR_Properties::FieldInfo &info = HDHR_Properties::GetFieldInfo((HDHR_Properties::Field) i );
    if( !properties.Get( info.field, value ))
      continue;
    if( redact && ( info.field == HDHR_Properties::Field_DeviceID || info.field == HDHR_Properties::Field_DeviceAuth ))
      json_object_string_add( j, info.name, REDACTED );
    else if( info.kind == HDHR_Properties::Kind_Int )
      json_object_object_add( j, info.name, json_object_new_int( atoi( value.c_str( ))));
    else
      json_object_string_add( j, info.name, value );
  }
  json_object_string_add( j, "DiscoveryMethod", HDHR_TransportName( discovery_method ));
  json_object_object_add( j, "Online", json_object_new_boolean( online ));

  if( !channel_sources.empty( ))
  {
    json_object_string_add( j, "Source", source );
    json_object *a = json_object_new_array( );
    for( size_t i = 0; i < channel_sources.size( ); i++ )
      json_object_array_add( a, json_object_new_string( channel_sources[i].c_str( )));
    json_object_object_add( j, "SourceList", a );
    json_object_object_add( j, "ScanInProgress", json_object_new_int( scan_in_progress ));
    json_object_object_add( j, "ScanPossible", json_object_new_int( scan_possible ));
  }

  json_object *a = json_object_new_array( );
  for( size_t i = 0; i < channels.size( ); i++ )
  {
    json_object *entry = json_object_new_object( );
    channels[i].json( entry );
    json_object_array_add( a, entry );
  }
  json_object_object_add( j, "Channels", a );

  if( has_tuner_status )
  {
    a = json_object_new_array( );
    for( size_t i = 0; i < tuner_status.size( ); i++ )
    {
      json_object *entry = json_object_new_object( );
      tuner_status[i].json( entry );
      json_object_array_add( a, entry );
    }
    json_object_object_add( j, "TunerStatus", a );
  }
  else
    json_object_object_add( j, "TunerStatus", NULL );
}
