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

#ifndef _HDHR_Device_
#define _HDHR_Device_

#include <stdint.h>
#include <string>
#include <vector>
#include <map>

#include "JSONObject.h"

/* where a value came from, HTTP ranks above UDP and TCP */
enum HDHR_Transport
{
  Transport_None,
  Transport_UDP,
  Transport_TCP,
  Transport_HTTP,
};

const char *HDHR_TransportName( HDHR_Transport transport );

/*
 * raw property set of one device, keyed by a fixed field list
 */
class HDHR_Properties
{
  public:
    enum Field
    {
      Field_DeviceID,
      Field_DeviceType,
      Field_Host,
      Field_BaseURL,
      Field_DiscoverURL,
      Field_LineupURL,
      Field_FriendlyName,
      Field_Model,
      Field_HWModel,
      Field_InstalledVersion,
      Field_LatestVersion,
      Field_DeviceAuth,
      Field_TunerCount,
      Field_Count
    };

    enum Kind
    {
      Kind_String,
      Kind_Int
    };

    struct FieldInfo
    {
      Field field;
      const char *name;     // key as used by discover.json
      Kind kind;
      bool http;            // discover.json carries this key
    };

    static const FieldInfo &GetFieldInfo( Field field );
    static bool FieldFromJSON( const std::string &key, Field &field );
    static bool IsTruthy( Field field, const std::string &value );

    // only truthy values are stored, returns false if the value was dropped
    bool Set( Field field, const std::string &value );
    bool SetInt( Field field, uint32_t value );
    void Clear( Field field );

    bool Get( Field field, std::string &value ) const;
    std::string Get( Field field ) const;
    int GetInt( Field field ) const;
    bool Has( Field field ) const;

    bool Empty( ) const { return values.empty( ); }
    bool operator==( const HDHR_Properties &other ) const { return values == other.values; }

  private:
    std::map<Field, std::string> values;
};

struct HDHR_Channel : public JSONObject
{
  HDHR_Channel( ) : hd(false), favorite(false) { }

  std::string guide_number;
  std::string guide_name;
  std::string video_codec;
  std::string audio_codec;
  std::string url;
  bool hd;
  bool favorite;

  void json( json_object *j ) const;
};

struct HDHR_TunerStatus : public JSONObject
{
  std::string resource;
  std::map<std::string, int> metrics; // SignalStrengthPercent, ... non-zero only
  std::string vct_number;
  std::string vct_name;
  std::string target_ip;

  bool HasMetric( const std::string &name ) const { return metrics.find( name ) != metrics.end( ); }
  int GetMetric( const std::string &name ) const;

  void json( json_object *j ) const;
};

class HDHR_Device : public JSONObject
{
  public:
    enum Type
    {
      Type_Unknown = 0,
      Type_Tuner   = 1,
      Type_Storage = 5,
    };

    HDHR_Device( const std::string &host );
    virtual ~HDHR_Device( );

    std::string GetDeviceID( ) const        { return properties.Get( HDHR_Properties::Field_DeviceID ); }
    std::string GetHost( ) const            { return properties.Get( HDHR_Properties::Field_Host ); }
    std::string GetBaseURL( ) const         { return properties.Get( HDHR_Properties::Field_BaseURL ); }
    std::string GetDiscoverURL( ) const     { return properties.Get( HDHR_Properties::Field_DiscoverURL ); }
    std::string GetLineupURL( ) const       { return properties.Get( HDHR_Properties::Field_LineupURL ); }
    std::string GetFriendlyName( ) const    { return properties.Get( HDHR_Properties::Field_FriendlyName ); }
    std::string GetModel( ) const           { return properties.Get( HDHR_Properties::Field_Model ); }
    std::string GetHWModel( ) const         { return properties.Get( HDHR_Properties::Field_HWModel ); }
    std::string GetInstalledVersion( ) const{ return properties.Get( HDHR_Properties::Field_InstalledVersion ); }
    std::string GetLatestVersion( ) const   { return properties.Get( HDHR_Properties::Field_LatestVersion ); }
    std::string GetDeviceAuth( ) const      { return properties.Get( HDHR_Properties::Field_DeviceAuth ); }
    int GetTunerCount( ) const              { return properties.GetInt( HDHR_Properties::Field_TunerCount ); }
    Type GetDeviceType( ) const;

    const HDHR_Properties &GetProperties( ) const { return properties; }
    HDHR_Transport GetOrigin( HDHR_Properties::Field field ) const;

    /*
     * applies one property set, field by field in canonical order:
     * a truthy candidate wins if the device lacks the field or the
     * source ranks at least as high as the transport that set it.
     * the device id is never changed once set.
     * returns the number of fields changed
     */
    int Merge( const HDHR_Properties &other, HDHR_Transport source );
    bool Set( HDHR_Properties::Field field, const std::string &value, HDHR_Transport source );

    HDHR_Transport GetDiscoveryMethod( ) const { return discovery_method; }
    void SetDiscoveryMethod( HDHR_Transport method ) { discovery_method = method; }

    bool IsOnline( ) const { return online; }
    void SetOnline( bool online ) { this->online = online; }

    const std::vector<HDHR_Channel> &GetChannels( ) const { return channels; }
    void SetChannels( const std::vector<HDHR_Channel> &channels ) { this->channels = channels; }

    bool HasTunerStatus( ) const { return has_tuner_status; }
    const std::vector<HDHR_TunerStatus> &GetTunerStatus( ) const { return tuner_status; }
    // replaces the previous status, an empty list leaves the status absent
    void SetTunerStatus( const std::vector<HDHR_TunerStatus> &status );
    void ClearTunerStatus( );

    const std::vector<std::string> &GetChannelSources( ) const { return channel_sources; }
    const std::string &GetChannelSource( ) const { return source; }
    bool IsScanInProgress( ) const { return scan_in_progress; }
    bool IsScanPossible( ) const { return scan_possible; }
    void SetLineupStatus( const std::string &source, const std::vector<std::string> &sources, bool scan_in_progress, bool scan_possible );

    void json( json_object *j ) const;
    void json( json_object *j, bool redact ) const;

  private:
    HDHR_Properties properties;
    HDHR_Transport origin[HDHR_Properties::Field_Count];

    HDHR_Transport discovery_method;
    bool online;

    std::vector<HDHR_Channel> channels;
    bool has_tuner_status;
    std::vector<HDHR_TunerStatus> tuner_status;

    std::string source;
    std::vector<std::string> channel_sources;
    bool scan_in_progress;
    bool scan_possible;
};

#endif
