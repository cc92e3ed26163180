/*
 *  hdhrctl
 *
 *  HDHR_Device tests
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

#include <gtest/gtest.h>

#include "HDHR_Device.h"

typedef HDHR_Properties P;

static std::string json_string( json_object *j, const char *key )
{
  std::string value;
  json_object_get_string_value( j, key, value );
  return value;
}

TEST( HDHR_Properties, FalsyValuesAreDropped )
{
  P p;
  EXPECT_FALSE( p.Set( P::Field_FriendlyName, "" ));
  EXPECT_FALSE( p.Set( P::Field_TunerCount, "0" ));
  EXPECT_FALSE( p.SetInt( P::Field_DeviceType, 0 ));
  EXPECT_TRUE( p.Empty( ));

  EXPECT_TRUE( p.SetInt( P::Field_TunerCount, 2 ));
  EXPECT_EQ( 2, p.GetInt( P::Field_TunerCount ));
}

TEST( HDHR_Properties, DeviceIDIsUppercased )
{
  P p;
  p.Set( P::Field_DeviceID, "1234abcd" );
  EXPECT_EQ( "1234ABCD", p.Get( P::Field_DeviceID ));
}

TEST( HDHR_Properties, JSONKeys )
{
  P::Field field;
  ASSERT_TRUE( P::FieldFromJSON( "LocalIP", field ));
  EXPECT_EQ( P::Field_Host, field );
  ASSERT_TRUE( P::FieldFromJSON( "FirmwareVersion", field ));
  EXPECT_EQ( P::Field_InstalledVersion, field );
  ASSERT_TRUE( P::FieldFromJSON( "UpgradeAvailable", field ));
  EXPECT_EQ( P::Field_LatestVersion, field );
  EXPECT_FALSE( P::FieldFromJSON( "DeviceType", field ));
  EXPECT_FALSE( P::FieldFromJSON( "ConditionalAccess", field ));
}

TEST( HDHR_Device, NewDeviceHasHostOnly )
{
  HDHR_Device device( "10.0.0.5" );
  EXPECT_EQ( "10.0.0.5", device.GetHost( ));
  EXPECT_TRUE( device.GetDeviceID( ).empty( ));
  EXPECT_EQ( Transport_None, device.GetDiscoveryMethod( ));
  EXPECT_TRUE( device.IsOnline( ));
  EXPECT_FALSE( device.HasTunerStatus( ));
}

TEST( HDHR_Device, MergeIsIdempotent )
{
  P p;
  p.Set( P::Field_DeviceID, "1234ABCD" );
  p.SetInt( P::Field_TunerCount, 4 );
  p.Set( P::Field_BaseURL, "http://10.0.0.5:80" );

  HDHR_Device device( "10.0.0.5" );
  EXPECT_EQ( 3, device.Merge( p, Transport_UDP ));
  P before = device.GetProperties( );
  EXPECT_EQ( 0, device.Merge( p, Transport_UDP ));
  EXPECT_TRUE( before == device.GetProperties( ));
}

TEST( HDHR_Device, UDPDoesNotOverwriteHTTP )
{
  P http;
  http.Set( P::Field_DeviceID, "1234ABCD" );
  http.SetInt( P::Field_TunerCount, 4 );
  http.Set( P::Field_BaseURL, "http://10.0.0.5:80" );

  P udp;
  udp.Set( P::Field_DeviceID, "1234ABCD" );
  udp.SetInt( P::Field_TunerCount, 2 );
  udp.Set( P::Field_BaseURL, "http://10.0.0.5:5004" );
  udp.Set( P::Field_LineupURL, "http://10.0.0.5/lineup.json" );

  HDHR_Device device( "10.0.0.5" );
  device.Merge( http, Transport_HTTP );
  EXPECT_EQ( 1, device.Merge( udp, Transport_UDP ));

  EXPECT_EQ( 4, device.GetTunerCount( ));
  EXPECT_EQ( "http://10.0.0.5:80", device.GetBaseURL( ));
  EXPECT_EQ( "http://10.0.0.5/lineup.json", device.GetLineupURL( ));
  EXPECT_EQ( Transport_HTTP, device.GetOrigin( P::Field_TunerCount ));
  EXPECT_EQ( Transport_UDP, device.GetOrigin( P::Field_LineupURL ));
}

TEST( HDHR_Device, HTTPOverwritesUDP )
{
  P udp;
  udp.SetInt( P::Field_TunerCount, 2 );
  P http;
  http.SetInt( P::Field_TunerCount, 4 );

  HDHR_Device device( "10.0.0.5" );
  device.Merge( udp, Transport_UDP );
  EXPECT_EQ( 1, device.Merge( http, Transport_HTTP ));
  EXPECT_EQ( 4, device.GetTunerCount( ));
  EXPECT_EQ( Transport_HTTP, device.GetOrigin( P::Field_TunerCount ));
}

TEST( HDHR_Device, EqualRankReplaces )
{
  P udp;
  udp.Set( P::Field_InstalledVersion, "20140121" );
  P tcp;
  tcp.Set( P::Field_InstalledVersion, "20150826" );

  HDHR_Device device( "10.0.0.5" );
  device.Merge( udp, Transport_UDP );
  device.Merge( tcp, Transport_TCP );
  EXPECT_EQ( "20150826", device.GetInstalledVersion( ));
  EXPECT_EQ( Transport_TCP, device.GetOrigin( P::Field_InstalledVersion ));
}

TEST( HDHR_Device, DeviceIDIsImmutable )
{
  HDHR_Device device( "10.0.0.5" );
  EXPECT_TRUE( device.Set( P::Field_DeviceID, "1234abcd", Transport_UDP ));
  EXPECT_FALSE( device.Set( P::Field_DeviceID, "FFFFFFFF", Transport_HTTP ));
  EXPECT_EQ( "1234ABCD", device.GetDeviceID( ));
}

TEST( HDHR_Device, FalsyCandidatesAreSkipped )
{
  HDHR_Device device( "10.0.0.5" );
  device.Set( P::Field_FriendlyName, "HDHomeRun DUO", Transport_UDP );
  EXPECT_FALSE( device.Set( P::Field_FriendlyName, "", Transport_HTTP ));
  EXPECT_EQ( "HDHomeRun DUO", device.GetFriendlyName( ));
  EXPECT_EQ( Transport_UDP, device.GetOrigin( P::Field_FriendlyName ));
}

TEST( HDHR_Device, DeviceType )
{
  HDHR_Device device( "10.0.0.5" );
  EXPECT_EQ( HDHR_Device::Type_Unknown, device.GetDeviceType( ));
  device.Set( P::Field_DeviceType, "1", Transport_UDP );
  EXPECT_EQ( HDHR_Device::Type_Tuner, device.GetDeviceType( ));
}

TEST( HDHR_Device, EmptyTunerStatusIsAbsent )
{
  HDHR_Device device( "10.0.0.5" );
  std::vector<HDHR_TunerStatus> status( 1 );
  status[0].resource = "tuner0";
  device.SetTunerStatus( status );
  EXPECT_TRUE( device.HasTunerStatus( ));

  device.SetTunerStatus( std::vector<HDHR_TunerStatus>( ));
  EXPECT_FALSE( device.HasTunerStatus( ));
  EXPECT_TRUE( device.GetTunerStatus( ).empty( ));
}

TEST( HDHR_Device, RedactedJSON )
{
  HDHR_Device device( "10.0.0.5" );
  device.Set( P::Field_DeviceID, "1234ABCD", Transport_HTTP );
  device.Set( P::Field_DeviceAuth, "secret", Transport_HTTP );
  device.Set( P::Field_TunerCount, "4", Transport_HTTP );
  device.SetDiscoveryMethod( Transport_HTTP );

  json_object *j = json_object_new_object( );
  device.json( j, true );
  EXPECT_EQ( "**REDACTED**", json_string( j, "DeviceID" ));
  EXPECT_EQ( "**REDACTED**", json_string( j, "DeviceAuth" ));
  EXPECT_EQ( "10.0.0.5", json_string( j, "LocalIP" ));
  EXPECT_EQ( "HTTP", json_string( j, "DiscoveryMethod" ));
  int tuners = 0;
  EXPECT_TRUE( json_object_get_int_value( j, "TunerCount", tuners ));
  EXPECT_EQ( 4, tuners );
  json_object *status = NULL;
  EXPECT_TRUE( json_object_object_get_ex( j, "TunerStatus", &status ));
  EXPECT_TRUE( status == NULL );
  json_object_put( j );

  j = json_object_new_object( );
  device.json( j );
  EXPECT_EQ( "1234ABCD", json_string( j, "DeviceID" ));
  EXPECT_EQ( "secret", json_string( j, "DeviceAuth" ));
  json_object_put( j );
}
