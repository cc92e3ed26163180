/*
 *  hdhrctl
 *
 *  Discover_HTTP tests
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
#include <stdio.h> // snprintf

#include "Discover_HTTP.h"
#include "HTTPClient.h"
#include "HDHR_Error.h"
#include "FakeDevice.h"

#define TIMEOUT 1000

#define DISCOVER_JSON \
  "{\"FriendlyName\":\"HDHomeRun CONNECT\",\"ModelNumber\":\"HDHR4-2US\",\"FirmwareName\":\"hdhomerun4_atsc\"," \
  "\"FirmwareVersion\":\"20150826\",\"DeviceID\":\"1234abcd\",\"DeviceAuth\":\"abc123\",\"TunerCount\":2," \
  "\"BaseURL\":\"http://127.0.0.1:80\",\"LineupURL\":\"http://127.0.0.1:80/lineup.json\"}"

#define LINEUP_JSON \
  "[{\"GuideNumber\":\"20.1\",\"GuideName\":\"KBTC-DT\",\"VideoCodec\":\"MPEG2\",\"AudioCodec\":\"AC3\",\"HD\":1," \
  "\"URL\":\"http://127.0.0.1:5004/auto/v20.1\"}," \
  "{\"GuideNumber\":\"20.4\",\"GuideName\":\"PBS Kids\",\"Favorite\":1,\"URL\":\"http://127.0.0.1:5004/auto/v20.4\"}]"

#define LINEUP_STATUS_JSON \
  "{\"ScanInProgress\":0,\"ScanPossible\":1,\"Source\":\"Antenna\",\"SourceList\":[\"Antenna\",\"Cable\"]}"

#define STATUS_JSON \
  "[{\"Resource\":\"tuner0\",\"VctNumber\":\"20.1\",\"VctName\":\"KBTC-DT\",\"Frequency\":615000000," \
  "\"SignalStrengthPercent\":80,\"SignalQualityPercent\":70,\"SymbolQualityPercent\":100,\"TargetIP\":\"192.168.1.20\"}," \
  "{\"Resource\":\"tuner1\"}]"

static void free_devices( std::vector<HDHR_Device *> &devices )
{
  for( size_t i = 0; i < devices.size( ); i++ )
    delete devices[i];
  devices.clear( );
}

static std::string unused_url( const char *path )
{
  char url[64];
  snprintf( url, sizeof( url ), "http://%s:%d%s", FAKE_ADDRESS, UnusedPort( ), path );
  return url;
}

TEST( Discover_HTTP, ParseDirectoryArray )
{
  std::vector<HDHR_Properties> devices;
  Discover_HTTP::ParseDevices( "[{\"DeviceID\":\"1234ABCD\",\"TunerCount\":4,\"LocalIP\":\"10.0.0.5\"}]",
                               "https://ipv4-api.hdhomerun.com/discover", devices );
  ASSERT_EQ( 1u, devices.size( ));
  EXPECT_EQ( "1234ABCD", devices[0].Get( HDHR_Properties::Field_DeviceID ));
  EXPECT_EQ( 4, devices[0].GetInt( HDHR_Properties::Field_TunerCount ));
  EXPECT_EQ( "10.0.0.5", devices[0].Get( HDHR_Properties::Field_Host ));
}

TEST( Discover_HTTP, ParseSingleObjectFallsBackToURLHost )
{
  std::vector<HDHR_Properties> devices;
  Discover_HTTP::ParseDevices( DISCOVER_JSON, "http://10.0.0.7/discover.json", devices );
  ASSERT_EQ( 1u, devices.size( ));
  EXPECT_EQ( "10.0.0.7", devices[0].Get( HDHR_Properties::Field_Host ));
  EXPECT_EQ( "1234ABCD", devices[0].Get( HDHR_Properties::Field_DeviceID ));
  EXPECT_EQ( "hdhomerun4_atsc", devices[0].Get( HDHR_Properties::Field_Model ));
  EXPECT_EQ( "HDHR4-2US", devices[0].Get( HDHR_Properties::Field_HWModel ));
  EXPECT_EQ( "20150826", devices[0].Get( HDHR_Properties::Field_InstalledVersion ));
  EXPECT_EQ( "abc123", devices[0].Get( HDHR_Properties::Field_DeviceAuth ));
}

TEST( Discover_HTTP, ParseIgnoresUnknownKeysAndFalsyValues )
{
  std::vector<HDHR_Properties> devices;
  Discover_HTTP::ParseDevices( "[{\"DeviceID\":\"1234ABCD\",\"TunerCount\":0,\"FriendlyName\":\"\",\"Legacy\":1,"
                               "\"ConditionalAccess\":{\"a\":1}}]", "http://10.0.0.5/discover.json", devices );
  ASSERT_EQ( 1u, devices.size( ));
  EXPECT_FALSE( devices[0].Has( HDHR_Properties::Field_TunerCount ));
  EXPECT_FALSE( devices[0].Has( HDHR_Properties::Field_FriendlyName ));
}

TEST( Discover_HTTP, ParseEmptyResults )
{
  std::vector<HDHR_Properties> devices;
  Discover_HTTP::ParseDevices( "[]", "http://10.0.0.5/discover.json", devices );
  EXPECT_TRUE( devices.empty( ));
  Discover_HTTP::ParseDevices( "{}", "http://10.0.0.5/discover.json", devices );
  EXPECT_TRUE( devices.empty( ));
}

TEST( Discover_HTTP, ParseRejectsGarbage )
{
  std::vector<HDHR_Properties> devices;
  EXPECT_THROW( Discover_HTTP::ParseDevices( "<html>", "http://10.0.0.5/discover.json", devices ), ProtocolDecodeError );
  EXPECT_THROW( Discover_HTTP::ParseDevices( "42", "http://10.0.0.5/discover.json", devices ), ProtocolDecodeError );
  EXPECT_THROW( Discover_HTTP::ParseDevices( "[1,2]", "http://10.0.0.5/discover.json", devices ), ProtocolDecodeError );
}

TEST( Discover_HTTP, ParseLineup )
{
  std::vector<HDHR_Channel> channels;
  Discover_HTTP::ParseLineup( LINEUP_JSON, channels );
  ASSERT_EQ( 2u, channels.size( ));
  EXPECT_EQ( "20.1", channels[0].guide_number );
  EXPECT_EQ( "KBTC-DT", channels[0].guide_name );
  EXPECT_EQ( "MPEG2", channels[0].video_codec );
  EXPECT_TRUE( channels[0].hd );
  EXPECT_FALSE( channels[0].favorite );
  EXPECT_EQ( "PBS Kids", channels[1].guide_name );
  EXPECT_TRUE( channels[1].favorite );
  EXPECT_EQ( "http://127.0.0.1:5004/auto/v20.4", channels[1].url );

  EXPECT_THROW( Discover_HTTP::ParseLineup( "{}", channels ), ProtocolDecodeError );
}

TEST( Discover_HTTP, ParseTunerStatus )
{
  std::vector<HDHR_TunerStatus> status;
  Discover_HTTP::ParseTunerStatus( STATUS_JSON, status );
  ASSERT_EQ( 2u, status.size( ));
  EXPECT_EQ( "tuner0", status[0].resource );
  EXPECT_EQ( "20.1", status[0].vct_number );
  EXPECT_EQ( "KBTC-DT", status[0].vct_name );
  EXPECT_EQ( "192.168.1.20", status[0].target_ip );
  EXPECT_EQ( 80, status[0].GetMetric( "SignalStrengthPercent" ));
  EXPECT_EQ( 615000000, status[0].GetMetric( "Frequency" ));
  EXPECT_EQ( "tuner1", status[1].resource );
  EXPECT_TRUE( status[1].metrics.empty( ));
}

TEST( Discover_HTTP, ParseLineupStatus )
{
  std::string source;
  std::vector<std::string> sources;
  bool scanning = true, possible = false;
  Discover_HTTP::ParseLineupStatus( LINEUP_STATUS_JSON, source, sources, scanning, possible );
  EXPECT_EQ( "Antenna", source );
  ASSERT_EQ( 2u, sources.size( ));
  EXPECT_EQ( "Cable", sources[1] );
  EXPECT_FALSE( scanning );
  EXPECT_TRUE( possible );
}

TEST( Discover_HTTP, DeviceURL )
{
  HDHR_Device device( "10.0.0.5" );
  EXPECT_EQ( "http://10.0.0.5/status.json", Discover_HTTP::DeviceURL( device, "/status.json" ));
  device.Set( HDHR_Properties::Field_BaseURL, "http://10.0.0.5:80", Transport_UDP );
  EXPECT_EQ( "http://10.0.0.5:80/status.json", Discover_HTTP::DeviceURL( device, "/status.json" ));
  device.Set( HDHR_Properties::Field_DiscoverURL, "http://10.0.0.6/discover.json", Transport_HTTP );
  EXPECT_EQ( "http://10.0.0.6/status.json", Discover_HTTP::DeviceURL( device, "/status.json" ));
}

class HTTPTest : public ::testing::Test
{
  protected:
    virtual void SetUp( )
    {
      ASSERT_TRUE( server.Start( ));
      snprintf( host, sizeof( host ), "%s:%d", FAKE_ADDRESS, server.GetPort( ));
    }
    virtual void TearDown( )
    {
      server.Stop( );
    }

    FakeHTTPServer server;
    char host[32];
};

TEST_F( HTTPTest, Get )
{
  server.SetResponse( "/discover.json", "{}" );
  HTTPResponse response = HTTPClient::Get( server.GetURL( "/discover.json" ), TIMEOUT );
  EXPECT_EQ( 200, response.status );
  EXPECT_EQ( "{}", response.body );

  response = HTTPClient::Get( server.GetURL( "/missing" ), TIMEOUT );
  EXPECT_EQ( 404, response.status );
  EXPECT_FALSE( response.OK( ));
}

TEST_F( HTTPTest, Discover )
{
  server.SetResponse( "/discover", "[{\"DeviceID\":\"1234ABCD\",\"TunerCount\":4,\"LocalIP\":\"10.0.0.5\"}]" );
  std::vector<HDHR_Device *> devices = Discover_HTTP::Discover( server.GetURL( "/discover" ), TIMEOUT );

  ASSERT_EQ( 1u, devices.size( ));
  EXPECT_EQ( "1234ABCD", devices[0]->GetDeviceID( ));
  EXPECT_EQ( 4, devices[0]->GetTunerCount( ));
  EXPECT_EQ( "10.0.0.5", devices[0]->GetHost( ));
  EXPECT_EQ( Transport_HTTP, devices[0]->GetDiscoveryMethod( ));
  free_devices( devices );
}

TEST_F( HTTPTest, DiscoverUnavailable )
{
  server.SetResponse( "/discover", "oops", 500 );
  try
  {
    Discover_HTTP::Discover( server.GetURL( "/discover" ), TIMEOUT );
    FAIL( ) << "expected HttpDiscoveryUnavailable";
  }
  catch( HttpDiscoveryUnavailable &e )
  {
    EXPECT_FALSE( e.IsConnectionFailure( ));
  }

  server.SetResponse( "/discover", "not json" );
  EXPECT_THROW( Discover_HTTP::Discover( server.GetURL( "/discover" ), TIMEOUT ), HttpDiscoveryUnavailable );
}

TEST( Discover_HTTP, DiscoverConnectionFailure )
{
  try
  {
    Discover_HTTP::Discover( unused_url( "/discover" ), TIMEOUT );
    FAIL( ) << "expected HttpDiscoveryUnavailable";
  }
  catch( HttpDiscoveryUnavailable &e )
  {
    EXPECT_TRUE( e.IsConnectionFailure( ));
  }
}

TEST_F( HTTPTest, RediscoverRecordsDiscoverURL )
{
  server.SetResponse( "/discover.json", DISCOVER_JSON );

  HDHR_Device device( host );
  device.Set( HDHR_Properties::Field_TunerCount, "4", Transport_UDP );
  ASSERT_TRUE( Discover_HTTP::Rediscover( device, TIMEOUT ));

  EXPECT_EQ( "1234ABCD", device.GetDeviceID( ));
  EXPECT_EQ( 2, device.GetTunerCount( ));
  EXPECT_EQ( "HDHomeRun CONNECT", device.GetFriendlyName( ));
  EXPECT_EQ( server.GetURL( "/discover.json" ), device.GetDiscoverURL( ));
  EXPECT_EQ( Transport_HTTP, device.GetDiscoveryMethod( ));
  EXPECT_EQ( Transport_HTTP, device.GetOrigin( HDHR_Properties::Field_TunerCount ));
}

TEST( Discover_HTTP, RediscoverUnreachable )
{
  HDHR_Device device( FAKE_ADDRESS );
  device.Set( HDHR_Properties::Field_DiscoverURL, unused_url( "/discover.json" ), Transport_HTTP );
  bool unreachable = false;
  EXPECT_FALSE( Discover_HTTP::Rediscover( device, TIMEOUT, &unreachable ));
  EXPECT_TRUE( unreachable );
  EXPECT_EQ( Transport_None, device.GetDiscoveryMethod( ));
}

TEST_F( HTTPTest, RediscoverPicksMatchingDevice )
{
  server.SetResponse( "/discover",
    "[{\"DeviceID\":\"1234ABCD\",\"TunerCount\":4,\"DeviceAuth\":\"other\",\"LocalIP\":\"10.0.0.5\"},"
    "{\"DeviceID\":\"5678EF00\",\"TunerCount\":3,\"FriendlyName\":\"HDHomeRun PRIME\",\"LocalIP\":\"10.0.0.6\"}]" );

  HDHR_Device device( "10.0.0.6" );
  device.Set( HDHR_Properties::Field_DeviceID, "5678ef00", Transport_UDP );
  device.Set( HDHR_Properties::Field_DiscoverURL, server.GetURL( "/discover" ), Transport_HTTP );
  ASSERT_TRUE( Discover_HTTP::Rediscover( device, TIMEOUT ));
  EXPECT_EQ( 3, device.GetTunerCount( ));
  EXPECT_EQ( "HDHomeRun PRIME", device.GetFriendlyName( ));
  EXPECT_EQ( "10.0.0.6", device.GetHost( ));
  EXPECT_TRUE( device.GetDeviceAuth( ).empty( ));
}

TEST_F( HTTPTest, RediscoverIgnoresOtherDevice )
{
  // the address now belongs to another unit
  server.SetResponse( "/discover.json", DISCOVER_JSON );

  HDHR_Device device( host );
  device.Set( HDHR_Properties::Field_DeviceID, "5678EF00", Transport_UDP );
  device.Set( HDHR_Properties::Field_TunerCount, "3", Transport_UDP );
  bool unreachable = true;
  EXPECT_FALSE( Discover_HTTP::Rediscover( device, TIMEOUT, &unreachable ));
  EXPECT_FALSE( unreachable );
  EXPECT_EQ( "5678EF00", device.GetDeviceID( ));
  EXPECT_EQ( 3, device.GetTunerCount( ));
  EXPECT_TRUE( device.GetFriendlyName( ).empty( ));
  EXPECT_TRUE( device.GetDiscoverURL( ).empty( ));
  EXPECT_TRUE( device.IsOnline( ));
}

TEST_F( HTTPTest, GatherDetailsIgnoresOtherDevice )
{
  server.SetResponse( "/discover.json", DISCOVER_JSON );
  server.SetResponse( "/lineup.json", LINEUP_JSON );
  server.SetResponse( "/lineup_status.json", LINEUP_STATUS_JSON );

  HDHR_Device device( host );
  device.Set( HDHR_Properties::Field_DeviceID, "5678EF00", Transport_UDP );
  EXPECT_FALSE( Discover_HTTP::GatherDetails( device, TIMEOUT ));
  EXPECT_TRUE( device.GetFriendlyName( ).empty( ));
  EXPECT_TRUE( device.GetChannels( ).empty( ));
}

TEST_F( HTTPTest, FetchLineup )
{
  server.SetResponse( "/lineup.json", LINEUP_JSON );
  HDHR_Device device( host );
  ASSERT_TRUE( Discover_HTTP::FetchLineup( device, TIMEOUT ));
  EXPECT_EQ( 2u, device.GetChannels( ).size( ));
}

TEST_F( HTTPTest, RefreshTunerStatus )
{
  server.SetResponse( "/status.json", STATUS_JSON );
  HDHR_Device device( host );
  device.SetOnline( false );
  ASSERT_TRUE( Discover_HTTP::RefreshTunerStatus( device, TIMEOUT ));
  ASSERT_TRUE( device.HasTunerStatus( ));
  EXPECT_EQ( 2u, device.GetTunerStatus( ).size( ));
  EXPECT_TRUE( device.IsOnline( ));
}

TEST( Discover_HTTP, UnreachableStatusKeepsPreviousStatus )
{
  HDHR_Device device( FAKE_ADDRESS );
  device.Set( HDHR_Properties::Field_DiscoverURL, unused_url( "/discover.json" ), Transport_HTTP );
  std::vector<HDHR_TunerStatus> previous( 1 );
  previous[0].resource = "tuner0";
  previous[0].metrics["SignalStrengthPercent"] = 80;
  device.SetTunerStatus( previous );

  EXPECT_FALSE( Discover_HTTP::RefreshTunerStatus( device, TIMEOUT ));
  ASSERT_TRUE( device.HasTunerStatus( ));
  ASSERT_EQ( 1u, device.GetTunerStatus( ).size( ));
  EXPECT_EQ( 80, device.GetTunerStatus( )[0].GetMetric( "SignalStrengthPercent" ));
  EXPECT_FALSE( device.IsOnline( ));
}

TEST_F( HTTPTest, GatherDetails )
{
  server.SetResponse( "/discover.json", DISCOVER_JSON );
  server.SetResponse( "/lineup.json", LINEUP_JSON );
  server.SetResponse( "/lineup_status.json", LINEUP_STATUS_JSON );

  HDHR_Device device( host );
  ASSERT_TRUE( Discover_HTTP::GatherDetails( device, TIMEOUT ));
  EXPECT_EQ( "1234ABCD", device.GetDeviceID( ));
  EXPECT_EQ( 2u, device.GetChannels( ).size( ));
  EXPECT_EQ( "Antenna", device.GetChannelSource( ));
  EXPECT_EQ( 2u, device.GetChannelSources( ).size( ));
  EXPECT_TRUE( device.IsScanPossible( ));
  EXPECT_EQ( 1, server.GetRequests( "/lineup_status.json" ));
}

TEST_F( HTTPTest, GatherDetailsAppliesNothingOnPartialFailure )
{
  server.SetResponse( "/discover.json", DISCOVER_JSON );
  server.SetResponse( "/lineup.json", LINEUP_JSON );

  HDHR_Device device( host );
  EXPECT_FALSE( Discover_HTTP::GatherDetails( device, TIMEOUT ));
  EXPECT_TRUE( device.GetDeviceID( ).empty( ));
  EXPECT_TRUE( device.GetChannels( ).empty( ));
  EXPECT_TRUE( device.GetChannelSources( ).empty( ));
}
