/*
 *  hdhrctl
 *
 *  HDHR_Packet class
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

#include "HDHR_Packet.h"

#include <stdio.h> // snprintf
#include <string.h> // memcpy

#include "HDHR_Error.h"

namespace
{
  class PacketBuffer
  {
    public:
      PacketBuffer( ) : pkt(hdhomerun_pkt_create( ))
      {
        if( !pkt )
          throw HDHR_Error( "unable to allocate packet buffer" );
      }
      ~PacketBuffer( ) { hdhomerun_pkt_destroy( pkt ); }

      struct hdhomerun_pkt_t *Get( ) { return pkt; }

    private:
      struct hdhomerun_pkt_t *pkt;

      PacketBuffer( const PacketBuffer & );
      PacketBuffer &operator=( const PacketBuffer & );
  };
}

HDHR_Packet::HDHR_Packet( uint16_t type ) : type(type), length(0)
{
}

HDHR_Packet::~HDHR_Packet( )
{
}

void HDHR_Packet::AddTag( uint8_t tag, const ByteBuffer &value )
{
  payload.push_back( std::make_pair( tag, value ));
  tags[tag] = value;
}

void HDHR_Packet::AddTagU8( uint8_t tag, uint8_t value )
{
  AddTag( tag, ByteBuffer( 1, value ));
}

void HDHR_Packet::AddTagU32( uint8_t tag, uint32_t value )
{
  ByteBuffer b( 4 );
  b[0] = value >> 24;
  b[1] = value >> 16;
  b[2] = value >> 8;
  b[3] = value;
  AddTag( tag, b );
}

void HDHR_Packet::AddTagString( uint8_t tag, const std::string &value )
{
  ByteBuffer b( value.begin( ), value.end( ));
  b.push_back( '\0' );
  AddTag( tag, b );
}

bool HDHR_Packet::HasTag( uint8_t tag ) const
{
  return tags.find( tag ) != tags.end( );
}

bool HDHR_Packet::GetBytes( uint8_t tag, ByteBuffer &value ) const
{
  std::map<uint8_t, ByteBuffer>::const_iterator it = tags.find( tag );
  if( it == tags.end( ))
    return false;
  value = it->second;
  return true;
}

bool HDHR_Packet::GetString( uint8_t tag, std::string &value ) const
{
  std::map<uint8_t, ByteBuffer>::const_iterator it = tags.find( tag );
  if( it == tags.end( ))
    return false;
  const ByteBuffer &b = it->second;
  size_t len = b.size( );
  if( len > 0 && b[len - 1] == '\0' )
    len--;
  value.assign((const char *) b.data( ), len );
  return true;
}

bool HDHR_Packet::GetU8( uint8_t tag, uint8_t &value ) const
{
  std::map<uint8_t, ByteBuffer>::const_iterator it = tags.find( tag );
  if( it == tags.end( ) || it->second.size( ) != 1 )
    return false;
  value = it->second[0];
  return true;
}

bool HDHR_Packet::GetU32( uint8_t tag, uint32_t &value ) const
{
  std::map<uint8_t, ByteBuffer>::const_iterator it = tags.find( tag );
  if( it == tags.end( ) || it->second.size( ) != 4 )
    return false;
  const ByteBuffer &b = it->second;
  value = ((uint32_t) b[0] << 24 ) | ((uint32_t) b[1] << 16 ) | ((uint32_t) b[2] << 8 ) | (uint32_t) b[3];
  return true;
}

ByteBuffer HDHR_Packet::Build( ) const
{
  return Build( type, payload );
}

ByteBuffer HDHR_Packet::Build( uint16_t type, const TagList &payload )
{
  char msg[64];
  PacketBuffer buffer;
  struct hdhomerun_pkt_t *pkt = buffer.Get( );
  for( TagList::const_iterator it = payload.begin( ); it != payload.end( ); it++ )
  {
    size_t len = it->second.size( );
    if( len > HDHR_MAX_TAG_LENGTH )
    {
      snprintf( msg, sizeof( msg ), "tag value too long: %zu bytes", len );
      throw HDHR_Error( msg );
    }
    // tag, up to two length bytes, value and the crc trailer
    if( 3 + len + HDHR_FRAME_CRC_SIZE > (size_t) ( pkt->limit - pkt->end ))
    {
      snprintf( msg, sizeof( msg ), "payload exceeds packet buffer at tag 0x%02x", it->first );
      throw HDHR_Error( msg );
    }
    hdhomerun_pkt_write_u8( pkt, it->first );
    hdhomerun_pkt_write_var_length( pkt, len );
    if( len > 0 )
      hdhomerun_pkt_write_mem( pkt, it->second.data( ), len );
  }
  hdhomerun_pkt_seal_frame( pkt, type );
  return ByteBuffer( pkt->start, pkt->end );
}

size_t HDHR_Packet::FrameSize( const uint8_t *header )
{
  size_t len = ((size_t) header[2] << 8 ) | header[3];
  return HDHR_FRAME_HEADER_SIZE + len + HDHR_FRAME_CRC_SIZE;
}

HDHR_Packet HDHR_Packet::Parse( const ByteBuffer &raw, uint16_t expected_type )
{
  return Parse( raw.data( ), raw.size( ), expected_type );
}

HDHR_Packet HDHR_Packet::Parse( const uint8_t *raw, size_t size, uint16_t expected_type )
{
  char msg[128];
  if( !raw || size < HDHR_FRAME_HEADER_SIZE + HDHR_FRAME_CRC_SIZE )
  {
    snprintf( msg, sizeof( msg ), "frame too short: %zu bytes", size );
    throw ProtocolDecodeError( msg );
  }

  PacketBuffer buffer;
  struct hdhomerun_pkt_t *pkt = buffer.Get( );
  hdhomerun_pkt_reset( pkt );
  if( size > (size_t) ( pkt->limit - pkt->end ))
  {
    snprintf( msg, sizeof( msg ), "frame of %zu bytes exceeds packet buffer", size );
    throw ProtocolDecodeError( msg );
  }
  memcpy( pkt->end, raw, size );
  pkt->end += size;

  uint16_t type;
  switch( hdhomerun_pkt_open_frame( pkt, &type ))
  {
    case 1:
      break;
    case 0:
      snprintf( msg, sizeof( msg ), "declared length %zu exceeds frame of %zu bytes", FrameSize( raw ) - HDHR_FRAME_HEADER_SIZE - HDHR_FRAME_CRC_SIZE, size );
      throw ProtocolDecodeError( msg );
    default:
      throw ProtocolDecodeError( "crc mismatch" );
  }
  if( type != expected_type )
  {
    snprintf( msg, sizeof( msg ), "unexpected packet type 0x%04x, expected 0x%04x", type, expected_type );
    throw ProtocolDecodeError( msg );
  }

  HDHR_Packet packet( type );
  packet.length = pkt->end - pkt->start;
  while( pkt->pos < pkt->end )
  {
    uint8_t tag = 0;
    size_t vlen = 0;
    uint8_t *next = hdhomerun_pkt_read_tlv( pkt, &tag, &vlen );
    if( !next || vlen > (size_t) ( pkt->end - pkt->pos ))
    {
      snprintf( msg, sizeof( msg ), "truncated value of tag 0x%02x", tag );
      throw ProtocolDecodeError( msg );
    }
    packet.AddTag( tag, ByteBuffer( pkt->pos, pkt->pos + vlen ));
    pkt->pos = next;
  }
  return packet;
}

HDHR_Packet HDHR_Packet::DiscoverRequest( uint32_t device_type, uint32_t device_id )
{
  HDHR_Packet p( HDHR_TYPE_DISCOVER_REQ );
  p.AddTagU32( HDHR_TAG_DEVICE_TYPE, device_type );
  p.AddTagU32( HDHR_TAG_DEVICE_ID, device_id );
  return p;
}

HDHR_Packet HDHR_Packet::GetsetRequest( const std::string &name )
{
  HDHR_Packet p( HDHR_TYPE_GETSET_REQ );
  p.AddTagString( HDHR_TAG_GETSET_NAME, name );
  return p;
}

HDHR_Packet HDHR_Packet::GetsetRequest( const std::string &name, const std::string &value )
{
  HDHR_Packet p( HDHR_TYPE_GETSET_REQ );
  p.AddTagString( HDHR_TAG_GETSET_NAME, name );
  p.AddTagString( HDHR_TAG_GETSET_VALUE, value );
  return p;
}
